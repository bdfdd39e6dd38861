// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//
#pragma once

#include <functional>
#include <future>
#include <vector>

namespace mcsig
{
  namespace concurrency
  {
    /**
     * @brief Interface of an executor policy used to dispatch Monte Carlo trials.
     *
     * Implementations schedule a void() task and hand back a std::future that
     * carries either completion or the exception the task raised.
     */
    class IParallelExecutor
    {
    public:
      virtual ~IParallelExecutor() = default;

      virtual std::future<void> submit(std::function<void()> task) = 0;

      // Waits for every future, rethrowing the first stored exception.
      // All futures are drained before rethrowing so that no task is left
      // running against state owned by the caller.
      virtual void waitAll(std::vector<std::future<void>>& futures)
      {
	std::exception_ptr firstError;

	for (auto& f : futures)
	  {
	    try
	      {
		f.get();
	      }
	    catch (...)
	      {
		if (!firstError)
		  firstError = std::current_exception();
	      }
	  }

	if (firstError)
	  std::rethrow_exception(firstError);
      }
    };
  } // namespace concurrency
} // namespace mcsig
