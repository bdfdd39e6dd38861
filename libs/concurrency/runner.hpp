// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//
#ifndef __MCSIG_RUNNER_HPP
#define __MCSIG_RUNNER_HPP 1

#include <cstddef>
#include <memory>
#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/thread/future.hpp>
#include <boost/thread/thread.hpp>

namespace mcsig
{
  namespace concurrency
  {
    // Number of worker threads for the shared pool: the value of the
    // environment variable ncpu when set, else std::thread::hardware_concurrency().
    //   ncpu=4 ./mcsig experiments.json
    std::size_t getNCpus();

    /**
     * @brief Process-wide Boost.Asio thread pool.
     *
     * Used by BoostRunnerExecutor so that repeated estimatePValue() calls reuse
     * one set of worker threads instead of creating threads per run.
     */
    class runner
    {
    public:
      // nthreads == 0 selects getNCpus()
      explicit runner(std::size_t nthreads);

      runner(const runner&) = delete;
      runner& operator=(const runner&) = delete;

      ~runner();

      // Releases the work guard; threads exit once the queue drains.
      void stop();

      std::size_t numThreads() const
      {
	return mNumThreads;
      }

      // Posts a job; exceptions are reported back through the future.
      template<typename F>
      boost::unique_future<void> post(F f)
      {
	auto promise = std::make_shared<boost::promise<void>>();
	auto res = promise->get_future();

	boost::asio::post(mIoContext, [promise, task = std::move(f)]() mutable {
	  try
	    {
	      task();
	      promise->set_value();
	    }
	  catch (...)
	    {
	      promise->set_exception(boost::current_exception());
	    }
	});

	return res;
      }

      static bool is_initialized()
      {
	return instance_ptr() != nullptr;
      }

      static void ensure_initialized(std::size_t num_threads = 0);

      static runner& instance();

    private:
      static std::unique_ptr<runner>& instance_ptr();

      void run();

    private:
      using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

      boost::asio::io_context mIoContext;
      std::unique_ptr<WorkGuard> mWork;
      boost::thread_group mPool;
      std::size_t mNumThreads;
    };
  } // namespace concurrency
} // namespace mcsig

#endif // __MCSIG_RUNNER_HPP
