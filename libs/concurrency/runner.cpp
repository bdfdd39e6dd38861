// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//
#include "runner.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace mcsig
{
  namespace concurrency
  {
    std::size_t getNCpus()
    {
      const std::size_t hwcpus = std::thread::hardware_concurrency();
      const char* ncpu_env = std::getenv("ncpu");

      if (ncpu_env != nullptr)
	{
	  const int envcpus = std::atoi(ncpu_env);
	  if (envcpus > 0)
	    return std::min<std::size_t>(static_cast<std::size_t>(envcpus),
					 std::numeric_limits<unsigned char>::max());
	}

      return hwcpus ? hwcpus : 2;
    }

    std::unique_ptr<runner>& runner::instance_ptr()
    {
      static std::unique_ptr<runner> r;
      return r;
    }

    void runner::ensure_initialized(std::size_t num_threads)
    {
      static std::mutex initMutex;
      std::lock_guard<std::mutex> lock(initMutex);

      if (!instance_ptr())
	instance_ptr().reset(new runner(num_threads));
    }

    runner& runner::instance()
    {
      ensure_initialized(0);
      return *instance_ptr();
    }

    runner::runner(std::size_t nthreads)
      : mIoContext(),
	mWork(std::make_unique<WorkGuard>(boost::asio::make_work_guard(mIoContext))),
	mPool(),
	mNumThreads(std::max<std::size_t>(1, nthreads == 0 ? getNCpus() : nthreads))
    {
      std::cerr << "runner: starting " << mNumThreads << " threads" << std::endl;

      for (std::size_t i = 0; i < mNumThreads; ++i)
	mPool.create_thread([this]() { run(); });
    }

    runner::~runner()
    {
      try
	{
	  stop();
	  mPool.join_all();
	}
      catch (const std::exception& e)
	{
	  std::cerr << "runner: shutdown failed: " << e.what() << std::endl;
	}
    }

    void runner::stop()
    {
      mWork.reset();
    }

    void runner::run()
    {
      try
	{
	  mIoContext.run();
	}
      catch (const std::exception& e)
	{
	  std::cerr << "runner: worker terminated: " << e.what() << std::endl;
	}
    }
  } // namespace concurrency
} // namespace mcsig
