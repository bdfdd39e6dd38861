// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//
#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

#include "IParallelExecutor.h"
#include "runner.hpp"

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used to run Monte Carlo trials.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread.
 *  - StdAsyncExecutor: one std::async(std::launch::async) per task.
 *  - BoostRunnerExecutor: posts to the process-wide Boost.Asio pool (see runner.hpp).
 *  - ThreadPoolExecutor<N>: a private pool of N workers owned by the executor.
 *
 * Trials only read immutable model state and write their own output slot,
 * so every policy produces the same simulated distribution for the same
 * per-trial seeds. The choice only affects throughput.
 */
namespace mcsig
{
  namespace concurrency
  {
    /**
     * @brief Executes tasks synchronously on the calling thread.
     *
     * Default policy of the hypothesis-test harness; convenient in unit tests.
     */
    class SingleThreadExecutor : public IParallelExecutor
    {
    public:
      std::future<void> submit(std::function<void()> task) override
      {
	std::promise<void> prom;
	auto fut = prom.get_future();

	try
	  {
	    task();
	    prom.set_value();
	  }
	catch (...)
	  {
	    prom.set_exception(std::current_exception());
	  }

	return fut;
      }
    };

    /**
     * @brief Launches every task with std::async(std::launch::async).
     *
     * Suitable for a handful of large chunks; parallel_for_chunked never submits
     * more chunks than there are hardware threads, so oversubscription is bounded.
     */
    class StdAsyncExecutor : public IParallelExecutor
    {
    public:
      std::future<void> submit(std::function<void()> task) override
      {
	return std::async(std::launch::async, std::move(task));
      }
    };

    /**
     * @brief Submits tasks to the shared Boost runner thread pool.
     *
     * The task is wrapped so that its exception travels through a
     * std::future rather than boost::unique_future.
     */
    class BoostRunnerExecutor : public IParallelExecutor
    {
    public:
      std::future<void> submit(std::function<void()> task) override
      {
	runner::ensure_initialized(getNCpus());

	auto prom = std::make_shared<std::promise<void>>();
	auto fut  = prom->get_future();

	runner::instance().post([task = std::move(task), prom]() {
	  try
	    {
	      task();
	      prom->set_value();
	    }
	  catch (...)
	    {
	      prom->set_exception(std::current_exception());
	    }
	});

	return fut;
      }
    };

    /**
     * @brief Fixed-size thread pool owned by the executor instance.
     *
     * N == 0 selects std::thread::hardware_concurrency() (2 if unknown).
     * Workers are joined in the destructor after the queue drains.
     */
    template <std::size_t N = 0>
    class ThreadPoolExecutor : public IParallelExecutor
    {
    public:
      ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
      ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

      ThreadPoolExecutor()
	: mWorkers(),
	  mTasks(),
	  mMutex(),
	  mCondition(),
	  mStop(false)
      {
	const unsigned hw = std::thread::hardware_concurrency();
	const std::size_t numThreads = N > 0 ? N : (hw ? hw : 2);

	try
	  {
	    for (std::size_t i = 0; i < numThreads; ++i)
	      mWorkers.emplace_back([this] { workerLoop(); });
	  }
	catch (...)
	  {
	    shutdown();
	    throw;
	  }
      }

      ~ThreadPoolExecutor()
      {
	shutdown();
      }

      std::size_t numThreads() const
      {
	return mWorkers.size();
      }

      std::future<void> submit(std::function<void()> task) override
      {
	auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
	auto fut = packaged->get_future();

	{
	  std::lock_guard<std::mutex> lock(mMutex);
	  if (mStop)
	    throw std::runtime_error("ThreadPoolExecutor::submit: executor is stopped");

	  mTasks.emplace([packaged]() { (*packaged)(); });
	}

	mCondition.notify_one();
	return fut;
      }

    private:
      void workerLoop()
      {
	for (;;)
	  {
	    std::function<void()> task;

	    {
	      std::unique_lock<std::mutex> lock(mMutex);
	      mCondition.wait(lock, [this] { return mStop || !mTasks.empty(); });

	      if (mStop && mTasks.empty())
		return;

	      task = std::move(mTasks.front());
	      mTasks.pop();
	    }

	    // packaged_task stores any exception in its future
	    task();
	  }
      }

      void shutdown()
      {
	{
	  std::lock_guard<std::mutex> lock(mMutex);
	  mStop = true;
	}

	mCondition.notify_all();

	for (auto& worker : mWorkers)
	  if (worker.joinable())
	    worker.join();
      }

    private:
      std::vector<std::thread>          mWorkers;
      std::queue<std::function<void()>> mTasks;
      std::mutex                        mMutex;
      std::condition_variable           mCondition;
      bool                              mStop;
    };
  } // namespace concurrency
} // namespace mcsig
