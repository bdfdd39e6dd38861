#include <catch2/catch_test_macros.hpp>
#include "ParallelFor.h"
#include "ParallelExecutors.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mcsig::concurrency;

namespace
{
  // Records how many tasks reach the executor
  class CountingExecutor : public SingleThreadExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      ++submitted;
      return SingleThreadExecutor::submit(std::move(task));
    }

    int submitted = 0;
  };
}

TEST_CASE("parallel_for basic operations", "[parallel_for]")
{
  SECTION("Basic execution with SingleThreadExecutor")
  {
    SingleThreadExecutor executor;
    std::vector<int> results(10, 0);

    parallel_for(10, executor, [&results](uint32_t i) {
      results[i] = static_cast<int>(i * 2);
    });

    for (uint32_t i = 0; i < 10; ++i) {
      REQUIRE(results[i] == static_cast<int>(i * 2));
    }
  }

  SECTION("Basic execution with ThreadPoolExecutor")
  {
    ThreadPoolExecutor<4> executor;
    std::atomic<int> counter{0};

    parallel_for(100, executor, [&counter](uint32_t) {
      counter.fetch_add(1, std::memory_order_relaxed);
    });

    REQUIRE(counter.load() == 100);
  }

  SECTION("Zero iterations")
  {
    CountingExecutor executor;
    std::atomic<int> counter{0};

    parallel_for(0, executor, [&counter](uint32_t) {
      counter.fetch_add(1);
    });

    REQUIRE(counter.load() == 0);
    REQUIRE(executor.submitted == 0);
  }

  SECTION("One task per index")
  {
    CountingExecutor executor;
    parallel_for(17, executor, [](uint32_t) {});
    REQUIRE(executor.submitted == 17);
  }
}

TEST_CASE("parallel_for_chunked covers every index exactly once", "[parallel_for_chunked]")
{
  SECTION("Explicit chunk size")
  {
    CountingExecutor executor;
    std::vector<int> hits(103, 0);

    parallel_for_chunked(103, executor, [&hits](uint32_t i) { ++hits[i]; }, 10);

    REQUIRE(executor.submitted == 11);
    for (int h : hits)
      REQUIRE(h == 1);
  }

  SECTION("Default chunking is bounded by hardware threads")
  {
    CountingExecutor executor;
    std::vector<int> hits(1000, 0);

    parallel_for_chunked(1000, executor, [&hits](uint32_t i) { ++hits[i]; });

    const unsigned hw = std::thread::hardware_concurrency();
    REQUIRE(executor.submitted <= static_cast<int>(hw ? hw : 2));
    for (int h : hits)
      REQUIRE(h == 1);
  }

  SECTION("Chunk larger than the range")
  {
    CountingExecutor executor;
    std::vector<int> hits(5, 0);

    parallel_for_chunked(5, executor, [&hits](uint32_t i) { ++hits[i]; }, 64);

    REQUIRE(executor.submitted == 1);
    REQUIRE(hits == std::vector<int>(5, 1));
  }

  SECTION("Concurrent workers write disjoint slots")
  {
    ThreadPoolExecutor<4> executor;
    std::vector<uint32_t> slots(5000, 0);

    parallel_for_chunked(5000, executor, [&slots](uint32_t i) { slots[i] = i + 1; }, 37);

    for (uint32_t i = 0; i < slots.size(); ++i)
      REQUIRE(slots[i] == i + 1);
  }

  SECTION("Work is spread over several threads")
  {
    ThreadPoolExecutor<4> executor;
    std::mutex m;
    std::set<std::thread::id> ids;

    parallel_for_chunked(64, executor, [&](uint32_t) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      std::lock_guard<std::mutex> lock(m);
      ids.insert(std::this_thread::get_id());
    }, 4);

    REQUIRE(ids.size() >= 1);
    REQUIRE(ids.count(std::this_thread::get_id()) == 0);
  }
}

TEST_CASE("parallel_for_chunked propagates the first exception", "[parallel_for_chunked][exceptions]")
{
  SECTION("SingleThreadExecutor")
  {
    SingleThreadExecutor executor;
    std::atomic<int> visited{0};

    REQUIRE_THROWS_AS(parallel_for_chunked(50, executor, [&visited](uint32_t i) {
      visited.fetch_add(1);
      if (i == 25)
        throw std::domain_error("bad trial");
    }, 10), std::domain_error);

    // The failing chunk stops; the other chunks still run
    REQUIRE(visited.load() == 46);
  }

  SECTION("ThreadPoolExecutor")
  {
    ThreadPoolExecutor<3> executor;

    REQUIRE_THROWS_AS(parallel_for_chunked(90, executor, [](uint32_t i) {
      if (i % 30 == 7)
        throw std::logic_error("bad trial");
    }, 5), std::logic_error);
  }
}
