// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//
#pragma once

#include <algorithm>
#include <cstdint>
#include <future>
#include <thread>
#include <vector>

namespace mcsig
{
  namespace concurrency
  {
    namespace detail
    {
      inline uint32_t defaultNumChunks()
      {
	const unsigned hw = std::thread::hardware_concurrency();
	return hw ? hw : 2;
      }
    }

    /**
     * @brief Runs body(i) for every i in [0, total) using executor exec.
     *
     * The range is cut into contiguous chunks; each chunk is one submitted
     * task that loops over its indices. With chunkSizeHint == 0 the range is
     * split into about one chunk per hardware thread. The call returns after
     * all chunks have finished and rethrows the first exception raised by a
     * chunk.
     */
    template<typename Executor, typename Body>
    void parallel_for_chunked(uint32_t total, Executor& exec, Body body, uint32_t chunkSizeHint = 0)
    {
      if (total == 0)
	return;

      uint32_t chunkSize = chunkSizeHint;
      if (chunkSize == 0)
	{
	  const uint32_t numChunks = detail::defaultNumChunks();
	  chunkSize = (total + numChunks - 1) / numChunks;
	}

      std::vector<std::future<void>> futures;
      futures.reserve((total + chunkSize - 1) / chunkSize);

      for (uint32_t start = 0; start < total; )
	{
	  const uint32_t end = std::min(total, start + chunkSize);

	  futures.emplace_back(exec.submit([start, end, &body]() {
	    for (uint32_t i = start; i < end; ++i)
	      body(i);
	  }));

	  start = end;
	}

      exec.waitAll(futures);
    }

    // One task per index; only sensible when each body(i) is expensive,
    // e.g. one power-analysis experiment with its own inner simulation.
    template<typename Executor, typename Body>
    void parallel_for(uint32_t total, Executor& exec, Body body)
    {
      parallel_for_chunked(total, exec, std::move(body), 1);
    }
  } // namespace concurrency
} // namespace mcsig
