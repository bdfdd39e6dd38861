// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MCSIG_THREAD_SAFE_ACCUMULATOR_H
#define __MCSIG_THREAD_SAFE_ACCUMULATOR_H 1

#include <cmath>
#include <cstddef>
#include <mutex>
#include <optional>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/median.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>

namespace mcsig
{
  /**
   * @class ThreadSafeAccumulator
   * @brief Mutex-guarded Boost.Accumulators set over doubles.
   *
   * Boost accumulators are not thread-safe; worker threads of a concurrent
   * simulation all feed the same instance. Median is the P-square estimate
   * Boost provides, not the exact sample median.
   */
  class ThreadSafeAccumulator
  {
  private:
    using AccumulatorType = boost::accumulators::accumulator_set<
      double,
      boost::accumulators::stats<
	boost::accumulators::tag::min,
	boost::accumulators::tag::max,
	boost::accumulators::tag::mean,
	boost::accumulators::tag::median,
	boost::accumulators::tag::variance,
	boost::accumulators::tag::count
	>
      >;

  public:
    void addValue(double value)
    {
      std::lock_guard<std::mutex> lock(mMutex);
      mAccumulator(value);
    }

    std::optional<double> getMin() const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      if (boost::accumulators::count(mAccumulator) == 0)
	return std::nullopt;
      return boost::accumulators::min(mAccumulator);
    }

    std::optional<double> getMax() const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      if (boost::accumulators::count(mAccumulator) == 0)
	return std::nullopt;
      return boost::accumulators::max(mAccumulator);
    }

    std::optional<double> getMean() const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      if (boost::accumulators::count(mAccumulator) == 0)
	return std::nullopt;
      return boost::accumulators::mean(mAccumulator);
    }

    std::optional<double> getMedian() const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      if (boost::accumulators::count(mAccumulator) == 0)
	return std::nullopt;
      return boost::accumulators::median(mAccumulator);
    }

    // Sample standard deviation; nullopt below two values.
    std::optional<double> getStdDev() const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      const std::size_t n = boost::accumulators::count(mAccumulator);
      if (n < 2)
	return std::nullopt;

      // Boost reports the population variance
      const double popVar = boost::accumulators::variance(mAccumulator);
      return std::sqrt(popVar * static_cast<double>(n) / static_cast<double>(n - 1));
    }

    std::size_t getCount() const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      return boost::accumulators::count(mAccumulator);
    }

    void clear()
    {
      std::lock_guard<std::mutex> lock(mMutex);
      mAccumulator = AccumulatorType{};
    }

  private:
    mutable std::mutex mMutex;
    AccumulatorType mAccumulator;
  };
}

#endif
