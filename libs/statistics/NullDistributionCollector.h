// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MCSIG_NULL_DISTRIBUTION_COLLECTOR_H
#define __MCSIG_NULL_DISTRIBUTION_COLLECTOR_H 1

#include <cstddef>
#include <optional>
#include "SimulationObserver.h"
#include "ThreadSafeAccumulator.h"

namespace mcsig
{
  /**
   * @class NullDistributionCollector
   * @brief Observer that summarizes the simulated null distribution.
   *
   * Attach to a MonteCarloHypothesisTest to obtain min/max/mean/median/
   * standard deviation of the simulated statistics of the latest run
   * without keeping a second copy of the distribution.
   */
  template <class Decimal>
  class NullDistributionCollector : public SimulationObserver<Decimal>
  {
  public:
    void update(std::size_t, const Decimal& simulatedStatistic) override
    {
      mAccumulator.addValue(static_cast<double>(simulatedStatistic));
    }

    void clear() override
    {
      mAccumulator.clear();
    }

    std::size_t getCount() const
    {
      return mAccumulator.getCount();
    }

    std::optional<double> getMin() const
    {
      return mAccumulator.getMin();
    }

    std::optional<double> getMax() const
    {
      return mAccumulator.getMax();
    }

    std::optional<double> getMean() const
    {
      return mAccumulator.getMean();
    }

    std::optional<double> getMedian() const
    {
      return mAccumulator.getMedian();
    }

    std::optional<double> getStdDev() const
    {
      return mAccumulator.getStdDev();
    }

  private:
    ThreadSafeAccumulator mAccumulator;
  };
}

#endif
