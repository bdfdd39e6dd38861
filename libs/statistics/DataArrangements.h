// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MCSIG_DATA_ARRANGEMENTS_H
#define __MCSIG_DATA_ARRANGEMENTS_H 1

#include <cstddef>
#include <string>
#include <vector>
#include "HypothesisTestException.h"

namespace mcsig
{
  /**
   * @brief Two unpaired samples (e.g. first babies vs. others).
   *
   * Used by AbsDiffMeans, SignedDiffMeans and DiffStdDev together with
   * PermutationSplit or ResampleWithReplacement.
   */
  template <class Decimal>
  struct TwoSampleData
  {
    using DecimalType = Decimal;

    std::vector<Decimal> group1;
    std::vector<Decimal> group2;

    std::size_t size() const
    {
      return group1.size() + group2.size();
    }

    bool empty() const
    {
      return group1.empty() && group2.empty();
    }
  };

  // Two equal-length series observed index for index (correlation tests).
  template <class Decimal>
  struct PairedSeries
  {
    using DecimalType = Decimal;

    std::vector<Decimal> x;
    std::vector<Decimal> y;

    std::size_t size() const
    {
      return x.size();
    }

    bool empty() const
    {
      return x.empty() && y.empty();
    }
  };

  // Observed count per category, e.g. die faces 1..6.
  template <class Decimal>
  struct CategoryCounts
  {
    using DecimalType = Decimal;

    std::vector<Decimal> counts;

    std::size_t numCategories() const
    {
      return counts.size();
    }

    Decimal total() const
    {
      Decimal n(0);
      for (const auto& c : counts)
	n += c;
      return n;
    }

    bool empty() const
    {
      return counts.empty();
    }
  };

  /**
   * @brief Raw categorical observations of two groups.
   *
   * Unlike CategoryCounts the observations are not aggregated, so the pool
   * can be shuffled and split. `categories` lists the values the chi-squared
   * statistic tabulates, in order; observations outside that list take part
   * in the shuffle but are not counted.
   */
  template <class Decimal>
  struct TwoCategoricalSamples
  {
    using DecimalType = Decimal;

    std::vector<Decimal> group1;
    std::vector<Decimal> group2;
    std::vector<Decimal> categories;

    std::size_t size() const
    {
      return group1.size() + group2.size();
    }

    bool empty() const
    {
      return group1.empty() && group2.empty();
    }
  };

  namespace detail
  {
    template <class Decimal>
    void requireNonEmptyGroups(const std::vector<Decimal>& g1,
			       const std::vector<Decimal>& g2,
			       const std::string& who)
    {
      if (g1.empty() && g2.empty())
	throw InvalidDataError(who + ": data arrangement is empty");

      if (g1.empty())
	throw InvalidDataError(who + ": first group is empty");

      if (g2.empty())
	throw InvalidDataError(who + ": second group is empty");
    }
  }
}

#endif
