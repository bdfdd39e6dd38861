// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//
#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace mcsig
{
  /**
   * @brief Descriptive statistics used by the test statistic functions.
   *
   * All routines are pure. Empty input yields zero rather than throwing;
   * the statistic functions validate their arrangements up front, so a
   * zero here never reaches a p-value silently.
   */
  template <class Decimal>
  struct StatUtils
  {
    /**
     * @brief Arithmetic mean.
     * @return 0 for empty input.
     */
    static Decimal computeMean(const std::vector<Decimal>& data)
    {
      if (data.empty())
	return Decimal(0);

      const Decimal sum = std::accumulate(data.begin(), data.end(), Decimal(0));
      return sum / Decimal(data.size());
    }

    /**
     * @brief Population variance (n denominator) given the mean.
     *        Returns 0 for an empty vector.
     */
    static Decimal computeVariance(const std::vector<Decimal>& data, const Decimal& mean)
    {
      const std::size_t n = data.size();
      if (n == 0)
	return Decimal(0);

      Decimal sq_sum(0);
      for (const auto& v : data)
	{
	  const Decimal diff = v - mean;
	  sq_sum += diff * diff;
	}

      return sq_sum / Decimal(n);
    }

    static Decimal computeStdDev(const std::vector<Decimal>& data, const Decimal& mean)
    {
      const double v = static_cast<double>(computeVariance(data, mean));
      return (v > 0.0) ? Decimal(std::sqrt(v)) : Decimal(0);
    }

    static Decimal computeStdDev(const std::vector<Decimal>& data)
    {
      return computeStdDev(data, computeMean(data));
    }

    /**
     * @brief Pearson correlation coefficient of two equal-length series.
     *
     * Returns 0 when either series has zero variance: no linear association
     * can be measured, and a NaN would make every comparison against the
     * observed statistic false.
     *
     * @throws std::invalid_argument if the lengths differ.
     */
    static Decimal computeCorrelation(const std::vector<Decimal>& x, const std::vector<Decimal>& y)
    {
      if (x.size() != y.size())
	throw std::invalid_argument("StatUtils::computeCorrelation: series lengths differ");

      if (x.size() < 2)
	return Decimal(0);

      const Decimal mx = computeMean(x);
      const Decimal my = computeMean(y);

      Decimal sxy(0), sxx(0), syy(0);
      for (std::size_t i = 0; i < x.size(); ++i)
	{
	  const Decimal dx = x[i] - mx;
	  const Decimal dy = y[i] - my;
	  sxy += dx * dy;
	  sxx += dx * dx;
	  syy += dy * dy;
	}

      const double denom = std::sqrt(static_cast<double>(sxx) * static_cast<double>(syy));
      if (!(denom > 0.0))
	return Decimal(0);

      return Decimal(static_cast<double>(sxy) / denom);
    }

    static Decimal computeMax(const std::vector<Decimal>& data)
    {
      if (data.empty())
	throw std::invalid_argument("StatUtils::computeMax: empty input");

      return *std::max_element(data.begin(), data.end());
    }

    /**
     * @brief Counts of each value of `categories` among `observations`.
     *
     * Values equal to no category are ignored. Categories are compared
     * exactly; they are small integral codes (weeks, faces, outcomes).
     */
    static std::vector<Decimal> tabulate(const std::vector<Decimal>& observations,
					 const std::vector<Decimal>& categories)
    {
      std::vector<Decimal> counts(categories.size(), Decimal(0));

      for (const auto& obs : observations)
	{
	  auto it = std::find(categories.begin(), categories.end(), obs);
	  if (it != categories.end())
	    counts[static_cast<std::size_t>(std::distance(categories.begin(), it))] += Decimal(1);
	}

      return counts;
    }
  };
}
