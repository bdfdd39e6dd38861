// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MCSIG_PVALUE_COMPUTATION_POLICY_H
#define __MCSIG_PVALUE_COMPUTATION_POLICY_H 1

#include <cmath>
#include <cstdint>
#include <string>

namespace mcsig
{
  /**
   * @class EmpiricalPValueComputationPolicy
   * @brief Raw empirical tail fraction k / N.
   *
   * k is the number of simulated statistics >= the actual statistic and N
   * the number of trials. The resolution is 1/N; a result of 0 means only
   * that the true p-value is below 1/N.
   */
  class EmpiricalPValueComputationPolicy
  {
  public:
    static std::string name()
    {
      return "empirical";
    }

    static double computePermutationPValue(std::uint32_t k, std::uint32_t N)
    {
      return static_cast<double>(k) / static_cast<double>(N);
    }
  };

  /**
   * @class StandardPValueComputationPolicy
   * @brief "+1" corrected estimate (k + 1) / (N + 1).
   *
   * Counts the observed arrangement as one of the permutations
   * (Good 2005; North et al. 2002), so the p-value never reaches zero and
   * the smallest reportable value is 1/(N+1).
   */
  class StandardPValueComputationPolicy
  {
  public:
    static std::string name()
    {
      return "standard";
    }

    static double computePermutationPValue(std::uint32_t k, std::uint32_t N)
    {
      return static_cast<double>(k + 1) / static_cast<double>(N + 1);
    }
  };

  /**
   * @class WilsonPValueComputationPolicy
   * @brief One-sided 95% Wilson score upper bound of the +1 corrected estimate.
   *
   * \f[
   *   UB = \frac{\hat p + \frac{z^2}{2N} + z\sqrt{\frac{\hat p(1-\hat p)}{N} + \frac{z^2}{4N^2}}}{1 + z^2/N},
   *   \qquad \hat p = \frac{k+1}{N+1}
   * \f]
   *
   * Inflates the p-value by the Monte Carlo uncertainty at finite N, so a
   * rule "reject if p <= alpha" stays conservative. Clipped to [0, 1].
   */
  class WilsonPValueComputationPolicy
  {
  public:
    static std::string name()
    {
      return "wilson";
    }

    static double computePermutationPValue(std::uint32_t k, std::uint32_t N)
    {
      constexpr double kZOneSided95 = 1.6448536269514722;

      const double phat = static_cast<double>(k + 1) / static_cast<double>(N + 1);
      const double n = static_cast<double>(N);
      const double z2 = kZOneSided95 * kZOneSided95;

      const double denom  = 1.0 + z2 / n;
      const double center = phat + z2 / (2.0 * n);
      const double rad    = kZOneSided95 * std::sqrt((phat * (1.0 - phat) + z2 / (4.0 * n)) / n);

      double ub = (center + rad) / denom;
      if (ub < 0.0)
	ub = 0.0;
      if (ub > 1.0)
	ub = 1.0;

      return ub;
    }
  };
}

#endif
