// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MCSIG_TEST_STATISTICS_H
#define __MCSIG_TEST_STATISTICS_H 1

#include <cmath>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "DataArrangements.h"
#include "HypothesisTestException.h"
#include "ModelStates.h"
#include "StatUtils.h"

namespace mcsig
{
  /**
   * Test statistic functions.
   *
   * Every statistic is a stateless functor
   *
   *   Decimal operator()(const ArrangementType&) const
   *
   * (PooledChiSquared additionally takes the null model's state) plus a
   * validate() member the harness calls once at construction. The harness
   * compares simulated >= actual only, so two-sided statistics return a
   * magnitude.
   */

  // |mean(g1) - mean(g2)|
  template <class Decimal>
  class AbsDiffMeans
  {
  public:
    using ArrangementType = TwoSampleData<Decimal>;

    static std::string name()
    {
      return "AbsDiffMeans";
    }

    void validate(const ArrangementType& data) const
    {
      detail::requireNonEmptyGroups(data.group1, data.group2, "AbsDiffMeans");
    }

    Decimal operator()(const ArrangementType& data) const
    {
      const Decimal diff = StatUtils<Decimal>::computeMean(data.group1) -
	StatUtils<Decimal>::computeMean(data.group2);
      return diff < Decimal(0) ? -diff : diff;
    }
  };

  // mean(g1) - mean(g2); one-sided, "group 1 is larger"
  template <class Decimal>
  class SignedDiffMeans
  {
  public:
    using ArrangementType = TwoSampleData<Decimal>;

    static std::string name()
    {
      return "SignedDiffMeans";
    }

    void validate(const ArrangementType& data) const
    {
      detail::requireNonEmptyGroups(data.group1, data.group2, "SignedDiffMeans");
    }

    Decimal operator()(const ArrangementType& data) const
    {
      return StatUtils<Decimal>::computeMean(data.group1) -
	StatUtils<Decimal>::computeMean(data.group2);
    }
  };

  // sd(g1) - sd(g2) with the population (n denominator) standard deviation
  template <class Decimal>
  class DiffStdDev
  {
  public:
    using ArrangementType = TwoSampleData<Decimal>;

    static std::string name()
    {
      return "DiffStdDev";
    }

    void validate(const ArrangementType& data) const
    {
      detail::requireNonEmptyGroups(data.group1, data.group2, "DiffStdDev");
    }

    Decimal operator()(const ArrangementType& data) const
    {
      return StatUtils<Decimal>::computeStdDev(data.group1) -
	StatUtils<Decimal>::computeStdDev(data.group2);
    }
  };

  // |pearson(x, y)|
  template <class Decimal>
  class AbsCorrelation
  {
  public:
    using ArrangementType = PairedSeries<Decimal>;

    static std::string name()
    {
      return "AbsCorrelation";
    }

    void validate(const ArrangementType& data) const
    {
      if (data.x.empty() || data.y.empty())
	throw InvalidDataError("AbsCorrelation: paired series are empty");

      if (data.x.size() != data.y.size())
	throw InvalidDataError("AbsCorrelation: paired series have different lengths (" +
			       std::to_string(data.x.size()) + " vs " +
			       std::to_string(data.y.size()) + ")");

      if (data.x.size() < 2)
	throw InvalidDataError("AbsCorrelation: at least two pairs are required");
    }

    Decimal operator()(const ArrangementType& data) const
    {
      const Decimal r = StatUtils<Decimal>::computeCorrelation(data.x, data.y);
      return r < Decimal(0) ? -r : r;
    }
  };

  namespace detail
  {
    // Counts must be non-negative whole numbers with a positive total.
    template <class Decimal>
    void validateCategoryCounts(const CategoryCounts<Decimal>& data, const std::string& who)
    {
      if (data.counts.empty())
	throw InvalidDataError(who + ": no categories");

      for (const auto& c : data.counts)
	{
	  const double v = static_cast<double>(c);
	  if (!(v >= 0.0) || std::floor(v) != v)
	    throw InvalidDataError(who + ": category counts must be non-negative integers");
	}

      if (!(data.total() > Decimal(0)))
	throw InvalidDataError(who + ": total count is zero, every expected frequency would be zero");
    }

    // Uniform expected frequency n / k
    template <class Decimal>
    Decimal uniformExpected(const CategoryCounts<Decimal>& data)
    {
      return data.total() / Decimal(data.numCategories());
    }

    template <class Decimal>
    Decimal chiSquared(const std::vector<Decimal>& observed, const std::vector<Decimal>& expected)
    {
      Decimal stat(0);
      for (std::size_t i = 0; i < observed.size(); ++i)
	{
	  const Decimal d = observed[i] - expected[i];
	  stat += d * d / expected[i];
	}
      return stat;
    }
  }

  // sum |o_i - e_i| against the uniform expectation
  template <class Decimal>
  class CategoricalAbsDeviation
  {
  public:
    using ArrangementType = CategoryCounts<Decimal>;

    static std::string name()
    {
      return "CategoricalAbsDeviation";
    }

    void validate(const ArrangementType& data) const
    {
      detail::validateCategoryCounts(data, "CategoricalAbsDeviation");
    }

    Decimal operator()(const ArrangementType& data) const
    {
      const Decimal expected = detail::uniformExpected(data);

      Decimal stat(0);
      for (const auto& observed : data.counts)
	{
	  const Decimal d = observed - expected;
	  stat += d < Decimal(0) ? -d : d;
	}
      return stat;
    }
  };

  // sum (o_i - e_i)^2 / e_i against the uniform expectation
  template <class Decimal>
  class CategoricalChiSquared
  {
  public:
    using ArrangementType = CategoryCounts<Decimal>;

    static std::string name()
    {
      return "CategoricalChiSquared";
    }

    void validate(const ArrangementType& data) const
    {
      detail::validateCategoryCounts(data, "CategoricalChiSquared");
    }

    Decimal operator()(const ArrangementType& data) const
    {
      const std::vector<Decimal> expected(data.counts.size(), detail::uniformExpected(data));
      return detail::chiSquared(data.counts, expected);
    }
  };

  /**
   * @brief Chi-squared of each group against the pooled distribution.
   *
   * stat = chi2(counts(g1), p * |g1|) + chi2(counts(g2), p * |g2|)
   *
   * where p is PooledCategoricalState::expectedProbabilities, fixed when
   * the null model derived its state. Strict positivity of p is enforced
   * by PooledShuffleSplit::deriveState().
   */
  template <class Decimal>
  class PooledChiSquared
  {
  public:
    using ArrangementType = TwoCategoricalSamples<Decimal>;

    static std::string name()
    {
      return "PooledChiSquared";
    }

    void validate(const ArrangementType& data) const
    {
      detail::requireNonEmptyGroups(data.group1, data.group2, "PooledChiSquared");

      if (data.categories.empty())
	throw InvalidDataError("PooledChiSquared: no categories to tabulate");
    }

    Decimal operator()(const ArrangementType& data, const PooledCategoricalState<Decimal>& state) const
    {
      return groupChiSquared(data.group1, state) + groupChiSquared(data.group2, state);
    }

  private:
    static Decimal groupChiSquared(const std::vector<Decimal>& group,
				   const PooledCategoricalState<Decimal>& state)
    {
      const std::vector<Decimal> observed = StatUtils<Decimal>::tabulate(group, state.categories);

      std::vector<Decimal> expected;
      expected.reserve(state.expectedProbabilities.size());
      for (const auto& p : state.expectedProbabilities)
	expected.push_back(p * Decimal(group.size()));

      return detail::chiSquared(observed, expected);
    }
  };

  /**
   * @brief Statistic supplied as a function value.
   *
   * Lets a caller plug in an ad hoc statistic without writing a functor
   * type. A default-constructed instance is unbound; the harness rejects it
   * with UnimplementedVariantError at construction.
   */
  template <class Decimal, class Arrangement>
  class FunctionStatistic
  {
  public:
    using ArrangementType = Arrangement;
    using Function = std::function<Decimal(const Arrangement&)>;

    FunctionStatistic() = default;

    explicit FunctionStatistic(Function f, std::string label = "FunctionStatistic")
      : mFunction(std::move(f)),
	mName(std::move(label))
    {}

    std::string name() const
    {
      return mName;
    }

    explicit operator bool() const
    {
      return static_cast<bool>(mFunction);
    }

    Decimal operator()(const Arrangement& data) const
    {
      if (!mFunction)
	throw UnimplementedVariantError("FunctionStatistic: no statistic function bound");

      return mFunction(data);
    }

  private:
    Function mFunction;
    std::string mName;
  };
}

#endif
