// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MCSIG_NULL_MODELS_H
#define __MCSIG_NULL_MODELS_H 1

#include <cmath>
#include <cstddef>
#include <functional>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include "DataArrangements.h"
#include "HypothesisTestException.h"
#include "ModelStates.h"
#include "RngUtils.h"
#include "StatUtils.h"

namespace mcsig
{
  /**
   * Null models.
   *
   * A null model is a pair of operations:
   *
   *   StateType       deriveState(const ArrangementType& observed) const;
   *   ArrangementType generate(const StateType& state, Engine& rng) const;
   *
   * deriveState() runs exactly once per harness. generate() never modifies
   * the state: shuffles and draws work on a copy, so trials may run
   * concurrently against one shared state.
   */

  namespace detail
  {
    template <class Decimal>
    std::vector<Decimal> concatenate(const std::vector<Decimal>& a, const std::vector<Decimal>& b)
    {
      std::vector<Decimal> pool;
      pool.reserve(a.size() + b.size());
      pool.insert(pool.end(), a.begin(), a.end());
      pool.insert(pool.end(), b.begin(), b.end());
      return pool;
    }

    template <class Decimal, class Engine>
    std::vector<Decimal> drawWithReplacement(const std::vector<Decimal>& pool, std::size_t m, Engine& rng)
    {
      std::vector<Decimal> out;
      out.reserve(m);
      for (std::size_t i = 0; i < m; ++i)
	out.push_back(pool[rng_utils::get_random_index(rng, pool.size())]);
      return out;
    }

    // Fresh uniform permutation of a copy of `pool`, cut at n1.
    template <class Decimal, class Engine>
    std::pair<std::vector<Decimal>, std::vector<Decimal>>
    shuffleAndSplit(const std::vector<Decimal>& pool, std::size_t n1, Engine& rng)
    {
      std::vector<Decimal> work(pool);
      rng_utils::shuffle(work, rng);

      std::vector<Decimal> first(work.begin(), work.begin() + static_cast<std::ptrdiff_t>(n1));
      std::vector<Decimal> second(work.begin() + static_cast<std::ptrdiff_t>(n1), work.end());
      return {std::move(first), std::move(second)};
    }
  }

  // Permutation test for two unpaired groups: shuffle the pool, split at n1.
  template <class Decimal>
  class PermutationSplit
  {
  public:
    using ArrangementType = TwoSampleData<Decimal>;
    using StateType = PooledSampleState<Decimal>;

    static std::string name()
    {
      return "PermutationSplit";
    }

    StateType deriveState(const ArrangementType& observed) const
    {
      detail::requireNonEmptyGroups(observed.group1, observed.group2, "PermutationSplit");

      return StateType{detail::concatenate(observed.group1, observed.group2),
		       observed.group1.size(),
		       observed.group2.size()};
    }

    template <class Engine>
    ArrangementType generate(const StateType& state, Engine& rng) const
    {
      auto halves = detail::shuffleAndSplit(state.pool, state.n1, rng);
      return ArrangementType{std::move(halves.first), std::move(halves.second)};
    }
  };

  /**
   * @brief Bootstrap null: both groups drawn with replacement from the pool.
   *
   * Unlike PermutationSplit the simulated groups need not reproduce the
   * pooled multiset, so p-values generally differ between the two models.
   */
  template <class Decimal>
  class ResampleWithReplacement
  {
  public:
    using ArrangementType = TwoSampleData<Decimal>;
    using StateType = PooledSampleState<Decimal>;

    static std::string name()
    {
      return "ResampleWithReplacement";
    }

    StateType deriveState(const ArrangementType& observed) const
    {
      detail::requireNonEmptyGroups(observed.group1, observed.group2, "ResampleWithReplacement");

      return StateType{detail::concatenate(observed.group1, observed.group2),
		       observed.group1.size(),
		       observed.group2.size()};
    }

    template <class Engine>
    ArrangementType generate(const StateType& state, Engine& rng) const
    {
      ArrangementType simulated;
      simulated.group1 = detail::drawWithReplacement(state.pool, state.n1, rng);
      simulated.group2 = detail::drawWithReplacement(state.pool, state.n2, rng);
      return simulated;
    }
  };

  // Correlation null: permute x only, keep y in place.
  template <class Decimal>
  class SinglesidePermutation
  {
  public:
    using ArrangementType = PairedSeries<Decimal>;
    using StateType = PairedSeriesState<Decimal>;

    static std::string name()
    {
      return "SinglesidePermutation";
    }

    StateType deriveState(const ArrangementType& observed) const
    {
      if (observed.x.empty() || observed.y.empty())
	throw InvalidDataError("SinglesidePermutation: paired series are empty");

      if (observed.x.size() != observed.y.size())
	throw InvalidDataError("SinglesidePermutation: paired series have different lengths");

      return StateType{observed.x, observed.y};
    }

    template <class Engine>
    ArrangementType generate(const StateType& state, Engine& rng) const
    {
      ArrangementType simulated{state.x, state.y};
      rng_utils::shuffle(simulated.x, rng);
      return simulated;
    }
  };

  // n independent uniform outcomes over k categories, tabulated.
  template <class Decimal>
  class CategoricalRedraw
  {
  public:
    using ArrangementType = CategoryCounts<Decimal>;
    using StateType = CategoricalState;

    static std::string name()
    {
      return "CategoricalRedraw";
    }

    StateType deriveState(const ArrangementType& observed) const
    {
      if (observed.counts.empty())
	throw InvalidDataError("CategoricalRedraw: no categories");

      const double total = static_cast<double>(observed.total());
      if (!(total > 0.0))
	throw InvalidDataError("CategoricalRedraw: total count must be positive");

      if (std::floor(total) != total)
	throw InvalidDataError("CategoricalRedraw: total count must be a whole number");

      return StateType{static_cast<std::size_t>(std::llround(total)), observed.counts.size()};
    }

    template <class Engine>
    ArrangementType generate(const StateType& state, Engine& rng) const
    {
      ArrangementType simulated;
      simulated.counts.assign(state.numCategories, Decimal(0));

      for (std::size_t i = 0; i < state.numObservations; ++i)
	simulated.counts[rng_utils::get_random_index(rng, state.numCategories)] += Decimal(1);

      return simulated;
    }
  };

  /**
   * @brief Permutation null for two groups of raw categorical observations.
   *
   * The state carries the pooled category probabilities used by
   * PooledChiSquared. They are derived from the observed pool once and are
   * not recomputed from simulated splits.
   */
  template <class Decimal>
  class PooledShuffleSplit
  {
  public:
    using ArrangementType = TwoCategoricalSamples<Decimal>;
    using StateType = PooledCategoricalState<Decimal>;

    static std::string name()
    {
      return "PooledShuffleSplit";
    }

    StateType deriveState(const ArrangementType& observed) const
    {
      detail::requireNonEmptyGroups(observed.group1, observed.group2, "PooledShuffleSplit");

      if (observed.categories.empty())
	throw InvalidDataError("PooledShuffleSplit: no categories to tabulate");

      StateType state;
      state.pool = detail::concatenate(observed.group1, observed.group2);
      state.n1 = observed.group1.size();
      state.n2 = observed.group2.size();
      state.categories = observed.categories;

      const std::vector<Decimal> freqs = StatUtils<Decimal>::tabulate(state.pool, state.categories);
      const Decimal poolSize(state.pool.size());

      state.expectedProbabilities.reserve(freqs.size());
      for (std::size_t i = 0; i < freqs.size(); ++i)
	{
	  if (!(freqs[i] > Decimal(0)))
	    throw InvalidDataError("PooledShuffleSplit: category " +
				   std::to_string(static_cast<double>(state.categories[i])) +
				   " never occurs in the pooled sample, its expected frequency would be zero");

	  state.expectedProbabilities.push_back(freqs[i] / poolSize);
	}

      return state;
    }

    template <class Engine>
    ArrangementType generate(const StateType& state, Engine& rng) const
    {
      auto halves = detail::shuffleAndSplit(state.pool, state.n1, rng);
      return ArrangementType{std::move(halves.first), std::move(halves.second), state.categories};
    }
  };

  /**
   * @brief Null model supplied as a pair of function values.
   *
   * The generator receives the per-trial engine used by the harness
   * (std::mt19937_64). Either function left empty makes the model unbound.
   */
  template <class Arrangement, class State>
  class FunctionNullModel
  {
  public:
    using ArrangementType = Arrangement;
    using StateType = State;
    using Engine = std::mt19937_64;
    using DeriveFunction = std::function<State(const Arrangement&)>;
    using GenerateFunction = std::function<Arrangement(const State&, Engine&)>;

    FunctionNullModel() = default;

    FunctionNullModel(DeriveFunction derive, GenerateFunction gen, std::string label = "FunctionNullModel")
      : mDerive(std::move(derive)),
	mGenerate(std::move(gen)),
	mName(std::move(label))
    {}

    std::string name() const
    {
      return mName;
    }

    explicit operator bool() const
    {
      return static_cast<bool>(mDerive) && static_cast<bool>(mGenerate);
    }

    State deriveState(const Arrangement& observed) const
    {
      if (!mDerive)
	throw UnimplementedVariantError("FunctionNullModel: no state derivation bound");

      return mDerive(observed);
    }

    Arrangement generate(const State& state, Engine& rng) const
    {
      if (!mGenerate)
	throw UnimplementedVariantError("FunctionNullModel: no trial generator bound");

      return mGenerate(state, rng);
    }

  private:
    DeriveFunction mDerive;
    GenerateFunction mGenerate;
    std::string mName;
  };
}

#endif
