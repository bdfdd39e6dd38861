#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <random>
#include <vector>

#include "NullModels.h"
#include "TestStatistics.h"

using namespace mcsig;
using Catch::Approx;

namespace
{
  std::vector<double> sorted(std::vector<double> v)
  {
    std::sort(v.begin(), v.end());
    return v;
  }
}

TEST_CASE("PermutationSplit preserves shape and the pooled multiset", "[NullModels][permutation]")
{
  TwoSampleData<double> observed{{1.0, 2.0, 3.0, 4.0}, {10.0, 20.0, 30.0}};
  PermutationSplit<double> model;

  const auto state = model.deriveState(observed);
  REQUIRE(state.n1 == 4);
  REQUIRE(state.n2 == 3);
  REQUIRE(state.pool == std::vector<double>{1.0, 2.0, 3.0, 4.0, 10.0, 20.0, 30.0});

  const auto poolBefore = state.pool;
  std::mt19937_64 rng(11u);
  bool sawDifferentSplit = false;

  for (int t = 0; t < 20; ++t)
    {
      const auto trial = model.generate(state, rng);
      REQUIRE(trial.group1.size() == 4);
      REQUIRE(trial.group2.size() == 3);

      std::vector<double> combined(trial.group1);
      combined.insert(combined.end(), trial.group2.begin(), trial.group2.end());
      REQUIRE(sorted(combined) == sorted(poolBefore));

      if (trial.group1 != observed.group1)
	sawDifferentSplit = true;
    }

  REQUIRE(sawDifferentSplit);
  REQUIRE(state.pool == poolBefore);
}

TEST_CASE("ResampleWithReplacement draws only pooled values", "[NullModels][bootstrap]")
{
  TwoSampleData<double> observed{{1.0, 2.0}, {3.0, 4.0, 5.0}};
  ResampleWithReplacement<double> model;
  const auto state = model.deriveState(observed);
  const auto poolBefore = state.pool;

  std::mt19937_64 rng(3u);
  bool sawRepeat = false;
  for (int t = 0; t < 50; ++t)
    {
      const auto trial = model.generate(state, rng);
      REQUIRE(trial.group1.size() == 2);
      REQUIRE(trial.group2.size() == 3);

      for (double v : trial.group1)
	REQUIRE(std::find(poolBefore.begin(), poolBefore.end(), v) != poolBefore.end());
      for (double v : trial.group2)
	REQUIRE(std::find(poolBefore.begin(), poolBefore.end(), v) != poolBefore.end());

      std::vector<double> combined(trial.group1);
      combined.insert(combined.end(), trial.group2.begin(), trial.group2.end());
      auto s = sorted(combined);
      if (std::adjacent_find(s.begin(), s.end()) != s.end())
	sawRepeat = true;
    }

  REQUIRE(sawRepeat);
  REQUIRE(state.pool == poolBefore);
}

TEST_CASE("Two-group null models reject empty groups", "[NullModels][errors]")
{
  REQUIRE_THROWS_AS(PermutationSplit<double>().deriveState(TwoSampleData<double>{{}, {1.0}}), InvalidDataError);
  REQUIRE_THROWS_AS(ResampleWithReplacement<double>().deriveState(TwoSampleData<double>{{1.0}, {}}), InvalidDataError);
}

TEST_CASE("SinglesidePermutation permutes x and keeps y", "[NullModels][correlation]")
{
  PairedSeries<double> observed{{1.0, 2.0, 3.0, 4.0, 5.0, 6.0}, {6.0, 5.0, 4.0, 3.0, 2.0, 1.0}};
  SinglesidePermutation<double> model;
  const auto state = model.deriveState(observed);

  std::mt19937_64 rng(8u);
  for (int t = 0; t < 10; ++t)
    {
      const auto trial = model.generate(state, rng);
      REQUIRE(trial.y == observed.y);
      REQUIRE(sorted(trial.x) == observed.x);
    }

  REQUIRE(state.x == observed.x);
  REQUIRE_THROWS_AS(model.deriveState(PairedSeries<double>{{1.0, 2.0}, {1.0}}), InvalidDataError);
}

TEST_CASE("CategoricalRedraw keeps n and k", "[NullModels][categorical]")
{
  CategoryCounts<double> dice{{8.0, 9.0, 19.0, 5.0, 8.0, 11.0}};
  CategoricalRedraw<double> model;
  const auto state = model.deriveState(dice);

  REQUIRE(state.numObservations == 60);
  REQUIRE(state.numCategories == 6);

  std::mt19937_64 rng(21u);
  for (int t = 0; t < 20; ++t)
    {
      const auto trial = model.generate(state, rng);
      REQUIRE(trial.counts.size() == 6);
      REQUIRE(trial.total() == Approx(60.0));
    }

  REQUIRE_THROWS_AS(model.deriveState(CategoryCounts<double>{}), InvalidDataError);
  REQUIRE_THROWS_AS(model.deriveState(CategoryCounts<double>{{0.0, 0.0}}), InvalidDataError);
  REQUIRE_THROWS_AS(model.deriveState(CategoryCounts<double>{{1.5, 2.0}}), InvalidDataError);
}

TEST_CASE("PooledShuffleSplit fixes expected probabilities once", "[NullModels][pooled]")
{
  TwoCategoricalSamples<double> observed{{1.0, 1.0, 2.0, 3.0}, {2.0, 2.0, 3.0, 3.0, 1.0}, {1.0, 2.0, 3.0}};
  PooledShuffleSplit<double> model;
  const auto state = model.deriveState(observed);

  REQUIRE(state.n1 == 4);
  REQUIRE(state.n2 == 5);
  REQUIRE(state.expectedProbabilities.size() == 3);
  for (double p : state.expectedProbabilities)
    REQUIRE(p == Approx(1.0 / 3.0));

  const auto probsBefore = state.expectedProbabilities;
  std::mt19937_64 rng(5u);
  for (int t = 0; t < 10; ++t)
    {
      const auto trial = model.generate(state, rng);
      REQUIRE(trial.group1.size() == 4);
      REQUIRE(trial.group2.size() == 5);
      REQUIRE(trial.categories == observed.categories);
    }
  REQUIRE(state.expectedProbabilities == probsBefore);

  SECTION("A category absent from the pool is rejected")
  {
    TwoCategoricalSamples<double> missing{{1.0, 2.0}, {2.0, 1.0}, {1.0, 2.0, 3.0}};
    REQUIRE_THROWS_AS(model.deriveState(missing), InvalidDataError);
  }

  SECTION("No categories to tabulate")
  {
    TwoCategoricalSamples<double> none{{1.0}, {2.0}, {}};
    REQUIRE_THROWS_AS(model.deriveState(none), InvalidDataError);
  }
}

TEST_CASE("FunctionNullModel forwards to its functions", "[NullModels][function]")
{
  using Model = FunctionNullModel<CategoryCounts<double>, CategoricalState>;

  Model unbound;
  REQUIRE_FALSE(static_cast<bool>(unbound));
  REQUIRE_THROWS_AS(unbound.deriveState(CategoryCounts<double>{{1.0}}), UnimplementedVariantError);

  Model constant(
    [](const CategoryCounts<double>& c) {
      return CategoricalState{static_cast<std::size_t>(c.total()), c.numCategories()};
    },
    [](const CategoricalState& s, Model::Engine&) {
      CategoryCounts<double> out;
      out.counts.assign(s.numCategories, 0.0);
      out.counts[0] = static_cast<double>(s.numObservations);
      return out;
    },
    "AllInFirst");

  REQUIRE(static_cast<bool>(constant));
  REQUIRE(constant.name() == "AllInFirst");

  const auto state = constant.deriveState(CategoryCounts<double>{{2.0, 3.0}});
  Model::Engine rng(1u);
  const auto trial = constant.generate(state, rng);
  REQUIRE(trial.counts == std::vector<double>{5.0, 0.0});
}
