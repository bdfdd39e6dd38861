// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MCSIG_POWER_ANALYSIS_H
#define __MCSIG_POWER_ANALYSIS_H 1

#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <utility>
#include <vector>

#include "randutils.hpp"
#include "DataArrangements.h"
#include "HypothesisTestConfiguration.h"
#include "HypothesisTestException.h"
#include "MonteCarloHypothesisTest.h"
#include "NullModels.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "RngUtils.h"
#include "SimulationObserver.h"

namespace mcsig
{
  /**
   * Experiment resamplers: draw a new experiment of the same shape and size
   * from the observed one, treating the observed data as the population.
   */

  // Each group resampled with replacement from itself.
  template <class Decimal, class Engine>
  TwoSampleData<Decimal> resampleExperiment(const TwoSampleData<Decimal>& observed, Engine& rng)
  {
    return TwoSampleData<Decimal>{
      detail::drawWithReplacement(observed.group1, observed.group1.size(), rng),
      detail::drawWithReplacement(observed.group2, observed.group2.size(), rng)};
  }

  // Pairs resampled with replacement, keeping each (x_i, y_i) together.
  template <class Decimal, class Engine>
  PairedSeries<Decimal> resampleExperiment(const PairedSeries<Decimal>& observed, Engine& rng)
  {
    PairedSeries<Decimal> experiment;
    experiment.x.reserve(observed.x.size());
    experiment.y.reserve(observed.y.size());

    for (std::size_t i = 0; i < observed.x.size(); ++i)
      {
	const std::size_t j = rng_utils::get_random_index(rng, observed.x.size());
	experiment.x.push_back(observed.x[j]);
	experiment.y.push_back(observed.y[j]);
      }

    return experiment;
  }

  // n outcomes drawn with the observed category proportions.
  template <class Decimal, class Engine>
  CategoryCounts<Decimal> resampleExperiment(const CategoryCounts<Decimal>& observed, Engine& rng)
  {
    std::vector<double> weights;
    weights.reserve(observed.counts.size());
    for (const auto& c : observed.counts)
      weights.push_back(static_cast<double>(c));

    std::discrete_distribution<std::size_t> pick(weights.begin(), weights.end());
    const auto n = static_cast<std::size_t>(std::llround(static_cast<double>(observed.total())));

    CategoryCounts<Decimal> experiment;
    experiment.counts.assign(observed.counts.size(), Decimal(0));
    for (std::size_t i = 0; i < n; ++i)
      experiment.counts[pick(rng_utils::get_engine(rng))] += Decimal(1);

    return experiment;
  }

  template <class Decimal, class Engine>
  TwoCategoricalSamples<Decimal> resampleExperiment(const TwoCategoricalSamples<Decimal>& observed, Engine& rng)
  {
    return TwoCategoricalSamples<Decimal>{
      detail::drawWithReplacement(observed.group1, observed.group1.size(), rng),
      detail::drawWithReplacement(observed.group2, observed.group2.size(), rng),
      observed.categories};
  }

  /**
   * @class PowerAnalysis
   * @brief Estimates the false-negative rate of a Monte Carlo test.
   *
   * Repeats the whole experiment `numExperiments` times on data resampled
   * from the observation (resampleExperiment), runs a fresh
   * MonteCarloHypothesisTest with `iterationsPerExperiment` trials on each,
   * and counts experiments with p > alpha. If the observed effect is real,
   * that fraction estimates the probability of missing it; power is its
   * complement.
   *
   * Observers attached to this object receive (experiment index, p-value)
   * once per experiment.
   *
   * Experiments run through `Executor`; each inner test runs single-threaded
   * with its own seeded std::mt19937_64. Errors raised by an inner test
   * (e.g. a resampled pool missing a chi-squared category) propagate.
   */
  template <class Decimal,
	    class StatisticFunction,
	    class NullModel,
	    class PValueComputationPolicy = EmpiricalPValueComputationPolicy,
	    class Executor = concurrency::SingleThreadExecutor,
	    class Rng = randutils::mt19937_rng>
  class PowerAnalysis : public SimulationSubject<Decimal>
  {
  public:
    using ArrangementType = typename NullModel::ArrangementType;
    using TrialEngine = std::mt19937_64;
    using ExperimentTest = MonteCarloHypothesisTest<Decimal,
						    StatisticFunction,
						    NullModel,
						    PValueComputationPolicy,
						    concurrency::SingleThreadExecutor,
						    TrialEngine>;

    struct Result
    {
      double        falseNegativeRate;
      double        power;
      double        alpha;
      std::uint32_t numExperiments;
      std::uint32_t numMissed;                  // experiments with p > alpha
      std::uint32_t iterationsPerExperiment;
    };

    PowerAnalysis(std::uint32_t numExperiments = HypothesisTestConfiguration::kDefaultPowerExperiments,
		  std::uint32_t iterationsPerExperiment = HypothesisTestConfiguration::kDefaultPowerIterations,
		  double alpha = HypothesisTestConfiguration::kDefaultAlpha,
		  StatisticFunction statistic = StatisticFunction(),
		  NullModel nullModel = NullModel())
      : SimulationSubject<Decimal>(),
	mNumExperiments(numExperiments),
	mIterations(iterationsPerExperiment),
	mAlpha(alpha),
	mStatistic(std::move(statistic)),
	mNullModel(std::move(nullModel)),
	mExecutor(std::make_shared<Executor>())
    {
      if (mNumExperiments < 1)
	throw InvalidArgumentError("PowerAnalysis: numExperiments must be >= 1");

      if (mIterations < 1)
	throw InvalidArgumentError("PowerAnalysis: iterationsPerExperiment must be >= 1");

      if (!(mAlpha > 0.0 && mAlpha < 1.0))
	throw InvalidArgumentError("PowerAnalysis: alpha must be in (0, 1)");
    }

    Result run(const ArrangementType& observed, Rng& rng) const
    {
      // Fails fast on an observation the pair cannot test at all
      const ExperimentTest probe(observed, mStatistic, mNullModel, std::uint64_t(0));

      std::vector<std::uint64_t> seeds(mNumExperiments);
      for (auto& seed : seeds)
	seed = rng_utils::get_random_value(rng);

      std::atomic<std::uint32_t> missed{0};

      concurrency::parallel_for_chunked(mNumExperiments, *mExecutor,
	[this, &seeds, &observed, &missed](std::uint32_t e) {
	  TrialEngine engine = rng_utils::make_seeded_engine<TrialEngine>(seeds[e]);
	  const ArrangementType experiment = resampleExperiment(observed, engine);

	  ExperimentTest test(experiment, mStatistic, mNullModel, rng_utils::get_random_value(engine));
	  const double pValue = test.estimatePValue(mIterations);

	  if (pValue > mAlpha)
	    missed.fetch_add(1, std::memory_order_relaxed);

	  this->notifyObservers(e, Decimal(pValue));
	});

      const std::uint32_t numMissed = missed.load(std::memory_order_relaxed);
      const double fnr = static_cast<double>(numMissed) / static_cast<double>(mNumExperiments);

      return Result{fnr, 1.0 - fnr, mAlpha, mNumExperiments, numMissed, mIterations};
    }

    Result run(const ArrangementType& observed, std::uint64_t seed) const
    {
      Rng rng = rng_utils::make_seeded_engine<Rng>(seed);
      return run(observed, rng);
    }

    std::uint32_t getNumExperiments() const
    {
      return mNumExperiments;
    }

    std::uint32_t getIterationsPerExperiment() const
    {
      return mIterations;
    }

    double getAlpha() const
    {
      return mAlpha;
    }

  private:
    std::uint32_t mNumExperiments;
    std::uint32_t mIterations;
    double mAlpha;
    StatisticFunction mStatistic;
    NullModel mNullModel;
    std::shared_ptr<Executor> mExecutor;
  };
}

#endif
