#pragma once

#include "ExperimentConfiguration.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace mcsig {

struct NullDistributionSummary {
    std::size_t count = 0;
    std::optional<double> min;
    std::optional<double> max;
    std::optional<double> mean;
    std::optional<double> median;
    std::optional<double> stdDev;
};

struct PowerReport {
    std::uint32_t numExperiments = 0;
    std::uint32_t iterationsPerExperiment = 0;
    std::uint32_t numMissed = 0;
    double alpha = 0.0;
    double falseNegativeRate = 0.0;
    double power = 0.0;
};

/**
 * @brief Outcome of one experiment, ready to print.
 */
struct ExperimentReport {
    std::string name;
    std::string statistic;
    std::string nullModel;
    std::string pValuePolicy;
    std::string executor;
    DataShape shape = DataShape::TwoSample;

    double actualStatistic = 0.0;
    double pValue = 0.0;
    double pValueResolution = 0.0;
    double maxSimulatedStatistic = 0.0;
    std::uint32_t iterations = 0;
    std::uint32_t extremeCount = 0;

    NullDistributionSummary nullSummary;
    std::optional<PowerReport> power;
};

/**
 * @brief Runtime factory over the compile-time harness.
 *
 * Resolves the statistic, null model, p-value policy and executor names of
 * an ExperimentConfiguration to one MonteCarloHypothesisTest instantiation,
 * runs it and optionally the power analysis.
 *
 * Statistic names:  AbsDiffMeans, SignedDiffMeans, DiffStdDev, AbsCorrelation,
 *                   CategoricalAbsDeviation, CategoricalChiSquared, PooledChiSquared
 * Null models:      PermutationSplit, ResampleWithReplacement, SinglesidePermutation,
 *                   CategoricalRedraw, PooledShuffleSplit
 * P-value policies: empirical, standard, wilson
 * Executors:        single, threadpool, async, boost
 *
 * An unknown name raises UnimplementedVariantError. A statistic and null
 * model that work on different arrangements, or data of the wrong shape,
 * raise InvalidDataError.
 */
class ExperimentRunner {
public:
    ExperimentReport run(const ExperimentConfiguration& config) const;
};

void printReport(std::ostream& os, const ExperimentReport& report);

} // namespace mcsig
