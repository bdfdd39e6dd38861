#include "ExperimentRunner.h"

#include "DataArrangements.h"
#include "HypothesisTestException.h"
#include "MonteCarloHypothesisTest.h"
#include "NullDistributionCollector.h"
#include "NullModels.h"
#include "PValueComputationPolicy.h"
#include "ParallelExecutors.h"
#include "PowerAnalysis.h"
#include "RngUtils.h"
#include "TestStatistics.h"
#include "randutils.hpp"

#include <iomanip>
#include <memory>
#include <type_traits>

namespace mcsig {

namespace {

void requireShape(const ExperimentConfiguration& config, DataShape expected) {
    if (config.getDataShape() != expected) {
        throw InvalidDataError("ExperimentRunner: " + config.getName() + ": " + config.getStatistic() +
                               " / " + config.getNullModel() + " needs " + dataShapeToString(expected) +
                               " but the data holds " + dataShapeToString(config.getDataShape()));
    }
}

template <class Arrangement>
struct ArrangementBuilder;

template <>
struct ArrangementBuilder<TwoSampleData<double>> {
    static TwoSampleData<double> build(const ExperimentConfiguration& config) {
        requireShape(config, DataShape::TwoSample);
        const auto& s = config.getSeries();
        return TwoSampleData<double>{s[0], s[1]};
    }
};

template <>
struct ArrangementBuilder<PairedSeries<double>> {
    static PairedSeries<double> build(const ExperimentConfiguration& config) {
        requireShape(config, DataShape::Paired);
        const auto& s = config.getSeries();
        return PairedSeries<double>{s[0], s[1]};
    }
};

template <>
struct ArrangementBuilder<CategoryCounts<double>> {
    static CategoryCounts<double> build(const ExperimentConfiguration& config) {
        requireShape(config, DataShape::Counts);
        return CategoryCounts<double>{config.getSeries()[0]};
    }
};

template <>
struct ArrangementBuilder<TwoCategoricalSamples<double>> {
    static TwoCategoricalSamples<double> build(const ExperimentConfiguration& config) {
        requireShape(config, DataShape::TwoCategorical);
        const auto& s = config.getSeries();
        return TwoCategoricalSamples<double>{s[0], s[1], s[2]};
    }
};

template <class Statistic, class NullModel, class Policy, class Executor>
ExperimentReport runTyped(const ExperimentConfiguration& config) {
    using Test = MonteCarloHypothesisTest<double, Statistic, NullModel, Policy, Executor>;
    using Arrangement = typename NullModel::ArrangementType;

    const Arrangement data = ArrangementBuilder<Arrangement>::build(config);
    const auto& seed = config.getSeed();

    std::unique_ptr<Test> test = seed
        ? std::make_unique<Test>(data, Statistic(), NullModel(), *seed)
        : std::make_unique<Test>(data);

    NullDistributionCollector<double> collector;
    test->attach(&collector);
    const double pValue = test->estimatePValue(config.getIterations());
    test->detach(&collector);

    ExperimentReport report;
    report.name = config.getName();
    report.statistic = config.getStatistic();
    report.nullModel = config.getNullModel();
    report.pValuePolicy = Policy::name();
    report.executor = config.getExecutor();
    report.shape = config.getDataShape();
    report.actualStatistic = test->getActualStatistic();
    report.pValue = pValue;
    report.pValueResolution = test->getPValueResolution();
    report.maxSimulatedStatistic = test->getMaxSimulatedStatistic();
    report.iterations = test->getNumIterations();
    report.extremeCount = test->getExtremeCount();

    report.nullSummary.count = collector.getCount();
    report.nullSummary.min = collector.getMin();
    report.nullSummary.max = collector.getMax();
    report.nullSummary.mean = collector.getMean();
    report.nullSummary.median = collector.getMedian();
    report.nullSummary.stdDev = collector.getStdDev();

    if (const auto& settings = config.getPowerSettings()) {
        PowerAnalysis<double, Statistic, NullModel, Policy, Executor> analysis(settings->numExperiments,
                                                                               settings->iterationsPerExperiment,
                                                                               config.getAlpha());
        typename PowerAnalysis<double, Statistic, NullModel, Policy, Executor>::Result result;

        if (seed) {
            result = analysis.run(data, rng_utils::splitmix64(*seed));
        } else {
            randutils::mt19937_rng rng;
            result = analysis.run(data, rng);
        }

        PowerReport power;
        power.numExperiments = result.numExperiments;
        power.iterationsPerExperiment = result.iterationsPerExperiment;
        power.numMissed = result.numMissed;
        power.alpha = result.alpha;
        power.falseNegativeRate = result.falseNegativeRate;
        power.power = result.power;
        report.power = power;
    }

    return report;
}

template <class Statistic, class NullModel, class Policy>
ExperimentReport dispatchExecutor(const ExperimentConfiguration& config) {
    const std::string& executor = config.getExecutor();

    if (executor == "single")
        return runTyped<Statistic, NullModel, Policy, concurrency::SingleThreadExecutor>(config);
    if (executor == "threadpool")
        return runTyped<Statistic, NullModel, Policy, concurrency::ThreadPoolExecutor<>>(config);
    if (executor == "async")
        return runTyped<Statistic, NullModel, Policy, concurrency::StdAsyncExecutor>(config);
    if (executor == "boost")
        return runTyped<Statistic, NullModel, Policy, concurrency::BoostRunnerExecutor>(config);

    throw UnimplementedVariantError("ExperimentRunner: " + config.getName() + ": unknown executor '" +
                                    executor + "'");
}

template <class Statistic, class NullModel>
ExperimentReport dispatchPolicy(const ExperimentConfiguration& config) {
    const std::string& policy = config.getPValuePolicy();

    if (policy == EmpiricalPValueComputationPolicy::name())
        return dispatchExecutor<Statistic, NullModel, EmpiricalPValueComputationPolicy>(config);
    if (policy == StandardPValueComputationPolicy::name())
        return dispatchExecutor<Statistic, NullModel, StandardPValueComputationPolicy>(config);
    if (policy == WilsonPValueComputationPolicy::name())
        return dispatchExecutor<Statistic, NullModel, WilsonPValueComputationPolicy>(config);

    throw UnimplementedVariantError("ExperimentRunner: " + config.getName() + ": unknown p-value policy '" +
                                    policy + "'");
}

template <class Statistic, class NullModel>
ExperimentReport dispatchPair(const ExperimentConfiguration& config) {
    if constexpr (std::is_same_v<typename Statistic::ArrangementType, typename NullModel::ArrangementType>) {
        return dispatchPolicy<Statistic, NullModel>(config);
    } else {
        throw InvalidDataError("ExperimentRunner: " + config.getName() + ": statistic " + Statistic::name() +
                               " and null model " + NullModel::name() + " work on different data arrangements");
    }
}

template <class Statistic>
ExperimentReport dispatchNullModel(const ExperimentConfiguration& config) {
    const std::string& model = config.getNullModel();

    if (model == PermutationSplit<double>::name())
        return dispatchPair<Statistic, PermutationSplit<double>>(config);
    if (model == ResampleWithReplacement<double>::name())
        return dispatchPair<Statistic, ResampleWithReplacement<double>>(config);
    if (model == SinglesidePermutation<double>::name())
        return dispatchPair<Statistic, SinglesidePermutation<double>>(config);
    if (model == CategoricalRedraw<double>::name())
        return dispatchPair<Statistic, CategoricalRedraw<double>>(config);
    if (model == PooledShuffleSplit<double>::name())
        return dispatchPair<Statistic, PooledShuffleSplit<double>>(config);

    throw UnimplementedVariantError("ExperimentRunner: " + config.getName() + ": unknown null model '" +
                                    model + "'");
}

void printOptional(std::ostream& os, const char* label, const std::optional<double>& value) {
    os << label << " ";
    if (value) {
        os << *value;
    } else {
        os << "n/a";
    }
}

} // namespace

ExperimentReport ExperimentRunner::run(const ExperimentConfiguration& config) const {
    const std::string& statistic = config.getStatistic();

    if (statistic == AbsDiffMeans<double>::name())
        return dispatchNullModel<AbsDiffMeans<double>>(config);
    if (statistic == SignedDiffMeans<double>::name())
        return dispatchNullModel<SignedDiffMeans<double>>(config);
    if (statistic == DiffStdDev<double>::name())
        return dispatchNullModel<DiffStdDev<double>>(config);
    if (statistic == AbsCorrelation<double>::name())
        return dispatchNullModel<AbsCorrelation<double>>(config);
    if (statistic == CategoricalAbsDeviation<double>::name())
        return dispatchNullModel<CategoricalAbsDeviation<double>>(config);
    if (statistic == CategoricalChiSquared<double>::name())
        return dispatchNullModel<CategoricalChiSquared<double>>(config);
    if (statistic == PooledChiSquared<double>::name())
        return dispatchNullModel<PooledChiSquared<double>>(config);

    throw UnimplementedVariantError("ExperimentRunner: " + config.getName() + ": unknown statistic '" +
                                    statistic + "'");
}

void printReport(std::ostream& os, const ExperimentReport& report) {
    os << "Experiment: " << report.name << "\n";
    os << "  Statistic:               " << report.statistic << "\n";
    os << "  Null model:              " << report.nullModel << "\n";
    os << "  Data:                    " << dataShapeToString(report.shape) << "\n";
    os << "  P-value policy:          " << report.pValuePolicy << "\n";
    os << "  Executor:                " << report.executor << "\n";
    os << "  Iterations:              " << report.iterations << "\n";
    os << "  Actual statistic:        " << report.actualStatistic << "\n";

    if (report.pValue == 0.0) {
        os << "  p-value:                 < " << report.pValueResolution
           << " (no simulated statistic reached the actual value)\n";
    } else {
        os << "  p-value:                 " << report.pValue << " (" << report.extremeCount << " of "
           << report.iterations << " trials >= actual)\n";
    }

    os << "  Max simulated statistic: " << report.maxSimulatedStatistic << "\n";

    os << "  Null distribution:      ";
    printOptional(os, " mean", report.nullSummary.mean);
    printOptional(os, ", sd", report.nullSummary.stdDev);
    printOptional(os, ", median", report.nullSummary.median);
    printOptional(os, ", min", report.nullSummary.min);
    printOptional(os, ", max", report.nullSummary.max);
    os << "\n";

    if (report.power) {
        const PowerReport& power = *report.power;
        os << "  Power analysis:          " << power.numExperiments << " experiments x "
           << power.iterationsPerExperiment << " trials, alpha " << power.alpha << "\n";
        os << "    False negative rate:   " << std::fixed << std::setprecision(4) << power.falseNegativeRate
           << " (" << power.numMissed << " missed)\n";
        os << "    Power:                 " << power.power << "\n";
        os << std::defaultfloat << std::setprecision(6);
    }
}

} // namespace mcsig
