#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "ExperimentConfiguration.h"
#include "ExperimentRunner.h"
#include "HypothesisTestException.h"
#include <sstream>
#include <string>
#include <vector>

using namespace mcsig;
using Catch::Approx;

namespace {

ExperimentConfiguration diceExperiment(const std::string& statistic) {
    ExperimentConfiguration config("dice", statistic, "CategoricalRedraw", DataShape::Counts,
                                   {{8.0, 9.0, 19.0, 5.0, 8.0, 11.0}});
    config.setIterations(4000);
    config.setSeed(2718);
    return config;
}

ExperimentConfiguration separatedGroups() {
    ExperimentConfiguration config("separated", "AbsDiffMeans", "PermutationSplit", DataShape::TwoSample,
                                   {{1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0, 10.0},
                                    {101.0, 102.0, 103.0, 104.0, 105.0, 106.0, 107.0, 108.0, 109.0, 110.0}});
    config.setIterations(100);
    config.setSeed(5);
    return config;
}

} // namespace

TEST_CASE("Runner resolves names and runs the harness", "[ExperimentRunner]") {
    ExperimentRunner runner;

    SECTION("Dice chi-squared") {
        const auto report = runner.run(diceExperiment("CategoricalChiSquared"));

        REQUIRE(report.actualStatistic == Approx(11.6));
        REQUIRE(report.pValue == Approx(0.04).margin(0.03));
        REQUIRE(report.iterations == 4000);
        REQUIRE(report.pValuePolicy == "empirical");
        REQUIRE(report.nullSummary.count == 4000);
        REQUIRE(*report.nullSummary.max == Approx(report.maxSimulatedStatistic));
        REQUIRE_FALSE(report.power.has_value());
    }

    SECTION("Seeded reports do not depend on the executor") {
        auto serial = diceExperiment("CategoricalAbsDeviation");
        auto pooled = diceExperiment("CategoricalAbsDeviation");
        pooled.setExecutor("threadpool");

        const auto a = runner.run(serial);
        const auto b = runner.run(pooled);
        REQUIRE(a.pValue == b.pValue);
        REQUIRE(a.maxSimulatedStatistic == b.maxSimulatedStatistic);
        REQUIRE(b.executor == "threadpool");
    }

    SECTION("Alternative p-value policy") {
        auto config = separatedGroups();
        config.setPValuePolicy("standard");

        const auto report = runner.run(config);
        REQUIRE(report.pValue == Approx(1.0 / 101.0));
        REQUIRE(report.pValuePolicy == "standard");
    }

    SECTION("Power analysis") {
        auto config = separatedGroups();
        config.setPowerSettings(PowerSettings{20, 101});

        const auto report = runner.run(config);
        REQUIRE(report.power.has_value());
        REQUIRE(report.power->numExperiments == 20);
        REQUIRE(report.power->falseNegativeRate == 0.0);
        REQUIRE(report.power->power == 1.0);
    }
}

TEST_CASE("Runner rejects unknown names and mismatched shapes", "[ExperimentRunner][errors]") {
    ExperimentRunner runner;

    REQUIRE_THROWS_AS(runner.run(diceExperiment("MedianDifference")), UnimplementedVariantError);

    ExperimentConfiguration unknownModel("dice", "CategoricalChiSquared", "Bootstrap", DataShape::Counts,
                                         {{1.0, 2.0}});
    REQUIRE_THROWS_AS(runner.run(unknownModel), UnimplementedVariantError);

    auto unknownPolicy = diceExperiment("CategoricalChiSquared");
    unknownPolicy.setPValuePolicy("bonferroni");
    REQUIRE_THROWS_AS(runner.run(unknownPolicy), UnimplementedVariantError);

    auto unknownExecutor = diceExperiment("CategoricalChiSquared");
    unknownExecutor.setExecutor("gpu");
    REQUIRE_THROWS_AS(runner.run(unknownExecutor), UnimplementedVariantError);

    // Statistic and null model work on different arrangements
    ExperimentConfiguration mismatchedPair("pair", "AbsDiffMeans", "CategoricalRedraw", DataShape::Counts,
                                           {{1.0, 2.0}});
    REQUIRE_THROWS_AS(runner.run(mismatchedPair), InvalidDataError);

    // Data shape does not fit the pair
    ExperimentConfiguration mismatchedData("shape", "AbsDiffMeans", "PermutationSplit", DataShape::Counts,
                                           {{1.0, 2.0}});
    REQUIRE_THROWS_AS(runner.run(mismatchedData), InvalidDataError);

    auto zeroIterations = diceExperiment("CategoricalChiSquared");
    zeroIterations.setIterations(0);
    REQUIRE_THROWS_AS(runner.run(zeroIterations), InvalidArgumentError);
}

TEST_CASE("Report printing", "[ExperimentRunner][report]") {
    ExperimentRunner runner;

    SECTION("Zero p-value is reported against the resolution") {
        const auto report = runner.run(separatedGroups());
        REQUIRE(report.pValue == 0.0);

        std::ostringstream os;
        printReport(os, report);
        const std::string text = os.str();

        REQUIRE(text.find("Experiment: separated") != std::string::npos);
        REQUIRE(text.find("p-value:                 < 0.01") != std::string::npos);
        REQUIRE(text.find("Max simulated statistic") != std::string::npos);
    }

    SECTION("Non-zero p-value shows the extreme count") {
        const auto report = runner.run(diceExperiment("CategoricalAbsDeviation"));

        std::ostringstream os;
        printReport(os, report);
        const std::string text = os.str();

        REQUIRE(text.find("trials >= actual") != std::string::npos);
        REQUIRE(text.find("Null distribution") != std::string::npos);
        REQUIRE(text.find("Power analysis") == std::string::npos);
    }
}
