#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "StatUtils.h"

using namespace mcsig;
using Catch::Approx;

TEST_CASE("StatUtils::computeMean", "[StatUtils]")
{
  REQUIRE(StatUtils<double>::computeMean({1.0, 2.0, 3.0, 4.0}) == Approx(2.5));
  REQUIRE(StatUtils<double>::computeMean({}) == 0.0);
}

TEST_CASE("StatUtils::computeVariance and computeStdDev divide by n", "[StatUtils]")
{
  const std::vector<double> v{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
  const double mean = StatUtils<double>::computeMean(v);

  REQUIRE(mean == Approx(5.0));
  REQUIRE(StatUtils<double>::computeVariance(v, mean) == Approx(4.0));
  REQUIRE(StatUtils<double>::computeStdDev(v) == Approx(2.0));

  SECTION("A single value or an empty vector has zero spread")
  {
    REQUIRE(StatUtils<double>::computeVariance({3.0}, 3.0) == 0.0);
    REQUIRE(StatUtils<double>::computeStdDev(std::vector<double>{}) == 0.0);
  }
}

TEST_CASE("StatUtils::computeCorrelation", "[StatUtils]")
{
  REQUIRE(StatUtils<double>::computeCorrelation({1.0, 2.0, 3.0}, {2.0, 4.0, 6.0}) == Approx(1.0));
  REQUIRE(StatUtils<double>::computeCorrelation({1.0, 2.0, 3.0}, {3.0, 2.0, 1.0}) == Approx(-1.0));
  REQUIRE(StatUtils<double>::computeCorrelation({1.0, 1.0, 1.0}, {1.0, 2.0, 3.0}) == 0.0);
  REQUIRE_THROWS_AS(StatUtils<double>::computeCorrelation({1.0, 2.0}, {1.0}), std::invalid_argument);
}

TEST_CASE("StatUtils::computeMax", "[StatUtils]")
{
  REQUIRE(StatUtils<double>::computeMax({-3.0, 8.5, 2.0}) == 8.5);
  REQUIRE_THROWS_AS(StatUtils<double>::computeMax({}), std::invalid_argument);
}

TEST_CASE("StatUtils::tabulate counts listed categories only", "[StatUtils]")
{
  const std::vector<double> obs{1.0, 2.0, 2.0, 5.0, 3.0, 2.0};
  const std::vector<double> cats{1.0, 2.0, 3.0, 4.0};

  const auto counts = StatUtils<double>::tabulate(obs, cats);
  REQUIRE(counts == std::vector<double>{1.0, 3.0, 1.0, 0.0});
}
