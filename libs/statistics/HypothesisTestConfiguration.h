#pragma once

#include <cstdint>

namespace HypothesisTestConfiguration
{
  // Default number of Monte Carlo trials per p-value estimate.
  // Resolution of the empirical p-value is 1 / iterations.
  constexpr std::uint32_t kDefaultIterations = 1000;

  // Significance level used by the driver and the power analysis.
  constexpr double kDefaultAlpha = 0.05;

  // Power analysis: number of resampled experiments and the (deliberately
  // small) trial count used for the p-value of each experiment.
  constexpr std::uint32_t kDefaultPowerExperiments = 1000;
  constexpr std::uint32_t kDefaultPowerIterations  = 101;

  // 0 lets parallel_for_chunked pick about one chunk per hardware thread.
  constexpr std::uint32_t kDefaultChunkSizeHint = 0;
}
