// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MCSIG_HYPOTHESIS_TEST_EXCEPTION_H
#define __MCSIG_HYPOTHESIS_TEST_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mcsig
{
  class HypothesisTestException : public std::runtime_error
  {
  public:
    explicit HypothesisTestException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~HypothesisTestException() = default;
  };

  // Observed data unusable for the chosen statistic / null model pair:
  // empty arrangement or group, mismatched shape, or a zero expected
  // frequency in a chi-squared denominator.
  class InvalidDataError : public HypothesisTestException
  {
  public:
    explicit InvalidDataError(const std::string& msg)
      : HypothesisTestException(msg)
    {}
  };

  // Raised before any simulation starts, e.g. a zero iteration count.
  class InvalidArgumentError : public HypothesisTestException
  {
  public:
    explicit InvalidArgumentError(const std::string& msg)
      : HypothesisTestException(msg)
    {}
  };

  // A diagnostic of the simulated distribution was requested before
  // estimatePValue() ran.
  class NotYetEstimatedError : public HypothesisTestException
  {
  public:
    explicit NotYetEstimatedError(const std::string& msg)
      : HypothesisTestException(msg)
    {}
  };

  // A statistic function or null model slot is unbound.
  class UnimplementedVariantError : public HypothesisTestException
  {
  public:
    explicit UnimplementedVariantError(const std::string& msg)
      : HypothesisTestException(msg)
    {}
  };
}

#endif
