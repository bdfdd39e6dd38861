// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MCSIG_MODEL_STATES_H
#define __MCSIG_MODEL_STATES_H 1

#include <cstddef>
#include <vector>

namespace mcsig
{
  // Model state types. Each is derived once from the observed arrangement
  // by a null model's deriveState() and is read-only afterwards.

  // Shared by PermutationSplit and ResampleWithReplacement.
  template <class Decimal>
  struct PooledSampleState
  {
    std::vector<Decimal> pool;   // group1 followed by group2
    std::size_t n1;
    std::size_t n2;
  };

  // SinglesidePermutation keeps both original series.
  template <class Decimal>
  struct PairedSeriesState
  {
    std::vector<Decimal> x;
    std::vector<Decimal> y;
  };

  // CategoricalRedraw: n outcomes over k equally likely categories.
  struct CategoricalState
  {
    std::size_t numObservations;
    std::size_t numCategories;
  };

  /**
   * @brief State of PooledShuffleSplit.
   *
   * expectedProbabilities[i] is the relative frequency of categories[i] in
   * the original pool. It belongs to the null hypothesis: computed once and
   * used unchanged as the expected baseline of every trial.
   */
  template <class Decimal>
  struct PooledCategoricalState
  {
    std::vector<Decimal> pool;
    std::size_t n1;
    std::size_t n2;
    std::vector<Decimal> categories;
    std::vector<Decimal> expectedProbabilities;
  };
}

#endif
