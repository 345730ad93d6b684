// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "Cohort.h"
#include "RandomStreams.h"

namespace triagesim
{
  /**
   * @class CohortSampler
   * @brief Draws i.i.d. bootstrap cohorts of the base population size.
   *
   * Each member is drawn uniformly with replacement. Cohort r depends only on
   * the seed and r, so cohorts may be drawn lazily, in any order and from any
   * thread.
   */
  class CohortSampler
  {
  public:
    /**
     * @throws InvalidInputException if the population is empty.
     */
    CohortSampler(const TriagePopulation& population, uint64_t seed);

    Cohort drawCohort(std::size_t replicate) const;

    // Cohorts 0..numReplicates-1, identical to calling drawCohort for each.
    std::vector<Cohort> sample(std::size_t numReplicates) const;

  private:
    const TriagePopulation& mPopulation;
    RandomStreams mStreams;
  };
}
