// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "CohortSampler.h"
#include "TriageException.h"

namespace triagesim
{
  CohortSampler::CohortSampler(const TriagePopulation& population, uint64_t seed)
    : mPopulation(population),
      mStreams(seed)
  {
    if (mPopulation.size() == 0)
      throw InvalidInputException("CohortSampler: cannot resample an empty population");
  }

  Cohort CohortSampler::drawCohort(std::size_t replicate) const
  {
    const std::size_t m = mPopulation.size();
    TriageRng rng = mStreams.cohortEngine(replicate);

    std::vector<std::size_t> members;
    members.reserve(m);
    for (std::size_t i = 0; i < m; ++i)
      members.push_back(rng_utils::get_random_index(rng, m));

    return Cohort(mPopulation, std::move(members));
  }

  std::vector<Cohort> CohortSampler::sample(std::size_t numReplicates) const
  {
    std::vector<Cohort> cohorts;
    cohorts.reserve(numReplicates);
    for (std::size_t r = 0; r < numReplicates; ++r)
      cohorts.push_back(drawCohort(r));
    return cohorts;
  }
}
