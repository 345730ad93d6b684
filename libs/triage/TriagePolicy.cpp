// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "TriagePolicy.h"
#include "TriageException.h"
#include "RngUtils.h"

namespace triagesim
{
  AllocationResult TriagePolicy::allocate(const Cohort& cohort, std::size_t capacity, TriageRng& rng) const
  {
    if (capacity > cohort.size())
      throw InvalidInputException(getName() + ": capacity " + std::to_string(capacity) +
				  " exceeds cohort size " + std::to_string(cohort.size()));

    std::vector<std::size_t> order = priorityOrder(cohort, rng);

    std::vector<AllocationDecision> decisions(cohort.size(), AllocationDecision::NoCriticalCare);
    for (std::size_t rank = 0; rank < capacity; ++rank)
      {
	const std::size_t position = order[rank];
	decisions[position] = cohort.getPatient(position).survivedToDischarge()
	  ? AllocationDecision::GrantedSurvived
	  : AllocationDecision::DeathInCare;
      }

    return AllocationResult(std::move(decisions), std::move(order));
  }

  std::vector<double> TriagePolicy::drawLottery(std::size_t count, TriageRng& rng)
  {
    std::vector<double> draws;
    draws.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
      draws.push_back(rng_utils::get_random_uniform_01(rng));
    return draws;
  }
}
