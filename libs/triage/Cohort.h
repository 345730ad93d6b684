// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <vector>
#include <numeric>
#include "TriagePopulation.h"
#include "TriageException.h"

namespace triagesim
{
  /**
   * @class Cohort
   * @brief One ordered bootstrap replicate of the base population.
   *
   * Stores indices into the population; a patient may appear more than once.
   * Position in the cohort is the arrival order used to break remaining ties.
   * The population must outlive the cohort.
   */
  class Cohort
  {
  public:
    /**
     * @throws InvalidInputException if any member index is outside the population.
     */
    Cohort(const TriagePopulation& population, std::vector<std::size_t> members)
      : mPopulation(population),
	mMembers(std::move(members))
    {
      for (std::size_t idx : mMembers)
	if (idx >= mPopulation.size())
	  throw InvalidInputException("Cohort: member index outside the base population");
    }

    // The unpermuted population in its original order.
    static Cohort identity(const TriagePopulation& population)
    {
      std::vector<std::size_t> members(population.size());
      std::iota(members.begin(), members.end(), std::size_t(0));
      return Cohort(population, std::move(members));
    }

    std::size_t size() const
    {
      return mMembers.size();
    }

    bool empty() const
    {
      return mMembers.empty();
    }

    const Patient& getPatient(std::size_t position) const
    {
      return mPopulation.getPatient(mMembers.at(position));
    }

    ChronicDiseaseTier getChronicTier(std::size_t position) const
    {
      return mPopulation.getChronicTier(mMembers.at(position));
    }

    const std::vector<std::size_t>& getMembers() const
    {
      return mMembers;
    }

  private:
    const TriagePopulation& mPopulation;
    std::vector<std::size_t> mMembers;
  };
}
