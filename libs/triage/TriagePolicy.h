// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <numeric>
#include <algorithm>
#include "AllocationDecision.h"
#include "Cohort.h"
#include "RandomStreams.h"

namespace triagesim
{
  // Stable identifiers; also the column order of the outcome matrix.
  enum class PolicyId : uint32_t
  {
    Lottery = 0,
    SickestFirst,
    YoungestFirst,
    NewYork,
    Maryland,
    Pennsylvania
  };

  /**
   * @class TriagePolicy
   * @brief Ranks a cohort and grants the scarce resource to the top `capacity`.
   *
   * Subclasses only decide the priority order. allocate() then marks the
   * first `capacity` patients in that order GrantedSurvived or DeathInCare
   * according to their survival flag and every other patient NoCriticalCare.
   *
   * Randomised policies draw exactly one uniform value per cohort member from
   * the engine passed in; deterministic ones draw nothing.
   */
  class TriagePolicy
  {
  public:
    virtual ~TriagePolicy() = default;

    virtual PolicyId getId() const = 0;
    virtual std::string getName() const = 0;
    virtual bool consumesRandomness() const = 0;

    /**
     * @brief Cohort positions ordered from highest to lowest priority.
     *
     * Always a permutation of 0..cohort.size()-1. Ties left after every key
     * field are broken by cohort position.
     */
    virtual std::vector<std::size_t> priorityOrder(const Cohort& cohort, TriageRng& rng) const = 0;

    /**
     * @throws InvalidInputException if capacity exceeds the cohort size.
     */
    AllocationResult allocate(const Cohort& cohort, std::size_t capacity, TriageRng& rng) const;

  protected:
    // Ascending stable sort of cohort positions by key.
    template <class Key>
    static std::vector<std::size_t> stableOrderByKey(const std::vector<Key>& keys)
    {
      std::vector<std::size_t> order(keys.size());
      std::iota(order.begin(), order.end(), std::size_t(0));
      std::stable_sort(order.begin(), order.end(),
		       [&keys](std::size_t lhs, std::size_t rhs) {
			 return keys[lhs] < keys[rhs];
		       });
      return order;
    }

    // One fresh draw in [0,1) per cohort member, in cohort order.
    static std::vector<double> drawLottery(std::size_t count, TriageRng& rng);
  };
}
