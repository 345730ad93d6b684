// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <algorithm>

namespace triagesim
{
  enum class AllocationDecision
  {
    DeathInCare,      // received the resource, did not survive
    GrantedSurvived,  // received the resource, survived to discharge
    NoCriticalCare    // did not receive the resource
  };

  inline std::string allocationDecisionToString(AllocationDecision decision)
  {
    switch (decision)
      {
      case AllocationDecision::DeathInCare:
	return "death-in-care";
      case AllocationDecision::GrantedSurvived:
	return "granted-survived";
      case AllocationDecision::NoCriticalCare:
	return "no-critical-care";
      }
    return "no-critical-care";
  }

  /**
   * @class AllocationResult
   * @brief Decisions for one cohort under one policy.
   *
   * getDecisions() is indexed by cohort position. getPriorityOrder() lists
   * cohort positions from highest to lowest priority; the first `capacity`
   * entries are the patients who received the resource.
   */
  class AllocationResult
  {
  public:
    AllocationResult(std::vector<AllocationDecision> decisions,
		     std::vector<std::size_t> priorityOrder)
      : mDecisions(std::move(decisions)),
	mPriorityOrder(std::move(priorityOrder))
    {}

    const std::vector<AllocationDecision>& getDecisions() const
    {
      return mDecisions;
    }

    AllocationDecision getDecision(std::size_t position) const
    {
      return mDecisions.at(position);
    }

    const std::vector<std::size_t>& getPriorityOrder() const
    {
      return mPriorityOrder;
    }

    std::size_t count(AllocationDecision decision) const
    {
      return static_cast<std::size_t>(std::count(mDecisions.begin(), mDecisions.end(), decision));
    }

    std::size_t countAllocated() const
    {
      return count(AllocationDecision::GrantedSurvived) + count(AllocationDecision::DeathInCare);
    }

  private:
    std::vector<AllocationDecision> mDecisions;
    std::vector<std::size_t> mPriorityOrder;
  };
}
