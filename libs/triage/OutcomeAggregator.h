// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstdint>
#include <vector>
#include "AllocationDecision.h"

namespace triagesim
{
  class OutcomeAggregator
  {
  public:
    // Resource recipients who survived to discharge.
    static uint32_t countLivesSaved(const std::vector<AllocationDecision>& decisions)
    {
      uint32_t saved = 0;
      for (AllocationDecision d : decisions)
	if (d == AllocationDecision::GrantedSurvived)
	  ++saved;
      return saved;
    }

    static uint32_t countLivesSaved(const AllocationResult& allocation)
    {
      return countLivesSaved(allocation.getDecisions());
    }
  };
}
