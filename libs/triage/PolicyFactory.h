// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "TriagePolicy.h"

namespace triagesim
{
  using TriagePolicyPtr = std::shared_ptr<const TriagePolicy>;

  class PolicyFactory
  {
  public:
    static TriagePolicyPtr createPolicy(PolicyId id);

    // All six policies in PolicyId order.
    static std::vector<TriagePolicyPtr> createAll();

    static std::vector<std::string> getPolicyNames(const std::vector<TriagePolicyPtr>& policies);
  };
}
