// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "PolicyFactory.h"
#include "TriagePolicies.h"
#include "TriageException.h"

namespace triagesim
{
  TriagePolicyPtr PolicyFactory::createPolicy(PolicyId id)
  {
    switch (id)
      {
      case PolicyId::Lottery:
	return std::make_shared<LotteryPolicy>();
      case PolicyId::SickestFirst:
	return std::make_shared<SickestFirstPolicy>();
      case PolicyId::YoungestFirst:
	return std::make_shared<YoungestFirstPolicy>();
      case PolicyId::NewYork:
	return std::make_shared<NewYorkPolicy>();
      case PolicyId::Maryland:
	return std::make_shared<MarylandPolicy>();
      case PolicyId::Pennsylvania:
	return std::make_shared<PennsylvaniaPolicy>();
      }

    throw InvalidInputException("PolicyFactory::createPolicy: unknown policy id " +
				std::to_string(static_cast<uint32_t>(id)));
  }

  std::vector<TriagePolicyPtr> PolicyFactory::createAll()
  {
    return {
      createPolicy(PolicyId::Lottery),
      createPolicy(PolicyId::SickestFirst),
      createPolicy(PolicyId::YoungestFirst),
      createPolicy(PolicyId::NewYork),
      createPolicy(PolicyId::Maryland),
      createPolicy(PolicyId::Pennsylvania)
    };
  }

  std::vector<std::string> PolicyFactory::getPolicyNames(const std::vector<TriagePolicyPtr>& policies)
  {
    std::vector<std::string> names;
    names.reserve(policies.size());
    for (const auto& policy : policies)
      names.push_back(policy->getName());
    return names;
  }
}
