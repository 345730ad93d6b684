// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <algorithm>
#include "TriagePopulation.h"
#include "TriageException.h"

namespace triagesim
{
  TriagePopulation::TriagePopulation(std::vector<Patient> patients,
				     const ChronicDiseaseClassifier& classifier)
    : mPatients(std::move(patients)),
      mChronicTiers(),
      mThresholds(classifier.getThresholds())
  {
    if (mPatients.empty())
      throw InvalidInputException("TriagePopulation: base population is empty");

    mChronicTiers.reserve(mPatients.size());
    for (const auto& patient : mPatients)
      mChronicTiers.push_back(classifier.classify(patient));
  }

  std::size_t TriagePopulation::countChronicTier(ChronicDiseaseTier tier) const
  {
    return static_cast<std::size_t>(std::count(mChronicTiers.begin(), mChronicTiers.end(), tier));
  }
}
