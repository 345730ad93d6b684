// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <vector>
#include "Patient.h"
#include "ChronicDiseaseClassifier.h"

namespace triagesim
{
  /**
   * @class TriagePopulation
   * @brief The base population with each patient's chronic disease tier fixed.
   *
   * Built once before resampling and shared read-only by every replicate and
   * worker thread. Cohorts refer to patients by index into this population,
   * so a resampled patient always carries the tier assigned here.
   */
  class TriagePopulation
  {
  public:
    /**
     * @throws InvalidInputException if patients is empty.
     */
    TriagePopulation(std::vector<Patient> patients,
		     const ChronicDiseaseClassifier& classifier);

    TriagePopulation(const TriagePopulation&) = delete;
    TriagePopulation& operator=(const TriagePopulation&) = delete;
    TriagePopulation(TriagePopulation&&) = default;

    std::size_t size() const
    {
      return mPatients.size();
    }

    const Patient& getPatient(std::size_t index) const
    {
      return mPatients.at(index);
    }

    ChronicDiseaseTier getChronicTier(std::size_t index) const
    {
      return mChronicTiers.at(index);
    }

    const ChronicDiseaseThresholds& getChronicThresholds() const
    {
      return mThresholds;
    }

    std::size_t countChronicTier(ChronicDiseaseTier tier) const;

  private:
    std::vector<Patient> mPatients;
    std::vector<ChronicDiseaseTier> mChronicTiers;
    ChronicDiseaseThresholds mThresholds;
  };
}
