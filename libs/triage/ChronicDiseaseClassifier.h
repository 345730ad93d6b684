// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <string>
#include <vector>
#include <optional>
#include "Patient.h"

namespace triagesim
{
  enum class ChronicDiseaseTier
  {
    None,
    Major,
    Severe
  };

  std::string chronicDiseaseTierToString(ChronicDiseaseTier tier);

  /**
   * @brief Burden-score cut points taken from the base population.
   *
   * Both are NaN when no patient in the base population has a burden score,
   * in which case every patient classifies as ChronicDiseaseTier::None.
   */
  struct ChronicDiseaseThresholds
  {
    double majorPercentile;
    double severePercentile;
    double majorThreshold;
    double severeThreshold;
  };

  /**
   * @class ChronicDiseaseClassifier
   * @brief Maps a chronic burden score to none / major / severe.
   *
   * The thresholds are computed exactly once, from the original (not
   * resampled) population, as type-7 quantiles of the non-missing burden
   * scores. Resampled copies of a patient keep the tier assigned here.
   *
   * A score strictly above the severe threshold is Severe, strictly above the
   * major threshold is Major, anything else (including a missing score) is None.
   */
  class ChronicDiseaseClassifier
  {
  public:
    explicit ChronicDiseaseClassifier(const ChronicDiseaseThresholds& thresholds);

    /**
     * @throws InvalidInputException if the percentiles are not in (0,1) or
     *         majorPercentile >= severePercentile.
     */
    static ChronicDiseaseThresholds computeThresholds(const std::vector<Patient>& basePopulation,
						      double majorPercentile,
						      double severePercentile);

    ChronicDiseaseTier classify(const std::optional<double>& burdenScore) const;

    ChronicDiseaseTier classify(const Patient& patient) const
    {
      return classify(patient.getChronicBurdenScore());
    }

    const ChronicDiseaseThresholds& getThresholds() const
    {
      return mThresholds;
    }

  private:
    ChronicDiseaseThresholds mThresholds;
  };
}
