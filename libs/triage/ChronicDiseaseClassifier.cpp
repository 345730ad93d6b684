// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <cmath>
#include <limits>
#include "ChronicDiseaseClassifier.h"
#include "TriageException.h"
#include "StatUtils.h"

namespace triagesim
{
  std::string chronicDiseaseTierToString(ChronicDiseaseTier tier)
  {
    switch (tier)
      {
      case ChronicDiseaseTier::None:
	return "none";
      case ChronicDiseaseTier::Major:
	return "major";
      case ChronicDiseaseTier::Severe:
	return "severe";
      }
    return "none";
  }

  ChronicDiseaseClassifier::ChronicDiseaseClassifier(const ChronicDiseaseThresholds& thresholds)
    : mThresholds(thresholds)
  {}

  ChronicDiseaseThresholds
  ChronicDiseaseClassifier::computeThresholds(const std::vector<Patient>& basePopulation,
					      double majorPercentile,
					      double severePercentile)
  {
    if (!(majorPercentile > 0.0 && majorPercentile < 1.0) ||
	!(severePercentile > 0.0 && severePercentile < 1.0))
      throw InvalidInputException("ChronicDiseaseClassifier: percentiles must lie strictly between 0 and 1");

    if (majorPercentile >= severePercentile)
      throw InvalidInputException("ChronicDiseaseClassifier: major percentile must be below severe percentile");

    std::vector<double> scores;
    scores.reserve(basePopulation.size());
    for (const auto& patient : basePopulation)
      {
	if (patient.getChronicBurdenScore())
	  scores.push_back(*patient.getChronicBurdenScore());
      }

    ChronicDiseaseThresholds thresholds{majorPercentile, severePercentile,
					std::numeric_limits<double>::quiet_NaN(),
					std::numeric_limits<double>::quiet_NaN()};
    if (scores.empty())
      return thresholds;

    thresholds.majorThreshold  = StatUtils::quantileType7(scores, majorPercentile);
    thresholds.severeThreshold = StatUtils::quantileType7(scores, severePercentile);
    return thresholds;
  }

  ChronicDiseaseTier ChronicDiseaseClassifier::classify(const std::optional<double>& burdenScore) const
  {
    // Comparisons against NaN thresholds are false, so an all-missing base
    // population classifies everyone as None.
    if (!burdenScore)
      return ChronicDiseaseTier::None;

    if (*burdenScore > mThresholds.severeThreshold)
      return ChronicDiseaseTier::Severe;
    if (*burdenScore > mThresholds.majorThreshold)
      return ChronicDiseaseTier::Major;

    return ChronicDiseaseTier::None;
  }
}
