// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <cmath>
#include <boost/algorithm/string.hpp>
#include "Patient.h"
#include "TriageException.h"

namespace triagesim
{
  std::string raceCategoryToString(RaceCategory race)
  {
    switch (race)
      {
      case RaceCategory::White:
	return "white";
      case RaceCategory::Black:
	return "black";
      case RaceCategory::Asian:
	return "asian";
      case RaceCategory::Hispanic:
	return "hispanic";
      case RaceCategory::Other:
	return "other";
      case RaceCategory::Unknown:
	return "unknown";
      }
    return "unknown";
  }

  RaceCategory raceCategoryFromString(const std::string& name)
  {
    const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));

    if (key == "white")
      return RaceCategory::White;
    else if (key == "black")
      return RaceCategory::Black;
    else if (key == "asian")
      return RaceCategory::Asian;
    else if (key == "hispanic")
      return RaceCategory::Hispanic;
    else if (key == "other")
      return RaceCategory::Other;
    else
      return RaceCategory::Unknown;
  }

  Patient::Patient(double age,
		   RaceCategory race,
		   double severityScore,
		   bool survived,
		   std::optional<double> chronicBurdenScore)
    : mAge(age),
      mRace(race),
      mSeverityScore(severityScore),
      mSurvived(survived),
      mChronicBurdenScore(chronicBurdenScore)
  {
    if (!std::isfinite(mAge) || mAge < 0.0)
      throw InvalidInputException("Patient: age must be a finite non-negative number");

    if (!std::isfinite(mSeverityScore))
      throw InvalidInputException("Patient: severity score must be finite");

    if (mChronicBurdenScore && !std::isfinite(*mChronicBurdenScore))
      throw InvalidInputException("Patient: chronic burden score must be finite when present");
  }
}
