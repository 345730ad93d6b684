// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <string>
#include <optional>

namespace triagesim
{
  // Recorded for reporting only; no allocation policy looks at it.
  enum class RaceCategory
  {
    White,
    Black,
    Asian,
    Hispanic,
    Other,
    Unknown
  };

  std::string raceCategoryToString(RaceCategory race);

  // Case-insensitive; anything unrecognised maps to RaceCategory::Unknown.
  RaceCategory raceCategoryFromString(const std::string& name);

  /**
   * @class Patient
   * @brief One record of the base population.
   *
   * Immutable once constructed. The constructor rejects negative or
   * non-finite ages, non-finite severity scores and a present but non-finite
   * chronic burden score.
   */
  class Patient
  {
  public:
    Patient(double age,
	    RaceCategory race,
	    double severityScore,
	    bool survived,
	    std::optional<double> chronicBurdenScore);

    double getAge() const
    {
      return mAge;
    }

    RaceCategory getRace() const
    {
      return mRace;
    }

    // SOFA score; higher means more severe organ failure.
    double getSeverityScore() const
    {
      return mSeverityScore;
    }

    bool survivedToDischarge() const
    {
      return mSurvived;
    }

    const std::optional<double>& getChronicBurdenScore() const
    {
      return mChronicBurdenScore;
    }

  private:
    double mAge;
    RaceCategory mRace;
    double mSeverityScore;
    bool mSurvived;
    std::optional<double> mChronicBurdenScore;
  };
}
