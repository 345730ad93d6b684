// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __TRIAGESIM_POPULATION_CSV_READER_H
#define __TRIAGESIM_POPULATION_CSV_READER_H 1

#include <string>
#include <vector>
#include <utility>
#include "Patient.h"

namespace triagesim
{
  /**
   * @class PopulationCsvReader
   * @brief Reads the base population from a CSV file with a header row.
   *
   * Required columns (any order, extra columns ignored):
   *   age, race, sofa, survived, comorbidity_score
   *
   * survived accepts 0/1, true/false or yes/no in any case. An empty
   * comorbidity_score is a missing burden score.
   */
  class PopulationCsvReader
  {
  public:
    /**
     * @throws PopulationFileException if the file cannot be opened.
     */
    explicit PopulationCsvReader(const std::string& fileName);

    /**
     * @throws PopulationFileException on a missing column, an unparseable
     *         field or a file without data rows.
     * @throws InvalidInputException when a row holds out-of-range values
     *         (negative age, non-finite scores).
     */
    void readFile();

    const std::string& getFileName() const
    {
      return mFileName;
    }

    const std::vector<Patient>& getPatients() const
    {
      return mPatients;
    }

    std::vector<Patient> releasePatients()
    {
      return std::move(mPatients);
    }

    // Exposed for the reader's own field parsing and for the unit tests.
    static bool parseSurvivalFlag(const std::string& field);
    static std::optional<double> parseBurdenScore(const std::string& field);

  private:
    std::string mFileName;
    std::vector<Patient> mPatients;
  };
}

#endif
