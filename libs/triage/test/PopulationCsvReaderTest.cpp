// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <catch2/catch.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include "PopulationCsvReader.h"
#include "TriageException.h"

using namespace triagesim;

namespace
{
  // Writes a scratch CSV in the working directory and removes it on scope exit.
  class ScratchCsvFile
  {
  public:
    ScratchCsvFile(const std::string& name, const std::string& contents)
      : mName(name)
    {
      std::ofstream out(mName, std::ios::trunc);
      out << contents;
    }

    ~ScratchCsvFile()
    {
      std::remove(mName.c_str());
    }

    const std::string& getName() const
    {
      return mName;
    }

  private:
    std::string mName;
  };
}

TEST_CASE("PopulationCsvReader reads a well formed file", "[PopulationCsvReader]")
{
  const ScratchCsvFile file("population_reader_ok.csv",
			    "age,race,sofa,survived,comorbidity_score,site\n"
			    "34,White,5,1,2.5,A\n"
			    "71, black ,12,0,,B\n"
			    "\"55\",Hispanic,8,yes,4,C\n"
			    "80,Pacific Islander,15.5,FALSE,0,D\n");

  PopulationCsvReader reader(file.getName());
  reader.readFile();

  const auto& patients = reader.getPatients();
  REQUIRE(patients.size() == 4);

  REQUIRE(patients[0].getAge() == 34.0);
  REQUIRE(patients[0].getRace() == RaceCategory::White);
  REQUIRE(patients[0].getSeverityScore() == 5.0);
  REQUIRE(patients[0].survivedToDischarge());
  REQUIRE(*patients[0].getChronicBurdenScore() == 2.5);

  REQUIRE(patients[1].getRace() == RaceCategory::Black);
  REQUIRE_FALSE(patients[1].survivedToDischarge());
  REQUIRE_FALSE(patients[1].getChronicBurdenScore().has_value());

  REQUIRE(patients[2].getAge() == 55.0);
  REQUIRE(patients[2].survivedToDischarge());

  REQUIRE(patients[3].getRace() == RaceCategory::Unknown);
  REQUIRE(patients[3].getSeverityScore() == 15.5);
  REQUIRE(*patients[3].getChronicBurdenScore() == 0.0);

  const std::vector<Patient> released = reader.releasePatients();
  REQUIRE(released.size() == 4);
}

TEST_CASE("PopulationCsvReader accepts columns in any order", "[PopulationCsvReader]")
{
  const ScratchCsvFile file("population_reader_reordered.csv",
			    "comorbidity_score,survived,sofa,race,age\n"
			    "3,true,9,asian,42\n");

  PopulationCsvReader reader(file.getName());
  reader.readFile();

  REQUIRE(reader.getPatients().size() == 1);
  REQUIRE(reader.getPatients()[0].getAge() == 42.0);
  REQUIRE(reader.getPatients()[0].getRace() == RaceCategory::Asian);
  REQUIRE(reader.getPatients()[0].getSeverityScore() == 9.0);
}

TEST_CASE("PopulationCsvReader field parsers", "[PopulationCsvReader]")
{
  REQUIRE(PopulationCsvReader::parseSurvivalFlag("1"));
  REQUIRE(PopulationCsvReader::parseSurvivalFlag("True"));
  REQUIRE(PopulationCsvReader::parseSurvivalFlag(" YES "));
  REQUIRE_FALSE(PopulationCsvReader::parseSurvivalFlag("0"));
  REQUIRE_FALSE(PopulationCsvReader::parseSurvivalFlag("false"));
  REQUIRE_FALSE(PopulationCsvReader::parseSurvivalFlag("No"));
  REQUIRE_THROWS_AS(PopulationCsvReader::parseSurvivalFlag("maybe"), PopulationFileException);
  REQUIRE_THROWS_AS(PopulationCsvReader::parseSurvivalFlag(""), PopulationFileException);

  REQUIRE_FALSE(PopulationCsvReader::parseBurdenScore("").has_value());
  REQUIRE_FALSE(PopulationCsvReader::parseBurdenScore("   ").has_value());
  REQUIRE(*PopulationCsvReader::parseBurdenScore("7.25") == 7.25);
  REQUIRE_THROWS_AS(PopulationCsvReader::parseBurdenScore("high"), PopulationFileException);
}

TEST_CASE("PopulationCsvReader errors", "[PopulationCsvReader]")
{
  SECTION("Missing file")
  {
    REQUIRE_THROWS_AS(PopulationCsvReader("no_such_population_file.csv"), PopulationFileException);
  }

  SECTION("Missing column")
  {
    const ScratchCsvFile file("population_reader_missing_column.csv",
			      "age,race,survived,comorbidity_score\n"
			      "34,White,1,2.5\n");
    PopulationCsvReader reader(file.getName());
    REQUIRE_THROWS_AS(reader.readFile(), PopulationFileException);
  }

  SECTION("Unparseable number")
  {
    const ScratchCsvFile file("population_reader_bad_number.csv",
			      "age,race,sofa,survived,comorbidity_score\n"
			      "34,White,5,1,2.5\n"
			      "old,White,5,1,2.5\n");
    PopulationCsvReader reader(file.getName());
    REQUIRE_THROWS_AS(reader.readFile(), PopulationFileException);
    REQUIRE(reader.getPatients().empty());
  }

  SECTION("Unparseable survival flag names its line")
  {
    const ScratchCsvFile file("population_reader_bad_flag.csv",
			      "age,race,sofa,survived,comorbidity_score\n"
			      "34,White,5,1,2.5\n"
			      "40,White,5,1,2.5\n"
			      "50,White,5,perhaps,2.5\n");
    PopulationCsvReader reader(file.getName());
    try
      {
	reader.readFile();
	FAIL("expected PopulationFileException");
      }
    catch (const PopulationFileException& e)
      {
	REQUIRE(std::string(e.what()).find("line 4") != std::string::npos);
      }
  }

  SECTION("Negative age is invalid input")
  {
    const ScratchCsvFile file("population_reader_negative_age.csv",
			      "age,race,sofa,survived,comorbidity_score\n"
			      "-3,White,5,1,2.5\n");
    PopulationCsvReader reader(file.getName());
    REQUIRE_THROWS_AS(reader.readFile(), InvalidInputException);
  }

  SECTION("Header without data rows")
  {
    const ScratchCsvFile file("population_reader_empty.csv",
			      "age,race,sofa,survived,comorbidity_score\n");
    PopulationCsvReader reader(file.getName());
    REQUIRE_THROWS_AS(reader.readFile(), PopulationFileException);
  }
}
