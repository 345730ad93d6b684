// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <fstream>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"
#include "PopulationCsvReader.h"
#include "TriageException.h"

namespace triagesim
{
  namespace
  {
    double parseNumber(const std::string& field, const char* columnName)
    {
      try
	{
	  return boost::lexical_cast<double>(boost::algorithm::trim_copy(field));
	}
      catch (const boost::bad_lexical_cast&)
	{
	  throw PopulationFileException(std::string("column ") + columnName +
					": cannot parse '" + field + "' as a number");
	}
    }

    std::string atLine(const std::string& fileName, unsigned lineNo)
    {
      return fileName + ", line " + std::to_string(lineNo) + ": ";
    }
  }

  PopulationCsvReader::PopulationCsvReader(const std::string& fileName)
    : mFileName(fileName),
      mPatients()
  {
    std::ifstream fin(mFileName);
    if (!fin.is_open())
      throw PopulationFileException("Cannot open population file: " + mFileName);
  }

  bool PopulationCsvReader::parseSurvivalFlag(const std::string& field)
  {
    const std::string value = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(field));

    if (value == "1" || value == "true" || value == "yes")
      return true;
    if (value == "0" || value == "false" || value == "no")
      return false;

    throw PopulationFileException("column survived: cannot parse '" + field + "' as a survival flag");
  }

  std::optional<double> PopulationCsvReader::parseBurdenScore(const std::string& field)
  {
    if (boost::algorithm::trim_copy(field).empty())
      return std::nullopt;

    return parseNumber(field, "comorbidity_score");
  }

  void PopulationCsvReader::readFile()
  {
    std::vector<Patient> patients;

    try
      {
	io::CSVReader<5, io::trim_chars<' ', '\t'>, io::double_quote_escape<',','\"'>> csvFile(mFileName);
	csvFile.read_header(io::ignore_extra_column, "age", "race", "sofa", "survived", "comorbidity_score");

	std::string ageString, raceString, sofaString, survivedString, burdenString;

	while (csvFile.read_row(ageString, raceString, sofaString, survivedString, burdenString))
	  {
	    const unsigned lineNo = csvFile.get_file_line();
	    try
	      {
		patients.emplace_back(parseNumber(ageString, "age"),
				      raceCategoryFromString(raceString),
				      parseNumber(sofaString, "sofa"),
				      parseSurvivalFlag(survivedString),
				      parseBurdenScore(burdenString));
	      }
	    catch (const PopulationFileException& e)
	      {
		throw PopulationFileException(atLine(mFileName, lineNo) + e.what());
	      }
	    catch (const InvalidInputException& e)
	      {
		throw InvalidInputException(atLine(mFileName, lineNo) + e.what());
	      }
	  }
      }
    catch (const io::error::base& e)
      {
	throw PopulationFileException(std::string("PopulationCsvReader: ") + e.what());
      }

    if (patients.empty())
      throw PopulationFileException("No patient rows found in file: " + mFileName);

    mPatients = std::move(patients);
  }
}
