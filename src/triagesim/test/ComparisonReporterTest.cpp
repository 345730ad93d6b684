// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <catch2/catch.hpp>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <vector>
#include "ComparisonReporter.h"
#include "OutputUtils.h"

using namespace triagesim;
using namespace triagesim::analysis;
using triagesim::reporting::ComparisonReporter;

namespace
{
  OutcomeMatrix makeOutcomes()
  {
    OutcomeMatrix outcomes({"Lottery", "Sickest first"}, 3);
    const uint32_t cells[3][2] = {{4, 6}, {5, 7}, {3, 6}};
    for (std::size_t r = 0; r < 3; ++r)
      for (std::size_t p = 0; p < 2; ++p)
	outcomes.set(r, p, cells[r][p]);
    return outcomes;
  }

  std::vector<std::string> lines(const std::string& text)
  {
    std::vector<std::string> result;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
      result.push_back(line);
    return result;
  }
}

TEST_CASE("ComparisonReporter::pValueLabel", "[ComparisonReporter]")
{
  PairedComparisonResult r{};
  r.pValue = 0.0001;
  REQUIRE(ComparisonReporter::pValueLabel(r) == "p<0.001");
  r.pValue = 0.27;
  REQUIRE(ComparisonReporter::pValueLabel(r) == "p=0.3");
  r.pValue = std::numeric_limits<double>::quiet_NaN();
  REQUIRE(ComparisonReporter::pValueLabel(r) == "undefined");
}

TEST_CASE("ComparisonReporter CSV exports", "[ComparisonReporter]")
{
  const OutcomeMatrix outcomes = makeOutcomes();
  const auto summaries = ComparativeStatistics::summarizeAll(outcomes, 10);
  const ComparisonMatrix comparisons = ComparativeStatistics::compareAll(outcomes, 10);

  SECTION("outcomes.csv has one row per replicate")
  {
    std::ostringstream out;
    ComparisonReporter::writeOutcomesCsv(out, outcomes);
    REQUIRE(lines(out.str()) == std::vector<std::string>{"replicate,Lottery,Sickest first",
							 "0,4,6", "1,5,7", "2,3,6"});
  }

  SECTION("summary.csv carries the interval strings")
  {
    std::ostringstream out;
    ComparisonReporter::writeSummaryCsv(out, summaries);
    const auto rows = lines(out.str());
    REQUIRE(rows.size() == 3);
    REQUIRE(rows[1].rfind("Lottery,3,4,1,40,", 0) == 0);
    REQUIRE(rows[1].find(summaries[0].credibleInterval()) != std::string::npos);
    REQUIRE(rows[2].rfind("Sickest first,3,", 0) == 0);
  }

  SECTION("summary.csv interval bounds are separate numeric columns")
  {
    OutcomeMatrix wide({"Lottery"}, 3);
    wide.set(0, 0, 0);
    wide.set(1, 0, 0);
    wide.set(2, 0, 9);
    const auto wideSummaries = ComparativeStatistics::summarizeAll(wide, 10);
    REQUIRE(wideSummaries[0].confidenceLowerPercent < 0.0);

    std::ostringstream out;
    ComparisonReporter::writeSummaryCsv(out, wideSummaries);
    const auto rows = lines(out.str());
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].find(",credible_lower,credible_upper,confidence_lower,confidence_upper") != std::string::npos);

    std::vector<std::string> fields;
    std::stringstream row(rows[1]);
    std::string field;
    while (std::getline(row, field, ','))
      fields.push_back(field);

    REQUIRE(fields.size() == 11);
    REQUIRE(fields[6] == wideSummaries[0].confidenceInterval());
    REQUIRE(fields[6].find(" to ") != std::string::npos);
    REQUIRE(std::stod(fields[9]) == Approx(wideSummaries[0].confidenceLowerPercent));
    REQUIRE(std::stod(fields[10]) == Approx(wideSummaries[0].confidenceUpperPercent));
  }

  SECTION("pvalues.csv is square with self-pairs equal to one")
  {
    std::ostringstream out;
    ComparisonReporter::writePValuesCsv(out, comparisons);
    const auto rows = lines(out.str());
    REQUIRE(rows.size() == 3);
    REQUIRE(rows[0] == "policy,Lottery,Sickest first");
    REQUIRE(rows[1].rfind("Lottery,p=1,", 0) == 0);
    REQUIRE(rows[2].substr(rows[2].size() - 4) == ",p=1");
  }

  SECTION("Console tables name every policy")
  {
    std::ostringstream out;
    ComparisonReporter::writeSummaryTable(out, summaries);
    ComparisonReporter::writePValueTable(out, comparisons);
    const std::string text = out.str();
    REQUIRE(text.find("Sickest first") != std::string::npos);
    REQUIRE(text.find(summaries[1].confidenceInterval()) != std::string::npos);
    REQUIRE(text.find(ComparisonReporter::pValueLabel(comparisons.at(0, 1))) != std::string::npos);
  }
}

TEST_CASE("TeeStream writes to both streams", "[OutputUtils]")
{
  std::ostringstream a;
  std::ostringstream b;
  utils::TeeStream tee(a, b);

  tee << "capacity " << 5 << std::endl;

  REQUIRE(a.str() == "capacity 5\n");
  REQUIRE(b.str() == "capacity 5\n");
}

TEST_CASE("formatElapsedTime", "[OutputUtils]")
{
  REQUIRE(utils::formatElapsedTime(0) == "00:00:00");
  REQUIRE(utils::formatElapsedTime(59) == "00:00:59");
  REQUIRE(utils::formatElapsedTime(3725) == "01:02:05");
}
