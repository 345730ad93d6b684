// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <catch2/catch.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "TriageSimOptions.h"
#include "TriageException.h"

using namespace triagesim;

namespace
{
  TriageSimOptions parse(const std::vector<const char*>& args, std::ostream& helpOut)
  {
    std::vector<const char*> argv{"triagesim"};
    argv.insert(argv.end(), args.begin(), args.end());
    return parseTriageSimOptions(static_cast<int>(argv.size()), argv.data(), helpOut);
  }
}

TEST_CASE("Command line defaults", "[TriageSimOptions]")
{
  std::ostringstream help;
  const TriageSimOptions options = parse({"--population", "cohort.csv"}, help);

  REQUIRE_FALSE(options.helpRequested);
  REQUIRE(options.populationFile == "cohort.csv");
  REQUIRE(options.outputDir.empty());
  REQUIRE(options.logFile.empty());
  REQUIRE(options.parameters.seed == 42);
  REQUIRE(options.parameters.replicateCount == 10000);
  REQUIRE(options.parameters.scarcityFraction == 0.5);
  REQUIRE(options.parameters.majorChronicPercentile == 0.75);
  REQUIRE(options.parameters.severeChronicPercentile == 0.90);
  REQUIRE(options.parameters.numThreads == 0);
  REQUIRE(help.str().empty());
}

TEST_CASE("Command line overrides", "[TriageSimOptions]")
{
  std::ostringstream help;
  const TriageSimOptions options = parse({"--population", "p.csv", "--seed", "7",
					  "--replicates", "500", "--scarcity", "0.25",
					  "--major-percentile", "0.6", "--severe-percentile", "0.8",
					  "--threads", "3", "--output-dir", "out", "--log-file", "run.log"},
					 help);

  REQUIRE(options.parameters.seed == 7);
  REQUIRE(options.parameters.replicateCount == 500);
  REQUIRE(options.parameters.scarcityFraction == 0.25);
  REQUIRE(options.parameters.majorChronicPercentile == 0.6);
  REQUIRE(options.parameters.severeChronicPercentile == 0.8);
  REQUIRE(options.parameters.numThreads == 3);
  REQUIRE(options.outputDir == "out");
  REQUIRE(options.logFile == "run.log");
}

TEST_CASE("Help short-circuits validation", "[TriageSimOptions]")
{
  std::ostringstream help;
  const TriageSimOptions options = parse({"--help"}, help);

  REQUIRE(options.helpRequested);
  REQUIRE(help.str().find("--population") != std::string::npos);
}

TEST_CASE("Configuration file values sit below the command line", "[TriageSimOptions]")
{
  const std::string iniName = "triagesim_options_test.ini";
  {
    std::ofstream ini(iniName, std::ios::trunc);
    ini << "population = from_ini.csv\n"
	<< "replicates = 250\n"
	<< "scarcity = 0.3\n"
	<< "seed = 99\n";
  }

  std::ostringstream help;
  const TriageSimOptions options = parse({"--config", iniName.c_str(), "--seed", "5"}, help);
  std::remove(iniName.c_str());

  REQUIRE(options.populationFile == "from_ini.csv");
  REQUIRE(options.parameters.replicateCount == 250);
  REQUIRE(options.parameters.scarcityFraction == 0.3);
  REQUIRE(options.parameters.seed == 5);
}

TEST_CASE("Bad command lines are configuration errors", "[TriageSimOptions]")
{
  std::ostringstream help;

  REQUIRE_THROWS_AS(parse({}, help), SimulationConfigurationException);
  REQUIRE_THROWS_AS(parse({"--population", "p.csv", "--bogus"}, help), SimulationConfigurationException);
  REQUIRE_THROWS_AS(parse({"--population", "p.csv", "--scarcity", "lots"}, help),
		    SimulationConfigurationException);
  REQUIRE_THROWS_AS(parse({"--population", "p.csv", "--scarcity", "1.5"}, help),
		    SimulationConfigurationException);
  REQUIRE_THROWS_AS(parse({"--population", "p.csv", "--replicates", "1"}, help),
		    SimulationConfigurationException);
  REQUIRE_THROWS_AS(parse({"--population", "p.csv", "--major-percentile", "0.95"}, help),
		    SimulationConfigurationException);
  REQUIRE_THROWS_AS(parse({"--population", "p.csv", "--config", "no_such_file.ini"}, help),
		    SimulationConfigurationException);
}

TEST_CASE("Negative counts are rejected rather than wrapped", "[TriageSimOptions]")
{
  std::ostringstream help;

  REQUIRE_THROWS_AS(parse({"--population", "x.csv", "--threads", "-1"}, help), SimulationConfigurationException);
  REQUIRE_THROWS_AS(parse({"--population", "x.csv", "--threads=-1"}, help), SimulationConfigurationException);
  REQUIRE_THROWS_AS(parse({"--population", "x.csv", "--seed", "-1"}, help), SimulationConfigurationException);
  REQUIRE_THROWS_AS(parse({"--population", "x.csv", "--replicates", "-5"}, help), SimulationConfigurationException);

  SECTION("Also from a configuration file")
  {
    const std::string iniName = "triagesim_negative_threads.ini";
    {
      std::ofstream ini(iniName, std::ios::trunc);
      ini << "population = x.csv\n"
	  << "threads = -2\n";
    }
    REQUIRE_THROWS_AS(parse({"--config", iniName.c_str()}, help), SimulationConfigurationException);
    std::remove(iniName.c_str());
  }
}

TEST_CASE("Thread counts beyond the worker limit are configuration errors", "[TriageSimOptions]")
{
  std::ostringstream help;
  const std::string tooMany = std::to_string(maxWorkerThreads() + 1);

  REQUIRE_THROWS_AS(parse({"--population", "x.csv", "--threads", tooMany.c_str()}, help),
		    SimulationConfigurationException);
  REQUIRE_THROWS_AS(parse({"--population", "x.csv", "--threads", "18446744073709551615"}, help),
		    SimulationConfigurationException);
}
