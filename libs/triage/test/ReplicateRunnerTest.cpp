// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <catch2/catch.hpp>
#include <algorithm>
#include <cmath>
#include <mutex>
#include <vector>
#include "ReplicateRunner.h"
#include "TriageSimulation.h"
#include "TriageTestFixtures.h"

using namespace triagesim;
using concurrency::SingleThreadExecutor;
using concurrency::ThreadPoolExecutor;

namespace
{
  SimulationConfiguration makeConfig(const TriagePopulation& population,
				     std::size_t replicates,
				     uint64_t seed = 42)
  {
    SimulationParameters params;
    params.seed = seed;
    params.replicateCount = replicates;
    params.numThreads = 4;
    return SimulationConfiguration(params, population.size(), population.getChronicThresholds());
  }
}

TEST_CASE("ReplicateRunner fills every cell of the outcome matrix", "[ReplicateRunner]")
{
  const TriagePopulation population = testing::makePopulation(testing::makeMixedPatients(40));
  const SimulationConfiguration config = makeConfig(population, 12);
  const auto policies = PolicyFactory::createAll();

  const ReplicateRunner<SingleThreadExecutor> runner(config, population, policies);
  const OutcomeMatrix outcomes = runner.run();

  REQUIRE(outcomes.getNumReplicates() == 12);
  REQUIRE(outcomes.getNumPolicies() == 6);
  REQUIRE(outcomes.getPolicyNames() == PolicyFactory::getPolicyNames(policies));

  SECTION("Each cell matches a direct evaluation of its cohort and stream")
  {
    const CohortSampler sampler(population, config.getSeed());
    const RandomStreams streams(config.getSeed());

    for (std::size_t r = 0; r < outcomes.getNumReplicates(); ++r)
      {
	const Cohort cohort = sampler.drawCohort(r);
	for (std::size_t p = 0; p < policies.size(); ++p)
	  {
	    TriageRng rng = streams.policyEngine(static_cast<uint64_t>(policies[p]->getId()), r);
	    const AllocationResult result = policies[p]->allocate(cohort, config.getCapacity(), rng);
	    REQUIRE(outcomes.at(r, p) == OutcomeAggregator::countLivesSaved(result));
	    REQUIRE(outcomes.at(r, p) <= config.getCapacity());
	  }
      }
  }
}

TEST_CASE("ReplicateRunner is deterministic across executors and runs", "[ReplicateRunner][concurrency]")
{
  const TriagePopulation population = testing::makePopulation(testing::makeMixedPatients(60));
  const SimulationConfiguration config = makeConfig(population, 50);
  const auto policies = PolicyFactory::createAll();

  const OutcomeMatrix serial = ReplicateRunner<SingleThreadExecutor>(config, population, policies).run();
  const OutcomeMatrix pooled = ReplicateRunner<ThreadPoolExecutor<4>>(config, population, policies).run();
  const OutcomeMatrix defaultPool = ReplicateRunner<>(config, population, policies).run();

  REQUIRE(serial == pooled);
  REQUIRE(serial == defaultPool);
  REQUIRE(serial == ReplicateRunner<SingleThreadExecutor>(config, population, policies).run());

  SECTION("A different seed gives a different matrix")
  {
    const SimulationConfiguration other = makeConfig(population, 50, 43);
    REQUIRE(serial != ReplicateRunner<SingleThreadExecutor>(other, population, policies).run());
  }

  SECTION("Policy subsets reproduce their columns of the full run")
  {
    const std::vector<TriagePolicyPtr> subset{PolicyFactory::createPolicy(PolicyId::Maryland),
					      PolicyFactory::createPolicy(PolicyId::Lottery)};
    const OutcomeMatrix partial = ReplicateRunner<SingleThreadExecutor>(config, population, subset).run();

    REQUIRE(partial.getPolicyOutcomes(0) == serial.getPolicyOutcomes(4));
    REQUIRE(partial.getPolicyOutcomes(1) == serial.getPolicyOutcomes(0));
  }
}

TEST_CASE("ReplicateRunner reports progress", "[ReplicateRunner]")
{
  const TriagePopulation population = testing::makePopulation(testing::makeMixedPatients(20));
  const SimulationConfiguration config = makeConfig(population, 30);
  const auto policies = PolicyFactory::createAll();

  SECTION("Serially, in order")
  {
    std::vector<std::size_t> seen;
    ReplicateRunner<SingleThreadExecutor>(config, population, policies)
      .run([&seen](std::size_t completed, std::size_t total) {
	     REQUIRE(total == 30);
	     seen.push_back(completed);
	   });

    REQUIRE(seen.size() == 30);
    for (std::size_t i = 0; i < seen.size(); ++i)
      REQUIRE(seen[i] == i + 1);
  }

  SECTION("From worker threads, once per replicate")
  {
    std::mutex mutex;
    std::vector<std::size_t> seen;
    ReplicateRunner<ThreadPoolExecutor<4>>(config, population, policies)
      .run([&](std::size_t completed, std::size_t) {
	     std::lock_guard<std::mutex> lock(mutex);
	     seen.push_back(completed);
	   });

    std::sort(seen.begin(), seen.end());
    REQUIRE(seen.size() == 30);
    for (std::size_t i = 0; i < seen.size(); ++i)
      REQUIRE(seen[i] == i + 1);
  }
}

TEST_CASE("ReplicateRunner validates its inputs", "[ReplicateRunner]")
{
  const TriagePopulation population = testing::makePopulation(testing::makeMixedPatients(20));
  const TriagePopulation smaller = testing::makePopulation(testing::makeMixedPatients(10));
  const SimulationConfiguration config = makeConfig(population, 5);

  REQUIRE_THROWS_AS(ReplicateRunner<SingleThreadExecutor>(config, population, {}), InvalidInputException);
  REQUIRE_THROWS_AS(ReplicateRunner<SingleThreadExecutor>(config, smaller, PolicyFactory::createAll()),
		    InvalidInputException);

  const std::vector<TriagePolicyPtr> duplicated{PolicyFactory::createPolicy(PolicyId::Lottery),
						PolicyFactory::createPolicy(PolicyId::Lottery)};
  REQUIRE_THROWS_AS(ReplicateRunner<SingleThreadExecutor>(config, population, duplicated),
		    InvalidInputException);
}

TEST_CASE("runTriageSimulation summarises and compares every policy", "[TriageSimulation]")
{
  const TriagePopulation population = testing::makePopulation(testing::makeMixedPatients(80));
  const SimulationConfiguration config = makeConfig(population, 200, 7);
  const auto policies = PolicyFactory::createAll();

  const SimulationResults results =
    runTriageSimulation<SingleThreadExecutor>(config, population, policies);

  REQUIRE(results.outcomes.getNumReplicates() == 200);
  REQUIRE(results.summaries.size() == 6);
  REQUIRE(results.comparisons.size() == 6);

  for (std::size_t p = 0; p < results.summaries.size(); ++p)
    {
      const auto& summary = results.summaries[p];
      REQUIRE(summary.policyName == policies[p]->getName());
      REQUIRE(summary.replicates == 200);
      REQUIRE(summary.meanLivesSavedPercent >= 0.0);
      REQUIRE(summary.meanLivesSavedPercent <= 100.0 * config.getCapacity() / population.size());
      REQUIRE(summary.credibleLowerPercent <= summary.meanLivesSavedPercent);
      REQUIRE(summary.credibleUpperPercent >= summary.meanLivesSavedPercent);
    }

  for (std::size_t row = 0; row < 6; ++row)
    {
      const auto& self = results.comparisons.at(row, row);
      REQUIRE(self.degenerate);
      REQUIRE((self.pValue == 1.0 || std::isnan(self.pValue)));

      for (std::size_t column = 0; column < 6; ++column)
	{
	  const auto& ab = results.comparisons.at(row, column);
	  const auto& ba = results.comparisons.at(column, row);
	  if (std::isnan(ab.pValue))
	    REQUIRE(std::isnan(ba.pValue));
	  else
	    REQUIRE(ab.pValue == Approx(ba.pValue));
	  REQUIRE(results.comparisons.pValueString(row, column) ==
		  results.comparisons.pValueString(column, row));
	}
    }

  SECTION("Identical runs give identical tables")
  {
    const SimulationResults again =
      runTriageSimulation<ThreadPoolExecutor<4>>(config, population, policies);

    REQUIRE(again.outcomes == results.outcomes);
    for (std::size_t p = 0; p < 6; ++p)
      {
	REQUIRE(again.summaries[p].credibleInterval() == results.summaries[p].credibleInterval());
	REQUIRE(again.summaries[p].confidenceInterval() == results.summaries[p].confidenceInterval());
	for (std::size_t q = 0; q < 6; ++q)
	  REQUIRE(again.comparisons.pValueString(p, q) == results.comparisons.pValueString(p, q));
      }
  }
}
