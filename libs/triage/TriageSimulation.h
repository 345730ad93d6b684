// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <vector>
#include "ReplicateRunner.h"
#include "ComparativeStatistics.h"

namespace triagesim
{
  struct SimulationResults
  {
    OutcomeMatrix                         outcomes;
    std::vector<analysis::PolicySummary> summaries;
    analysis::ComparisonMatrix            comparisons;
  };

  /**
   * @brief Runs every replicate, then summarises each policy and compares
   *        every pair of policies.
   */
  template <class Executor = concurrency::ThreadPoolExecutor<>>
  SimulationResults runTriageSimulation(const SimulationConfiguration& config,
					const TriagePopulation& population,
					const std::vector<TriagePolicyPtr>& policies,
					typename ReplicateRunner<Executor>::ProgressCallback onProgress = nullptr)
  {
    const ReplicateRunner<Executor> runner(config, population, policies);
    OutcomeMatrix outcomes = runner.run(onProgress);

    auto summaries   = analysis::ComparativeStatistics::summarizeAll(outcomes, population.size());
    auto comparisons = analysis::ComparativeStatistics::compareAll(outcomes, population.size());

    return SimulationResults{std::move(outcomes), std::move(summaries), std::move(comparisons)};
  }
}
