// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <set>
#include <vector>
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "OutcomeMatrix.h"
#include "SimulationConfiguration.h"
#include "TriagePopulation.h"
#include "CohortSampler.h"
#include "PolicyFactory.h"
#include "OutcomeAggregator.h"
#include "RandomStreams.h"
#include "TriageException.h"

namespace triagesim
{
  /**
   * @class ReplicateRunner
   * @brief Fills the replicates x policies outcome matrix.
   *
   * For every replicate r the runner draws cohort r, then applies every policy
   * to it with that policy's own engine for replicate r and stores the number
   * of recipients who survived. Replicates are spread across the Executor;
   * each task writes only its own matrix row.
   *
   * @tparam Executor  Executor policy constructed with the configured thread
   *                   count (see ParallelExecutors.h). The outcome matrix is
   *                   identical for every executor.
   */
  template <class Executor = concurrency::ThreadPoolExecutor<>>
  class ReplicateRunner
  {
  public:
    using ProgressCallback = std::function<void(std::size_t completed, std::size_t total)>;

    /**
     * @throws InvalidInputException if the population does not match the
     *         configuration, no policies are given, or a policy id repeats.
     */
    ReplicateRunner(const SimulationConfiguration& config,
		    const TriagePopulation& population,
		    std::vector<TriagePolicyPtr> policies)
      : mConfig(config),
	mPopulation(population),
	mPolicies(std::move(policies))
    {
      if (mPopulation.size() != mConfig.getPopulationSize())
	throw InvalidInputException("ReplicateRunner: population size differs from the configured size");

      if (mPolicies.empty())
	throw InvalidInputException("ReplicateRunner: no allocation policies to evaluate");

      std::set<PolicyId> ids;
      for (const auto& policy : mPolicies)
	{
	  if (!policy)
	    throw InvalidInputException("ReplicateRunner: null allocation policy");
	  if (!ids.insert(policy->getId()).second)
	    throw InvalidInputException("ReplicateRunner: policy " + policy->getName() + " given twice");
	}
    }

    const std::vector<TriagePolicyPtr>& getPolicies() const
    {
      return mPolicies;
    }

    OutcomeMatrix run(ProgressCallback onProgress = nullptr) const
    {
      const std::size_t numReplicates = mConfig.getReplicateCount();
      const std::size_t capacity = mConfig.getCapacity();

      OutcomeMatrix outcomes(PolicyFactory::getPolicyNames(mPolicies), numReplicates);

      const CohortSampler sampler(mPopulation, mConfig.getSeed());
      const RandomStreams streams(mConfig.getSeed());

      Executor executor(mConfig.getNumThreads());
      std::atomic<std::size_t> completed{0};

      concurrency::parallel_for(static_cast<uint32_t>(numReplicates), executor,
				[&](uint32_t replicate) {
				  const Cohort cohort = sampler.drawCohort(replicate);

				  for (std::size_t p = 0; p < mPolicies.size(); ++p)
				    {
				      const TriagePolicy& policy = *mPolicies[p];
				      TriageRng rng = streams.policyEngine(static_cast<uint64_t>(policy.getId()),
									   replicate);
				      const AllocationResult allocation = policy.allocate(cohort, capacity, rng);
				      outcomes.set(replicate, p, OutcomeAggregator::countLivesSaved(allocation));
				    }

				  const std::size_t done = completed.fetch_add(1) + 1;
				  if (onProgress)
				    onProgress(done, numReplicates);
				});

      return outcomes;
    }

  private:
    const SimulationConfiguration& mConfig;
    const TriagePopulation& mPopulation;
    std::vector<TriagePolicyPtr> mPolicies;
  };
}
