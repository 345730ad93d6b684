// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "ChronicDiseaseClassifier.h"

namespace triagesim
{
  struct SimulationParameters
  {
    uint64_t    seed                    = 42;
    std::size_t replicateCount          = 10000;
    double      scarcityFraction        = 0.5;
    double      majorChronicPercentile  = 0.75;
    double      severeChronicPercentile = 0.90;
    std::size_t numThreads              = 0;    // 0 = hardware concurrency
  };

  /**
   * @class SimulationConfiguration
   * @brief Process-wide constants of one simulation run.
   *
   * Built once at startup from the parameters and the base population and
   * passed by const reference to every component. Capacity is
   * floor(population size * scarcity fraction) and is the same for every
   * replicate and policy.
   */
  class SimulationConfiguration
  {
  public:
    /**
     * @throws InvalidInputException for an empty population, a scarcity
     *         fraction outside [0,1], fewer than two replicates, more
     *         replicates than fit in 32 bits, a thread count above
     *         maxWorkerThreads(), or thresholds whose percentiles disagree
     *         with the parameters.
     */
    SimulationConfiguration(const SimulationParameters& parameters,
			    std::size_t populationSize,
			    const ChronicDiseaseThresholds& chronicThresholds);

    static std::size_t computeCapacity(std::size_t populationSize, double scarcityFraction);

    const SimulationParameters& getParameters() const
    {
      return mParameters;
    }

    uint64_t getSeed() const
    {
      return mParameters.seed;
    }

    std::size_t getReplicateCount() const
    {
      return mParameters.replicateCount;
    }

    double getScarcityFraction() const
    {
      return mParameters.scarcityFraction;
    }

    std::size_t getNumThreads() const
    {
      return mParameters.numThreads;
    }

    std::size_t getPopulationSize() const
    {
      return mPopulationSize;
    }

    std::size_t getCapacity() const
    {
      return mCapacity;
    }

    const ChronicDiseaseThresholds& getChronicThresholds() const
    {
      return mChronicThresholds;
    }

  private:
    SimulationParameters     mParameters;
    std::size_t              mPopulationSize;
    std::size_t              mCapacity;
    ChronicDiseaseThresholds mChronicThresholds;
  };

  // Largest accepted worker thread count: 64 per hardware thread.
  std::size_t maxWorkerThreads();

  void validateSimulationParameters(const SimulationParameters& parameters);
}
