// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <cmath>
#include <limits>
#include "SimulationConfiguration.h"
#include "TriageException.h"
#include "ParallelExecutors.h"

namespace triagesim
{
  std::size_t maxWorkerThreads()
  {
    return 64 * concurrency::defaultThreadCount();
  }

  void validateSimulationParameters(const SimulationParameters& parameters)
  {
    if (!(parameters.scarcityFraction >= 0.0 && parameters.scarcityFraction <= 1.0))
      throw InvalidInputException("SimulationConfiguration: scarcity fraction must be in [0,1]");

    if (parameters.replicateCount < 2)
      throw InvalidInputException("SimulationConfiguration: at least two replicates are required");

    if (parameters.replicateCount > std::numeric_limits<uint32_t>::max())
      throw InvalidInputException("SimulationConfiguration: replicate count exceeds 32 bits");

    if (!(parameters.majorChronicPercentile > 0.0 && parameters.majorChronicPercentile < 1.0) ||
	!(parameters.severeChronicPercentile > 0.0 && parameters.severeChronicPercentile < 1.0))
      throw InvalidInputException("SimulationConfiguration: chronic disease percentiles must lie strictly between 0 and 1");

    if (parameters.majorChronicPercentile >= parameters.severeChronicPercentile)
      throw InvalidInputException("SimulationConfiguration: major chronic percentile must be below severe percentile");

    if (parameters.numThreads > maxWorkerThreads())
      throw InvalidInputException("SimulationConfiguration: thread count " + std::to_string(parameters.numThreads) +
				  " exceeds the limit of " + std::to_string(maxWorkerThreads()));
  }

  std::size_t SimulationConfiguration::computeCapacity(std::size_t populationSize, double scarcityFraction)
  {
    if (!(scarcityFraction >= 0.0 && scarcityFraction <= 1.0))
      throw InvalidInputException("SimulationConfiguration: scarcity fraction must be in [0,1]");

    return static_cast<std::size_t>(std::floor(static_cast<double>(populationSize) * scarcityFraction));
  }

  SimulationConfiguration::SimulationConfiguration(const SimulationParameters& parameters,
						   std::size_t populationSize,
						   const ChronicDiseaseThresholds& chronicThresholds)
    : mParameters(parameters),
      mPopulationSize(populationSize),
      mCapacity(0),
      mChronicThresholds(chronicThresholds)
  {
    validateSimulationParameters(mParameters);

    if (mPopulationSize == 0)
      throw InvalidInputException("SimulationConfiguration: base population is empty");

    if (mChronicThresholds.majorPercentile != mParameters.majorChronicPercentile ||
	mChronicThresholds.severePercentile != mParameters.severeChronicPercentile)
      throw InvalidInputException("SimulationConfiguration: chronic thresholds were computed at different percentiles");

    mCapacity = computeCapacity(mPopulationSize, mParameters.scarcityFraction);
  }
}
