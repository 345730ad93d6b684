// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "TriageSimOptions.h"
#include "PopulationCsvReader.h"
#include "ChronicDiseaseClassifier.h"
#include "TriagePopulation.h"
#include "SimulationConfiguration.h"
#include "PolicyFactory.h"
#include "TriageSimulation.h"
#include "TriageException.h"
#include "ComparisonReporter.h"
#include "OutputUtils.h"

using namespace triagesim;
using triagesim::reporting::ComparisonReporter;
using triagesim::utils::TeeStream;

namespace
{

TriagePopulation loadPopulation(const TriageSimOptions& options, std::ostream& log)
{
    PopulationCsvReader reader(options.populationFile);
    reader.readFile();
    std::vector<Patient> patients = reader.releasePatients();

    log << "Loaded " << patients.size() << " patients from " << options.populationFile << std::endl;

    const ChronicDiseaseThresholds thresholds =
        ChronicDiseaseClassifier::computeThresholds(patients,
                                                    options.parameters.majorChronicPercentile,
                                                    options.parameters.severeChronicPercentile);

    TriagePopulation population(std::move(patients), ChronicDiseaseClassifier(thresholds));

    log << "Chronic disease thresholds: major > " << thresholds.majorThreshold
        << " (p" << thresholds.majorPercentile * 100.0 << "), severe > "
        << thresholds.severeThreshold << " (p" << thresholds.severePercentile * 100.0 << ")" << std::endl;
    log << "Chronic disease tiers: "
        << population.countChronicTier(ChronicDiseaseTier::None) << " none, "
        << population.countChronicTier(ChronicDiseaseTier::Major) << " major, "
        << population.countChronicTier(ChronicDiseaseTier::Severe) << " severe" << std::endl;

    return population;
}

void printRunParameters(const SimulationConfiguration& config, std::ostream& log)
{
    log << "\n=== Simulation Parameters ===" << std::endl;
    log << "Seed: " << config.getSeed() << std::endl;
    log << "Replicates: " << config.getReplicateCount() << std::endl;
    log << "Population size: " << config.getPopulationSize() << std::endl;
    log << "Scarcity fraction: " << config.getScarcityFraction() << std::endl;
    log << "Capacity per cohort: " << config.getCapacity() << std::endl;
    log << "Worker threads: ";
    if (config.getNumThreads() == 0)
        log << "hardware (" << concurrency::defaultThreadCount() << ")" << std::endl;
    else
        log << config.getNumThreads() << std::endl;
    log << "=============================" << std::endl;
}

int runSimulation(const TriageSimOptions& options, std::ostream& log)
{
    const TriagePopulation population = loadPopulation(options, log);
    const SimulationConfiguration config(options.parameters,
                                         population.size(),
                                         population.getChronicThresholds());
    printRunParameters(config, log);

    const auto policies = PolicyFactory::createAll();

    std::mutex logMutex;
    auto reportProgress = [&log, &logMutex](std::size_t completed, std::size_t total) {
        // Each completed count is reported once, so every decile prints exactly once.
        if (completed * 10 / total == (completed - 1) * 10 / total)
            return;
        std::lock_guard<std::mutex> lock(logMutex);
        log << "  " << completed << " / " << total << " replicates" << std::endl;
    };

    const auto startTime = std::chrono::steady_clock::now();
    log << "\nRunning " << config.getReplicateCount() << " replicates x "
        << policies.size() << " policies..." << std::endl;

    const SimulationResults results = runTriageSimulation<>(config, population, policies, reportProgress);

    ComparisonReporter::writeSummaryTable(log, results.summaries);
    ComparisonReporter::writePValueTable(log, results.comparisons);

    if (!options.outputDir.empty())
    {
        ComparisonReporter::exportAll(options.outputDir, results.outcomes,
                                      results.summaries, results.comparisons);
        log << "\nWrote " << ComparisonReporter::kOutcomesFileName << ", "
            << ComparisonReporter::kSummaryFileName << " and "
            << ComparisonReporter::kPValuesFileName << " to " << options.outputDir << std::endl;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - startTime);
    log << "\nSimulation completed." << std::endl;
    log << "Total elapsed time: " << utils::formatElapsedTime(elapsed.count()) << std::endl;

    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    TriageSimOptions options;
    try
    {
        options = parseTriageSimOptions(argc, argv, std::cout);
    }
    catch (const SimulationConfigurationException& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Run 'triagesim --help' for usage." << std::endl;
        return 1;
    }

    if (options.helpRequested)
        return 0;

    std::ofstream logFile;
    std::unique_ptr<TeeStream> tee;
    if (!options.logFile.empty())
    {
        logFile.open(options.logFile, std::ios::trunc);
        if (!logFile.is_open())
        {
            std::cerr << "Error: cannot open log file " << options.logFile << std::endl;
            return 1;
        }
        tee = std::make_unique<TeeStream>(std::cout, logFile);
    }
    std::ostream& log = tee ? static_cast<std::ostream&>(*tee) : std::cout;

    try
    {
        return runSimulation(options, log);
    }
    catch (const TriageException& e)
    {
        log.flush();
        std::cerr << "Simulation failed: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e)
    {
        log.flush();
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
