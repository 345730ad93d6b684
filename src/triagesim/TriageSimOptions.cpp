// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "TriageSimOptions.h"
#include "TriageException.h"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace triagesim
{

namespace
{

po::options_description simulationOptions()
{
    const SimulationParameters defaults;

    po::options_description desc("Simulation");
    desc.add_options()
        ("population", po::value<std::string>(), "Base population CSV (age, race, sofa, survived, comorbidity_score)")
        ("seed", po::value<uint64_t>()->default_value(defaults.seed), "Master random seed")
        ("replicates", po::value<std::size_t>()->default_value(defaults.replicateCount), "Number of bootstrap replicate cohorts")
        ("scarcity", po::value<double>()->default_value(defaults.scarcityFraction), "Fraction of the population that can receive the resource")
        ("major-percentile", po::value<double>()->default_value(defaults.majorChronicPercentile), "Burden score percentile above which chronic disease is major")
        ("severe-percentile", po::value<double>()->default_value(defaults.severeChronicPercentile), "Burden score percentile above which chronic disease is severe")
        ("threads", po::value<std::size_t>()->default_value(defaults.numThreads), "Worker threads (0 = hardware concurrency)")
        ("output-dir", po::value<std::string>(), "Directory for outcomes.csv, summary.csv and pvalues.csv")
        ("log-file", po::value<std::string>(), "Mirror console output into this file");
    return desc;
}

// Boost.Program_options converts "-1" to SIZE_MAX for unsigned targets.
void rejectNegativeCounts(const po::parsed_options& parsed)
{
    static const char* const unsignedOptions[] = {"seed", "replicates", "threads"};

    for (const auto& option : parsed.options)
    {
        const bool isUnsigned = std::find(std::begin(unsignedOptions), std::end(unsignedOptions),
                                          option.string_key) != std::end(unsignedOptions);
        if (!isUnsigned)
        {
            continue;
        }
        for (const auto& token : option.value)
        {
            if (boost::algorithm::starts_with(boost::algorithm::trim_copy(token), "-"))
            {
                throw SimulationConfigurationException("Option --" + option.string_key +
                                                       " must be a non-negative integer, got '" + token + "'");
            }
        }
    }
}

void printUsage(std::ostream& out, const po::options_description& desc)
{
    out << "triagesim - Monte Carlo comparison of ICU triage policies\n\n";
    out << "Usage: triagesim --population <csv> [options]\n\n";
    out << desc << std::endl;
    out << "\nExamples:\n";
    out << "  triagesim --population cohort.csv --replicates 10000 --scarcity 0.5\n";
    out << "  triagesim --population cohort.csv --config run.ini --output-dir results\n";
}

} // namespace

TriageSimOptions parseTriageSimOptions(int argc, const char* const argv[], std::ostream& helpOut)
{
    po::options_description generic("General");
    generic.add_options()
        ("help,h", "Show this help message")
        ("config", po::value<std::string>(), "INI file with any of the simulation options");

    const po::options_description simulation = simulationOptions();

    po::options_description all;
    all.add(generic).add(simulation);

    TriageSimOptions options;
    po::variables_map vm;

    try
    {
        const po::parsed_options commandLine = po::parse_command_line(argc, argv, all);
        rejectNegativeCounts(commandLine);
        po::store(commandLine, vm);

        if (vm.count("help"))
        {
            printUsage(helpOut, all);
            options.helpRequested = true;
            return options;
        }

        if (vm.count("config"))
        {
            const std::string configPath = vm["config"].as<std::string>();
            std::ifstream configFile(configPath);
            if (!configFile.is_open())
            {
                throw SimulationConfigurationException("Cannot open configuration file: " + configPath);
            }
            const po::parsed_options fromFile = po::parse_config_file(configFile, simulation);
            rejectNegativeCounts(fromFile);
            po::store(fromFile, vm);
        }

        po::notify(vm);
    }
    catch (const po::error& e)
    {
        throw SimulationConfigurationException(std::string("Invalid command line: ") + e.what());
    }

    if (!vm.count("population"))
    {
        throw SimulationConfigurationException("Missing required option --population");
    }

    options.populationFile = vm["population"].as<std::string>();
    if (vm.count("output-dir"))
    {
        options.outputDir = vm["output-dir"].as<std::string>();
    }
    if (vm.count("log-file"))
    {
        options.logFile = vm["log-file"].as<std::string>();
    }

    SimulationParameters& params = options.parameters;
    params.seed = vm["seed"].as<uint64_t>();
    params.replicateCount = vm["replicates"].as<std::size_t>();
    params.scarcityFraction = vm["scarcity"].as<double>();
    params.majorChronicPercentile = vm["major-percentile"].as<double>();
    params.severeChronicPercentile = vm["severe-percentile"].as<double>();
    params.numThreads = vm["threads"].as<std::size_t>();

    try
    {
        validateSimulationParameters(params);
    }
    catch (const InvalidInputException& e)
    {
        throw SimulationConfigurationException(e.what());
    }

    return options;
}

} // namespace triagesim
