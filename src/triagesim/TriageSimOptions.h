// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <ostream>
#include <string>
#include "SimulationConfiguration.h"

namespace triagesim
{

/**
 * @brief Everything the command line and the optional INI file can set
 */
struct TriageSimOptions
{
    std::string populationFile;
    std::string outputDir;         // empty: no CSV export
    std::string logFile;           // empty: console only
    SimulationParameters parameters;
    bool helpRequested = false;
};

/**
 * @brief Parse the command line, then the INI file named by --config if any
 *
 * Values given on the command line take precedence over the INI file. When
 * --help is given the usage text is written to helpOut and helpRequested is
 * set; no other option is checked.
 *
 * @throws SimulationConfigurationException on unknown options, unparseable
 *         or out-of-range values, an unreadable INI file, or a missing
 *         --population.
 */
TriageSimOptions parseTriageSimOptions(int argc, const char* const argv[], std::ostream& helpOut);

} // namespace triagesim
