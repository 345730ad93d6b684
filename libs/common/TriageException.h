// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __TRIAGESIM_TRIAGE_EXCEPTION_H
#define __TRIAGESIM_TRIAGE_EXCEPTION_H 1

#include <string>
#include <stdexcept>

namespace triagesim
{
  class TriageException : public std::runtime_error
  {
  public:
    explicit TriageException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    ~TriageException()
    {}
  };

  // Empty or malformed population, out-of-range parameters, capacity larger than the cohort.
  class InvalidInputException : public TriageException
  {
  public:
    explicit InvalidInputException(const std::string& msg)
      : TriageException(msg)
    {}

    ~InvalidInputException()
    {}
  };

  class PopulationFileException : public TriageException
  {
  public:
    explicit PopulationFileException(const std::string& msg)
      : TriageException(msg)
    {}

    ~PopulationFileException()
    {}
  };

  class SimulationConfigurationException : public TriageException
  {
  public:
    explicit SimulationConfigurationException(const std::string& msg)
      : TriageException(msg)
    {}

    ~SimulationConfigurationException()
    {}
  };
}

#endif
