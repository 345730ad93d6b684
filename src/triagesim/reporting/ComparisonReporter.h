// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "ComparativeStatistics.h"
#include "OutcomeMatrix.h"

namespace triagesim
{
namespace reporting
{

/**
 * @brief Writes the policy summary and pairwise p-value tables
 *
 * The console tables are fixed-width text. The CSV writers produce
 * outcomes.csv, summary.csv and pvalues.csv for downstream plotting.
 */
class ComparisonReporter
{
public:
    static constexpr const char* kOutcomesFileName = "outcomes.csv";
    static constexpr const char* kSummaryFileName  = "summary.csv";
    static constexpr const char* kPValuesFileName  = "pvalues.csv";

    static void writeSummaryTable(std::ostream& out,
                                  const std::vector<analysis::PolicySummary>& summaries);

    static void writePValueTable(std::ostream& out, const analysis::ComparisonMatrix& comparisons);

    // replicate,<policy 1>,...,<policy k>; one row per replicate
    static void writeOutcomesCsv(std::ostream& out, const OutcomeMatrix& outcomes);

    static void writeSummaryCsv(std::ostream& out,
                                const std::vector<analysis::PolicySummary>& summaries);

    // Square matrix of "p<0.001" / "p=0.3" / "undefined" strings
    static void writePValuesCsv(std::ostream& out, const analysis::ComparisonMatrix& comparisons);

    /**
     * @brief Write all three CSV files into outputDir
     * @throws std::runtime_error if a file cannot be opened
     */
    static void exportAll(const std::string& outputDir,
                          const OutcomeMatrix& outcomes,
                          const std::vector<analysis::PolicySummary>& summaries,
                          const analysis::ComparisonMatrix& comparisons);

    static std::string pValueLabel(const analysis::PairedComparisonResult& result);
};

} // namespace reporting
} // namespace triagesim
