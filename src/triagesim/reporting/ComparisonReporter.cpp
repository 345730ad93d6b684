// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ComparisonReporter.h"
#include "OutputUtils.h"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace triagesim
{
namespace reporting
{

namespace
{

std::size_t policyColumnWidth(const std::vector<std::string>& names)
{
    std::size_t width = std::string("Policy").size();
    for (const auto& name : names)
    {
        width = std::max(width, name.size());
    }
    return width + 2;
}

std::string quoteCsvField(const std::string& field)
{
    if (field.find_first_of(",\"") == std::string::npos)
    {
        return field;
    }

    std::string quoted("\"");
    for (char c : field)
    {
        if (c == '"')
        {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void openForWriting(std::ofstream& file, const std::string& path)
{
    file.open(path, std::ios::trunc);
    if (!file.is_open())
    {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
}

} // namespace

std::string ComparisonReporter::pValueLabel(const analysis::PairedComparisonResult& result)
{
    const std::string formatted = result.formattedPValue();
    return formatted == "undefined" ? formatted : "p" + formatted;
}

void ComparisonReporter::writeSummaryTable(std::ostream& out,
                                           const std::vector<analysis::PolicySummary>& summaries)
{
    std::vector<std::string> names;
    for (const auto& s : summaries)
    {
        names.push_back(s.policyName);
    }
    const std::size_t nameWidth = policyColumnWidth(names);

    out << "\n=== Lives saved by policy ===" << std::endl;
    out << std::left << std::setw(static_cast<int>(nameWidth)) << "Policy"
        << std::right << std::setw(12) << "Mean (%)"
        << std::setw(16) << "Mean (count)"
        << std::setw(24) << "Credible interval"
        << std::setw(24) << "Confidence interval" << std::endl;

    for (const auto& s : summaries)
    {
        out << std::left << std::setw(static_cast<int>(nameWidth)) << s.policyName
            << std::right << std::fixed << std::setprecision(1)
            << std::setw(12) << s.meanLivesSavedPercent
            << std::setw(16) << s.meanLivesSaved
            << std::setw(24) << s.credibleInterval()
            << std::setw(24) << s.confidenceInterval() << std::endl;
    }
    out.unsetf(std::ios::fixed);
}

void ComparisonReporter::writePValueTable(std::ostream& out, const analysis::ComparisonMatrix& comparisons)
{
    const auto& names = comparisons.getPolicyNames();
    const std::size_t nameWidth = policyColumnWidth(names);
    const std::size_t cellWidth = std::max<std::size_t>(nameWidth, 12);

    out << "\n=== Pairwise paired comparison p-values ===" << std::endl;
    out << std::left << std::setw(static_cast<int>(nameWidth)) << "";
    for (const auto& name : names)
    {
        out << std::setw(static_cast<int>(cellWidth)) << name;
    }
    out << std::endl;

    for (std::size_t row = 0; row < comparisons.size(); ++row)
    {
        out << std::left << std::setw(static_cast<int>(nameWidth)) << names[row];
        for (std::size_t column = 0; column < comparisons.size(); ++column)
        {
            out << std::setw(static_cast<int>(cellWidth)) << pValueLabel(comparisons.at(row, column));
        }
        out << std::endl;
    }
}

void ComparisonReporter::writeOutcomesCsv(std::ostream& out, const OutcomeMatrix& outcomes)
{
    out << "replicate";
    for (const auto& name : outcomes.getPolicyNames())
    {
        out << "," << quoteCsvField(name);
    }
    out << "\n";

    for (std::size_t r = 0; r < outcomes.getNumReplicates(); ++r)
    {
        out << r;
        for (std::size_t p = 0; p < outcomes.getNumPolicies(); ++p)
        {
            out << "," << outcomes.at(r, p);
        }
        out << "\n";
    }
}

void ComparisonReporter::writeSummaryCsv(std::ostream& out,
                                         const std::vector<analysis::PolicySummary>& summaries)
{
    out << "policy,replicates,mean_lives_saved,sd_lives_saved,mean_lives_saved_percent,"
        << "credible_interval,confidence_interval,"
        << "credible_lower,credible_upper,confidence_lower,confidence_upper\n";

    for (const auto& s : summaries)
    {
        out << quoteCsvField(s.policyName) << ","
            << s.replicates << ","
            << std::setprecision(10) << s.meanLivesSaved << ","
            << s.stdDevLivesSaved << ","
            << s.meanLivesSavedPercent << ","
            << s.credibleInterval() << ","
            << s.confidenceInterval() << ","
            << s.credibleLowerPercent << ","
            << s.credibleUpperPercent << ","
            << s.confidenceLowerPercent << ","
            << s.confidenceUpperPercent << "\n";
    }
}

void ComparisonReporter::writePValuesCsv(std::ostream& out, const analysis::ComparisonMatrix& comparisons)
{
    const auto& names = comparisons.getPolicyNames();

    out << "policy";
    for (const auto& name : names)
    {
        out << "," << quoteCsvField(name);
    }
    out << "\n";

    for (std::size_t row = 0; row < comparisons.size(); ++row)
    {
        out << quoteCsvField(names[row]);
        for (std::size_t column = 0; column < comparisons.size(); ++column)
        {
            out << "," << pValueLabel(comparisons.at(row, column));
        }
        out << "\n";
    }
}

void ComparisonReporter::exportAll(const std::string& outputDir,
                                   const OutcomeMatrix& outcomes,
                                   const std::vector<analysis::PolicySummary>& summaries,
                                   const analysis::ComparisonMatrix& comparisons)
{
    std::ofstream outcomesFile;
    openForWriting(outcomesFile, utils::createOutputFilePath(outputDir, kOutcomesFileName));
    writeOutcomesCsv(outcomesFile, outcomes);

    std::ofstream summaryFile;
    openForWriting(summaryFile, utils::createOutputFilePath(outputDir, kSummaryFileName));
    writeSummaryCsv(summaryFile, summaries);

    std::ofstream pValuesFile;
    openForWriting(pValuesFile, utils::createOutputFilePath(outputDir, kPValuesFileName));
    writePValuesCsv(pValuesFile, comparisons);
}

} // namespace reporting
} // namespace triagesim
