// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <cmath>
#include <limits>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <boost/math/distributions/students_t.hpp>
#include "ComparativeStatistics.h"
#include "StatUtils.h"
#include "TriageException.h"

namespace triagesim
{
  namespace analysis
  {
    namespace
    {
      // var1 + var2 - 2cov below this fraction of var1 + var2 is rounding noise.
      constexpr double kDegenerateDenominatorTolerance = 1e-12;

      bool allDifferencesZero(const std::vector<uint32_t>& first,
			      const std::vector<uint32_t>& second)
      {
	return std::equal(first.begin(), first.end(), second.begin());
      }
    }

    std::string formatPercentInterval(double lower, double upper)
    {
      std::ostringstream out;
      out << std::fixed << std::setprecision(1) << lower << " to " << upper;
      return out.str();
    }

    std::string formatPValue(double pValue)
    {
      if (std::isnan(pValue))
	return "undefined";

      if (pValue < 0.001)
	return "<0.001";

      std::ostringstream out;
      out << "=" << std::setprecision(1) << pValue;
      return out.str();
    }

    std::string PolicySummary::credibleInterval() const
    {
      return formatPercentInterval(credibleLowerPercent, credibleUpperPercent);
    }

    std::string PolicySummary::confidenceInterval() const
    {
      return formatPercentInterval(confidenceLowerPercent, confidenceUpperPercent);
    }

    std::string PairedComparisonResult::formattedPValue() const
    {
      return formatPValue(pValue);
    }

    PairedComparisonResult PairedComparisonTest::compare(const std::vector<uint32_t>& first,
							 const std::vector<uint32_t>& second,
							 std::size_t degreesOfFreedom)
    {
      if (first.size() != second.size())
	throw InvalidInputException("PairedComparisonTest::compare: outcome sequences differ in length");
      if (first.size() < 2)
	throw InvalidInputException("PairedComparisonTest::compare: at least two replicates are required");
      if (degreesOfFreedom == 0)
	throw InvalidInputException("PairedComparisonTest::compare: degrees of freedom must be positive");

      PairedComparisonResult result{};
      result.meanDifference = std::fabs(StatUtils::computeMeanDifference(first, second));

      // Variances go through the covariance routine so that a sequence paired
      // with itself cancels exactly in the denominator.
      result.varianceFirst  = StatUtils::computeCovariance(first, first);
      result.varianceSecond = StatUtils::computeCovariance(second, second);
      result.covariance     = StatUtils::computeCovariance(first, second);

      const double pooled = result.varianceFirst + result.varianceSecond;
      const double denominator = pooled - 2.0 * result.covariance;

      if (denominator <= kDegenerateDenominatorTolerance * std::max(pooled, 1.0))
	{
	  result.degenerate = true;
	  const bool bothConstant = result.varianceFirst == 0.0 && result.varianceSecond == 0.0;
	  if (bothConstant)
	    {
	      result.zStatistic = std::numeric_limits<double>::quiet_NaN();
	      result.pValue     = std::numeric_limits<double>::quiet_NaN();
	    }
	  else if (allDifferencesZero(first, second))
	    {
	      result.zStatistic = 0.0;
	      result.pValue     = 1.0;
	    }
	  else
	    {
	      // Every replicate differs by the same nonzero amount.
	      result.zStatistic = std::numeric_limits<double>::infinity();
	      result.pValue     = 0.0;
	    }
	  return result;
	}

      result.degenerate = false;
      result.zStatistic = result.meanDifference / std::sqrt(denominator);

      boost::math::students_t_distribution<double> tDist(static_cast<double>(degreesOfFreedom));
      const double p = 2.0 * boost::math::cdf(tDist, -result.zStatistic);
      result.pValue = std::min(p, 1.0);

      return result;
    }

    ComparisonMatrix::ComparisonMatrix(std::vector<std::string> policyNames,
				       std::vector<PairedComparisonResult> cells)
      : mPolicyNames(std::move(policyNames)),
	mCells(std::move(cells))
    {
      if (mCells.size() != mPolicyNames.size() * mPolicyNames.size())
	throw InvalidInputException("ComparisonMatrix: cell count does not match a square of the policy count");
    }

    const PairedComparisonResult& ComparisonMatrix::at(std::size_t row, std::size_t column) const
    {
      if (row >= mPolicyNames.size() || column >= mPolicyNames.size())
	throw InvalidInputException("ComparisonMatrix::at: index out of range");

      return mCells[row * mPolicyNames.size() + column];
    }

    PolicySummary ComparativeStatistics::summarize(const std::string& policyName,
						   const std::vector<uint32_t>& livesSaved,
						   std::size_t cohortSize)
    {
      if (livesSaved.empty())
	throw InvalidInputException("ComparativeStatistics::summarize: no replicate outcomes for " + policyName);
      if (cohortSize == 0)
	throw InvalidInputException("ComparativeStatistics::summarize: cohort size must be positive");

      const double scale = 100.0 / static_cast<double>(cohortSize);

      std::vector<double> percents;
      percents.reserve(livesSaved.size());
      for (uint32_t count : livesSaved)
	percents.push_back(static_cast<double>(count) * scale);

      const auto [meanCount, varCount] = StatUtils::computeMeanAndVariance(livesSaved);
      const double meanPercent = StatUtils::computeMean(percents);
      const double sdPercent   = std::sqrt(StatUtils::computeVariance(percents, meanPercent));

      PolicySummary summary;
      summary.policyName             = policyName;
      summary.replicates             = livesSaved.size();
      summary.meanLivesSaved         = meanCount;
      summary.stdDevLivesSaved       = std::sqrt(varCount);
      summary.meanLivesSavedPercent  = meanPercent;
      summary.credibleLowerPercent   = StatUtils::quantileType7(percents, kCredibleLowerQuantile);
      summary.credibleUpperPercent   = StatUtils::quantileType7(percents, kCredibleUpperQuantile);
      summary.confidenceLowerPercent = meanPercent - kNormalCriticalValue * sdPercent;
      summary.confidenceUpperPercent = meanPercent + kNormalCriticalValue * sdPercent;

      return summary;
    }

    std::vector<PolicySummary> ComparativeStatistics::summarizeAll(const OutcomeMatrix& outcomes,
								   std::size_t cohortSize)
    {
      std::vector<PolicySummary> summaries;
      summaries.reserve(outcomes.getNumPolicies());

      for (std::size_t p = 0; p < outcomes.getNumPolicies(); ++p)
	summaries.push_back(summarize(outcomes.getPolicyName(p),
				      outcomes.getPolicyOutcomes(p),
				      cohortSize));
      return summaries;
    }

    ComparisonMatrix ComparativeStatistics::compareAll(const OutcomeMatrix& outcomes,
						       std::size_t basePopulationSize)
    {
      const std::size_t numPolicies = outcomes.getNumPolicies();
      const std::size_t dof = basePopulationSize > 1 ? basePopulationSize - 1 : 1;

      std::vector<std::vector<uint32_t>> columns;
      columns.reserve(numPolicies);
      for (std::size_t p = 0; p < numPolicies; ++p)
	columns.push_back(outcomes.getPolicyOutcomes(p));

      std::vector<PairedComparisonResult> cells;
      cells.reserve(numPolicies * numPolicies);
      for (std::size_t row = 0; row < numPolicies; ++row)
	for (std::size_t column = 0; column < numPolicies; ++column)
	  cells.push_back(PairedComparisonTest::compare(columns[row], columns[column], dof));

      return ComparisonMatrix(outcomes.getPolicyNames(), std::move(cells));
    }
  }
}
