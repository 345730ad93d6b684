// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "OutcomeMatrix.h"

namespace triagesim
{
  namespace analysis
  {
    /**
     * @brief Distribution summary of one policy's lives-saved outcomes.
     *
     * Percentages are 100 * lives saved / cohort size. The credible interval is
     * the empirical 2.5% - 97.5% range of the per-replicate percentages; the
     * confidence interval is mean +/- 1.96 sample standard deviations.
     */
    struct PolicySummary
    {
      std::string policyName;
      std::size_t replicates;
      double      meanLivesSaved;          // raw counts
      double      stdDevLivesSaved;
      double      meanLivesSavedPercent;
      double      credibleLowerPercent;
      double      credibleUpperPercent;
      double      confidenceLowerPercent;
      double      confidenceUpperPercent;

      // "<lower> to <upper>", each bound rounded to one decimal
      std::string credibleInterval() const;
      std::string confidenceInterval() const;
    };

    /**
     * @brief Paired, covariance-adjusted comparison of two policies.
     *
     * z = |mean(a_i - b_i)| / sqrt(var(a) + var(b) - 2 cov(a, b)).
     *
     * When the denominator vanishes the comparison is degenerate. Two
     * zero-variance sequences give NaN z and p. Otherwise identical sequences
     * (a policy against itself) report p = 1, and a constant nonzero paired
     * difference reports z = +inf and p = 0.
     */
    struct PairedComparisonResult
    {
      double meanDifference;    // |mean(a_i - b_i)|
      double varianceFirst;
      double varianceSecond;
      double covariance;
      double zStatistic;
      double pValue;
      bool   degenerate;

      // "<0.001", "=<p to one significant figure>", or "undefined"
      std::string formattedPValue() const;
    };

    std::string formatPercentInterval(double lower, double upper);
    std::string formatPValue(double pValue);

    class PairedComparisonTest
    {
    public:
      /**
       * @param degreesOfFreedom  Student-t degrees of freedom used for the
       *                          two-sided p-value; must be >= 1.
       * @throws InvalidInputException if the sequences differ in length, are
       *         shorter than two replicates, or degreesOfFreedom is zero.
       */
      static PairedComparisonResult compare(const std::vector<uint32_t>& first,
					    const std::vector<uint32_t>& second,
					    std::size_t degreesOfFreedom);
    };

    /**
     * @brief Square policy x policy table of paired comparisons.
     */
    class ComparisonMatrix
    {
    public:
      ComparisonMatrix(std::vector<std::string> policyNames,
		       std::vector<PairedComparisonResult> cells);

      std::size_t size() const
      {
	return mPolicyNames.size();
      }

      const std::vector<std::string>& getPolicyNames() const
      {
	return mPolicyNames;
      }

      const PairedComparisonResult& at(std::size_t row, std::size_t column) const;

      std::string pValueString(std::size_t row, std::size_t column) const
      {
	return at(row, column).formattedPValue();
      }

    private:
      std::vector<std::string>            mPolicyNames;
      std::vector<PairedComparisonResult> mCells;
    };

    class ComparativeStatistics
    {
    public:
      static constexpr double kCredibleLowerQuantile = 0.025;
      static constexpr double kCredibleUpperQuantile = 0.975;
      static constexpr double kNormalCriticalValue   = 1.96;

      /**
       * @throws InvalidInputException on empty outcomes or zero cohort size.
       */
      static PolicySummary summarize(const std::string& policyName,
				     const std::vector<uint32_t>& livesSaved,
				     std::size_t cohortSize);

      static std::vector<PolicySummary> summarizeAll(const OutcomeMatrix& outcomes,
						     std::size_t cohortSize);

      /**
       * @brief Runs the paired test for every ordered pair of policy columns.
       *
       * Degrees of freedom are basePopulationSize - 1, floored at one.
       */
      static ComparisonMatrix compareAll(const OutcomeMatrix& outcomes,
					 std::size_t basePopulationSize);
    };
  }
}
