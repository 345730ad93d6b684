// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __TRIAGESIM_OUTCOME_MATRIX_H
#define __TRIAGESIM_OUTCOME_MATRIX_H 1

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "TriageException.h"

namespace triagesim
{
  /**
   * @class OutcomeMatrix
   * @brief Replicates x policies table of lives-saved counts.
   *
   * Row r holds the outcome of every policy on bootstrap cohort r. The full
   * matrix is retained until every pairwise comparison has been computed,
   * because the paired test needs the per-replicate pairing of each column,
   * not just its summary.
   *
   * Each (replicate, policy) slot is written by exactly one task, so workers
   * may fill disjoint rows concurrently without locking. An index outside
   * the table is an InvalidInputException.
   */
  class OutcomeMatrix
  {
  public:
    OutcomeMatrix(std::vector<std::string> policyNames, std::size_t numReplicates)
      : mPolicyNames(std::move(policyNames)),
	mNumReplicates(numReplicates),
	mCells(mPolicyNames.size() * numReplicates, 0)
    {
      if (mPolicyNames.empty())
	throw InvalidInputException("OutcomeMatrix: at least one policy column is required");
    }

    std::size_t getNumReplicates() const
    {
      return mNumReplicates;
    }

    std::size_t getNumPolicies() const
    {
      return mPolicyNames.size();
    }

    const std::vector<std::string>& getPolicyNames() const
    {
      return mPolicyNames;
    }

    const std::string& getPolicyName(std::size_t policy) const
    {
      checkPolicy(policy);
      return mPolicyNames[policy];
    }

    uint32_t at(std::size_t replicate, std::size_t policy) const
    {
      return mCells[index(replicate, policy)];
    }

    void set(std::size_t replicate, std::size_t policy, uint32_t livesSaved)
    {
      mCells[index(replicate, policy)] = livesSaved;
    }

    // Outcome sequence of one policy across all replicates, in replicate order.
    std::vector<uint32_t> getPolicyOutcomes(std::size_t policy) const
    {
      checkPolicy(policy);

      std::vector<uint32_t> column;
      column.reserve(mNumReplicates);
      for (std::size_t r = 0; r < mNumReplicates; ++r)
	column.push_back(mCells[r * mPolicyNames.size() + policy]);
      return column;
    }

    bool operator==(const OutcomeMatrix& rhs) const
    {
      return mPolicyNames == rhs.mPolicyNames &&
	mNumReplicates == rhs.mNumReplicates &&
	mCells == rhs.mCells;
    }

    bool operator!=(const OutcomeMatrix& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    void checkPolicy(std::size_t policy) const
    {
      if (policy >= mPolicyNames.size())
	throw InvalidInputException("OutcomeMatrix: policy index " + std::to_string(policy) + " out of range");
    }

    std::size_t index(std::size_t replicate, std::size_t policy) const
    {
      checkPolicy(policy);
      if (replicate >= mNumReplicates)
	throw InvalidInputException("OutcomeMatrix: replicate index " + std::to_string(replicate) + " out of range");

      return replicate * mPolicyNames.size() + policy;
    }

  private:
    std::vector<std::string> mPolicyNames;
    std::size_t mNumReplicates;
    std::vector<uint32_t> mCells;
  };
}

#endif
