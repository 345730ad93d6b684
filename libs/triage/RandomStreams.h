// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <random>
#include "RngUtils.h"

namespace triagesim
{
  using TriageRng = std::mt19937_64;

  /**
   * @brief Named random streams derived from the master seed.
   *
   * The cohort drawn for replicate r and the lottery draws of policy p on
   * replicate r each come from their own engine, seeded from
   * (seed, stream tag[, policy], r). Nothing is shared between replicates or
   * between policies on the same replicate, so the outcome of any cell of the
   * outcome matrix is independent of thread count and scheduling order.
   */
  class RandomStreams
  {
  public:
    static constexpr uint64_t kCohortStreamTag = 0xC0407ull;
    static constexpr uint64_t kPolicyStreamTag = 0x9011C7ull;

    explicit RandomStreams(uint64_t masterSeed)
      : mCohortStream(rng_utils::CRNKey(masterSeed).with_tag(kCohortStreamTag)),
	mPolicyStream(rng_utils::CRNKey(masterSeed).with_tag(kPolicyStreamTag))
    {}

    TriageRng cohortEngine(std::size_t replicate) const
    {
      return mCohortStream.make_engine(replicate);
    }

    TriageRng policyEngine(uint64_t policyTag, std::size_t replicate) const
    {
      return mPolicyStream.with_tag(policyTag).make_engine(replicate);
    }

  private:
    rng_utils::CRNRng<TriageRng> mCohortStream;
    rng_utils::CRNRng<TriageRng> mPolicyStream;
  };
}
