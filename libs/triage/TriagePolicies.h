// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <string>
#include <vector>
#include "TriagePolicy.h"
#include "ChronicDiseaseClassifier.h"

namespace triagesim
{
  // Pure lottery: one uniform draw per patient, no clinical information.
  class LotteryPolicy : public TriagePolicy
  {
  public:
    PolicyId getId() const override { return PolicyId::Lottery; }
    std::string getName() const override { return "Lottery"; }
    bool consumesRandomness() const override { return true; }

    std::vector<std::size_t> priorityOrder(const Cohort& cohort, TriageRng& rng) const override;
  };

  // Highest severity score first.
  class SickestFirstPolicy : public TriagePolicy
  {
  public:
    PolicyId getId() const override { return PolicyId::SickestFirst; }
    std::string getName() const override { return "Sickest first"; }
    bool consumesRandomness() const override { return false; }

    std::vector<std::size_t> priorityOrder(const Cohort& cohort, TriageRng& rng) const override;
  };

  // Lowest age first.
  class YoungestFirstPolicy : public TriagePolicy
  {
  public:
    PolicyId getId() const override { return PolicyId::YoungestFirst; }
    std::string getName() const override { return "Youngest first"; }
    bool consumesRandomness() const override { return false; }

    std::vector<std::size_t> priorityOrder(const Cohort& cohort, TriageRng& rng) const override;
  };

  /**
   * @brief New York guidelines: three severity tiers, lottery within a tier.
   *
   * Tier 0 (highest priority) SOFA < 8, tier 1 SOFA < 12, tier 2 otherwise
   * (no critical care). The key is the pair (tier, draw) so tier-2 patients
   * only receive the resource once every tier 0/1 patient has it.
   */
  class NewYorkPolicy : public TriagePolicy
  {
  public:
    static constexpr int kNoCriticalCareTier = 2;

    PolicyId getId() const override { return PolicyId::NewYork; }
    std::string getName() const override { return "New York"; }
    bool consumesRandomness() const override { return true; }

    std::vector<std::size_t> priorityOrder(const Cohort& cohort, TriageRng& rng) const override;

    static int severityTier(double severityScore);
  };

  /**
   * @brief Maryland framework.
   *
   * Composite = SOFA tier (1: <9, 2: <12, 3: <15, 4: otherwise) + 3 for a
   * severe chronic disease tier. Ascending sort on (composite, age bucket,
   * draw) with age buckets 1: <50, 2: <70, 3: <85, 4: otherwise.
   */
  class MarylandPolicy : public TriagePolicy
  {
  public:
    PolicyId getId() const override { return PolicyId::Maryland; }
    std::string getName() const override { return "Maryland"; }
    bool consumesRandomness() const override { return true; }

    std::vector<std::size_t> priorityOrder(const Cohort& cohort, TriageRng& rng) const override;

    static int compositeScore(double severityScore, ChronicDiseaseTier chronicTier);
    static int ageBucket(double age);
  };

  /**
   * @brief Pennsylvania framework.
   *
   * Composite = SOFA tier (1: <6, 2: <9, 3: <12, 4: otherwise) + 2 for a
   * major and + 4 for a severe chronic disease tier. Ascending sort on
   * (composite, age bucket, draw) with age buckets 1: <41, 2: <61, 3: <76,
   * 4: otherwise.
   */
  class PennsylvaniaPolicy : public TriagePolicy
  {
  public:
    PolicyId getId() const override { return PolicyId::Pennsylvania; }
    std::string getName() const override { return "Pennsylvania"; }
    bool consumesRandomness() const override { return true; }

    std::vector<std::size_t> priorityOrder(const Cohort& cohort, TriageRng& rng) const override;

    static int compositeScore(double severityScore, ChronicDiseaseTier chronicTier);
    static int ageBucket(double age);
  };
}
