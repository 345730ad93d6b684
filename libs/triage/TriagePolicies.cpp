// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <tuple>
#include "TriagePolicies.h"

namespace triagesim
{
  std::vector<std::size_t> LotteryPolicy::priorityOrder(const Cohort& cohort, TriageRng& rng) const
  {
    return stableOrderByKey(drawLottery(cohort.size(), rng));
  }

  std::vector<std::size_t> SickestFirstPolicy::priorityOrder(const Cohort& cohort, TriageRng&) const
  {
    std::vector<double> keys;
    keys.reserve(cohort.size());
    for (std::size_t i = 0; i < cohort.size(); ++i)
      keys.push_back(-cohort.getPatient(i).getSeverityScore());

    return stableOrderByKey(keys);
  }

  std::vector<std::size_t> YoungestFirstPolicy::priorityOrder(const Cohort& cohort, TriageRng&) const
  {
    std::vector<double> keys;
    keys.reserve(cohort.size());
    for (std::size_t i = 0; i < cohort.size(); ++i)
      keys.push_back(cohort.getPatient(i).getAge());

    return stableOrderByKey(keys);
  }

  //
  // New York
  //

  int NewYorkPolicy::severityTier(double severityScore)
  {
    if (severityScore < 8.0)
      return 0;
    if (severityScore < 12.0)
      return 1;
    return kNoCriticalCareTier;
  }

  std::vector<std::size_t> NewYorkPolicy::priorityOrder(const Cohort& cohort, TriageRng& rng) const
  {
    const std::vector<double> draws = drawLottery(cohort.size(), rng);

    std::vector<std::tuple<int, double>> keys;
    keys.reserve(cohort.size());
    for (std::size_t i = 0; i < cohort.size(); ++i)
      keys.emplace_back(severityTier(cohort.getPatient(i).getSeverityScore()), draws[i]);

    return stableOrderByKey(keys);
  }

  //
  // Maryland
  //

  int MarylandPolicy::compositeScore(double severityScore, ChronicDiseaseTier chronicTier)
  {
    int score;
    if (severityScore < 9.0)
      score = 1;
    else if (severityScore < 12.0)
      score = 2;
    else if (severityScore < 15.0)
      score = 3;
    else
      score = 4;

    if (chronicTier == ChronicDiseaseTier::Severe)
      score += 3;

    return score;
  }

  int MarylandPolicy::ageBucket(double age)
  {
    if (age < 50.0)
      return 1;
    if (age < 70.0)
      return 2;
    if (age < 85.0)
      return 3;
    return 4;
  }

  std::vector<std::size_t> MarylandPolicy::priorityOrder(const Cohort& cohort, TriageRng& rng) const
  {
    const std::vector<double> draws = drawLottery(cohort.size(), rng);

    std::vector<std::tuple<int, int, double>> keys;
    keys.reserve(cohort.size());
    for (std::size_t i = 0; i < cohort.size(); ++i)
      {
	const Patient& patient = cohort.getPatient(i);
	keys.emplace_back(compositeScore(patient.getSeverityScore(), cohort.getChronicTier(i)),
			  ageBucket(patient.getAge()),
			  draws[i]);
      }

    return stableOrderByKey(keys);
  }

  //
  // Pennsylvania
  //

  int PennsylvaniaPolicy::compositeScore(double severityScore, ChronicDiseaseTier chronicTier)
  {
    int score;
    if (severityScore < 6.0)
      score = 1;
    else if (severityScore < 9.0)
      score = 2;
    else if (severityScore < 12.0)
      score = 3;
    else
      score = 4;

    if (chronicTier == ChronicDiseaseTier::Major)
      score += 2;
    else if (chronicTier == ChronicDiseaseTier::Severe)
      score += 4;

    return score;
  }

  int PennsylvaniaPolicy::ageBucket(double age)
  {
    if (age < 41.0)
      return 1;
    if (age < 61.0)
      return 2;
    if (age < 76.0)
      return 3;
    return 4;
  }

  std::vector<std::size_t> PennsylvaniaPolicy::priorityOrder(const Cohort& cohort, TriageRng& rng) const
  {
    const std::vector<double> draws = drawLottery(cohort.size(), rng);

    std::vector<std::tuple<int, int, double>> keys;
    keys.reserve(cohort.size());
    for (std::size_t i = 0; i < cohort.size(); ++i)
      {
	const Patient& patient = cohort.getPatient(i);
	keys.emplace_back(compositeScore(patient.getSeverityScore(), cohort.getChronicTier(i)),
			  ageBucket(patient.getAge()),
			  draws[i]);
      }

    return stableOrderByKey(keys);
  }
}
