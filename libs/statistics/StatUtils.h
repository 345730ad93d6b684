// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <vector>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <algorithm>
#include <utility>
#include <limits>
#include <stdexcept>

namespace triagesim
{
  /**
   * @brief Descriptive statistics over replicate outcome vectors.
   *
   * All functions accept any arithmetic element type (lives-saved counts are
   * integers, percentages are doubles) and compute in double / long double.
   * Variances and covariances use the unbiased (n - 1) denominator.
   */
  struct StatUtils
  {
    /**
     * @brief Computes the arithmetic mean of the data.
     * @return The mean, or 0 for empty input.
     */
    template <class T>
    static double computeMean(const std::vector<T>& data)
    {
      if (data.empty())
	return 0.0;

      const long double sum = std::accumulate(data.begin(), data.end(), 0.0L,
					      [](long double acc, const T& v) {
						return acc + static_cast<long double>(v);
					      });
      return static_cast<double>(sum / static_cast<long double>(data.size()));
    }

    /**
     * @brief Computes the (unbiased) sample variance given a precomputed mean.
     *        Returns 0 when data.size() < 2.
     */
    template <class T>
    static double computeVariance(const std::vector<T>& data, double mean)
    {
      const std::size_t n = data.size();
      if (n < 2)
	return 0.0;

      long double sq_sum = 0.0L;
      for (const auto& v : data)
	{
	  const long double diff = static_cast<long double>(v) - mean;
	  sq_sum += diff * diff;
	}

      return static_cast<double>(sq_sum / static_cast<long double>(n - 1));
    }

    /**
     * @brief Single-pass, numerically stable mean and (unbiased) variance via Welford.
     *        Returns {0,0} for empty; variance=0 for n<2.
     */
    template <class T>
    static std::pair<double, double> computeMeanAndVariance(const std::vector<T>& data)
    {
      if (data.empty())
	return {0.0, 0.0};

      long double mean = 0.0L;
      long double m2   = 0.0L;
      std::size_t k = 0;

      for (const auto& d : data)
	{
	  const long double x = static_cast<long double>(d);
	  ++k;
	  const long double delta  = x - mean;
	  mean += delta / static_cast<long double>(k);
	  const long double delta2 = x - mean;
	  m2 += delta * delta2;
	}

      if (k < 2)
	return {static_cast<double>(mean), 0.0};

      return {static_cast<double>(mean), static_cast<double>(m2 / static_cast<long double>(k - 1))};
    }

    /**
     * @brief Unbiased sample covariance of two paired sequences.
     *
     * Two-pass: means first, then the cross products. computeCovariance(x, x)
     * is bit-identical to computeVariance(x, computeMean(x)).
     *
     * @throws std::invalid_argument if the sequences differ in length.
     */
    template <class T, class U>
    static double computeCovariance(const std::vector<T>& x, const std::vector<U>& y)
    {
      if (x.size() != y.size())
	throw std::invalid_argument("StatUtils::computeCovariance: paired sequences differ in length");

      const std::size_t n = x.size();
      if (n < 2)
	return 0.0;

      const double mx = computeMean(x);
      const double my = computeMean(y);

      long double cross = 0.0L;
      for (std::size_t i = 0; i < n; ++i)
	{
	  const long double dx = static_cast<long double>(x[i]) - mx;
	  const long double dy = static_cast<long double>(y[i]) - my;
	  cross += dx * dy;
	}

      return static_cast<double>(cross / static_cast<long double>(n - 1));
    }

    /**
     * @brief Mean of the paired differences x[i] - y[i].
     * @throws std::invalid_argument if the sequences differ in length.
     */
    template <class T, class U>
    static double computeMeanDifference(const std::vector<T>& x, const std::vector<U>& y)
    {
      if (x.size() != y.size())
	throw std::invalid_argument("StatUtils::computeMeanDifference: paired sequences differ in length");

      if (x.empty())
	return 0.0;

      long double sum = 0.0L;
      for (std::size_t i = 0; i < x.size(); ++i)
	sum += static_cast<long double>(x[i]) - static_cast<long double>(y[i]);

      return static_cast<double>(sum / static_cast<long double>(x.size()));
    }

    // Hyndman–Fan type-7 quantile (linear interpolation between order statistics).
    template <class T>
    static double quantileType7(const std::vector<T>& data, double p)
    {
      if (data.empty())
	throw std::invalid_argument("StatUtils::quantileType7: empty input");
      if (!(p >= 0.0 && p <= 1.0))
	throw std::invalid_argument("StatUtils::quantileType7: p must be in [0,1]");

      std::vector<double> sorted;
      sorted.reserve(data.size());
      for (const auto& v : data)
	sorted.push_back(static_cast<double>(v));
      std::sort(sorted.begin(), sorted.end());

      const double h = (static_cast<double>(sorted.size()) - 1.0) * p;
      const std::size_t lo = static_cast<std::size_t>(std::floor(h));
      const std::size_t hi = std::min(lo + 1, sorted.size() - 1);
      const double frac = h - static_cast<double>(lo);

      return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
    }
  };
}
