#pragma once
#include <vector>
#include <cmath>
#include <optional>
#include <type_traits>
#include <algorithm>
#include <cstddef>
#include "number.h"

namespace ledger
{
  /**
   * @brief Location and spread of a sample, both as population statistics.
   */
  struct SeriesStatistics
  {
    double mean;
    double standardDeviation;
  };

  /**
   * @brief How many standard deviations a value lies from a mean.
   * @return Empty when the standard deviation is zero (or not finite), since a flat
   *         series carries no information about what an outlier looks like.
   */
  inline std::optional<double> zScore(double value, double mean, double standardDeviation)
  {
    if (!(standardDeviation > 0.0) || !std::isfinite(standardDeviation) || !std::isfinite(value))
      return std::nullopt;

    return (value - mean) / standardDeviation;
  }

  inline std::optional<double> zScore(double value, const SeriesStatistics& stats)
  {
    return zScore(value, stats.mean, stats.standardDeviation);
  }

  /**
   * @class StatUtils
   * @brief Descriptive statistics over a series of amounts.
   * @tparam Decimal Either `num::DefaultNumber` for money or `double` for derived series.
   *
   * Sums and means stay in the Decimal type so that totals of money are exact.
   * Dispersion measures are returned as double. Every function returns a
   * finite value for degenerate input (empty series, zero mean).
   */
  template<class Decimal>
  struct StatUtils
  {
  public:
    static inline double toDouble(const Decimal& value)
    {
      if constexpr (std::is_floating_point_v<Decimal>)
	return static_cast<double>(value);
      else
	return num::to_double(value);
    }

    static inline Decimal absValue(const Decimal& value)
    {
      if constexpr (std::is_floating_point_v<Decimal>)
	return std::abs(value);
      else
	return value.abs();
    }

    static inline Decimal computeSum(const std::vector<Decimal>& data)
    {
      Decimal sum(0.0);
      for (const auto& value : data)
	sum = sum + value;
      return sum;
    }

    /**
     * @brief Arithmetic mean; zero for an empty series.
     */
    static inline Decimal computeMean(const std::vector<Decimal>& data)
    {
      if (data.empty())
	return Decimal(0.0);

      return computeSum(data) / Decimal(static_cast<double>(data.size()));
    }

    /**
     * @brief Population variance (divides by n); zero for an empty series.
     */
    static inline double computeVariance(const std::vector<Decimal>& data)
    {
      if (data.empty())
	return 0.0;

      const double mean = toDouble(computeMean(data));
      double sumSquares = 0.0;
      for (const auto& value : data)
	{
	  const double diff = toDouble(value) - mean;
	  sumSquares += diff * diff;
	}

      return sumSquares / static_cast<double>(data.size());
    }

    /**
     * @brief Unbiased sample variance (divides by n - 1); zero below two values.
     */
    static inline double computeSampleVariance(const std::vector<Decimal>& data)
    {
      if (data.size() < 2)
	return 0.0;

      return computeVariance(data) * static_cast<double>(data.size())
	/ static_cast<double>(data.size() - 1);
    }

    static inline double computeStdDev(const std::vector<Decimal>& data)
    {
      return std::sqrt(computeVariance(data));
    }

    static inline double computeSampleStdDev(const std::vector<Decimal>& data)
    {
      return std::sqrt(computeSampleVariance(data));
    }

    static inline SeriesStatistics computeStatistics(const std::vector<Decimal>& data)
    {
      if (data.empty())
	return SeriesStatistics{0.0, 0.0};

      return SeriesStatistics{toDouble(computeMean(data)), computeStdDev(data)};
    }

    /**
     * @brief Population standard deviation over mean.
     *
     * Fewer than two values give 0. A zero mean gives 1, which the confidence
     * bands treat as maximally unstable.
     */
    static inline double coefficientOfVariation(const std::vector<Decimal>& data)
    {
      if (data.size() < 2)
	return 0.0;

      const double mean = toDouble(computeMean(data));
      if (mean == 0.0)
	return 1.0;

      return computeStdDev(data) / mean;
    }

    /**
     * @brief Percent change from oldValue to newValue.
     *
     * `(new - old) / |old| * 100`. When old is zero the change is reported
     * as 100 if new is positive and 0 otherwise.
     */
    static inline Decimal percentChange(const Decimal& oldValue, const Decimal& newValue)
    {
      const Decimal zero(0.0);
      const Decimal oneHundred(100.0);

      if (oldValue == zero)
	return (newValue > zero) ? oneHundred : zero;

      return (newValue - oldValue) / absValue(oldValue) * oneHundred;
    }
  };

  inline double percentChange(double oldValue, double newValue)
  {
    return StatUtils<double>::percentChange(oldValue, newValue);
  }

  /**
   * @brief Percent change between two counts (transactions, customers).
   */
  inline double countPercentChange(std::size_t oldCount, std::size_t newCount)
  {
    return StatUtils<double>::percentChange(static_cast<double>(oldCount),
					    static_cast<double>(newCount));
  }
}
