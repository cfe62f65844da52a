#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <vector>
#include "EnsembleForecaster.h"
#include "OutputUtils.h"
#include "TestUtils.h"

using namespace ledgerinsights;
using namespace ledgerinsights::forecasting;
using Catch::Approx;

namespace
{
  std::vector<Money> seasonalSeries(int months)
  {
    const int shape[] = {90, 80, 100, 110, 120, 140, 150, 145, 120, 110, 100, 130};
    std::vector<Money> data;
    for (int t = 0; t < months; ++t)
      data.push_back (Money (shape[t % 12] * 10 + 5 * t));
    return data;
  }
}

TEST_CASE ("Method selection by amount of history", "[EnsembleForecaster]")
{
  REQUIRE (EnsembleForecaster::selectMethod (23, ForecastMethod::Auto) == ForecastMethod::HoltWinters);
  REQUIRE (EnsembleForecaster::selectMethod (24, ForecastMethod::Auto) == ForecastMethod::Combined);
  REQUIRE (EnsembleForecaster::selectMethod (10, ForecastMethod::SSA) == ForecastMethod::HoltWinters);
  REQUIRE (EnsembleForecaster::selectMethod (30, ForecastMethod::SSA) == ForecastMethod::SSA);
  REQUIRE (EnsembleForecaster::selectMethod (12, ForecastMethod::Combined) == ForecastMethod::HoltWinters);
  REQUIRE (EnsembleForecaster::selectMethod (5, ForecastMethod::HoltWinters) == ForecastMethod::HoltWinters);
}

TEST_CASE ("Method agreement", "[EnsembleForecaster]")
{
  const std::vector<Money> a = {Money(100), Money(200)};
  REQUIRE (EnsembleForecaster::methodAgreement (a, a) == Approx (1.0));
  REQUIRE (EnsembleForecaster::methodAgreement ({Money(100)}, {Money(300)}) == Approx (0.0));
  REQUIRE (EnsembleForecaster::methodAgreement ({}, {}) == 0.0);
  REQUIRE (EnsembleForecaster::methodAgreement ({Money(0)}, {Money(0)}) == 0.0);
}

TEST_CASE ("Ensemble forecast on short input", "[EnsembleForecaster]")
{
  utils::NullStream nullStream;
  EnsembleForecaster ensemble (nullStream);

  SECTION ("A single point cannot be forecast")
    {
      const EnhancedForecastResult result = ensemble.forecast ({Money(250)}, 2);
      REQUIRE (result.methodUsed == "Insufficient Data");
      REQUIRE (result.confidenceScore == 0.0);
      REQUIRE (result.forecastedValues.size() == 2);
      REQUIRE (result.getForecastedValue() == Money(250));
      REQUIRE (result.getConfidenceLevel() == ConfidenceLevel::Low);
    }

  SECTION ("Periods must be positive")
    {
      REQUIRE_THROWS_AS (ensemble.forecast (seasonalSeries (12), 0), std::invalid_argument);
    }

  SECTION ("Less than two short seasons falls back to smoothing")
    {
      const EnhancedForecastResult result = ensemble.forecast (seasonalSeries (3), 1);
      REQUIRE (result.methodUsed == "Simple Exponential Smoothing");
      REQUIRE (result.dataPointsUsed == 3);
      REQUIRE (result.lowerBounds.size() == 1);
      REQUIRE (result.lowerBounds[0] <= result.forecastedValues[0]);
      REQUIRE (result.upperBounds[0] >= result.forecastedValues[0]);
    }
}

TEST_CASE ("Combined forecast", "[EnsembleForecaster]")
{
  std::ostringstream log;
  EnsembleForecaster ensemble (log);

  const EnhancedForecastResult result = ensemble.forecast (seasonalSeries (36), 3);

  REQUIRE (result.methodUsed == "Combined (SSA + Holt-Winters)");
  REQUIRE (result.fallbackReasons.empty());
  REQUIRE (result.periodsForecasted == 3);
  REQUIRE (result.forecastedValues.size() == 3);
  for (std::size_t i = 0; i < 3; ++i)
    {
      REQUIRE (result.lowerBounds[i] <= result.forecastedValues[i]);
      REQUIRE (result.upperBounds[i] >= result.forecastedValues[i]);
    }
  REQUIRE (result.confidenceScore > 0.0);
  REQUIRE (result.confidenceScore <= 100.0);
  REQUIRE (log.str().find ("[EnsembleForecaster]") != std::string::npos);
}

TEST_CASE ("Failing SSA degrades to Holt-Winters", "[EnsembleForecaster]")
{
  utils::NullStream nullStream;
  EnsembleForecaster ensemble (nullStream);

  // An all zero series has nothing for SSA to decompose.
  const std::vector<Money> zeros (24, Money(0));

  SECTION ("Combined keeps Holt-Winters alone and loses ten points")
    {
      const EnhancedForecastResult holtWinters = ensemble.forecast (zeros, 1, ForecastMethod::HoltWinters);
      const EnhancedForecastResult combined = ensemble.forecast (zeros, 1, ForecastMethod::Combined);

      REQUIRE (combined.methodUsed == "Combined (Holt-Winters only)");
      REQUIRE (combined.fallbackReasons.size() == 1);
      REQUIRE (combined.confidenceScore == Approx (holtWinters.confidenceScore - 10.0));
      REQUIRE (combined.getForecastedValue() == Money(0));
    }

  SECTION ("Explicit SSA falls back and records why")
    {
      const EnhancedForecastResult holtWinters = ensemble.forecast (zeros, 2, ForecastMethod::HoltWinters);
      const EnhancedForecastResult result = ensemble.forecast (zeros, 2, ForecastMethod::SSA);
      REQUIRE (result.methodUsed == "Holt-Winters Additive");
      REQUIRE (result.fallbackReasons.size() == 1);
      REQUIRE_FALSE (result.fallbackReasons.front().empty());
      REQUIRE (result.forecastedValues.size() == 2);
      REQUIRE (holtWinters.confidenceScore > 10.0);
      REQUIRE (result.confidenceScore < holtWinters.confidenceScore);
      REQUIRE (result.confidenceScore == Approx (holtWinters.confidenceScore - 10.0));
    }
}

TEST_CASE ("Seasonality detection", "[EnsembleForecaster]")
{
  utils::NullStream nullStream;
  EnsembleForecaster ensemble (nullStream);

  REQUIRE (ensemble.detectSeasonality (seasonalSeries (6)).seasonalStrength == 0.0);

  const SeasonalPattern pattern = ensemble.detectSeasonality (seasonalSeries (36));
  REQUIRE (pattern.seasonLength == 12);
  REQUIRE (pattern.seasonalFactors.size() == 12);
  REQUIRE (pattern.trendDirection == TrendDirection::Increasing);
}
