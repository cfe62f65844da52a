#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <vector>
#include "SsaForecaster.h"
#include "TestUtils.h"

using namespace ledgerinsights::forecasting;
using Catch::Approx;

TEST_CASE ("SSA continues a geometric series", "[SsaForecaster]")
{
  // A geometric series has a rank one trajectory matrix, so the recurrence
  // it implies is exactly x(t) = 1.05 x(t-1).
  std::vector<Money> data;
  for (int t = 0; t < 24; ++t)
    data.push_back (num::fromDouble (100.0 * std::pow (1.05, t)));

  SsaForecaster ssa (6, 12);
  const SsaResult result = ssa.forecast (data, 3);

  REQUIRE (result.rank == 1);
  REQUIRE (result.explainedEnergy == Approx (1.0).margin (1e-9));
  REQUIRE (result.forecastedValues.size() == 3);

  for (int h = 1; h <= 3; ++h)
    {
      const double expected = 100.0 * std::pow (1.05, 23 + h);
      REQUIRE (result.forecastedValues[h - 1] == Approx (expected).epsilon (1e-4));
      REQUIRE (result.lowerBounds[h - 1] <= result.forecastedValues[h - 1]);
      REQUIRE (result.upperBounds[h - 1] >= result.forecastedValues[h - 1]);
    }
}

TEST_CASE ("SSA bounds widen with the horizon", "[SsaForecaster]")
{
  std::vector<Money> data;
  const int noise[] = {7, -4, 3, -8, 5, 0, -2, 6, -5, 4, -3, 1};
  for (int t = 0; t < 36; ++t)
    data.push_back (Money (500 + 10 * t + noise[t % 12]));

  SsaForecaster ssa (6, 12);
  const SsaResult result = ssa.forecast (data, 4);

  const double firstWidth = result.upperBounds[0] - result.lowerBounds[0];
  const double lastWidth = result.upperBounds[3] - result.lowerBounds[3];
  REQUIRE (firstWidth > 0.0);
  REQUIRE (lastWidth > firstWidth);
}

TEST_CASE ("SSA rejects input it cannot decompose", "[SsaForecaster]")
{
  SsaForecaster ssa (6, 12);

  SECTION ("Series shorter than two windows")
    {
      REQUIRE_THROWS_AS (ssa.forecast (std::vector<Money>(11, Money(10)), 1), ForecastException);
    }

  SECTION ("Flat zero series")
    {
      REQUIRE_THROWS_AS (ssa.forecast (std::vector<Money>(24, Money(0)), 1), ForecastException);
    }

  SECTION ("Horizon below one")
    {
      REQUIRE_THROWS_AS (ssa.forecast (std::vector<Money>(24, Money(10)), 0), ForecastException);
    }

  SECTION ("Bad construction parameters")
    {
      REQUIRE_THROWS_AS (SsaForecaster (1, 12), std::invalid_argument);
      REQUIRE_THROWS_AS (SsaForecaster (6, 0), std::invalid_argument);
      REQUIRE_THROWS_AS (SsaForecaster (6, 12, 1.0), std::invalid_argument);
    }
}
