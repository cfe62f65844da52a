#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include "BaselineForecaster.h"
#include "TestUtils.h"

using namespace ledgerinsights::forecasting;
using Catch::Approx;

namespace
{
  std::vector<Money> series(std::initializer_list<int> values)
  {
    std::vector<Money> result;
    for (int v : values)
      result.push_back(Money(v));
    return result;
  }
}

TEST_CASE ("Linear regression forecast", "[BaselineForecaster]")
{
  SECTION ("A straight line continues exactly")
    {
      REQUIRE (BaselineForecaster::linearRegressionForecast (series ({100, 200, 300, 400})) == Money(500));
    }

  SECTION ("Short series return the first value")
    {
      REQUIRE (BaselineForecaster::linearRegressionForecast (std::vector<Money>()) == Money(0));
      REQUIRE (BaselineForecaster::linearRegressionForecast (series ({42})) == Money(42));
    }

  SECTION ("A falling line is clamped at zero")
    {
      REQUIRE (BaselineForecaster::linearRegressionForecast (series ({400, 300, 200, 100})) == Money(0));
    }

  SECTION ("Repeated runs give the same answer")
    {
      const std::vector<Money> data = series ({120, 95, 143, 160, 151, 170});
      REQUIRE (BaselineForecaster::linearRegressionForecast (data) ==
	       BaselineForecaster::linearRegressionForecast (data));
    }
}

TEST_CASE ("Exponential smoothing forecast", "[BaselineForecaster]")
{
  REQUIRE (BaselineForecaster::exponentialSmoothingForecast (series ({100, 200})) == Money(130));
  REQUIRE (BaselineForecaster::exponentialSmoothingForecast (series ({75})) == Money(75));
  REQUIRE (BaselineForecaster::exponentialSmoothingForecast (std::vector<Money>()) == Money(0));
}

TEST_CASE ("Blended next period forecast", "[BaselineForecaster]")
{
  SECTION ("Fewer than six points weight regression at 0.4")
    {
      // regression 500, smoothing 246.7
      const PointForecast forecast = BaselineForecaster::forecastNextPeriod (series ({100, 200, 300, 400}));
      REQUIRE (num::to_double (forecast.value) == Approx (348.02).margin (1e-6));
      REQUIRE (forecast.coefficientOfVariation == Approx (0.4472136).epsilon (1e-6));
    }

  SECTION ("Six or more points weight regression at 0.6")
    {
      const PointForecast forecast = BaselineForecaster::forecastNextPeriod (series ({100, 100, 100, 100, 100, 100}));
      REQUIRE (forecast.value == Money(100));
      REQUIRE (forecast.coefficientOfVariation == 0.0);
    }

  SECTION ("One point carries zero confidence")
    {
      const PointForecast forecast = BaselineForecaster::forecastNextPeriod (series ({250}));
      REQUIRE (forecast.value == Money(250));
      REQUIRE (forecast.coefficientOfVariation == 0.0);
    }

  SECTION ("Collapsing revenue never forecasts below zero")
    {
      const PointForecast forecast = BaselineForecaster::forecastNextPeriod (series ({900, 600, 300, 10, 0, 0, 0}));
      REQUIRE (forecast.value >= Money(0));
    }
}

TEST_CASE ("Forecast method names round trip", "[BaselineForecaster]")
{
  for (ForecastMethod method : {ForecastMethod::Auto, ForecastMethod::SSA,
				ForecastMethod::HoltWinters, ForecastMethod::Combined})
    REQUIRE (forecastMethodFromString (getForecastMethodString (method)) == method);

  REQUIRE_THROWS_AS (forecastMethodFromString ("Neural"), std::invalid_argument);
}
