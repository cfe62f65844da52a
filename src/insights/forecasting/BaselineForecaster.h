#pragma once

#include <vector>
#include <string>
#include <stdexcept>
#include "number.h"

namespace ledgerinsights
{
namespace forecasting
{

using Money = num::DefaultNumber;

/**
 * @brief Forecasting methods the ensemble can be asked for
 */
enum class ForecastMethod
{
    Auto,
    SSA,
    HoltWinters,
    Combined
};

std::string getForecastMethodString(ForecastMethod method);

/**
 * @throws std::invalid_argument for a name that is not a ForecastMethod
 */
ForecastMethod forecastMethodFromString(const std::string& name);

/**
 * @brief Raised by a forecasting method that cannot work with its input
 *
 * Never leaves the forecasting layer: the ensemble catches it and degrades
 * to the remaining methods.
 */
class ForecastException : public std::runtime_error
{
public:
    ForecastException(const std::string msg)
        : std::runtime_error(msg)
    {}

    ~ForecastException()
    {}
};

/**
 * @brief Next period value together with the coefficient of variation of its input
 */
struct PointForecast
{
    Money value;
    double coefficientOfVariation;
};

/**
 * @brief Regression and smoothing forecasts of a monthly series
 *
 * Inputs are chronological monthly totals, oldest first.
 */
class BaselineForecaster
{
public:
    static constexpr double SmoothingAlpha = 0.3;

    /**
     * @brief OLS fit on x = 0..n-1, evaluated at x = n and clamped at zero
     *
     * Fewer than two points return the first value (zero when empty). A
     * degenerate denominator returns the last value.
     */
    static Money linearRegressionForecast(const std::vector<Money>& data);

    /**
     * @brief Final level of single exponential smoothing seeded at the first value
     */
    static Money exponentialSmoothingForecast(const std::vector<Money>& data,
                                              double alpha = SmoothingAlpha);

    /**
     * @brief Weighted blend of regression and smoothing
     *
     * Regression weight is 0.6 with six or more points, 0.4 otherwise. With
     * fewer than two points the value is the first point (zero when empty)
     * and the coefficient of variation is 0.
     */
    static PointForecast forecastNextPeriod(const std::vector<Money>& data);
};

} // namespace forecasting
} // namespace ledgerinsights
