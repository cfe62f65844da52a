#pragma once

#include <vector>
#include <string>
#include "InsightTypes.h"

namespace ledgerinsights
{
namespace forecasting
{

/**
 * @brief Output of a Holt-Winters run (or of its smoothing fallback)
 */
struct HoltWintersResult
{
    std::vector<Money> forecastedValues;
    SeasonalPattern seasonalPattern;
    double finalLevel = 0.0;
    double finalTrend = 0.0;
    std::string method;

    Money getForecastedValue() const
    {
        return forecastedValues.empty() ? Money(0) : forecastedValues.front();
    }
};

/**
 * @brief Triple exponential smoothing (level, trend, season) of a monthly series
 *
 * Smoothing constants are fixed: alpha 0.3 for the level, beta 0.1 for the
 * trend and gamma 0.2 for the seasonal component. Components are
 * initialised from the first two seasons, so a seasonal fit needs at least
 * 2 * seasonLength points; shorter series fall back to single exponential
 * smoothing plus the average first-to-last drift.
 *
 * startMonth is the calendar month (1..12) of the first point. It is only
 * used to name the peak and trough months of a yearly pattern.
 *
 * All forecasts are clamped at zero.
 */
class HoltWinters
{
public:
    static constexpr double Alpha = 0.3;
    static constexpr double Beta = 0.1;
    static constexpr double Gamma = 0.2;

    static HoltWintersResult forecastAdditive(const std::vector<Money>& data,
                                              int seasonLength = 12,
                                              int periodsToForecast = 1,
                                              int startMonth = 1);

    /**
     * @brief Multiplicative seasons; any value <= 0 switches to the additive method
     */
    static HoltWintersResult forecastMultiplicative(const std::vector<Money>& data,
                                                    int seasonLength = 12,
                                                    int periodsToForecast = 1,
                                                    int startMonth = 1);

    /**
     * @brief Choose between the additive and multiplicative methods
     *
     * Series shorter than one season use the fallback. Any value <= 0 forces
     * the additive method. Otherwise the per-phase coefficients of variation
     * are compared: when they are nearly constant (sample std below 0.3) the
     * seasonal swing scales with the level and the multiplicative method is
     * used.
     */
    static HoltWintersResult autoForecast(const std::vector<Money>& data,
                                          int seasonLength = 12,
                                          int periodsToForecast = 1,
                                          int startMonth = 1);

    /**
     * @brief Pick the season length that best explains the series
     *
     * A candidate is eligible when the series covers at least two full
     * cycles. For each eligible length the series is regressed on a common
     * linear trend plus one level per phase; the candidate with the lowest
     * residual variance SSR / (n - length - 1) wins, ties going to the shorter
     * length.
     *
     * @return The chosen length, or 0 when no candidate is eligible.
     */
    static int detectSeasonLength(const std::vector<Money>& data,
                                  const std::vector<int>& candidateLengths);

    static std::string describeSeasonality(const std::vector<double>& seasonalFactors,
                                           int seasonLength,
                                           double strength,
                                           int startMonth = 1);

private:
    static HoltWintersResult fallbackForecast(const std::vector<Money>& data,
                                              int seasonLength,
                                              int periodsToForecast);

    static TrendDirection trendDirectionFor(double trend);

    static std::vector<double> factorsByPhase(const std::vector<double>& smoothedSeasonals,
                                              std::size_t n,
                                              int seasonLength);
};

} // namespace forecasting
} // namespace ledgerinsights
