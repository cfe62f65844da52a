#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "BaselineForecaster.h"
#include "HoltWinters.h"
#include "InsightTypes.h"

namespace ledgerinsights
{
namespace forecasting
{

/**
 * @brief Multi-period forecast with bounds, produced by the ensemble
 *
 * fallbackReasons lists every sub-method that failed on the way to this
 * result, in the order the failures happened.
 */
struct EnhancedForecastResult
{
    std::vector<Money> forecastedValues;
    std::vector<Money> lowerBounds;
    std::vector<Money> upperBounds;
    SeasonalPattern seasonalPattern;
    double confidenceScore = 0.0;
    std::string methodUsed;
    int dataPointsUsed = 0;
    int periodsForecasted = 0;
    std::vector<std::string> fallbackReasons;

    Money getForecastedValue() const
    {
        return forecastedValues.empty() ? Money(0) : forecastedValues.front();
    }

    ConfidenceLevel getConfidenceLevel() const
    {
        return confidenceLevelFromScore(confidenceScore);
    }
};

/**
 * @class EnsembleForecaster
 * @brief Chooses between SSA, Holt-Winters and their weighted combination
 *
 * Method selection by number of monthly points:
 *   - Auto: Combined from 24 points, Holt-Winters below
 *   - SSA and Combined need 24 points, Holt-Winters 12; a preferred method
 *     without enough data becomes Holt-Winters (which falls back to simple
 *     smoothing on its own when the series is short)
 *
 * No ForecastException leaves this class. A failing SSA run degrades to
 * Holt-Winters and the reason is kept on the result and written to the
 * diagnostics stream.
 */
class EnsembleForecaster
{
public:
    static constexpr int MinimumPointsForSsa = 24;
    static constexpr int MinimumPointsForHoltWinters = 12;
    static constexpr int DefaultWindowLength = 6;
    static constexpr int DefaultSeriesLength = 12;

    explicit EnsembleForecaster(std::ostream& os);

    /**
     * @param monthlyData chronological monthly totals, oldest first
     * @param startMonth calendar month (1..12) of the first point
     * @throws std::invalid_argument when periodsToForecast < 1
     */
    EnhancedForecastResult forecast(const std::vector<Money>& monthlyData,
                                    int periodsToForecast = 1,
                                    ForecastMethod preferredMethod = ForecastMethod::Auto,
                                    int startMonth = 1) const;

    /**
     * @brief Seasonal pattern of a monthly series
     *
     * Fewer than 12 points report zero strength. Otherwise the season
     * length is detected among 12, 6, 4 and 3 months and the pattern comes
     * from the automatically chosen Holt-Winters variant.
     */
    SeasonalPattern detectSeasonality(const std::vector<Money>& monthlyData,
                                      int startMonth = 1) const;

    static ForecastMethod selectMethod(std::size_t dataPoints, ForecastMethod preferred);

    /**
     * @brief 1 minus the mean relative difference of two forecasts, floored at 0
     *
     * Periods whose average is not positive are skipped; with none left the
     * agreement is 0.
     */
    static double methodAgreement(const std::vector<Money>& first,
                                  const std::vector<Money>& second);

private:
    EnhancedForecastResult ssaForecast(const std::vector<Money>& data,
                                       int periodsToForecast,
                                       int startMonth) const;

    EnhancedForecastResult holtWintersForecast(const std::vector<Money>& data,
                                               int periodsToForecast,
                                               int startMonth) const;

    EnhancedForecastResult combinedForecast(const std::vector<Money>& data,
                                            int periodsToForecast,
                                            int startMonth) const;

    std::ostream& mOutputStream;
};

} // namespace forecasting
} // namespace ledgerinsights
