#pragma once

#include <vector>
#include <optional>
#include "BaselineForecaster.h"

namespace ledgerinsights
{
namespace forecasting
{

/**
 * @brief 0..100 confidence in a forecast built from a monthly series
 *
 * Four additive parts:
 *   - data quantity: 1.5 points per point, at most 35
 *   - stability (three or more points): 25/20/15/10/5 for a coefficient of
 *     variation below 0.1/0.3/0.5/0.8/otherwise
 *   - seasonality: 20 x strength when strength > 0.1, otherwise 10 when the
 *     series covers at least a year
 *   - track record: accuracy / 100 x 20 when a positive accuracy is known
 */
class ConfidenceScorer
{
public:
    static constexpr int MinimumPointsForSeasonality = 12;

    static double score(const std::vector<Money>& historicalData,
                        std::optional<double> seasonalStrength,
                        std::optional<double> historicalAccuracy);
};

} // namespace forecasting
} // namespace ledgerinsights
