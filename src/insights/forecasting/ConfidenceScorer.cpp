#include "ConfidenceScorer.h"
#include <algorithm>
#include "StatUtils.h"

namespace ledgerinsights
{
namespace forecasting
{
double ConfidenceScorer::score(const std::vector<Money>& historicalData,
                               std::optional<double> seasonalStrength,
                               std::optional<double> historicalAccuracy)
{
    const std::size_t n = historicalData.size();
    double result = std::min(35.0, static_cast<double>(n) * 1.5);

    if (n >= 3)
    {
        const double cv = ledger::StatUtils<Money>::coefficientOfVariation(historicalData);
        if (cv < 0.1)
            result += 25.0;
        else if (cv < 0.3)
            result += 20.0;
        else if (cv < 0.5)
            result += 15.0;
        else if (cv < 0.8)
            result += 10.0;
        else
            result += 5.0;
    }

    if (seasonalStrength && *seasonalStrength > 0.1)
        result += *seasonalStrength * 20.0;
    else if (n >= static_cast<std::size_t>(MinimumPointsForSeasonality))
        result += 10.0;

    if (historicalAccuracy && *historicalAccuracy > 0.0)
        result += (*historicalAccuracy / 100.0) * 20.0;

    return std::min(100.0, std::max(0.0, result));
}

} // namespace forecasting
} // namespace ledgerinsights
