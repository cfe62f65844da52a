#include "HoltWinters.h"
#include <cmath>
#include <algorithm>
#include <stdexcept>
#include "StatUtils.h"
#include "BoostDateHelper.h"

namespace ledgerinsights
{
namespace forecasting
{
namespace
{
const double MinimumMagnitude = 0.0001;

std::vector<double> toDoubles(const std::vector<Money>& data)
{
    std::vector<double> values;
    values.reserve(data.size());
    for (const auto& value : data)
        values.push_back(num::to_double(value));
    return values;
}

double meanOf(const std::vector<double>& values, std::size_t first, std::size_t count)
{
    double sum = 0.0;
    for (std::size_t i = first; i < first + count; ++i)
        sum += values[i];
    return sum / static_cast<double>(count);
}

double guardMagnitude(double value)
{
    return std::abs(value) < MinimumMagnitude ? MinimumMagnitude : value;
}

void checkArguments(int seasonLength, int periodsToForecast)
{
    if (seasonLength < 2)
        throw std::invalid_argument("HoltWinters: season length must be at least 2");
    if (periodsToForecast < 1)
        throw std::invalid_argument("HoltWinters: periods to forecast must be at least 1");
}

std::vector<std::string> phaseLabels(int seasonLength, int startMonth, std::string& cycleName)
{
    std::vector<std::string> labels;
    switch (seasonLength)
    {
        case 12:
            cycleName = "yearly";
            for (int p = 0; p < 12; ++p)
                labels.push_back(ledger::month_name(((startMonth - 1 + p) % 12 + 12) % 12 + 1));
            break;
        case 6:
            cycleName = "bi-monthly";
            labels = {"Jan-Feb", "Mar-Apr", "May-Jun", "Jul-Aug", "Sep-Oct", "Nov-Dec"};
            break;
        case 4:
            cycleName = "quarterly";
            labels = {"Q1 (Jan-Mar)", "Q2 (Apr-Jun)", "Q3 (Jul-Sep)", "Q4 (Oct-Dec)"};
            break;
        case 3:
            cycleName = "3-month";
            labels = {"beginning", "middle", "end"};
            break;
        case 2:
            cycleName = "bi-monthly";
            labels = {"first month", "second month"};
            break;
        default:
            cycleName = std::to_string(seasonLength) + "-period";
            for (int p = 0; p < seasonLength; ++p)
                labels.push_back("period " + std::to_string(p + 1));
            break;
    }
    return labels;
}
}

TrendDirection HoltWinters::trendDirectionFor(double trend)
{
    if (trend > 0.01)
        return TrendDirection::Increasing;
    if (trend < -0.01)
        return TrendDirection::Decreasing;
    return TrendDirection::Stable;
}

// Seasonal estimates are kept per time index; the latest estimate of
// phase p lives in the last season of the series.
std::vector<double> HoltWinters::factorsByPhase(const std::vector<double>& smoothedSeasonals,
                                                std::size_t n,
                                                int seasonLength)
{
    const std::size_t length = static_cast<std::size_t>(seasonLength);
    const std::size_t lastSeasonStart = n - length;

    std::vector<double> factors(length, 0.0);
    for (std::size_t p = 0; p < length; ++p)
    {
        const std::size_t offset = (p + length - (lastSeasonStart % length)) % length;
        factors[p] = smoothedSeasonals[lastSeasonStart + offset];
    }
    return factors;
}

HoltWintersResult HoltWinters::fallbackForecast(const std::vector<Money>& data,
                                                int seasonLength,
                                                int periodsToForecast)
{
    HoltWintersResult result;
    result.seasonalPattern.seasonLength = seasonLength;
    result.seasonalPattern.description = "Insufficient data for seasonal analysis.";

    if (data.empty())
    {
        result.method = "No Data";
        result.forecastedValues.assign(static_cast<std::size_t>(periodsToForecast), Money(0));
        return result;
    }

    const std::vector<double> values = toDoubles(data);
    double level = values.front();
    for (std::size_t i = 1; i < values.size(); ++i)
        level = Alpha * values[i] + (1.0 - Alpha) * level;

    double trend = 0.0;
    if (values.size() >= 2)
        trend = (values.back() - values.front()) / static_cast<double>(values.size() - 1);

    for (int h = 1; h <= periodsToForecast; ++h)
        result.forecastedValues.push_back(num::fromDouble(std::max(0.0, level + h * trend)));

    result.finalLevel = level;
    result.finalTrend = trend;
    result.method = "Simple Exponential Smoothing";
    result.seasonalPattern.trendSlope = trend;
    result.seasonalPattern.trendDirection = trendDirectionFor(trend);
    return result;
}

HoltWintersResult HoltWinters::forecastAdditive(const std::vector<Money>& data,
                                                int seasonLength,
                                                int periodsToForecast,
                                                int startMonth)
{
    checkArguments(seasonLength, periodsToForecast);

    const std::size_t n = data.size();
    const std::size_t length = static_cast<std::size_t>(seasonLength);
    if (n < 2 * length)
        return fallbackForecast(data, seasonLength, periodsToForecast);

    const std::vector<double> values = toDoubles(data);

    double level = meanOf(values, 0, length);
    double trend = (meanOf(values, length, length) - level) / static_cast<double>(length);

    std::vector<double> seasonals(n, 0.0);
    for (std::size_t i = 0; i < length; ++i)
        seasonals[i] = values[i] - level;

    for (std::size_t t = length; t < n; ++t)
    {
        const double previousSeasonal = seasonals[t - length];
        const double previousLevel = level;

        level = Alpha * (values[t] - previousSeasonal) + (1.0 - Alpha) * (level + trend);
        trend = Beta * (level - previousLevel) + (1.0 - Beta) * trend;
        seasonals[t] = Gamma * (values[t] - level) + (1.0 - Gamma) * previousSeasonal;
    }

    HoltWintersResult result;
    for (int h = 1; h <= periodsToForecast; ++h)
    {
        const std::size_t seasonIndex = n - length + static_cast<std::size_t>(h - 1) % length;
        const double forecast = level + h * trend + seasonals[seasonIndex];
        result.forecastedValues.push_back(num::fromDouble(std::max(0.0, forecast)));
    }

    const std::vector<double> factors = factorsByPhase(seasonals, n, seasonLength);

    double meanSquare = 0.0;
    for (double factor : factors)
        meanSquare += factor * factor;
    meanSquare /= static_cast<double>(factors.size());

    const double dataVariance = ledger::StatUtils<double>::computeSampleVariance(values);
    const double strength = dataVariance > 0.0 ? std::min(1.0, meanSquare / dataVariance) : 0.0;

    result.finalLevel = level;
    result.finalTrend = trend;
    result.method = "Holt-Winters Additive";

    SeasonalPattern& pattern = result.seasonalPattern;
    pattern.seasonLength = seasonLength;
    pattern.seasonalFactors = factors;
    pattern.seasonalStrength = strength;
    pattern.trendSlope = trend;
    pattern.trendDirection = trendDirectionFor(trend);
    pattern.description = describeSeasonality(factors, seasonLength, strength, startMonth);
    return result;
}

HoltWintersResult HoltWinters::forecastMultiplicative(const std::vector<Money>& data,
                                                      int seasonLength,
                                                      int periodsToForecast,
                                                      int startMonth)
{
    checkArguments(seasonLength, periodsToForecast);

    for (const auto& value : data)
        if (value <= Money(0))
            return forecastAdditive(data, seasonLength, periodsToForecast, startMonth);

    const std::size_t n = data.size();
    const std::size_t length = static_cast<std::size_t>(seasonLength);
    if (n < 2 * length)
        return fallbackForecast(data, seasonLength, periodsToForecast);

    const std::vector<double> values = toDoubles(data);

    double level = meanOf(values, 0, length);
    double trend = (meanOf(values, length, length) - level) / static_cast<double>(length);
    if (level <= 0.0)
        level = MinimumMagnitude;

    std::vector<double> seasonals(n, 0.0);
    for (std::size_t i = 0; i < length; ++i)
    {
        seasonals[i] = values[i] / level;
        if (seasonals[i] <= 0.0)
            seasonals[i] = MinimumMagnitude;
    }

    for (std::size_t t = length; t < n; ++t)
    {
        const double previousSeasonal = guardMagnitude(seasonals[t - length]);
        const double previousLevel = level;

        level = Alpha * (values[t] / previousSeasonal) + (1.0 - Alpha) * (level + trend);
        trend = Beta * (level - previousLevel) + (1.0 - Beta) * trend;
        seasonals[t] = Gamma * (values[t] / guardMagnitude(level)) + (1.0 - Gamma) * previousSeasonal;
    }

    HoltWintersResult result;
    for (int h = 1; h <= periodsToForecast; ++h)
    {
        const std::size_t seasonIndex = n - length + static_cast<std::size_t>(h - 1) % length;
        const double forecast = (level + h * trend) * seasonals[seasonIndex];
        result.forecastedValues.push_back(num::fromDouble(std::max(0.0, forecast)));
    }

    const std::vector<double> factors = factorsByPhase(seasonals, n, seasonLength);

    double meanDeviation = 0.0;
    for (double factor : factors)
        meanDeviation += std::abs(factor - 1.0);
    meanDeviation /= static_cast<double>(factors.size());

    const double strength = std::min(1.0, meanDeviation * 5.0);

    result.finalLevel = level;
    result.finalTrend = trend;
    result.method = "Holt-Winters Multiplicative";

    SeasonalPattern& pattern = result.seasonalPattern;
    pattern.seasonLength = seasonLength;
    pattern.seasonalFactors = factors;
    pattern.seasonalStrength = strength;
    pattern.trendSlope = trend;
    pattern.trendDirection = trendDirectionFor(trend);
    pattern.description = describeSeasonality(factors, seasonLength, strength, startMonth);
    return result;
}

HoltWintersResult HoltWinters::autoForecast(const std::vector<Money>& data,
                                            int seasonLength,
                                            int periodsToForecast,
                                            int startMonth)
{
    checkArguments(seasonLength, periodsToForecast);

    const std::size_t length = static_cast<std::size_t>(seasonLength);
    if (data.size() < length)
        return fallbackForecast(data, seasonLength, periodsToForecast);

    for (const auto& value : data)
        if (value <= Money(0))
            return forecastAdditive(data, seasonLength, periodsToForecast, startMonth);

    const std::vector<double> values = toDoubles(data);

    std::vector<double> phaseVariation;
    for (std::size_t p = 0; p < length; ++p)
    {
        std::vector<double> phaseValues;
        for (std::size_t i = p; i < values.size(); i += length)
            phaseValues.push_back(values[i]);

        const double phaseMean = ledger::StatUtils<double>::computeMean(phaseValues);
        if (phaseMean > 0.0)
            phaseVariation.push_back(ledger::StatUtils<double>::computeSampleStdDev(phaseValues)
                                     / phaseMean);
    }

    const double variationSpread = ledger::StatUtils<double>::computeSampleStdDev(phaseVariation);
    if (variationSpread < 0.3)
        return forecastMultiplicative(data, seasonLength, periodsToForecast, startMonth);

    return forecastAdditive(data, seasonLength, periodsToForecast, startMonth);
}

int HoltWinters::detectSeasonLength(const std::vector<Money>& data,
                                    const std::vector<int>& candidateLengths)
{
    const std::vector<double> values = toDoubles(data);
    const std::size_t n = values.size();

    std::vector<int> candidates(candidateLengths);
    std::sort(candidates.begin(), candidates.end());
    candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());

    int bestLength = 0;
    double bestVariance = 0.0;

    for (int candidate : candidates)
    {
        if (candidate < 2)
            continue;

        const std::size_t length = static_cast<std::size_t>(candidate);
        if (n < 2 * length)
            continue;

        // Remove each phase's mean from both the values and the time index,
        // then fit one slope shared by every phase.
        std::vector<double> demeanedValues(n, 0.0);
        std::vector<double> demeanedTimes(n, 0.0);
        for (std::size_t p = 0; p < length; ++p)
        {
            double valueSum = 0.0, timeSum = 0.0;
            std::size_t count = 0;
            for (std::size_t t = p; t < n; t += length)
            {
                valueSum += values[t];
                timeSum += static_cast<double>(t);
                ++count;
            }

            const double valueMean = valueSum / static_cast<double>(count);
            const double timeMean = timeSum / static_cast<double>(count);
            for (std::size_t t = p; t < n; t += length)
            {
                demeanedValues[t] = values[t] - valueMean;
                demeanedTimes[t] = static_cast<double>(t) - timeMean;
            }
        }

        double crossProduct = 0.0, timeSquares = 0.0;
        for (std::size_t t = 0; t < n; ++t)
        {
            crossProduct += demeanedTimes[t] * demeanedValues[t];
            timeSquares += demeanedTimes[t] * demeanedTimes[t];
        }

        const double slope = timeSquares > 0.0 ? crossProduct / timeSquares : 0.0;

        double residualSquares = 0.0;
        for (std::size_t t = 0; t < n; ++t)
        {
            const double residual = demeanedValues[t] - slope * demeanedTimes[t];
            residualSquares += residual * residual;
        }

        const double degreesOfFreedom = static_cast<double>(n - length - 1);
        const double residualVariance = residualSquares / degreesOfFreedom;

        if (bestLength == 0 ||
            residualVariance < bestVariance - 1e-9 * std::max(bestVariance, 1.0))
        {
            bestLength = candidate;
            bestVariance = residualVariance;
        }
    }

    return bestLength;
}

std::string HoltWinters::describeSeasonality(const std::vector<double>& seasonalFactors,
                                             int seasonLength,
                                             double strength,
                                             int startMonth)
{
    if (strength < 0.1 || seasonalFactors.empty())
        return "No significant seasonal pattern detected.";

    std::string cycleName;
    const std::vector<std::string> labels = phaseLabels(seasonLength, startMonth, cycleName);

    const auto peak = std::max_element(seasonalFactors.begin(), seasonalFactors.end());
    const auto trough = std::min_element(seasonalFactors.begin(), seasonalFactors.end());
    const std::size_t peakIndex = static_cast<std::size_t>(peak - seasonalFactors.begin());
    const std::size_t troughIndex = static_cast<std::size_t>(trough - seasonalFactors.begin());

    const std::string peakLabel = peakIndex < labels.size() ? labels[peakIndex]
      : "period " + std::to_string(peakIndex + 1);
    const std::string troughLabel = troughIndex < labels.size() ? labels[troughIndex]
      : "period " + std::to_string(troughIndex + 1);

    std::string strengthWord;
    if (strength > 0.5)
        strengthWord = "strong";
    else if (strength > 0.25)
        strengthWord = "moderate";
    else
        strengthWord = "mild";

    return "A " + strengthWord + " " + cycleName + " pattern detected. Peak at " + peakLabel
      + " of cycle, lowest at " + troughLabel + ".";
}

} // namespace forecasting
} // namespace ledgerinsights
