#include "EnsembleForecaster.h"
#include <cmath>
#include <algorithm>
#include <stdexcept>
#include "ConfidenceScorer.h"
#include "SsaForecaster.h"
#include "DecimalConstants.h"

namespace ledgerinsights
{
namespace forecasting
{
namespace
{
const std::vector<int> CandidateSeasonLengths = {12, 6, 4, 3};

Money clampAtZero(double value)
{
    return num::fromDouble(std::max(0.0, value));
}
}

EnsembleForecaster::EnsembleForecaster(std::ostream& os)
  : mOutputStream(os)
{}

ForecastMethod EnsembleForecaster::selectMethod(std::size_t dataPoints, ForecastMethod preferred)
{
    const bool enoughForSsa = dataPoints >= static_cast<std::size_t>(MinimumPointsForSsa);

    switch (preferred)
    {
        case ForecastMethod::Auto:
            return enoughForSsa ? ForecastMethod::Combined : ForecastMethod::HoltWinters;
        case ForecastMethod::SSA:
            return enoughForSsa ? ForecastMethod::SSA : ForecastMethod::HoltWinters;
        case ForecastMethod::Combined:
            return enoughForSsa ? ForecastMethod::Combined : ForecastMethod::HoltWinters;
        case ForecastMethod::HoltWinters:
            return ForecastMethod::HoltWinters;
        default:
            throw std::invalid_argument("Unknown forecast method");
    }
}

EnhancedForecastResult EnsembleForecaster::forecast(const std::vector<Money>& monthlyData,
                                                    int periodsToForecast,
                                                    ForecastMethod preferredMethod,
                                                    int startMonth) const
{
    if (periodsToForecast < 1)
        throw std::invalid_argument("EnsembleForecaster: periods to forecast must be at least 1");

    if (monthlyData.size() < 2)
    {
        EnhancedForecastResult result;
        const Money value = monthlyData.empty() ? Money(0) : monthlyData.front();
        result.forecastedValues.assign(static_cast<std::size_t>(periodsToForecast), value);
        result.methodUsed = "Insufficient Data";
        result.confidenceScore = 0.0;
        result.dataPointsUsed = static_cast<int>(monthlyData.size());
        result.periodsForecasted = periodsToForecast;
        return result;
    }

    const ForecastMethod method = selectMethod(monthlyData.size(), preferredMethod);
    mOutputStream << "   [EnsembleForecaster] " << monthlyData.size() << " points, method "
                  << getForecastMethodString(method) << std::endl;

    EnhancedForecastResult result;
    switch (method)
    {
        case ForecastMethod::SSA:
            try
            {
                result = ssaForecast(monthlyData, periodsToForecast, startMonth);
            }
            catch (const ForecastException& e)
            {
                mOutputStream << "   [EnsembleForecaster] SSA failed, using Holt-Winters: "
                              << e.what() << std::endl;
                result = holtWintersForecast(monthlyData, periodsToForecast, startMonth);
                result.confidenceScore = std::max(0.0, result.confidenceScore - 10.0);
                result.fallbackReasons.push_back(e.what());
            }
            break;
        case ForecastMethod::HoltWinters:
            result = holtWintersForecast(monthlyData, periodsToForecast, startMonth);
            break;
        default:
            result = combinedForecast(monthlyData, periodsToForecast, startMonth);
            break;
    }

    result.dataPointsUsed = static_cast<int>(monthlyData.size());
    result.periodsForecasted = periodsToForecast;
    return result;
}

SeasonalPattern EnsembleForecaster::detectSeasonality(const std::vector<Money>& monthlyData,
                                                      int startMonth) const
{
    if (monthlyData.size() < static_cast<std::size_t>(MinimumPointsForHoltWinters))
    {
        SeasonalPattern pattern;
        pattern.seasonalStrength = 0.0;
        pattern.description = "Insufficient data to detect seasonal patterns.";
        return pattern;
    }

    // Twelve points always admit a 6 month season, so a length is found.
    const int seasonLength = HoltWinters::detectSeasonLength(monthlyData, CandidateSeasonLengths);
    return HoltWinters::autoForecast(monthlyData, seasonLength, 1, startMonth).seasonalPattern;
}

EnhancedForecastResult EnsembleForecaster::ssaForecast(const std::vector<Money>& data,
                                                       int periodsToForecast,
                                                       int startMonth) const
{
    const int n = static_cast<int>(data.size());
    const int windowLength = std::max(2, std::min(DefaultWindowLength, n / 4));
    const int seriesLength = std::max(windowLength + 1, std::min(DefaultSeriesLength, n / 2));

    SsaForecaster ssa(windowLength, seriesLength);
    const SsaResult ssaResult = ssa.forecast(data, periodsToForecast);

    EnhancedForecastResult result;
    for (std::size_t i = 0; i < ssaResult.forecastedValues.size(); ++i)
    {
        result.forecastedValues.push_back(clampAtZero(ssaResult.forecastedValues[i]));
        result.lowerBounds.push_back(clampAtZero(ssaResult.lowerBounds[i]));
        result.upperBounds.push_back(num::fromDouble(ssaResult.upperBounds[i]));
    }

    result.methodUsed = "Singular Spectrum Analysis";
    result.confidenceScore = ConfidenceScorer::score(data, std::nullopt, std::nullopt);
    result.seasonalPattern = detectSeasonality(data, startMonth);

    mOutputStream << "   [EnsembleForecaster] SSA window " << windowLength << ", rank "
                  << ssaResult.rank << std::endl;
    return result;
}

EnhancedForecastResult EnsembleForecaster::holtWintersForecast(const std::vector<Money>& data,
                                                               int periodsToForecast,
                                                               int startMonth) const
{
    const std::size_t n = data.size();
    int seasonLength = n >= static_cast<std::size_t>(MinimumPointsForHoltWinters)
      ? HoltWinters::detectSeasonLength(data, CandidateSeasonLengths)
      : std::min(4, static_cast<int>(n / 2));
    seasonLength = std::max(2, seasonLength);

    const HoltWintersResult hwResult =
      HoltWinters::autoForecast(data, seasonLength, periodsToForecast, startMonth);

    EnhancedForecastResult result;
    result.forecastedValues = hwResult.forecastedValues;
    result.seasonalPattern = hwResult.seasonalPattern;
    result.methodUsed = hwResult.method;
    result.confidenceScore = ConfidenceScorer::score(data,
                                                     hwResult.seasonalPattern.seasonalStrength,
                                                     std::nullopt);

    using Constants = ledger::DecimalConstants<Money>;
    const Money boundsPercent = result.confidenceScore >= 70.0
      ? Constants::TenPercent : Constants::TwentyPercent;

    for (const auto& value : hwResult.forecastedValues)
    {
        result.lowerBounds.push_back(value * (Constants::DecimalOne - boundsPercent));
        result.upperBounds.push_back(value * (Constants::DecimalOne + boundsPercent));
    }

    return result;
}

EnhancedForecastResult EnsembleForecaster::combinedForecast(const std::vector<Money>& data,
                                                            int periodsToForecast,
                                                            int startMonth) const
{
    const EnhancedForecastResult hwResult = holtWintersForecast(data, periodsToForecast, startMonth);

    EnhancedForecastResult ssaResult;
    try
    {
        ssaResult = ssaForecast(data, periodsToForecast, startMonth);
    }
    catch (const ForecastException& e)
    {
        mOutputStream << "   [EnsembleForecaster] SSA failed, combined forecast uses Holt-Winters only: "
                      << e.what() << std::endl;

        EnhancedForecastResult result = hwResult;
        result.methodUsed = "Combined (Holt-Winters only)";
        result.confidenceScore = std::max(0.0, hwResult.confidenceScore - 10.0);
        result.fallbackReasons.push_back(e.what());
        return result;
    }

    const double ssaWeight = data.size() >= 36 ? 0.6 : 0.5;
    const double hwWeight = 1.0 - ssaWeight;

    EnhancedForecastResult result;
    for (std::size_t i = 0; i < static_cast<std::size_t>(periodsToForecast); ++i)
    {
        const Money ssaValue = i < ssaResult.forecastedValues.size() ? ssaResult.forecastedValues[i] : Money(0);
        const Money hwValue = i < hwResult.forecastedValues.size() ? hwResult.forecastedValues[i] : Money(0);

        result.forecastedValues.push_back(num::fromDouble(ssaWeight * num::to_double(ssaValue)
                                                          + hwWeight * num::to_double(hwValue)));
        result.lowerBounds.push_back(std::min(ssaResult.lowerBounds[i], hwResult.lowerBounds[i]));
        result.upperBounds.push_back(std::max(ssaResult.upperBounds[i], hwResult.upperBounds[i]));
    }

    result.seasonalPattern = hwResult.seasonalPattern;
    result.methodUsed = "Combined (SSA + Holt-Winters)";

    const double agreement = methodAgreement(ssaResult.forecastedValues, hwResult.forecastedValues);
    const double baseConfidence = (ssaResult.confidenceScore + hwResult.confidenceScore) / 2.0;
    result.confidenceScore = std::min(100.0, baseConfidence + agreement * 10.0);

    mOutputStream << "   [EnsembleForecaster] SSA weight " << ssaWeight << ", agreement "
                  << agreement << std::endl;
    return result;
}

double EnsembleForecaster::methodAgreement(const std::vector<Money>& first,
                                           const std::vector<Money>& second)
{
    const std::size_t count = std::min(first.size(), second.size());

    double differenceSum = 0.0;
    std::size_t used = 0;
    for (std::size_t i = 0; i < count; ++i)
    {
        const double a = num::to_double(first[i]);
        const double b = num::to_double(second[i]);
        const double average = (a + b) / 2.0;
        if (average > 0.0)
        {
            differenceSum += std::abs(a - b) / average;
            ++used;
        }
    }

    if (used == 0)
        return 0.0;

    return std::max(0.0, 1.0 - differenceSum / static_cast<double>(used));
}

} // namespace forecasting
} // namespace ledgerinsights
