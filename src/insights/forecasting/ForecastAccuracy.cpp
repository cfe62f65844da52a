#include "ForecastAccuracy.h"
#include <algorithm>
#include <stdexcept>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "LedgerSeries.h"
#include "StatUtils.h"

namespace ledgerinsights
{
namespace forecasting
{
using ledger::ForecastAccuracyRecord;

namespace
{
const char* NoValidatedForecasts =
  "No validated forecasts yet. Check back after the current forecast period ends.";

double meanOrZero(const std::vector<double>& values)
{
    return values.empty() ? 0.0 : ledger::StatUtils<double>::computeMean(values);
}

bool newerPeriodFirst(const ForecastAccuracyRecord& lhs, const ForecastAccuracyRecord& rhs)
{
    return lhs.getPeriod().getStartDate() > rhs.getPeriod().getStartDate();
}
}

std::string getAccuracyTrendLabel(AccuracyTrend trend)
{
    switch (trend)
    {
        case AccuracyTrend::Improving:
            return "Improving";
        case AccuracyTrend::Stable:
            return "Stable";
        case AccuracyTrend::Declining:
            return "Declining";
        default:
            throw std::invalid_argument("Unknown accuracy trend");
    }
}

std::vector<ForecastAccuracyRecord>
ForecastAccuracyTracker::recordForecast(const std::vector<ForecastAccuracyRecord>& records,
                                        const ForecastData& forecast,
                                        const ledger::AnalysisDateRange& period,
                                        const ledger::LedgerDate& forecastDate)
{
    std::vector<ForecastAccuracyRecord> updated(records);

    auto existing = std::find_if(updated.begin(), updated.end(),
                                 [&period](const ForecastAccuracyRecord& r) {
        return r.getPeriod() == period && !r.isValidated();
    });

    if (existing != updated.end())
    {
        *existing = existing->withForecast(forecastDate,
                                           forecast.forecastedRevenue,
                                           forecast.forecastedExpenses,
                                           forecast.forecastedProfit,
                                           forecast.expectedNewCustomers,
                                           forecast.confidenceScore);
        return updated;
    }

    const std::string id = "FC-" + boost::gregorian::to_iso_extended_string(period.getStartDate())
      + "-" + boost::gregorian::to_iso_extended_string(period.getEndDate());

    updated.emplace_back(id,
                         forecastDate,
                         period,
                         forecast.forecastedRevenue,
                         forecast.forecastedExpenses,
                         forecast.forecastedProfit,
                         forecast.expectedNewCustomers,
                         forecast.confidenceScore,
                         forecast.forecastMethod.empty() ? std::string("Combined") : forecast.forecastMethod);
    return updated;
}

std::vector<ForecastAccuracyRecord>
ForecastAccuracyTracker::validatePastForecasts(const std::vector<ForecastAccuracyRecord>& records,
                                               const ledger::CompanyData& company,
                                               const ledger::LedgerDate& asOf)
{
    std::vector<ForecastAccuracyRecord> validated;
    validated.reserve(records.size());

    for (const auto& record : records)
    {
        if (record.isValidated() || !(record.getPeriod().getEndDate() < asOf))
        {
            validated.push_back(record);
            continue;
        }

        const ledger::AnalysisDateRange& period = record.getPeriod();
        validated.push_back(record.withActuals(totalInRange(company.getSales(), period),
                                               totalInRange(company.getPurchases(), period),
                                               newCustomersInRange(company.getSales(), period)));
    }

    return validated;
}

ForecastAccuracySummary
ForecastAccuracyTracker::summarize(const std::vector<ForecastAccuracyRecord>& records)
{
    ForecastAccuracySummary summary;
    summary.records = records;
    std::stable_sort(summary.records.begin(), summary.records.end(), newerPeriodFirst);
    summary.totalForecastCount = static_cast<int>(records.size());

    std::vector<ForecastAccuracyRecord> validatedRecords;
    for (const auto& record : records)
        if (record.isValidated())
            validatedRecords.push_back(record);

    summary.validatedForecastCount = static_cast<int>(validatedRecords.size());
    if (validatedRecords.empty())
    {
        summary.accuracyDescription = NoValidatedForecasts;
        return summary;
    }

    // Oldest period first, so the trend compares earlier forecasts with later ones.
    std::stable_sort(validatedRecords.begin(), validatedRecords.end(),
                     [](const ForecastAccuracyRecord& lhs, const ForecastAccuracyRecord& rhs) {
        return lhs.getPeriod().getStartDate() < rhs.getPeriod().getStartDate();
    });

    std::vector<double> revenueAccuracies, expenseAccuracies, revenueErrors;
    for (const auto& record : validatedRecords)
    {
        if (auto accuracy = record.getRevenueAccuracyPercent())
            revenueAccuracies.push_back(*accuracy);
        if (auto accuracy = record.getExpensesAccuracyPercent())
            expenseAccuracies.push_back(*accuracy);
        if (auto error = record.getRevenueMAPE())
            revenueErrors.push_back(*error);
    }

    summary.averageRevenueAccuracy = meanOrZero(revenueAccuracies);
    summary.averageExpensesAccuracy = meanOrZero(expenseAccuracies);
    summary.overallRevenueMAPE = meanOrZero(revenueErrors);

    if (revenueAccuracies.size() >= 4)
    {
        const auto half = static_cast<std::ptrdiff_t>(revenueAccuracies.size() / 2);
        const double olderAverage =
          meanOrZero(std::vector<double>(revenueAccuracies.begin(), revenueAccuracies.begin() + half));
        const double newerAverage =
          meanOrZero(std::vector<double>(revenueAccuracies.begin() + half, revenueAccuracies.end()));

        if (newerAverage > olderAverage + 5.0)
            summary.accuracyTrend = AccuracyTrend::Improving;
        else if (newerAverage < olderAverage - 5.0)
            summary.accuracyTrend = AccuracyTrend::Declining;
    }

    const double overall = (summary.averageRevenueAccuracy + summary.averageExpensesAccuracy) / 2.0;
    const std::string error = num::formatPercent(100.0 - overall, 0);

    if (overall >= 90.0)
        summary.accuracyDescription = "Excellent accuracy! Forecasts are within ±" + error
          + "% of actual values on average.";
    else if (overall >= 80.0)
        summary.accuracyDescription = "Good accuracy. Forecasts average ±" + error
          + "% deviation from actual values.";
    else if (overall >= 70.0)
        summary.accuracyDescription = "Moderate accuracy. Forecasts average ±" + error
          + "% deviation. Consider reviewing data patterns.";
    else
        summary.accuracyDescription = "Low accuracy (±" + error
          + "% average error). More historical data may improve predictions.";

    return summary;
}

std::optional<RecentAccuracy>
ForecastAccuracyTracker::recentAccuracy(const std::vector<ForecastAccuracyRecord>& records,
                                        int recentCount)
{
    std::vector<ForecastAccuracyRecord> validatedRecords;
    for (const auto& record : records)
        if (record.isValidated())
            validatedRecords.push_back(record);

    std::stable_sort(validatedRecords.begin(), validatedRecords.end(),
                     [](const ForecastAccuracyRecord& lhs, const ForecastAccuracyRecord& rhs) {
        return lhs.getPeriod().getEndDate() > rhs.getPeriod().getEndDate();
    });

    if (recentCount >= 0 && validatedRecords.size() > static_cast<std::size_t>(recentCount))
        validatedRecords.erase(validatedRecords.begin() + recentCount, validatedRecords.end());

    std::vector<double> revenueAccuracies, expenseAccuracies;
    for (const auto& record : validatedRecords)
    {
        if (auto accuracy = record.getRevenueAccuracyPercent())
            revenueAccuracies.push_back(*accuracy);
        if (auto accuracy = record.getExpensesAccuracyPercent())
            expenseAccuracies.push_back(*accuracy);
    }

    if (revenueAccuracies.empty() && expenseAccuracies.empty())
        return std::nullopt;

    return RecentAccuracy{meanOrZero(revenueAccuracies), meanOrZero(expenseAccuracies)};
}

std::string
ForecastAccuracyTracker::accuracySummaryText(const std::vector<ForecastAccuracyRecord>& records)
{
    const std::optional<RecentAccuracy> recent = recentAccuracy(records);
    if (!recent)
        return NoValidatedForecasts;

    const auto validatedCount = std::count_if(records.begin(), records.end(),
                                              [](const ForecastAccuracyRecord& r) {
        return r.isValidated();
    });

    const double averageAccuracy = (recent->revenueAccuracy + recent->expenseAccuracy) / 2.0;
    return "Based on " + std::to_string(validatedCount)
      + " validated forecast(s), predictions were within ±"
      + num::formatPercent(100.0 - averageAccuracy, 0) + "% of actual values on average.";
}

std::vector<ForecastAccuracyRecord>
ForecastAccuracyTracker::cleanupOldRecords(const std::vector<ForecastAccuracyRecord>& records,
                                           int maxRecords)
{
    if (maxRecords < 0)
        throw std::invalid_argument("cleanupOldRecords: maxRecords must not be negative");

    std::vector<ForecastAccuracyRecord> kept(records);
    std::stable_sort(kept.begin(), kept.end(),
                     [](const ForecastAccuracyRecord& lhs, const ForecastAccuracyRecord& rhs) {
        if (lhs.isValidated() != rhs.isValidated())
            return lhs.isValidated();
        return newerPeriodFirst(lhs, rhs);
    });

    if (kept.size() > static_cast<std::size_t>(maxRecords))
        kept.erase(kept.begin() + maxRecords, kept.end());

    return kept;
}

} // namespace forecasting
} // namespace ledgerinsights
