#pragma once

#include <optional>
#include <string>
#include <vector>
#include "CompanyData.h"
#include "ForecastAccuracyRecord.h"
#include "InsightTypes.h"

namespace ledgerinsights
{
namespace forecasting
{

enum class AccuracyTrend
{
    Improving,
    Stable,
    Declining
};

std::string getAccuracyTrendLabel(AccuracyTrend trend);

/**
 * @brief How well past forecasts matched what happened
 *
 * records holds every record, newest period first. Averages only cover
 * validated records that have the corresponding actual.
 */
struct ForecastAccuracySummary
{
    std::vector<ledger::ForecastAccuracyRecord> records;
    double averageRevenueAccuracy = 0.0;
    double averageExpensesAccuracy = 0.0;
    double overallRevenueMAPE = 0.0;
    int validatedForecastCount = 0;
    int totalForecastCount = 0;
    AccuracyTrend accuracyTrend = AccuracyTrend::Stable;
    std::string accuracyDescription;
};

struct RecentAccuracy
{
    double revenueAccuracy;
    double expenseAccuracy;
};

/**
 * @class ForecastAccuracyTracker
 * @brief Bookkeeping of forecast records against realised figures
 *
 * Every operation is a pure function over a list of records: the caller
 * owns the list and decides where it is stored.
 */
class ForecastAccuracyTracker
{
public:
    static constexpr int DefaultRecentCount = 6;
    static constexpr int DefaultMaxRecords = 24;

    /**
     * @brief Store a forecast for period
     *
     * An unvalidated record for the same period is replaced in place (id and
     * method kept); otherwise a record with id "FC-<start>-<end>" is appended.
     */
    static std::vector<ledger::ForecastAccuracyRecord>
    recordForecast(const std::vector<ledger::ForecastAccuracyRecord>& records,
                   const ForecastData& forecast,
                   const ledger::AnalysisDateRange& period,
                   const ledger::LedgerDate& forecastDate);

    /**
     * @brief Fill in the actuals of every unvalidated record whose period ended before asOf
     *
     * Actual revenue and expenses are the sale and purchase totals inside the
     * period; actual new customers are the customers whose first sale falls
     * inside it. Other records are returned unchanged.
     */
    static std::vector<ledger::ForecastAccuracyRecord>
    validatePastForecasts(const std::vector<ledger::ForecastAccuracyRecord>& records,
                          const ledger::CompanyData& company,
                          const ledger::LedgerDate& asOf);

    static ForecastAccuracySummary summarize(const std::vector<ledger::ForecastAccuracyRecord>& records);

    /**
     * @brief Mean accuracies of the recentCount validated records with the latest period end
     * @return Empty when no validated record carries an accuracy.
     */
    static std::optional<RecentAccuracy>
    recentAccuracy(const std::vector<ledger::ForecastAccuracyRecord>& records,
                   int recentCount = DefaultRecentCount);

    static std::string accuracySummaryText(const std::vector<ledger::ForecastAccuracyRecord>& records);

    /**
     * @brief Keep at most maxRecords records, validated ones first, then the newest periods
     */
    static std::vector<ledger::ForecastAccuracyRecord>
    cleanupOldRecords(const std::vector<ledger::ForecastAccuracyRecord>& records,
                      int maxRecords = DefaultMaxRecords);
};

} // namespace forecasting
} // namespace ledgerinsights
