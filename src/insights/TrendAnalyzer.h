#pragma once

#include <optional>
#include <ostream>
#include <vector>
#include "AnalysisDateRange.h"
#include "CompanyData.h"
#include "InsightTypes.h"
#include "InsightsConfiguration.h"

namespace ledgerinsights
{

/**
 * @class TrendAnalyzer
 * @brief Period-over-period and calendar patterns in sales and purchases
 *
 * Findings are produced in a fixed order: revenue trend, expense trend,
 * day-of-week pattern, seasonal pattern, transaction volume trend.
 */
class TrendAnalyzer
{
public:
    explicit TrendAnalyzer(const AnalysisThresholds& thresholds);

    std::vector<InsightItem> analyze(const ledger::CompanyData& company,
                                     const ledger::AnalysisDateRange& range,
                                     const ledger::LedgerDate& asOf,
                                     std::ostream& os) const;

    /**
     * @brief Revenue against the previous period; emitted when |change| reaches the threshold
     *
     * Nothing is reported when the previous period has no revenue.
     */
    std::optional<InsightItem> revenueTrend(const Money& previousRevenue,
                                            const Money& currentRevenue) const;

    std::optional<InsightItem> expenseTrend(const Money& previousExpenses,
                                            const Money& currentExpenses) const;

    /**
     * @brief Best weekday when it beats the average populated weekday by the lift ratio
     */
    std::optional<InsightItem> dayOfWeekPattern(const std::vector<const ledger::Sale*>& currentSales) const;

    /**
     * @brief Best calendar month over the trailing year ending at asOf
     */
    std::optional<InsightItem> seasonalPattern(const std::vector<ledger::Sale>& sales,
                                               const ledger::LedgerDate& asOf) const;

    std::optional<InsightItem> volumeTrend(std::size_t previousCount, std::size_t currentCount) const;

private:
    AnalysisThresholds mThresholds;
};

} // namespace ledgerinsights
