#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "AnalysisDateRange.h"
#include "CompanyData.h"
#include "InsightTypes.h"
#include "InsightsConfiguration.h"

namespace ledgerinsights
{

/**
 * @class AnomalyDetector
 * @brief z-score based detection of unusual weeks, days and sales
 *
 * All checks use population statistics of a baseline and stay silent when
 * the baseline has no spread. Findings come out in the order expense
 * spike, return rate, revenue drop, large transaction.
 *
 * The evaluate* members hold the decision rules on already aggregated
 * figures; analyze() does the aggregation from the ledger.
 */
class AnomalyDetector
{
public:
    explicit AnomalyDetector(const AnalysisThresholds& thresholds);

    std::vector<InsightItem> analyze(const ledger::CompanyData& company,
                                     const ledger::AnalysisDateRange& range,
                                     std::ostream& os) const;

    /**
     * @param currentWeek purchases in the last seven days of the range
     * @param weeklyTotals purchase totals per week bucket over the last twelve weeks
     */
    std::optional<InsightItem> evaluateExpenseSpike(const Money& currentWeek,
                                                    const std::vector<Money>& weeklyTotals) const;

    /**
     * @param currentBuckets revenue per bucket of the range, in bucket order
     * @return The first bucket far enough below the baseline, if any
     */
    std::optional<InsightItem> evaluateRevenueDrop(const std::vector<Money>& baselineBuckets,
                                                   const std::vector<Money>& currentBuckets) const;

    std::optional<InsightItem> evaluateReturnRate(std::size_t currentReturns,
                                                  std::size_t currentSales,
                                                  std::size_t historicalReturns,
                                                  std::size_t historicalSales,
                                                  const std::optional<std::string>& mostReturnedProduct) const;

    /**
     * @param customerName name of the largest sale's customer when it is known
     */
    std::optional<InsightItem> evaluateLargeTransaction(const std::vector<Money>& saleAmounts,
                                                        const ledger::Sale& largestSale,
                                                        const std::optional<std::string>& customerName) const;

private:
    std::optional<InsightItem> expenseSpike(const ledger::CompanyData& company,
                                            const ledger::AnalysisDateRange& range) const;
    std::optional<InsightItem> returnRate(const ledger::CompanyData& company,
                                          const ledger::AnalysisDateRange& range) const;
    std::optional<InsightItem> revenueDrop(const ledger::CompanyData& company,
                                           const ledger::AnalysisDateRange& range) const;
    std::optional<InsightItem> largeTransaction(const ledger::CompanyData& company,
                                                const ledger::AnalysisDateRange& range) const;

    AnalysisThresholds mThresholds;
};

} // namespace ledgerinsights
