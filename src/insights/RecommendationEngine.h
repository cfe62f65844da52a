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
 * @class RecommendationEngine
 * @brief Heuristic business advice drawn from the ledger
 *
 * Each rule is independent and yields at most one item. Output order is
 * top product, inactive customers, overdue invoices, supplier
 * concentration, customer concentration, profit margin.
 */
class RecommendationEngine
{
public:
    explicit RecommendationEngine(const AnalysisThresholds& thresholds);

    std::vector<InsightItem> analyze(const ledger::CompanyData& company,
                                     const ledger::AnalysisDateRange& range,
                                     const ledger::LedgerDate& asOf,
                                     std::ostream& os) const;

    /**
     * @brief Highest margin product sold in the range among those with a known cost
     */
    std::optional<InsightItem> topProduct(const ledger::CompanyData& company,
                                          const ledger::AnalysisDateRange& range) const;

    /**
     * @brief Repeat customers whose last purchase is older than the inactivity window at the range end
     */
    std::optional<InsightItem> inactiveCustomers(const ledger::CompanyData& company,
                                                 const ledger::AnalysisDateRange& range) const;

    std::optional<InsightItem> overdueInvoices(const ledger::CompanyData& company,
                                               const ledger::LedgerDate& asOf) const;

    std::optional<InsightItem> supplierConcentration(const ledger::CompanyData& company,
                                                     const ledger::AnalysisDateRange& range) const;

    std::optional<InsightItem> customerConcentration(const ledger::CompanyData& company,
                                                     const ledger::AnalysisDateRange& range) const;

    std::optional<InsightItem> profitMargin(const Money& revenue, const Money& expenses) const;

private:
    AnalysisThresholds mThresholds;
};

} // namespace ledgerinsights
