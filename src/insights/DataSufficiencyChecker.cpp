#include "DataSufficiencyChecker.h"
#include <vector>
#include <algorithm>
#include "BoostDateHelper.h"

namespace ledgerinsights
{
DataSufficiencyChecker::DataSufficiencyChecker(const AnalysisThresholds& thresholds)
  : mThresholds(thresholds)
{}

DataSufficiency DataSufficiencyChecker::check(const ledger::CompanyData& company,
                                              const ledger::AnalysisDateRange& range,
                                              std::ostream& os) const
{
    std::vector<ledger::LedgerDate> dates;
    for (const auto& sale : company.getSales())
        if (range.contains(sale.getDate()))
            dates.push_back(sale.getDate());
    for (const auto& purchase : company.getPurchases())
        if (range.contains(purchase.getDate()))
            dates.push_back(purchase.getDate());

    DataSufficiency result;
    const int transactionCount = static_cast<int>(dates.size());

    if (transactionCount < mThresholds.minimumTransactions)
    {
        result.message = "Need at least " + std::to_string(mThresholds.minimumTransactions)
          + " transactions for meaningful insights. Currently have "
          + std::to_string(transactionCount) + ".";
        os << "   [DataSufficiency] " << result.message << std::endl;
        return result;
    }

    if (dates.empty())
    {
        result.message = "No transaction data available for the selected period.";
        os << "   [DataSufficiency] " << result.message << std::endl;
        return result;
    }

    const auto bounds = std::minmax_element(dates.begin(), dates.end());
    result.hasSufficientData = true;
    result.monthsOfData = ledger::inclusive_month_span(*bounds.first, *bounds.second);

    os << "   [DataSufficiency] " << transactionCount << " transactions over "
       << result.monthsOfData << " month(s)" << std::endl;
    return result;
}

} // namespace ledgerinsights
