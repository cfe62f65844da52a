#pragma once

#include <map>
#include <string>
#include <vector>
#include "AnalysisDateRange.h"
#include "BoostDateHelper.h"
#include "GroupingUtils.h"
#include "LedgerTransaction.h"
#include "InsightTypes.h"

namespace ledgerinsights
{

/**
 * @brief Populated calendar months of a window, oldest first
 *
 * startMonth is the calendar month (1..12) of the first value, or 0 when
 * the series is empty.
 */
struct MonthlySeries
{
    std::vector<Money> values;
    int startMonth = 0;
};

template <class Transaction>
std::vector<const Transaction*> transactionsInRange(const std::vector<Transaction>& transactions,
                                                    const ledger::AnalysisDateRange& range)
{
    return ledger::selectWhere(transactions, [&range](const Transaction& t) {
        return range.contains(t.getDate());
    });
}

template <class Transaction>
Money totalInRange(const std::vector<Transaction>& transactions,
                   const ledger::AnalysisDateRange& range)
{
    Money total(0);
    for (const auto& t : transactions)
        if (range.contains(t.getDate()))
            total = total + t.getEffectiveTotalUSD();
    return total;
}

/**
 * @brief Totals per calendar month over [asOf - months, asOf]
 *
 * Months without transactions are left out rather than reported as zero.
 */
template <class Transaction>
MonthlySeries monthlyTotals(const std::vector<Transaction>& transactions,
                            const ledger::LedgerDate& asOf,
                            int months)
{
    const ledger::AnalysisDateRange window(ledger::add_months(asOf, -months), asOf);

    std::map<int, Money> totals;
    for (const auto& t : transactions)
    {
        if (!window.contains(t.getDate()))
            continue;

        const int key = ledger::month_bucket_key(t.getDate());
        auto it = totals.find(key);
        if (it == totals.end())
            totals.emplace(key, t.getEffectiveTotalUSD());
        else
            it->second = it->second + t.getEffectiveTotalUSD();
    }

    MonthlySeries series;
    series.values = ledger::valuesInKeyOrder(totals);
    if (!totals.empty())
        series.startMonth = totals.begin()->first % 100;
    return series;
}

/**
 * @brief Date of each customer's first sale; sales without a customer are ignored
 */
inline std::map<std::string, ledger::LedgerDate> firstPurchaseDates(const std::vector<ledger::Sale>& sales)
{
    std::map<std::string, ledger::LedgerDate> firstDates;
    for (const auto& sale : sales)
    {
        if (sale.getCustomerId().empty())
            continue;

        auto it = firstDates.find(sale.getCustomerId());
        if (it == firstDates.end())
            firstDates.emplace(sale.getCustomerId(), sale.getDate());
        else if (sale.getDate() < it->second)
            it->second = sale.getDate();
    }
    return firstDates;
}

/**
 * @brief Customers whose first sale falls inside range
 */
inline int newCustomersInRange(const std::vector<ledger::Sale>& sales,
                               const ledger::AnalysisDateRange& range)
{
    int count = 0;
    for (const auto& entry : firstPurchaseDates(sales))
        if (range.contains(entry.second))
            ++count;
    return count;
}

/**
 * @brief New customers per calendar month over [asOf - months, asOf]
 */
inline MonthlySeries monthlyNewCustomers(const std::vector<ledger::Sale>& sales,
                                         const ledger::LedgerDate& asOf,
                                         int months)
{
    const ledger::AnalysisDateRange window(ledger::add_months(asOf, -months), asOf);

    std::map<int, int> counts;
    for (const auto& entry : firstPurchaseDates(sales))
        if (window.contains(entry.second))
            ++counts[ledger::month_bucket_key(entry.second)];

    MonthlySeries series;
    for (const auto& entry : counts)
        series.values.push_back(Money(entry.second));
    if (!counts.empty())
        series.startMonth = counts.begin()->first % 100;
    return series;
}

} // namespace ledgerinsights
