#include "AnomalyDetector.h"
#include <map>
#include "BoostDateHelper.h"
#include "GroupingUtils.h"
#include "LedgerSeries.h"
#include "StatUtils.h"

namespace ledgerinsights
{
using ledger::AnalysisDateRange;
using ledger::LedgerDate;
using ledger::date_duration;

namespace
{
template <class Transaction, class KeyFn>
std::map<int, Money> bucketTotals(const std::vector<Transaction>& transactions,
                                  const LedgerDate& first,
                                  const LedgerDate& last,
                                  KeyFn keyFn)
{
    std::map<int, Money> totals;
    for (const auto& t : transactions)
    {
        if (t.getDate() < first || t.getDate() > last)
            continue;

        const int key = keyFn(t.getDate());
        auto it = totals.find(key);
        if (it == totals.end())
            totals.emplace(key, t.getEffectiveTotalUSD());
        else
            it->second = it->second + t.getEffectiveTotalUSD();
    }
    return totals;
}

std::string shortDate(const LedgerDate& date)
{
    return std::string(date.month().as_short_string()) + " " + std::to_string(date.day().as_number());
}
}

AnomalyDetector::AnomalyDetector(const AnalysisThresholds& thresholds)
  : mThresholds(thresholds)
{}

std::vector<InsightItem> AnomalyDetector::analyze(const ledger::CompanyData& company,
                                                  const AnalysisDateRange& range,
                                                  std::ostream& os) const
{
    std::vector<InsightItem> anomalies;

    if (auto item = expenseSpike(company, range))
        anomalies.push_back(*item);

    if (auto item = returnRate(company, range))
        anomalies.push_back(*item);

    if (auto item = revenueDrop(company, range))
        anomalies.push_back(*item);

    if (auto item = largeTransaction(company, range))
        anomalies.push_back(*item);

    os << "   [AnomalyDetector] " << anomalies.size() << " anomaly(ies) in "
       << range.dayCount() << " day range" << std::endl;
    return anomalies;
}

std::optional<InsightItem> AnomalyDetector::evaluateExpenseSpike(const Money& currentWeek,
                                                                 const std::vector<Money>& weeklyTotals) const
{
    if (weeklyTotals.size() < static_cast<std::size_t>(mThresholds.expenseSpikeMinimumWeeks))
        return std::nullopt;

    const ledger::SeriesStatistics stats = ledger::StatUtils<Money>::computeStatistics(weeklyTotals);
    const std::optional<double> z = ledger::zScore(num::to_double(currentWeek), stats);
    if (!z || !(*z > mThresholds.expenseSpikeZScore))
        return std::nullopt;

    const double percentAbove = ledger::percentChange(stats.mean, num::to_double(currentWeek));

    InsightItem item("Unusual Expense Spike Detected",
                     "This week's expenses (" + num::formatCurrency(currentWeek) + ") are "
                     + num::formatPercent(percentAbove, 0) + "% above your typical weekly average ("
                     + num::formatCurrency(stats.mean) + ").",
                     InsightSeverity::Warning,
                     InsightCategory::Anomaly);

    return item.withRecommendation("Review recent expense entries for any errors, unexpected costs, or one-time purchases.")
      .withMetricValue(currentWeek)
      .withPercentageChange(percentAbove);
}

std::optional<InsightItem> AnomalyDetector::evaluateRevenueDrop(const std::vector<Money>& baselineBuckets,
                                                                const std::vector<Money>& currentBuckets) const
{
    if (baselineBuckets.size() < static_cast<std::size_t>(mThresholds.revenueDropMinimumBaselinePoints))
        return std::nullopt;

    const ledger::SeriesStatistics stats = ledger::StatUtils<Money>::computeStatistics(baselineBuckets);

    for (const Money& bucket : currentBuckets)
    {
        const std::optional<double> z = ledger::zScore(num::to_double(bucket), stats);
        if (!z)
            return std::nullopt;

        if (*z < -mThresholds.revenueDropZScore)
        {
            const double percentBelow = (1.0 - num::to_double(bucket) / stats.mean) * 100.0;

            InsightItem item("Unusual Revenue Drop",
                             "Revenue for a recent period (" + num::formatCurrency(bucket) + ") was "
                             + num::formatPercent(percentBelow, 0) + "% below typical levels.",
                             InsightSeverity::Critical,
                             InsightCategory::Anomaly);

            return item.withRecommendation("Check for any operational issues, competitor activity, or external factors that may have affected sales.")
              .withMetricValue(bucket)
              .withPercentageChange(-percentBelow);
        }
    }

    return std::nullopt;
}

std::optional<InsightItem>
AnomalyDetector::evaluateReturnRate(std::size_t currentReturns,
                                    std::size_t currentSales,
                                    std::size_t historicalReturns,
                                    std::size_t historicalSales,
                                    const std::optional<std::string>& mostReturnedProduct) const
{
    const std::size_t minimumSales = static_cast<std::size_t>(mThresholds.returnRateMinimumSales);
    if (currentSales < minimumSales || historicalSales < minimumSales || currentSales == 0 || historicalSales == 0)
        return std::nullopt;

    const double currentRate = static_cast<double>(currentReturns) / static_cast<double>(currentSales) * 100.0;
    const double historicalRate =
      static_cast<double>(historicalReturns) / static_cast<double>(historicalSales) * 100.0;

    if (!(currentRate > historicalRate + mThresholds.returnRateMarginPoints))
        return std::nullopt;

    std::string description = "Current return rate is " + num::formatPercent(currentRate, 1)
      + "% compared to historical average of " + num::formatPercent(historicalRate, 1) + "%.";
    if (mostReturnedProduct)
        description += " Most returns are for: " + *mostReturnedProduct + ".";

    InsightItem item("Return Rate Above Normal", description,
                     InsightSeverity::Warning, InsightCategory::Anomaly);

    return item.withRecommendation("Investigate product quality, description accuracy, or shipping issues for affected items.")
      .withMetricValue(num::fromDouble(currentRate))
      .withPercentageChange(currentRate - historicalRate);
}

std::optional<InsightItem>
AnomalyDetector::evaluateLargeTransaction(const std::vector<Money>& saleAmounts,
                                          const ledger::Sale& largestSale,
                                          const std::optional<std::string>& customerName) const
{
    if (saleAmounts.size() < static_cast<std::size_t>(mThresholds.largeTransactionMinimumSales))
        return std::nullopt;

    const ledger::SeriesStatistics stats = ledger::StatUtils<Money>::computeStatistics(saleAmounts);
    const std::optional<double> z = ledger::zScore(num::to_double(largestSale.getEffectiveTotalUSD()), stats);
    if (!z || !(*z > mThresholds.largeTransactionZScore))
        return std::nullopt;

    InsightItem item("Unusually Large Transaction",
                     "A sale of " + num::formatCurrency(largestSale.getEffectiveTotalUSD()) + " to "
                     + customerName.value_or("a customer") + " on " + shortDate(largestSale.getDate())
                     + " is significantly larger than your typical transaction size ("
                     + num::formatCurrency(stats.mean) + ").",
                     InsightSeverity::Info,
                     InsightCategory::Anomaly);

    return item.withRecommendation("Verify this transaction is correct and consider nurturing this high-value customer relationship.")
      .withMetricValue(largestSale.getEffectiveTotalUSD());
}

std::optional<InsightItem> AnomalyDetector::expenseSpike(const ledger::CompanyData& company,
                                                         const AnalysisDateRange& range) const
{
    const LedgerDate& end = range.getEndDate();

    const std::map<int, Money> weekly = bucketTotals(company.getPurchases(), end - date_duration(84), end,
                                                     [](const LedgerDate& d) { return ledger::week_bucket_key(d); });

    const AnalysisDateRange currentWeek(end - date_duration(7), end);
    return evaluateExpenseSpike(totalInRange(company.getPurchases(), currentWeek),
                                ledger::valuesInKeyOrder(weekly));
}

std::optional<InsightItem> AnomalyDetector::returnRate(const ledger::CompanyData& company,
                                                       const AnalysisDateRange& range) const
{
    const LedgerDate& start = range.getStartDate();
    const LedgerDate historicalStart = ledger::add_months(start, -6);

    std::size_t currentReturns = 0, historicalReturns = 0;
    std::map<std::string, std::size_t> returnedLines;
    for (const auto& returnRecord : company.getReturns())
    {
        const LedgerDate& date = returnRecord.getReturnDate();
        if (range.contains(date))
        {
            ++currentReturns;
            for (const auto& item : returnRecord.getItems())
                ++returnedLines[item.getProductId()];
        }
        else if (date >= historicalStart && date < start)
            ++historicalReturns;
    }

    std::size_t currentSales = 0, historicalSales = 0;
    for (const auto& sale : company.getSales())
    {
        if (range.contains(sale.getDate()))
            ++currentSales;
        else if (sale.getDate() >= historicalStart && sale.getDate() < start)
            ++historicalSales;
    }

    std::optional<std::string> productName;
    const auto mostReturned = ledger::maxByValue(returnedLines);
    if (mostReturned != returnedLines.end())
        if (auto product = company.getProduct(mostReturned->first))
            productName = product->getName();

    return evaluateReturnRate(currentReturns, currentSales, historicalReturns, historicalSales, productName);
}

std::optional<InsightItem> AnomalyDetector::revenueDrop(const ledger::CompanyData& company,
                                                        const AnalysisDateRange& range) const
{
    const long periodDays = range.dayCount();
    const bool weekly = periodDays > 30;
    auto keyFn = [weekly](const LedgerDate& d) {
        return weekly ? ledger::week_bucket_key(d) : ledger::day_bucket_key(d);
    };

    const LedgerDate& start = range.getStartDate();
    const std::map<int, Money> baseline = bucketTotals(company.getSales(),
                                                       start - date_duration(periodDays * 3),
                                                       start - date_duration(1),
                                                       keyFn);
    const std::map<int, Money> current = bucketTotals(company.getSales(), start, range.getEndDate(), keyFn);

    return evaluateRevenueDrop(ledger::valuesInKeyOrder(baseline), ledger::valuesInKeyOrder(current));
}

std::optional<InsightItem> AnomalyDetector::largeTransaction(const ledger::CompanyData& company,
                                                             const AnalysisDateRange& range) const
{
    const auto currentSales = transactionsInRange(company.getSales(), range);
    if (currentSales.empty())
        return std::nullopt;

    std::vector<Money> amounts;
    const ledger::Sale* largest = currentSales.front();
    for (const ledger::Sale* sale : currentSales)
    {
        amounts.push_back(sale->getEffectiveTotalUSD());
        if (largest->getEffectiveTotalUSD() < sale->getEffectiveTotalUSD())
            largest = sale;
    }

    std::optional<std::string> customerName;
    if (auto customer = company.getCustomer(largest->getCustomerId()))
        customerName = customer->getName();

    return evaluateLargeTransaction(amounts, *largest, customerName);
}

} // namespace ledgerinsights
