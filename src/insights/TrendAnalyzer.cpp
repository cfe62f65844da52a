#include "TrendAnalyzer.h"
#include <cmath>
#include <map>
#include "BoostDateHelper.h"
#include "GroupingUtils.h"
#include "LedgerSeries.h"
#include "StatUtils.h"

namespace ledgerinsights
{
namespace
{
double percentChange(const Money& previous, const Money& current)
{
    return num::to_double(ledger::StatUtils<Money>::percentChange(previous, current));
}

std::string periodComparison(const Money& previous, const Money& current)
{
    return "(" + num::formatCurrency(previous) + " → " + num::formatCurrency(current) + ")";
}
}

TrendAnalyzer::TrendAnalyzer(const AnalysisThresholds& thresholds)
  : mThresholds(thresholds)
{}

std::vector<InsightItem> TrendAnalyzer::analyze(const ledger::CompanyData& company,
                                                const ledger::AnalysisDateRange& range,
                                                const ledger::LedgerDate& asOf,
                                                std::ostream& os) const
{
    const ledger::AnalysisDateRange previousRange = range.previousPeriod();

    const auto currentSales = transactionsInRange(company.getSales(), range);
    const auto previousSales = transactionsInRange(company.getSales(), previousRange);

    std::vector<InsightItem> insights;

    if (auto item = revenueTrend(totalInRange(company.getSales(), previousRange),
                                 totalInRange(company.getSales(), range)))
        insights.push_back(*item);

    if (auto item = expenseTrend(totalInRange(company.getPurchases(), previousRange),
                                 totalInRange(company.getPurchases(), range)))
        insights.push_back(*item);

    if (auto item = dayOfWeekPattern(currentSales))
        insights.push_back(*item);

    if (auto item = seasonalPattern(company.getSales(), asOf))
        insights.push_back(*item);

    if (auto item = volumeTrend(previousSales.size(), currentSales.size()))
        insights.push_back(*item);

    os << "   [TrendAnalyzer] " << currentSales.size() << " current sales, "
       << previousSales.size() << " previous, " << insights.size() << " trend(s)" << std::endl;
    return insights;
}

std::optional<InsightItem> TrendAnalyzer::revenueTrend(const Money& previousRevenue,
                                                       const Money& currentRevenue) const
{
    if (!(previousRevenue > Money(0)))
        return std::nullopt;

    const double change = percentChange(previousRevenue, currentRevenue);
    if (std::abs(change) < mThresholds.significantChangePercent)
        return std::nullopt;

    const bool growth = change > 0.0;
    InsightItem item(growth ? "Revenue Growth Detected" : "Revenue Decline Detected",
                     "Your revenue has " + std::string(growth ? "increased" : "decreased") + " by "
                     + num::formatPercent(std::abs(change), 1)
                     + "% compared to the previous period "
                     + periodComparison(previousRevenue, currentRevenue) + ".",
                     growth ? InsightSeverity::Success : InsightSeverity::Warning,
                     InsightCategory::RevenueTrend);

    return item.withRecommendation(growth
                                   ? "Consider analyzing which products or services drove this growth to replicate success."
                                   : "Review recent changes that may have impacted revenue and consider promotional strategies.")
      .withMetricValue(currentRevenue)
      .withPercentageChange(change);
}

std::optional<InsightItem> TrendAnalyzer::expenseTrend(const Money& previousExpenses,
                                                       const Money& currentExpenses) const
{
    if (!(previousExpenses > Money(0)))
        return std::nullopt;

    const double change = percentChange(previousExpenses, currentExpenses);
    if (std::abs(change) < mThresholds.significantChangePercent)
        return std::nullopt;

    const bool increase = change > 0.0;
    InsightItem item(increase ? "Expense Increase Detected" : "Expense Reduction Achieved",
                     "Your expenses have " + std::string(increase ? "increased" : "decreased") + " by "
                     + num::formatPercent(std::abs(change), 1)
                     + "% compared to the previous period "
                     + periodComparison(previousExpenses, currentExpenses) + ".",
                     increase ? InsightSeverity::Warning : InsightSeverity::Success,
                     InsightCategory::ExpenseTrend);

    return item.withRecommendation(increase
                                   ? "Review expense categories to identify areas where costs can be optimized."
                                   : "Good job on cost management! Document what strategies worked for future reference.")
      .withMetricValue(currentExpenses)
      .withPercentageChange(change);
}

std::optional<InsightItem>
TrendAnalyzer::dayOfWeekPattern(const std::vector<const ledger::Sale*>& currentSales) const
{
    if (currentSales.size() < static_cast<std::size_t>(mThresholds.dayOfWeekMinimumSales))
        return std::nullopt;

    std::map<int, Money> totalsByWeekday;
    for (const ledger::Sale* sale : currentSales)
    {
        const int weekday = sale->getDate().day_of_week().as_number();
        auto it = totalsByWeekday.find(weekday);
        if (it == totalsByWeekday.end())
            totalsByWeekday.emplace(weekday, sale->getEffectiveTotalUSD());
        else
            it->second = it->second + sale->getEffectiveTotalUSD();
    }

    const auto best = ledger::maxByValue(totalsByWeekday);
    const Money average = ledger::StatUtils<Money>::computeMean(ledger::valuesInKeyOrder(totalsByWeekday));

    // Refunds can leave the baseline at or below zero; a lift has no meaning then
    if (!(average > Money(0)))
        return std::nullopt;

    if (!(num::to_double(best->second) > num::to_double(average) * mThresholds.dayOfWeekLiftRatio))
        return std::nullopt;

    const double percentAbove = (num::to_double(best->second) / num::to_double(average) - 1.0) * 100.0;
    const std::string day = ledger::weekday_name(best->first);

    InsightItem item(day + " Sales Performance",
                     day + "s generate " + num::formatPercent(percentAbove, 0)
                     + "% more revenue than average daily sales (" + num::formatCurrency(best->second)
                     + " vs " + num::formatCurrency(average) + " average).",
                     InsightSeverity::Info,
                     InsightCategory::RevenueTrend);

    return item.withRecommendation("Consider running promotions or increasing staffing on " + day
                                   + "s to maximize this opportunity.")
      .withPercentageChange(percentAbove);
}

std::optional<InsightItem> TrendAnalyzer::seasonalPattern(const std::vector<ledger::Sale>& sales,
                                                          const ledger::LedgerDate& asOf) const
{
    const ledger::AnalysisDateRange trailingYear(ledger::add_months(asOf, -12), asOf);

    std::map<int, Money> totalsByMonth;
    for (const auto& sale : sales)
    {
        if (!trailingYear.contains(sale.getDate()))
            continue;

        const int month = sale.getDate().month().as_number();
        auto it = totalsByMonth.find(month);
        if (it == totalsByMonth.end())
            totalsByMonth.emplace(month, sale.getEffectiveTotalUSD());
        else
            it->second = it->second + sale.getEffectiveTotalUSD();
    }

    if (totalsByMonth.size() < static_cast<std::size_t>(mThresholds.seasonalMinimumMonths))
        return std::nullopt;

    const auto best = ledger::maxByValue(totalsByMonth);
    const Money average = ledger::StatUtils<Money>::computeMean(ledger::valuesInKeyOrder(totalsByMonth));
    if (!(average > Money(0)))
        return std::nullopt;

    if (!(num::to_double(best->second) > num::to_double(average) * mThresholds.seasonalLiftRatio))
        return std::nullopt;

    const double percentAbove = (num::to_double(best->second) / num::to_double(average) - 1.0) * 100.0;
    const std::string month = ledger::month_name(best->first);

    InsightItem item("Seasonal Pattern Identified",
                     "Historical data shows " + month + " generates " + num::formatPercent(percentAbove, 0)
                     + "% more revenue than average months.",
                     InsightSeverity::Info,
                     InsightCategory::RevenueTrend);

    return item.withRecommendation("Plan inventory and marketing campaigns ahead of " + month
                                   + " to capitalize on this seasonal trend.")
      .withPercentageChange(percentAbove);
}

std::optional<InsightItem> TrendAnalyzer::volumeTrend(std::size_t previousCount,
                                                      std::size_t currentCount) const
{
    if (previousCount == 0)
        return std::nullopt;

    const double change = ledger::countPercentChange(previousCount, currentCount);
    if (std::abs(change) < mThresholds.volumeChangePercent)
        return std::nullopt;

    const bool increase = change > 0.0;
    InsightItem item(increase ? "Transaction Volume Increasing" : "Transaction Volume Declining",
                     "Number of transactions has " + std::string(increase ? "increased" : "decreased")
                     + " by " + num::formatPercent(std::abs(change), 0) + "% ("
                     + std::to_string(previousCount) + " → " + std::to_string(currentCount)
                     + " transactions).",
                     increase ? InsightSeverity::Success : InsightSeverity::Warning,
                     InsightCategory::RevenueTrend);

    return item.withRecommendation(increase
                                   ? "Ensure operational capacity can handle increased demand."
                                   : "Consider outreach campaigns to re-engage customers.")
      .withPercentageChange(change);
}

} // namespace ledgerinsights
