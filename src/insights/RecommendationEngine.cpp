#include "RecommendationEngine.h"
#include <algorithm>
#include <map>
#include <string>
#include "BoostDateHelper.h"
#include "GroupingUtils.h"
#include "LedgerSeries.h"

namespace ledgerinsights
{
using ledger::AnalysisDateRange;
using ledger::LedgerDate;

namespace
{
struct ProductTotals
{
    Money revenue = Money(0);
    Money cost = Money(0);
};

template <class Transaction>
std::map<std::string, Money> totalsByCounterparty(const std::vector<Transaction>& transactions,
                                                  const AnalysisDateRange& range)
{
    std::map<std::string, Money> totals;
    for (const auto& t : transactions)
    {
        if (!range.contains(t.getDate()))
            continue;

        auto it = totals.find(t.getCounterpartyId());
        if (it == totals.end())
            totals.emplace(t.getCounterpartyId(), t.getEffectiveTotalUSD());
        else
            it->second = it->second + t.getEffectiveTotalUSD();
    }
    return totals;
}

Money sumOf(const std::map<std::string, Money>& totals)
{
    Money sum(0);
    for (const auto& entry : totals)
        sum = sum + entry.second;
    return sum;
}
}

RecommendationEngine::RecommendationEngine(const AnalysisThresholds& thresholds)
  : mThresholds(thresholds)
{}

std::vector<InsightItem> RecommendationEngine::analyze(const ledger::CompanyData& company,
                                                       const AnalysisDateRange& range,
                                                       const LedgerDate& asOf,
                                                       std::ostream& os) const
{
    std::vector<InsightItem> recommendations;

    if (auto item = topProduct(company, range))
        recommendations.push_back(*item);

    if (auto item = inactiveCustomers(company, range))
        recommendations.push_back(*item);

    if (auto item = overdueInvoices(company, asOf))
        recommendations.push_back(*item);

    if (auto item = supplierConcentration(company, range))
        recommendations.push_back(*item);

    if (auto item = customerConcentration(company, range))
        recommendations.push_back(*item);

    if (auto item = profitMargin(totalInRange(company.getSales(), range),
                                 totalInRange(company.getPurchases(), range)))
        recommendations.push_back(*item);

    os << "   [RecommendationEngine] " << recommendations.size() << " recommendation(s)" << std::endl;
    return recommendations;
}

std::optional<InsightItem> RecommendationEngine::topProduct(const ledger::CompanyData& company,
                                                            const AnalysisDateRange& range) const
{
    std::map<std::string, ProductTotals> products;
    for (const ledger::Sale* sale : transactionsInRange(company.getSales(), range))
        for (const auto& line : sale->getLineItems())
        {
            if (line.getProductId().empty())
                continue;

            ProductTotals& totals = products[line.getProductId()];
            totals.revenue = totals.revenue + line.getAmount();
            if (auto product = company.getProduct(line.getProductId()))
                totals.cost = totals.cost + line.getQuantity() * product->getCostPrice();
        }

    const std::string* bestId = nullptr;
    double bestMargin = 0.0;
    Money bestRevenue(0);
    for (const auto& entry : products)
    {
        const ProductTotals& totals = entry.second;
        if (!(totals.cost > Money(0)) || totals.revenue == Money(0))
            continue;

        const double margin = num::to_double(totals.revenue - totals.cost) / num::to_double(totals.revenue) * 100.0;
        if (bestId == nullptr || margin > bestMargin)
        {
            bestId = &entry.first;
            bestMargin = margin;
            bestRevenue = totals.revenue;
        }
    }

    if (bestId == nullptr)
        return std::nullopt;

    auto product = company.getProduct(*bestId);
    if (!product)
        return std::nullopt;

    InsightItem item("Top Performing Product",
                     "\"" + product->getName() + "\" has the highest profit margin at "
                     + num::formatPercent(bestMargin, 0) + "%. Revenue this period: "
                     + num::formatCurrency(bestRevenue) + ".",
                     InsightSeverity::Info,
                     InsightCategory::Product);

    return item.withRecommendation("Consider featuring this product more prominently in marketing or bundling it with other items.")
      .withMetricValue(bestRevenue)
      .withPercentageChange(bestMargin);
}

std::optional<InsightItem> RecommendationEngine::inactiveCustomers(const ledger::CompanyData& company,
                                                                   const AnalysisDateRange& range) const
{
    std::map<std::string, LedgerDate> lastPurchase;
    std::map<std::string, int> purchaseCount;
    for (const auto& sale : company.getSales())
    {
        const std::string& customerId = sale.getCustomerId();
        if (customerId.empty())
            continue;

        ++purchaseCount[customerId];
        auto it = lastPurchase.find(customerId);
        if (it == lastPurchase.end())
            lastPurchase.emplace(customerId, sale.getDate());
        else if (it->second < sale.getDate())
            it->second = sale.getDate();
    }

    int inactiveCount = 0;
    for (const auto& entry : lastPurchase)
        if (ledger::days_between(entry.second, range.getEndDate()) > mThresholds.inactivityDays &&
            purchaseCount[entry.first] >= mThresholds.minimumPurchasesForInactive)
            ++inactiveCount;

    if (inactiveCount == 0)
        return std::nullopt;

    InsightItem item("Customer Retention Opportunity",
                     std::to_string(inactiveCount) + " previously active customer(s) haven't made a purchase in over "
                     + std::to_string(mThresholds.inactivityDays) + " days.",
                     InsightSeverity::Info,
                     InsightCategory::Customer);

    return item.withRecommendation("Consider sending re-engagement emails, special offers, or conducting a satisfaction survey.")
      .withMetricValue(Money(inactiveCount));
}

std::optional<InsightItem> RecommendationEngine::overdueInvoices(const ledger::CompanyData& company,
                                                                 const LedgerDate& asOf) const
{
    int count = 0;
    long oldestDaysOverdue = 0;
    Money totalOverdue(0);
    for (const auto& invoice : company.getInvoices())
    {
        if (!invoice.isOverdue(asOf) || !(invoice.getEffectiveBalanceUSD() > Money(0)))
            continue;

        ++count;
        totalOverdue = totalOverdue + invoice.getEffectiveBalanceUSD();
        oldestDaysOverdue = std::max(oldestDaysOverdue, invoice.daysOverdue(asOf));
    }

    if (count == 0)
        return std::nullopt;

    InsightItem item("Payment Collection Needed",
                     std::to_string(count) + " invoice(s) totaling " + num::formatCurrency(totalOverdue)
                     + " are overdue. Oldest is " + std::to_string(oldestDaysOverdue) + " days past due.",
                     oldestDaysOverdue > mThresholds.overdueWarningDays ? InsightSeverity::Warning
                     : InsightSeverity::Info,
                     InsightCategory::Payment);

    return item.withRecommendation("Send payment reminders and follow up with these customers to improve cash flow.")
      .withMetricValue(totalOverdue);
}

std::optional<InsightItem> RecommendationEngine::supplierConcentration(const ledger::CompanyData& company,
                                                                       const AnalysisDateRange& range) const
{
    const std::map<std::string, Money> bySupplier = totalsByCounterparty(company.getPurchases(), range);
    if (bySupplier.size() < 2)
        return std::nullopt;

    const auto top = ledger::maxByValue(bySupplier);
    auto supplier = company.getSupplier(top->first);
    if (!supplier)
        return std::nullopt;

    const Money total = sumOf(bySupplier);
    if (!(total > Money(0)))
        return std::nullopt;

    const double concentration = num::to_double(top->second) / num::to_double(total) * 100.0;
    if (!(concentration > mThresholds.supplierConcentrationPercent))
        return std::nullopt;

    InsightItem item("Supplier Concentration Risk",
                     num::formatPercent(concentration, 0) + "% of your purchases ("
                     + num::formatCurrency(top->second) + ") are from " + supplier->getName() + ".",
                     InsightSeverity::Info,
                     InsightCategory::Recommendation);

    return item.withRecommendation("Consider diversifying suppliers to reduce risk and potentially negotiate better terms.")
      .withPercentageChange(concentration);
}

std::optional<InsightItem> RecommendationEngine::customerConcentration(const ledger::CompanyData& company,
                                                                       const AnalysisDateRange& range) const
{
    const std::map<std::string, Money> byCustomer = totalsByCounterparty(company.getSales(), range);
    if (byCustomer.size() < 3)
        return std::nullopt;

    const Money total = sumOf(byCustomer);
    if (total == Money(0))
        return std::nullopt;

    const auto top = ledger::maxByValue(byCustomer);
    const double concentration = num::to_double(top->second) / num::to_double(total) * 100.0;
    if (!(concentration > mThresholds.customerConcentrationPercent))
        return std::nullopt;

    auto customer = company.getCustomer(top->first);
    const std::string customerName = customer ? customer->getName() : std::string("your top customer");

    InsightItem item("Revenue Concentration Risk",
                     num::formatPercent(concentration, 0) + "% of revenue comes from " + customerName
                     + ". This creates business risk if that relationship changes.",
                     InsightSeverity::Warning,
                     InsightCategory::Customer);

    return item.withRecommendation("Work on diversifying your customer base through acquisition and marketing efforts.")
      .withPercentageChange(concentration);
}

std::optional<InsightItem> RecommendationEngine::profitMargin(const Money& revenue, const Money& expenses) const
{
    if (revenue == Money(0))
        return std::nullopt;

    const double margin = num::to_double(revenue - expenses) / num::to_double(revenue) * 100.0;

    if (margin < mThresholds.lowMarginPercent)
    {
        InsightItem item("Low Profit Margin Alert",
                         "Your current profit margin is " + num::formatPercent(margin, 1)
                         + "%. Industry benchmarks typically suggest 15-20% for healthy businesses.",
                         InsightSeverity::Warning,
                         InsightCategory::Recommendation);

        return item.withRecommendation("Review pricing strategy and look for cost reduction opportunities to improve profitability.")
          .withPercentageChange(margin);
    }

    if (margin > mThresholds.strongMarginPercent)
    {
        InsightItem item("Strong Profit Margins",
                         "Your profit margin of " + num::formatPercent(margin, 1)
                         + "% is excellent. You're maintaining healthy profitability.",
                         InsightSeverity::Success,
                         InsightCategory::Recommendation);

        return item.withPercentageChange(margin);
    }

    return std::nullopt;
}

} // namespace ledgerinsights
