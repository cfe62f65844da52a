#include "BusinessForecaster.h"
#include <cmath>
#include <algorithm>
#include <map>
#include <stdexcept>
#include "BaselineForecaster.h"
#include "BoostDateHelper.h"
#include "ConfidenceScorer.h"
#include "DecimalConstants.h"
#include "ForecastAccuracy.h"
#include "LedgerSeries.h"
#include "StatUtils.h"

namespace ledgerinsights
{
using ledger::AnalysisDateRange;
using ledger::LedgerDate;
using forecasting::BaselineForecaster;

namespace
{
using Constants = ledger::DecimalConstants<Money>;

double growthPercent(const Money& latest, const Money& forecast)
{
    return num::to_double(ledger::StatUtils<Money>::percentChange(latest, forecast));
}

Money clampAtZero(const Money& value)
{
    return value < Constants::DecimalZero ? Constants::DecimalZero : value;
}
}

BusinessForecaster::BusinessForecaster(const AnalysisThresholds& thresholds,
                                       const ForecastSettings& settings)
  : mThresholds(thresholds),
    mSettings(settings)
{}

ForecastData BusinessForecaster::generateForecast(const ledger::CompanyData& company,
                                                  const LedgerDate& asOf,
                                                  std::ostream& os) const
{
    const MonthlySeries revenue = monthlyTotals(company.getSales(), asOf, HistoryMonths);
    const MonthlySeries expenses = monthlyTotals(company.getPurchases(), asOf, HistoryMonths);
    const std::size_t minimumMonths = static_cast<std::size_t>(mThresholds.minimumForecastMonths);

    ForecastData forecast;
    forecast.forecastMethod = MethodName;
    forecast.dataMonthsUsed = static_cast<int>(std::max(revenue.values.size(), expenses.values.size()));

    if (revenue.values.size() >= minimumMonths)
    {
        forecast.forecastedRevenue = clampAtZero(BaselineForecaster::forecastNextPeriod(revenue.values).value);
        if (revenue.values.back() > Constants::DecimalZero)
            forecast.revenueGrowthPercent = growthPercent(revenue.values.back(), forecast.forecastedRevenue);
    }

    if (expenses.values.size() >= minimumMonths)
    {
        forecast.forecastedExpenses = clampAtZero(BaselineForecaster::forecastNextPeriod(expenses.values).value);
        if (expenses.values.back() > Constants::DecimalZero)
            forecast.expenseGrowthPercent = growthPercent(expenses.values.back(), forecast.forecastedExpenses);
    }

    forecast.forecastedProfit = forecast.forecastedRevenue - forecast.forecastedExpenses;

    const Money latestRevenue = revenue.values.empty() ? Constants::DecimalZero : revenue.values.back();
    const Money latestExpenses = expenses.values.empty() ? Constants::DecimalZero : expenses.values.back();
    const Money latestProfit = latestRevenue - latestExpenses;
    if (latestProfit != Constants::DecimalZero)
        forecast.profitGrowthPercent = growthPercent(latestProfit, forecast.forecastedProfit);

    const MonthlySeries newCustomers = monthlyNewCustomers(company.getSales(), asOf, HistoryMonths);
    if (newCustomers.values.size() >= minimumMonths)
    {
        const double expected = num::to_double(BaselineForecaster::forecastNextPeriod(newCustomers.values).value);
        forecast.expectedNewCustomers = std::max(0, static_cast<int>(std::lround(expected)));
        if (newCustomers.values.back() > Constants::DecimalZero)
            forecast.customerGrowthPercent = growthPercent(newCustomers.values.back(),
                                                           Money(forecast.expectedNewCustomers));
    }

    forecasting::EnsembleForecaster ensemble(os);
    forecast.seasonalPattern = ensemble.detectSeasonality(revenue.values,
                                                          revenue.startMonth == 0 ? 1 : revenue.startMonth);

    std::optional<double> historicalAccuracy;
    if (auto recent = forecasting::ForecastAccuracyTracker::recentAccuracy(company.getForecastRecords(),
                                                                             mSettings.recentAccuracyCount))
        historicalAccuracy = recent->revenueAccuracy;

    forecast.confidenceScore = forecasting::ConfidenceScorer::score(revenue.values,
                                                                    forecast.seasonalPattern.seasonalStrength,
                                                                    historicalAccuracy);
    forecast.confidenceLevel = confidenceLevelFromScore(forecast.confidenceScore);

    os << "   [BusinessForecaster] " << forecast.dataMonthsUsed << " month(s), revenue "
       << num::formatCurrency(forecast.forecastedRevenue) << ", confidence "
       << num::formatPercent(forecast.confidenceScore, 0) << std::endl;
    return forecast;
}

std::vector<InsightItem> BusinessForecaster::forecastInsights(const ForecastData& forecast,
                                                              const ledger::CompanyData& company,
                                                              const AnalysisDateRange& range,
                                                              std::ostream& os) const
{
    std::vector<InsightItem> insights;

    if (forecast.forecastedRevenue > Constants::DecimalZero)
    {
        const bool narrow = forecast.confidenceScore >= 70.0;
        const Money& margin = narrow ? Constants::TenPercent : Constants::TwentyPercent;
        const Money low = forecast.forecastedRevenue - forecast.forecastedRevenue * margin;
        const Money high = forecast.forecastedRevenue + forecast.forecastedRevenue * margin;

        insights.emplace_back(InsightItem("Next Month Revenue Forecast",
                                          "Based on " + std::to_string(forecast.dataMonthsUsed)
                                          + " months of historical data, expected revenue for next month is "
                                          + num::formatCurrency(low) + " - " + num::formatCurrency(high)
                                          + " (" + (narrow ? "±10%" : "±20%") + ").",
                                          InsightSeverity::Info,
                                          InsightCategory::Forecast).withMetricValue(forecast.forecastedRevenue));
    }

    if (forecast.forecastedProfit != Constants::DecimalZero)
    {
        const bool positive = forecast.forecastedProfit > Constants::DecimalZero;
        insights.emplace_back(InsightItem("Cash Flow Projection",
                                          std::string("Projected cash flow for the next 30 days is ")
                                          + (positive ? "positive" : "negative") + ". Expected "
                                          + (positive ? "surplus" : "shortfall") + ": "
                                          + num::formatCurrency(num::abs(forecast.forecastedProfit)) + ".",
                                          positive ? InsightSeverity::Success : InsightSeverity::Warning,
                                          InsightCategory::Forecast).withMetricValue(forecast.forecastedProfit));
    }

    const std::vector<std::string> depleting = depletingProducts(company, range);
    if (!depleting.empty())
    {
        std::string names;
        for (std::size_t i = 0; i < depleting.size() && i < 3; ++i)
            names += (i == 0 ? "" : ", ") + depleting[i];

        InsightItem item("Inventory Depletion Alert",
                         "At current sales velocity, " + std::to_string(depleting.size())
                         + " product(s) will reach reorder point within 2 weeks.",
                         InsightSeverity::Warning,
                         InsightCategory::Inventory);
        insights.push_back(item.withRecommendation("Review and place orders for low-stock items: " + names)
                           .withMetricValue(Money(static_cast<int>(depleting.size()))));
    }

    os << "   [BusinessForecaster] " << insights.size() << " forecast insight(s), "
       << depleting.size() << " depleting product(s)" << std::endl;
    return insights;
}

std::vector<std::string> BusinessForecaster::depletingProducts(const ledger::CompanyData& company,
                                                               const AnalysisDateRange& range) const
{
    const AnalysisDateRange window(range.getEndDate() - ledger::date_duration(mThresholds.inventoryVelocityDays),
                                   range.getEndDate());

    std::map<std::string, Money> quantitySold;
    for (const ledger::Sale* sale : transactionsInRange(company.getSales(), window))
        for (const auto& line : sale->getLineItems())
        {
            auto it = quantitySold.find(line.getProductId());
            if (it == quantitySold.end())
                quantitySold.emplace(line.getProductId(), line.getQuantity());
            else
                it->second = it->second + line.getQuantity();
        }

    std::vector<std::string> names;
    for (const auto& entry : quantitySold)
    {
        const double dailyVelocity = num::to_double(entry.second) / mThresholds.inventoryVelocityDays;
        if (!(dailyVelocity > 0.0))
            continue;

        const auto& inventory = company.getInventory();
        auto record = std::find_if(inventory.begin(), inventory.end(),
                                   [&entry](const ledger::InventoryRecord& r) {
            return r.getProductId() == entry.first;
        });
        if (record == inventory.end() || record->getInStock() <= 0)
            continue;

        const double daysUntilEmpty = record->getInStock() / dailyVelocity;
        if (daysUntilEmpty > mThresholds.inventoryDepletionDays)
            continue;

        if (auto product = company.getProduct(entry.first))
            names.push_back(product->getName());
    }

    return names;
}

forecasting::EnhancedForecastResult
BusinessForecaster::enhancedRevenueForecast(const ledger::CompanyData& company,
                                            const LedgerDate& asOf,
                                            int periods,
                                            forecasting::ForecastMethod method,
                                            std::ostream& os) const
{
    const MonthlySeries revenue = monthlyTotals(company.getSales(), asOf, mSettings.enhancedHistoryMonths);

    forecasting::EnsembleForecaster ensemble(os);
    return ensemble.forecast(revenue.values, periods, method,
                             revenue.startMonth == 0 ? 1 : revenue.startMonth);
}

} // namespace ledgerinsights
