#include "InsightTypes.h"
#include <stdexcept>

namespace ledgerinsights
{

const std::vector<InsightSeverity>& getAllSeverities()
{
    static const std::vector<InsightSeverity> severities = {
        InsightSeverity::Info,
        InsightSeverity::Success,
        InsightSeverity::Warning,
        InsightSeverity::Critical
    };
    return severities;
}

const std::vector<InsightCategory>& getAllCategories()
{
    static const std::vector<InsightCategory> categories = {
        InsightCategory::RevenueTrend,
        InsightCategory::ExpenseTrend,
        InsightCategory::Anomaly,
        InsightCategory::Forecast,
        InsightCategory::Inventory,
        InsightCategory::Product,
        InsightCategory::Customer,
        InsightCategory::Payment,
        InsightCategory::Recommendation
    };
    return categories;
}

std::string getSeverityLabel(InsightSeverity severity)
{
    switch (severity)
    {
        case InsightSeverity::Info:
            return "Info";
        case InsightSeverity::Success:
            return "Success";
        case InsightSeverity::Warning:
            return "Warning";
        case InsightSeverity::Critical:
            return "Critical";
        default:
            throw std::invalid_argument("Unknown insight severity");
    }
}

std::string getSeverityColor(InsightSeverity severity)
{
    switch (severity)
    {
        case InsightSeverity::Info:
            return "#3B82F6";
        case InsightSeverity::Success:
            return "#22C55E";
        case InsightSeverity::Warning:
            return "#F59E0B";
        case InsightSeverity::Critical:
            return "#EF4444";
        default:
            throw std::invalid_argument("Unknown insight severity");
    }
}

std::string getCategoryLabel(InsightCategory category)
{
    switch (category)
    {
        case InsightCategory::RevenueTrend:
            return "Revenue Trend";
        case InsightCategory::ExpenseTrend:
            return "Expense Trend";
        case InsightCategory::Anomaly:
            return "Anomaly";
        case InsightCategory::Forecast:
            return "Forecast";
        case InsightCategory::Inventory:
            return "Inventory";
        case InsightCategory::Product:
            return "Product";
        case InsightCategory::Customer:
            return "Customer";
        case InsightCategory::Payment:
            return "Payment";
        case InsightCategory::Recommendation:
            return "Recommendation";
        default:
            throw std::invalid_argument("Unknown insight category");
    }
}

std::string getConfidenceLevelLabel(ConfidenceLevel level)
{
    switch (level)
    {
        case ConfidenceLevel::Low:
            return "Low";
        case ConfidenceLevel::Medium:
            return "Medium";
        case ConfidenceLevel::High:
            return "High";
        default:
            throw std::invalid_argument("Unknown confidence level");
    }
}

ConfidenceLevel confidenceLevelFromScore(double score)
{
    if (score >= 80.0)
        return ConfidenceLevel::High;
    if (score >= 50.0)
        return ConfidenceLevel::Medium;
    return ConfidenceLevel::Low;
}

std::string getTrendDirectionLabel(TrendDirection direction)
{
    switch (direction)
    {
        case TrendDirection::Increasing:
            return "Increasing";
        case TrendDirection::Stable:
            return "Stable";
        case TrendDirection::Decreasing:
            return "Decreasing";
        default:
            throw std::invalid_argument("Unknown trend direction");
    }
}

InsightItem::InsightItem(const std::string& title,
                         const std::string& description,
                         InsightSeverity severity,
                         InsightCategory category)
    : mTitle(title),
      mDescription(description),
      mRecommendation(),
      mSeverity(severity),
      mCategory(category),
      mMetricValue(),
      mPercentageChange()
{
}

InsightItem InsightItem::withRecommendation(const std::string& recommendation) const
{
    InsightItem item(*this);
    item.mRecommendation = recommendation;
    return item;
}

InsightItem InsightItem::withMetricValue(const Money& metricValue) const
{
    InsightItem item(*this);
    item.mMetricValue = metricValue;
    return item;
}

InsightItem InsightItem::withPercentageChange(double percentageChange) const
{
    InsightItem item(*this);
    item.mPercentageChange = percentageChange;
    return item;
}

bool InsightItem::operator==(const InsightItem& rhs) const
{
    return mTitle == rhs.mTitle
        && mDescription == rhs.mDescription
        && mRecommendation == rhs.mRecommendation
        && mSeverity == rhs.mSeverity
        && mCategory == rhs.mCategory
        && mMetricValue == rhs.mMetricValue
        && mPercentageChange == rhs.mPercentageChange;
}

bool SeasonalPattern::operator==(const SeasonalPattern& rhs) const
{
    return seasonLength == rhs.seasonLength
        && seasonalFactors == rhs.seasonalFactors
        && seasonalStrength == rhs.seasonalStrength
        && trendDirection == rhs.trendDirection
        && trendSlope == rhs.trendSlope
        && description == rhs.description;
}

bool ForecastData::operator==(const ForecastData& rhs) const
{
    return forecastedRevenue == rhs.forecastedRevenue
        && forecastedExpenses == rhs.forecastedExpenses
        && forecastedProfit == rhs.forecastedProfit
        && revenueGrowthPercent == rhs.revenueGrowthPercent
        && expenseGrowthPercent == rhs.expenseGrowthPercent
        && profitGrowthPercent == rhs.profitGrowthPercent
        && expectedNewCustomers == rhs.expectedNewCustomers
        && customerGrowthPercent == rhs.customerGrowthPercent
        && confidenceScore == rhs.confidenceScore
        && confidenceLevel == rhs.confidenceLevel
        && dataMonthsUsed == rhs.dataMonthsUsed
        && forecastMethod == rhs.forecastMethod
        && seasonalPattern == rhs.seasonalPattern;
}

bool InsightsSummary::operator==(const InsightsSummary& rhs) const
{
    return totalInsights == rhs.totalInsights
        && trendsDetected == rhs.trendsDetected
        && anomaliesDetected == rhs.anomaliesDetected
        && forecastsGenerated == rhs.forecastsGenerated
        && opportunities == rhs.opportunities
        && monthsOfData == rhs.monthsOfData
        && countsByCategory == rhs.countsByCategory;
}

bool InsightsData::operator==(const InsightsData& rhs) const
{
    return hasSufficientData == rhs.hasSufficientData
        && insufficientDataMessage == rhs.insufficientDataMessage
        && revenueTrends == rhs.revenueTrends
        && anomalies == rhs.anomalies
        && forecasts == rhs.forecasts
        && recommendations == rhs.recommendations
        && forecast == rhs.forecast
        && summary == rhs.summary;
}

} // namespace ledgerinsights
