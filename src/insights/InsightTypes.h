#pragma once

#include <map>
#include <string>
#include <vector>
#include <optional>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "number.h"

namespace ledgerinsights
{

using Money = num::DefaultNumber;

/**
 * @brief How urgently an insight should be read
 */
enum class InsightSeverity
{
    Info,
    Success,
    Warning,
    Critical
};

/**
 * @brief Which part of the business an insight is about
 */
enum class InsightCategory
{
    RevenueTrend,
    ExpenseTrend,
    Anomaly,
    Forecast,
    Inventory,
    Product,
    Customer,
    Payment,
    Recommendation
};

/**
 * @brief Coarse reading of a 0..100 confidence score
 */
enum class ConfidenceLevel
{
    Low,
    Medium,
    High
};

enum class TrendDirection
{
    Increasing,
    Stable,
    Decreasing
};

/**
 * @brief Every severity, in declaration order. Used by exhaustive mapping checks.
 */
const std::vector<InsightSeverity>& getAllSeverities();

/**
 * @brief Every category, in declaration order.
 */
const std::vector<InsightCategory>& getAllCategories();

std::string getSeverityLabel(InsightSeverity severity);

/**
 * @brief Display color for a severity as a #RRGGBB string
 */
std::string getSeverityColor(InsightSeverity severity);

std::string getCategoryLabel(InsightCategory category);

std::string getConfidenceLevelLabel(ConfidenceLevel level);

/**
 * @brief Map a score to a level: below 50 Low, 50 up to 80 Medium, 80 and above High
 */
ConfidenceLevel confidenceLevelFromScore(double score);

std::string getTrendDirectionLabel(TrendDirection direction);

/**
 * @class InsightItem
 * @brief One finding produced by an analyzer.
 *
 * Items are immutable. Optional parts are attached with the with* methods,
 * each of which returns a new item.
 */
class InsightItem
{
public:
    InsightItem(const std::string& title,
                const std::string& description,
                InsightSeverity severity,
                InsightCategory category);

    const std::string& getTitle() const { return mTitle; }
    const std::string& getDescription() const { return mDescription; }
    const std::optional<std::string>& getRecommendation() const { return mRecommendation; }
    InsightSeverity getSeverity() const { return mSeverity; }
    InsightCategory getCategory() const { return mCategory; }
    const std::optional<Money>& getMetricValue() const { return mMetricValue; }
    const std::optional<double>& getPercentageChange() const { return mPercentageChange; }

    InsightItem withRecommendation(const std::string& recommendation) const;
    InsightItem withMetricValue(const Money& metricValue) const;
    InsightItem withPercentageChange(double percentageChange) const;

    bool operator==(const InsightItem& rhs) const;
    bool operator!=(const InsightItem& rhs) const { return !(*this == rhs); }

private:
    std::string mTitle;
    std::string mDescription;
    std::optional<std::string> mRecommendation;
    InsightSeverity mSeverity;
    InsightCategory mCategory;
    std::optional<Money> mMetricValue;
    std::optional<double> mPercentageChange;
};

/**
 * @brief Repeating pattern found in a monthly series
 *
 * seasonalFactors are ordered by phase: factor i belongs to periods whose
 * index within the series is congruent to i modulo seasonLength.
 */
struct SeasonalPattern
{
    int seasonLength = 12;
    std::vector<double> seasonalFactors;
    double seasonalStrength = 0.0;       ///< 0..1
    TrendDirection trendDirection = TrendDirection::Stable;
    double trendSlope = 0.0;
    std::string description;

    bool operator==(const SeasonalPattern& rhs) const;
    bool operator!=(const SeasonalPattern& rhs) const { return !(*this == rhs); }
};

/**
 * @brief Next month business forecast
 */
struct ForecastData
{
    Money forecastedRevenue = Money(0);
    Money forecastedExpenses = Money(0);
    Money forecastedProfit = Money(0);
    double revenueGrowthPercent = 0.0;
    double expenseGrowthPercent = 0.0;
    double profitGrowthPercent = 0.0;
    int expectedNewCustomers = 0;
    double customerGrowthPercent = 0.0;
    double confidenceScore = 0.0;        ///< 0..100
    ConfidenceLevel confidenceLevel = ConfidenceLevel::Low;
    int dataMonthsUsed = 0;
    std::string forecastMethod;
    SeasonalPattern seasonalPattern;

    bool operator==(const ForecastData& rhs) const;
    bool operator!=(const ForecastData& rhs) const { return !(*this == rhs); }
};

struct InsightsSummary
{
    int totalInsights = 0;
    int trendsDetected = 0;
    int anomaliesDetected = 0;
    int forecastsGenerated = 0;
    int opportunities = 0;
    int monthsOfData = 0;
    std::map<InsightCategory, int> countsByCategory;

    bool operator==(const InsightsSummary& rhs) const;
    bool operator!=(const InsightsSummary& rhs) const { return !(*this == rhs); }
};

/**
 * @brief Complete result of one insights run
 *
 * When hasSufficientData is false every list is empty and
 * insufficientDataMessage says why. Equality ignores generatedAt, which is
 * the wall clock time of the run.
 */
struct InsightsData
{
    bool hasSufficientData = false;
    std::string insufficientDataMessage;
    std::vector<InsightItem> revenueTrends;
    std::vector<InsightItem> anomalies;
    std::vector<InsightItem> forecasts;
    std::vector<InsightItem> recommendations;
    ForecastData forecast;
    InsightsSummary summary;
    boost::posix_time::ptime generatedAt;

    bool operator==(const InsightsData& rhs) const;
    bool operator!=(const InsightsData& rhs) const { return !(*this == rhs); }
};

} // namespace ledgerinsights
