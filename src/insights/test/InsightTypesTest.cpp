#include <catch2/catch_test_macros.hpp>
#include <set>
#include "InsightTypes.h"
#include "TestUtils.h"

using namespace ledgerinsights;

TEST_CASE("Every severity has a label and a distinct color", "[InsightTypes]")
{
    std::set<std::string> labels;
    std::set<std::string> colors;

    for (InsightSeverity severity : getAllSeverities())
    {
        const std::string label = getSeverityLabel(severity);
        const std::string color = getSeverityColor(severity);

        REQUIRE_FALSE(label.empty());
        REQUIRE(color.size() == 7);
        REQUIRE(color.front() == '#');

        labels.insert(label);
        colors.insert(color);
    }

    REQUIRE(getAllSeverities().size() == 4);
    REQUIRE(labels.size() == 4);
    REQUIRE(colors.size() == 4);
    REQUIRE(getSeverityLabel(InsightSeverity::Critical) == "Critical");
}

TEST_CASE("Every category has a distinct label", "[InsightTypes]")
{
    std::set<std::string> labels;
    for (InsightCategory category : getAllCategories())
        labels.insert(getCategoryLabel(category));

    REQUIRE(getAllCategories().size() == 9);
    REQUIRE(labels.size() == 9);
    REQUIRE(getCategoryLabel(InsightCategory::RevenueTrend) == "Revenue Trend");
}

TEST_CASE("Confidence level boundaries", "[InsightTypes]")
{
    REQUIRE(confidenceLevelFromScore(0.0) == ConfidenceLevel::Low);
    REQUIRE(confidenceLevelFromScore(49.9) == ConfidenceLevel::Low);
    REQUIRE(confidenceLevelFromScore(50.0) == ConfidenceLevel::Medium);
    REQUIRE(confidenceLevelFromScore(79.9) == ConfidenceLevel::Medium);
    REQUIRE(confidenceLevelFromScore(80.0) == ConfidenceLevel::High);
    REQUIRE(getConfidenceLevelLabel(ConfidenceLevel::Medium) == "Medium");
}

TEST_CASE("InsightItem with* methods leave the original untouched", "[InsightTypes]")
{
    const InsightItem base("Title", "Description", InsightSeverity::Info, InsightCategory::Forecast);
    const InsightItem decorated = base.withRecommendation("Do something")
        .withMetricValue(createDecimal("12.50"))
        .withPercentageChange(-3.5);

    REQUIRE_FALSE(base.getRecommendation().has_value());
    REQUIRE_FALSE(base.getMetricValue().has_value());
    REQUIRE_FALSE(base.getPercentageChange().has_value());

    REQUIRE(*decorated.getRecommendation() == "Do something");
    REQUIRE(*decorated.getMetricValue() == createDecimal("12.50"));
    REQUIRE(*decorated.getPercentageChange() == -3.5);
    REQUIRE(decorated.getTitle() == base.getTitle());
    REQUIRE(decorated != base);
}

TEST_CASE("InsightsData equality ignores the generation time", "[InsightTypes]")
{
    InsightsData first;
    InsightsData second;
    first.generatedAt = boost::posix_time::ptime(boost::gregorian::date(2024, 1, 1));
    second.generatedAt = boost::posix_time::ptime(boost::gregorian::date(2025, 6, 1));

    REQUIRE(first == second);

    second.anomalies.push_back(InsightItem("A", "B", InsightSeverity::Warning, InsightCategory::Anomaly));
    REQUIRE(first != second);
}
