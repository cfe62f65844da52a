#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "InsightsService.h"
#include "CancellationToken.h"
#include "ParallelExecutors.h"
#include "TestUtils.h"

using namespace ledgerinsights;
using ledger::AnalysisDateRange;
using ledger::CompanyData;
using ledger::ForecastAccuracyRecord;
using ledger::Purchase;
using ledger::Sale;
using ledger::Supplier;
using Catch::Approx;

namespace
{
  // January to March 2024: revenue and expenses both grow into March, and
  // one supplier takes most of the March purchases.
  CompanyData quarterOfTrading()
  {
    CompanyData company;
    company.addSupplier (Supplier ("V1", "Parts Inc"));
    company.addSupplier (Supplier ("V2", "Bolts Ltd"));

    company.addSale (Sale ("J1", createDate ("20240108"), Money(250), "C1"));
    company.addSale (Sale ("J2", createDate ("20240115"), Money(250), "C2"));
    company.addPurchase (Purchase ("JP1", createDate ("20240110"), Money(300), "V1"));

    const char* february[] = {"20240205", "20240212", "20240219", "20240226"};
    const char* march[] = {"20240304", "20240311", "20240318", "20240325"};
    for (int i = 0; i < 4; ++i)
      {
	const std::string customer = "C" + std::to_string (i + 1);
	company.addSale (Sale ("F" + std::to_string (i), createDate (february[i]), Money(250), customer));
	company.addSale (Sale ("M" + std::to_string (i), createDate (march[i]), Money(400), customer));
      }

    company.addPurchase (Purchase ("FP1", createDate ("20240207"), Money(300), "V1"));
    company.addPurchase (Purchase ("FP2", createDate ("20240221"), Money(300), "V1"));
    company.addPurchase (Purchase ("MP1", createDate ("20240306"), Money(700), "V1"));
    company.addPurchase (Purchase ("MP2", createDate ("20240320"), Money(700), "V1"));
    company.addPurchase (Purchase ("MP3", createDate ("20240322"), Money(100), "V2"));
    return company;
  }

  AnalysisDateRange march2024()
  {
    return AnalysisDateRange (createDate ("20240301"), createDate ("20240331"));
  }

  bool containsTitle(const std::vector<InsightItem>& items, const std::string& title)
  {
    for (const auto& item : items)
      if (item.getTitle() == title)
	return true;

    return false;
  }
}

TEST_CASE ("Full insights run over a quarter of trading", "[InsightsService]")
{
  std::ostringstream log;
  const InsightsService service (InsightsConfiguration::createDefault(), log);
  const CompanyData company = quarterOfTrading();

  const InsightsData data = service.generateInsights (company, march2024(), createDate ("20240331"));

  REQUIRE (data.hasSufficientData);
  REQUIRE (data.insufficientDataMessage.empty());

  REQUIRE (data.revenueTrends.size() == 2);
  REQUIRE (data.revenueTrends[0].getTitle() == "Revenue Growth Detected");
  REQUIRE (*data.revenueTrends[0].getPercentageChange() == Approx (60.0));
  REQUIRE (data.revenueTrends[1].getTitle() == "Expense Increase Detected");

  REQUIRE (data.recommendations.size() == 2);
  REQUIRE (data.recommendations[0].getTitle() == "Supplier Concentration Risk");
  REQUIRE (data.recommendations[1].getTitle() == "Low Profit Margin Alert");

  REQUIRE (data.forecast.dataMonthsUsed == 3);
  REQUIRE (data.forecast.forecastedRevenue > Money(0));
  REQUIRE (containsTitle (data.forecasts, "Next Month Revenue Forecast"));

  const InsightsSummary& summary = data.summary;
  REQUIRE (summary.trendsDetected == 2);
  REQUIRE (summary.anomaliesDetected == static_cast<int>(data.anomalies.size()));
  REQUIRE (summary.forecastsGenerated == static_cast<int>(data.forecasts.size()));
  REQUIRE (summary.opportunities == 2);
  REQUIRE (summary.totalInsights == summary.trendsDetected + summary.anomaliesDetected
	   + summary.forecastsGenerated + summary.opportunities);
  REQUIRE (summary.monthsOfData == 1);

  int categorized = 0;
  for (const auto& entry : summary.countsByCategory)
    categorized += entry.second;
  REQUIRE (categorized == summary.totalInsights);
  REQUIRE (summary.countsByCategory.at (InsightCategory::RevenueTrend) == 1);
  REQUIRE (summary.countsByCategory.at (InsightCategory::ExpenseTrend) == 1);

  REQUIRE (log.str().find ("[InsightsService]") != std::string::npos);
  REQUIRE_FALSE (data.generatedAt.is_not_a_date_time());
}

TEST_CASE ("Repeated runs give equal results", "[InsightsService]")
{
  const InsightsService service;
  const CompanyData company = quarterOfTrading();

  const InsightsData first = service.generateInsights (company, march2024(), createDate ("20240331"));
  const InsightsData second = service.generateInsights (company, march2024(), createDate ("20240331"));

  REQUIRE (first == second);
  REQUIRE (service.analyzeTrends (company, march2024(), createDate ("20240331")) == first.revenueTrends);
  REQUIRE (service.detectAnomalies (company, march2024(), createDate ("20240331")) == first.anomalies);
  REQUIRE (service.generateRecommendations (company, march2024(), createDate ("20240331"))
	   == first.recommendations);
  REQUIRE (service.generateForecast (company, march2024(), createDate ("20240331")) == first.forecast);
}

TEST_CASE ("Insufficient data stops the run", "[InsightsService]")
{
  CompanyData company;
  company.addSale (Sale ("S1", createDate ("20240305"), Money(100), "C1"));
  company.addSale (Sale ("S2", createDate ("20240306"), Money(100), "C1"));

  const InsightsService service;
  const InsightsData data = service.generateInsights (company, march2024(), createDate ("20240331"));

  REQUIRE_FALSE (data.hasSufficientData);
  REQUIRE (data.insufficientDataMessage ==
	   "Need at least 5 transactions for meaningful insights. Currently have 2.");
  REQUIRE (data.revenueTrends.empty());
  REQUIRE (data.anomalies.empty());
  REQUIRE (data.forecasts.empty());
  REQUIRE (data.recommendations.empty());
  REQUIRE (data.summary.totalInsights == 0);
}

TEST_CASE ("Thresholds from the configuration reach the analyzers", "[InsightsService]")
{
  AnalysisThresholds thresholds;
  thresholds.minimumTransactions = 50;

  const InsightsService service (InsightsConfiguration (thresholds, ForecastSettings()));
  const InsightsData data = service.generateInsights (quarterOfTrading(), march2024(), createDate ("20240331"));

  REQUIRE_FALSE (data.hasSufficientData);
  REQUIRE (data.insufficientDataMessage ==
	   "Need at least 50 transactions for meaningful insights. Currently have 7.");
}

TEST_CASE ("Stored forecasts are validated against the ledger", "[InsightsService]")
{
  CompanyData company = quarterOfTrading();
  const AnalysisDateRange february (createDate ("20240201"), createDate ("20240229"));
  const AnalysisDateRange april (createDate ("20240401"), createDate ("20240430"));

  company.addForecastRecord (ForecastAccuracyRecord ("FC-FEB", createDate ("20240131"), february,
						     Money(1000), Money(600), Money(400), 1, 65.0,
						     "Combined (SSA + Holt-Winters)"));
  company.addForecastRecord (ForecastAccuracyRecord ("FC-APR", createDate ("20240331"), april,
						     Money(1700), Money(1500), Money(200), 0, 40.0,
						     "Holt-Winters Additive"));

  const InsightsService service;
  const auto summary = service.getForecastAccuracy (company, createDate ("20240331"));

  REQUIRE (summary.totalForecastCount == 2);
  REQUIRE (summary.validatedForecastCount == 1);
  REQUIRE (summary.averageRevenueAccuracy == Approx (100.0));
  REQUIRE (summary.averageExpensesAccuracy == Approx (100.0));
}

TEST_CASE ("Enhanced forecast uses the preferred method", "[InsightsService]")
{
  const CompanyData company = quarterOfTrading();
  const InsightsService service;

  const auto result = service.generateEnhancedForecast (company, createDate ("20240331"), 2);
  REQUIRE (result.dataPointsUsed == 3);
  REQUIRE (result.periodsForecasted == 2);
  REQUIRE (result.forecastedValues.size() == 2);

  REQUIRE_THROWS_AS (service.generateEnhancedForecast (company, createDate ("20240331"), 0),
		     std::invalid_argument);
}

TEST_CASE ("Asynchronous runs match the synchronous ones", "[InsightsService]")
{
  const InsightsService service;
  const auto company = std::make_shared<const CompanyData> (quarterOfTrading());
  const auto asOf = createDate ("20240331");
  const InsightsData expected = service.generateInsights (*company, march2024(), asOf);

  SECTION ("on the calling thread")
    {
      concurrency::SingleThreadExecutor executor;

      REQUIRE (service.generateInsightsAsync (executor, company, march2024(), asOf).get() == expected);
      REQUIRE (service.generateForecastAsync (executor, company, march2024(), asOf).get() == expected.forecast);
      REQUIRE (service.detectAnomaliesAsync (executor, company, march2024(), asOf).get() == expected.anomalies);
      REQUIRE (service.analyzeTrendsAsync (executor, company, march2024(), asOf).get() == expected.revenueTrends);
      REQUIRE (service.generateRecommendationsAsync (executor, company, march2024(), asOf).get()
	       == expected.recommendations);
    }

  SECTION ("on a thread pool")
    {
      concurrency::ThreadPoolExecutor<2> executor;

      auto insights = service.generateInsightsAsync (executor, company, march2024(), asOf);
      REQUIRE (insights.get() == expected);

      auto trends = service.analyzeTrendsAsync (executor, company, march2024(), asOf);
      REQUIRE (trends.get() == expected.revenueTrends);
    }
}

TEST_CASE ("Overlapping asynchronous runs share one diagnostic stream", "[InsightsService]")
{
  std::ostringstream log;
  const InsightsService service (InsightsConfiguration::createDefault(), log);
  const auto company = std::make_shared<const CompanyData> (quarterOfTrading());
  const auto asOf = createDate ("20240331");

  const InsightsService reference;
  const InsightsData expected = reference.generateInsights (*company, march2024(), asOf);
  const std::vector<InsightItem> expectedTrends = reference.analyzeTrends (*company, march2024(), asOf);

  const int runs = 4;
  {
    concurrency::ThreadPoolExecutor<4> executor;
    std::vector<std::future<InsightsData>> insights;
    std::vector<std::future<std::vector<InsightItem>>> trends;

    // Everything is queued before the first result is collected
    for (int i = 0; i < runs; ++i)
      {
	insights.push_back (service.generateInsightsAsync (executor, company, march2024(), asOf));
	trends.push_back (service.analyzeTrendsAsync (executor, company, march2024(), asOf));
      }

    for (auto& future : insights)
      REQUIRE (future.get() == expected);
    for (auto& future : trends)
      REQUIRE (future.get() == expectedTrends);
  }

  const std::string text = log.str();
  REQUIRE_FALSE (text.empty());
  REQUIRE (text.back() == '\n');

  std::istringstream lines (text);
  std::string line;
  int summaryLines = 0;
  int trendLines = 0;
  while (std::getline (lines, line))
    {
      REQUIRE (line.rfind ("   [", 0) == 0);
      REQUIRE (line.find ("   [", 1) == std::string::npos);

      if (line.find ("[InsightsService]") != std::string::npos
	  && line.find ("insight(s) over") != std::string::npos)
	++summaryLines;
      if (line.rfind ("   [TrendAnalyzer]", 0) == 0)
	++trendLines;
    }

  REQUIRE (summaryLines == runs);
  REQUIRE (trendLines == 2 * runs);
}

TEST_CASE ("Asynchronous argument and cancellation errors", "[InsightsService]")
{
  const InsightsService service;
  concurrency::SingleThreadExecutor executor;
  const auto asOf = createDate ("20240331");

  SECTION ("null company is rejected before scheduling")
    {
      std::shared_ptr<const CompanyData> missing;
      REQUIRE_THROWS_AS (service.generateInsightsAsync (executor, missing, march2024(), asOf),
			 std::invalid_argument);
      REQUIRE_THROWS_AS (service.detectAnomaliesAsync (executor, missing, march2024(), asOf),
			 std::invalid_argument);
    }

  SECTION ("cancelled token surfaces from get")
    {
      const auto company = std::make_shared<const CompanyData> (quarterOfTrading());
      concurrency::CancellationSource source;
      source.cancel();

      auto insights = service.generateInsightsAsync (executor, company, march2024(), asOf, source.getToken());
      REQUIRE_THROWS_AS (insights.get(), concurrency::OperationCancelledException);

      auto forecast = service.generateForecastAsync (executor, company, march2024(), asOf, source.getToken());
      REQUIRE_THROWS_AS (forecast.get(), concurrency::OperationCancelledException);
    }
}

TEST_CASE ("Invalid configuration is refused at construction", "[InsightsService]")
{
  AnalysisThresholds thresholds;
  thresholds.supplierConcentrationPercent = 150.0;

  std::ostringstream log;
  REQUIRE_THROWS_AS (InsightsService (InsightsConfiguration (thresholds, ForecastSettings()), log),
		     InsightsConfigurationException);
}

TEST_CASE ("Diagnostics can be mirrored to two sinks", "[InsightsService]")
{
  std::ostringstream console;
  std::ostringstream logFile;
  utils::TeeStream tee (console, logFile);

  const InsightsService service (InsightsConfiguration::createDefault(), tee);
  service.detectAnomalies (quarterOfTrading(), march2024(), createDate ("20240331"));
  tee.flush();

  REQUIRE (console.str().find ("   [AnomalyDetector]") == 0);
  REQUIRE (console.str() == logFile.str());
}

TEST_CASE ("Six months of trading with one spike month", "[InsightsService]")
{
  // October 2023 to March 2024: ten $1,000 sales and two $4,000 purchases a
  // month; March also carries a single $6,000 sale, taking it to $16,000.
  CompanyData company;
  for (int month = 0; month < 6; ++month)
    {
      const auto first = ledger::add_months (createDate ("20231001"), month);
      for (int day = 0; day < 10; ++day)
	company.addSale (Sale ("S" + std::to_string (month) + "-" + std::to_string (day),
			       first + boost::gregorian::date_duration (day),
			       Money(1000), "C" + std::to_string (day)));

      company.addPurchase (Purchase ("P" + std::to_string (month) + "a",
				     first + boost::gregorian::date_duration (4), Money(4000), "V1"));
      company.addPurchase (Purchase ("P" + std::to_string (month) + "b",
				     first + boost::gregorian::date_duration (19), Money(4000), "V1"));
    }
  company.addSale (Sale ("SPIKE", createDate ("20240315"), Money(6000), "C-BIG"));

  const InsightsService service;
  const AnalysisDateRange sixMonths (createDate ("20231001"), createDate ("20240331"));
  const InsightsData data = service.generateInsights (company, sixMonths, createDate ("20240331"));

  REQUIRE (data.hasSufficientData);
  REQUIRE (data.summary.monthsOfData == 6);

  REQUIRE (data.anomalies.size() == 1);
  REQUIRE (data.anomalies[0].getCategory() == InsightCategory::Anomaly);
  REQUIRE (data.anomalies[0].getSeverity() == InsightSeverity::Info);
  REQUIRE (data.anomalies[0].getTitle() == "Unusually Large Transaction");
  REQUIRE (data.anomalies[0].getDescription().find ("$6,000") != std::string::npos);

  // 27% margin sits between the low and strong bands
  REQUIRE_FALSE (containsTitle (data.recommendations, "Low Profit Margin Alert"));
  REQUIRE_FALSE (containsTitle (data.recommendations, "Strong Profit Margins"));

  REQUIRE (data.forecast.dataMonthsUsed == 6);
  REQUIRE (data.forecast.forecastedRevenue > Money(0));
  REQUIRE (data.forecast.forecastedExpenses > Money(0));
}
