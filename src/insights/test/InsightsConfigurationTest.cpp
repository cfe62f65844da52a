#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <string>
#include "InsightsConfiguration.h"
#include "InsightsService.h"

using namespace ledgerinsights;
using ledgerinsights::forecasting::ForecastMethod;

namespace
{
  bool containsText(const std::vector<std::string>& messages, const std::string& text)
  {
    for (const auto& message : messages)
      if (message.find(text) != std::string::npos)
	return true;

    return false;
  }
}

TEST_CASE ("Default configuration is valid", "[InsightsConfiguration]")
{
  InsightsConfiguration config;

  REQUIRE (config.validate().empty());
  REQUIRE (config == InsightsConfiguration::createDefault());
  REQUIRE (config.getThresholds().minimumTransactions == 5);
  REQUIRE (config.getThresholds().significantChangePercent == 15.0);
  REQUIRE (config.getForecastSettings().preferredMethod == ForecastMethod::Auto);
}

TEST_CASE ("Configuration survives a JSON round trip", "[InsightsConfiguration]")
{
  AnalysisThresholds thresholds;
  thresholds.minimumTransactions = 12;
  thresholds.significantChangePercent = 22.5;
  thresholds.inactivityDays = 90;
  thresholds.customerConcentrationPercent = 55.0;

  ForecastSettings settings;
  settings.preferredMethod = ForecastMethod::SSA;
  settings.enhancedHistoryMonths = 24;

  const InsightsConfiguration original (thresholds, settings);

  InsightsConfiguration restored;
  REQUIRE (restored.loadFromString (original.toJsonString()));
  REQUIRE (restored == original);
  REQUIRE (restored.getLastError().empty());
}

TEST_CASE ("Missing keys keep their value and unknown keys are ignored", "[InsightsConfiguration]")
{
  InsightsConfiguration config;

  REQUIRE (config.loadFromString ("{\"thresholds\": {\"significantChangePercent\": 20.0, \"bogus\": 1}}"));
  REQUIRE (config.getThresholds().significantChangePercent == 20.0);
  REQUIRE (config.getThresholds().minimumTransactions == 5);
  REQUIRE (config.getForecastSettings().enhancedHistoryMonths == 36);

  REQUIRE (config.loadFromString ("{}"));
  REQUIRE (config.getThresholds().significantChangePercent == 20.0);
}

TEST_CASE ("A rejected load leaves the configuration unchanged", "[InsightsConfiguration]")
{
  InsightsConfiguration config;
  const InsightsConfiguration before (config);

  SECTION ("wrong type")
    {
      REQUIRE_FALSE (config.loadFromString ("{\"thresholds\": {\"significantChangePercent\": 30.0,"
					    " \"minimumTransactions\": \"five\"}}"));
      REQUIRE (config.getLastError() == "\"minimumTransactions\" must be an integer");
    }

  SECTION ("malformed JSON")
    {
      REQUIRE_FALSE (config.loadFromString ("{\"thresholds\": "));
      REQUIRE (config.getLastError().rfind ("JSON parse error", 0) == 0);
    }

  SECTION ("root is not an object")
    {
      REQUIRE_FALSE (config.loadFromString ("[1, 2, 3]"));
      REQUIRE (config.getLastError() == "Configuration root must be a JSON object");
    }

  SECTION ("unknown forecast method")
    {
      REQUIRE_FALSE (config.loadFromString ("{\"forecasting\": {\"preferredMethod\": \"Neural\"}}"));
      REQUIRE (config.getLastError().find ("Neural") != std::string::npos);
    }

  REQUIRE (config == before);
}

TEST_CASE ("Configuration file save and load", "[InsightsConfiguration]")
{
  const std::string path ("insights_configuration_test.json");

  AnalysisThresholds thresholds;
  thresholds.overdueWarningDays = 45;
  const InsightsConfiguration original (thresholds, ForecastSettings());

  REQUIRE (original.saveToFile (path));

  InsightsConfiguration loaded;
  REQUIRE (loaded.loadFromFile (path));
  REQUIRE (loaded == original);
  std::remove (path.c_str());

  REQUIRE_FALSE (loaded.loadFromFile ("no_such_directory/insights.json"));
  REQUIRE (loaded.getLastError().find ("Cannot open configuration file") == 0);
}

TEST_CASE ("validate reports out of range values", "[InsightsConfiguration]")
{
  AnalysisThresholds thresholds;
  thresholds.minimumTransactions = 0;
  thresholds.significantChangePercent = -1.0;
  thresholds.seasonalMinimumMonths = 13;
  thresholds.lowMarginPercent = 40.0;

  const InsightsConfiguration config (thresholds, ForecastSettings());
  const auto errors = config.validate();

  REQUIRE (errors.size() == 4);
  REQUIRE (containsText (errors, "minimumTransactions must be at least"));
  REQUIRE (containsText (errors, "significantChangePercent must be positive"));
  REQUIRE (containsText (errors, "seasonalMinimumMonths cannot exceed 12"));
  REQUIRE (containsText (errors, "lowMarginPercent must be below strongMarginPercent"));
}

TEST_CASE ("Service refuses an invalid configuration", "[InsightsConfiguration]")
{
  ForecastSettings settings;
  settings.recentAccuracyCount = 0;

  REQUIRE_THROWS_AS (InsightsService (InsightsConfiguration (AnalysisThresholds(), settings)),
		     InsightsConfigurationException);
}
