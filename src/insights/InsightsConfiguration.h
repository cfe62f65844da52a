#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "BaselineForecaster.h"

namespace ledgerinsights
{

/**
 * @brief Raised when an InsightsConfiguration does not pass validate()
 */
class InsightsConfigurationException : public std::runtime_error
{
public:
    InsightsConfigurationException(const std::string msg)
        : std::runtime_error(msg)
    {}

    ~InsightsConfigurationException()
    {}
};

/**
 * @brief Every cut-off used by the analyzers
 *
 * Percent values are on the 0..100 scale, ratios are multiples of an
 * average and day counts are calendar days.
 */
struct AnalysisThresholds
{
    // Sufficiency
    int minimumTransactions = 5;

    // Trends
    double significantChangePercent = 15.0;
    int dayOfWeekMinimumSales = 14;
    double dayOfWeekLiftRatio = 1.3;
    int seasonalMinimumMonths = 6;
    double seasonalLiftRatio = 1.25;
    double volumeChangePercent = 20.0;

    // Anomalies
    double expenseSpikeZScore = 2.0;
    int expenseSpikeMinimumWeeks = 4;
    double revenueDropZScore = 2.0;
    int revenueDropMinimumBaselinePoints = 5;
    int returnRateMinimumSales = 10;
    double returnRateMarginPoints = 3.0;
    int largeTransactionMinimumSales = 5;
    double largeTransactionZScore = 3.0;

    // Forecasting
    int minimumForecastMonths = 2;
    int inventoryVelocityDays = 30;
    int inventoryDepletionDays = 14;

    // Recommendations
    int inactivityDays = 60;
    int minimumPurchasesForInactive = 2;
    int overdueWarningDays = 30;
    double supplierConcentrationPercent = 60.0;
    double customerConcentrationPercent = 40.0;
    double lowMarginPercent = 10.0;
    double strongMarginPercent = 30.0;
};

struct ForecastSettings
{
    forecasting::ForecastMethod preferredMethod = forecasting::ForecastMethod::Auto;
    int enhancedHistoryMonths = 36;
    int recentAccuracyCount = 6;
};

/**
 * @class InsightsConfiguration
 * @brief Thresholds and forecast settings, persisted as JSON
 *
 * Layout:
 * @code
 * {
 *   "thresholds":  { "minimumTransactions": 5, "significantChangePercent": 15.0, ... },
 *   "forecasting": { "preferredMethod": "Auto", "enhancedHistoryMonths": 36, ... }
 * }
 * @endcode
 *
 * Keys are the field names of AnalysisThresholds and ForecastSettings.
 * Unknown keys are ignored and missing keys keep their current value. A
 * key with the wrong JSON type fails the whole load and leaves the
 * configuration untouched.
 */
class InsightsConfiguration
{
public:
    InsightsConfiguration();
    InsightsConfiguration(const AnalysisThresholds& thresholds, const ForecastSettings& forecastSettings);

    static InsightsConfiguration createDefault();

    const AnalysisThresholds& getThresholds() const { return mThresholds; }
    const ForecastSettings& getForecastSettings() const { return mForecastSettings; }

    void setThresholds(const AnalysisThresholds& thresholds) { mThresholds = thresholds; }
    void setForecastSettings(const ForecastSettings& settings) { mForecastSettings = settings; }

    /**
     * @return false if the file cannot be read or does not parse; see getLastError()
     */
    bool loadFromFile(const std::string& filePath);
    bool loadFromString(const std::string& json);

    bool saveToFile(const std::string& filePath) const;
    std::string toJsonString() const;

    const std::string& getLastError() const { return mLastError; }

    /**
     * @brief One message per out-of-range value; empty when the configuration is usable
     */
    std::vector<std::string> validate() const;

    bool operator==(const InsightsConfiguration& rhs) const;
    bool operator!=(const InsightsConfiguration& rhs) const { return !(*this == rhs); }

private:
    AnalysisThresholds mThresholds;
    ForecastSettings mForecastSettings;
    mutable std::string mLastError;
};

} // namespace ledgerinsights
