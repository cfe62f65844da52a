#include "InsightsConfiguration.h"
#include <fstream>
#include <iterator>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/error/en.h>

using namespace rapidjson;

namespace ledgerinsights
{
namespace
{
struct IntField
{
    const char* name;
    int AnalysisThresholds::* member;
};

struct DoubleField
{
    const char* name;
    double AnalysisThresholds::* member;
};

const IntField ThresholdIntFields[] = {
    {"minimumTransactions", &AnalysisThresholds::minimumTransactions},
    {"dayOfWeekMinimumSales", &AnalysisThresholds::dayOfWeekMinimumSales},
    {"seasonalMinimumMonths", &AnalysisThresholds::seasonalMinimumMonths},
    {"expenseSpikeMinimumWeeks", &AnalysisThresholds::expenseSpikeMinimumWeeks},
    {"revenueDropMinimumBaselinePoints", &AnalysisThresholds::revenueDropMinimumBaselinePoints},
    {"returnRateMinimumSales", &AnalysisThresholds::returnRateMinimumSales},
    {"largeTransactionMinimumSales", &AnalysisThresholds::largeTransactionMinimumSales},
    {"minimumForecastMonths", &AnalysisThresholds::minimumForecastMonths},
    {"inventoryVelocityDays", &AnalysisThresholds::inventoryVelocityDays},
    {"inventoryDepletionDays", &AnalysisThresholds::inventoryDepletionDays},
    {"inactivityDays", &AnalysisThresholds::inactivityDays},
    {"minimumPurchasesForInactive", &AnalysisThresholds::minimumPurchasesForInactive},
    {"overdueWarningDays", &AnalysisThresholds::overdueWarningDays}
};

const DoubleField ThresholdDoubleFields[] = {
    {"significantChangePercent", &AnalysisThresholds::significantChangePercent},
    {"dayOfWeekLiftRatio", &AnalysisThresholds::dayOfWeekLiftRatio},
    {"seasonalLiftRatio", &AnalysisThresholds::seasonalLiftRatio},
    {"volumeChangePercent", &AnalysisThresholds::volumeChangePercent},
    {"expenseSpikeZScore", &AnalysisThresholds::expenseSpikeZScore},
    {"revenueDropZScore", &AnalysisThresholds::revenueDropZScore},
    {"returnRateMarginPoints", &AnalysisThresholds::returnRateMarginPoints},
    {"largeTransactionZScore", &AnalysisThresholds::largeTransactionZScore},
    {"supplierConcentrationPercent", &AnalysisThresholds::supplierConcentrationPercent},
    {"customerConcentrationPercent", &AnalysisThresholds::customerConcentrationPercent},
    {"lowMarginPercent", &AnalysisThresholds::lowMarginPercent},
    {"strongMarginPercent", &AnalysisThresholds::strongMarginPercent}
};

bool readInt(const Value& object, const char* key, int& target, std::string& error)
{
    if (!object.HasMember(key))
        return true;

    const Value& value = object[key];
    if (!value.IsInt())
    {
        error = std::string("\"") + key + "\" must be an integer";
        return false;
    }

    target = value.GetInt();
    return true;
}

bool readDouble(const Value& object, const char* key, double& target, std::string& error)
{
    if (!object.HasMember(key))
        return true;

    const Value& value = object[key];
    if (!value.IsNumber())
    {
        error = std::string("\"") + key + "\" must be a number";
        return false;
    }

    target = value.GetDouble();
    return true;
}

void requireAtLeast(std::vector<std::string>& errors, const char* name, double value, double minimum)
{
    if (value < minimum)
        errors.push_back(std::string(name) + " must be at least " + num::formatPercent(minimum, 2)
                         + " (got " + num::formatPercent(value, 2) + ")");
}

void requirePositive(std::vector<std::string>& errors, const char* name, double value)
{
    if (!(value > 0.0))
        errors.push_back(std::string(name) + " must be positive (got "
                         + num::formatPercent(value, 2) + ")");
}

void requirePercent(std::vector<std::string>& errors, const char* name, double value)
{
    if (!(value > 0.0 && value <= 100.0))
        errors.push_back(std::string(name) + " must be in (0, 100] (got "
                         + num::formatPercent(value, 2) + ")");
}
}

InsightsConfiguration::InsightsConfiguration()
  : mThresholds(),
    mForecastSettings(),
    mLastError()
{}

InsightsConfiguration::InsightsConfiguration(const AnalysisThresholds& thresholds,
                                             const ForecastSettings& forecastSettings)
  : mThresholds(thresholds),
    mForecastSettings(forecastSettings),
    mLastError()
{}

InsightsConfiguration InsightsConfiguration::createDefault()
{
    return InsightsConfiguration();
}

bool InsightsConfiguration::loadFromFile(const std::string& filePath)
{
    std::ifstream file(filePath);
    if (!file.is_open())
    {
        mLastError = "Cannot open configuration file: " + filePath;
        return false;
    }

    std::string json((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return loadFromString(json);
}

bool InsightsConfiguration::loadFromString(const std::string& json)
{
    Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError())
    {
        mLastError = std::string("JSON parse error at offset ") + std::to_string(doc.GetErrorOffset())
          + ": " + GetParseError_En(doc.GetParseError());
        return false;
    }

    if (!doc.IsObject())
    {
        mLastError = "Configuration root must be a JSON object";
        return false;
    }

    AnalysisThresholds thresholds(mThresholds);
    ForecastSettings settings(mForecastSettings);
    std::string error;

    if (doc.HasMember("thresholds"))
    {
        const Value& object = doc["thresholds"];
        if (!object.IsObject())
        {
            mLastError = "\"thresholds\" must be an object";
            return false;
        }

        for (const auto& field : ThresholdIntFields)
            if (!readInt(object, field.name, thresholds.*(field.member), error))
            {
                mLastError = error;
                return false;
            }

        for (const auto& field : ThresholdDoubleFields)
            if (!readDouble(object, field.name, thresholds.*(field.member), error))
            {
                mLastError = error;
                return false;
            }
    }

    if (doc.HasMember("forecasting"))
    {
        const Value& object = doc["forecasting"];
        if (!object.IsObject())
        {
            mLastError = "\"forecasting\" must be an object";
            return false;
        }

        if (object.HasMember("preferredMethod"))
        {
            const Value& method = object["preferredMethod"];
            if (!method.IsString())
            {
                mLastError = "\"preferredMethod\" must be a string";
                return false;
            }

            try
            {
                settings.preferredMethod = forecasting::forecastMethodFromString(method.GetString());
            }
            catch (const std::invalid_argument& e)
            {
                mLastError = e.what();
                return false;
            }
        }

        if (!readInt(object, "enhancedHistoryMonths", settings.enhancedHistoryMonths, error) ||
            !readInt(object, "recentAccuracyCount", settings.recentAccuracyCount, error))
        {
            mLastError = error;
            return false;
        }
    }

    mThresholds = thresholds;
    mForecastSettings = settings;
    mLastError.clear();
    return true;
}

std::string InsightsConfiguration::toJsonString() const
{
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value thresholds(kObjectType);
    for (const auto& field : ThresholdIntFields)
        thresholds.AddMember(StringRef(field.name), mThresholds.*(field.member), allocator);
    for (const auto& field : ThresholdDoubleFields)
        thresholds.AddMember(StringRef(field.name), mThresholds.*(field.member), allocator);
    doc.AddMember("thresholds", thresholds, allocator);

    Value forecastingSettings(kObjectType);
    const std::string method = forecasting::getForecastMethodString(mForecastSettings.preferredMethod);
    forecastingSettings.AddMember("preferredMethod", Value(method.c_str(), allocator), allocator);
    forecastingSettings.AddMember("enhancedHistoryMonths", mForecastSettings.enhancedHistoryMonths, allocator);
    forecastingSettings.AddMember("recentAccuracyCount", mForecastSettings.recentAccuracyCount, allocator);
    doc.AddMember("forecasting", forecastingSettings, allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

bool InsightsConfiguration::saveToFile(const std::string& filePath) const
{
    std::ofstream file(filePath);
    if (!file.is_open())
    {
        mLastError = "Cannot open configuration file for writing: " + filePath;
        return false;
    }

    file << toJsonString();
    if (!file)
    {
        mLastError = "Failed writing configuration file: " + filePath;
        return false;
    }

    mLastError.clear();
    return true;
}

std::vector<std::string> InsightsConfiguration::validate() const
{
    std::vector<std::string> errors;
    const AnalysisThresholds& t = mThresholds;

    requireAtLeast(errors, "minimumTransactions", t.minimumTransactions, 1);

    requirePositive(errors, "significantChangePercent", t.significantChangePercent);
    requireAtLeast(errors, "dayOfWeekMinimumSales", t.dayOfWeekMinimumSales, 1);
    requireAtLeast(errors, "dayOfWeekLiftRatio", t.dayOfWeekLiftRatio, 1.0);
    requireAtLeast(errors, "seasonalMinimumMonths", t.seasonalMinimumMonths, 1);
    if (t.seasonalMinimumMonths > 12)
        errors.push_back("seasonalMinimumMonths cannot exceed 12");
    requireAtLeast(errors, "seasonalLiftRatio", t.seasonalLiftRatio, 1.0);
    requirePositive(errors, "volumeChangePercent", t.volumeChangePercent);

    requirePositive(errors, "expenseSpikeZScore", t.expenseSpikeZScore);
    requireAtLeast(errors, "expenseSpikeMinimumWeeks", t.expenseSpikeMinimumWeeks, 2);
    requirePositive(errors, "revenueDropZScore", t.revenueDropZScore);
    requireAtLeast(errors, "revenueDropMinimumBaselinePoints", t.revenueDropMinimumBaselinePoints, 2);
    requireAtLeast(errors, "returnRateMinimumSales", t.returnRateMinimumSales, 1);
    requireAtLeast(errors, "returnRateMarginPoints", t.returnRateMarginPoints, 0.0);
    requireAtLeast(errors, "largeTransactionMinimumSales", t.largeTransactionMinimumSales, 2);
    requirePositive(errors, "largeTransactionZScore", t.largeTransactionZScore);

    requireAtLeast(errors, "minimumForecastMonths", t.minimumForecastMonths, 2);
    requireAtLeast(errors, "inventoryVelocityDays", t.inventoryVelocityDays, 1);
    requireAtLeast(errors, "inventoryDepletionDays", t.inventoryDepletionDays, 0);

    requireAtLeast(errors, "inactivityDays", t.inactivityDays, 1);
    requireAtLeast(errors, "minimumPurchasesForInactive", t.minimumPurchasesForInactive, 1);
    requireAtLeast(errors, "overdueWarningDays", t.overdueWarningDays, 0);
    requirePercent(errors, "supplierConcentrationPercent", t.supplierConcentrationPercent);
    requirePercent(errors, "customerConcentrationPercent", t.customerConcentrationPercent);
    if (!(t.lowMarginPercent < t.strongMarginPercent))
        errors.push_back("lowMarginPercent must be below strongMarginPercent");

    requireAtLeast(errors, "enhancedHistoryMonths", mForecastSettings.enhancedHistoryMonths, 2);
    requireAtLeast(errors, "recentAccuracyCount", mForecastSettings.recentAccuracyCount, 1);

    return errors;
}

bool InsightsConfiguration::operator==(const InsightsConfiguration& rhs) const
{
    for (const auto& field : ThresholdIntFields)
        if (mThresholds.*(field.member) != rhs.mThresholds.*(field.member))
            return false;

    for (const auto& field : ThresholdDoubleFields)
        if (mThresholds.*(field.member) != rhs.mThresholds.*(field.member))
            return false;

    return mForecastSettings.preferredMethod == rhs.mForecastSettings.preferredMethod &&
      mForecastSettings.enhancedHistoryMonths == rhs.mForecastSettings.enhancedHistoryMonths &&
      mForecastSettings.recentAccuracyCount == rhs.mForecastSettings.recentAccuracyCount;
}

} // namespace ledgerinsights
