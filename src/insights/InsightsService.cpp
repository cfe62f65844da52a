#include "InsightsService.h"
#include <stdexcept>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "AnomalyDetector.h"
#include "BusinessForecaster.h"
#include "DataSufficiencyChecker.h"
#include "RecommendationEngine.h"
#include "TaskSubmission.h"
#include "TrendAnalyzer.h"

namespace ledgerinsights
{
using ledger::AnalysisDateRange;
using ledger::CompanyData;
using ledger::LedgerDate;
using concurrency::CancellationToken;

namespace
{
const InsightsConfiguration& checkedConfiguration(const InsightsConfiguration& configuration)
{
    const std::vector<std::string> errors = configuration.validate();
    if (!errors.empty())
    {
        std::string message = "InsightsService: invalid configuration:";
        for (const auto& error : errors)
            message += " " + error + ";";
        throw InsightsConfigurationException(message);
    }
    return configuration;
}

void countCategories(const std::vector<InsightItem>& items, std::map<InsightCategory, int>& counts)
{
    for (const auto& item : items)
        ++counts[item.getCategory()];
}

InsightsSummary summarize(const InsightsData& data, int monthsOfData)
{
    InsightsSummary summary;
    summary.trendsDetected = static_cast<int>(data.revenueTrends.size());
    summary.anomaliesDetected = static_cast<int>(data.anomalies.size());
    summary.forecastsGenerated = static_cast<int>(data.forecasts.size());
    summary.opportunities = static_cast<int>(data.recommendations.size());
    summary.totalInsights = summary.trendsDetected + summary.anomaliesDetected
      + summary.forecastsGenerated + summary.opportunities;
    summary.monthsOfData = monthsOfData;

    countCategories(data.revenueTrends, summary.countsByCategory);
    countCategories(data.anomalies, summary.countsByCategory);
    countCategories(data.forecasts, summary.countsByCategory);
    countCategories(data.recommendations, summary.countsByCategory);
    return summary;
}
}

InsightsService::InsightsService()
  : mConfiguration(InsightsConfiguration::createDefault()),
    mNullStream(std::make_unique<utils::NullStream>()),
    mOutputStream(*mNullStream)
{}

InsightsService::InsightsService(const InsightsConfiguration& configuration)
  : mConfiguration(checkedConfiguration(configuration)),
    mNullStream(std::make_unique<utils::NullStream>()),
    mOutputStream(*mNullStream)
{}

InsightsService::InsightsService(const InsightsConfiguration& configuration, std::ostream& os)
  : mConfiguration(checkedConfiguration(configuration)),
    mNullStream(),
    mOutputStream(os)
{}

LedgerDate InsightsService::today()
{
    return boost::gregorian::day_clock::local_day();
}

InsightsData InsightsService::runInsights(const CompanyData& company,
                                          const AnalysisDateRange& range,
                                          const LedgerDate& asOf,
                                          const CancellationToken& token) const
{
    const AnalysisThresholds& thresholds = mConfiguration.getThresholds();
    utils::BufferedDiagnosticStream os(mOutputStream, mOutputMutex);

    InsightsData data;
    data.generatedAt = boost::posix_time::second_clock::local_time();

    token.throwIfCancellationRequested("data sufficiency check");
    const DataSufficiency sufficiency = DataSufficiencyChecker(thresholds).check(company, range, os);
    if (!sufficiency.hasSufficientData)
    {
        data.hasSufficientData = false;
        data.insufficientDataMessage = sufficiency.message;
        os << "   [InsightsService] " << sufficiency.message << std::endl;
        return data;
    }

    data.hasSufficientData = true;

    token.throwIfCancellationRequested("trend analysis");
    data.revenueTrends = TrendAnalyzer(thresholds).analyze(company, range, asOf, os);

    token.throwIfCancellationRequested("anomaly detection");
    data.anomalies = AnomalyDetector(thresholds).analyze(company, range, os);

    token.throwIfCancellationRequested("forecasting");
    const BusinessForecaster forecaster(thresholds, mConfiguration.getForecastSettings());
    data.forecast = forecaster.generateForecast(company, asOf, os);
    data.forecasts = forecaster.forecastInsights(data.forecast, company, range, os);

    token.throwIfCancellationRequested("recommendations");
    data.recommendations = RecommendationEngine(thresholds).analyze(company, range, asOf, os);

    data.summary = summarize(data, sufficiency.monthsOfData);

    os << "   [InsightsService] " << data.summary.totalInsights << " insight(s) over "
       << sufficiency.monthsOfData << " month(s) of data" << std::endl;
    return data;
}

InsightsData InsightsService::generateInsights(const CompanyData& company,
                                               const AnalysisDateRange& range,
                                               const LedgerDate& asOf) const
{
    return runInsights(company, range, asOf, CancellationToken());
}

InsightsData InsightsService::generateInsights(const CompanyData& company,
                                               const AnalysisDateRange& range) const
{
    return generateInsights(company, range, today());
}

ForecastData InsightsService::generateForecast(const CompanyData& company,
                                               const AnalysisDateRange&,
                                               const LedgerDate& asOf) const
{
    utils::BufferedDiagnosticStream os(mOutputStream, mOutputMutex);
    return BusinessForecaster(mConfiguration.getThresholds(), mConfiguration.getForecastSettings())
      .generateForecast(company, asOf, os);
}

ForecastData InsightsService::generateForecast(const CompanyData& company,
                                               const AnalysisDateRange& range) const
{
    return generateForecast(company, range, today());
}

std::vector<InsightItem> InsightsService::detectAnomalies(const CompanyData& company,
                                                          const AnalysisDateRange& range,
                                                          const LedgerDate&) const
{
    utils::BufferedDiagnosticStream os(mOutputStream, mOutputMutex);
    return AnomalyDetector(mConfiguration.getThresholds()).analyze(company, range, os);
}

std::vector<InsightItem> InsightsService::detectAnomalies(const CompanyData& company,
                                                          const AnalysisDateRange& range) const
{
    return detectAnomalies(company, range, today());
}

std::vector<InsightItem> InsightsService::analyzeTrends(const CompanyData& company,
                                                        const AnalysisDateRange& range,
                                                        const LedgerDate& asOf) const
{
    utils::BufferedDiagnosticStream os(mOutputStream, mOutputMutex);
    return TrendAnalyzer(mConfiguration.getThresholds()).analyze(company, range, asOf, os);
}

std::vector<InsightItem> InsightsService::analyzeTrends(const CompanyData& company,
                                                        const AnalysisDateRange& range) const
{
    return analyzeTrends(company, range, today());
}

std::vector<InsightItem> InsightsService::generateRecommendations(const CompanyData& company,
                                                                  const AnalysisDateRange& range,
                                                                  const LedgerDate& asOf) const
{
    utils::BufferedDiagnosticStream os(mOutputStream, mOutputMutex);
    return RecommendationEngine(mConfiguration.getThresholds()).analyze(company, range, asOf, os);
}

std::vector<InsightItem> InsightsService::generateRecommendations(const CompanyData& company,
                                                                  const AnalysisDateRange& range) const
{
    return generateRecommendations(company, range, today());
}

forecasting::EnhancedForecastResult InsightsService::generateEnhancedForecast(const CompanyData& company,
                                                                              const LedgerDate& asOf,
                                                                              int periods) const
{
    const ForecastSettings& settings = mConfiguration.getForecastSettings();
    utils::BufferedDiagnosticStream os(mOutputStream, mOutputMutex);
    return BusinessForecaster(mConfiguration.getThresholds(), settings)
      .enhancedRevenueForecast(company, asOf, periods, settings.preferredMethod, os);
}

forecasting::ForecastAccuracySummary InsightsService::getForecastAccuracy(const CompanyData& company,
                                                                          const LedgerDate& asOf) const
{
    using forecasting::ForecastAccuracyTracker;

    const auto validated = ForecastAccuracyTracker::validatePastForecasts(company.getForecastRecords(),
                                                                          company, asOf);
    forecasting::ForecastAccuracySummary summary = ForecastAccuracyTracker::summarize(validated);

    utils::BufferedDiagnosticStream os(mOutputStream, mOutputMutex);
    os << "   [InsightsService] " << summary.validatedForecastCount << " of "
       << summary.totalForecastCount << " forecast(s) validated" << std::endl;
    return summary;
}

void InsightsService::requireCompany(const std::shared_ptr<const CompanyData>& company)
{
    if (!company)
        throw std::invalid_argument("InsightsService: company data must not be null");
}

std::future<InsightsData>
InsightsService::generateInsightsAsync(concurrency::IParallelExecutor& executor,
                                       std::shared_ptr<const CompanyData> company,
                                       const AnalysisDateRange& range,
                                       const LedgerDate& asOf,
                                       CancellationToken token) const
{
    requireCompany(company);
    return concurrency::submitTask(executor, [this, company, range, asOf, token]() {
        token.throwIfCancellationRequested("insights");
        return runInsights(*company, range, asOf, token);
    });
}

std::future<ForecastData>
InsightsService::generateForecastAsync(concurrency::IParallelExecutor& executor,
                                       std::shared_ptr<const CompanyData> company,
                                       const AnalysisDateRange& range,
                                       const LedgerDate& asOf,
                                       CancellationToken token) const
{
    requireCompany(company);
    return concurrency::submitTask(executor, [this, company, range, asOf, token]() {
        token.throwIfCancellationRequested("forecasting");
        return generateForecast(*company, range, asOf);
    });
}

std::future<std::vector<InsightItem>>
InsightsService::detectAnomaliesAsync(concurrency::IParallelExecutor& executor,
                                      std::shared_ptr<const CompanyData> company,
                                      const AnalysisDateRange& range,
                                      const LedgerDate& asOf,
                                      CancellationToken token) const
{
    requireCompany(company);
    return concurrency::submitTask(executor, [this, company, range, asOf, token]() {
        token.throwIfCancellationRequested("anomaly detection");
        return detectAnomalies(*company, range, asOf);
    });
}

std::future<std::vector<InsightItem>>
InsightsService::analyzeTrendsAsync(concurrency::IParallelExecutor& executor,
                                    std::shared_ptr<const CompanyData> company,
                                    const AnalysisDateRange& range,
                                    const LedgerDate& asOf,
                                    CancellationToken token) const
{
    requireCompany(company);
    return concurrency::submitTask(executor, [this, company, range, asOf, token]() {
        token.throwIfCancellationRequested("trend analysis");
        return analyzeTrends(*company, range, asOf);
    });
}

std::future<std::vector<InsightItem>>
InsightsService::generateRecommendationsAsync(concurrency::IParallelExecutor& executor,
                                              std::shared_ptr<const CompanyData> company,
                                              const AnalysisDateRange& range,
                                              const LedgerDate& asOf,
                                              CancellationToken token) const
{
    requireCompany(company);
    return concurrency::submitTask(executor, [this, company, range, asOf, token]() {
        token.throwIfCancellationRequested("recommendations");
        return generateRecommendations(*company, range, asOf);
    });
}

} // namespace ledgerinsights
