#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <ostream>
#include <vector>
#include "AnalysisDateRange.h"
#include "CancellationToken.h"
#include "CompanyData.h"
#include "EnsembleForecaster.h"
#include "ForecastAccuracy.h"
#include "IParallelExecutor.h"
#include "InsightTypes.h"
#include "InsightsConfiguration.h"
#include "OutputUtils.h"

namespace ledgerinsights
{

/**
 * @class InsightsService
 * @brief Entry point of the library: runs every analyzer over a company ledger
 *
 * Analyses are pure functions of the company data, the date range and the
 * as-of date. Overloads without an as-of date use today's local date.
 *
 * The *Async members schedule the work on an executor. The company data is
 * shared with the task; the service itself is referenced by the task and
 * must outlive the returned future. Cancellation is checked when the task
 * starts and before each sub-analysis, and surfaces from future::get() as
 * concurrency::OperationCancelledException.
 *
 * Diagnostics go to the stream given at construction, or are discarded.
 * Each call collects its own diagnostics and writes them to that stream in
 * one piece under a lock, so concurrent calls on one service never
 * interleave. Nothing else may write to the stream while calls are running.
 */
class InsightsService
{
public:
    InsightsService();

    /**
     * @throws InsightsConfigurationException when configuration.validate() reports errors
     */
    explicit InsightsService(const InsightsConfiguration& configuration);
    InsightsService(const InsightsConfiguration& configuration, std::ostream& os);

    InsightsService(const InsightsService&) = delete;
    InsightsService& operator=(const InsightsService&) = delete;

    const InsightsConfiguration& getConfiguration() const { return mConfiguration; }

    /**
     * @brief Full run: sufficiency gate, trends, anomalies, forecast, recommendations and summary
     *
     * When the gate refuses the range every list is empty and
     * insufficientDataMessage explains why.
     */
    InsightsData generateInsights(const ledger::CompanyData& company,
                                  const ledger::AnalysisDateRange& range,
                                  const ledger::LedgerDate& asOf) const;
    InsightsData generateInsights(const ledger::CompanyData& company,
                                  const ledger::AnalysisDateRange& range) const;

    ForecastData generateForecast(const ledger::CompanyData& company,
                                  const ledger::AnalysisDateRange& range,
                                  const ledger::LedgerDate& asOf) const;
    ForecastData generateForecast(const ledger::CompanyData& company,
                                  const ledger::AnalysisDateRange& range) const;

    std::vector<InsightItem> detectAnomalies(const ledger::CompanyData& company,
                                             const ledger::AnalysisDateRange& range,
                                             const ledger::LedgerDate& asOf) const;
    std::vector<InsightItem> detectAnomalies(const ledger::CompanyData& company,
                                             const ledger::AnalysisDateRange& range) const;

    std::vector<InsightItem> analyzeTrends(const ledger::CompanyData& company,
                                           const ledger::AnalysisDateRange& range,
                                           const ledger::LedgerDate& asOf) const;
    std::vector<InsightItem> analyzeTrends(const ledger::CompanyData& company,
                                           const ledger::AnalysisDateRange& range) const;

    std::vector<InsightItem> generateRecommendations(const ledger::CompanyData& company,
                                                     const ledger::AnalysisDateRange& range,
                                                     const ledger::LedgerDate& asOf) const;
    std::vector<InsightItem> generateRecommendations(const ledger::CompanyData& company,
                                                     const ledger::AnalysisDateRange& range) const;

    /**
     * @brief Multi-period revenue forecast using the configured preferred method
     * @throws std::invalid_argument when periods < 1
     */
    forecasting::EnhancedForecastResult generateEnhancedForecast(const ledger::CompanyData& company,
                                                                 const ledger::LedgerDate& asOf,
                                                                 int periods = 1) const;

    /**
     * @brief Accuracy of the company's stored forecasts, validated against the ledger as of asOf
     */
    forecasting::ForecastAccuracySummary getForecastAccuracy(const ledger::CompanyData& company,
                                                             const ledger::LedgerDate& asOf) const;

    /**
     * @throws std::invalid_argument immediately when company is null
     */
    std::future<InsightsData>
    generateInsightsAsync(concurrency::IParallelExecutor& executor,
                          std::shared_ptr<const ledger::CompanyData> company,
                          const ledger::AnalysisDateRange& range,
                          const ledger::LedgerDate& asOf,
                          concurrency::CancellationToken token = concurrency::CancellationToken()) const;

    std::future<ForecastData>
    generateForecastAsync(concurrency::IParallelExecutor& executor,
                          std::shared_ptr<const ledger::CompanyData> company,
                          const ledger::AnalysisDateRange& range,
                          const ledger::LedgerDate& asOf,
                          concurrency::CancellationToken token = concurrency::CancellationToken()) const;

    std::future<std::vector<InsightItem>>
    detectAnomaliesAsync(concurrency::IParallelExecutor& executor,
                         std::shared_ptr<const ledger::CompanyData> company,
                         const ledger::AnalysisDateRange& range,
                         const ledger::LedgerDate& asOf,
                         concurrency::CancellationToken token = concurrency::CancellationToken()) const;

    std::future<std::vector<InsightItem>>
    analyzeTrendsAsync(concurrency::IParallelExecutor& executor,
                       std::shared_ptr<const ledger::CompanyData> company,
                       const ledger::AnalysisDateRange& range,
                       const ledger::LedgerDate& asOf,
                       concurrency::CancellationToken token = concurrency::CancellationToken()) const;

    std::future<std::vector<InsightItem>>
    generateRecommendationsAsync(concurrency::IParallelExecutor& executor,
                                 std::shared_ptr<const ledger::CompanyData> company,
                                 const ledger::AnalysisDateRange& range,
                                 const ledger::LedgerDate& asOf,
                                 concurrency::CancellationToken token = concurrency::CancellationToken()) const;

    static ledger::LedgerDate today();

private:
    InsightsData runInsights(const ledger::CompanyData& company,
                             const ledger::AnalysisDateRange& range,
                             const ledger::LedgerDate& asOf,
                             const concurrency::CancellationToken& token) const;

    static void requireCompany(const std::shared_ptr<const ledger::CompanyData>& company);

    InsightsConfiguration mConfiguration;
    std::unique_ptr<utils::NullStream> mNullStream;
    std::ostream& mOutputStream;
    mutable std::mutex mOutputMutex;
};

} // namespace ledgerinsights
