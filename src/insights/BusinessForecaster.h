#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "AnalysisDateRange.h"
#include "CompanyData.h"
#include "EnsembleForecaster.h"
#include "InsightTypes.h"
#include "InsightsConfiguration.h"

namespace ledgerinsights
{

/**
 * @class BusinessForecaster
 * @brief Next month revenue, expense, profit and customer forecast of a company
 *
 * Works on populated calendar months of the trailing year ending at the
 * as-of date. Also turns a forecast into the Forecast and Inventory
 * insights shown next to trends and anomalies.
 */
class BusinessForecaster
{
public:
    static constexpr int HistoryMonths = 12;
    static constexpr const char* MethodName = "Linear Regression + Exponential Smoothing";

    BusinessForecaster(const AnalysisThresholds& thresholds, const ForecastSettings& settings);

    ForecastData generateForecast(const ledger::CompanyData& company,
                                  const ledger::LedgerDate& asOf,
                                  std::ostream& os) const;

    /**
     * @brief Revenue range, cash flow projection and inventory depletion for a forecast
     */
    std::vector<InsightItem> forecastInsights(const ForecastData& forecast,
                                              const ledger::CompanyData& company,
                                              const ledger::AnalysisDateRange& range,
                                              std::ostream& os) const;

    /**
     * @brief Names of stocked products that reach zero within the depletion window
     *
     * Velocity is the quantity sold over the velocity window ending at the
     * range end, per day. Products are listed in id order; products without
     * a record or a name are skipped.
     */
    std::vector<std::string> depletingProducts(const ledger::CompanyData& company,
                                               const ledger::AnalysisDateRange& range) const;

    /**
     * @brief Multi-period revenue forecast over the configured history
     * @throws std::invalid_argument when periods < 1
     */
    forecasting::EnhancedForecastResult enhancedRevenueForecast(const ledger::CompanyData& company,
                                                                const ledger::LedgerDate& asOf,
                                                                int periods,
                                                                forecasting::ForecastMethod method,
                                                                std::ostream& os) const;

private:
    AnalysisThresholds mThresholds;
    ForecastSettings mSettings;
};

} // namespace ledgerinsights
