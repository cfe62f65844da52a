#pragma once

#include <vector>
#include "BaselineForecaster.h"

namespace ledgerinsights
{
namespace forecasting
{

/**
 * @brief Point forecasts and symmetric prediction bounds from singular spectrum analysis
 */
struct SsaResult
{
    std::vector<double> forecastedValues;
    std::vector<double> lowerBounds;
    std::vector<double> upperBounds;
    int rank = 0;                    ///< eigentriples kept for reconstruction
    double explainedEnergy = 0.0;    ///< share of the eigenvalue sum they carry
};

/**
 * @class SsaForecaster
 * @brief Singular spectrum analysis with recurrent forecasting
 *
 * The series is embedded in an L x K trajectory matrix (L = window length,
 * K = n - L + 1). The leading eigenvectors of X * X^T that together carry
 * 90% of the energy span the signal subspace; the series is reconstructed
 * by diagonal averaging and continued with the linear recurrence that
 * subspace implies.
 *
 * Prediction bounds use the root mean square of the reconstruction residual
 * over the last seriesLength points, widened by sqrt(h) at horizon h.
 *
 * forecast() throws ForecastException when the input cannot support the
 * decomposition: non-finite values, fewer than 2 * L points, a horizon
 * below 1, a flat zero series, or a recurrence whose verticality
 * coefficient reaches 1.
 */
class SsaForecaster
{
public:
    static constexpr double EnergyThreshold = 0.9;

    /**
     * @throws std::invalid_argument for a window below 2, a seriesLength
     *         below 1 or a confidence level outside (0, 1)
     */
    SsaForecaster(int windowLength, int seriesLength, double confidenceLevel = 0.95);

    SsaResult forecast(const std::vector<Money>& data, int horizon) const;

    int getWindowLength() const { return mWindowLength; }
    int getSeriesLength() const { return mSeriesLength; }
    double getConfidenceLevel() const { return mConfidenceLevel; }

private:
    int mWindowLength;
    int mSeriesLength;
    double mConfidenceLevel;
};

} // namespace forecasting
} // namespace ledgerinsights
