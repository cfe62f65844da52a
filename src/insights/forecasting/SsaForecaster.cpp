#include "SsaForecaster.h"
#include <cmath>
#include <algorithm>
#include <stdexcept>
#include <Eigen/Dense>
#include "NormalQuantile.h"

namespace ledgerinsights
{
namespace forecasting
{
SsaForecaster::SsaForecaster(int windowLength, int seriesLength, double confidenceLevel)
  : mWindowLength(windowLength),
    mSeriesLength(seriesLength),
    mConfidenceLevel(confidenceLevel)
{
    if (windowLength < 2)
        throw std::invalid_argument("SsaForecaster: window length must be at least 2");
    if (seriesLength < 1)
        throw std::invalid_argument("SsaForecaster: series length must be at least 1");
    if (!(confidenceLevel > 0.0 && confidenceLevel < 1.0))
        throw std::invalid_argument("SsaForecaster: confidence level must be in (0, 1)");
}

SsaResult SsaForecaster::forecast(const std::vector<Money>& data, int horizon) const
{
    if (horizon < 1)
        throw ForecastException("SSA: horizon must be at least 1");

    const int n = static_cast<int>(data.size());
    const int L = mWindowLength;
    if (n < 2 * L)
        throw ForecastException("SSA: need at least " + std::to_string(2 * L)
                                + " points for window " + std::to_string(L)
                                + ", have " + std::to_string(n));

    Eigen::VectorXd series(n);
    for (int i = 0; i < n; ++i)
    {
        series(i) = num::to_double(data[static_cast<std::size_t>(i)]);
        if (!std::isfinite(series(i)))
            throw ForecastException("SSA: series contains a non-finite value");
    }

    const int K = n - L + 1;
    Eigen::MatrixXd trajectory(L, K);
    for (int i = 0; i < L; ++i)
        for (int j = 0; j < K; ++j)
            trajectory(i, j) = series(i + j);

    const Eigen::MatrixXd lagCovariance = trajectory * trajectory.transpose();
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(lagCovariance);
    if (solver.info() != Eigen::Success)
        throw ForecastException("SSA: eigen decomposition failed");

    // Eigen returns ascending eigenvalues; the signal lives in the largest.
    const Eigen::VectorXd eigenvalues = solver.eigenvalues().reverse();
    const Eigen::MatrixXd eigenvectors = solver.eigenvectors().rowwise().reverse();

    double totalEnergy = 0.0;
    for (int i = 0; i < L; ++i)
        totalEnergy += std::max(0.0, eigenvalues(i));

    if (!(totalEnergy > 0.0))
        throw ForecastException("SSA: series has no energy to decompose");

    int rank = 0;
    double keptEnergy = 0.0;
    while (rank < L - 1 && keptEnergy < EnergyThreshold * totalEnergy)
    {
        keptEnergy += std::max(0.0, eigenvalues(rank));
        ++rank;
    }

    const Eigen::MatrixXd basis = eigenvectors.leftCols(rank);
    const Eigen::MatrixXd reconstructed = basis * (basis.transpose() * trajectory);

    // Diagonal averaging back to a series of length n.
    Eigen::VectorXd smooth = Eigen::VectorXd::Zero(n);
    Eigen::VectorXd counts = Eigen::VectorXd::Zero(n);
    for (int i = 0; i < L; ++i)
        for (int j = 0; j < K; ++j)
        {
            smooth(i + j) += reconstructed(i, j);
            counts(i + j) += 1.0;
        }
    smooth = smooth.cwiseQuotient(counts);

    const Eigen::RowVectorXd lastComponents = basis.row(L - 1);
    const double verticality = lastComponents.squaredNorm();
    if (verticality >= 1.0 - 1e-9)
        throw ForecastException("SSA: recurrence is degenerate (verticality coefficient reaches 1)");

    const Eigen::VectorXd recurrence =
      (basis.topRows(L - 1) * lastComponents.transpose()) / (1.0 - verticality);

    std::vector<double> extended(smooth.data(), smooth.data() + n);
    for (int h = 0; h < horizon; ++h)
    {
        const std::size_t first = extended.size() - static_cast<std::size_t>(L - 1);
        double next = 0.0;
        for (int j = 0; j < L - 1; ++j)
            next += recurrence(j) * extended[first + static_cast<std::size_t>(j)];
        extended.push_back(next);
    }

    const int residualCount = std::min(mSeriesLength, n);
    double squaredResiduals = 0.0;
    for (int i = n - residualCount; i < n; ++i)
    {
        const double residual = series(i) - smooth(i);
        squaredResiduals += residual * residual;
    }
    const double residualRms = std::sqrt(squaredResiduals / residualCount);
    const double criticalValue = ledger::normalCriticalValue(mConfidenceLevel);

    SsaResult result;
    result.rank = rank;
    result.explainedEnergy = keptEnergy / totalEnergy;
    for (int h = 1; h <= horizon; ++h)
    {
        const double value = extended[static_cast<std::size_t>(n + h - 1)];
        if (!std::isfinite(value))
            throw ForecastException("SSA: recurrent forecast diverged");

        const double halfWidth = criticalValue * residualRms * std::sqrt(static_cast<double>(h));
        result.forecastedValues.push_back(value);
        result.lowerBounds.push_back(value - halfWidth);
        result.upperBounds.push_back(value + halfWidth);
    }

    return result;
}

} // namespace forecasting
} // namespace ledgerinsights
