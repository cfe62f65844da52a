#include "BaselineForecaster.h"
#include <cmath>
#include <algorithm>
#include "StatUtils.h"

namespace ledgerinsights
{
namespace forecasting
{
std::string getForecastMethodString(ForecastMethod method)
{
    switch (method)
    {
        case ForecastMethod::Auto:
            return "Auto";
        case ForecastMethod::SSA:
            return "SSA";
        case ForecastMethod::HoltWinters:
            return "HoltWinters";
        case ForecastMethod::Combined:
            return "Combined";
        default:
            throw std::invalid_argument("Unknown forecast method");
    }
}

ForecastMethod forecastMethodFromString(const std::string& name)
{
    if (name == "Auto")
        return ForecastMethod::Auto;
    if (name == "SSA")
        return ForecastMethod::SSA;
    if (name == "HoltWinters")
        return ForecastMethod::HoltWinters;
    if (name == "Combined")
        return ForecastMethod::Combined;

    throw std::invalid_argument("Unknown forecast method: " + name);
}

Money BaselineForecaster::linearRegressionForecast(const std::vector<Money>& data)
{
    const std::size_t n = data.size();
    if (n == 0)
        return Money(0);
    if (n < 2)
        return data.front();

    double sumX = 0.0, sumY = 0.0, sumXY = 0.0, sumX2 = 0.0;
    for (std::size_t i = 0; i < n; ++i)
    {
        const double x = static_cast<double>(i);
        const double y = num::to_double(data[i]);
        sumX += x;
        sumY += y;
        sumXY += x * y;
        sumX2 += x * x;
    }

    const double count = static_cast<double>(n);
    const double denominator = count * sumX2 - sumX * sumX;
    if (std::abs(denominator) < 0.0001)
        return data.back();

    const double slope = (count * sumXY - sumX * sumY) / denominator;
    const double intercept = (sumY - slope * sumX) / count;

    return num::fromDouble(std::max(0.0, slope * count + intercept));
}

Money BaselineForecaster::exponentialSmoothingForecast(const std::vector<Money>& data,
                                                       double alpha)
{
    if (data.empty())
        return Money(0);
    if (data.size() == 1)
        return data.front();

    double smoothed = num::to_double(data.front());
    for (std::size_t i = 1; i < data.size(); ++i)
        smoothed = alpha * num::to_double(data[i]) + (1.0 - alpha) * smoothed;

    return num::fromDouble(smoothed);
}

PointForecast BaselineForecaster::forecastNextPeriod(const std::vector<Money>& data)
{
    if (data.size() < 2)
        return PointForecast{data.empty() ? Money(0) : data.front(), 0.0};

    const Money linear = linearRegressionForecast(data);
    const Money smoothed = exponentialSmoothingForecast(data, SmoothingAlpha);

    const double weight = data.size() >= 6 ? 0.6 : 0.4;
    const double combined = num::to_double(linear) * weight
      + num::to_double(smoothed) * (1.0 - weight);

    return PointForecast{num::fromDouble(combined),
                         ledger::StatUtils<Money>::coefficientOfVariation(data)};
}

} // namespace forecasting
} // namespace ledgerinsights
