#pragma once

#include <cmath>
#include <stdexcept>

namespace ledger
{
  /**
   * @brief Inverse CDF of the standard normal distribution.
   *
   * Acklam's rational approximation: one fit for the central region
   * [0.02425, 0.97575] and a mirrored fit for each tail. Relative error is
   * below 1.2e-9 over the open unit interval.
   *
   * @throws std::domain_error unless 0 < p < 1
   */
  inline double normalQuantile(double p)
  {
    if (!(p > 0.0 && p < 1.0))
      throw std::domain_error("normalQuantile: probability must be in (0, 1)");

    if (p == 0.5)
      return 0.0;

    static constexpr double a[] = {-3.969683028665376e+01,  2.209460984245205e+02,
				   -2.759285104469687e+02,  1.383577518672690e+02,
				   -3.066479806614716e+01,  2.506628277459239e+00};
    static constexpr double b[] = {-5.447609879822406e+01,  1.615858368580409e+02,
				   -1.556989798598866e+02,  6.680131188771972e+01,
				   -1.328068155288572e+01};
    static constexpr double c[] = {-7.784894002430226e-03, -3.223964580411365e-01,
				   -2.400758277161838e+00, -2.549732539343734e+00,
				    4.374664141464968e+00,  2.938163982698783e+00};
    static constexpr double d[] = { 7.784695709041462e-03,  3.224671290700398e-01,
				    2.445134137142996e+00,  3.754408661907416e+00};

    static constexpr double lowBreak = 0.02425;

    auto tail = [](double q) {
      return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
	((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    };

    if (p < lowBreak)
      return tail(std::sqrt(-2.0 * std::log(p)));

    if (p > 1.0 - lowBreak)
      return -tail(std::sqrt(-2.0 * std::log(1.0 - p)));

    const double q = p - 0.5;
    const double r = q * q;
    return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
      (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
  }

  /**
   * @brief Half width, in standard deviations, of a two sided normal interval.
   *
   * 0.95 gives about 1.96.
   *
   * @throws std::domain_error unless 0 < confidenceLevel < 1
   */
  inline double normalCriticalValue(double confidenceLevel)
  {
    if (!(confidenceLevel > 0.0 && confidenceLevel < 1.0))
      throw std::domain_error("normalCriticalValue: confidence level must be in (0, 1)");

    return normalQuantile(0.5 + confidenceLevel / 2.0);
  }
}
