#ifndef NUMBER_H
#define NUMBER_H

#include <string>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include "decimal.h"
#include "DecimalConstants.h"

/**
 * @file number.h
 * @brief Decimal money type used throughout the ledger and its conversion helpers.
 *
 * Monetary sums are carried in `num::DefaultNumber` so that totals over many
 * transactions do not accumulate binary floating point drift. Statistical
 * code converts to double at its boundary through `to_double`.
 */
namespace num
{
  /**
   * @brief Default decimal type with 7 decimal places using the default rounding policy.
   * @see dec::decimal
   */
  using DefaultNumber  = dec::decimal<7>;

  /**
   * @brief Converts a DefaultNumber to a double.
   * Note: This conversion may result in a loss of precision.
   */
  inline double to_double(const DefaultNumber& d) {
    return d.getAsDouble();
  }

  /**
   * @brief Builds a DefaultNumber from a double produced by statistical code.
   *
   * Non-finite inputs map to zero so that no NaN or infinity can enter a
   * decimal field.
   */
  inline DefaultNumber fromDouble(double value) {
    if (!std::isfinite(value))
      return DefaultNumber(0.0);
    return DefaultNumber(value);
  }

  /**
   * @brief Converts a string representation to a decimal type.
   * @tparam N The target decimal type (e.g., DefaultNumber, dec::decimal<P, RP>).
   */
  template<class N>
  inline N fromString(const std::string& s) {
    return ::dec::fromString<N>(s);
  }

  template<typename Decimal>
  inline Decimal abs(const Decimal& d) {
    return d.abs();
  }

  /**
   * @brief Formats an amount as whole US dollars with thousands separators.
   *
   * Rounds half away from zero to the nearest dollar, e.g. 1234.5 becomes
   * "$1,235" and -1234.2 becomes "-$1,234".
   */
  inline std::string formatCurrency(const DefaultNumber& amount)
  {
    const long long dollars = std::llround(amount.getAsDouble());
    const bool negative = dollars < 0;
    std::string digits = std::to_string(negative ? -dollars : dollars);

    std::string grouped;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it)
      {
	if (count > 0 && (count % 3) == 0)
	  grouped.insert(grouped.begin(), ',');
	grouped.insert(grouped.begin(), *it);
	++count;
      }

    return (negative ? std::string("-$") : std::string("$")) + grouped;
  }

  inline std::string formatCurrency(double amount)
  {
    return formatCurrency(fromDouble(amount));
  }

  /**
   * @brief Formats a percentage with a fixed number of decimals, e.g. "15.0".
   */
  inline std::string formatPercent(double value, int decimals = 1)
  {
    if (!std::isfinite(value))
      value = 0.0;

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    return std::string(buffer);
  }

  using ledger::DecimalConstants;
} // namespace num

#endif // NUMBER_H
