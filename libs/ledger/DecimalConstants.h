// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEDGER_DECIMAL_CONSTANT_H
#define __LEDGER_DECIMAL_CONSTANT_H 1

#include <string>
#include "decimal.h"

namespace ledger
{
  template <class Decimal>
  class DecimalConstants
    {
    public:
      static Decimal DecimalZero;
      static Decimal DecimalOne;
      static Decimal TenPercent;
      static Decimal TwentyPercent;

      static Decimal createDecimal (const std::string& valueString)
      {
	return dec::fromString<Decimal>(valueString);
      }
    };

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalZero(
      DecimalConstants<Decimal>::createDecimal("0.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalOne(
      DecimalConstants<Decimal>::createDecimal("1.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::TenPercent(
      DecimalConstants<Decimal>::createDecimal("0.10"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::TwentyPercent(
      DecimalConstants<Decimal>::createDecimal("0.20"));
}

#endif
