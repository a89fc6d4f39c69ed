// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __DECIMAL_CONSTANT_H
#define __DECIMAL_CONSTANT_H 1

#include <string>
#include <type_traits>
#include "decimal.h"

namespace mkc_updown
{
  template <class Decimal>
  class DecimalConstants
    {
    public:
      static Decimal DecimalZero;
      static Decimal DecimalOne;
      static Decimal DecimalTwo;
      static Decimal DecimalOneHundred;

      // Binary contract payouts
      static Decimal WinningPayout;
      static Decimal LosingPayout;

      // Execution defaults
      static Decimal DefaultStartingCapital;
      static Decimal DefaultSpreadBuffer;
      static Decimal DefaultFeeRate;

      static Decimal createDecimal (const std::string& valueString)
      {
        if constexpr (std::is_floating_point_v<Decimal>) {
          return static_cast<Decimal>(std::stod(valueString));
        } else {
          return dec::fromString<Decimal>(valueString);
        }
      }
    };

  // All values are initialised via createDecimal(string) so the full precision
  // of the underlying Decimal type is used and no floating point literal
  // rounding leaks into dec::decimal<N> constants.

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalZero(
      DecimalConstants<Decimal>::createDecimal("0.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalOne(
      DecimalConstants<Decimal>::createDecimal("1.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalTwo(
      DecimalConstants<Decimal>::createDecimal("2.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalOneHundred(
      DecimalConstants<Decimal>::createDecimal("100.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::WinningPayout(
      DecimalConstants<Decimal>::createDecimal("1.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::LosingPayout(
      DecimalConstants<Decimal>::createDecimal("0.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultStartingCapital(
      DecimalConstants<Decimal>::createDecimal("100.0"));

  // Half a cent added to the ask (subtracted from the bid) on every fill
  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultSpreadBuffer(
      DecimalConstants<Decimal>::createDecimal("0.005"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultFeeRate(
      DecimalConstants<Decimal>::createDecimal("0.0"));
}

#endif
