// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef NUMBER_H
#define NUMBER_H

#include <string>
#include <type_traits>
#include "decimal.h"
#include "DecimalConstants.h"

/**
 * @file number.h
 * @brief Conversion helpers shared by every Decimal instantiation of the
 *        up/down backtester.
 *
 * Prices of binary contracts live in [0, 1] and capital is a small dollar
 * amount, so a seven digit fixed point decimal holds every value exactly.
 * All helpers also accept plain floating point types so the templates can be
 * instantiated with double in quick experiments.
 */
namespace num
{
  /**
   * @brief Default decimal type with 7 decimal places using the default rounding policy.
   * @see dec::decimal
   */
  using DefaultNumber  = dec::decimal<7>;

  /**
   * @brief Converts a decimal to its string representation.
   */
  template<class Decimal>
  inline std::string toString(const Decimal& d)
  {
    if constexpr (std::is_floating_point_v<Decimal>)
      return std::to_string(d);
    else
      return dec::toString(d);
  }

  /**
   * @brief Converts a decimal to a double.
   * Note: This conversion may result in a loss of precision. It is only used
   * for output, never inside the accounting.
   */
  template<class Decimal>
  inline double to_double(const Decimal& d)
  {
    if constexpr (std::is_floating_point_v<Decimal>)
      return static_cast<double>(d);
    else
      return d.getAsDouble();
  }

  /**
   * @brief Parses a string into a decimal type.
   * @throws std::invalid_argument for floating point types when the string is not a number
   */
  template<class N>
  inline N fromString(const std::string& s)
  {
    return mkc_updown::DecimalConstants<N>::createDecimal(s);
  }

  template<typename Decimal>
  inline Decimal abs(const Decimal& d)
  {
    if constexpr (std::is_floating_point_v<Decimal>)
      return d < Decimal(0) ? -d : d;
    else
      return d.abs();
  }

  /**
   * @brief Converts a count (trades, windows, units) into a Decimal.
   */
  template<typename Decimal>
  inline Decimal fromCount(std::size_t count)
  {
    return Decimal(static_cast<unsigned int>(count));
  }

  template<typename Decimal>
  inline const Decimal& maxOf(const Decimal& lhs, const Decimal& rhs)
  {
    return (lhs < rhs) ? rhs : lhs;
  }

  template<typename Decimal>
  inline const Decimal& minOf(const Decimal& lhs, const Decimal& rhs)
  {
    return (rhs < lhs) ? rhs : lhs;
  }
} // namespace num

#endif // NUMBER_H
