// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __DATE_RANGE_H
#define __DATE_RANGE_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace mkc_updown
{
  using boost::posix_time::ptime;

  class DateRangeException : public std::runtime_error
  {
  public:
  DateRangeException(const std::string& msg)
    : std::runtime_error(msg)
      {}

    ~DateRangeException()
      {}
  };

  /**
   * @class DateRange
   * @brief Closed interval [first, last] of timestamps used to bound the tick
   *        data loaded for a backtest run.
   */
  class DateRange
  {
  public:
    DateRange(const ptime& firstDateTime, const ptime& lastDateTime)
      : mFirstDateTime(firstDateTime),
	mLastDateTime(lastDateTime)
    {
      if (firstDateTime.is_special() || lastDateTime.is_special())
	throw DateRangeException ("DateRange::DateRange - both ends of the range must be valid timestamps");

      if (lastDateTime < firstDateTime)
	throw DateRangeException ("DateRange::DateRange - Second date cannot occur before first date");
    }

    DateRange(const DateRange&) = default;
    DateRange& operator=(const DateRange&) = default;
    ~DateRange() noexcept = default;

    const ptime& getFirstDateTime() const
    {
      return mFirstDateTime;
    }

    const ptime& getLastDateTime() const
    {
      return mLastDateTime;
    }

    bool contains(const ptime& timestamp) const
    {
      return (timestamp >= mFirstDateTime) && (timestamp <= mLastDateTime);
    }

  private:
    ptime mFirstDateTime;
    ptime mLastDateTime;
  };

  inline bool operator==(const DateRange& lhs, const DateRange& rhs)
  {
    return (lhs.getFirstDateTime() == rhs.getFirstDateTime()) &&
      (lhs.getLastDateTime() == rhs.getLastDateTime());
  }

  inline bool operator!=(const DateRange& lhs, const DateRange& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
