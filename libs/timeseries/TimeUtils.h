// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIME_UTILS_H
#define __TIME_UTILS_H 1

#include <cstdint>
#include <stdexcept>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace mkc_updown
{
  class TimestampParseException : public std::runtime_error
  {
  public:
    explicit TimestampParseException(const std::string& msg)
      : std::runtime_error(msg)
    {}
  };

  /**
   * @brief Parse an ISO-8601 timestamp as produced by the tick recorders.
   *
   * Accepted forms: "2026-01-25T12:00:00Z", "2026-01-25T12:00:00.250Z",
   * "2026-01-25T12:00:00+00:00", "2026-01-25 12:00:00" and the bare date
   * "2026-01-25" (midnight). Only UTC offsets
   * are accepted; every timestamp in the engine is UTC.
   *
   * @throws TimestampParseException when the string is not a UTC timestamp
   */
  boost::posix_time::ptime parseIsoTimestamp(const std::string& timestamp);

  /**
   * @brief Format a timestamp as "YYYY-MM-DDTHH:MM:SS[.ffffff]Z".
   */
  std::string toIsoString(const boost::posix_time::ptime& timestamp);

  /**
   * @brief Whole seconds since 1970-01-01T00:00:00Z (fraction truncated).
   */
  int64_t toEpochSeconds(const boost::posix_time::ptime& timestamp);

  boost::posix_time::ptime fromEpochSeconds(int64_t epochSeconds);

  /**
   * @brief Current wall clock time formatted for file names, e.g. "Aug_25_2024_1430".
   */
  std::string getCurrentTimestamp();
}

#endif
