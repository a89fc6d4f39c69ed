// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "TimeUtils.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <boost/algorithm/string.hpp>

namespace mkc_updown
{
  using boost::posix_time::ptime;

  static const ptime& getEpoch()
  {
    static const ptime epoch(boost::gregorian::date(1970, 1, 1));
    return epoch;
  }

  ptime parseIsoTimestamp(const std::string& timestamp)
  {
    std::string text = boost::algorithm::trim_copy(timestamp);

    if (text.empty())
      throw TimestampParseException("parseIsoTimestamp - empty timestamp");

    if (boost::algorithm::ends_with(text, "Z") || boost::algorithm::ends_with(text, "z"))
      text.erase(text.size() - 1);
    else if (boost::algorithm::ends_with(text, "+00:00"))
      text.erase(text.size() - 6);
    else if (text.size() > 19 && (text[text.size() - 6] == '+' || text[text.size() - 6] == '-')
	     && text[text.size() - 3] == ':')
      throw TimestampParseException("parseIsoTimestamp - non UTC offset in " + timestamp);

    // "2026-01-25 12:00:00" is the database export form
    if (text.size() > 10 && text[10] == ' ')
      text[10] = 'T';
    else if (text.size() == 10)
      text += "T00:00:00";

    ptime result;
    try
      {
	result = boost::posix_time::from_iso_extended_string(text);
      }
    catch (const std::exception& e)
      {
	throw TimestampParseException("parseIsoTimestamp - cannot parse " + timestamp + ": " + e.what());
      }

    if (result.is_special())
      throw TimestampParseException("parseIsoTimestamp - cannot parse " + timestamp);

    return result;
  }

  std::string toIsoString(const ptime& timestamp)
  {
    if (timestamp.is_special())
      return boost::posix_time::to_simple_string(timestamp);

    return boost::posix_time::to_iso_extended_string(timestamp) + "Z";
  }

  int64_t toEpochSeconds(const ptime& timestamp)
  {
    return (timestamp - getEpoch()).total_seconds();
  }

  ptime fromEpochSeconds(int64_t epochSeconds)
  {
    return getEpoch() + boost::posix_time::seconds(static_cast<long>(epochSeconds));
  }

  std::string getCurrentTimestamp()
  {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%b_%d_%Y_%H%M");
    return ss.str();
  }
}
