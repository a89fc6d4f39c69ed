// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __INTERVAL_SLICER_H
#define __INTERVAL_SLICER_H 1

#include <algorithm>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace mkc_updown
{
  using boost::posix_time::ptime;

  /**
   * @class IntervalSlicer
   * @brief Extracts the records of a timestamp-sorted vector that fall in [start, end).
   *
   * Record must expose getTimestamp(). The input must be sorted ascending by
   * timestamp (ties in any order); the slicer never reorders or modifies it,
   * so one sorted vector can be sliced from many threads at once.
   *
   * Both bounds are found by binary search: the first record at or after
   * start, and the first record after end - 1 tick. Symbol or epoch filtering
   * is not monotonic in the timestamp and is applied by the caller to the
   * returned slice.
   */
  template <class Record>
  class IntervalSlicer
  {
  public:
    typedef typename std::vector<Record>::const_iterator ConstRecordIterator;

    /**
     * @brief First record with timestamp >= target (end() if none).
     */
    static ConstRecordIterator lowerBound(const std::vector<Record>& sorted, const ptime& target)
    {
      return std::lower_bound(sorted.begin(), sorted.end(), target,
			      [](const Record& record, const ptime& t) {
				return record.getTimestamp() < t;
			      });
    }

    /**
     * @brief First record with timestamp > target (end() if none).
     */
    static ConstRecordIterator upperBound(const std::vector<Record>& sorted, const ptime& target)
    {
      return std::upper_bound(sorted.begin(), sorted.end(), target,
			      [](const ptime& t, const Record& record) {
				return t < record.getTimestamp();
			      });
    }

    /**
     * @brief Copy of the records with start <= timestamp < end.
     *
     * An empty or inverted interval yields an empty vector.
     */
    static std::vector<Record> slice(const std::vector<Record>& sorted,
				     const ptime& start,
				     const ptime& end)
    {
      if (end <= start)
	return std::vector<Record>();

      ConstRecordIterator first = lowerBound(sorted, start);
      ConstRecordIterator last = upperBound(sorted, end - boost::posix_time::time_duration::unit());

      if (last <= first)
	return std::vector<Record>();

      return std::vector<Record>(first, last);
    }

    /**
     * @brief Copy of the records with timestamp < start.
     */
    static std::vector<Record> sliceBefore(const std::vector<Record>& sorted, const ptime& start)
    {
      return std::vector<Record>(sorted.begin(), lowerBound(sorted, start));
    }

    /**
     * @brief Copy of the records with timestamp >= end.
     */
    static std::vector<Record> sliceFrom(const std::vector<Record>& sorted, const ptime& end)
    {
      return std::vector<Record>(lowerBound(sorted, end), sorted.end());
    }
  };
}

#endif
