// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIMELINE_BUILDER_H
#define __TIMELINE_BUILDER_H 1

#include <algorithm>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include "MarketEvents.h"

namespace mkc_updown
{
  /**
   * @brief The three tick collections that make up one window's market data.
   */
  template <class Decimal>
  class WindowTickData
  {
  public:
    WindowTickData()
      : mOracleTicks(),
	mBookSnapshots(),
	mExchangeTicks()
    {}

    WindowTickData(const std::vector<OracleTick<Decimal>>& oracleTicks,
		   const std::vector<BookSnapshot<Decimal>>& bookSnapshots,
		   const std::vector<ExchangeTick<Decimal>>& exchangeTicks)
      : mOracleTicks(oracleTicks),
	mBookSnapshots(bookSnapshots),
	mExchangeTicks(exchangeTicks)
    {}

    const std::vector<OracleTick<Decimal>>& getOracleTicks() const
    {
      return mOracleTicks;
    }

    const std::vector<BookSnapshot<Decimal>>& getBookSnapshots() const
    {
      return mBookSnapshots;
    }

    const std::vector<ExchangeTick<Decimal>>& getExchangeTicks() const
    {
      return mExchangeTicks;
    }

    std::size_t getNumTicks() const
    {
      return mOracleTicks.size() + mBookSnapshots.size() + mExchangeTicks.size();
    }

  private:
    std::vector<OracleTick<Decimal>> mOracleTicks;
    std::vector<BookSnapshot<Decimal>> mBookSnapshots;
    std::vector<ExchangeTick<Decimal>> mExchangeTicks;
  };

  /**
   * @class TimelineBuilder
   * @brief Merges a window's three tick sources into one tagged, time ordered sequence.
   *
   * Tagging:
   *   - oracle ticks: OracleTopic -> "chainlink", ReferenceTopic -> "polyRef",
   *     any other topic -> "raw:<topic>"
   *   - book snapshots: symbol containing "down" (any case) -> "clobDown",
   *     otherwise "clobUp"
   *   - exchange ticks: "exchange:<name>"
   *
   * A record missing the field a tag is built from gets the generic tag
   * ("raw:unknown", "exchange:unknown") and is kept.
   *
   * The merged events are ordered with a stable sort on timestamp. Events
   * sharing a timestamp keep insertion order: oracle ticks, then book
   * snapshots, then exchange ticks, each in their input order.
   */
  template <class Decimal>
  class TimelineBuilder
  {
  public:
    static std::vector<TimelineEvent<Decimal>> buildTimeline(const WindowTickData<Decimal>& data)
    {
      std::vector<TimelineEvent<Decimal>> timeline;
      timeline.reserve(data.getNumTicks());

      for (const auto& tick : data.getOracleTicks())
	timeline.emplace_back(tick, tagOracleTick(tick));

      for (const auto& snapshot : data.getBookSnapshots())
	timeline.emplace_back(snapshot, tagBookSnapshot(snapshot));

      for (const auto& tick : data.getExchangeTicks())
	timeline.emplace_back(tick, tagExchangeTick(tick));

      std::stable_sort(timeline.begin(), timeline.end(),
		       [](const TimelineEvent<Decimal>& lhs, const TimelineEvent<Decimal>& rhs) {
			 return lhs.getTimestamp() < rhs.getTimestamp();
		       });

      return timeline;
    }

    static std::string tagOracleTick(const OracleTick<Decimal>& tick)
    {
      const std::string& topic = tick.getTopic();

      if (topic == OracleTopic)
	return OracleSourceTag;
      if (topic == ReferenceTopic)
	return ReferenceSourceTag;

      return RawFeedTagPrefix + (topic.empty() ? std::string("unknown") : topic);
    }

    static std::string tagBookSnapshot(const BookSnapshot<Decimal>& snapshot)
    {
      if (boost::algorithm::icontains(snapshot.getSymbol(), "down"))
	return DownBookSourceTag;

      return UpBookSourceTag;
    }

    static std::string tagExchangeTick(const ExchangeTick<Decimal>& tick)
    {
      const std::string& exchange = tick.getExchange();
      return ExchangeTagPrefix + (exchange.empty() ? std::string("unknown") : exchange);
    }
  };
}

#endif
