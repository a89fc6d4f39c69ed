// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __WINDOW_RESULT_H
#define __WINDOW_RESULT_H 1

#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BinaryWindow.h"
#include "ExecutionSimulator.h"
#include "GroundTruthResolver.h"

namespace mkc_updown
{
  using boost::posix_time::ptime;

  /**
   * @brief Result of replaying one event: ok, or a fault raised by the
   *        strategy or the execution step.
   */
  class EventOutcome
  {
  public:
    static EventOutcome ok(const ptime& timestamp)
    {
      return EventOutcome(timestamp, true, std::string());
    }

    static EventOutcome fault(const ptime& timestamp, const std::string& message)
    {
      return EventOutcome(timestamp, false, message);
    }

    bool isOk() const
    {
      return mOk;
    }

    const ptime& getTimestamp() const
    {
      return mTimestamp;
    }

    const std::string& getMessage() const
    {
      return mMessage;
    }

  private:
    EventOutcome(const ptime& timestamp, bool ok, const std::string& message)
      : mTimestamp(timestamp),
	mOk(ok),
	mMessage(message)
    {}

    ptime mTimestamp;
    bool mOk;
    std::string mMessage;
  };

  inline bool operator==(const EventOutcome& lhs, const EventOutcome& rhs)
  {
    return (lhs.isOk() == rhs.isOk()) &&
      (lhs.getTimestamp() == rhs.getTimestamp()) &&
      (lhs.getMessage() == rhs.getMessage());
  }

  /**
   * @class WindowResult
   * @brief Everything one window evaluation produced. Immutable once built.
   */
  template <class Decimal>
  class WindowResult
  {
  public:
    WindowResult(const BinaryWindow<Decimal>& window,
		 const ptime& openTime,
		 const std::optional<GroundTruth>& groundTruth,
		 const SimulatorStats<Decimal>& stats,
		 const std::vector<SimulatedTrade<Decimal>>& trades,
		 const std::vector<Decimal>& equityCurve,
		 unsigned long eventsProcessed,
		 const std::vector<EventOutcome>& eventFaults)
      : mSymbol(window.getSymbol()),
	mOpenTime(openTime),
	mCloseTime(window.getCloseTime()),
	mStrikePrice(window.getStrikePrice()),
	mOracleClosePrice(window.getOracleClosePrice()),
	mGroundTruth(groundTruth),
	mPnl(stats.getTotalPnl()),
	mCapitalAfter(stats.getFinalCapital()),
	mWinRate(stats.getWinRate()),
	mTrades(trades),
	mEquityCurve(equityCurve),
	mEventsProcessed(eventsProcessed),
	mEventFaults(eventFaults)
    {}

    const std::string& getSymbol() const { return mSymbol; }
    const ptime& getOpenTime() const { return mOpenTime; }
    const ptime& getCloseTime() const { return mCloseTime; }
    const std::optional<Decimal>& getStrikePrice() const { return mStrikePrice; }
    const std::optional<Decimal>& getOracleClosePrice() const { return mOracleClosePrice; }
    const std::optional<GroundTruth>& getGroundTruth() const { return mGroundTruth; }

    std::optional<OutcomeDirection> getResolvedDirection() const
    {
      if (!mGroundTruth)
	return std::nullopt;

      return mGroundTruth->getDirection();
    }

    const Decimal& getPnl() const { return mPnl; }
    const Decimal& getCapitalAfter() const { return mCapitalAfter; }
    const Decimal& getWinRate() const { return mWinRate; }
    const std::vector<SimulatedTrade<Decimal>>& getTrades() const { return mTrades; }
    unsigned long getNumTrades() const { return mTrades.size(); }
    const std::vector<Decimal>& getEquityCurve() const { return mEquityCurve; }
    unsigned long getEventsProcessed() const { return mEventsProcessed; }

    /**
     * @brief Events whose strategy or execution step failed, in replay order.
     */
    const std::vector<EventOutcome>& getEventFaults() const { return mEventFaults; }

  private:
    std::string mSymbol;
    ptime mOpenTime;
    ptime mCloseTime;
    std::optional<Decimal> mStrikePrice;
    std::optional<Decimal> mOracleClosePrice;
    std::optional<GroundTruth> mGroundTruth;
    Decimal mPnl;
    Decimal mCapitalAfter;
    Decimal mWinRate;
    std::vector<SimulatedTrade<Decimal>> mTrades;
    std::vector<Decimal> mEquityCurve;
    unsigned long mEventsProcessed;
    std::vector<EventOutcome> mEventFaults;
  };
}

#endif
