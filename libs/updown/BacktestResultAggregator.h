// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_RESULT_AGGREGATOR_H
#define __BACKTEST_RESULT_AGGREGATOR_H 1

#include <algorithm>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BinaryWindow.h"
#include "DecimalConstants.h"
#include "ExecutionSimulator.h"
#include "StrategyParameters.h"
#include "WindowResult.h"
#include "number.h"

namespace mkc_updown
{
  using boost::posix_time::ptime;

  /**
   * @brief One line per aggregated window.
   */
  template <class Decimal>
  class WindowSummary
  {
  public:
    explicit WindowSummary(const WindowResult<Decimal>& result)
      : mCloseTime(result.getCloseTime()),
	mSymbol(result.getSymbol()),
	mStrikePrice(result.getStrikePrice()),
	mOracleClosePrice(result.getOracleClosePrice()),
	mResolvedDirection(result.getResolvedDirection()),
	mPnl(result.getPnl()),
	mNumTrades(result.getNumTrades()),
	mEventsProcessed(result.getEventsProcessed()),
	mNumEventFaults(result.getEventFaults().size())
    {}

    const ptime& getCloseTime() const { return mCloseTime; }
    const std::string& getSymbol() const { return mSymbol; }
    const std::optional<Decimal>& getStrikePrice() const { return mStrikePrice; }
    const std::optional<Decimal>& getOracleClosePrice() const { return mOracleClosePrice; }
    const std::optional<OutcomeDirection>& getResolvedDirection() const { return mResolvedDirection; }
    const Decimal& getPnl() const { return mPnl; }
    unsigned long getNumTrades() const { return mNumTrades; }
    unsigned long getEventsProcessed() const { return mEventsProcessed; }
    unsigned long getNumEventFaults() const { return mNumEventFaults; }

  private:
    ptime mCloseTime;
    std::string mSymbol;
    std::optional<Decimal> mStrikePrice;
    std::optional<Decimal> mOracleClosePrice;
    std::optional<OutcomeDirection> mResolvedDirection;
    Decimal mPnl;
    unsigned long mNumTrades;
    unsigned long mEventsProcessed;
    unsigned long mNumEventFaults;
  };

  template <class Decimal>
  inline bool operator==(const WindowSummary<Decimal>& lhs, const WindowSummary<Decimal>& rhs)
  {
    return (lhs.getCloseTime() == rhs.getCloseTime()) &&
      (lhs.getSymbol() == rhs.getSymbol()) &&
      (lhs.getStrikePrice() == rhs.getStrikePrice()) &&
      (lhs.getOracleClosePrice() == rhs.getOracleClosePrice()) &&
      (lhs.getResolvedDirection() == rhs.getResolvedDirection()) &&
      (lhs.getPnl() == rhs.getPnl()) &&
      (lhs.getNumTrades() == rhs.getNumTrades()) &&
      (lhs.getEventsProcessed() == rhs.getEventsProcessed()) &&
      (lhs.getNumEventFaults() == rhs.getNumEventFaults());
  }

  /**
   * @brief A window whose evaluation failed and was left out of the aggregation.
   */
  class FailedWindow
  {
  public:
    FailedWindow(const std::string& symbol, const ptime& closeTime, const std::string& message)
      : mSymbol(symbol),
	mCloseTime(closeTime),
	mMessage(message)
    {}

    const std::string& getSymbol() const { return mSymbol; }
    const ptime& getCloseTime() const { return mCloseTime; }
    const std::string& getMessage() const { return mMessage; }

  private:
    std::string mSymbol;
    ptime mCloseTime;
    std::string mMessage;
  };

  inline bool operator==(const FailedWindow& lhs, const FailedWindow& rhs)
  {
    return (lhs.getSymbol() == rhs.getSymbol()) &&
      (lhs.getCloseTime() == rhs.getCloseTime()) &&
      (lhs.getMessage() == rhs.getMessage());
  }

  template <class Decimal>
  class BacktestSummary
  {
  public:
    BacktestSummary(unsigned long totalTrades,
		    const Decimal& winRate,
		    const Decimal& totalPnl,
		    const Decimal& returnPct,
		    const Decimal& maxDrawdown,
		    const Decimal& finalCapital,
		    const Decimal& avgWin,
		    const Decimal& avgLoss,
		    unsigned long eventsProcessed,
		    unsigned long windowsProcessed,
		    unsigned long eventFaults)
      : mTotalTrades(totalTrades),
	mWinRate(winRate),
	mTotalPnl(totalPnl),
	mReturnPct(returnPct),
	mMaxDrawdown(maxDrawdown),
	mFinalCapital(finalCapital),
	mAvgWin(avgWin),
	mAvgLoss(avgLoss),
	mEventsProcessed(eventsProcessed),
	mWindowsProcessed(windowsProcessed),
	mEventFaults(eventFaults)
    {}

    unsigned long getTotalTrades() const { return mTotalTrades; }
    const Decimal& getWinRate() const { return mWinRate; }
    const Decimal& getTotalPnl() const { return mTotalPnl; }

    /**
     * @brief Total pnl as a fraction of the starting capital.
     */
    const Decimal& getReturnPct() const { return mReturnPct; }

    /**
     * @brief Largest fractional decline from a prior peak, in [0, 1].
     */
    const Decimal& getMaxDrawdown() const { return mMaxDrawdown; }
    const Decimal& getFinalCapital() const { return mFinalCapital; }
    const Decimal& getAvgWin() const { return mAvgWin; }
    const Decimal& getAvgLoss() const { return mAvgLoss; }
    unsigned long getEventsProcessed() const { return mEventsProcessed; }
    unsigned long getWindowsProcessed() const { return mWindowsProcessed; }
    unsigned long getEventFaults() const { return mEventFaults; }

  private:
    unsigned long mTotalTrades;
    Decimal mWinRate;
    Decimal mTotalPnl;
    Decimal mReturnPct;
    Decimal mMaxDrawdown;
    Decimal mFinalCapital;
    Decimal mAvgWin;
    Decimal mAvgLoss;
    unsigned long mEventsProcessed;
    unsigned long mWindowsProcessed;
    unsigned long mEventFaults;
  };

  template <class Decimal>
  inline bool operator==(const BacktestSummary<Decimal>& lhs, const BacktestSummary<Decimal>& rhs)
  {
    return (lhs.getTotalTrades() == rhs.getTotalTrades()) &&
      (lhs.getWinRate() == rhs.getWinRate()) &&
      (lhs.getTotalPnl() == rhs.getTotalPnl()) &&
      (lhs.getReturnPct() == rhs.getReturnPct()) &&
      (lhs.getMaxDrawdown() == rhs.getMaxDrawdown()) &&
      (lhs.getFinalCapital() == rhs.getFinalCapital()) &&
      (lhs.getAvgWin() == rhs.getAvgWin()) &&
      (lhs.getAvgLoss() == rhs.getAvgLoss()) &&
      (lhs.getEventsProcessed() == rhs.getEventsProcessed()) &&
      (lhs.getWindowsProcessed() == rhs.getWindowsProcessed()) &&
      (lhs.getEventFaults() == rhs.getEventFaults());
  }

  /**
   * @class AggregateBacktestResult
   * @brief Portfolio level result of one backtest run.
   *
   * Everything except the elapsed time is a function of the run's inputs;
   * operator== compares those parts only.
   */
  template <class Decimal>
  class AggregateBacktestResult
  {
  public:
    AggregateBacktestResult(const std::string& strategyName,
			    const StrategyParameters<Decimal>& strategyParameters,
			    const Decimal& startingCapital,
			    const std::optional<ptime>& startDate,
			    const std::optional<ptime>& endDate,
			    const BacktestSummary<Decimal>& summary,
			    const std::vector<SimulatedTrade<Decimal>>& trades,
			    const std::vector<Decimal>& equityCurve,
			    const std::vector<WindowSummary<Decimal>>& windowSummaries,
			    const std::vector<FailedWindow>& failedWindows,
			    long elapsedMilliseconds)
      : mStrategyName(strategyName),
	mStrategyParameters(strategyParameters),
	mStartingCapital(startingCapital),
	mStartDate(startDate),
	mEndDate(endDate),
	mSummary(summary),
	mTrades(trades),
	mEquityCurve(equityCurve),
	mWindowSummaries(windowSummaries),
	mFailedWindows(failedWindows),
	mElapsedMilliseconds(elapsedMilliseconds)
    {}

    const std::string& getStrategyName() const { return mStrategyName; }
    const StrategyParameters<Decimal>& getStrategyParameters() const { return mStrategyParameters; }
    const Decimal& getStartingCapital() const { return mStartingCapital; }

    /**
     * @brief Close time of the first and last aggregated window.
     */
    const std::optional<ptime>& getStartDate() const { return mStartDate; }
    const std::optional<ptime>& getEndDate() const { return mEndDate; }

    const BacktestSummary<Decimal>& getSummary() const { return mSummary; }

    /**
     * @brief All trades, window by window in close time order.
     */
    const std::vector<SimulatedTrade<Decimal>>& getTrades() const { return mTrades; }

    /**
     * @brief Starting capital followed by the running capital after each window.
     */
    const std::vector<Decimal>& getEquityCurve() const { return mEquityCurve; }
    const std::vector<WindowSummary<Decimal>>& getWindowSummaries() const { return mWindowSummaries; }
    const std::vector<FailedWindow>& getFailedWindows() const { return mFailedWindows; }
    long getElapsedMilliseconds() const { return mElapsedMilliseconds; }

    bool operator==(const AggregateBacktestResult<Decimal>& rhs) const
    {
      return (mStrategyName == rhs.mStrategyName) &&
	(mStrategyParameters == rhs.mStrategyParameters) &&
	(mStartingCapital == rhs.mStartingCapital) &&
	(mStartDate == rhs.mStartDate) &&
	(mEndDate == rhs.mEndDate) &&
	(mSummary == rhs.mSummary) &&
	(mTrades == rhs.mTrades) &&
	(mEquityCurve == rhs.mEquityCurve) &&
	(mWindowSummaries == rhs.mWindowSummaries) &&
	(mFailedWindows == rhs.mFailedWindows);
    }

    bool operator!=(const AggregateBacktestResult<Decimal>& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    std::string mStrategyName;
    StrategyParameters<Decimal> mStrategyParameters;
    Decimal mStartingCapital;
    std::optional<ptime> mStartDate;
    std::optional<ptime> mEndDate;
    BacktestSummary<Decimal> mSummary;
    std::vector<SimulatedTrade<Decimal>> mTrades;
    std::vector<Decimal> mEquityCurve;
    std::vector<WindowSummary<Decimal>> mWindowSummaries;
    std::vector<FailedWindow> mFailedWindows;
    long mElapsedMilliseconds;
  };

  /**
   * @class BacktestResultAggregator
   * @brief Folds per-window results into one chronological portfolio result.
   *
   * Windows complete in any order under concurrent evaluation, so results are
   * first ordered by close time. The sort is stable: windows closing at the
   * same time stay in the order they were submitted.
   *
   * Walking the ordered windows the running capital is the starting capital
   * plus the cumulative pnl. Drawdown is measured against the highest running
   * capital seen so far, only while that peak is positive, and is clamped to
   * [0, 1]. A trade with pnl > 0 is a win; every other trade counts toward the
   * average loss.
   */
  template <class Decimal>
  class BacktestResultAggregator
  {
  public:
    static AggregateBacktestResult<Decimal> aggregate(const std::vector<WindowResult<Decimal>>& windowResults,
						      const std::string& strategyName,
						      const StrategyParameters<Decimal>& strategyParameters,
						      const Decimal& startingCapital,
						      const std::vector<FailedWindow>& failedWindows,
						      long elapsedMilliseconds)
    {
      const Decimal& zero = DecimalConstants<Decimal>::DecimalZero;
      const Decimal& one = DecimalConstants<Decimal>::DecimalOne;

      std::vector<const WindowResult<Decimal>*> ordered;
      ordered.reserve(windowResults.size());
      for (const auto& result : windowResults)
	ordered.push_back(&result);

      std::stable_sort(ordered.begin(), ordered.end(),
		       [](const WindowResult<Decimal>* lhs, const WindowResult<Decimal>* rhs) {
			 return lhs->getCloseTime() < rhs->getCloseTime();
		       });

      Decimal totalPnl(zero);
      Decimal runningCapital(startingCapital);
      Decimal peakCapital(startingCapital);
      Decimal maxDrawdown(zero);
      Decimal winSum(zero);
      Decimal lossSum(zero);
      unsigned long totalWins = 0;
      unsigned long eventsProcessed = 0;
      unsigned long eventFaults = 0;

      std::vector<SimulatedTrade<Decimal>> allTrades;
      std::vector<Decimal> equityCurve(1, startingCapital);
      std::vector<WindowSummary<Decimal>> summaries;
      summaries.reserve(ordered.size());

      for (const WindowResult<Decimal>* result : ordered)
	{
	  totalPnl += result->getPnl();
	  eventsProcessed += result->getEventsProcessed();
	  eventFaults += result->getEventFaults().size();

	  for (const auto& trade : result->getTrades())
	    {
	      allTrades.push_back(trade);

	      if (trade.isWinner())
		{
		  totalWins++;
		  winSum += trade.getPnl();
		}
	      else
		lossSum += trade.getPnl();
	    }

	  summaries.push_back(WindowSummary<Decimal>(*result));

	  runningCapital += result->getPnl();
	  equityCurve.push_back(runningCapital);

	  if (runningCapital > peakCapital)
	    peakCapital = runningCapital;

	  if (peakCapital > zero)
	    {
	      Decimal drawdown = (peakCapital - runningCapital) / peakCapital;
	      if (drawdown > maxDrawdown)
		maxDrawdown = num::minOf(drawdown, one);
	    }
	}

      const unsigned long totalTrades = allTrades.size();
      const unsigned long totalLosses = totalTrades - totalWins;

      Decimal winRate = (totalTrades > 0) ?
	num::fromCount<Decimal>(totalWins) / num::fromCount<Decimal>(totalTrades) : zero;
      Decimal returnPct = (startingCapital > zero) ? totalPnl / startingCapital : zero;
      Decimal avgWin = (totalWins > 0) ? winSum / num::fromCount<Decimal>(totalWins) : zero;
      Decimal avgLoss = (totalLosses > 0) ? lossSum / num::fromCount<Decimal>(totalLosses) : zero;

      std::optional<ptime> startDate;
      std::optional<ptime> endDate;
      if (!ordered.empty())
	{
	  startDate = ordered.front()->getCloseTime();
	  endDate = ordered.back()->getCloseTime();
	}

      BacktestSummary<Decimal> summary(totalTrades, winRate, totalPnl, returnPct, maxDrawdown,
				       runningCapital, avgWin, avgLoss, eventsProcessed,
				       ordered.size(), eventFaults);

      return AggregateBacktestResult<Decimal>(strategyName, strategyParameters, startingCapital,
					      startDate, endDate, summary, allTrades, equityCurve,
					      summaries, failedWindows, elapsedMilliseconds);
    }
  };
}

#endif
