// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EXECUTION_SIMULATOR_H
#define __EXECUTION_SIMULATOR_H 1

#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BinaryWindow.h"
#include "DecimalConstants.h"
#include "StrategyParameters.h"
#include "TradeSignal.h"
#include "WindowMarketState.h"
#include "number.h"

namespace mkc_updown
{
  using boost::posix_time::ptime;

  class ExecutionSimulatorException : public std::runtime_error
  {
  public:
  ExecutionSimulatorException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~ExecutionSimulatorException()
      {}
  };

  // Reasons an execute() request is not filled
  const std::string NoBookDataReason("no_book_data");
  const std::string InvalidSizeReason("invalid_size");
  const std::string InsufficientCapitalReason("insufficient_capital");
  const std::string NoPositionReason("no_position");
  const std::string UnknownTokenReason("unknown_token");
  const std::string UnsupportedActionReason("unsupported_action");

  const std::string ResolutionExitReason("resolution");
  const std::string StrategySellExitReason("strategy_sell");

  /**
   * @brief Capital, spread buffer and fee rate a per-window ledger starts from.
   *
   * The spread buffer is added to the ask on buys and subtracted from the bid
   * on sells. The fee rate is a fraction of the notional of every fill.
   */
  template <class Decimal>
  class ExecutionSettings
  {
  public:
    ExecutionSettings(const Decimal& startingCapital,
		      const Decimal& spreadBuffer,
		      const Decimal& feeRate)
      : mStartingCapital(startingCapital),
	mSpreadBuffer(spreadBuffer),
	mFeeRate(feeRate)
    {}

    const Decimal& getStartingCapital() const
    {
      return mStartingCapital;
    }

    const Decimal& getSpreadBuffer() const
    {
      return mSpreadBuffer;
    }

    const Decimal& getFeeRate() const
    {
      return mFeeRate;
    }

  private:
    Decimal mStartingCapital;
    Decimal mSpreadBuffer;
    Decimal mFeeRate;
  };

  /**
   * @brief Outcome of a fill request: filled at a price and size, or rejected with a reason.
   */
  template <class Decimal>
  class ExecutionDecision
  {
  public:
    static ExecutionDecision<Decimal> filled(const Decimal& fillPrice, const Decimal& fillSize)
    {
      return ExecutionDecision<Decimal>(true, fillPrice, fillSize, std::string());
    }

    static ExecutionDecision<Decimal> rejected(const std::string& reason)
    {
      return ExecutionDecision<Decimal>(false,
					DecimalConstants<Decimal>::DecimalZero,
					DecimalConstants<Decimal>::DecimalZero,
					reason);
    }

    bool isFilled() const
    {
      return mFilled;
    }

    const Decimal& getFillPrice() const
    {
      return mFillPrice;
    }

    const Decimal& getFillSize() const
    {
      return mFillSize;
    }

    const std::string& getReason() const
    {
      return mReason;
    }

  private:
    ExecutionDecision(bool filled, const Decimal& fillPrice, const Decimal& fillSize,
		      const std::string& reason)
      : mFilled(filled),
	mFillPrice(fillPrice),
	mFillSize(fillSize),
	mReason(reason)
    {}

    bool mFilled;
    Decimal mFillPrice;
    Decimal mFillSize;
    std::string mReason;
  };

  /**
   * @brief One lot bought and not yet sold or settled.
   */
  template <class Decimal>
  class OpenLot
  {
  public:
    OpenLot(const std::string& token,
	    const Decimal& entryPrice,
	    const Decimal& size,
	    const Decimal& entryFee,
	    const ptime& entryTime,
	    const std::string& entryReason)
      : mToken(token),
	mEntryPrice(entryPrice),
	mSize(size),
	mEntryFee(entryFee),
	mEntryTime(entryTime),
	mEntryReason(entryReason)
    {}

    const std::string& getToken() const { return mToken; }
    const Decimal& getEntryPrice() const { return mEntryPrice; }
    const Decimal& getSize() const { return mSize; }
    const Decimal& getEntryFee() const { return mEntryFee; }
    const ptime& getEntryTime() const { return mEntryTime; }
    const std::string& getEntryReason() const { return mEntryReason; }

    Decimal getCost() const
    {
      return mEntryPrice * mSize;
    }

  private:
    std::string mToken;
    Decimal mEntryPrice;
    Decimal mSize;
    Decimal mEntryFee;
    ptime mEntryTime;
    std::string mEntryReason;
  };

  /**
   * @brief A closed lot: entry and exit price, size and realized pnl.
   *
   * pnl = size * (exit - entry) - entry fee - exit fee
   */
  template <class Decimal>
  class SimulatedTrade
  {
  public:
    SimulatedTrade(const std::string& token,
		   const Decimal& entryPrice,
		   const Decimal& exitPrice,
		   const Decimal& size,
		   const Decimal& fees,
		   const ptime& entryTime,
		   const ptime& exitTime,
		   const std::string& entryReason,
		   const std::string& exitReason)
      : mToken(token),
	mEntryPrice(entryPrice),
	mExitPrice(exitPrice),
	mSize(size),
	mFees(fees),
	mPnl(exitPrice * size - entryPrice * size - fees),
	mEntryTime(entryTime),
	mExitTime(exitTime),
	mEntryReason(entryReason),
	mExitReason(exitReason)
    {}

    const std::string& getToken() const { return mToken; }
    const Decimal& getEntryPrice() const { return mEntryPrice; }
    const Decimal& getExitPrice() const { return mExitPrice; }
    const Decimal& getSize() const { return mSize; }
    const Decimal& getFees() const { return mFees; }
    const Decimal& getPnl() const { return mPnl; }
    const ptime& getEntryTime() const { return mEntryTime; }
    const ptime& getExitTime() const { return mExitTime; }
    const std::string& getEntryReason() const { return mEntryReason; }
    const std::string& getExitReason() const { return mExitReason; }

    Decimal getCost() const
    {
      return mEntryPrice * mSize;
    }

    bool isWinner() const
    {
      return mPnl > DecimalConstants<Decimal>::DecimalZero;
    }

  private:
    std::string mToken;
    Decimal mEntryPrice;
    Decimal mExitPrice;
    Decimal mSize;
    Decimal mFees;
    Decimal mPnl;
    ptime mEntryTime;
    ptime mExitTime;
    std::string mEntryReason;
    std::string mExitReason;
  };

  template <class Decimal>
  inline bool operator==(const SimulatedTrade<Decimal>& lhs, const SimulatedTrade<Decimal>& rhs)
  {
    return (lhs.getToken() == rhs.getToken()) &&
      (lhs.getEntryPrice() == rhs.getEntryPrice()) &&
      (lhs.getExitPrice() == rhs.getExitPrice()) &&
      (lhs.getSize() == rhs.getSize()) &&
      (lhs.getFees() == rhs.getFees()) &&
      (lhs.getEntryTime() == rhs.getEntryTime()) &&
      (lhs.getExitTime() == rhs.getExitTime()) &&
      (lhs.getEntryReason() == rhs.getEntryReason()) &&
      (lhs.getExitReason() == rhs.getExitReason());
  }

  template <class Decimal>
  inline bool operator!=(const SimulatedTrade<Decimal>& lhs, const SimulatedTrade<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }

  template <class Decimal>
  class SimulatorStats
  {
  public:
    SimulatorStats(const Decimal& initialCapital,
		   const Decimal& finalCapital,
		   const Decimal& totalPnl,
		   unsigned long tradeCount,
		   unsigned long winCount,
		   const Decimal& avgWin,
		   const Decimal& avgLoss,
		   unsigned long openLots)
      : mInitialCapital(initialCapital),
	mFinalCapital(finalCapital),
	mTotalPnl(totalPnl),
	mTradeCount(tradeCount),
	mWinCount(winCount),
	mAvgWin(avgWin),
	mAvgLoss(avgLoss),
	mOpenLots(openLots)
    {}

    const Decimal& getInitialCapital() const { return mInitialCapital; }
    const Decimal& getFinalCapital() const { return mFinalCapital; }
    const Decimal& getTotalPnl() const { return mTotalPnl; }
    unsigned long getTradeCount() const { return mTradeCount; }
    unsigned long getWinCount() const { return mWinCount; }
    unsigned long getLossCount() const { return mTradeCount - mWinCount; }
    const Decimal& getAvgWin() const { return mAvgWin; }
    const Decimal& getAvgLoss() const { return mAvgLoss; }
    unsigned long getOpenLots() const { return mOpenLots; }

    Decimal getWinRate() const
    {
      if (mTradeCount == 0)
	return DecimalConstants<Decimal>::DecimalZero;

      return num::fromCount<Decimal>(mWinCount) / num::fromCount<Decimal>(mTradeCount);
    }

  private:
    Decimal mInitialCapital;
    Decimal mFinalCapital;
    Decimal mTotalPnl;
    unsigned long mTradeCount;
    unsigned long mWinCount;
    Decimal mAvgWin;
    Decimal mAvgLoss;
    unsigned long mOpenLots;
  };

  /**
   * @class ExecutionSimulator
   * @brief Per-window execution ledger: decides fills and books the resulting trades.
   *
   * A fresh simulator is created for every window evaluation, so
   * implementations need not be thread-safe.
   */
  template <class Decimal>
  class ExecutionSimulator
  {
  public:
    virtual ~ExecutionSimulator()
    {}

    /**
     * @brief Decide whether a signal fills against the current market state.
     *
     * Does not change the ledger; the caller books a fill with buyToken() or
     * sellToken().
     */
    virtual ExecutionDecision<Decimal> execute(const TradeSignal<Decimal>& signal,
					       const WindowMarketState<Decimal>& state,
					       const StrategyParameters<Decimal>& parameters) const = 0;

    virtual void buyToken(const std::string& token,
			  const Decimal& price,
			  const Decimal& size,
			  const ptime& timestamp,
			  const std::string& reason) = 0;

    /**
     * @brief Close up to size units of token; an empty size closes the whole holding.
     * @return the trades produced, empty if nothing was held
     */
    virtual std::vector<SimulatedTrade<Decimal>> sellToken(const std::string& token,
							   const Decimal& price,
							   const std::optional<Decimal>& size,
							   const ptime& timestamp,
							   const std::string& reason) = 0;

    /**
     * @brief Settle every open lot at the binary payout for the realized direction.
     */
    virtual std::vector<SimulatedTrade<Decimal>> resolveWindow(OutcomeDirection direction,
							       const ptime& timestamp) = 0;

    virtual SimulatorStats<Decimal> getStats() const = 0;
    virtual const std::vector<SimulatedTrade<Decimal>>& getTrades() const = 0;
    virtual const std::vector<Decimal>& getEquityCurve() const = 0;
    virtual Decimal getCapital() const = 0;
  };

  /**
   * @class BinaryExecutionSimulator
   * @brief Execution ledger for binary outcome tokens.
   *
   * Fill model:
   *   - buy fills at the best ask of the token's side plus the spread buffer
   *   - sell fills at the best bid minus the spread buffer, never below zero
   *
   * Holdings are kept as lots per token; a sell closes lots first in first out.
   * At settlement every lot pays WinningPayout per unit when its side won and
   * LosingPayout otherwise. Capital moves by cost on entry and by proceeds on
   * exit; the equity curve records the starting capital and the capital after
   * every closed trade.
   */
  template <class Decimal>
  class BinaryExecutionSimulator : public ExecutionSimulator<Decimal>
  {
  public:
    explicit BinaryExecutionSimulator(const ExecutionSettings<Decimal>& settings)
      : ExecutionSimulator<Decimal>(),
	mSettings(settings),
	mCapital(settings.getStartingCapital()),
	mOpenLots(),
	mTrades(),
	mEquityCurve(1, settings.getStartingCapital()),
	mTotalPnl(DecimalConstants<Decimal>::DecimalZero)
    {}

    ExecutionDecision<Decimal> execute(const TradeSignal<Decimal>& signal,
				       const WindowMarketState<Decimal>& state,
				       const StrategyParameters<Decimal>&) const override
    {
      const Decimal& zero = DecimalConstants<Decimal>::DecimalZero;

      if (signal.getAction() == SignalAction::Buy)
	{
	  std::optional<OutcomeDirection> side = signal.getSide();
	  if (!side)
	    return ExecutionDecision<Decimal>::rejected(UnknownTokenReason);

	  const std::optional<BookQuote<Decimal>>& book = state.getBook(*side);
	  if (!book)
	    return ExecutionDecision<Decimal>::rejected(NoBookDataReason);

	  if (signal.getSize() <= zero)
	    return ExecutionDecision<Decimal>::rejected(InvalidSizeReason);

	  Decimal fillPrice = book->getBestAsk() + mSettings.getSpreadBuffer();
	  Decimal cost = fillPrice * signal.getSize();

	  if (cost + computeFee(cost) > mCapital)
	    return ExecutionDecision<Decimal>::rejected(InsufficientCapitalReason);

	  return ExecutionDecision<Decimal>::filled(fillPrice, signal.getSize());
	}

      if (signal.getAction() == SignalAction::Sell)
	{
	  Decimal held = getHolding(signal.getToken());
	  if (held <= zero)
	    return ExecutionDecision<Decimal>::rejected(NoPositionReason);

	  std::optional<OutcomeDirection> side = signal.getSide();
	  if (!side)
	    return ExecutionDecision<Decimal>::rejected(UnknownTokenReason);

	  const std::optional<BookQuote<Decimal>>& book = state.getBook(*side);
	  if (!book)
	    return ExecutionDecision<Decimal>::rejected(NoBookDataReason);

	  if (signal.getSize() < zero)
	    return ExecutionDecision<Decimal>::rejected(InvalidSizeReason);

	  Decimal fillPrice = book->getBestBid() - mSettings.getSpreadBuffer();
	  if (fillPrice < zero)
	    fillPrice = zero;

	  Decimal fillSize = (signal.getSize() == zero) ? held : num::minOf(signal.getSize(), held);
	  return ExecutionDecision<Decimal>::filled(fillPrice, fillSize);
	}

      return ExecutionDecision<Decimal>::rejected(UnsupportedActionReason);
    }

    /**
     * @throws ExecutionSimulatorException for a non-positive size or when the
     *         cost exceeds the available capital
     */
    void buyToken(const std::string& token,
		  const Decimal& price,
		  const Decimal& size,
		  const ptime& timestamp,
		  const std::string& reason) override
    {
      if (size <= DecimalConstants<Decimal>::DecimalZero)
	throw ExecutionSimulatorException("BinaryExecutionSimulator::buyToken - size must be positive for " + token);

      Decimal cost = price * size;
      Decimal fee = computeFee(cost);

      if (cost + fee > mCapital)
	throw ExecutionSimulatorException("BinaryExecutionSimulator::buyToken - insufficient capital to buy " + token);

      mCapital -= (cost + fee);
      mOpenLots[token].push_back(OpenLot<Decimal>(token, price, size, fee, timestamp, reason));
    }

    std::vector<SimulatedTrade<Decimal>> sellToken(const std::string& token,
						   const Decimal& price,
						   const std::optional<Decimal>& size,
						   const ptime& timestamp,
						   const std::string& reason) override
    {
      std::vector<SimulatedTrade<Decimal>> closed;

      auto it = mOpenLots.find(token);
      if (it == mOpenLots.end())
	return closed;

      Decimal remaining = size ? *size : getHolding(token);
      std::deque<OpenLot<Decimal>>& lots = it->second;

      while (!lots.empty() && remaining > DecimalConstants<Decimal>::DecimalZero)
	{
	  OpenLot<Decimal> lot = lots.front();
	  lots.pop_front();

	  if (remaining < lot.getSize())
	    {
	      // Split the lot; the entry fee is shared pro rata
	      Decimal closedFee = lot.getEntryFee() * remaining / lot.getSize();
	      lots.push_front(OpenLot<Decimal>(token, lot.getEntryPrice(), lot.getSize() - remaining,
					       lot.getEntryFee() - closedFee, lot.getEntryTime(),
					       lot.getEntryReason()));
	      lot = OpenLot<Decimal>(token, lot.getEntryPrice(), remaining, closedFee,
				     lot.getEntryTime(), lot.getEntryReason());
	    }

	  Decimal proceeds = price * lot.getSize();
	  Decimal exitFee = computeFee(proceeds);

	  mCapital += (proceeds - exitFee);
	  closed.push_back(bookTrade(lot, price, lot.getEntryFee() + exitFee, timestamp, reason));
	  remaining -= lot.getSize();
	}

      if (lots.empty())
	mOpenLots.erase(it);

      return closed;
    }

    std::vector<SimulatedTrade<Decimal>> resolveWindow(OutcomeDirection direction,
						       const ptime& timestamp) override
    {
      std::vector<SimulatedTrade<Decimal>> settled;

      for (const auto& entry : mOpenLots)
	{
	  std::optional<OutcomeDirection> side = tokenSide(entry.first);
	  const Decimal& payout = (side && *side == direction) ?
	    DecimalConstants<Decimal>::WinningPayout : DecimalConstants<Decimal>::LosingPayout;

	  for (const auto& lot : entry.second)
	    {
	      mCapital += payout * lot.getSize();
	      settled.push_back(bookTrade(lot, payout, lot.getEntryFee(), timestamp, ResolutionExitReason));
	    }
	}

      mOpenLots.clear();
      return settled;
    }

    SimulatorStats<Decimal> getStats() const override
    {
      Decimal winSum(DecimalConstants<Decimal>::DecimalZero);
      Decimal lossSum(DecimalConstants<Decimal>::DecimalZero);
      unsigned long wins = 0;

      for (const auto& trade : mTrades)
	{
	  if (trade.isWinner())
	    {
	      winSum += trade.getPnl();
	      wins++;
	    }
	  else
	    lossSum += trade.getPnl();
	}

      unsigned long losses = mTrades.size() - wins;
      Decimal avgWin = (wins > 0) ? winSum / num::fromCount<Decimal>(wins) : DecimalConstants<Decimal>::DecimalZero;
      Decimal avgLoss = (losses > 0) ? lossSum / num::fromCount<Decimal>(losses) : DecimalConstants<Decimal>::DecimalZero;

      return SimulatorStats<Decimal>(mSettings.getStartingCapital(), mCapital, mTotalPnl,
				     mTrades.size(), wins, avgWin, avgLoss, getNumOpenLots());
    }

    const std::vector<SimulatedTrade<Decimal>>& getTrades() const override
    {
      return mTrades;
    }

    const std::vector<Decimal>& getEquityCurve() const override
    {
      return mEquityCurve;
    }

    Decimal getCapital() const override
    {
      return mCapital;
    }

    const Decimal& getTotalPnl() const
    {
      return mTotalPnl;
    }

    /**
     * @brief Total units of token still held.
     */
    Decimal getHolding(const std::string& token) const
    {
      Decimal held(DecimalConstants<Decimal>::DecimalZero);

      auto it = mOpenLots.find(token);
      if (it != mOpenLots.end())
	{
	  for (const auto& lot : it->second)
	    held += lot.getSize();
	}

      return held;
    }

    std::vector<OpenLot<Decimal>> getOpenPositions() const
    {
      std::vector<OpenLot<Decimal>> positions;

      for (const auto& entry : mOpenLots)
	positions.insert(positions.end(), entry.second.begin(), entry.second.end());

      return positions;
    }

    void reset()
    {
      mCapital = mSettings.getStartingCapital();
      mOpenLots.clear();
      mTrades.clear();
      mEquityCurve.assign(1, mSettings.getStartingCapital());
      mTotalPnl = DecimalConstants<Decimal>::DecimalZero;
    }

  private:
    Decimal computeFee(const Decimal& notional) const
    {
      return notional * mSettings.getFeeRate();
    }

    unsigned long getNumOpenLots() const
    {
      unsigned long count = 0;
      for (const auto& entry : mOpenLots)
	count += entry.second.size();

      return count;
    }

    const SimulatedTrade<Decimal>& bookTrade(const OpenLot<Decimal>& lot,
					     const Decimal& exitPrice,
					     const Decimal& fees,
					     const ptime& exitTime,
					     const std::string& exitReason)
    {
      mTrades.push_back(SimulatedTrade<Decimal>(lot.getToken(), lot.getEntryPrice(), exitPrice,
						lot.getSize(), fees, lot.getEntryTime(), exitTime,
						lot.getEntryReason(), exitReason));
      mTotalPnl += mTrades.back().getPnl();
      mEquityCurve.push_back(mCapital);

      return mTrades.back();
    }

  private:
    ExecutionSettings<Decimal> mSettings;
    Decimal mCapital;
    std::map<std::string, std::deque<OpenLot<Decimal>>> mOpenLots;
    std::vector<SimulatedTrade<Decimal>> mTrades;
    std::vector<Decimal> mEquityCurve;
    Decimal mTotalPnl;
  };
}

#endif
