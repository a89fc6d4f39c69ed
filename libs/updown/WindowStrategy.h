// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __WINDOW_STRATEGY_H
#define __WINDOW_STRATEGY_H 1

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BinaryWindow.h"
#include "StrategyParameters.h"
#include "TradeSignal.h"
#include "WindowMarketState.h"

namespace mkc_updown
{
  using boost::posix_time::ptime;

  class WindowStrategyException : public std::runtime_error
  {
  public:
  WindowStrategyException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~WindowStrategyException()
      {}
  };

  /**
   * @brief What a strategy is told when its window closes.
   */
  template <class Decimal>
  class WindowCloseSummary
  {
  public:
    WindowCloseSummary(const ptime& closeTime,
		       const std::string& symbol,
		       const std::optional<Decimal>& strikePrice,
		       const std::optional<Decimal>& oracleClosePrice,
		       const std::optional<OutcomeDirection>& resolvedDirection,
		       const Decimal& pnl,
		       unsigned long tradeCount)
      : mCloseTime(closeTime),
	mSymbol(symbol),
	mStrikePrice(strikePrice),
	mOracleClosePrice(oracleClosePrice),
	mResolvedDirection(resolvedDirection),
	mPnl(pnl),
	mTradeCount(tradeCount)
    {}

    const ptime& getCloseTime() const { return mCloseTime; }
    const std::string& getSymbol() const { return mSymbol; }
    const std::optional<Decimal>& getStrikePrice() const { return mStrikePrice; }
    const std::optional<Decimal>& getOracleClosePrice() const { return mOracleClosePrice; }
    const std::optional<OutcomeDirection>& getResolvedDirection() const { return mResolvedDirection; }
    const Decimal& getPnl() const { return mPnl; }
    unsigned long getTradeCount() const { return mTradeCount; }

  private:
    ptime mCloseTime;
    std::string mSymbol;
    std::optional<Decimal> mStrikePrice;
    std::optional<Decimal> mOracleClosePrice;
    std::optional<OutcomeDirection> mResolvedDirection;
    Decimal mPnl;
    unsigned long mTradeCount;
  };

  /**
   * @class WindowStrategy
   * @brief Decision logic replayed against one window's timeline.
   *
   * evaluate() is called once per replayed event and returns zero or more
   * signals. onWindowOpen() and onWindowClose() are optional hooks.
   *
   * Thread-safety: a strategy instance is only ever used by one window. The
   * backtester keeps the configured strategy as a prototype and asks it for a
   * clone() per window, so a strategy may keep per-window memory in members
   * without locking.
   */
  template <class Decimal>
  class WindowStrategy
  {
  public:
    WindowStrategy(const std::string& strategyName,
		   const StrategyParameters<Decimal>& defaultParameters)
      : mStrategyName(strategyName),
	mDefaultParameters(defaultParameters)
    {}

    WindowStrategy(const WindowStrategy<Decimal>& rhs)
      : mStrategyName(rhs.mStrategyName),
	mDefaultParameters(rhs.mDefaultParameters)
    {}

    virtual ~WindowStrategy()
    {}

    const std::string& getStrategyName() const
    {
      return mStrategyName;
    }

    const StrategyParameters<Decimal>& getDefaultParameters() const
    {
      return mDefaultParameters;
    }

    virtual std::vector<TradeSignal<Decimal>> evaluate(const WindowMarketState<Decimal>& state,
						       const StrategyParameters<Decimal>& parameters) = 0;

    virtual void onWindowOpen(const WindowMarketState<Decimal>& state,
			      const StrategyParameters<Decimal>& parameters)
    {}

    virtual void onWindowClose(const WindowMarketState<Decimal>& state,
			       const WindowCloseSummary<Decimal>& summary,
			       const StrategyParameters<Decimal>& parameters)
    {}

    /**
     * @brief Fresh instance with the same configuration and no per-window memory.
     */
    virtual std::shared_ptr<WindowStrategy<Decimal>> clone() const = 0;

    /**
     * @brief Check the strategy can be run.
     * @throws WindowStrategyException when it cannot
     */
    virtual void validate() const
    {}

  private:
    std::string mStrategyName;
    StrategyParameters<Decimal> mDefaultParameters;
  };

  /**
   * @class FunctionalWindowStrategy
   * @brief Strategy assembled from callables.
   *
   * Cloning copies the callables, and with them any state they captured by
   * value, so every window starts from the state the prototype was built
   * with.
   */
  template <class Decimal>
  class FunctionalWindowStrategy : public WindowStrategy<Decimal>
  {
  public:
    typedef std::function<std::vector<TradeSignal<Decimal>>(const WindowMarketState<Decimal>&,
							    const StrategyParameters<Decimal>&)> DecisionFunction;
    typedef std::function<void(const WindowMarketState<Decimal>&,
			       const StrategyParameters<Decimal>&)> OpenHook;
    typedef std::function<void(const WindowMarketState<Decimal>&,
			       const WindowCloseSummary<Decimal>&,
			       const StrategyParameters<Decimal>&)> CloseHook;

    FunctionalWindowStrategy(const std::string& strategyName,
			     DecisionFunction decision,
			     OpenHook openHook = OpenHook(),
			     CloseHook closeHook = CloseHook(),
			     const StrategyParameters<Decimal>& defaultParameters = StrategyParameters<Decimal>())
      : WindowStrategy<Decimal>(strategyName, defaultParameters),
	mDecision(std::move(decision)),
	mOpenHook(std::move(openHook)),
	mCloseHook(std::move(closeHook))
    {}

    FunctionalWindowStrategy(const FunctionalWindowStrategy<Decimal>& rhs)
      : WindowStrategy<Decimal>(rhs),
	mDecision(rhs.mDecision),
	mOpenHook(rhs.mOpenHook),
	mCloseHook(rhs.mCloseHook)
    {}

    std::vector<TradeSignal<Decimal>> evaluate(const WindowMarketState<Decimal>& state,
					       const StrategyParameters<Decimal>& parameters) override
    {
      if (!mDecision)
	throw WindowStrategyException("FunctionalWindowStrategy::evaluate - " + this->getStrategyName() +
				      " has no decision function");

      return mDecision(state, parameters);
    }

    void onWindowOpen(const WindowMarketState<Decimal>& state,
		      const StrategyParameters<Decimal>& parameters) override
    {
      if (mOpenHook)
	mOpenHook(state, parameters);
    }

    void onWindowClose(const WindowMarketState<Decimal>& state,
		       const WindowCloseSummary<Decimal>& summary,
		       const StrategyParameters<Decimal>& parameters) override
    {
      if (mCloseHook)
	mCloseHook(state, summary, parameters);
    }

    std::shared_ptr<WindowStrategy<Decimal>> clone() const override
    {
      return std::make_shared<FunctionalWindowStrategy<Decimal>>(*this);
    }

    void validate() const override
    {
      if (!mDecision)
	throw WindowStrategyException("Strategy " + this->getStrategyName() + " must have a decision function");
    }

  private:
    DecisionFunction mDecision;
    OpenHook mOpenHook;
    CloseHook mCloseHook;
  };
}

#endif
