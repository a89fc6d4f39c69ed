// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TRADE_SIGNAL_H
#define __TRADE_SIGNAL_H 1

#include <map>
#include <optional>
#include <string>
#include "BinaryWindow.h"
#include "DecimalConstants.h"

namespace mkc_updown
{
  enum class SignalAction { Buy, Sell, Hold };

  inline std::string toString(SignalAction action)
  {
    switch (action)
      {
      case SignalAction::Buy:
	return "buy";
      case SignalAction::Sell:
	return "sell";
      case SignalAction::Hold:
	return "hold";
      }
    return "unknown";
  }

  /**
   * @class TradeSignal
   * @brief A strategy's trading intention for the current event.
   *
   * Signals are short lived: they are produced by a strategy decision, passed
   * to the execution simulator and then dropped. An empty token means the
   * signal does not reference a token and cannot be executed. A size of zero
   * on a sell means "the whole holding".
   */
  template <class Decimal>
  class TradeSignal
  {
  public:
    TradeSignal(SignalAction action,
		const std::string& token,
		const Decimal& size,
		const std::string& reason = std::string())
      : mAction(action),
	mToken(token),
	mSide(),
	mSize(size),
	mReason(reason),
	mDiagnostics()
    {}

    static TradeSignal<Decimal> buy(const std::string& token, const Decimal& size,
				    const std::string& reason = std::string())
    {
      return TradeSignal<Decimal>(SignalAction::Buy, token, size, reason);
    }

    static TradeSignal<Decimal> sell(const std::string& token,
				     const std::string& reason = std::string())
    {
      return TradeSignal<Decimal>(SignalAction::Sell, token, DecimalConstants<Decimal>::DecimalZero, reason);
    }

    static TradeSignal<Decimal> hold(const std::string& reason = std::string())
    {
      return TradeSignal<Decimal>(SignalAction::Hold, std::string(), DecimalConstants<Decimal>::DecimalZero, reason);
    }

    SignalAction getAction() const
    {
      return mAction;
    }

    const std::string& getToken() const
    {
      return mToken;
    }

    /**
     * @brief Side the signal trades; an explicit side wins over the side
     *        implied by the token name.
     */
    std::optional<OutcomeDirection> getSide() const
    {
      if (mSide)
	return mSide;

      return tokenSide(mToken);
    }

    void setSide(OutcomeDirection side)
    {
      mSide = side;
    }

    const Decimal& getSize() const
    {
      return mSize;
    }

    const std::string& getReason() const
    {
      return mReason;
    }

    const std::map<std::string, std::string>& getDiagnostics() const
    {
      return mDiagnostics;
    }

    void addDiagnostic(const std::string& key, const std::string& value)
    {
      mDiagnostics[key] = value;
    }

    /**
     * @brief True for a buy or sell that references a token.
     */
    bool isExecutable() const
    {
      return (mAction != SignalAction::Hold) && !mToken.empty();
    }

  private:
    SignalAction mAction;
    std::string mToken;
    std::optional<OutcomeDirection> mSide;
    Decimal mSize;
    std::string mReason;
    std::map<std::string, std::string> mDiagnostics;
  };
}

#endif
