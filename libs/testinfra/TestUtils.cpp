// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "TestUtils.h"
#include "TimeUtils.h"
#include "TradeSignal.h"
#include "WindowMarketState.h"
#include "StrategyParameters.h"

using namespace mkc_updown;

namespace
{
  class BuyOnceStrategy : public WindowStrategy<DecimalType>
  {
  public:
    BuyOnceStrategy(const std::string& token, const DecimalType& size)
      : WindowStrategy<DecimalType>("BuyOnce " + token, StrategyParameters<DecimalType>()),
	mToken(token),
	mSize(size),
	mBought(false)
    {}

    BuyOnceStrategy(const BuyOnceStrategy& rhs)
      : WindowStrategy<DecimalType>(rhs),
	mToken(rhs.mToken),
	mSize(rhs.mSize),
	mBought(false)
    {}

    std::vector<TradeSignal<DecimalType>> evaluate(const WindowMarketState<DecimalType>& state,
						   const StrategyParameters<DecimalType>&) override
    {
      std::vector<TradeSignal<DecimalType>> signals;
      std::optional<OutcomeDirection> side = tokenSide(mToken);

      if (!mBought && side && state.getBook(*side))
	{
	  mBought = true;
	  signals.push_back(TradeSignal<DecimalType>::buy(mToken, mSize, "buy_once"));
	}

      return signals;
    }

    std::shared_ptr<WindowStrategy<DecimalType>> clone() const override
    {
      return std::make_shared<BuyOnceStrategy>(*this);
    }

  private:
    std::string mToken;
    DecimalType mSize;
    bool mBought;
  };
}

DecimalType createDecimal(const std::string& valueString)
{
  return num::fromString<DecimalType>(valueString);
}

boost::posix_time::ptime createTimestamp(const std::string& isoString)
{
  return parseIsoTimestamp(isoString);
}

BinaryWindow<DecimalType> createWindow(const std::string& symbol, const std::string& closeTime)
{
  return BinaryWindow<DecimalType>(symbol, createTimestamp(closeTime));
}

OracleTick<DecimalType> createOracleTick(const std::string& timestamp,
					 const std::string& price,
					 const std::string& topic,
					 const std::string& symbol)
{
  return OracleTick<DecimalType>(createTimestamp(timestamp), topic, symbol, createDecimal(price));
}

BookSnapshot<DecimalType> createBookSnapshot(const std::string& timestamp,
					     const std::string& symbol,
					     const std::string& bestBid,
					     const std::string& bestAsk)
{
  return BookSnapshot<DecimalType>(createTimestamp(timestamp),
				   symbol,
				   symbol + "-token",
				   createDecimal(bestBid),
				   createDecimal(bestAsk),
				   createDecimal("100"),
				   createDecimal("100"));
}

ExchangeTick<DecimalType> createExchangeTick(const std::string& timestamp,
					     const std::string& exchange,
					     const std::string& symbol,
					     const std::string& price)
{
  return ExchangeTick<DecimalType>(createTimestamp(timestamp), exchange, symbol, createDecimal(price));
}

std::shared_ptr<WindowStrategy<DecimalType>>
createBuyOnceStrategy(const std::string& token, const std::string& size)
{
  return std::make_shared<BuyOnceStrategy>(token, createDecimal(size));
}

std::shared_ptr<WindowStrategy<DecimalType>> createHoldStrategy()
{
  return std::make_shared<FunctionalWindowStrategy<DecimalType>>(
    "Hold",
    [](const WindowMarketState<DecimalType>&, const StrategyParameters<DecimalType>&) {
      return std::vector<TradeSignal<DecimalType>>();
    });
}
