// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __WINDOW_MARKET_STATE_H
#define __WINDOW_MARKET_STATE_H 1

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BinaryWindow.h"
#include "DecimalConstants.h"
#include "MarketEvents.h"

namespace mkc_updown
{
  using boost::posix_time::ptime;
  using boost::posix_time::time_duration;

  template <class Decimal>
  class PriceQuote
  {
  public:
    PriceQuote(const Decimal& price, const ptime& timestamp)
      : mPrice(price),
	mTimestamp(timestamp)
    {}

    const Decimal& getPrice() const
    {
      return mPrice;
    }

    const ptime& getTimestamp() const
    {
      return mTimestamp;
    }

  private:
    Decimal mPrice;
    ptime mTimestamp;
  };

  template <class Decimal>
  class BookQuote
  {
  public:
    explicit BookQuote(const BookSnapshot<Decimal>& snapshot)
      : mBestBid(snapshot.getBestBid()),
	mBestAsk(snapshot.getBestAsk()),
	mMidPrice(snapshot.getMidPrice()),
	mSpread(snapshot.getSpread()),
	mBidSize(snapshot.getBidSize()),
	mAskSize(snapshot.getAskSize()),
	mTimestamp(snapshot.getTimestamp())
    {}

    const Decimal& getBestBid() const { return mBestBid; }
    const Decimal& getBestAsk() const { return mBestAsk; }
    const Decimal& getMidPrice() const { return mMidPrice; }
    const Decimal& getSpread() const { return mSpread; }
    const Decimal& getBidSize() const { return mBidSize; }
    const Decimal& getAskSize() const { return mAskSize; }
    const ptime& getTimestamp() const { return mTimestamp; }

  private:
    Decimal mBestBid;
    Decimal mBestAsk;
    Decimal mMidPrice;
    Decimal mSpread;
    Decimal mBidSize;
    Decimal mAskSize;
    ptime mTimestamp;
  };

  template <class Decimal>
  class ExchangeQuote
  {
  public:
    explicit ExchangeQuote(const ExchangeTick<Decimal>& tick)
      : mPrice(tick.getPrice()),
	mBid(tick.getBid()),
	mAsk(tick.getAsk()),
	mTimestamp(tick.getTimestamp())
    {}

    const Decimal& getPrice() const { return mPrice; }
    const std::optional<Decimal>& getBid() const { return mBid; }
    const std::optional<Decimal>& getAsk() const { return mAsk; }
    const ptime& getTimestamp() const { return mTimestamp; }

  private:
    Decimal mPrice;
    std::optional<Decimal> mBid;
    std::optional<Decimal> mAsk;
    ptime mTimestamp;
  };

  /**
   * @brief Dispersion of the latest exchange prices.
   *
   * rangePct is range / min.
   */
  template <class Decimal>
  class ExchangeSpread
  {
  public:
    ExchangeSpread(const Decimal& minPrice, const Decimal& maxPrice)
      : mMin(minPrice),
	mMax(maxPrice),
	mRange(maxPrice - minPrice),
	mRangePct((minPrice == DecimalConstants<Decimal>::DecimalZero) ?
		  DecimalConstants<Decimal>::DecimalZero : (maxPrice - minPrice) / minPrice)
    {}

    const Decimal& getMin() const { return mMin; }
    const Decimal& getMax() const { return mMax; }
    const Decimal& getRange() const { return mRange; }
    const Decimal& getRangePct() const { return mRangePct; }

  private:
    Decimal mMin;
    Decimal mMax;
    Decimal mRange;
    Decimal mRangePct;
  };

  /**
   * @class WindowMarketState
   * @brief Latest view of every market feed seen so far in one window.
   *
   * A pure accumulator: setWindow() establishes the window context, every
   * replayed event is folded in by processEvent(), and updateTimeToClose()
   * advances the clock. Strategies only ever see a const reference.
   *
   * One instance per window evaluation; instances are never shared between
   * threads.
   */
  template <class Decimal>
  class WindowMarketState
  {
  public:
    typedef std::map<std::string, ExchangeQuote<Decimal>> ExchangeQuoteMap;

    WindowMarketState()
      : mSymbol(),
	mStrikePrice(),
	mWindowOpenTime(),
	mWindowCloseTime(),
	mTimeToClose(),
	mCurrentTime(),
	mOracleQuote(),
	mReferenceQuote(),
	mUpBook(),
	mDownBook(),
	mExchangeQuotes(),
	mRawFeedQuotes(),
	mTickCount(0)
    {}

    void setWindow(const BinaryWindow<Decimal>& window, const ptime& openTime)
    {
      mSymbol = window.getSymbol();
      mStrikePrice = window.getStrikePrice();
      mWindowOpenTime = openTime;
      mWindowCloseTime = window.getCloseTime();
      mTimeToClose = mWindowCloseTime - mWindowOpenTime;
    }

    void processEvent(const TimelineEvent<Decimal>& event)
    {
      const std::string& tag = event.getSourceTag();

      if (const OracleTick<Decimal>* tick = event.getOracleTick())
	{
	  PriceQuote<Decimal> quote(tick->getPrice(), tick->getTimestamp());

	  if (tag == OracleSourceTag)
	    mOracleQuote = quote;
	  else if (tag == ReferenceSourceTag)
	    mReferenceQuote = quote;
	  else
	    mRawFeedQuotes.insert_or_assign(tag, quote);
	}
      else if (const BookSnapshot<Decimal>* snapshot = event.getBookSnapshot())
	{
	  if (tag == DownBookSourceTag)
	    mDownBook = BookQuote<Decimal>(*snapshot);
	  else
	    mUpBook = BookQuote<Decimal>(*snapshot);
	}
      else if (const ExchangeTick<Decimal>* tick = event.getExchangeTick())
	{
	  std::string exchange = tick->getExchange().empty() ? std::string("unknown") : tick->getExchange();
	  mExchangeQuotes.insert_or_assign(exchange, ExchangeQuote<Decimal>(*tick));
	}

      mCurrentTime = event.getTimestamp();
      mTickCount++;
    }

    void updateTimeToClose(const ptime& eventTime)
    {
      mTimeToClose = mWindowCloseTime - eventTime;
    }

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    const std::optional<Decimal>& getStrikePrice() const
    {
      return mStrikePrice;
    }

    const ptime& getWindowOpenTime() const
    {
      return mWindowOpenTime;
    }

    const ptime& getWindowCloseTime() const
    {
      return mWindowCloseTime;
    }

    const time_duration& getTimeToClose() const
    {
      return mTimeToClose;
    }

    const ptime& getCurrentTime() const
    {
      return mCurrentTime;
    }

    const std::optional<PriceQuote<Decimal>>& getOracleQuote() const
    {
      return mOracleQuote;
    }

    const std::optional<PriceQuote<Decimal>>& getReferenceQuote() const
    {
      return mReferenceQuote;
    }

    std::optional<PriceQuote<Decimal>> getRawFeedQuote(const std::string& sourceTag) const
    {
      auto it = mRawFeedQuotes.find(sourceTag);
      if (it == mRawFeedQuotes.end())
	return std::nullopt;

      return it->second;
    }

    const std::optional<BookQuote<Decimal>>& getUpBook() const
    {
      return mUpBook;
    }

    const std::optional<BookQuote<Decimal>>& getDownBook() const
    {
      return mDownBook;
    }

    const std::optional<BookQuote<Decimal>>& getBook(OutcomeDirection side) const
    {
      return (side == OutcomeDirection::Up) ? mUpBook : mDownBook;
    }

    std::optional<ExchangeQuote<Decimal>> getExchangeQuote(const std::string& exchange) const
    {
      auto it = mExchangeQuotes.find(exchange);
      if (it == mExchangeQuotes.end())
	return std::nullopt;

      return it->second;
    }

    const ExchangeQuoteMap& getAllExchanges() const
    {
      return mExchangeQuotes;
    }

    /**
     * @brief Median of the latest price of every exchange seen so far.
     *
     * An even number of exchanges averages the two middle prices.
     */
    std::optional<Decimal> getExchangeMedian() const
    {
      std::vector<Decimal> prices(getExchangePrices());
      if (prices.empty())
	return std::nullopt;

      std::sort(prices.begin(), prices.end());

      std::size_t middle = prices.size() / 2;
      if (prices.size() % 2 == 0)
	return (prices[middle - 1] + prices[middle]) / DecimalConstants<Decimal>::DecimalTwo;

      return prices[middle];
    }

    /**
     * @brief Min, max and range of the latest exchange prices; needs two exchanges.
     */
    std::optional<ExchangeSpread<Decimal>> getExchangeSpread() const
    {
      std::vector<Decimal> prices(getExchangePrices());
      if (prices.size() < 2)
	return std::nullopt;

      auto bounds = std::minmax_element(prices.begin(), prices.end());
      return ExchangeSpread<Decimal>(*bounds.first, *bounds.second);
    }

    /**
     * @brief Strike minus the latest slow oracle price.
     */
    std::optional<Decimal> getOracleDeficit() const
    {
      if (!mStrikePrice || !mOracleQuote)
	return std::nullopt;

      return *mStrikePrice - mOracleQuote->getPrice();
    }

    /**
     * @brief Strike minus the latest fast reference price.
     */
    std::optional<Decimal> getRefToStrikeGap() const
    {
      if (!mStrikePrice || !mReferenceQuote)
	return std::nullopt;

      return *mStrikePrice - mReferenceQuote->getPrice();
    }

    unsigned long getTickCount() const
    {
      return mTickCount;
    }

    /**
     * @brief Forget all feed data; the window context set by setWindow() is kept.
     */
    void reset()
    {
      mOracleQuote.reset();
      mReferenceQuote.reset();
      mUpBook.reset();
      mDownBook.reset();
      mExchangeQuotes.clear();
      mRawFeedQuotes.clear();
      mCurrentTime = ptime();
      mTimeToClose = mWindowCloseTime - mWindowOpenTime;
      mTickCount = 0;
    }

  private:
    std::vector<Decimal> getExchangePrices() const
    {
      std::vector<Decimal> prices;
      prices.reserve(mExchangeQuotes.size());

      for (const auto& entry : mExchangeQuotes)
	prices.push_back(entry.second.getPrice());

      return prices;
    }

  private:
    std::string mSymbol;
    std::optional<Decimal> mStrikePrice;
    ptime mWindowOpenTime;
    ptime mWindowCloseTime;
    time_duration mTimeToClose;
    ptime mCurrentTime;
    std::optional<PriceQuote<Decimal>> mOracleQuote;
    std::optional<PriceQuote<Decimal>> mReferenceQuote;
    std::optional<BookQuote<Decimal>> mUpBook;
    std::optional<BookQuote<Decimal>> mDownBook;
    ExchangeQuoteMap mExchangeQuotes;
    std::map<std::string, PriceQuote<Decimal>> mRawFeedQuotes;
    unsigned long mTickCount;
  };
}

#endif
