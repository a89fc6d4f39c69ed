// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MARKET_EVENTS_H
#define __MARKET_EVENTS_H 1

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "DecimalConstants.h"

namespace mkc_updown
{
  using boost::posix_time::ptime;

  // Feed topics of the oracle tier
  const std::string OracleTopic("crypto_prices_chainlink");
  const std::string ReferenceTopic("crypto_prices");

  // Source tags carried by timeline events
  const std::string OracleSourceTag("chainlink");
  const std::string ReferenceSourceTag("polyRef");
  const std::string UpBookSourceTag("clobUp");
  const std::string DownBookSourceTag("clobDown");
  const std::string RawFeedTagPrefix("raw:");
  const std::string ExchangeTagPrefix("exchange:");

  /**
   * @brief Price observation from the oracle tier.
   *
   * The slow authoritative oracle and the fast reference feed share this
   * record; they differ by topic only.
   */
  template <class Decimal>
  class OracleTick
  {
  public:
    OracleTick(const ptime& timestamp,
	       const std::string& topic,
	       const std::string& symbol,
	       const Decimal& price)
      : mTimestamp(timestamp),
	mTopic(topic),
	mSymbol(symbol),
	mPrice(price)
    {}

    const ptime& getTimestamp() const
    {
      return mTimestamp;
    }

    const std::string& getTopic() const
    {
      return mTopic;
    }

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    const Decimal& getPrice() const
    {
      return mPrice;
    }

  private:
    ptime mTimestamp;
    std::string mTopic;
    std::string mSymbol;
    Decimal mPrice;
  };

  /**
   * @brief Top of book for one outcome token of a binary market.
   *
   * The symbol names the market and side ("btc-up", "btc-down"). The window
   * epoch, when recorded, is the close time (epoch seconds) of the window the
   * book belongs to.
   */
  template <class Decimal>
  class BookSnapshot
  {
  public:
    BookSnapshot(const ptime& timestamp,
		 const std::string& symbol,
		 const std::string& tokenId,
		 const Decimal& bestBid,
		 const Decimal& bestAsk,
		 const Decimal& bidSize,
		 const Decimal& askSize)
      : mTimestamp(timestamp),
	mSymbol(symbol),
	mTokenId(tokenId),
	mBestBid(bestBid),
	mBestAsk(bestAsk),
	mMidPrice((bestBid + bestAsk) / DecimalConstants<Decimal>::DecimalTwo),
	mSpread(bestAsk - bestBid),
	mBidSize(bidSize),
	mAskSize(askSize),
	mWindowEpoch()
    {}

    const ptime& getTimestamp() const
    {
      return mTimestamp;
    }

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    const std::string& getTokenId() const
    {
      return mTokenId;
    }

    const Decimal& getBestBid() const
    {
      return mBestBid;
    }

    const Decimal& getBestAsk() const
    {
      return mBestAsk;
    }

    const Decimal& getMidPrice() const
    {
      return mMidPrice;
    }

    const Decimal& getSpread() const
    {
      return mSpread;
    }

    const Decimal& getBidSize() const
    {
      return mBidSize;
    }

    const Decimal& getAskSize() const
    {
      return mAskSize;
    }

    const std::optional<int64_t>& getWindowEpoch() const
    {
      return mWindowEpoch;
    }

    void setWindowEpoch(int64_t epoch)
    {
      mWindowEpoch = epoch;
    }

  private:
    ptime mTimestamp;
    std::string mSymbol;
    std::string mTokenId;
    Decimal mBestBid;
    Decimal mBestAsk;
    Decimal mMidPrice;
    Decimal mSpread;
    Decimal mBidSize;
    Decimal mAskSize;
    std::optional<int64_t> mWindowEpoch;
  };

  /**
   * @brief Last trade price (and optionally the quote) on an external exchange.
   */
  template <class Decimal>
  class ExchangeTick
  {
  public:
    ExchangeTick(const ptime& timestamp,
		 const std::string& exchange,
		 const std::string& symbol,
		 const Decimal& price)
      : mTimestamp(timestamp),
	mExchange(exchange),
	mSymbol(symbol),
	mPrice(price),
	mBid(),
	mAsk()
    {}

    const ptime& getTimestamp() const
    {
      return mTimestamp;
    }

    const std::string& getExchange() const
    {
      return mExchange;
    }

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    const Decimal& getPrice() const
    {
      return mPrice;
    }

    const std::optional<Decimal>& getBid() const
    {
      return mBid;
    }

    const std::optional<Decimal>& getAsk() const
    {
      return mAsk;
    }

    void setQuote(const Decimal& bid, const Decimal& ask)
    {
      mBid = bid;
      mAsk = ask;
    }

  private:
    ptime mTimestamp;
    std::string mExchange;
    std::string mSymbol;
    Decimal mPrice;
    std::optional<Decimal> mBid;
    std::optional<Decimal> mAsk;
  };

  enum class EventSource { OracleFeed, OrderBook, Exchange };

  /**
   * @class TimelineEvent
   * @brief One tick of a window timeline together with its source tag.
   *
   * The tag is assigned once when the timeline is built and never changes.
   */
  template <class Decimal>
  class TimelineEvent
  {
  public:
    typedef std::variant<OracleTick<Decimal>, BookSnapshot<Decimal>, ExchangeTick<Decimal>> Payload;

    TimelineEvent(const OracleTick<Decimal>& tick, const std::string& sourceTag)
      : mPayload(tick),
	mSourceTag(sourceTag)
    {}

    TimelineEvent(const BookSnapshot<Decimal>& snapshot, const std::string& sourceTag)
      : mPayload(snapshot),
	mSourceTag(sourceTag)
    {}

    TimelineEvent(const ExchangeTick<Decimal>& tick, const std::string& sourceTag)
      : mPayload(tick),
	mSourceTag(sourceTag)
    {}

    const ptime& getTimestamp() const
    {
      return std::visit([](const auto& record) -> const ptime& { return record.getTimestamp(); },
			mPayload);
    }

    const std::string& getSourceTag() const
    {
      return mSourceTag;
    }

    EventSource getSourceKind() const
    {
      static_assert(std::variant_size<Payload>::value == 3,
		    "every payload alternative needs an EventSource");

      switch (mPayload.index())
	{
	case 0:
	  return EventSource::OracleFeed;
	case 1:
	  return EventSource::OrderBook;
	case 2:
	  return EventSource::Exchange;
	default:
	  throw std::logic_error("TimelineEvent: unknown event payload");
	}
    }

    const OracleTick<Decimal>* getOracleTick() const
    {
      return std::get_if<OracleTick<Decimal>>(&mPayload);
    }

    const BookSnapshot<Decimal>* getBookSnapshot() const
    {
      return std::get_if<BookSnapshot<Decimal>>(&mPayload);
    }

    const ExchangeTick<Decimal>* getExchangeTick() const
    {
      return std::get_if<ExchangeTick<Decimal>>(&mPayload);
    }

  private:
    Payload mPayload;
    std::string mSourceTag;
  };
}

#endif
