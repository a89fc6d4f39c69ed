// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BINARY_WINDOW_H
#define __BINARY_WINDOW_H 1

#include <cstdint>
#include <optional>
#include <string>
#include <boost/algorithm/string.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "TimeUtils.h"

namespace mkc_updown
{
  using boost::posix_time::ptime;
  using boost::posix_time::time_duration;

  enum class OutcomeDirection { Up, Down };

  /**
   * @brief Where a window's realized direction came from, most trusted first.
   */
  enum class ResolutionSource
    {
      AuditedResolution,
      OnchainResolution,
      GenericResolution,
      OraclePriceComparison
    };

  /**
   * @brief Parse a direction string ("up", "UP", " Down ", ...).
   * @return the direction, or an empty optional for anything else
   */
  inline std::optional<OutcomeDirection> parseOutcomeDirection(const std::string& text)
  {
    std::string value = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));

    if (value == "up")
      return OutcomeDirection::Up;
    if (value == "down")
      return OutcomeDirection::Down;

    return std::nullopt;
  }

  inline std::string toString(OutcomeDirection direction)
  {
    return (direction == OutcomeDirection::Up) ? "UP" : "DOWN";
  }

  inline std::string toString(ResolutionSource source)
  {
    switch (source)
      {
      case ResolutionSource::AuditedResolution:
	return "audited";
      case ResolutionSource::OnchainResolution:
	return "onchain";
      case ResolutionSource::GenericResolution:
	return "resolved";
      case ResolutionSource::OraclePriceComparison:
	return "oracle_price";
      }
    return "unknown";
  }

  /**
   * @brief Side of the binary market a token pays out on.
   *
   * Tokens are named after the side they win on ("btc_up", "btc_down").
   * @return the side, or an empty optional when the name names neither side
   */
  inline std::optional<OutcomeDirection> tokenSide(const std::string& token)
  {
    std::string name = boost::algorithm::to_lower_copy(token);

    if (name.find("down") != std::string::npos)
      return OutcomeDirection::Down;
    if (name.find("up") != std::string::npos)
      return OutcomeDirection::Up;

    return std::nullopt;
  }

  /**
   * @class BinaryWindow
   * @brief One fixed-duration up/down market episode.
   *
   * A window is identified by its symbol and close time. The open time is
   * either given explicitly or derived from the close time and the run's
   * window duration. The three resolution strings are populated independently
   * by different upstream sources; an empty string means "not populated".
   *
   * Windows are plain input records; nothing in the engine mutates one after
   * it has been handed to a backtest.
   */
  template <class Decimal>
  class BinaryWindow
  {
  public:
    BinaryWindow(const std::string& symbol, const ptime& closeTime)
      : mSymbol(symbol),
	mCloseTime(closeTime),
	mOpenTime(),
	mStrikePrice(),
	mOracleOpenPrice(),
	mOracleClosePrice(),
	mAuditedResolution(),
	mOnchainResolution(),
	mResolvedDirection()
    {}

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    const ptime& getCloseTime() const
    {
      return mCloseTime;
    }

    /**
     * @brief Explicit open time if one was recorded, otherwise close - windowDuration.
     */
    ptime getOpenTime(const time_duration& windowDuration) const
    {
      if (mOpenTime)
	return *mOpenTime;

      return mCloseTime - windowDuration;
    }

    bool hasExplicitOpenTime() const
    {
      return mOpenTime.has_value();
    }

    void setOpenTime(const ptime& openTime)
    {
      mOpenTime = openTime;
    }

    /**
     * @brief Close time in whole epoch seconds; book snapshots recorded for
     *        this window carry the same value as their window epoch.
     */
    int64_t getWindowEpoch() const
    {
      return toEpochSeconds(mCloseTime);
    }

    const std::optional<Decimal>& getStrikePrice() const
    {
      return mStrikePrice;
    }

    void setStrikePrice(const Decimal& strike)
    {
      mStrikePrice = strike;
    }

    const std::optional<Decimal>& getOracleOpenPrice() const
    {
      return mOracleOpenPrice;
    }

    void setOracleOpenPrice(const Decimal& price)
    {
      mOracleOpenPrice = price;
    }

    const std::optional<Decimal>& getOracleClosePrice() const
    {
      return mOracleClosePrice;
    }

    void setOracleClosePrice(const Decimal& price)
    {
      mOracleClosePrice = price;
    }

    const std::string& getAuditedResolution() const
    {
      return mAuditedResolution;
    }

    void setAuditedResolution(const std::string& direction)
    {
      mAuditedResolution = direction;
    }

    const std::string& getOnchainResolution() const
    {
      return mOnchainResolution;
    }

    void setOnchainResolution(const std::string& direction)
    {
      mOnchainResolution = direction;
    }

    const std::string& getResolvedDirection() const
    {
      return mResolvedDirection;
    }

    void setResolvedDirection(const std::string& direction)
    {
      mResolvedDirection = direction;
    }

  private:
    std::string mSymbol;
    ptime mCloseTime;
    std::optional<ptime> mOpenTime;
    std::optional<Decimal> mStrikePrice;
    std::optional<Decimal> mOracleOpenPrice;
    std::optional<Decimal> mOracleClosePrice;
    std::string mAuditedResolution;
    std::string mOnchainResolution;
    std::string mResolvedDirection;
  };
}

#endif
