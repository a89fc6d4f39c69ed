// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __GROUND_TRUTH_RESOLVER_H
#define __GROUND_TRUTH_RESOLVER_H 1

#include <optional>
#include "BinaryWindow.h"
#include "DecimalConstants.h"

namespace mkc_updown
{
  /**
   * @brief A window's realized direction together with the source it was read from.
   */
  class GroundTruth
  {
  public:
    GroundTruth(OutcomeDirection direction, ResolutionSource source)
      : mDirection(direction),
	mSource(source)
    {}

    OutcomeDirection getDirection() const
    {
      return mDirection;
    }

    ResolutionSource getSource() const
    {
      return mSource;
    }

  private:
    OutcomeDirection mDirection;
    ResolutionSource mSource;
  };

  inline bool operator==(const GroundTruth& lhs, const GroundTruth& rhs)
  {
    return (lhs.getDirection() == rhs.getDirection()) && (lhs.getSource() == rhs.getSource());
  }

  inline bool operator!=(const GroundTruth& lhs, const GroundTruth& rhs)
  {
    return !(lhs == rhs);
  }

  /**
   * @class GroundTruthResolver
   * @brief Determines the realized direction of a window.
   *
   * The populated resolution fields are consulted in descending order of trust:
   *
   *   1. audited resolution (settlement reported by the market operator)
   *   2. on-chain resolution
   *   3. generic resolved direction
   *   4. oracle close price compared to oracle open price, close >= open is UP
   *
   * The first field holding "up" or "down" (any case) wins. A field holding
   * anything else counts as unpopulated. The price comparison needs both
   * prices and treats a zero price as missing. When nothing applies the
   * window is unresolved and an empty optional is returned.
   *
   * The result depends on the window fields only.
   */
  template <class Decimal>
  class GroundTruthResolver
  {
  public:
    static std::optional<GroundTruth> resolve(const BinaryWindow<Decimal>& window)
    {
      if (auto direction = parseOutcomeDirection(window.getAuditedResolution()))
	return GroundTruth(*direction, ResolutionSource::AuditedResolution);

      if (auto direction = parseOutcomeDirection(window.getOnchainResolution()))
	return GroundTruth(*direction, ResolutionSource::OnchainResolution);

      if (auto direction = parseOutcomeDirection(window.getResolvedDirection()))
	return GroundTruth(*direction, ResolutionSource::GenericResolution);

      const std::optional<Decimal>& closePrice = window.getOracleClosePrice();
      const std::optional<Decimal>& openPrice = window.getOracleOpenPrice();

      if (!closePrice || !openPrice)
	return std::nullopt;

      if (*closePrice == DecimalConstants<Decimal>::DecimalZero ||
	  *openPrice == DecimalConstants<Decimal>::DecimalZero)
	return std::nullopt;

      return GroundTruth((*closePrice >= *openPrice) ? OutcomeDirection::Up : OutcomeDirection::Down,
			 ResolutionSource::OraclePriceComparison);
    }
  };
}

#endif
