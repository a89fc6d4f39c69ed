// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "number.h"
#include "DecimalConstants.h"
#include "StrategyParameters.h"
#include "TradeSignal.h"
#include "WindowMarketState.h"
#include "WindowStrategy.h"

namespace updownbacktester
{

using namespace mkc_updown;

/**
 * @brief Buys the DOWN token late in a window when the slow oracle lags
 *        below the strike while the fast reference still sits near it.
 *
 * The settlement oracle updates less often than the reference feed. When
 * the reference price is within nearStrikeThreshold of the strike but the
 * last oracle print is more than deficitThreshold below it, the window is
 * likely to settle DOWN. The entry is taken at most once per window, only
 * during the last entryWindowSeconds and only while the DOWN ask is below
 * maxDownPrice.
 */
template <class Decimal>
class OracleDeficitStrategy : public WindowStrategy<Decimal>
{
public:
    static constexpr const char* DeficitThreshold = "deficitThreshold";
    static constexpr const char* NearStrikeThreshold = "nearStrikeThreshold";
    static constexpr const char* MaxDownPrice = "maxDownPrice";
    static constexpr const char* EntryWindowSeconds = "entryWindowSeconds";
    static constexpr const char* PositionSize = "positionSize";

    OracleDeficitStrategy()
        : WindowStrategy<Decimal>("Oracle Deficit", createDefaultParameters()),
          mEntered(false)
    {
    }

    OracleDeficitStrategy(const OracleDeficitStrategy<Decimal>& rhs)
        : WindowStrategy<Decimal>(rhs),
          mEntered(false)
    {
    }

    void onWindowOpen(const WindowMarketState<Decimal>&,
                      const StrategyParameters<Decimal>&) override
    {
        mEntered = false;
    }

    std::vector<TradeSignal<Decimal>> evaluate(const WindowMarketState<Decimal>& state,
                                               const StrategyParameters<Decimal>& parameters) override
    {
        std::vector<TradeSignal<Decimal>> signals;
        if (mEntered)
            return signals;

        const boost::posix_time::time_duration& timeToClose = state.getTimeToClose();
        const Decimal entryWindow = lookup(parameters, EntryWindowSeconds);
        const Decimal secondsToClose(static_cast<int>(timeToClose.total_seconds()));

        if (timeToClose <= boost::posix_time::seconds(0) || secondsToClose > entryWindow)
            return signals;

        std::optional<Decimal> deficit = state.getOracleDeficit();
        std::optional<Decimal> refGap = state.getRefToStrikeGap();
        const auto& downBook = state.getDownBook();

        if (!deficit || !refGap || !downBook)
            return signals;

        if (num::abs(*refGap) >= lookup(parameters, NearStrikeThreshold))
            return signals;

        if (*deficit <= lookup(parameters, DeficitThreshold))
            return signals;

        if (downBook->getBestAsk() >= lookup(parameters, MaxDownPrice))
            return signals;

        mEntered = true;

        TradeSignal<Decimal> signal =
            TradeSignal<Decimal>::buy(state.getSymbol() + "_down", lookup(parameters, PositionSize), "oracle_deficit");
        signal.setSide(OutcomeDirection::Down);
        signal.addDiagnostic("deficit", num::toString(*deficit));
        signal.addDiagnostic("refGap", num::toString(*refGap));
        signal.addDiagnostic("downAsk", num::toString(downBook->getBestAsk()));
        signals.push_back(signal);

        return signals;
    }

    std::shared_ptr<WindowStrategy<Decimal>> clone() const override
    {
        return std::make_shared<OracleDeficitStrategy<Decimal>>(*this);
    }

    void validate() const override
    {
        const StrategyParameters<Decimal>& defaults = this->getDefaultParameters();
        if (lookup(defaults, PositionSize) <= DecimalConstants<Decimal>::DecimalZero)
            throw WindowStrategyException("OracleDeficitStrategy: positionSize must be positive");
    }

    static StrategyParameters<Decimal> createDefaultParameters()
    {
        StrategyParameters<Decimal> defaults;
        defaults.setParameter(DeficitThreshold, num::fromString<Decimal>("80"));
        defaults.setParameter(NearStrikeThreshold, num::fromString<Decimal>("100"));
        defaults.setParameter(MaxDownPrice, num::fromString<Decimal>("0.65"));
        defaults.setParameter(EntryWindowSeconds, num::fromString<Decimal>("120"));
        defaults.setParameter(PositionSize, num::fromString<Decimal>("1"));
        return defaults;
    }

private:
    // Run parameters first, then the strategy defaults
    Decimal lookup(const StrategyParameters<Decimal>& parameters, const char* name) const
    {
        return parameters.getParameter(name, this->getDefaultParameters().getParameter(name));
    }

private:
    bool mEntered;
};

} // namespace updownbacktester
