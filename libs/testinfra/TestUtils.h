// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TEST_UTILS_H
#define __TEST_UTILS_H 1

#include <memory>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>
#include "number.h"
#include "BinaryWindow.h"
#include "MarketEvents.h"
#include "WindowStrategy.h"

typedef num::DefaultNumber DecimalType;

DecimalType createDecimal(const std::string& valueString);

boost::posix_time::ptime createTimestamp(const std::string& isoString);

mkc_updown::BinaryWindow<DecimalType>
createWindow(const std::string& symbol, const std::string& closeTime);

mkc_updown::OracleTick<DecimalType>
createOracleTick(const std::string& timestamp,
		 const std::string& price,
		 const std::string& topic = mkc_updown::OracleTopic,
		 const std::string& symbol = "btcusd");

/// Book snapshot with bid size and ask size of 100.
mkc_updown::BookSnapshot<DecimalType>
createBookSnapshot(const std::string& timestamp,
		   const std::string& symbol,
		   const std::string& bestBid,
		   const std::string& bestAsk);

mkc_updown::ExchangeTick<DecimalType>
createExchangeTick(const std::string& timestamp,
		   const std::string& exchange,
		   const std::string& symbol,
		   const std::string& price);

///
/// Strategy that buys `size` of `token` on the first event where that
/// token's book is known, then holds until the window settles.
///
std::shared_ptr<mkc_updown::WindowStrategy<DecimalType>>
createBuyOnceStrategy(const std::string& token, const std::string& size);

///
/// Strategy that never trades.
///
std::shared_ptr<mkc_updown::WindowStrategy<DecimalType>>
createHoldStrategy();

#endif
