// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "csv.h"
#include "number.h"
#include "DateRange.h"
#include "TimeUtils.h"
#include "BinaryWindow.h"
#include "MarketEvents.h"
#include "TimelineBuilder.h"
#include "WindowDataSource.h"

namespace updownbacktester
{

using namespace mkc_updown;

class TickDataException : public std::runtime_error
{
public:
    TickDataException(const std::string msg)
        : std::runtime_error(msg)
    {}

    ~TickDataException()
    {}
};

/**
 * @brief Locations of the CSV files a run reads. The exchange tick file is
 *        optional; an empty path means the run has no exchange data.
 */
struct TickDataFiles
{
    std::string windowsFile;
    std::string oracleTicksFile;
    std::string bookSnapshotsFile;
    std::string exchangeTicksFile;
};

//
// Reads windows and ticks from CSV files
//
// windows:         Symbol, CloseTime, OpenTime, StrikePrice, OracleOpenPrice,
//                  OracleClosePrice, AuditedResolution, OnchainResolution,
//                  ResolvedDirection
// oracle ticks:    Timestamp, Topic, Symbol, Price
// book snapshots:  Timestamp, Symbol, TokenId, BestBid, BestAsk, BidSize,
//                  AskSize, WindowEpoch
// exchange ticks:  Timestamp, Exchange, Symbol, Price, Bid, Ask
//
// Every column must be present in the header; extra columns are ignored.
// Empty optional fields (open time, prices, resolutions, epoch, bid/ask)
// mean "not recorded". Timestamps are ISO-8601.
//
// Only windows closing inside the date range are read. Ticks are read from
// the earliest window open time (at the latest one window duration before
// the range start) up to the range end, so every window sees its whole
// interval.
//
// As a WindowTickLoader the files are scanned again for each window, which
// is what per-window mode models: one fetch per window from the store.
//

template <class Decimal>
class CsvTickDataLoader : public WindowTickLoader<Decimal>
{
public:
    typedef io::CSVReader<4, io::trim_chars<' '>, io::double_quote_escape<',','\"'>> OracleCsvFile;
    typedef io::CSVReader<6, io::trim_chars<' '>, io::double_quote_escape<',','\"'>> ExchangeCsvFile;
    typedef io::CSVReader<8, io::trim_chars<' '>, io::double_quote_escape<',','\"'>> BookCsvFile;
    typedef io::CSVReader<9, io::trim_chars<' '>, io::double_quote_escape<',','\"'>> WindowCsvFile;

    CsvTickDataLoader(const TickDataFiles& files,
                      const DateRange& dateRange,
                      const time_duration& windowDuration,
                      const std::vector<std::string>& symbols = std::vector<std::string>())
        : mFiles(files),
          mDateRange(dateRange),
          mWindowDuration(windowDuration),
          mSymbols(symbols)
    {
        if (mFiles.windowsFile.empty())
            throw TickDataException("CsvTickDataLoader: windows file is required");

        if (mFiles.oracleTicksFile.empty())
            throw TickDataException("CsvTickDataLoader: oracle ticks file is required");

        if (mFiles.bookSnapshotsFile.empty())
            throw TickDataException("CsvTickDataLoader: book snapshots file is required");
    }

    const DateRange& getDateRange() const
    {
        return mDateRange;
    }

    const TickDataFiles& getFiles() const
    {
        return mFiles;
    }

    /**
     * @brief Windows closing inside the date range, ordered by close time
     * @throws TickDataException for an unreadable file or a malformed row
     */
    std::vector<BinaryWindow<Decimal>> readWindows() const
    {
        std::vector<BinaryWindow<Decimal>> windows;

        try
        {
            WindowCsvFile csvFile(mFiles.windowsFile.c_str());
            csvFile.read_header(io::ignore_extra_column, "Symbol", "CloseTime", "OpenTime", "StrikePrice",
                                "OracleOpenPrice", "OracleClosePrice", "AuditedResolution",
                                "OnchainResolution", "ResolvedDirection");

            std::string symbol, closeTimeString, openTimeString, strikeString;
            std::string oracleOpenString, oracleCloseString;
            std::string auditedString, onchainString, resolvedString;

            while (csvFile.read_row(symbol, closeTimeString, openTimeString, strikeString,
                                    oracleOpenString, oracleCloseString,
                                    auditedString, onchainString, resolvedString))
            {
                if (!isSelectedSymbol(symbol))
                    continue;

                ptime closeTime = parseIsoTimestamp(closeTimeString);
                if (!mDateRange.contains(closeTime))
                    continue;

                BinaryWindow<Decimal> window(symbol, closeTime);

                if (!openTimeString.empty())
                    window.setOpenTime(parseIsoTimestamp(openTimeString));
                if (!strikeString.empty())
                    window.setStrikePrice(num::fromString<Decimal>(strikeString));
                if (!oracleOpenString.empty())
                    window.setOracleOpenPrice(num::fromString<Decimal>(oracleOpenString));
                if (!oracleCloseString.empty())
                    window.setOracleClosePrice(num::fromString<Decimal>(oracleCloseString));

                window.setAuditedResolution(auditedString);
                window.setOnchainResolution(onchainString);
                window.setResolvedDirection(resolvedString);

                windows.push_back(window);
            }
        }
        catch (const std::exception& e)
        {
            throw TickDataException("CsvTickDataLoader: error reading windows file " +
                                    mFiles.windowsFile + ": " + e.what());
        }

        std::stable_sort(windows.begin(), windows.end(),
                         [](const BinaryWindow<Decimal>& lhs, const BinaryWindow<Decimal>& rhs) {
                             return lhs.getCloseTime() < rhs.getCloseTime();
                         });

        return windows;
    }

    /**
     * @brief Every tick any window of the date range can replay
     *
     * Starts at the earliest window open time, and never later than one
     * window duration before the range start, so a window with an early
     * explicit open time sees the same ticks as a per-window fetch.
     *
     * @throws TickDataException for an unreadable file or a malformed row
     */
    std::shared_ptr<const BacktestDataset<Decimal>> readDataset() const
    {
        const ptime firstTick = getFirstTickTime(readWindows());
        const ptime lastTick = mDateRange.getLastDateTime();

        auto inRange = [&firstTick, &lastTick](const ptime& timestamp) {
            return (timestamp >= firstTick) && (timestamp <= lastTick);
        };

        return std::make_shared<const BacktestDataset<Decimal>>(readOracleTicks(inRange),
                                                                readBookSnapshots(inRange),
                                                                readExchangeTicks(inRange));
    }

    WindowTickData<Decimal> loadWindowTicks(const BinaryWindow<Decimal>& window,
                                            const ptime& openTime,
                                            const ptime& closeTime) const override
    {
        auto inWindow = [&openTime, &closeTime](const ptime& timestamp) {
            return (timestamp >= openTime) && (timestamp < closeTime);
        };

        auto windowDataset = std::make_shared<const BacktestDataset<Decimal>>(readOracleTicks(inWindow),
                                                                              readBookSnapshots(inWindow),
                                                                              readExchangeTicks(inWindow));

        // Same symbol and epoch filtering as a preloaded run
        PreloadedWindowDataSource<Decimal> slicer(windowDataset);
        return slicer.loadWindowData(window, openTime, closeTime);
    }

    /**
     * @brief Earliest tick the preloaded dataset keeps for these windows
     */
    ptime getFirstTickTime(const std::vector<BinaryWindow<Decimal>>& windows) const
    {
        ptime firstTick = mDateRange.getFirstDateTime() - mWindowDuration;

        for (const auto& window : windows)
            firstTick = std::min(firstTick, window.getOpenTime(mWindowDuration));

        return firstTick;
    }

private:
    typedef std::function<bool(const ptime&)> TimestampFilter;

    bool isSelectedSymbol(const std::string& symbol) const
    {
        if (mSymbols.empty())
            return true;

        return std::any_of(mSymbols.begin(), mSymbols.end(),
                           [&symbol](const std::string& selected) {
                               return boost::algorithm::iequals(selected, symbol);
                           });
    }

    std::vector<OracleTick<Decimal>> readOracleTicks(const TimestampFilter& accept) const
    {
        std::vector<OracleTick<Decimal>> ticks;

        try
        {
            OracleCsvFile csvFile(mFiles.oracleTicksFile.c_str());
            csvFile.read_header(io::ignore_extra_column, "Timestamp", "Topic", "Symbol", "Price");

            std::string timestampString, topic, symbol, priceString;

            while (csvFile.read_row(timestampString, topic, symbol, priceString))
            {
                ptime timestamp = parseIsoTimestamp(timestampString);
                if (!accept(timestamp))
                    continue;

                ticks.push_back(OracleTick<Decimal>(timestamp, topic, symbol,
                                                    num::fromString<Decimal>(priceString)));
            }
        }
        catch (const std::exception& e)
        {
            throw TickDataException("CsvTickDataLoader: error reading oracle ticks file " +
                                    mFiles.oracleTicksFile + ": " + e.what());
        }

        return ticks;
    }

    std::vector<BookSnapshot<Decimal>> readBookSnapshots(const TimestampFilter& accept) const
    {
        std::vector<BookSnapshot<Decimal>> snapshots;

        try
        {
            BookCsvFile csvFile(mFiles.bookSnapshotsFile.c_str());
            csvFile.read_header(io::ignore_extra_column, "Timestamp", "Symbol", "TokenId", "BestBid",
                                "BestAsk", "BidSize", "AskSize", "WindowEpoch");

            std::string timestampString, symbol, tokenId, bidString, askString;
            std::string bidSizeString, askSizeString, epochString;

            while (csvFile.read_row(timestampString, symbol, tokenId, bidString, askString,
                                    bidSizeString, askSizeString, epochString))
            {
                ptime timestamp = parseIsoTimestamp(timestampString);
                if (!accept(timestamp))
                    continue;

                BookSnapshot<Decimal> snapshot(timestamp, symbol, tokenId,
                                               num::fromString<Decimal>(bidString),
                                               num::fromString<Decimal>(askString),
                                               parseOptionalSize(bidSizeString),
                                               parseOptionalSize(askSizeString));
                if (!epochString.empty())
                    snapshot.setWindowEpoch(static_cast<int64_t>(std::stoll(epochString)));

                snapshots.push_back(snapshot);
            }
        }
        catch (const std::exception& e)
        {
            throw TickDataException("CsvTickDataLoader: error reading book snapshots file " +
                                    mFiles.bookSnapshotsFile + ": " + e.what());
        }

        return snapshots;
    }

    std::vector<ExchangeTick<Decimal>> readExchangeTicks(const TimestampFilter& accept) const
    {
        std::vector<ExchangeTick<Decimal>> ticks;
        if (mFiles.exchangeTicksFile.empty())
            return ticks;

        try
        {
            ExchangeCsvFile csvFile(mFiles.exchangeTicksFile.c_str());
            csvFile.read_header(io::ignore_extra_column, "Timestamp", "Exchange", "Symbol", "Price",
                                "Bid", "Ask");

            std::string timestampString, exchange, symbol, priceString, bidString, askString;

            while (csvFile.read_row(timestampString, exchange, symbol, priceString, bidString, askString))
            {
                ptime timestamp = parseIsoTimestamp(timestampString);
                if (!accept(timestamp))
                    continue;

                ExchangeTick<Decimal> tick(timestamp, exchange, symbol, num::fromString<Decimal>(priceString));
                if (!bidString.empty() && !askString.empty())
                    tick.setQuote(num::fromString<Decimal>(bidString), num::fromString<Decimal>(askString));

                ticks.push_back(tick);
            }
        }
        catch (const std::exception& e)
        {
            throw TickDataException("CsvTickDataLoader: error reading exchange ticks file " +
                                    mFiles.exchangeTicksFile + ": " + e.what());
        }

        return ticks;
    }

    static Decimal parseOptionalSize(const std::string& sizeString)
    {
        if (sizeString.empty())
            return DecimalConstants<Decimal>::DecimalZero;

        return num::fromString<Decimal>(sizeString);
    }

private:
    TickDataFiles mFiles;
    DateRange mDateRange;
    time_duration mWindowDuration;
    std::vector<std::string> mSymbols;
};

} // namespace updownbacktester
