#include <catch2/catch_test_macros.hpp>
#include "CsvTickDataLoader.h"
#include "ParallelBacktester.h"
#include "TestUtils.h"
#include "CliTestUtils.h"

using namespace mkc_updown;
using namespace updownbacktester;
using boost::posix_time::minutes;

namespace
{
    const char* WindowsCsv =
        "Symbol,CloseTime,OpenTime,StrikePrice,OracleOpenPrice,OracleClosePrice,AuditedResolution,OnchainResolution,ResolvedDirection\n"
        "btc,2026-01-25T12:10:00Z,,100000,100000,100100,,,up\n"
        "btc,2026-01-25T12:05:00Z,,100000,,,down,,\n"
        "eth,2026-01-25T12:05:00Z,2026-01-25T12:01:00Z,3000,,,,,\n"
        "btc,2026-01-26T12:05:00Z,,100000,,,,,\n";

    const char* OracleCsv =
        "Timestamp,Topic,Symbol,Price\n"
        "2026-01-25T12:00:30Z,crypto_prices_chainlink,btcusd,99990\n"
        "2026-01-25T12:06:00Z,crypto_prices,btcusd,100050\n"
        "2026-01-24T10:00:00Z,crypto_prices_chainlink,btcusd,90000\n";

    const char* BooksCsv =
        "Timestamp,Symbol,TokenId,BestBid,BestAsk,BidSize,AskSize,WindowEpoch\n"
        "2026-01-25T12:01:00Z,btc-up,tok-up,0.38,0.40,50,60,1769342700\n"
        "2026-01-25T12:01:00Z,btc-down,tok-down,0.58,0.60,,,\n"
        "2026-01-25T12:07:00Z,btc-up,tok-up,0.50,0.52,10,10,1769343000\n"
        "2026-01-25T12:02:00Z,eth-up,tok-eth,0.45,0.47,5,5,\n";

    const char* ExchangesCsv =
        "Timestamp,Exchange,Symbol,Price,Bid,Ask\n"
        "2026-01-25T12:02:00Z,binance,btc,100010,100009,100011\n"
        "2026-01-25T12:03:00Z,coinbase,BTC,100020,,\n";

    TickDataFiles writeTickFiles(const TemporaryDirectory& dir, bool withExchanges = true)
    {
        TickDataFiles files;
        files.windowsFile = dir.writeFile("windows.csv", WindowsCsv);
        files.oracleTicksFile = dir.writeFile("oracle.csv", OracleCsv);
        files.bookSnapshotsFile = dir.writeFile("books.csv", BooksCsv);
        if (withExchanges)
            files.exchangeTicksFile = dir.writeFile("exchanges.csv", ExchangesCsv);
        return files;
    }

    DateRange januaryTwentyFifth()
    {
        return DateRange(createTimestamp("2026-01-25T00:00:00Z"), createTimestamp("2026-01-25T23:59:59Z"));
    }
}

TEST_CASE("CsvTickDataLoader reads windows inside the date range", "[CsvTickDataLoader]")
{
    TemporaryDirectory dir;
    CsvTickDataLoader<DecimalType> loader(writeTickFiles(dir), januaryTwentyFifth(), minutes(5));

    std::vector<BinaryWindow<DecimalType>> windows = loader.readWindows();

    REQUIRE(windows.size() == 3);

    // ordered by close time, file order kept on ties
    REQUIRE(windows[0].getSymbol() == "btc");
    REQUIRE(windows[0].getCloseTime() == createTimestamp("2026-01-25T12:05:00Z"));
    REQUIRE(windows[1].getSymbol() == "eth");
    REQUIRE(windows[2].getCloseTime() == createTimestamp("2026-01-25T12:10:00Z"));

    SECTION("Populated fields")
    {
        REQUIRE(windows[0].getAuditedResolution() == "down");
        REQUIRE(windows[0].getResolvedDirection().empty());
        REQUIRE_FALSE(windows[0].getOracleClosePrice().has_value());
        REQUIRE(*windows[0].getStrikePrice() == createDecimal("100000"));

        REQUIRE(windows[2].getResolvedDirection() == "up");
        REQUIRE(*windows[2].getOracleOpenPrice() == createDecimal("100000"));
        REQUIRE(*windows[2].getOracleClosePrice() == createDecimal("100100"));
        REQUIRE_FALSE(windows[2].hasExplicitOpenTime());
    }

    SECTION("Explicit open time")
    {
        REQUIRE(windows[1].hasExplicitOpenTime());
        REQUIRE(windows[1].getOpenTime(minutes(5)) == createTimestamp("2026-01-25T12:01:00Z"));
    }
}

TEST_CASE("CsvTickDataLoader symbol selection", "[CsvTickDataLoader]")
{
    TemporaryDirectory dir;
    CsvTickDataLoader<DecimalType> loader(writeTickFiles(dir), januaryTwentyFifth(), minutes(5),
                                          std::vector<std::string>{"BTC"});

    std::vector<BinaryWindow<DecimalType>> windows = loader.readWindows();

    REQUIRE(windows.size() == 2);
    REQUIRE(windows[0].getSymbol() == "btc");
    REQUIRE(windows[1].getSymbol() == "btc");
}

TEST_CASE("CsvTickDataLoader preloads the date range", "[CsvTickDataLoader]")
{
    TemporaryDirectory dir;

    SECTION("Ticks before the lead-in are dropped")
    {
        CsvTickDataLoader<DecimalType> loader(writeTickFiles(dir), januaryTwentyFifth(), minutes(5));
        std::shared_ptr<const BacktestDataset<DecimalType>> dataset = loader.readDataset();

        REQUIRE(dataset->getOracleTicks().size() == 2);
        REQUIRE(dataset->getBookSnapshots().size() == 4);
        REQUIRE(dataset->getExchangeTicks().size() == 2);
        REQUIRE(dataset->getNumTicks() == 8);

        // sorted on load
        REQUIRE(dataset->getBookSnapshots().back().getTimestamp() == createTimestamp("2026-01-25T12:07:00Z"));
        REQUIRE(dataset->getOracleTicks().front().getTopic() == OracleTopic);
    }

    SECTION("Exchange ticks are optional")
    {
        CsvTickDataLoader<DecimalType> loader(writeTickFiles(dir, false), januaryTwentyFifth(), minutes(5));
        REQUIRE(loader.readDataset()->getExchangeTicks().empty());
    }
}

TEST_CASE("CsvTickDataLoader serves one window at a time", "[CsvTickDataLoader]")
{
    TemporaryDirectory dir;
    CsvTickDataLoader<DecimalType> loader(writeTickFiles(dir), januaryTwentyFifth(), minutes(5));

    BinaryWindow<DecimalType> window = createWindow("btc", "2026-01-25T12:05:00Z");
    WindowTickData<DecimalType> ticks = loader.loadWindowTicks(window,
                                                               createTimestamp("2026-01-25T12:00:00Z"),
                                                               window.getCloseTime());

    REQUIRE(ticks.getOracleTicks().size() == 1);
    REQUIRE(ticks.getOracleTicks()[0].getPrice() == createDecimal("99990"));

    // eth book and the next window's book are filtered out
    REQUIRE(ticks.getBookSnapshots().size() == 2);
    for (const auto& snapshot : ticks.getBookSnapshots())
        REQUIRE(snapshot.getSymbol().substr(0, 3) == "btc");

    const BookSnapshot<DecimalType>& up = ticks.getBookSnapshots()[0];
    REQUIRE(up.getTokenId() == "tok-up");
    REQUIRE(*up.getWindowEpoch() == 1769342700);
    REQUIRE(up.getAskSize() == createDecimal("60"));

    const BookSnapshot<DecimalType>& down = ticks.getBookSnapshots()[1];
    REQUIRE_FALSE(down.getWindowEpoch().has_value());
    REQUIRE(down.getBidSize() == createDecimal("0"));

    REQUIRE(ticks.getExchangeTicks().size() == 2);
    REQUIRE(*ticks.getExchangeTicks()[0].getBid() == createDecimal("100009"));
    REQUIRE_FALSE(ticks.getExchangeTicks()[1].getBid().has_value());
}

TEST_CASE("CsvTickDataLoader errors", "[CsvTickDataLoader]")
{
    TemporaryDirectory dir;

    SECTION("Required files")
    {
        TickDataFiles files = writeTickFiles(dir);
        files.windowsFile.clear();
        REQUIRE_THROWS_AS(CsvTickDataLoader<DecimalType>(files, januaryTwentyFifth(), minutes(5)), TickDataException);

        files = writeTickFiles(dir);
        files.bookSnapshotsFile.clear();
        REQUIRE_THROWS_AS(CsvTickDataLoader<DecimalType>(files, januaryTwentyFifth(), minutes(5)), TickDataException);
    }

    SECTION("Missing file")
    {
        TickDataFiles files = writeTickFiles(dir);
        files.oracleTicksFile = (dir.getPath() / "missing.csv").string();

        CsvTickDataLoader<DecimalType> loader(files, januaryTwentyFifth(), minutes(5));
        REQUIRE_THROWS_AS(loader.readDataset(), TickDataException);
    }

    SECTION("Missing column")
    {
        TickDataFiles files = writeTickFiles(dir);
        files.oracleTicksFile = dir.writeFile("bad_oracle.csv",
                                              "Timestamp,Topic,Price\n"
                                              "2026-01-25T12:00:30Z,crypto_prices_chainlink,99990\n");

        CsvTickDataLoader<DecimalType> loader(files, januaryTwentyFifth(), minutes(5));
        REQUIRE_THROWS_AS(loader.readDataset(), TickDataException);
    }

    SECTION("Malformed timestamp")
    {
        TickDataFiles files = writeTickFiles(dir);
        files.windowsFile = dir.writeFile("bad_windows.csv",
                                          "Symbol,CloseTime,OpenTime,StrikePrice,OracleOpenPrice,OracleClosePrice,"
                                          "AuditedResolution,OnchainResolution,ResolvedDirection\n"
                                          "btc,yesterday,,,,,,,\n");

        CsvTickDataLoader<DecimalType> loader(files, januaryTwentyFifth(), minutes(5));
        REQUIRE_THROWS_AS(loader.readWindows(), TickDataException);
    }
}

TEST_CASE("CsvTickDataLoader gives both data modes the same ticks for an early open time", "[CsvTickDataLoader]")
{
    TemporaryDirectory dir;

    // opens ten minutes before its close, five minutes before the range lead-in
    TickDataFiles files;
    files.windowsFile = dir.writeFile("windows.csv",
        "Symbol,CloseTime,OpenTime,StrikePrice,OracleOpenPrice,OracleClosePrice,AuditedResolution,OnchainResolution,ResolvedDirection\n"
        "btc,2026-01-25T12:05:00Z,2026-01-25T11:50:00Z,100000,,,,,down\n");
    files.oracleTicksFile = dir.writeFile("oracle.csv",
        "Timestamp,Topic,Symbol,Price\n"
        "2026-01-25T11:52:00Z,crypto_prices_chainlink,btcusd,99900\n");
    files.bookSnapshotsFile = dir.writeFile("books.csv",
        "Timestamp,Symbol,TokenId,BestBid,BestAsk,BidSize,AskSize,WindowEpoch\n"
        "2026-01-25T11:53:00Z,btc-down,tok-down,0.58,0.60,100,100,1769342700\n");

    DateRange range(createTimestamp("2026-01-25T12:00:00Z"), createTimestamp("2026-01-25T12:30:00Z"));
    auto loader = std::make_shared<CsvTickDataLoader<DecimalType>>(files, range, minutes(5));

    std::vector<BinaryWindow<DecimalType>> windows = loader->readWindows();
    REQUIRE(windows.size() == 1);

    std::shared_ptr<const BacktestDataset<DecimalType>> dataset = loader->readDataset();
    REQUIRE(dataset->getOracleTicks().size() == 1);
    REQUIRE(dataset->getOracleTicks()[0].getTimestamp() == createTimestamp("2026-01-25T11:52:00Z"));

    // buys DOWN once an oracle price below the strike and a DOWN book are both known
    auto strategy = std::make_shared<FunctionalWindowStrategy<DecimalType>>(
        "Below Strike",
        [](const WindowMarketState<DecimalType>& state, const StrategyParameters<DecimalType>&) {
            std::vector<TradeSignal<DecimalType>> signals;
            if (state.getOracleQuote() && state.getBook(OutcomeDirection::Down) &&
                state.getOracleQuote()->getPrice() < *state.getStrikePrice())
                signals.push_back(TradeSignal<DecimalType>::buy("btc_down", createDecimal("10"), "below_strike"));
            return signals;
        });

    BacktestConfiguration<DecimalType> config;
    config.setSpreadBuffer(createDecimal("0"));

    ParallelBacktester<DecimalType> backtester(strategy, config);
    AggregateBacktestResult<DecimalType> preloaded = backtester.runPreloaded(windows, dataset);
    AggregateBacktestResult<DecimalType> perWindow = backtester.runPerWindow(windows, loader);

    REQUIRE(preloaded.getTrades().size() == 1);
    REQUIRE(preloaded.getTrades()[0].getEntryPrice() == createDecimal("0.60"));
    REQUIRE(preloaded.getSummary().getTotalPnl() == createDecimal("4"));
    REQUIRE(preloaded == perWindow);
}
