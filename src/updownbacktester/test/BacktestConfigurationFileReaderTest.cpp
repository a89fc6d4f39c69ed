#include <catch2/catch_test_macros.hpp>
#include "BacktestConfigurationFileReader.h"
#include "TestUtils.h"
#include "CliTestUtils.h"
#include <string>

using namespace mkc_updown;
using namespace updownbacktester;
using boost::posix_time::seconds;

namespace
{
    const std::string FullRunFile = R"({
      "strategy": { "name": "oracle_deficit",
                    "parameters": { "deficitThreshold": 60, "maxDownPrice": "0.7" } },
      "data": { "windows": "windows.csv", "oracleTicks": "oracle.csv",
                "bookSnapshots": "/archive/books.csv", "exchangeTicks": "exchanges.csv",
                "symbols": [ "btc", "eth" ] },
      "dateRange": { "start": "2026-01-25T00:00:00Z", "end": "2026-01-26T00:00:00Z" },
      "execution": { "startingCapital": "250", "spreadBuffer": 0.01, "feeRate": "0.02",
                     "windowDurationSeconds": 900 },
      "run": { "mode": "per-window", "concurrency": 20, "perWindowConcurrencyCeiling": 4,
               "failurePolicy": "skip", "verbose": true },
      "sweep": { "maxDownPrice": [ "0.60", "0.65" ], "deficitThreshold": [ 40, 80, 120 ] }
    })";

    const std::string MinimalRunFile = R"({
      "strategy": { "name": "hold" },
      "data": { "windows": "w.csv", "oracleTicks": "o.csv", "bookSnapshots": "b.csv" },
      "dateRange": { "start": "2026-01-25", "end": "2026-01-26" }
    })";

    std::string replaceText(std::string text, const std::string& from, const std::string& to)
    {
        std::string::size_type pos = text.find(from);
        REQUIRE(pos != std::string::npos);
        return text.replace(pos, from.size(), to);
    }
}

TEST_CASE("Run file with every section", "[BacktestConfigurationFileReader]")
{
    RunConfiguration run = BacktestConfigurationFileReader::parseConfiguration(FullRunFile, "/data/runs");
    const BacktestConfiguration<DecimalType>& config = run.getBacktestConfiguration();

    SECTION("Strategy")
    {
        REQUIRE(run.getStrategyName() == "oracle_deficit");
        REQUIRE(config.getStrategyParameters().getNumParameters() == 2);
        REQUIRE(config.getStrategyParameters().getParameter("deficitThreshold") == createDecimal("60"));
        REQUIRE(config.getStrategyParameters().getParameter("maxDownPrice") == createDecimal("0.7"));
    }

    SECTION("Data files and symbols")
    {
        REQUIRE(run.getDataFiles().windowsFile == "/data/runs/windows.csv");
        REQUIRE(run.getDataFiles().oracleTicksFile == "/data/runs/oracle.csv");
        REQUIRE(run.getDataFiles().bookSnapshotsFile == "/archive/books.csv");
        REQUIRE(run.getDataFiles().exchangeTicksFile == "/data/runs/exchanges.csv");
        REQUIRE(run.getSymbols() == std::vector<std::string>{"btc", "eth"});
    }

    SECTION("Date range")
    {
        REQUIRE(run.getDateRange().getFirstDateTime() == createTimestamp("2026-01-25T00:00:00Z"));
        REQUIRE(run.getDateRange().getLastDateTime() == createTimestamp("2026-01-26T00:00:00Z"));
    }

    SECTION("Execution and run settings")
    {
        REQUIRE(config.getStartingCapital() == createDecimal("250"));
        REQUIRE(config.getSpreadBuffer() == createDecimal("0.01"));
        REQUIRE(config.getFeeRate() == createDecimal("0.02"));
        REQUIRE(config.getWindowDuration() == seconds(900));
        REQUIRE(run.getDataMode() == DataMode::PerWindow);
        REQUIRE(config.getConcurrency() == 20);
        REQUIRE(config.getPerWindowConcurrencyCeiling() == 4);
        REQUIRE(config.getFailurePolicy() == WindowFailurePolicy::SkipWindow);
        REQUIRE(config.isVerbose());
    }

    SECTION("Sweep dimensions keep file order")
    {
        REQUIRE(run.isParameterSweep());
        const auto& dimensions = run.getParameterGrid().getDimensions();
        REQUIRE(dimensions.size() == 2);
        REQUIRE(dimensions[0].first == "maxDownPrice");
        REQUIRE(dimensions[1].first == "deficitThreshold");
        REQUIRE(dimensions[1].second.size() == 3);
        REQUIRE(run.getParameterGrid().getNumCombinations() == 6);
    }
}

TEST_CASE("Run file defaults", "[BacktestConfigurationFileReader]")
{
    RunConfiguration run = BacktestConfigurationFileReader::parseConfiguration(MinimalRunFile);
    const BacktestConfiguration<DecimalType>& config = run.getBacktestConfiguration();

    REQUIRE(run.getStrategyName() == "hold");
    REQUIRE(run.getDataFiles().windowsFile == "w.csv");
    REQUIRE(run.getDataFiles().exchangeTicksFile.empty());
    REQUIRE(run.getSymbols().empty());
    REQUIRE(run.getDataMode() == DataMode::Preloaded);
    REQUIRE_FALSE(run.isParameterSweep());

    REQUIRE(config.getStartingCapital() == createDecimal("100"));
    REQUIRE(config.getSpreadBuffer() == createDecimal("0.005"));
    REQUIRE(config.getFeeRate() == createDecimal("0"));
    REQUIRE(config.getWindowDuration() == seconds(300));
    REQUIRE(config.getConcurrency() == 50);
    REQUIRE(config.getPerWindowConcurrencyCeiling() == 10);
    REQUIRE(config.getFailurePolicy() == WindowFailurePolicy::AbortBatch);
    REQUIRE_FALSE(config.isVerbose());
    REQUIRE(config.getStrategyParameters().empty());
}

TEST_CASE("Run file errors", "[BacktestConfigurationFileReader]")
{
    SECTION("Missing date range")
    {
        std::string text = replaceText(MinimalRunFile,
                                       R"("dateRange": { "start": "2026-01-25", "end": "2026-01-26" })",
                                       R"("comment": "no range")");
        try
        {
            BacktestConfigurationFileReader::parseConfiguration(text);
            FAIL("a run file without a date range must be rejected");
        }
        catch (const BacktestConfigurationFileReaderException& e)
        {
            REQUIRE(std::string(e.what()).find("dateRange") != std::string::npos);
        }
    }

    SECTION("Reversed date range")
    {
        std::string text = replaceText(MinimalRunFile, R"("end": "2026-01-26")", R"("end": "2026-01-24")");
        REQUIRE_THROWS_AS(BacktestConfigurationFileReader::parseConfiguration(text),
                          BacktestConfigurationFileReaderException);
    }

    SECTION("Missing strategy name")
    {
        std::string text = replaceText(MinimalRunFile, R"("name": "hold")", R"("label": "hold")");
        REQUIRE_THROWS_AS(BacktestConfigurationFileReader::parseConfiguration(text),
                          BacktestConfigurationFileReaderException);
    }

    SECTION("Missing data file")
    {
        std::string text = replaceText(MinimalRunFile, R"("bookSnapshots": "b.csv")", R"("books": "b.csv")");
        REQUIRE_THROWS_AS(BacktestConfigurationFileReader::parseConfiguration(text),
                          BacktestConfigurationFileReaderException);
    }

    SECTION("Invalid JSON")
    {
        REQUIRE_THROWS_AS(BacktestConfigurationFileReader::parseConfiguration("{ \"strategy\": "),
                          BacktestConfigurationFileReaderException);
        REQUIRE_THROWS_AS(BacktestConfigurationFileReader::parseConfiguration("[1, 2]"),
                          BacktestConfigurationFileReaderException);
    }

    SECTION("Unknown failure policy and mode")
    {
        std::string policy = replaceText(FullRunFile, R"("failurePolicy": "skip")", R"("failurePolicy": "retry")");
        REQUIRE_THROWS_AS(BacktestConfigurationFileReader::parseConfiguration(policy),
                          BacktestConfigurationFileReaderException);

        std::string mode = replaceText(FullRunFile, R"("mode": "per-window")", R"("mode": "streaming")");
        REQUIRE_THROWS_AS(BacktestConfigurationFileReader::parseConfiguration(mode),
                          BacktestConfigurationFileReaderException);
    }

    SECTION("Settings that fail validation")
    {
        std::string capital = replaceText(FullRunFile, R"("startingCapital": "250")", R"("startingCapital": 0)");
        REQUIRE_THROWS_AS(BacktestConfigurationFileReader::parseConfiguration(capital),
                          BacktestConfigurationFileReaderException);

        std::string concurrency = replaceText(FullRunFile, R"("concurrency": 20)", R"("concurrency": 0)");
        REQUIRE_THROWS_AS(BacktestConfigurationFileReader::parseConfiguration(concurrency),
                          BacktestConfigurationFileReaderException);

        std::string negative = replaceText(FullRunFile, R"("concurrency": 20)", R"("concurrency": -3)");
        REQUIRE_THROWS_AS(BacktestConfigurationFileReader::parseConfiguration(negative),
                          BacktestConfigurationFileReaderException);
    }

    SECTION("Bad values")
    {
        std::string fee = replaceText(FullRunFile, R"("feeRate": "0.02")", R"("feeRate": true)");
        REQUIRE_THROWS_AS(BacktestConfigurationFileReader::parseConfiguration(fee),
                          BacktestConfigurationFileReaderException);

        std::string sweep = replaceText(FullRunFile, R"([ 40, 80, 120 ])", "[]");
        REQUIRE_THROWS_AS(BacktestConfigurationFileReader::parseConfiguration(sweep),
                          BacktestConfigurationFileReaderException);
    }
}

TEST_CASE("Run file on disk", "[BacktestConfigurationFileReader]")
{
    TemporaryDirectory dir;

    SECTION("Data paths are relative to the run file")
    {
        std::string path = dir.writeFile("run.json", MinimalRunFile);
        RunConfiguration run = BacktestConfigurationFileReader(path).readConfigurationFile();

        REQUIRE(run.getDataFiles().windowsFile == (dir.getPath() / "w.csv").string());
        REQUIRE(run.getDataFiles().bookSnapshotsFile == (dir.getPath() / "b.csv").string());
    }

    SECTION("Missing run file")
    {
        BacktestConfigurationFileReader reader((dir.getPath() / "absent.json").string());
        REQUIRE_THROWS_AS(reader.readConfigurationFile(), BacktestConfigurationFileReaderException);
    }
}
