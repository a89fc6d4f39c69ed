#include <catch2/catch_test_macros.hpp>
#include "BacktestResultAggregator.h"
#include "TestUtils.h"

using namespace mkc_updown;
using boost::posix_time::minutes;

namespace
{
  // One window holding a single 100 unit up position bought at entryPrice
  WindowResult<DecimalType> createWindowResult(const std::string& closeTime,
					       const std::string& entryPrice,
					       OutcomeDirection direction)
  {
    BinaryWindow<DecimalType> window = createWindow("btc", closeTime);
    window.setResolvedDirection(toString(direction));
    ptime openTime = window.getOpenTime(minutes(5));

    BinaryExecutionSimulator<DecimalType> simulator(
      ExecutionSettings<DecimalType>(createDecimal("100"), createDecimal("0"), createDecimal("0")));
    simulator.buyToken("btc_up", createDecimal(entryPrice), createDecimal("100"), openTime, "test");
    simulator.resolveWindow(direction, window.getCloseTime());

    return WindowResult<DecimalType>(window,
				     openTime,
				     GroundTruth(direction, ResolutionSource::GenericResolution),
				     simulator.getStats(),
				     simulator.getTrades(),
				     simulator.getEquityCurve(),
				     10,
				     std::vector<EventOutcome>());
  }

  AggregateBacktestResult<DecimalType> aggregate(const std::vector<WindowResult<DecimalType>>& results,
						 const std::vector<FailedWindow>& failed = std::vector<FailedWindow>(),
						 long elapsed = 0)
  {
    return BacktestResultAggregator<DecimalType>::aggregate(results, "Test", StrategyParameters<DecimalType>(),
							    createDecimal("100"), failed, elapsed);
  }
}

TEST_CASE("Aggregator orders windows chronologically", "[BacktestResultAggregator]")
{
  std::vector<WindowResult<DecimalType>> results;
  results.push_back(createWindowResult("2026-01-25T12:10:00Z", "0.40", OutcomeDirection::Up));
  results.push_back(createWindowResult("2026-01-25T12:05:00Z", "0.40", OutcomeDirection::Down));

  AggregateBacktestResult<DecimalType> result = aggregate(results);
  const BacktestSummary<DecimalType>& summary = result.getSummary();

  REQUIRE(result.getWindowSummaries().size() == 2);
  REQUIRE(result.getWindowSummaries()[0].getCloseTime() == createTimestamp("2026-01-25T12:05:00Z"));
  REQUIRE(result.getWindowSummaries()[0].getPnl() == createDecimal("-40"));
  REQUIRE(result.getWindowSummaries()[1].getResolvedDirection() == OutcomeDirection::Up);

  REQUIRE(result.getEquityCurve().size() == 3);
  REQUIRE(result.getEquityCurve()[0] == createDecimal("100"));
  REQUIRE(result.getEquityCurve()[1] == createDecimal("60"));
  REQUIRE(result.getEquityCurve()[2] == createDecimal("120"));

  REQUIRE(result.getTrades().size() == 2);
  REQUIRE(result.getTrades()[0].getPnl() == createDecimal("-40"));

  REQUIRE(summary.getTotalTrades() == 2);
  REQUIRE(summary.getWinRate() == createDecimal("0.5"));
  REQUIRE(summary.getTotalPnl() == createDecimal("20"));
  REQUIRE(summary.getReturnPct() == createDecimal("0.2"));
  REQUIRE(summary.getMaxDrawdown() == createDecimal("0.4"));
  REQUIRE(summary.getFinalCapital() == createDecimal("120"));
  REQUIRE(summary.getAvgWin() == createDecimal("60"));
  REQUIRE(summary.getAvgLoss() == createDecimal("-40"));
  REQUIRE(summary.getEventsProcessed() == 20);
  REQUIRE(summary.getWindowsProcessed() == 2);

  REQUIRE(*result.getStartDate() == createTimestamp("2026-01-25T12:05:00Z"));
  REQUIRE(*result.getEndDate() == createTimestamp("2026-01-25T12:10:00Z"));
}

TEST_CASE("Aggregator drawdown bounds", "[BacktestResultAggregator]")
{
  SECTION("Rising capital has no drawdown")
  {
    std::vector<WindowResult<DecimalType>> results;
    results.push_back(createWindowResult("2026-01-25T12:05:00Z", "0.40", OutcomeDirection::Up));
    results.push_back(createWindowResult("2026-01-25T12:10:00Z", "0.50", OutcomeDirection::Up));

    AggregateBacktestResult<DecimalType> result = aggregate(results);
    REQUIRE(result.getSummary().getMaxDrawdown() == createDecimal("0"));
    REQUIRE(result.getSummary().getFinalCapital() == createDecimal("210"));
  }

  SECTION("Drawdown is measured from the running peak")
  {
    std::vector<WindowResult<DecimalType>> results;
    results.push_back(createWindowResult("2026-01-25T12:05:00Z", "0.50", OutcomeDirection::Up));
    results.push_back(createWindowResult("2026-01-25T12:10:00Z", "0.75", OutcomeDirection::Down));
    results.push_back(createWindowResult("2026-01-25T12:15:00Z", "0.50", OutcomeDirection::Down));

    // 100 -> 150 -> 75 -> 25
    AggregateBacktestResult<DecimalType> result = aggregate(results);
    REQUIRE(result.getEquityCurve().back() == createDecimal("25"));
    REQUIRE(result.getSummary().getMaxDrawdown() > createDecimal("0.8"));
    REQUIRE(result.getSummary().getMaxDrawdown() <= createDecimal("1"));
  }
}

TEST_CASE("Aggregator with no windows", "[BacktestResultAggregator]")
{
  std::vector<FailedWindow> failed;
  failed.push_back(FailedWindow("btc", createTimestamp("2026-01-25T12:05:00Z"), "loader timeout"));

  AggregateBacktestResult<DecimalType> result = aggregate(std::vector<WindowResult<DecimalType>>(), failed, 12);

  REQUIRE(result.getEquityCurve().size() == 1);
  REQUIRE(result.getSummary().getTotalTrades() == 0);
  REQUIRE(result.getSummary().getWinRate() == createDecimal("0"));
  REQUIRE(result.getSummary().getFinalCapital() == createDecimal("100"));
  REQUIRE_FALSE(result.getStartDate().has_value());
  REQUIRE(result.getFailedWindows().size() == 1);
  REQUIRE(result.getFailedWindows()[0].getMessage() == "loader timeout");
  REQUIRE(result.getElapsedMilliseconds() == 12);
  REQUIRE(result.getStrategyName() == "Test");
}

TEST_CASE("Aggregate equality ignores elapsed time", "[BacktestResultAggregator]")
{
  std::vector<WindowResult<DecimalType>> results;
  results.push_back(createWindowResult("2026-01-25T12:05:00Z", "0.40", OutcomeDirection::Up));

  REQUIRE(aggregate(results, std::vector<FailedWindow>(), 5) == aggregate(results, std::vector<FailedWindow>(), 500));
}
