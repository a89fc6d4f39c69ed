#include <catch2/catch_test_macros.hpp>
#include "ParameterSweepRunner.h"
#include "TestUtils.h"
#include <sstream>

using namespace mkc_updown;
using boost::posix_time::minutes;

namespace
{
  // Buys positionSize of the up token whenever its ask is at or below maxAsk
  std::shared_ptr<WindowStrategy<DecimalType>> createThresholdStrategy()
  {
    StrategyParameters<DecimalType> defaults;
    defaults.setParameter("positionSize", createDecimal("10"));
    defaults.setParameter("maxAsk", createDecimal("0.50"));

    return std::make_shared<FunctionalWindowStrategy<DecimalType>>(
      "Threshold",
      [](const WindowMarketState<DecimalType>& state, const StrategyParameters<DecimalType>& params) {
	std::vector<TradeSignal<DecimalType>> signals;
	if (state.getUpBook() && state.getUpBook()->getBestAsk() <= params.getParameter("maxAsk"))
	  signals.push_back(TradeSignal<DecimalType>::buy("btc_up", params.getParameter("positionSize")));
	return signals;
      },
      FunctionalWindowStrategy<DecimalType>::OpenHook(),
      FunctionalWindowStrategy<DecimalType>::CloseHook(),
      defaults);
  }

  std::shared_ptr<const BacktestDataset<DecimalType>> createDataset()
  {
    std::vector<BookSnapshot<DecimalType>> book;
    book.push_back(createBookSnapshot("2026-01-25T12:01:00Z", "btc-up", "0.38", "0.40"));
    return std::make_shared<const BacktestDataset<DecimalType>>(std::vector<OracleTick<DecimalType>>(), book,
								std::vector<ExchangeTick<DecimalType>>());
  }
}

TEST_CASE("ParameterGrid enumeration", "[ParameterSweepRunner]")
{
  ParameterGrid<DecimalType> grid;
  REQUIRE(grid.getNumCombinations() == 1);
  REQUIRE(grid.enumerate().size() == 1);
  REQUIRE(grid.enumerate()[0].empty());

  grid.addDimension("maxAsk", {createDecimal("0.30"), createDecimal("0.45")});
  grid.addDimension("positionSize", {createDecimal("10"), createDecimal("20"), createDecimal("30")});
  REQUIRE_THROWS_AS(grid.addDimension("maxAsk", {createDecimal("0.5")}), StrategyParameterException);

  std::vector<StrategyParameters<DecimalType>> combinations = grid.enumerate();
  REQUIRE(grid.getNumCombinations() == 6);
  REQUIRE(combinations.size() == 6);

  // Last dimension varies fastest
  REQUIRE(combinations[0].getParameter("maxAsk") == createDecimal("0.30"));
  REQUIRE(combinations[0].getParameter("positionSize") == createDecimal("10"));
  REQUIRE(combinations[1].getParameter("positionSize") == createDecimal("20"));
  REQUIRE(combinations[3].getParameter("maxAsk") == createDecimal("0.45"));
  REQUIRE(combinations[5].getParameter("positionSize") == createDecimal("30"));

  SECTION("A dimension without values leaves nothing to run")
  {
    grid.addDimension("empty", {});
    REQUIRE(grid.getNumCombinations() == 0);
    REQUIRE(grid.enumerate().empty());
  }
}

TEST_CASE("ParameterSweepRunner runs one backtest per combination", "[ParameterSweepRunner]")
{
  std::vector<BinaryWindow<DecimalType>> windows;
  windows.push_back(createWindow("btc", "2026-01-25T12:05:00Z"));
  windows[0].setResolvedDirection("up");

  ParameterGrid<DecimalType> grid;
  grid.addDimension("maxAsk", {createDecimal("0.30"), createDecimal("0.45")});
  grid.addDimension("positionSize", {createDecimal("10"), createDecimal("50")});

  BacktestConfiguration<DecimalType> config;
  config.setSpreadBuffer(createDecimal("0"));

  std::vector<std::size_t> progress;
  std::ostringstream log;
  ParameterSweepRunner<DecimalType> runner(createThresholdStrategy(), config, grid, log);

  std::vector<SweepResult<DecimalType>> results =
    runner.runPreloaded(windows, createDataset(),
			[&progress](std::size_t completed, std::size_t total) {
			  REQUIRE(total == 4);
			  progress.push_back(completed);
			});

  REQUIRE(results.size() == 4);
  REQUIRE(progress == std::vector<std::size_t>({1, 2, 3, 4}));

  // maxAsk 0.30 never trades against a 0.40 ask
  REQUIRE(results[0].getResult().getSummary().getTotalTrades() == 0);
  REQUIRE(results[1].getResult().getSummary().getTotalTrades() == 0);

  // maxAsk 0.45 buys once per event at 0.40 and wins 0.60 per unit
  REQUIRE(results[2].getParameters().getParameter("positionSize") == createDecimal("10"));
  REQUIRE(results[2].getResult().getSummary().getTotalPnl() == createDecimal("6"));
  REQUIRE(results[3].getResult().getSummary().getTotalPnl() == createDecimal("30"));

  // The echoed parameters are the defaults overlaid with the grid point
  const StrategyParameters<DecimalType>& echoed = results[3].getResult().getStrategyParameters();
  REQUIRE(echoed.getParameter("maxAsk") == createDecimal("0.45"));
  REQUIRE(echoed.getParameter("positionSize") == createDecimal("50"));
}

TEST_CASE("ParameterSweepRunner validates up front", "[ParameterSweepRunner]")
{
  ParameterGrid<DecimalType> grid;
  BacktestConfiguration<DecimalType> config;
  std::ostringstream log;

  REQUIRE_THROWS_AS(ParameterSweepRunner<DecimalType>(nullptr, config, grid, log), WindowStrategyException);

  config.setStartingCapital(createDecimal("-1"));
  REQUIRE_THROWS_AS(ParameterSweepRunner<DecimalType>(createHoldStrategy(), config, grid, log),
		    BacktestConfigurationException);
}
