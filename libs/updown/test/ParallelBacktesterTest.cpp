#include <catch2/catch_test_macros.hpp>
#include "ParallelBacktester.h"
#include "TestUtils.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <sstream>
#include <thread>

using namespace mkc_updown;
using boost::posix_time::minutes;
using boost::posix_time::seconds;

namespace
{
  BacktestConfiguration<DecimalType> createConfiguration()
  {
    BacktestConfiguration<DecimalType> config;
    config.setSpreadBuffer(createDecimal("0"));
    config.setWindowDuration(seconds(300));
    return config;
  }

  // Consecutive five minute btc windows, the first closing at 12:05
  std::vector<BinaryWindow<DecimalType>> createWindows(int count, const std::string& direction = "up")
  {
    std::vector<BinaryWindow<DecimalType>> windows;
    ptime close = createTimestamp("2026-01-25T12:05:00Z");

    for (int i = 0; i < count; ++i)
      {
	BinaryWindow<DecimalType> window("btc", close + minutes(5 * i));
	window.setResolvedDirection(direction);
	windows.push_back(window);
      }

    return windows;
  }

  // Up book offered at 0.40 one minute into the window
  WindowTickData<DecimalType> createWindowTicks(const BinaryWindow<DecimalType>& window, const ptime& openTime)
  {
    BookSnapshot<DecimalType> up(openTime + minutes(1), window.getSymbol() + "-up", "up-token",
				 createDecimal("0.38"), createDecimal("0.40"),
				 createDecimal("500"), createDecimal("500"));
    up.setWindowEpoch(window.getWindowEpoch());

    std::vector<BookSnapshot<DecimalType>> book(1, up);
    std::vector<OracleTick<DecimalType>> oracle(1, OracleTick<DecimalType>(openTime + seconds(10), OracleTopic,
									     "btcusd", createDecimal("100000")));
    return WindowTickData<DecimalType>(oracle, book, std::vector<ExchangeTick<DecimalType>>());
  }

  std::shared_ptr<const BacktestDataset<DecimalType>> createDataset(const std::vector<BinaryWindow<DecimalType>>& windows)
  {
    std::vector<OracleTick<DecimalType>> oracle;
    std::vector<BookSnapshot<DecimalType>> book;

    for (const auto& window : windows)
      {
	WindowTickData<DecimalType> ticks = createWindowTicks(window, window.getOpenTime(minutes(5)));
	oracle.insert(oracle.end(), ticks.getOracleTicks().begin(), ticks.getOracleTicks().end());
	book.insert(book.end(), ticks.getBookSnapshots().begin(), ticks.getBookSnapshots().end());
      }

    return std::make_shared<const BacktestDataset<DecimalType>>(oracle, book, std::vector<ExchangeTick<DecimalType>>());
  }

  // Loader that tracks how many windows it is serving at once
  class SlowLoader : public WindowTickLoader<DecimalType>
  {
  public:
    explicit SlowLoader(int delayMilliseconds, const ptime& failingWindow = ptime())
      : mDelayMilliseconds(delayMilliseconds),
	mFailingWindow(failingWindow),
	mInFlight(0),
	mPeakInFlight(0),
	mCalls(0)
    {}

    WindowTickData<DecimalType> loadWindowTicks(const BinaryWindow<DecimalType>& window,
						const ptime& openTime,
						const ptime&) const override
    {
      mCalls.fetch_add(1);
      int now = mInFlight.fetch_add(1) + 1;
      int seen = mPeakInFlight.load();
      while (now > seen && !mPeakInFlight.compare_exchange_weak(seen, now)) {}

      std::this_thread::sleep_for(std::chrono::milliseconds(mDelayMilliseconds));
      mInFlight.fetch_sub(1);

      if (window.getCloseTime() == mFailingWindow)
	throw std::runtime_error("loader timeout");

      return createWindowTicks(window, openTime);
    }

    int getPeakInFlight() const { return mPeakInFlight.load(); }
    int getCalls() const { return mCalls.load(); }

  private:
    int mDelayMilliseconds;
    ptime mFailingWindow;
    mutable std::atomic<int> mInFlight;
    mutable std::atomic<int> mPeakInFlight;
    mutable std::atomic<int> mCalls;
  };
}

TEST_CASE("Two winning windows from $100", "[ParallelBacktester]")
{
  std::vector<BinaryWindow<DecimalType>> windows = createWindows(2);
  std::ostringstream log;

  ParallelBacktester<DecimalType> backtester(createBuyOnceStrategy("btc_up", "100"), createConfiguration(), log);
  AggregateBacktestResult<DecimalType> result = backtester.runPreloaded(windows, createDataset(windows));
  const BacktestSummary<DecimalType>& summary = result.getSummary();

  REQUIRE(result.getWindowSummaries().size() == 2);
  REQUIRE(result.getWindowSummaries()[0].getPnl() == createDecimal("60"));
  REQUIRE(result.getWindowSummaries()[1].getPnl() == createDecimal("60"));
  REQUIRE(summary.getTotalPnl() == createDecimal("120"));
  REQUIRE(summary.getFinalCapital() == createDecimal("220"));
  REQUIRE(summary.getWinRate() == createDecimal("1"));
  REQUIRE(summary.getTotalTrades() == 2);
  REQUIRE(summary.getMaxDrawdown() == createDecimal("0"));
  REQUIRE(summary.getReturnPct() == createDecimal("1.2"));

  REQUIRE(result.getEquityCurve().size() == 3);
  REQUIRE(result.getEquityCurve()[0] == createDecimal("100"));
  REQUIRE(result.getEquityCurve()[1] == createDecimal("160"));
  REQUIRE(result.getEquityCurve()[2] == createDecimal("220"));

  REQUIRE(result.getFailedWindows().empty());
  REQUIRE(backtester.getLastEffectiveConcurrency() == 50);
  REQUIRE(log.str().empty());
}

TEST_CASE("Per-window mode caps concurrency at the ceiling", "[ParallelBacktester]")
{
  std::vector<BinaryWindow<DecimalType>> windows = createWindows(30);
  auto loader = std::make_shared<SlowLoader>(20);

  BacktestConfiguration<DecimalType> config = createConfiguration();
  config.setConcurrency(50);

  std::ostringstream log;
  ParallelBacktester<DecimalType> backtester(createBuyOnceStrategy("btc_up", "100"), config, log);
  AggregateBacktestResult<DecimalType> result = backtester.runPerWindow(windows, loader);

  REQUIRE(loader->getCalls() == 30);
  REQUIRE(loader->getPeakInFlight() <= 10);
  REQUIRE(backtester.getLastEffectiveConcurrency() == 10);
  REQUIRE(backtester.getLastPeakInFlight() <= 10);
  REQUIRE(result.getSummary().getWindowsProcessed() == 30);
  REQUIRE(result.getSummary().getTotalTrades() == 30);
  REQUIRE(result.getSummary().getTotalPnl() == createDecimal("1800"));

  SECTION("A lower ceiling is honored")
  {
    config.setPerWindowConcurrencyCeiling(3);
    auto slowLoader = std::make_shared<SlowLoader>(10);
    ParallelBacktester<DecimalType> limited(createBuyOnceStrategy("btc_up", "100"), config, log);
    limited.runPerWindow(createWindows(9), slowLoader);

    REQUIRE(slowLoader->getPeakInFlight() <= 3);
    REQUIRE(limited.getLastEffectiveConcurrency() == 3);
  }
}

TEST_CASE("Invalid strategies fail before any window runs", "[ParallelBacktester]")
{
  auto loader = std::make_shared<SlowLoader>(0);
  std::ostringstream log;

  auto noDecision = std::make_shared<FunctionalWindowStrategy<DecimalType>>("Broken", nullptr);
  REQUIRE_THROWS_AS(ParallelBacktester<DecimalType>(noDecision, createConfiguration(), log), WindowStrategyException);
  REQUIRE_THROWS_AS(ParallelBacktester<DecimalType>(nullptr, createConfiguration(), log), WindowStrategyException);

  BacktestConfiguration<DecimalType> badConfig = createConfiguration();
  badConfig.setConcurrency(0);
  REQUIRE_THROWS_AS(ParallelBacktester<DecimalType>(createHoldStrategy(), badConfig, log),
		    BacktestConfigurationException);

  REQUIRE(loader->getCalls() == 0);
}

TEST_CASE("Progress callback reports every window", "[ParallelBacktester]")
{
  std::vector<BinaryWindow<DecimalType>> windows = createWindows(12);
  std::vector<std::size_t> completedCounts;
  std::size_t reportedTotal = 0;

  BacktestConfiguration<DecimalType> config = createConfiguration();
  config.setConcurrency(4);
  config.setProgressCallback([&completedCounts, &reportedTotal](std::size_t completed, std::size_t total) {
    completedCounts.push_back(completed);
    reportedTotal = total;
  });

  std::ostringstream log;
  ParallelBacktester<DecimalType> backtester(createHoldStrategy(), config, log);
  backtester.runPreloaded(windows, createDataset(windows));

  REQUIRE(completedCounts.size() == 12);
  REQUIRE(reportedTotal == 12);
  for (std::size_t i = 0; i < completedCounts.size(); ++i)
    REQUIRE(completedCounts[i] == i + 1);
}

TEST_CASE("Window failure policies", "[ParallelBacktester]")
{
  std::vector<BinaryWindow<DecimalType>> windows = createWindows(5);
  auto loader = std::make_shared<SlowLoader>(1, windows[2].getCloseTime());
  std::ostringstream log;
  BacktestConfiguration<DecimalType> config = createConfiguration();

  SECTION("Abort raises after every window has run")
  {
    ParallelBacktester<DecimalType> backtester(createBuyOnceStrategy("btc_up", "100"), config, log);

    try
      {
	backtester.runPerWindow(windows, loader);
	FAIL("runPerWindow should have thrown");
      }
    catch (const WindowEvaluationException& e)
      {
	REQUIRE(e.getSymbol() == "btc");
	REQUIRE(e.getCloseTime() == windows[2].getCloseTime());
	REQUIRE(e.getCause() == "loader timeout");
      }

    REQUIRE(loader->getCalls() == 5);
  }

  SECTION("Skip reports the failed window and aggregates the rest")
  {
    config.setFailurePolicy(WindowFailurePolicy::SkipWindow);
    config.setVerbose(true);
    ParallelBacktester<DecimalType> backtester(createBuyOnceStrategy("btc_up", "100"), config, log);

    AggregateBacktestResult<DecimalType> result = backtester.runPerWindow(windows, loader);

    REQUIRE(result.getFailedWindows().size() == 1);
    REQUIRE(result.getFailedWindows()[0].getCloseTime() == windows[2].getCloseTime());
    REQUIRE(result.getWindowSummaries().size() == 4);
    REQUIRE(result.getSummary().getTotalPnl() == createDecimal("240"));
    REQUIRE(log.str().find("loader timeout") != std::string::npos);
  }
}

TEST_CASE("Results do not depend on concurrency", "[ParallelBacktester]")
{
  std::vector<BinaryWindow<DecimalType>> windows = createWindows(20);
  windows[3].setResolvedDirection("down");
  windows[11].setResolvedDirection("down");
  auto dataset = createDataset(windows);
  std::ostringstream log;

  BacktestConfiguration<DecimalType> sequential = createConfiguration();
  sequential.setConcurrency(1);
  BacktestConfiguration<DecimalType> parallel = createConfiguration();
  parallel.setConcurrency(8);

  ParallelBacktester<DecimalType> first(createBuyOnceStrategy("btc_up", "100"), sequential, log);
  ParallelBacktester<DecimalType> second(createBuyOnceStrategy("btc_up", "100"), parallel, log);

  AggregateBacktestResult<DecimalType> a = first.runPreloaded(windows, dataset);
  AggregateBacktestResult<DecimalType> b = second.runPreloaded(windows, dataset);

  REQUIRE(a == b);
  REQUIRE(a.getSummary().getTotalTrades() == 20);
  REQUIRE(a.getSummary().getTotalPnl() == createDecimal("1000"));
  REQUIRE(a.getSummary().getMaxDrawdown() > createDecimal("0"));
}
