// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PARALLEL_BACKTESTER_H
#define __PARALLEL_BACKTESTER_H 1

#include <chrono>
#include <cstddef>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "ConcurrencyLimiter.h"
#include "BacktestConfiguration.h"
#include "BacktestResultAggregator.h"
#include "BinaryWindow.h"
#include "TimeUtils.h"
#include "TimelineBuilder.h"
#include "WindowDataSource.h"
#include "WindowEvaluator.h"
#include "WindowResult.h"
#include "WindowStrategy.h"
#include "number.h"

namespace mkc_updown
{
  using boost::posix_time::ptime;

  /**
   * @brief A window evaluation failed and the batch was aborted.
   */
  class WindowEvaluationException : public std::runtime_error
  {
  public:
    WindowEvaluationException(const std::string& symbol,
			      const ptime& closeTime,
			      const std::string& cause)
      : std::runtime_error("Window " + symbol + " closing " + toIsoString(closeTime) + " failed: " + cause),
	mSymbol(symbol),
	mCloseTime(closeTime),
	mCause(cause)
    {}

    ~WindowEvaluationException()
      {}

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    const ptime& getCloseTime() const
    {
      return mCloseTime;
    }

    const std::string& getCause() const
    {
      return mCause;
    }

  private:
    std::string mSymbol;
    ptime mCloseTime;
    std::string mCause;
  };

  /**
   * @class ParallelBacktester
   * @brief Runs a strategy over a list of windows with bounded parallelism.
   *
   * The strategy and configuration are validated on construction, before any
   * window is touched. run() submits one task per window to a
   * ConcurrencyLimiter sized by the data source (the requested concurrency
   * for preloaded data, at most the per-window ceiling when each window's
   * data is fetched on demand). Each task loads the window's ticks, builds
   * the timeline and evaluates the window with fresh per-window state.
   *
   * The progress callback fires once per finished window, failed or not, in
   * completion order.
   *
   * A window failure (data load, timeline, strategy hook) is handled by the
   * configured WindowFailurePolicy. No window is cancelled either way.
   */
  template <class Decimal>
  class ParallelBacktester
  {
  public:
    typedef typename WindowEvaluator<Decimal>::SimulatorFactory SimulatorFactory;

    /**
     * @throws BacktestConfigurationException for an invalid configuration
     * @throws WindowStrategyException for a null or invalid strategy
     */
    ParallelBacktester(std::shared_ptr<WindowStrategy<Decimal>> strategy,
		       const BacktestConfiguration<Decimal>& configuration,
		       std::ostream& log = std::cout,
		       SimulatorFactory simulatorFactory = SimulatorFactory())
      : mStrategyName(strategy ? strategy->getStrategyName() : std::string()),
	mConfiguration(validated(configuration)),
	mEvaluator(strategy, configuration, std::move(simulatorFactory)),
	mLog(log),
	mLastEffectiveConcurrency(0),
	mLastPeakInFlight(0)
    {}

    ParallelBacktester(const ParallelBacktester<Decimal>&) = delete;
    ParallelBacktester<Decimal>& operator=(const ParallelBacktester<Decimal>&) = delete;

    /**
     * @brief Slice every window out of a dataset loaded up front.
     */
    AggregateBacktestResult<Decimal> runPreloaded(const std::vector<BinaryWindow<Decimal>>& windows,
						  std::shared_ptr<const BacktestDataset<Decimal>> dataset)
    {
      PreloadedWindowDataSource<Decimal> dataSource(dataset);
      return run(windows, dataSource);
    }

    /**
     * @brief Fetch every window's ticks from the loader when the window runs.
     */
    AggregateBacktestResult<Decimal> runPerWindow(const std::vector<BinaryWindow<Decimal>>& windows,
						  std::shared_ptr<const WindowTickLoader<Decimal>> loader)
    {
      PerWindowDataSource<Decimal> dataSource(loader, mConfiguration.getPerWindowConcurrencyCeiling());
      return run(windows, dataSource);
    }

    /**
     * @throws WindowEvaluationException under AbortBatch when any window failed
     * @throws whatever the progress callback throws, once all windows are done
     */
    AggregateBacktestResult<Decimal> run(const std::vector<BinaryWindow<Decimal>>& windows,
					 const WindowDataSource<Decimal>& dataSource)
    {
      auto startTime = std::chrono::steady_clock::now();
      const std::size_t total = windows.size();
      const std::size_t effectiveConcurrency = dataSource.getEffectiveConcurrency(mConfiguration.getConcurrency());

      if (mConfiguration.isVerbose())
	mLog << "Starting backtest of " << mStrategyName << ": " << total << " windows, mode "
	     << dataSource.getModeName() << ", concurrency " << effectiveConcurrency << std::endl;

      std::vector<std::optional<WindowResult<Decimal>>> results(total);
      std::vector<std::optional<std::string>> failures(total);
      std::mutex progressMutex;
      std::size_t completed = 0;

      {
	concurrency::ConcurrencyLimiter limiter(effectiveConcurrency);
	std::vector<std::future<void>> futures;
	futures.reserve(total);

	for (std::size_t i = 0; i < total; ++i)
	  {
	    futures.push_back(limiter.submit([this, i, total, &windows, &dataSource,
					      &results, &failures, &progressMutex, &completed]() {
	      try
		{
		  results[i] = evaluateWindow(windows[i], dataSource);
		}
	      catch (const std::exception& e)
		{
		  failures[i] = std::string(e.what());
		}
	      catch (...)
		{
		  failures[i] = std::string("unknown exception");
		}

	      std::lock_guard<std::mutex> lock(progressMutex);
	      ++completed;
	      if (mConfiguration.getProgressCallback())
		mConfiguration.getProgressCallback()(completed, total);
	    }));
	  }

	limiter.waitAll(futures);

	mLastEffectiveConcurrency = effectiveConcurrency;
	mLastPeakInFlight = limiter.getPeakInFlight();
      }

      std::vector<WindowResult<Decimal>> windowResults;
      std::vector<FailedWindow> failedWindows;
      windowResults.reserve(total);

      for (std::size_t i = 0; i < total; ++i)
	{
	  if (failures[i])
	    {
	      if (mConfiguration.isVerbose())
		mLog << "Window " << windows[i].getSymbol() << " " << toIsoString(windows[i].getCloseTime())
		     << " failed: " << *failures[i] << std::endl;

	      if (mConfiguration.getFailurePolicy() == WindowFailurePolicy::AbortBatch)
		throw WindowEvaluationException(windows[i].getSymbol(), windows[i].getCloseTime(), *failures[i]);

	      failedWindows.push_back(FailedWindow(windows[i].getSymbol(), windows[i].getCloseTime(), *failures[i]));
	    }
	  else
	    windowResults.push_back(*results[i]);
	}

      long elapsed = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
	  std::chrono::steady_clock::now() - startTime).count());

      AggregateBacktestResult<Decimal> aggregate =
	BacktestResultAggregator<Decimal>::aggregate(windowResults,
						      mStrategyName,
						      mEvaluator.getEffectiveParameters(),
						      mConfiguration.getStartingCapital(),
						      failedWindows,
						      elapsed);

      if (mConfiguration.isVerbose())
	mLog << "Finished backtest of " << mStrategyName << ": " << aggregate.getSummary().getTotalTrades()
	     << " trades, total pnl " << num::toString(aggregate.getSummary().getTotalPnl())
	     << ", " << failedWindows.size() << " failed windows, " << elapsed << " ms" << std::endl;

      return aggregate;
    }

    const std::string& getStrategyName() const
    {
      return mStrategyName;
    }

    const BacktestConfiguration<Decimal>& getConfiguration() const
    {
      return mConfiguration;
    }

    /**
     * @brief Limiter capacity used by the most recent run.
     */
    std::size_t getLastEffectiveConcurrency() const
    {
      return mLastEffectiveConcurrency;
    }

    /**
     * @brief Most windows observed in flight at once during the most recent run.
     */
    std::size_t getLastPeakInFlight() const
    {
      return mLastPeakInFlight;
    }

  private:
    static const BacktestConfiguration<Decimal>& validated(const BacktestConfiguration<Decimal>& configuration)
    {
      configuration.validate();
      return configuration;
    }

    WindowResult<Decimal> evaluateWindow(const BinaryWindow<Decimal>& window,
					 const WindowDataSource<Decimal>& dataSource) const
    {
      ptime openTime = window.getOpenTime(mConfiguration.getWindowDuration());
      WindowTickData<Decimal> data = dataSource.loadWindowData(window, openTime, window.getCloseTime());

      return mEvaluator.evaluate(window, TimelineBuilder<Decimal>::buildTimeline(data));
    }

  private:
    std::string mStrategyName;
    BacktestConfiguration<Decimal> mConfiguration;
    WindowEvaluator<Decimal> mEvaluator;
    std::ostream& mLog;
    std::size_t mLastEffectiveConcurrency;
    std::size_t mLastPeakInFlight;
  };
}

#endif
