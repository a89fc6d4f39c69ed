// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __WINDOW_DATA_SOURCE_H
#define __WINDOW_DATA_SOURCE_H 1

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BinaryWindow.h"
#include "IntervalSlicer.h"
#include "MarketEvents.h"
#include "TimelineBuilder.h"

namespace mkc_updown
{
  using boost::posix_time::ptime;

  class WindowDataSourceException : public std::runtime_error
  {
  public:
  WindowDataSourceException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~WindowDataSourceException()
      {}
  };

  /**
   * @class BacktestDataset
   * @brief All ticks of a backtest's date range, loaded once.
   *
   * Each collection is stable sorted by timestamp on construction and never
   * modified afterwards, so the dataset can be sliced by any number of
   * window evaluations at the same time.
   */
  template <class Decimal>
  class BacktestDataset
  {
  public:
    BacktestDataset(std::vector<OracleTick<Decimal>> oracleTicks,
		    std::vector<BookSnapshot<Decimal>> bookSnapshots,
		    std::vector<ExchangeTick<Decimal>> exchangeTicks)
      : mOracleTicks(std::move(oracleTicks)),
	mBookSnapshots(std::move(bookSnapshots)),
	mExchangeTicks(std::move(exchangeTicks))
    {
      sortByTimestamp(mOracleTicks);
      sortByTimestamp(mBookSnapshots);
      sortByTimestamp(mExchangeTicks);
    }

    const std::vector<OracleTick<Decimal>>& getOracleTicks() const
    {
      return mOracleTicks;
    }

    const std::vector<BookSnapshot<Decimal>>& getBookSnapshots() const
    {
      return mBookSnapshots;
    }

    const std::vector<ExchangeTick<Decimal>>& getExchangeTicks() const
    {
      return mExchangeTicks;
    }

    std::size_t getNumTicks() const
    {
      return mOracleTicks.size() + mBookSnapshots.size() + mExchangeTicks.size();
    }

  private:
    template <class Record>
    static void sortByTimestamp(std::vector<Record>& records)
    {
      std::stable_sort(records.begin(), records.end(),
		       [](const Record& lhs, const Record& rhs) {
			 return lhs.getTimestamp() < rhs.getTimestamp();
		       });
    }

  private:
    std::vector<OracleTick<Decimal>> mOracleTicks;
    std::vector<BookSnapshot<Decimal>> mBookSnapshots;
    std::vector<ExchangeTick<Decimal>> mExchangeTicks;
  };

  /**
   * @class WindowDataSource
   * @brief Supplies the ticks of one window to the backtester.
   *
   * Implementations are called concurrently from the backtester's workers and
   * must be safe for that. The backtester sizes its concurrency limiter with
   * getEffectiveConcurrency().
   */
  template <class Decimal>
  class WindowDataSource
  {
  public:
    virtual ~WindowDataSource()
    {}

    /**
     * @brief Ticks of the window with openTime <= timestamp < closeTime.
     */
    virtual WindowTickData<Decimal> loadWindowData(const BinaryWindow<Decimal>& window,
						   const ptime& openTime,
						   const ptime& closeTime) const = 0;

    virtual std::size_t getEffectiveConcurrency(std::size_t requestedConcurrency) const = 0;

    virtual std::string getModeName() const = 0;
  };

  /**
   * @class PreloadedWindowDataSource
   * @brief Cuts each window's ticks out of a dataset loaded up front.
   *
   * Oracle ticks are time sliced only. Book snapshots must also have a symbol
   * starting with the window symbol (any case) and, when the snapshot records
   * a window epoch, the window's epoch. Exchange ticks must match the window
   * symbol (any case).
   */
  template <class Decimal>
  class PreloadedWindowDataSource : public WindowDataSource<Decimal>
  {
  public:
    explicit PreloadedWindowDataSource(std::shared_ptr<const BacktestDataset<Decimal>> dataset)
      : mDataset(dataset)
    {
      if (!mDataset)
	throw WindowDataSourceException("PreloadedWindowDataSource: dataset cannot be null");
    }

    WindowTickData<Decimal> loadWindowData(const BinaryWindow<Decimal>& window,
					   const ptime& openTime,
					   const ptime& closeTime) const override
    {
      std::vector<OracleTick<Decimal>> oracleTicks =
	IntervalSlicer<OracleTick<Decimal>>::slice(mDataset->getOracleTicks(), openTime, closeTime);

      return WindowTickData<Decimal>(oracleTicks,
				     sliceBookSnapshots(window, openTime, closeTime),
				     sliceExchangeTicks(window, openTime, closeTime));
    }

    std::size_t getEffectiveConcurrency(std::size_t requestedConcurrency) const override
    {
      return requestedConcurrency;
    }

    std::string getModeName() const override
    {
      return "preloaded";
    }

    std::shared_ptr<const BacktestDataset<Decimal>> getDataset() const
    {
      return mDataset;
    }

  private:
    std::vector<BookSnapshot<Decimal>> sliceBookSnapshots(const BinaryWindow<Decimal>& window,
							  const ptime& openTime,
							  const ptime& closeTime) const
    {
      std::vector<BookSnapshot<Decimal>> slice =
	IntervalSlicer<BookSnapshot<Decimal>>::slice(mDataset->getBookSnapshots(), openTime, closeTime);

      const std::string& prefix = window.getSymbol();
      const int64_t windowEpoch = window.getWindowEpoch();

      slice.erase(std::remove_if(slice.begin(), slice.end(),
				 [&prefix, windowEpoch](const BookSnapshot<Decimal>& snapshot) {
				   if (!boost::algorithm::istarts_with(snapshot.getSymbol(), prefix))
				     return true;

				   const std::optional<int64_t>& epoch = snapshot.getWindowEpoch();
				   return epoch && (*epoch != windowEpoch);
				 }),
		  slice.end());

      return slice;
    }

    std::vector<ExchangeTick<Decimal>> sliceExchangeTicks(const BinaryWindow<Decimal>& window,
							  const ptime& openTime,
							  const ptime& closeTime) const
    {
      std::vector<ExchangeTick<Decimal>> slice =
	IntervalSlicer<ExchangeTick<Decimal>>::slice(mDataset->getExchangeTicks(), openTime, closeTime);

      const std::string& symbol = window.getSymbol();

      slice.erase(std::remove_if(slice.begin(), slice.end(),
				 [&symbol](const ExchangeTick<Decimal>& tick) {
				   return !boost::algorithm::iequals(tick.getSymbol(), symbol);
				 }),
		  slice.end());

      return slice;
    }

  private:
    std::shared_ptr<const BacktestDataset<Decimal>> mDataset;
  };

  /**
   * @class WindowTickLoader
   * @brief Fetches one window's ticks from an external store on demand.
   *
   * Called from several threads at once, never more than the per-window
   * concurrency ceiling.
   */
  template <class Decimal>
  class WindowTickLoader
  {
  public:
    virtual ~WindowTickLoader()
    {}

    virtual WindowTickData<Decimal> loadWindowTicks(const BinaryWindow<Decimal>& window,
						    const ptime& openTime,
						    const ptime& closeTime) const = 0;
  };

  /**
   * @class PerWindowDataSource
   * @brief Fetches every window's ticks from a loader when the window runs.
   *
   * The loader usually sits on a shared, capacity limited resource, so the
   * number of windows in flight is capped at the ceiling whatever
   * concurrency the run asked for.
   */
  template <class Decimal>
  class PerWindowDataSource : public WindowDataSource<Decimal>
  {
  public:
    PerWindowDataSource(std::shared_ptr<const WindowTickLoader<Decimal>> loader,
			std::size_t concurrencyCeiling)
      : mLoader(loader),
	mConcurrencyCeiling(concurrencyCeiling)
    {
      if (!mLoader)
	throw WindowDataSourceException("PerWindowDataSource: loader cannot be null");

      if (mConcurrencyCeiling == 0)
	throw WindowDataSourceException("PerWindowDataSource: concurrency ceiling must be at least 1");
    }

    WindowTickData<Decimal> loadWindowData(const BinaryWindow<Decimal>& window,
					   const ptime& openTime,
					   const ptime& closeTime) const override
    {
      return mLoader->loadWindowTicks(window, openTime, closeTime);
    }

    std::size_t getEffectiveConcurrency(std::size_t requestedConcurrency) const override
    {
      return std::min(requestedConcurrency, mConcurrencyCeiling);
    }

    std::string getModeName() const override
    {
      return "per-window";
    }

    std::size_t getConcurrencyCeiling() const
    {
      return mConcurrencyCeiling;
    }

  private:
    std::shared_ptr<const WindowTickLoader<Decimal>> mLoader;
    std::size_t mConcurrencyCeiling;
  };
}

#endif
