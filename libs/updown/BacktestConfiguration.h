// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_CONFIGURATION_H
#define __BACKTEST_CONFIGURATION_H 1

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "DecimalConstants.h"
#include "ExecutionSimulator.h"
#include "StrategyParameters.h"

namespace mkc_updown
{
  using boost::posix_time::time_duration;

  class BacktestConfigurationException : public std::runtime_error
  {
  public:
  BacktestConfigurationException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~BacktestConfigurationException()
      {}
  };

  /**
   * @brief What happens to a batch when one window evaluation fails.
   *
   * AbortBatch: every window still runs, then the first failure in window
   * order is rethrown. SkipWindow: failed windows are reported beside the
   * result and left out of the aggregation.
   */
  enum class WindowFailurePolicy { AbortBatch, SkipWindow };

  inline std::string toString(WindowFailurePolicy policy)
  {
    return (policy == WindowFailurePolicy::AbortBatch) ? "abort" : "skip";
  }

  /**
   * @class BacktestConfiguration
   * @brief Settings of one backtest run.
   *
   * Defaults: starting capital 100, spread buffer 0.005, no fee, five minute
   * windows, 50 windows in flight (at most 10 when data is fetched per window),
   * abort the batch on a window failure.
   */
  template <class Decimal>
  class BacktestConfiguration
  {
  public:
    typedef std::function<void(std::size_t completed, std::size_t total)> ProgressCallback;

    static constexpr std::size_t DefaultConcurrency = 50;
    static constexpr std::size_t DefaultPerWindowConcurrencyCeiling = 10;

    BacktestConfiguration()
      : mStartingCapital(DecimalConstants<Decimal>::DefaultStartingCapital),
	mSpreadBuffer(DecimalConstants<Decimal>::DefaultSpreadBuffer),
	mFeeRate(DecimalConstants<Decimal>::DefaultFeeRate),
	mWindowDuration(boost::posix_time::minutes(5)),
	mConcurrency(DefaultConcurrency),
	mPerWindowConcurrencyCeiling(DefaultPerWindowConcurrencyCeiling),
	mFailurePolicy(WindowFailurePolicy::AbortBatch),
	mStrategyParameters(),
	mVerbose(false),
	mProgressCallback()
    {}

    const Decimal& getStartingCapital() const { return mStartingCapital; }
    void setStartingCapital(const Decimal& capital) { mStartingCapital = capital; }

    const Decimal& getSpreadBuffer() const { return mSpreadBuffer; }
    void setSpreadBuffer(const Decimal& buffer) { mSpreadBuffer = buffer; }

    const Decimal& getFeeRate() const { return mFeeRate; }
    void setFeeRate(const Decimal& feeRate) { mFeeRate = feeRate; }

    const time_duration& getWindowDuration() const { return mWindowDuration; }
    void setWindowDuration(const time_duration& duration) { mWindowDuration = duration; }

    std::size_t getConcurrency() const { return mConcurrency; }
    void setConcurrency(std::size_t concurrency) { mConcurrency = concurrency; }

    /**
     * @brief Upper bound on windows in flight when data is fetched per window.
     */
    std::size_t getPerWindowConcurrencyCeiling() const { return mPerWindowConcurrencyCeiling; }
    void setPerWindowConcurrencyCeiling(std::size_t ceiling) { mPerWindowConcurrencyCeiling = ceiling; }

    WindowFailurePolicy getFailurePolicy() const { return mFailurePolicy; }
    void setFailurePolicy(WindowFailurePolicy policy) { mFailurePolicy = policy; }

    const StrategyParameters<Decimal>& getStrategyParameters() const { return mStrategyParameters; }
    void setStrategyParameters(const StrategyParameters<Decimal>& parameters) { mStrategyParameters = parameters; }

    bool isVerbose() const { return mVerbose; }
    void setVerbose(bool verbose) { mVerbose = verbose; }

    /**
     * @brief Called once per completed window with (completed, total), from
     *        the worker thread that completed it. Calls are serialized.
     */
    const ProgressCallback& getProgressCallback() const { return mProgressCallback; }
    void setProgressCallback(ProgressCallback callback) { mProgressCallback = std::move(callback); }

    ExecutionSettings<Decimal> getExecutionSettings() const
    {
      return ExecutionSettings<Decimal>(mStartingCapital, mSpreadBuffer, mFeeRate);
    }

    /**
     * @throws BacktestConfigurationException for a non-positive capital or
     *         duration, a negative buffer or fee, or a zero concurrency or ceiling
     */
    void validate() const
    {
      const Decimal& zero = DecimalConstants<Decimal>::DecimalZero;

      if (mStartingCapital <= zero)
	throw BacktestConfigurationException("BacktestConfiguration: starting capital must be positive");

      if (mSpreadBuffer < zero)
	throw BacktestConfigurationException("BacktestConfiguration: spread buffer cannot be negative");

      if (mFeeRate < zero)
	throw BacktestConfigurationException("BacktestConfiguration: fee rate cannot be negative");

      if (mWindowDuration.is_special() || mWindowDuration <= time_duration(0, 0, 0))
	throw BacktestConfigurationException("BacktestConfiguration: window duration must be positive");

      if (mConcurrency == 0)
	throw BacktestConfigurationException("BacktestConfiguration: concurrency must be at least 1");

      if (mPerWindowConcurrencyCeiling == 0)
	throw BacktestConfigurationException("BacktestConfiguration: per-window concurrency ceiling must be at least 1");
    }

  private:
    Decimal mStartingCapital;
    Decimal mSpreadBuffer;
    Decimal mFeeRate;
    time_duration mWindowDuration;
    std::size_t mConcurrency;
    std::size_t mPerWindowConcurrencyCeiling;
    WindowFailurePolicy mFailurePolicy;
    StrategyParameters<Decimal> mStrategyParameters;
    bool mVerbose;
    ProgressCallback mProgressCallback;
  };
}

#endif
