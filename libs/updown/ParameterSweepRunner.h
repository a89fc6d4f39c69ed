// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PARAMETER_SWEEP_RUNNER_H
#define __PARAMETER_SWEEP_RUNNER_H 1

#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "BacktestConfiguration.h"
#include "BacktestResultAggregator.h"
#include "BinaryWindow.h"
#include "ParallelBacktester.h"
#include "StrategyParameters.h"
#include "WindowDataSource.h"
#include "WindowStrategy.h"

namespace mkc_updown
{
  /**
   * @class ParameterGrid
   * @brief Named parameter dimensions whose Cartesian product a sweep runs.
   *
   * Dimensions keep the order they were added in. Enumeration starts from
   * the single empty combination and folds in one dimension at a time, so
   * the last dimension varies fastest. A grid without dimensions has exactly
   * one (empty) combination; a dimension without values leaves none.
   */
  template <class Decimal>
  class ParameterGrid
  {
  public:
    typedef std::pair<std::string, std::vector<Decimal>> Dimension;

    ParameterGrid()
      : mDimensions()
    {}

    /**
     * @throws StrategyParameterException if the dimension already exists
     */
    void addDimension(const std::string& name, const std::vector<Decimal>& values)
    {
      for (const auto& dimension : mDimensions)
	if (dimension.first == name)
	  throw StrategyParameterException("ParameterGrid::addDimension - duplicate dimension " + name);

      mDimensions.push_back(std::make_pair(name, values));
    }

    const std::vector<Dimension>& getDimensions() const
    {
      return mDimensions;
    }

    std::size_t getNumCombinations() const
    {
      std::size_t count = 1;
      for (const auto& dimension : mDimensions)
	count *= dimension.second.size();

      return count;
    }

    std::vector<StrategyParameters<Decimal>> enumerate() const
    {
      std::vector<StrategyParameters<Decimal>> combinations(1);

      for (const auto& dimension : mDimensions)
	{
	  std::vector<StrategyParameters<Decimal>> extended;
	  extended.reserve(combinations.size() * dimension.second.size());

	  for (const auto& combination : combinations)
	    for (const auto& value : dimension.second)
	      {
		StrategyParameters<Decimal> next(combination);
		next.setParameter(dimension.first, value);
		extended.push_back(next);
	      }

	  combinations.swap(extended);
	}

      return combinations;
    }

  private:
    std::vector<Dimension> mDimensions;
  };

  template <class Decimal>
  class SweepResult
  {
  public:
    SweepResult(const StrategyParameters<Decimal>& parameters,
		const AggregateBacktestResult<Decimal>& result)
      : mParameters(parameters),
	mResult(result)
    {}

    /**
     * @brief The grid point this run used (grid values only).
     */
    const StrategyParameters<Decimal>& getParameters() const
    {
      return mParameters;
    }

    const AggregateBacktestResult<Decimal>& getResult() const
    {
      return mResult;
    }

  private:
    StrategyParameters<Decimal> mParameters;
    AggregateBacktestResult<Decimal> mResult;
  };

  /**
   * @class ParameterSweepRunner
   * @brief Runs one backtest per grid point, one after the other.
   *
   * Each run uses the base configuration with the grid point merged over its
   * strategy parameters. Only the windows of a run execute in parallel; the
   * runs themselves are sequential. The same data source (and so the same
   * preloaded dataset) serves every run.
   */
  template <class Decimal>
  class ParameterSweepRunner
  {
  public:
    typedef std::function<void(std::size_t completed, std::size_t total)> SweepProgressCallback;

    /**
     * @throws BacktestConfigurationException for an invalid base configuration
     * @throws WindowStrategyException for a null or invalid strategy
     */
    ParameterSweepRunner(std::shared_ptr<WindowStrategy<Decimal>> strategy,
			 const BacktestConfiguration<Decimal>& baseConfiguration,
			 const ParameterGrid<Decimal>& grid,
			 std::ostream& log = std::cout)
      : mStrategy(strategy),
	mBaseConfiguration(baseConfiguration),
	mGrid(grid),
	mLog(log)
    {
      mBaseConfiguration.validate();

      if (!mStrategy)
	throw WindowStrategyException("ParameterSweepRunner: strategy cannot be null");

      mStrategy->validate();
    }

    std::vector<SweepResult<Decimal>> run(const std::vector<BinaryWindow<Decimal>>& windows,
					  const WindowDataSource<Decimal>& dataSource,
					  const SweepProgressCallback& onSweepProgress = SweepProgressCallback()) const
    {
      std::vector<StrategyParameters<Decimal>> combinations = mGrid.enumerate();
      std::vector<SweepResult<Decimal>> results;
      results.reserve(combinations.size());

      if (mBaseConfiguration.isVerbose())
	mLog << "Parameter sweep of " << mStrategy->getStrategyName() << ": "
	     << combinations.size() << " combinations" << std::endl;

      for (std::size_t i = 0; i < combinations.size(); ++i)
	{
	  BacktestConfiguration<Decimal> configuration(mBaseConfiguration);
	  configuration.setStrategyParameters(mBaseConfiguration.getStrategyParameters().merge(combinations[i]));

	  ParallelBacktester<Decimal> backtester(mStrategy, configuration, mLog);
	  results.push_back(SweepResult<Decimal>(combinations[i], backtester.run(windows, dataSource)));

	  if (onSweepProgress)
	    onSweepProgress(i + 1, combinations.size());
	}

      return results;
    }

    std::vector<SweepResult<Decimal>> runPreloaded(const std::vector<BinaryWindow<Decimal>>& windows,
						   std::shared_ptr<const BacktestDataset<Decimal>> dataset,
						   const SweepProgressCallback& onSweepProgress = SweepProgressCallback()) const
    {
      PreloadedWindowDataSource<Decimal> dataSource(dataset);
      return run(windows, dataSource, onSweepProgress);
    }

    std::vector<SweepResult<Decimal>> runPerWindow(const std::vector<BinaryWindow<Decimal>>& windows,
						   std::shared_ptr<const WindowTickLoader<Decimal>> loader,
						   const SweepProgressCallback& onSweepProgress = SweepProgressCallback()) const
    {
      PerWindowDataSource<Decimal> dataSource(loader, mBaseConfiguration.getPerWindowConcurrencyCeiling());
      return run(windows, dataSource, onSweepProgress);
    }

  private:
    std::shared_ptr<WindowStrategy<Decimal>> mStrategy;
    BacktestConfiguration<Decimal> mBaseConfiguration;
    ParameterGrid<Decimal> mGrid;
    std::ostream& mLog;
  };
}

#endif
