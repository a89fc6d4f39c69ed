// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __WINDOW_EVALUATOR_H
#define __WINDOW_EVALUATOR_H 1

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BacktestConfiguration.h"
#include "BinaryWindow.h"
#include "ExecutionSimulator.h"
#include "GroundTruthResolver.h"
#include "MarketEvents.h"
#include "WindowMarketState.h"
#include "WindowResult.h"
#include "WindowStrategy.h"

namespace mkc_updown
{
  using boost::posix_time::ptime;

  /**
   * @class WindowEvaluator
   * @brief Replays one window's timeline through a strategy and an execution ledger.
   *
   * Every call to evaluate() builds its own strategy instance (a clone of the
   * prototype), market state and execution simulator and discards them when it
   * returns, so one evaluator may be used by many threads at once and no two
   * windows ever share mutable state.
   *
   * Evaluation of a window:
   *   - open: set the window on the state, call the strategy's open hook and
   *     resolve the ground truth (an unresolved window is not settled)
   *   - replay: each event with open <= timestamp < close, in timeline order,
   *     updates the state and the time to close and is then passed to the
   *     strategy. Executable signals are sent to the simulator and booked when
   *     filled. A failure in the strategy or execution step is recorded as an
   *     event fault and replay moves on to the next event.
   *   - settle: open lots are paid out on the realized direction
   *   - close: the strategy's close hook gets the window summary
   *
   * The result is a function of the window, timeline, strategy and settings
   * only.
   */
  template <class Decimal>
  class WindowEvaluator
  {
  public:
    typedef std::function<std::unique_ptr<ExecutionSimulator<Decimal>>(const ExecutionSettings<Decimal>&)> SimulatorFactory;

    /**
     * @param strategyPrototype strategy cloned for every window
     * @param configuration     capital, spread, fee, duration and parameters
     * @param simulatorFactory  creates the per-window ledger; BinaryExecutionSimulator when empty
     * @throws WindowStrategyException if the prototype is null or fails validation
     */
    WindowEvaluator(std::shared_ptr<WindowStrategy<Decimal>> strategyPrototype,
		    const BacktestConfiguration<Decimal>& configuration,
		    SimulatorFactory simulatorFactory = SimulatorFactory())
      : mStrategyPrototype(strategyPrototype),
	mExecutionSettings(configuration.getExecutionSettings()),
	mWindowDuration(configuration.getWindowDuration()),
	mParameters(),
	mSimulatorFactory(std::move(simulatorFactory))
    {
      if (!mStrategyPrototype)
	throw WindowStrategyException("WindowEvaluator: strategy cannot be null");

      mStrategyPrototype->validate();
      mParameters = mStrategyPrototype->getDefaultParameters().merge(configuration.getStrategyParameters());

      if (!mSimulatorFactory)
	mSimulatorFactory = [](const ExecutionSettings<Decimal>& settings) {
	  return std::unique_ptr<ExecutionSimulator<Decimal>>(std::make_unique<BinaryExecutionSimulator<Decimal>>(settings));
	};
    }

    /**
     * @brief Strategy defaults overlaid with the configured parameters.
     */
    const StrategyParameters<Decimal>& getEffectiveParameters() const
    {
      return mParameters;
    }

    /**
     * @param window   the window to evaluate
     * @param timeline the window's events in ascending timestamp order
     * @throws any exception raised by the strategy's open or close hook
     */
    WindowResult<Decimal> evaluate(const BinaryWindow<Decimal>& window,
				   const std::vector<TimelineEvent<Decimal>>& timeline) const
    {
      const ptime openTime = window.getOpenTime(mWindowDuration);
      const ptime& closeTime = window.getCloseTime();

      std::shared_ptr<WindowStrategy<Decimal>> strategy = mStrategyPrototype->clone();
      std::unique_ptr<ExecutionSimulator<Decimal>> simulator = mSimulatorFactory(mExecutionSettings);
      WindowMarketState<Decimal> state;

      state.setWindow(window, openTime);
      strategy->onWindowOpen(state, mParameters);

      std::optional<GroundTruth> groundTruth = GroundTruthResolver<Decimal>::resolve(window);
      unsigned long eventsProcessed = 0;
      std::vector<EventOutcome> eventFaults;

      for (const auto& event : timeline)
	{
	  const ptime& eventTime = event.getTimestamp();

	  if (eventTime < openTime || eventTime >= closeTime)
	    continue;

	  state.processEvent(event);
	  state.updateTimeToClose(eventTime);
	  eventsProcessed++;

	  EventOutcome outcome = evaluateEvent(*strategy, *simulator, state, eventTime);
	  if (!outcome.isOk())
	    eventFaults.push_back(outcome);
	}

      std::optional<OutcomeDirection> direction;
      if (groundTruth)
	{
	  direction = groundTruth->getDirection();
	  simulator->resolveWindow(*direction, closeTime);
	}

      SimulatorStats<Decimal> stats = simulator->getStats();

      strategy->onWindowClose(state,
			      WindowCloseSummary<Decimal>(closeTime,
							  window.getSymbol(),
							  window.getStrikePrice(),
							  window.getOracleClosePrice(),
							  direction,
							  stats.getTotalPnl(),
							  stats.getTradeCount()),
			      mParameters);

      return WindowResult<Decimal>(window,
				   openTime,
				   groundTruth,
				   stats,
				   simulator->getTrades(),
				   simulator->getEquityCurve(),
				   eventsProcessed,
				   eventFaults);
    }

  private:
    EventOutcome evaluateEvent(WindowStrategy<Decimal>& strategy,
			       ExecutionSimulator<Decimal>& simulator,
			       const WindowMarketState<Decimal>& state,
			       const ptime& eventTime) const
    {
      try
	{
	  std::vector<TradeSignal<Decimal>> signals = strategy.evaluate(state, mParameters);

	  for (const auto& signal : signals)
	    {
	      if (!signal.isExecutable())
		continue;

	      ExecutionDecision<Decimal> decision = simulator.execute(signal, state, mParameters);
	      if (!decision.isFilled())
		continue;

	      if (signal.getAction() == SignalAction::Buy)
		simulator.buyToken(signal.getToken(),
				   decision.getFillPrice(),
				   decision.getFillSize(),
				   eventTime,
				   signal.getReason());
	      else
		simulator.sellToken(signal.getToken(),
				    decision.getFillPrice(),
				    decision.getFillSize(),
				    eventTime,
				    signal.getReason().empty() ? StrategySellExitReason : signal.getReason());
	    }

	  return EventOutcome::ok(eventTime);
	}
      catch (const std::exception& e)
	{
	  return EventOutcome::fault(eventTime, e.what());
	}
      catch (...)
	{
	  return EventOutcome::fault(eventTime, "unknown exception");
	}
    }

  private:
    std::shared_ptr<WindowStrategy<Decimal>> mStrategyPrototype;
    ExecutionSettings<Decimal> mExecutionSettings;
    time_duration mWindowDuration;
    StrategyParameters<Decimal> mParameters;
    SimulatorFactory mSimulatorFactory;
  };
}

#endif
