// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "PerformanceReporter.h"
#include <iomanip>
#include <sstream>
#include "TimeUtils.h"

using namespace mkc_updown;

namespace updownbacktester
{
namespace reporting
{

void PerformanceReporter::writeBacktestReport(std::ostream& os,
                                              const AggregateBacktestResult<Num>& result)
{
    const BacktestSummary<Num>& summary = result.getSummary();
    const Num hundred(DecimalConstants<Num>::DecimalOneHundred);

    writeSectionHeader(os, "Backtest Performance Report");

    os << "Strategy: " << result.getStrategyName() << std::endl;
    if (!result.getStrategyParameters().empty())
        os << "Parameters: " << formatParameters(result.getStrategyParameters()) << std::endl;
    if (result.getStartDate() && result.getEndDate())
        os << "Windows: " << toIsoString(*result.getStartDate()) << " to "
           << toIsoString(*result.getEndDate()) << std::endl;

    os << "Windows Processed: " << summary.getWindowsProcessed() << std::endl;
    os << "Events Processed: " << summary.getEventsProcessed() << std::endl;
    os << "Event Faults: " << summary.getEventFaults() << std::endl;
    os << "Total Trades: " << summary.getTotalTrades() << std::endl;
    os << "Win Rate: " << num::toString(summary.getWinRate() * hundred) << "%" << std::endl;
    os << "Average Win: " << num::toString(summary.getAvgWin()) << std::endl;
    os << "Average Loss: " << num::toString(summary.getAvgLoss()) << std::endl;
    os << "Starting Capital: " << num::toString(result.getStartingCapital()) << std::endl;
    os << "Final Capital: " << num::toString(summary.getFinalCapital()) << std::endl;
    os << "Total PnL: " << num::toString(summary.getTotalPnl()) << std::endl;
    os << "Return: " << num::toString(summary.getReturnPct() * hundred) << "%" << std::endl;
    os << "Max Drawdown: " << num::toString(summary.getMaxDrawdown() * hundred) << "%" << std::endl;

    if (!result.getFailedWindows().empty())
    {
        os << "Failed Windows: " << result.getFailedWindows().size() << std::endl;
        for (const auto& failed : result.getFailedWindows())
            os << "  " << failed.getSymbol() << " @ " << toIsoString(failed.getCloseTime())
               << ": " << failed.getMessage() << std::endl;
    }

    os << "Elapsed: " << result.getElapsedMilliseconds() << " ms" << std::endl;

    writeSectionFooter(os);
    os << std::endl;
}

void PerformanceReporter::writeSweepReport(std::ostream& os,
                                           const std::vector<SweepResult<Num>>& results)
{
    writeSectionHeader(os, "Parameter Sweep Report");

    os << "Combinations: " << results.size() << std::endl;

    const SweepResult<Num>* best = nullptr;
    for (const auto& sweepResult : results)
    {
        const BacktestSummary<Num>& summary = sweepResult.getResult().getSummary();

        os << formatParameters(sweepResult.getParameters())
           << "  trades=" << summary.getTotalTrades()
           << "  winRate=" << num::toString(summary.getWinRate())
           << "  pnl=" << num::toString(summary.getTotalPnl())
           << "  maxDD=" << num::toString(summary.getMaxDrawdown()) << std::endl;

        if (!best || best->getResult().getSummary().getTotalPnl() < summary.getTotalPnl())
            best = &sweepResult;
    }

    if (best)
        os << "Best: " << formatParameters(best->getParameters())
           << " (pnl " << num::toString(best->getResult().getSummary().getTotalPnl()) << ")" << std::endl;

    writeSectionFooter(os);
    os << std::endl;
}

void PerformanceReporter::writeSectionHeader(std::ostream& os, const std::string& title)
{
    os << "=== " << title << " ===" << std::endl;
}

void PerformanceReporter::writeSectionFooter(std::ostream& os)
{
    os << "===================================" << std::endl;
}

std::string PerformanceReporter::formatParameters(const StrategyParameters<Num>& parameters)
{
    std::ostringstream formatted;
    bool first = true;

    for (auto it = parameters.beginParameters(); it != parameters.endParameters(); ++it)
    {
        if (!first)
            formatted << ", ";
        formatted << it->first << "=" << num::toString(it->second);
        first = false;
    }

    return formatted.str();
}

} // namespace reporting
} // namespace updownbacktester
