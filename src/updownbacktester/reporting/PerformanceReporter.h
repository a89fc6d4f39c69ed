// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "number.h"
#include "BacktestResultAggregator.h"
#include "ParameterSweepRunner.h"

namespace updownbacktester
{
namespace reporting
{

using Num = num::DefaultNumber;

/**
 * @brief Human readable summaries of backtest and sweep results
 */
class PerformanceReporter
{
public:
    /**
     * @brief Write the summary block of one run
     * @param os Stream to write to
     * @param result Aggregated run result
     */
    static void writeBacktestReport(std::ostream& os,
                                    const mkc_updown::AggregateBacktestResult<Num>& result);

    /**
     * @brief One line per grid point, in sweep order, followed by the best
     *        point by total pnl
     */
    static void writeSweepReport(std::ostream& os,
                                 const std::vector<mkc_updown::SweepResult<Num>>& results);

private:
    static void writeSectionHeader(std::ostream& os, const std::string& title);
    static void writeSectionFooter(std::ostream& os);
    static std::string formatParameters(const mkc_updown::StrategyParameters<Num>& parameters);
};

} // namespace reporting
} // namespace updownbacktester
