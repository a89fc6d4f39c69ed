// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <string>
#include <vector>
#include <rapidjson/document.h>
#include "number.h"
#include "BacktestResultAggregator.h"
#include "ParameterSweepRunner.h"

namespace updownbacktester
{
namespace reporting
{

using Num = num::DefaultNumber;

/**
 * @brief Writes backtest and sweep results as JSON
 *
 * Decimal values are written as JSON numbers, timestamps as ISO-8601
 * strings and values that were never recorded as null.
 */
class BacktestResultSerializer
{
public:
    /**
     * @brief Config echo, summary, trades, equity curve, window summaries
     *        and failed windows of one run
     */
    static std::string exportToJson(const mkc_updown::AggregateBacktestResult<Num>& result);

    /**
     * @brief One entry per grid point, in sweep order, each with the grid
     *        values and the run's summary
     */
    static std::string exportSweepToJson(const std::vector<mkc_updown::SweepResult<Num>>& results);

    /**
     * @throws std::runtime_error if the file cannot be written
     */
    static void saveToFile(const std::string& jsonText, const std::string& filePath);

private:
    typedef rapidjson::Document::AllocatorType Allocator;

    static rapidjson::Value serializeParameters(const mkc_updown::StrategyParameters<Num>& parameters,
                                                Allocator& allocator);
    static rapidjson::Value serializeSummary(const mkc_updown::BacktestSummary<Num>& summary,
                                             Allocator& allocator);
    static rapidjson::Value serializeTrade(const mkc_updown::SimulatedTrade<Num>& trade,
                                           Allocator& allocator);
    static rapidjson::Value serializeWindowSummary(const mkc_updown::WindowSummary<Num>& window,
                                                   Allocator& allocator);
    static rapidjson::Value serializeFailedWindow(const mkc_updown::FailedWindow& window,
                                                  Allocator& allocator);
    static void serializeResult(const mkc_updown::AggregateBacktestResult<Num>& result,
                                rapidjson::Value& json,
                                Allocator& allocator);
};

} // namespace reporting
} // namespace updownbacktester
