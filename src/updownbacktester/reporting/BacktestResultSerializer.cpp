// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "BacktestResultSerializer.h"
#include <fstream>
#include <optional>
#include <stdexcept>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "TimeUtils.h"

using namespace rapidjson;
using namespace mkc_updown;

namespace updownbacktester
{
namespace reporting
{

static Value decimalValue(const Num& value)
{
    return Value(num::to_double(value));
}

static Value optionalDecimalValue(const std::optional<Num>& value)
{
    if (!value)
        return Value(kNullType);

    return decimalValue(*value);
}

static Value timestampValue(const ptime& timestamp, Document::AllocatorType& allocator)
{
    return Value(toIsoString(timestamp).c_str(), allocator);
}

std::string BacktestResultSerializer::exportToJson(const AggregateBacktestResult<Num>& result)
{
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    serializeResult(result, doc, allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
}

std::string BacktestResultSerializer::exportSweepToJson(const std::vector<SweepResult<Num>>& results)
{
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("combinations", static_cast<uint64_t>(results.size()), allocator);

    Value runs(kArrayType);
    for (const auto& sweepResult : results)
    {
        const AggregateBacktestResult<Num>& result = sweepResult.getResult();

        Value run(kObjectType);
        run.AddMember("gridValues", serializeParameters(sweepResult.getParameters(), allocator), allocator);
        run.AddMember("strategyParameters", serializeParameters(result.getStrategyParameters(), allocator), allocator);
        run.AddMember("summary", serializeSummary(result.getSummary(), allocator), allocator);
        run.AddMember("failedWindows", static_cast<uint64_t>(result.getFailedWindows().size()), allocator);
        runs.PushBack(run, allocator);
    }
    doc.AddMember("runs", runs, allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
}

void BacktestResultSerializer::saveToFile(const std::string& jsonText, const std::string& filePath)
{
    std::ofstream file(filePath);
    if (!file.is_open())
        throw std::runtime_error("Cannot open file for writing: " + filePath);

    file << jsonText;
    if (!file)
        throw std::runtime_error("Error writing results to " + filePath);
}

void BacktestResultSerializer::serializeResult(const AggregateBacktestResult<Num>& result,
                                               Value& json,
                                               Allocator& allocator)
{
    Value config(kObjectType);
    config.AddMember("strategy", Value(result.getStrategyName().c_str(), allocator), allocator);
    config.AddMember("parameters", serializeParameters(result.getStrategyParameters(), allocator), allocator);
    config.AddMember("startingCapital", decimalValue(result.getStartingCapital()), allocator);
    if (result.getStartDate())
        config.AddMember("startDate", timestampValue(*result.getStartDate(), allocator), allocator);
    else
        config.AddMember("startDate", Value(kNullType), allocator);
    if (result.getEndDate())
        config.AddMember("endDate", timestampValue(*result.getEndDate(), allocator), allocator);
    else
        config.AddMember("endDate", Value(kNullType), allocator);
    json.AddMember("config", config, allocator);

    json.AddMember("summary", serializeSummary(result.getSummary(), allocator), allocator);
    json.AddMember("elapsedMs", static_cast<int64_t>(result.getElapsedMilliseconds()), allocator);

    Value trades(kArrayType);
    for (const auto& trade : result.getTrades())
        trades.PushBack(serializeTrade(trade, allocator), allocator);
    json.AddMember("trades", trades, allocator);

    Value equityCurve(kArrayType);
    for (const auto& capital : result.getEquityCurve())
        equityCurve.PushBack(decimalValue(capital), allocator);
    json.AddMember("equityCurve", equityCurve, allocator);

    Value windows(kArrayType);
    for (const auto& window : result.getWindowSummaries())
        windows.PushBack(serializeWindowSummary(window, allocator), allocator);
    json.AddMember("windows", windows, allocator);

    Value failed(kArrayType);
    for (const auto& window : result.getFailedWindows())
        failed.PushBack(serializeFailedWindow(window, allocator), allocator);
    json.AddMember("failedWindows", failed, allocator);
}

Value BacktestResultSerializer::serializeParameters(const StrategyParameters<Num>& parameters,
                                                    Allocator& allocator)
{
    Value json(kObjectType);
    for (auto it = parameters.beginParameters(); it != parameters.endParameters(); ++it)
        json.AddMember(Value(it->first.c_str(), allocator), decimalValue(it->second), allocator);

    return json;
}

Value BacktestResultSerializer::serializeSummary(const BacktestSummary<Num>& summary,
                                                 Allocator& allocator)
{
    Value json(kObjectType);
    json.AddMember("totalTrades", static_cast<uint64_t>(summary.getTotalTrades()), allocator);
    json.AddMember("winRate", decimalValue(summary.getWinRate()), allocator);
    json.AddMember("totalPnl", decimalValue(summary.getTotalPnl()), allocator);
    json.AddMember("returnPct", decimalValue(summary.getReturnPct()), allocator);
    json.AddMember("maxDrawdown", decimalValue(summary.getMaxDrawdown()), allocator);
    json.AddMember("finalCapital", decimalValue(summary.getFinalCapital()), allocator);
    json.AddMember("avgWin", decimalValue(summary.getAvgWin()), allocator);
    json.AddMember("avgLoss", decimalValue(summary.getAvgLoss()), allocator);
    json.AddMember("eventsProcessed", static_cast<uint64_t>(summary.getEventsProcessed()), allocator);
    json.AddMember("windowsProcessed", static_cast<uint64_t>(summary.getWindowsProcessed()), allocator);
    json.AddMember("eventFaults", static_cast<uint64_t>(summary.getEventFaults()), allocator);
    return json;
}

Value BacktestResultSerializer::serializeTrade(const SimulatedTrade<Num>& trade, Allocator& allocator)
{
    Value json(kObjectType);
    json.AddMember("token", Value(trade.getToken().c_str(), allocator), allocator);
    json.AddMember("entryTime", timestampValue(trade.getEntryTime(), allocator), allocator);
    json.AddMember("exitTime", timestampValue(trade.getExitTime(), allocator), allocator);
    json.AddMember("entryPrice", decimalValue(trade.getEntryPrice()), allocator);
    json.AddMember("exitPrice", decimalValue(trade.getExitPrice()), allocator);
    json.AddMember("size", decimalValue(trade.getSize()), allocator);
    json.AddMember("fees", decimalValue(trade.getFees()), allocator);
    json.AddMember("pnl", decimalValue(trade.getPnl()), allocator);
    json.AddMember("entryReason", Value(trade.getEntryReason().c_str(), allocator), allocator);
    json.AddMember("exitReason", Value(trade.getExitReason().c_str(), allocator), allocator);
    return json;
}

Value BacktestResultSerializer::serializeWindowSummary(const WindowSummary<Num>& window, Allocator& allocator)
{
    Value json(kObjectType);
    json.AddMember("symbol", Value(window.getSymbol().c_str(), allocator), allocator);
    json.AddMember("closeTime", timestampValue(window.getCloseTime(), allocator), allocator);
    json.AddMember("strike", optionalDecimalValue(window.getStrikePrice()), allocator);
    json.AddMember("oracleClose", optionalDecimalValue(window.getOracleClosePrice()), allocator);

    if (window.getResolvedDirection())
        json.AddMember("resolvedDirection",
                       Value(mkc_updown::toString(*window.getResolvedDirection()).c_str(), allocator),
                       allocator);
    else
        json.AddMember("resolvedDirection", Value(kNullType), allocator);

    json.AddMember("pnl", decimalValue(window.getPnl()), allocator);
    json.AddMember("trades", static_cast<uint64_t>(window.getNumTrades()), allocator);
    json.AddMember("eventsProcessed", static_cast<uint64_t>(window.getEventsProcessed()), allocator);
    json.AddMember("eventFaults", static_cast<uint64_t>(window.getNumEventFaults()), allocator);
    return json;
}

Value BacktestResultSerializer::serializeFailedWindow(const FailedWindow& window, Allocator& allocator)
{
    Value json(kObjectType);
    json.AddMember("symbol", Value(window.getSymbol().c_str(), allocator), allocator);
    json.AddMember("closeTime", timestampValue(window.getCloseTime(), allocator), allocator);
    json.AddMember("message", Value(window.getMessage().c_str(), allocator), allocator);
    return json;
}

} // namespace reporting
} // namespace updownbacktester
