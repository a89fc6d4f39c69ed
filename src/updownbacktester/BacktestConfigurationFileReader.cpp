// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "BacktestConfigurationFileReader.h"
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include "TimeUtils.h"

using namespace rapidjson;
using namespace mkc_updown;

namespace updownbacktester
{

static const Value& getRequiredMember(const Value& object, const char* name, const std::string& context);
static std::string readString(const Value& value, const std::string& name);
static Num readDecimal(const Value& value, const std::string& name);
static size_t readCount(const Value& value, const std::string& name);
static std::string resolveDataPath(const std::string& path, const std::string& baseDirectory);
static StrategyParameters<Num> readParameters(const Value& object);
static ParameterGrid<Num> readParameterGrid(const Value& object);
static WindowFailurePolicy readFailurePolicy(const std::string& policy);
static DataMode readDataMode(const std::string& mode);

std::string toString(DataMode mode)
{
    return (mode == DataMode::Preloaded) ? "preloaded" : "per-window";
}

RunConfiguration::RunConfiguration(const std::string& strategyName,
                                   const BacktestConfiguration<Num>& backtestConfiguration,
                                   const DateRange& dateRange,
                                   const TickDataFiles& dataFiles,
                                   const std::vector<std::string>& symbols,
                                   DataMode dataMode,
                                   const ParameterGrid<Num>& parameterGrid)
    : mStrategyName(strategyName),
      mBacktestConfiguration(backtestConfiguration),
      mDateRange(dateRange),
      mDataFiles(dataFiles),
      mSymbols(symbols),
      mDataMode(dataMode),
      mParameterGrid(parameterGrid)
{
}

BacktestConfigurationFileReader::BacktestConfigurationFileReader(const std::string& configFilePath)
    : mConfigFilePath(configFilePath)
{
}

RunConfiguration BacktestConfigurationFileReader::readConfigurationFile() const
{
    boost::filesystem::path configPath(mConfigFilePath);

    if (!boost::filesystem::exists(configPath))
        throw BacktestConfigurationFileReaderException("Run file " + configPath.string() + " does not exist");

    std::ifstream file(mConfigFilePath);
    if (!file.is_open())
        throw BacktestConfigurationFileReaderException("Cannot open run file: " + mConfigFilePath);

    std::string jsonText((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());

    return parseConfiguration(jsonText, configPath.parent_path().string());
}

RunConfiguration BacktestConfigurationFileReader::parseConfiguration(const std::string& jsonText,
                                                                     const std::string& baseDirectory)
{
    Document doc;
    doc.Parse(jsonText.c_str());

    if (doc.HasParseError())
    {
        throw BacktestConfigurationFileReaderException(
            std::string("Run file is not valid JSON: ") + GetParseError_En(doc.GetParseError()) +
            " (offset " + std::to_string(doc.GetErrorOffset()) + ")");
    }

    if (!doc.IsObject())
        throw BacktestConfigurationFileReaderException("Run file must contain a JSON object");

    // Strategy
    const Value& strategy = getRequiredMember(doc, "strategy", "run file");
    std::string strategyName = readString(getRequiredMember(strategy, "name", "strategy"), "strategy.name");

    BacktestConfiguration<Num> configuration;
    if (strategy.HasMember("parameters"))
        configuration.setStrategyParameters(readParameters(strategy["parameters"]));

    // Date range is required before any data is touched
    if (!doc.HasMember("dateRange"))
        throw BacktestConfigurationFileReaderException("Run file is missing the required dateRange");

    const Value& dateRange = doc["dateRange"];
    ptime startTime, endTime;
    try
    {
        startTime = parseIsoTimestamp(readString(getRequiredMember(dateRange, "start", "dateRange"), "dateRange.start"));
        endTime = parseIsoTimestamp(readString(getRequiredMember(dateRange, "end", "dateRange"), "dateRange.end"));
    }
    catch (const TimestampParseException& e)
    {
        throw BacktestConfigurationFileReaderException(std::string("Invalid dateRange: ") + e.what());
    }

    if (endTime < startTime)
        throw BacktestConfigurationFileReaderException("Invalid dateRange: end occurs before start");

    DateRange backtestDates(startTime, endTime);

    // Data files
    const Value& data = getRequiredMember(doc, "data", "run file");
    TickDataFiles files;
    files.windowsFile = resolveDataPath(readString(getRequiredMember(data, "windows", "data"), "data.windows"),
                                        baseDirectory);
    files.oracleTicksFile = resolveDataPath(readString(getRequiredMember(data, "oracleTicks", "data"), "data.oracleTicks"),
                                            baseDirectory);
    files.bookSnapshotsFile = resolveDataPath(readString(getRequiredMember(data, "bookSnapshots", "data"),
                                                         "data.bookSnapshots"),
                                              baseDirectory);
    if (data.HasMember("exchangeTicks"))
        files.exchangeTicksFile = resolveDataPath(readString(data["exchangeTicks"], "data.exchangeTicks"),
                                                  baseDirectory);

    std::vector<std::string> symbols;
    if (data.HasMember("symbols"))
    {
        const Value& symbolList = data["symbols"];
        if (!symbolList.IsArray())
            throw BacktestConfigurationFileReaderException("data.symbols must be an array of strings");

        for (const auto& symbol : symbolList.GetArray())
            symbols.push_back(readString(symbol, "data.symbols"));
    }

    // Execution settings
    if (doc.HasMember("execution"))
    {
        const Value& execution = doc["execution"];

        if (execution.HasMember("startingCapital"))
            configuration.setStartingCapital(readDecimal(execution["startingCapital"], "execution.startingCapital"));
        if (execution.HasMember("spreadBuffer"))
            configuration.setSpreadBuffer(readDecimal(execution["spreadBuffer"], "execution.spreadBuffer"));
        if (execution.HasMember("feeRate"))
            configuration.setFeeRate(readDecimal(execution["feeRate"], "execution.feeRate"));
        if (execution.HasMember("windowDurationSeconds"))
        {
            size_t seconds = readCount(execution["windowDurationSeconds"], "execution.windowDurationSeconds");
            configuration.setWindowDuration(boost::posix_time::seconds(static_cast<long>(seconds)));
        }
    }

    // Run settings
    DataMode mode = DataMode::Preloaded;
    if (doc.HasMember("run"))
    {
        const Value& run = doc["run"];

        if (run.HasMember("mode"))
            mode = readDataMode(readString(run["mode"], "run.mode"));
        if (run.HasMember("concurrency"))
            configuration.setConcurrency(readCount(run["concurrency"], "run.concurrency"));
        if (run.HasMember("perWindowConcurrencyCeiling"))
            configuration.setPerWindowConcurrencyCeiling(readCount(run["perWindowConcurrencyCeiling"],
                                                                   "run.perWindowConcurrencyCeiling"));
        if (run.HasMember("failurePolicy"))
            configuration.setFailurePolicy(readFailurePolicy(readString(run["failurePolicy"], "run.failurePolicy")));
        if (run.HasMember("verbose"))
        {
            if (!run["verbose"].IsBool())
                throw BacktestConfigurationFileReaderException("run.verbose must be true or false");
            configuration.setVerbose(run["verbose"].GetBool());
        }
    }

    ParameterGrid<Num> grid;
    if (doc.HasMember("sweep"))
        grid = readParameterGrid(doc["sweep"]);

    try
    {
        configuration.validate();
    }
    catch (const BacktestConfigurationException& e)
    {
        throw BacktestConfigurationFileReaderException(std::string("Invalid run settings: ") + e.what());
    }

    return RunConfiguration(strategyName, configuration, backtestDates, files, symbols, mode, grid);
}

static const Value& getRequiredMember(const Value& object, const char* name, const std::string& context)
{
    if (!object.IsObject())
        throw BacktestConfigurationFileReaderException(context + " must be a JSON object");

    if (!object.HasMember(name))
        throw BacktestConfigurationFileReaderException(context + " is missing required member " + name);

    return object[name];
}

static std::string readString(const Value& value, const std::string& name)
{
    if (!value.IsString())
        throw BacktestConfigurationFileReaderException(name + " must be a string");

    return value.GetString();
}

static Num readDecimal(const Value& value, const std::string& name)
{
    try
    {
        if (value.IsString())
            return num::fromString<Num>(value.GetString());

        if (value.IsInt64())
            return num::fromString<Num>(std::to_string(value.GetInt64()));

        if (value.IsNumber())
        {
            // fixed notation so the decimal parser never sees an exponent
            std::ostringstream formatted;
            formatted << std::fixed << std::setprecision(10) << value.GetDouble();
            return num::fromString<Num>(formatted.str());
        }
    }
    catch (const std::exception& e)
    {
        throw BacktestConfigurationFileReaderException(name + " is not a valid number: " + e.what());
    }

    throw BacktestConfigurationFileReaderException(name + " must be a number or a numeric string");
}

static size_t readCount(const Value& value, const std::string& name)
{
    if (!value.IsUint64())
        throw BacktestConfigurationFileReaderException(name + " must be a non-negative integer");

    return static_cast<size_t>(value.GetUint64());
}

static std::string resolveDataPath(const std::string& path, const std::string& baseDirectory)
{
    boost::filesystem::path dataPath(path);

    if (dataPath.is_relative() && !baseDirectory.empty())
        dataPath = boost::filesystem::path(baseDirectory) / dataPath;

    return dataPath.string();
}

static StrategyParameters<Num> readParameters(const Value& object)
{
    if (!object.IsObject())
        throw BacktestConfigurationFileReaderException("strategy.parameters must be a JSON object");

    StrategyParameters<Num> parameters;
    for (auto it = object.MemberBegin(); it != object.MemberEnd(); ++it)
    {
        std::string name = it->name.GetString();
        parameters.setParameter(name, readDecimal(it->value, "strategy.parameters." + name));
    }

    return parameters;
}

static ParameterGrid<Num> readParameterGrid(const Value& object)
{
    if (!object.IsObject())
        throw BacktestConfigurationFileReaderException("sweep must be a JSON object");

    ParameterGrid<Num> grid;
    for (auto it = object.MemberBegin(); it != object.MemberEnd(); ++it)
    {
        std::string name = it->name.GetString();
        if (!it->value.IsArray() || it->value.Empty())
            throw BacktestConfigurationFileReaderException("sweep." + name + " must be a non-empty array");

        std::vector<Num> values;
        for (const auto& value : it->value.GetArray())
            values.push_back(readDecimal(value, "sweep." + name));

        try
        {
            grid.addDimension(name, values);
        }
        catch (const StrategyParameterException& e)
        {
            throw BacktestConfigurationFileReaderException(e.what());
        }
    }

    return grid;
}

static WindowFailurePolicy readFailurePolicy(const std::string& policy)
{
    std::string value = boost::algorithm::to_lower_copy(policy);

    if (value == "abort")
        return WindowFailurePolicy::AbortBatch;
    if (value == "skip")
        return WindowFailurePolicy::SkipWindow;

    throw BacktestConfigurationFileReaderException("Unknown failure policy: " + policy + " (expected abort or skip)");
}

static DataMode readDataMode(const std::string& mode)
{
    std::string value = boost::algorithm::to_lower_copy(mode);

    if (value == "preloaded")
        return DataMode::Preloaded;
    if (value == "per-window")
        return DataMode::PerWindow;

    throw BacktestConfigurationFileReaderException("Unknown data mode: " + mode + " (expected preloaded or per-window)");
}

} // namespace updownbacktester
