// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "number.h"
#include "DateRange.h"
#include "BacktestConfiguration.h"
#include "ParameterSweepRunner.h"
#include "CsvTickDataLoader.h"

namespace updownbacktester
{

using Num = num::DefaultNumber;

class BacktestConfigurationFileReaderException : public std::runtime_error
{
public:
    BacktestConfigurationFileReaderException(const std::string msg)
        : std::runtime_error(msg)
    {}

    ~BacktestConfigurationFileReaderException()
    {}
};

enum class DataMode { Preloaded, PerWindow };

std::string toString(DataMode mode);

/**
 * @brief Everything a run file describes
 */
class RunConfiguration
{
public:
    RunConfiguration(const std::string& strategyName,
                     const mkc_updown::BacktestConfiguration<Num>& backtestConfiguration,
                     const mkc_updown::DateRange& dateRange,
                     const TickDataFiles& dataFiles,
                     const std::vector<std::string>& symbols,
                     DataMode dataMode,
                     const mkc_updown::ParameterGrid<Num>& parameterGrid);

    const std::string& getStrategyName() const { return mStrategyName; }

    const mkc_updown::BacktestConfiguration<Num>& getBacktestConfiguration() const { return mBacktestConfiguration; }

    /// Mutable access for command line overrides
    mkc_updown::BacktestConfiguration<Num>& getBacktestConfiguration() { return mBacktestConfiguration; }

    const mkc_updown::DateRange& getDateRange() const { return mDateRange; }
    const TickDataFiles& getDataFiles() const { return mDataFiles; }

    /// Window symbols to run; empty means every symbol in the windows file
    const std::vector<std::string>& getSymbols() const { return mSymbols; }

    DataMode getDataMode() const { return mDataMode; }
    void setDataMode(DataMode mode) { mDataMode = mode; }

    const mkc_updown::ParameterGrid<Num>& getParameterGrid() const { return mParameterGrid; }

    bool isParameterSweep() const { return !mParameterGrid.getDimensions().empty(); }

private:
    std::string mStrategyName;
    mkc_updown::BacktestConfiguration<Num> mBacktestConfiguration;
    mkc_updown::DateRange mDateRange;
    TickDataFiles mDataFiles;
    std::vector<std::string> mSymbols;
    DataMode mDataMode;
    mkc_updown::ParameterGrid<Num> mParameterGrid;
};

/**
 * @brief Reads a JSON run file
 *
 * @code
 * {
 *   "strategy":  { "name": "oracle_deficit", "parameters": { "deficitThreshold": 80 } },
 *   "data":      { "windows": "windows.csv", "oracleTicks": "oracle.csv",
 *                  "bookSnapshots": "books.csv", "exchangeTicks": "exchanges.csv",
 *                  "symbols": [ "btc" ] },
 *   "dateRange": { "start": "2026-01-25T00:00:00Z", "end": "2026-01-26T00:00:00Z" },
 *   "execution": { "startingCapital": 100, "spreadBuffer": "0.005", "feeRate": 0,
 *                  "windowDurationSeconds": 300 },
 *   "run":       { "mode": "preloaded", "concurrency": 50, "perWindowConcurrencyCeiling": 10,
 *                  "failurePolicy": "abort", "verbose": false },
 *   "sweep":     { "deficitThreshold": [ 60, 80, 100 ], "maxDownPrice": [ "0.60", "0.65" ] }
 * }
 * @endcode
 *
 * strategy.name, the three required data files and dateRange must be
 * present; every other member falls back to the BacktestConfiguration
 * defaults. Decimal values may be JSON numbers or strings. Relative data
 * paths are taken relative to the run file's directory. Sweep dimensions
 * keep the order they appear in.
 */
class BacktestConfigurationFileReader
{
public:
    explicit BacktestConfigurationFileReader(const std::string& configFilePath);

    /**
     * @throws BacktestConfigurationFileReaderException if the file cannot be
     *         read or does not describe a valid run
     */
    RunConfiguration readConfigurationFile() const;

    /**
     * @brief Parse run file text; relative data paths are resolved against baseDirectory
     * @throws BacktestConfigurationFileReaderException
     */
    static RunConfiguration parseConfiguration(const std::string& jsonText,
                                               const std::string& baseDirectory = std::string());

private:
    std::string mConfigFilePath;
};

} // namespace updownbacktester
