// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include "number.h"
#include "TimeUtils.h"
#include "ParallelBacktester.h"
#include "ParameterSweepRunner.h"
#include "BacktestConfigurationFileReader.h"
#include "CsvTickDataLoader.h"
#include "StrategyRegistry.h"
#include "utils/OutputUtils.h"
#include "reporting/BacktestResultSerializer.h"
#include "reporting/PerformanceReporter.h"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

using namespace mkc_updown;
using namespace updownbacktester;
using updownbacktester::reporting::BacktestResultSerializer;
using updownbacktester::reporting::PerformanceReporter;

void printUsage(const po::options_description& desc)
{
    std::cout << "Up/Down Window Backtester - replay binary up/down markets window by window\n\n";
    std::cout << "Usage: updownbacktester --config <run file> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Backtest with the data preloaded for the whole date range\n";
    std::cout << "  updownbacktester --config runs/btc_jan.json --output btc_jan_results.json\n\n";
    std::cout << "  # Fetch each window's ticks when it runs\n";
    std::cout << "  updownbacktester --config runs/btc_jan.json --per-window\n\n";
    std::cout << "  # Verbose run mirrored to a log file\n";
    std::cout << "  updownbacktester --config runs/btc_jan.json --verbose --log btc_jan.log\n";
}

// Reports every tenth of the run, and the last window
static BacktestConfiguration<Num>::ProgressCallback createProgressCallback(std::ostream& log)
{
    return [&log](std::size_t completed, std::size_t total) {
        std::size_t step = (total >= 10) ? total / 10 : 1;
        if (completed % step == 0 || completed == total)
            log << "  completed " << completed << " / " << total << " windows" << std::endl;
    };
}

static int runBacktest(const RunConfiguration& runConfiguration,
                       std::shared_ptr<WindowStrategy<Num>> strategy,
                       const std::string& outputPath,
                       std::ostream& log)
{
    const BacktestConfiguration<Num>& configuration = runConfiguration.getBacktestConfiguration();

    auto loader = std::make_shared<CsvTickDataLoader<Num>>(runConfiguration.getDataFiles(),
                                                           runConfiguration.getDateRange(),
                                                           configuration.getWindowDuration(),
                                                           runConfiguration.getSymbols());

    std::vector<BinaryWindow<Num>> windows = loader->readWindows();
    log << "Loaded " << windows.size() << " windows between "
        << toIsoString(runConfiguration.getDateRange().getFirstDateTime()) << " and "
        << toIsoString(runConfiguration.getDateRange().getLastDateTime()) << std::endl;

    if (windows.empty())
    {
        std::cerr << "Error: no windows close inside the date range" << std::endl;
        return 1;
    }

    std::shared_ptr<const BacktestDataset<Num>> dataset;
    if (runConfiguration.getDataMode() == DataMode::Preloaded)
    {
        dataset = loader->readDataset();
        log << "Preloaded " << dataset->getNumTicks() << " ticks" << std::endl;
    }

    std::string json;

    if (runConfiguration.isParameterSweep())
    {
        ParameterSweepRunner<Num> runner(strategy, configuration, runConfiguration.getParameterGrid(), log);
        log << "Running " << runConfiguration.getParameterGrid().getNumCombinations()
            << " parameter combinations (" << toString(runConfiguration.getDataMode()) << ")" << std::endl;

        auto onSweepProgress = [&log](std::size_t completed, std::size_t total) {
            log << "Combination " << completed << " / " << total << " done" << std::endl;
        };

        std::vector<SweepResult<Num>> results = dataset
            ? runner.runPreloaded(windows, dataset, onSweepProgress)
            : runner.runPerWindow(windows, loader, onSweepProgress);

        PerformanceReporter::writeSweepReport(log, results);
        json = BacktestResultSerializer::exportSweepToJson(results);
    }
    else
    {
        ParallelBacktester<Num> backtester(strategy, configuration, log);
        log << "Running " << strategy->getStrategyName() << " over " << windows.size()
            << " windows (" << toString(runConfiguration.getDataMode()) << ")" << std::endl;

        AggregateBacktestResult<Num> result = dataset
            ? backtester.runPreloaded(windows, dataset)
            : backtester.runPerWindow(windows, loader);

        PerformanceReporter::writeBacktestReport(log, result);
        json = BacktestResultSerializer::exportToJson(result);
    }

    if (!outputPath.empty())
    {
        BacktestResultSerializer::saveToFile(json, outputPath);
        log << "Results written to " << outputPath << std::endl;
    }

    return 0;
}

int main(int argc, char** argv)
{
    try
    {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show this help message")
            ("config,c", po::value<std::string>(), "JSON run file")
            ("per-window", "Fetch each window's ticks when it runs instead of preloading the date range")
            ("concurrency,n", po::value<std::size_t>(), "Windows evaluated at the same time (overrides the run file)")
            ("output,o", po::value<std::string>(), "Write the results as JSON to this file")
            ("log,l", po::value<std::string>(), "Mirror console output to this log file")
            ("verbose,v", "Report progress while the backtest runs")
            ("list-strategies", "List the built-in strategies");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        StrategyRegistry registry = StrategyRegistry::createDefaultRegistry();

        if (vm.count("help"))
        {
            printUsage(desc);
            return 0;
        }

        if (vm.count("list-strategies"))
        {
            for (const auto& name : registry.getAvailableStrategies())
                std::cout << name << std::endl;
            return 0;
        }

        if (!vm.count("config"))
        {
            std::cerr << "Error: --config is required" << std::endl;
            printUsage(desc);
            return 1;
        }

        BacktestConfigurationFileReader reader(vm["config"].as<std::string>());
        RunConfiguration runConfiguration = reader.readConfigurationFile();

        BacktestConfiguration<Num>& configuration = runConfiguration.getBacktestConfiguration();
        if (vm.count("per-window"))
            runConfiguration.setDataMode(DataMode::PerWindow);
        if (vm.count("concurrency"))
            configuration.setConcurrency(vm["concurrency"].as<std::size_t>());
        if (vm.count("verbose"))
            configuration.setVerbose(true);

        if (!registry.isStrategyAvailable(runConfiguration.getStrategyName()))
        {
            std::cerr << "Error: unknown strategy " << runConfiguration.getStrategyName() << std::endl;
            return 1;
        }

        std::shared_ptr<WindowStrategy<Num>> strategy = registry.createStrategy(runConfiguration.getStrategyName());
        std::string outputPath = vm.count("output") ? vm["output"].as<std::string>() : std::string();

        if (vm.count("log"))
        {
            std::string logPath = vm["log"].as<std::string>();
            if (fs::is_directory(logPath))
                logPath = (fs::path(logPath) / utils::createLogFileName(strategy->getStrategyName())).string();

            std::ofstream logFile(logPath);
            if (!logFile.is_open())
            {
                std::cerr << "Error: cannot open log file " << logPath << std::endl;
                return 1;
            }

            utils::RunLogStream log(std::cout, logFile);
            if (configuration.isVerbose())
                configuration.setProgressCallback(createProgressCallback(log));

            return runBacktest(runConfiguration, strategy, outputPath, log);
        }

        if (configuration.isVerbose())
            configuration.setProgressCallback(createProgressCallback(std::cout));

        return runBacktest(runConfiguration, strategy, outputPath, std::cout);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
