#pragma once

#include <functional>
#include <streambuf>
#include <ostream>
#include <string>

namespace updownbacktester
{
namespace utils
{

/**
 * @brief Stream buffer behind RunLogStream
 *
 * Every character goes to the console buffer unchanged. The log file buffer
 * receives the same text with "[<stamp>] " in front of each line, so a log
 * written by a long per-window run shows when each line was produced.
 */
class RunLogBuf : public std::streambuf
{
public:
    typedef std::function<std::string()> StampFunction;

    RunLogBuf(std::streambuf* console, std::streambuf* logFile, StampFunction stamp);

protected:
    int overflow(int c) override;
    std::streamsize xsputn(const char* s, std::streamsize count) override;

    /**
     * @return 0 when both buffers flushed, -1 otherwise
     */
    int sync() override;

private:
    bool writeToLog(char c);

    std::streambuf* mConsole;
    std::streambuf* mLogFile;
    StampFunction mStamp;
    bool mAtLineStart;
};

/**
 * @brief Output stream for a backtest run mirrored to the console and a log file
 */
class RunLogStream : public std::ostream
{
public:
    RunLogStream(std::ostream& console, std::ostream& logFile);

    /**
     * @param stamp produces the prefix written at the start of each log line
     */
    RunLogStream(std::ostream& console, std::ostream& logFile, RunLogBuf::StampFunction stamp);

private:
    RunLogBuf mBuf;
};

/**
 * @brief Default log file name, "<strategy>_backtest_<timestamp>.log"
 */
std::string createLogFileName(const std::string& strategyName);

} // namespace utils
} // namespace updownbacktester
