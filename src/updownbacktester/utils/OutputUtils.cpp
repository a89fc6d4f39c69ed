#include "OutputUtils.h"
#include "TimeUtils.h"
#include <boost/algorithm/string.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <utility>

namespace updownbacktester
{
namespace utils
{

static std::string currentUtcStamp()
{
    return mkc_updown::toIsoString(boost::posix_time::second_clock::universal_time());
}

RunLogBuf::RunLogBuf(std::streambuf* console, std::streambuf* logFile, StampFunction stamp)
    : mConsole(console),
      mLogFile(logFile),
      mStamp(stamp ? std::move(stamp) : StampFunction(currentUtcStamp)),
      mAtLineStart(true)
{
}

bool RunLogBuf::writeToLog(char c)
{
    if (mAtLineStart)
    {
        std::string prefix = "[" + mStamp() + "] ";
        std::streamsize length = static_cast<std::streamsize>(prefix.size());
        if (mLogFile->sputn(prefix.data(), length) != length)
            return false;
        mAtLineStart = false;
    }

    if (mLogFile->sputc(c) == traits_type::eof())
        return false;

    if (c == '\n')
        mAtLineStart = true;

    return true;
}

int RunLogBuf::overflow(int c)
{
    if (traits_type::eq_int_type(c, traits_type::eof()))
        return traits_type::not_eof(c);

    const char ch = traits_type::to_char_type(c);
    const bool consoleOk = mConsole->sputc(ch) != traits_type::eof();
    const bool logOk = writeToLog(ch);

    return (consoleOk && logOk) ? c : traits_type::eof();
}

std::streamsize RunLogBuf::xsputn(const char* s, std::streamsize count)
{
    const std::streamsize written = mConsole->sputn(s, count);

    for (std::streamsize i = 0; i < written; ++i)
    {
        if (!writeToLog(s[i]))
            return i;
    }

    return written;
}

int RunLogBuf::sync()
{
    const int consoleResult = mConsole->pubsync();
    const int logResult = mLogFile->pubsync();
    return (consoleResult == 0 && logResult == 0) ? 0 : -1;
}

RunLogStream::RunLogStream(std::ostream& console, std::ostream& logFile)
    : RunLogStream(console, logFile, RunLogBuf::StampFunction())
{
}

RunLogStream::RunLogStream(std::ostream& console, std::ostream& logFile, RunLogBuf::StampFunction stamp)
    : std::ostream(nullptr),
      mBuf(console.rdbuf(), logFile.rdbuf(), std::move(stamp))
{
    this->rdbuf(&mBuf);
}

std::string createLogFileName(const std::string& strategyName)
{
    std::string name = boost::algorithm::trim_copy(strategyName);
    boost::algorithm::replace_all(name, " ", "_");
    if (name.empty())
        name = "updown";

    return name + "_backtest_" + mkc_updown::getCurrentTimestamp() + ".log";
}

} // namespace utils
} // namespace updownbacktester
