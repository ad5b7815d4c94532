#include "Logger.hpp"
#include <iomanip>
#include <ctime>

/**
 * @file Logger.cpp
 * @brief Implementation of the thread-safe logging system.
 */

Logger& Logger::Instance()
{
    // Function-local static: initialized once, thread-safe since C++11
    static Logger instance;
    return instance;
}

void Logger::SetMinLevel(Level level)
{
    std::lock_guard<std::mutex> lock(mMutex);
    mMinLevel = level;
}

Logger::Level Logger::GetMinLevel() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    return mMinLevel;
}

void Logger::SetOutput(std::ostream* stream)
{
    std::lock_guard<std::mutex> lock(mMutex);
    mOutput = stream;
}

void Logger::Log(Level level, const std::string& tag, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mMutex);

    if (mOutput == nullptr || static_cast<int>(level) < static_cast<int>(mMinLevel))
        return;

    // Format: "HH:MM:SS.mmm [LVL][TAG] message"
    // Example: "14:23:45.123 [INF][ConnectionManager] State: Connecting -> Connected"
    *mOutput << GetTimestamp() << " [" << GetLevelStr(level) << "][" << tag << "] "
             << message << "\n";
    mOutput->flush();
}

void Logger::Debug(const std::string& tag, const std::string& message)
{
    Log(Level::Debug, tag, message);
}

void Logger::Info(const std::string& tag, const std::string& message)
{
    Log(Level::Info, tag, message);
}

void Logger::Warning(const std::string& tag, const std::string& message)
{
    Log(Level::Warning, tag, message);
}

void Logger::Error(const std::string& tag, const std::string& message)
{
    Log(Level::Error, tag, message);
}

std::string Logger::GetTimestamp() const
{
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    struct tm timeInfo;
    localtime_r(&time, &timeInfo);

    std::stringstream ss;
    ss << std::put_time(&timeInfo, "%H:%M:%S")
       << "."
       << std::setfill('0')
       << std::setw(3)
       << ms.count();

    return ss.str();
}

std::string Logger::GetLevelStr(Level level) const
{
    switch (level)
    {
    case Level::Debug:
        return "DBG";
    case Level::Info:
        return "INF";
    case Level::Warning:
        return "WRN";
    case Level::Error:
        return "ERR";
    default:
        return "???";
    }
}
