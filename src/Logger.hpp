#pragma once

#include <string>
#include <mutex>
#include <iostream>
#include <sstream>
#include <chrono>

/**
 * @class Logger
 * @brief Thread-safe singleton logging system for the chat transport.
 *
 * All components of the client log through this class with a component tag, so a
 * single line tells which layer produced it. Log lines from the event loop thread
 * and the IXWebSocket thread never interleave.
 *
 * Features:
 * - Thread-safe output via mutex protection
 * - Multiple severity levels (Debug, Info, Warning, Error) with a minimum level filter
 * - Timestamps with millisecond precision
 * - Tag-based categorization (e.g., "[DBG][ConnectionManager]")
 * - Redirectable output stream (tests point it at a string stream or silence it)
 *
 * @example
 *   Logger::Instance().Info("ChatClient", "Connecting to " + url);
 *   Logger::Instance().Error("StompFrame", "Missing NUL terminator");
 */
class Logger
{
public:
    /**
     * @enum Level
     * @brief Severity levels for log messages, lowest first.
     */
    enum class Level
    {
        Debug,      ///< Frame-level tracing (sent/received frames, heartbeats)
        Info,       ///< Connection lifecycle
        Warning,    ///< Recoverable anomalies (dropped payloads, caller misuse)
        Error       ///< Failures that change connection state
    };

    /**
     * @brief Get the singleton Logger instance.
     *
     * @return Reference to the process-wide Logger
     */
    static Logger& Instance();

    /**
     * @brief Set the minimum log level to display.
     *
     * Messages below this level are discarded before formatting.
     *
     * @param level Minimum level to display (Debug shows all, Error shows only errors)
     */
    void SetMinLevel(Level level);

    /// @brief Current minimum level.
    Level GetMinLevel() const;

    /**
     * @brief Redirect log output.
     *
     * @param stream Destination stream, or nullptr to discard all output.
     *               The stream must outlive every later log call.
     */
    void SetOutput(std::ostream* stream);

    /**
     * @brief Log a message with specified severity level and tag.
     *
     * @param level The severity level
     * @param tag A component tag (e.g., "Transport", "Dispatcher")
     * @param message The message content to log
     */
    void Log(Level level, const std::string& tag, const std::string& message);

    /// @brief Log a debug message.
    void Debug(const std::string& tag, const std::string& message);

    /// @brief Log an informational message.
    void Info(const std::string& tag, const std::string& message);

    /// @brief Log a warning message.
    void Warning(const std::string& tag, const std::string& message);

    /// @brief Log an error message.
    void Error(const std::string& tag, const std::string& message);

private:
    Logger() = default;
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /// @brief Mutex protecting the output stream and settings
    mutable std::mutex mMutex;

    /// @brief Minimum log level to display (messages below this are ignored)
    Level mMinLevel = Level::Debug;

    /// @brief Output stream, std::cout unless redirected
    std::ostream* mOutput = &std::cout;

    /**
     * @brief Generate current local time as "HH:MM:SS.mmm".
     */
    std::string GetTimestamp() const;

    /**
     * @brief Convert severity level to its 3-letter form ("DBG", "INF", "WRN", "ERR").
     */
    std::string GetLevelStr(Level level) const;
};
