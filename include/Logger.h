#pragma once

#include <array>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERR = 4,     // ERR rather than ERROR to avoid clashing with system macros
    NONE = 5     // No logging
};

/**
 * Process-wide diagnostic logger.
 *
 * Stdout carries the summary document, so console output defaults to stderr.
 * Lines are written as "[LEVEL] message" to the console stream and, when
 * configured, appended to a log file. Emitted messages are counted per level
 * so the driver can report how many warnings a run produced.
 */
class Logger {
public:
    static Logger& getInstance();

    // Resets level, sinks and counters. An unopenable log file is reported and skipped.
    void init(LogLevel level = LogLevel::INFO, bool enableConsoleLogging = true, const std::string& logFilePath = "");

    void setLogLevel(LogLevel level);

    // Redirects console output; the stream must outlive its use by the logger
    void setConsoleStream(std::ostream& stream);

    bool isEnabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message);

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Number of messages emitted at level since the last init()
    size_t messageCount(LogLevel level) const;

    void close();

    ~Logger();

    LogLevel getLogLevel() const {
        return logLevel;
    }

    // Parses "trace", "debug", "info", "warning"/"warn", "error", "none"/"off" (case-insensitive)
    static std::optional<LogLevel> parseLevel(std::string_view name);

    static const char* levelName(LogLevel level);

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel logLevel;
    bool logToConsole;
    std::ostream* console;
    std::ofstream logFile;
    std::array<size_t, 5> counts{};
    mutable std::mutex mutex;
};

// Convenience macros for logging
#define LOG_TRACE(message) Logger::getInstance().trace(message)
#define LOG_DEBUG(message) Logger::getInstance().debug(message)
#define LOG_INFO(message) Logger::getInstance().info(message)
#define LOG_WARNING(message) Logger::getInstance().warning(message)
#define LOG_ERROR(message) Logger::getInstance().error(message)

// Stream-style logging macros; the message is only formatted when the level is enabled
#define LOG_TRACE_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::TRACE)) { std::stringstream ss; ss << message; Logger::getInstance().trace(ss.str()); } }
#define LOG_DEBUG_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::DEBUG)) { std::stringstream ss; ss << message; Logger::getInstance().debug(ss.str()); } }
#define LOG_INFO_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::INFO)) { std::stringstream ss; ss << message; Logger::getInstance().info(ss.str()); } }
#define LOG_WARNING_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::WARNING)) { std::stringstream ss; ss << message; Logger::getInstance().warning(ss.str()); } }
#define LOG_ERROR_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::ERR)) { std::stringstream ss; ss << message; Logger::getInstance().error(ss.str()); } }
