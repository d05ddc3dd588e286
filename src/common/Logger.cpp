#include "../../include/Logger.h"
#include <cctype>
#include <iostream>

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : logLevel(LogLevel::INFO), logToConsole(true), console(&std::cerr) {
}

Logger::~Logger() {
    close();
}

void Logger::init(LogLevel level, bool enableConsoleLogging, const std::string& logFilePath) {
    std::lock_guard<std::mutex> lock(mutex);
    logLevel = level;
    logToConsole = enableConsoleLogging;
    counts.fill(0);

    if (logFile.is_open()) {
        logFile.close();
    }
    if (logFilePath.empty()) {
        return;
    }

    logFile.open(logFilePath, std::ios::out | std::ios::app);
    if (!logFile.is_open()) {
        *console << "[WARN] Could not open log file " << logFilePath << ", logging to the console only" << std::endl;
    }
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex);
    logLevel = level;
}

void Logger::setConsoleStream(std::ostream& stream) {
    std::lock_guard<std::mutex> lock(mutex);
    console = &stream;
}

bool Logger::isEnabled(LogLevel level) const {
    return level != LogLevel::NONE && level >= logLevel;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    const std::string output = std::string("[") + levelName(level) + "] " + message + '\n';

    std::lock_guard<std::mutex> lock(mutex);
    ++counts[static_cast<size_t>(level)];
    if (logToConsole) {
        *console << output;
    }
    if (logFile.is_open()) {
        logFile << output;
        logFile.flush();
    }
}

void Logger::trace(const std::string& message) {
    log(LogLevel::TRACE, message);
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERR, message);
}

size_t Logger::messageCount(LogLevel level) const {
    if (level == LogLevel::NONE) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(mutex);
    return counts[static_cast<size_t>(level)];
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(mutex);
    if (logFile.is_open()) {
        logFile.close();
    }
}

std::optional<LogLevel> Logger::parseLevel(std::string_view name) {
    std::string lower(name);
    for (char& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERR;
    if (lower == "none" || lower == "off") return LogLevel::NONE;
    return std::nullopt;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERR: return "ERROR";
        case LogLevel::NONE: return "NONE";
    }
    return "UNKNOWN";
}
