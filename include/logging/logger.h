// include/logging/logger.h
#pragma once

#ifndef TERMINAL_HEALTH_LOGGER_H
#define TERMINAL_HEALTH_LOGGER_H

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace terminal_health::logging {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERR   // named ERR to avoid the ERROR macro some platform headers define
};

// Parse "DEBUG" / "INFO" / "WARN" / "ERROR" (case-insensitive). Unknown -> INFO.
LogLevel logLevelFromString(const std::string& text);

// Process-wide logger. Console output always; file output with size-based
// rotation once initialize() is given a path.
class Logger {
public:
    static Logger& getInstance();

    // Empty path keeps console-only logging.
    void initialize(const std::string& logFilePath);
    void shutdown();

    void setMinLevel(LogLevel level);
    LogLevel getMinLevel() const;

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warn(const std::string& message) { log(LogLevel::WARN, message); }
    void error(const std::string& message) { log(LogLevel::ERR, message); }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatLogMessage(LogLevel level, const std::string& message) const;
    const char* levelToString(LogLevel level) const;
    void openLogFile();
    void closeLogFile();
    void rotate();

    static constexpr std::uintmax_t MAX_FILE_SIZE = 10 * 1024 * 1024;

    mutable std::mutex logMutex_;
    LogLevel minLevel_{LogLevel::INFO};
    std::string logFilePath_;
    std::ofstream logFile_;
    std::uintmax_t currentFileSize_{0};
};

} // namespace terminal_health::logging

#endif // TERMINAL_HEALTH_LOGGER_H
