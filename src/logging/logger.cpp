// src/logging/logger.cpp
#include "logging/logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace terminal_health::logging {

LogLevel logLevelFromString(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR" || upper == "ERR") return LogLevel::ERR;
    return LogLevel::INFO;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    closeLogFile();
}

void Logger::initialize(const std::string& logFilePath) {
    std::lock_guard<std::mutex> lock(logMutex_);
    closeLogFile();
    logFilePath_ = logFilePath;
    if (logFilePath_.empty()) {
        return;
    }

    // Create log directory if it doesn't exist
    try {
        std::filesystem::path parent = std::filesystem::path(logFilePath_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    } catch (const std::exception& e) {
        std::cerr << "[WARN ] Cannot create log directory: " << e.what() << std::endl;
    }
    openLogFile();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex_);
    closeLogFile();
    logFilePath_.clear();
}

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(logMutex_);
    minLevel_ = level;
}

LogLevel Logger::getMinLevel() const {
    std::lock_guard<std::mutex> lock(logMutex_);
    return minLevel_;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (static_cast<int>(level) < static_cast<int>(minLevel_)) {
        return;
    }

    std::string formatted = formatLogMessage(level, message);
    std::cout << formatted << std::endl;

    if (logFilePath_.empty()) {
        return;
    }
    if (!logFile_.is_open()) {
        openLogFile();
    }
    if (currentFileSize_ > MAX_FILE_SIZE) {
        rotate();
    }
    if (logFile_.is_open()) {
        logFile_ << formatted << '\n';
        logFile_.flush();
        currentFileSize_ += formatted.length() + 1;
    }
}

std::string Logger::formatLogMessage(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tmBuf{};
    localtime_r(&time_t, &tmBuf);

    std::stringstream ss;
    ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    ss << " [" << levelToString(level) << "] " << message;
    return ss.str();
}

const char* Logger::levelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERR:   return "ERROR";
        default: return "UNKNOWN";
    }
}

void Logger::openLogFile() {
    logFile_.open(logFilePath_, std::ios::app);
    if (logFile_.is_open()) {
        std::error_code ec;
        auto size = std::filesystem::file_size(logFilePath_, ec);
        currentFileSize_ = ec ? 0 : size;
    }
}

void Logger::closeLogFile() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::rotate() {
    closeLogFile();

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tmBuf{};
    localtime_r(&time_t, &tmBuf);
    std::stringstream ss;
    ss << std::put_time(&tmBuf, "%Y%m%d_%H%M%S");

    std::error_code ec;
    std::filesystem::rename(logFilePath_, logFilePath_ + "." + ss.str(), ec);
    if (ec) {
        std::cerr << "[WARN ] Log rotation failed: " << ec.message() << std::endl;
    }

    openLogFile();
    currentFileSize_ = 0;
}

} // namespace terminal_health::logging
