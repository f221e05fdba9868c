#include "logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <iostream>

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (!path.empty()) {
        file_.open(path, std::ios::out | std::ios::app);
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::setEcho(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    echo_ = enabled;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level == LogLevel::LVL_OFF) {
        return;
    }

    std::string ts = currentTimestamp();
    const char* lvl = levelToString(level);

    std::ostringstream oss;
    oss << "[" << ts << "] [" << lvl << "] " << message;
    std::string line = oss.str();

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }

    // Write to file if open.
    if (file_.is_open()) {
        file_ << line << "\n";
        file_.flush();
    }

    if (echo_) {
        std::cerr << line << std::endl;
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::LVL_DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::LVL_INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::LVL_WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::LVL_ERROR, message);
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::LVL_DEBUG;
    if (lower == "info")  return LogLevel::LVL_INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::LVL_WARN;
    if (lower == "error") return LogLevel::LVL_ERROR;
    if (lower == "off")   return LogLevel::LVL_OFF;
    return std::nullopt;
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::LVL_DEBUG: return "DEBUG";
        case LogLevel::LVL_INFO:  return "INFO";
        case LogLevel::LVL_WARN:  return "WARN";
        case LogLevel::LVL_ERROR: return "ERROR";
        case LogLevel::LVL_OFF:   return "OFF";
    }
    return "UNKNOWN";
}

std::string Logger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&time_t_now, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}
