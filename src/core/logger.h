#pragma once
#include <string>
#include <mutex>
#include <fstream>
#include <optional>

// NOTE: Avoid bare ERROR / DEBUG – they collide with common platform macros.
enum class LogLevel { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_OFF };

class Logger {
public:
    /// Get the singleton instance.
    static Logger& instance();

    /// Set (or change) the log output file path.
    /// Opens the file in append mode. Closes any previously opened file.
    /// An empty path only closes the current file.
    void setLogFile(const std::string& path);

    /// Messages below this level are dropped. Default: LVL_INFO.
    void setLevel(LogLevel level);
    LogLevel level() const;

    /// Also write every accepted line to stderr.
    void setEcho(bool enabled);

    /// Log a message at the given level.
    /// Format: "[YYYY-MM-DD HH:MM:SS] [LEVEL] message\n"
    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    /// Parse "debug", "info", "warn", "error" or "off" (case-insensitive).
    static std::optional<LogLevel> parseLevel(const std::string& name);

    // Non-copyable / non-movable (singleton).
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;

    static const char* levelToString(LogLevel level);
    static std::string currentTimestamp();

    mutable std::mutex mutex_;
    std::ofstream file_;
    LogLevel min_level_ = LogLevel::LVL_INFO;
    bool echo_ = false;
};
