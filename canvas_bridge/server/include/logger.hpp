#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

namespace canvas::server {

// Unknown names map to kInfo.
LogLevel parse_log_level(std::string_view name);
std::string_view log_level_name(LogLevel level);

// Appends "YYYY-MM-DD HH:MM:SS.mmm [LEVEL] message" lines to a file and,
// unless disabled, mirrors them to std::clog. Safe to share between threads.
class Logger {
public:
    explicit Logger(std::string file_path, LogLevel min_level = LogLevel::kInfo, bool mirror_to_console = true);

    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::kDebug, message); }
    void info(std::string_view message) { log(LogLevel::kInfo, message); }
    void warn(std::string_view message) { log(LogLevel::kWarn, message); }
    void error(std::string_view message) { log(LogLevel::kError, message); }

    bool enabled(LogLevel level) const;
    void set_min_level(LogLevel level);

    // Closes and reopens the file after an external rotation moved it away.
    void reopen();

private:
    void open_locked();

    mutable std::mutex mutex_;
    std::ofstream stream_;
    std::string file_path_;
    LogLevel min_level_;
    bool mirror_to_console_;
};

}  // namespace canvas::server
