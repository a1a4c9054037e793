#include "logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace canvas::server {

namespace {

constexpr std::array<std::string_view, 4> kLevelNames{"DEBUG", "INFO", "WARN", "ERROR"};

std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
    return out.str();
}

}  // namespace

LogLevel parse_log_level(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

std::string_view log_level_name(LogLevel level) {
    const auto index = static_cast<std::size_t>(level);
    return index < kLevelNames.size() ? kLevelNames[index] : kLevelNames[1];
}

Logger::Logger(std::string file_path, LogLevel min_level, bool mirror_to_console)
    : file_path_(std::move(file_path)), min_level_(min_level), mirror_to_console_(mirror_to_console) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_locked();
}

void Logger::open_locked() {
    const auto parent = std::filesystem::path(file_path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    stream_.open(file_path_, std::ios::app);
    if (!stream_) {
        throw std::runtime_error("Failed to open log file: " + file_path_);
    }
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_.close();
    stream_.clear();
    open_locked();
}

void Logger::log(LogLevel level, std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }
    std::string line = timestamp();
    line += " [";
    line += log_level_name(level);
    line += "] ";
    line += message;
    line += '\n';
    if (stream_.is_open()) {
        stream_ << line;
        stream_.flush();
    }
    if (mirror_to_console_) {
        std::clog << line;
    }
}

}  // namespace canvas::server
