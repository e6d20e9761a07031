#include "rainmeta/logging.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace rainmeta::logging {

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    if (text == "trace" || text == "TRACE") return LogLevel::TRACE;
    if (text == "debug" || text == "DEBUG") return LogLevel::DEBUG;
    if (text == "info" || text == "INFO") return LogLevel::INFO;
    if (text == "warn" || text == "WARN") return LogLevel::WARN;
    if (text == "error" || text == "ERROR") return LogLevel::ERROR;
    if (text == "fatal" || text == "FATAL") return LogLevel::FATAL;
    return std::nullopt;
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
    if (level < min_level_) return;

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    oss << " [" << getLevelString(level) << "] ";
    oss << "[" << category << "] " << message << std::endl;

    if (console_output_) std::clog << oss.str();

    if (log_file_.is_open()) {
        log_file_ << oss.str();
        log_file_.flush();
    }
}

bool Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) log_file_.close();
    log_file_.open(filename, std::ios::app);
    return log_file_.is_open();
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) log_file_.close();
}

const char* Logger::getLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNW";
    }
}

}  // namespace rainmeta::logging
