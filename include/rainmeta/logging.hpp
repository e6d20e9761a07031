// ====================================================================================
// RAINMETA - Logging
// ====================================================================================

#ifndef RAINMETA_LOGGING_HPP_
#define RAINMETA_LOGGING_HPP_

#include <atomic>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace rainmeta::logging {

enum class LogLevel : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

std::optional<LogLevel> ParseLogLevel(std::string_view text);

class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void log(LogLevel level, std::string_view category, std::string_view message);

    bool enabled(LogLevel level) const { return level >= min_level_; }
    void setLevel(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }
    void setConsoleOutput(bool enabled) { console_output_ = enabled; }
    // Returns false when the file cannot be opened for appending.
    bool setLogFile(const std::string& filename);
    void closeLogFile();

private:
    Logger() = default;

    std::mutex mutex_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::atomic<bool> console_output_{true};
    std::ofstream log_file_;

    static const char* getLevelString(LogLevel level);
};

}  // namespace rainmeta::logging

#define RAINMETA_LOG_TRACE(category, msg) ::rainmeta::logging::Logger::instance().log(::rainmeta::logging::LogLevel::TRACE, category, msg)
#define RAINMETA_LOG_DEBUG(category, msg) ::rainmeta::logging::Logger::instance().log(::rainmeta::logging::LogLevel::DEBUG, category, msg)
#define RAINMETA_LOG_INFO(category, msg)  ::rainmeta::logging::Logger::instance().log(::rainmeta::logging::LogLevel::INFO, category, msg)
#define RAINMETA_LOG_WARN(category, msg)  ::rainmeta::logging::Logger::instance().log(::rainmeta::logging::LogLevel::WARN, category, msg)
#define RAINMETA_LOG_ERROR(category, msg) ::rainmeta::logging::Logger::instance().log(::rainmeta::logging::LogLevel::ERROR, category, msg)

#endif  // RAINMETA_LOGGING_HPP_
