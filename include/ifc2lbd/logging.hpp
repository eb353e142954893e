#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace ifc2lbd {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Process-wide logger facade over a single named spdlog logger.
 * Messages go to stderr so that converted output may be piped through stdout.
 */
class Logger {
public:
    static Logger& getInstance();

    std::shared_ptr<spdlog::logger> get() const { return logger_; }

    void set_level(LogLevel level);
    LogLevel level() const;

    // Adds a file sink next to the console sink; returns false when the file cannot be opened
    bool set_output_file(const std::string& filename);

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<spdlog::logger> logger_;
};

// Parses "trace", "debug", "info", "warn", "error", "critical" (case-insensitive)
bool parse_log_level(const std::string& name, LogLevel& out);

inline void set_log_level(LogLevel level) {
    Logger::getInstance().set_level(level);
}

} // namespace ifc2lbd

// Convenience macros (fmt-style format strings)
#define LOG_TRACE(...)    ::ifc2lbd::Logger::getInstance().get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::ifc2lbd::Logger::getInstance().get()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::ifc2lbd::Logger::getInstance().get()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::ifc2lbd::Logger::getInstance().get()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::ifc2lbd::Logger::getInstance().get()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::ifc2lbd::Logger::getInstance().get()->critical(__VA_ARGS__)
