#include "ifc2lbd/logging.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ifc2lbd {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return spdlog::level::trace;
        case LogLevel::DEBUG:    return spdlog::level::debug;
        case LogLevel::INFO:     return spdlog::level::info;
        case LogLevel::WARN:     return spdlog::level::warn;
        case LogLevel::ERROR:    return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);

    logger_ = std::make_shared<spdlog::logger>("ifc2lbd", console_sink);
    logger_->set_level(spdlog::level::info);
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger_->flush_on(spdlog::level::warn);
}

void Logger::set_level(LogLevel level) {
    logger_->set_level(to_spdlog(level));
}

LogLevel Logger::level() const {
    switch (logger_->level()) {
        case spdlog::level::trace:    return LogLevel::TRACE;
        case spdlog::level::debug:    return LogLevel::DEBUG;
        case spdlog::level::info:     return LogLevel::INFO;
        case spdlog::level::warn:     return LogLevel::WARN;
        case spdlog::level::err:      return LogLevel::ERROR;
        default:                      return LogLevel::CRITICAL;
    }
}

bool Logger::set_output_file(const std::string& filename) {
    try {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger_->sinks().push_back(file_sink);
        return true;
    } catch (const spdlog::spdlog_ex& e) {
        logger_->error("Could not open log file '{}': {}", filename, e.what());
        return false;
    }
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string val = name;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "trace") out = LogLevel::TRACE;
    else if (val == "debug") out = LogLevel::DEBUG;
    else if (val == "info") out = LogLevel::INFO;
    else if (val == "warn" || val == "warning") out = LogLevel::WARN;
    else if (val == "error") out = LogLevel::ERROR;
    else if (val == "critical" || val == "fatal") out = LogLevel::CRITICAL;
    else return false;
    return true;
}

} // namespace ifc2lbd
