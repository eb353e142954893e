#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ifc2lbd {

/**
 * Error taxonomy for conversion runs.
 *
 * Configuration and encoding failures terminate a run; malformed records and
 * unsupported value shapes are recovered where they occur and never reach
 * this hierarchy.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Configuration
    CONFIGURATION_ERROR = 100,
    UNKNOWN_CONVERTER = 101,
    UNKNOWN_SCHEMA = 102,

    // Input parsing
    PARSE_ERROR = 200,

    // Serialization
    ENCODING_FAILED = 300,

    // I/O errors
    FILE_NOT_FOUND = 400,
    WRITE_FAILED = 401,
    READ_FAILED = 402,

    // Internal errors
    INTERNAL_ERROR = 500
};

class Ifc2LbdException : public std::runtime_error {
public:
    explicit Ifc2LbdException(ErrorCode code, const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "ifc2lbd error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public Ifc2LbdException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : Ifc2LbdException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Raised before any output is written
class ConfigurationError : public Ifc2LbdException {
public:
    explicit ConfigurationError(const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "",
                                ErrorCode code = ErrorCode::CONFIGURATION_ERROR)
        : Ifc2LbdException(code, message, context, suggestion) {}
};

class ParseError : public Ifc2LbdException {
public:
    explicit ParseError(const std::string& message, std::size_t line = 0,
                        const std::string& context = "")
        : Ifc2LbdException(ErrorCode::PARSE_ERROR,
                           line ? message + " (line " + std::to_string(line) + ")" : message,
                           context)
        , line_(line) {}

    std::size_t line() const noexcept { return line_; }

private:
    std::size_t line_;
};

/**
 * Failure while formatting one entity. The run cannot continue because the
 * output already holds part of the entity block.
 */
class EncodingError : public Ifc2LbdException {
public:
    explicit EncodingError(const std::string& message, std::uint64_t entity_id = 0,
                           const std::string& context = "")
        : Ifc2LbdException(ErrorCode::ENCODING_FAILED,
                           entity_id ? "entity #" + std::to_string(entity_id) + ": " + message : message,
                           context)
        , entity_id_(entity_id) {}

    std::uint64_t entity_id() const noexcept { return entity_id_; }

private:
    std::uint64_t entity_id_;
};

class IOError : public Ifc2LbdException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "",
                     ErrorCode code = ErrorCode::FILE_NOT_FOUND)
        : Ifc2LbdException(code, message, context, suggestion) {}
};

// Macros for common error checking
#define IFC2LBD_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw ::ifc2lbd::InvalidArgumentError(message, __func__); } while (0)

} // namespace ifc2lbd
