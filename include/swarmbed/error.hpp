#pragma once

#include "swarmbed/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>

namespace swarmbed {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,
    InvalidFormat,

    // Process lifecycle errors
    AlreadyRunning,
    NotRunning,
    LaunchFailed,
    PersistFailed,
    CorruptState,
    SignalFailed,
    ShutdownTimeout,
    PidFileRemoveFailed,

    // Node errors
    ReadinessTimeout,
    CommandFailed,
    IdentityMissing,
    UnknownAttribute,
    ShellNotFound,

    // Configuration errors
    ConfigReadFailed,
    ConfigWriteFailed,
    RegistryLoadFailed
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for error handling
template<typename T>
class Result {
public:
    // Implicit from Error so SWARMBED_TRY can forward across value types
    Result(Error error) : value_(std::move(error)) {}

    // Success constructor
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    // Error constructor
    static Result Err(Error error) {
        return Result(std::move(error));
    }

    // Error constructor with code and message
    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    static Result Err(ErrorCode code, const std::string& message, const std::string& details) {
        return Result(Error(code, message, details));
    }

    // Check if result contains a value
    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws if error)
    T& value() {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

    // Get value or default
    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    // Unwrap (throws if error)
    T unwrap() {
        return value();
    }

private:
    explicit Result(T value) : value_(std::move(value)) {}

    std::variant<T, Error> value_;
};

// Specialized Result<void> for operations that don't return a value
template<>
class Result<void> {
public:
    Result(Error error) : error_(std::move(error)) {}

    static Result Ok() {
        return Result(true);
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    static Result Err(ErrorCode code, const std::string& message, const std::string& details) {
        return Result(Error(code, message, details));
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    const Error& error() const {
        if (!error_) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return *error_;
    }

private:
    explicit Result(bool) : error_(std::nullopt) {}

    std::optional<Error> error_;
};

// Custom exception classes
class SwarmbedException : public std::runtime_error {
public:
    SwarmbedException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Thrown when the harness's own on-disk state can no longer be trusted
class ProcessException : public SwarmbedException {
public:
    ProcessException(ErrorCode code, const std::string& message)
        : SwarmbedException(code, "Process error: " + message) {}
};

class ConfigException : public SwarmbedException {
public:
    ConfigException(ErrorCode code, const std::string& message)
        : SwarmbedException(code, "Config error: " + message) {}
};

// Utility macros for error handling.
// SWARMBED_TRY forwards the error into a Result of the enclosing function's
// return type, so the expression's value type may differ from it.
#define SWARMBED_TRY(expr) \
    do { \
        auto __result = (expr); \
        if (__result.is_err()) { \
            return ::swarmbed::Error(__result.error()); \
        } \
    } while (0)

#define SWARMBED_TRY_UNWRAP(var, expr) \
    auto __result_##var = (expr); \
    if (__result_##var.is_err()) { \
        return ::swarmbed::Error(__result_##var.error()); \
    } \
    auto var = std::move(__result_##var.value());

} // namespace swarmbed
