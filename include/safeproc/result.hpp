#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types shared by every safeproc operation
 *
 * Every fallible call returns Result<T>. Callers check isOk() before
 * value(), or isErr() before error().
 *
 * @example
 * ```cpp
 * auto branch = safeproc::Validator::validate_branch_name("main");
 * if (branch.isErr()) {
 *     std::cerr << branch.error().message() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace safeproc {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for safeproc operations
 */
enum class ErrorCode {
    // Untrusted input rejected
    VALIDATION_ERROR,

    // Mediated process outcomes
    COMMAND_FAILED,
    COMMAND_TIMEOUT,
    SPAWN_FAILED,

    // Document compilation
    PDF_NOT_PRODUCED,

    // System / configuration
    IO_ERROR,
    CONFIG_PARSE_ERROR,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION_ERROR: return "VALIDATION_ERROR";
        case ErrorCode::COMMAND_FAILED: return "COMMAND_FAILED";
        case ErrorCode::COMMAND_TIMEOUT: return "COMMAND_TIMEOUT";
        case ErrorCode::SPAWN_FAILED: return "SPAWN_FAILED";
        case ErrorCode::PDF_NOT_PRODUCED: return "PDF_NOT_PRODUCED";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Diagnostic context attached to an Error
 *
 * Only the fields relevant to the error code are populated.
 */
struct ErrorDetail {
    std::string value;               // offending input (truncated), VALIDATION_ERROR
    std::optional<int> exit_code;    // COMMAND_FAILED
    std::string stdout_text;         // COMMAND_FAILED
    std::string stderr_text;         // COMMAND_FAILED
    std::string command;             // audit-quoted argv
    std::string cwd;
    std::string path;                // PDF_NOT_PRODUCED, IO_ERROR
};

/**
 * @brief Error type with code, message and diagnostic detail
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, ErrorDetail detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const ErrorDetail& detail() const { return detail_; }
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
    ErrorDetail detail_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace safeproc
