#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types shared by every progman operation
 *
 * Operations never throw across the library API. They return a Result<T>
 * holding either a value or an Error. The Error keeps a machine-readable
 * ErrorCode next to the human-readable message, so callers can branch on
 * the kind of failure without parsing text.
 *
 * @example
 * ```cpp
 * auto result = progman::remove_dir_all("/tmp/build");
 * if (result.isErr() && result.error().code() == progman::ErrorCode::FILE_NOT_FOUND) {
 *     // already gone
 * }
 * ```
 */

#include "progman/export.hpp"

#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace progman {

// ============================================================================
// Error Codes
// ============================================================================

/**
 * @brief Error codes for progman operations
 */
enum class ErrorCode {
    // System / IO
    FILE_NOT_FOUND,
    PERMISSION_DENIED,
    NOT_A_DIRECTORY,
    ALREADY_EXISTS,
    IO_ERROR,

    // Call bridge
    INVALID_ARGUMENT,
    UNKNOWN_COMMAND,
    PARSE_ERROR,

    INTERNAL,
};

/// Stable lowercase identifier used on the wire ("file_not_found", ...)
PROGMAN_API const char* error_code_name(ErrorCode code);

/// Map an OS-level error to an ErrorCode
PROGMAN_API ErrorCode error_code_from(const std::error_code& ec);

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
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

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

    template<typename F>
    auto map(F func) -> Result<decltype(func(std::declval<T>())), E> {
        if (has_value_) {
            return Result<decltype(func(std::declval<T>())), E>::ok(func(value_.value()));
        }
        return Result<decltype(func(std::declval<T>())), E>::err(error_.value());
    }

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

} // namespace progman
