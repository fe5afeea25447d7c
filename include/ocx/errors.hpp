#pragma once

/**
 * @file errors.hpp
 * @brief Error codes and the Result type used by every fallible ocx operation
 *
 * @example
 * ```cpp
 * auto plan = resolver.resolve(requests);
 * if (plan.isErr()) {
 *     std::cerr << ocx::error_code_to_string(plan.error().code()) << ": "
 *               << plan.error().message() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace ocx {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // Registry access
    REGISTRY_UNAVAILABLE,
    FILE_NOT_FOUND,

    // Resolution
    CYCLIC_DEPENDENCY,
    UNSATISFIABLE_VERSION,

    // Installation and audit
    PATH_CONFLICT,
    HASH_MISMATCH,
    CONCURRENT_OPERATION,

    // Ghost mode
    OVERLAY_TOO_LARGE,
    CANNOT_REMOVE_ACTIVE_PROFILE,
    PROFILE_MISSING,

    // System / input
    INVALID_ARGUMENT,
    CONFIG_INVALID,
    IO_ERROR,
};

// Kind name printed to users (e.g. "PathConflict")
inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::REGISTRY_UNAVAILABLE: return "RegistryUnavailable";
        case ErrorCode::FILE_NOT_FOUND: return "FileNotFound";
        case ErrorCode::CYCLIC_DEPENDENCY: return "CyclicDependency";
        case ErrorCode::UNSATISFIABLE_VERSION: return "UnsatisfiableVersion";
        case ErrorCode::PATH_CONFLICT: return "PathConflict";
        case ErrorCode::HASH_MISMATCH: return "HashMismatch";
        case ErrorCode::CONCURRENT_OPERATION: return "ConcurrentOperation";
        case ErrorCode::OVERLAY_TOO_LARGE: return "OverlayTooLarge";
        case ErrorCode::CANNOT_REMOVE_ACTIVE_PROFILE: return "CannotRemoveActiveProfile";
        case ErrorCode::PROFILE_MISSING: return "ProfileMissing";
        case ErrorCode::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorCode::CONFIG_INVALID: return "ConfigInvalid";
        case ErrorCode::IO_ERROR: return "IoError";
        default: return "Unknown";
    }
}

/**
 * @brief Error type with code and message
 *
 * The message always names the offending component id, path or registry.
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
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

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

} // namespace ocx
