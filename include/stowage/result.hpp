#pragma once

/**
 * @file result.hpp
 * @brief Error taxonomy and Result type shared by every stowage operation
 *
 * All operations are fatal on first error; nothing is retried internally.
 * Callers own retry policy and must treat any error as "abort the whole
 * pin/publish workflow".
 */

#include <optional>
#include <string>
#include <utility>

namespace stowage {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for stowage operations
 */
enum class ErrorCode {
    // Malformed service record (missing or invalid image field)
    INPUT_ERROR,

    // Unparsable reference or missing required tag
    REFERENCE_ERROR,

    // Engine/registry failure while resolving a digest or platform set
    RESOLUTION_ERROR,

    // Filesystem walk failure
    ARCHIVE_ERROR,
    // Device, socket, fifo or other irregular entry under the bundle root
    UNSUPPORTED_ENTRY,

    // Blob or manifest upload failure
    PUBLISH_ERROR,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::INPUT_ERROR: return "InputError";
        case ErrorCode::REFERENCE_ERROR: return "ReferenceError";
        case ErrorCode::RESOLUTION_ERROR: return "ResolutionError";
        case ErrorCode::ARCHIVE_ERROR: return "ArchiveError";
        case ErrorCode::UNSUPPORTED_ENTRY: return "UnsupportedEntryError";
        case ErrorCode::PUBLISH_ERROR: return "PublishError";
        default: return "UnknownError";
    }
}

inline bool is_archive_error(ErrorCode code) {
    return code == ErrorCode::ARCHIVE_ERROR || code == ErrorCode::UNSUPPORTED_ENTRY;
}

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

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
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

using Status = Result<void>;

} // namespace stowage
