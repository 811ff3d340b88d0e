#pragma once

/**
 * @file Result.h
 * @brief Error handling types for RelayPipe
 *
 * Relay operations report failure as values rather than exceptions.
 * Result<T> holds either a value or an Error carrying an ErrorCode.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace RelayPipe {

/**
 * @brief Error codes for relay operations
 */
enum class ErrorCode {
    Success = 0,

    // Channel outcomes (100-199)
    AuthError = 100,
    Locked = 101,
    Empty = 102,
    Expired = 103,
    NotFound = 104,
    ChannelFull = 105,

    // Codec errors (200-299)
    IntegrityError = 200,
    FormatError = 201,
    TooLarge = 202,

    // Transport errors (300-399)
    NetworkError = 300,
    Timeout = 301,
    RateLimited = 302,
    ServerError = 303,
    ShuttingDown = 304,
    Cancelled = 305,

    // Local errors (900-999)
    InvalidArgument = 900,
    ConfigError = 901,
    StorageError = 902,
    InternalError = 999
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::AuthError: return "Authentication failed";
        case ErrorCode::Locked: return "Channel locked by another receiver";
        case ErrorCode::Empty: return "Channel empty";
        case ErrorCode::Expired: return "Channel gone";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::ChannelFull: return "Channel full";
        case ErrorCode::IntegrityError: return "Integrity check failed";
        case ErrorCode::FormatError: return "Unsupported format";
        case ErrorCode::TooLarge: return "Chunk too large";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Timed out";
        case ErrorCode::RateLimited: return "Rate limited";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::ShuttingDown: return "Server shutting down";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/**
 * @brief Whether a client may retry the same exchange after this error
 */
inline bool isRetryable(ErrorCode code) {
    switch (code) {
        case ErrorCode::Locked:
        case ErrorCode::Empty:
        case ErrorCode::ChannelFull:
        case ErrorCode::RateLimited:
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::ServerError:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error type with code and optional message
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    std::string toString() const {
        return std::string(errorCodeToString(code)) + ": " + message;
    }

    bool operator==(const Error& other) const { return code == other.code; }
    bool operator!=(const Error& other) const { return code != other.code; }
};

/**
 * @brief Result type for operations that can fail
 *
 * Usage:
 * @code
 * Result<uint64_t> r = store.push(name, credential, chunk);
 * if (!r) {
 *     logger.warn(r.error().toString(), "Relay");
 * }
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    /// Construct success result
    Result(T value) : data_(std::move(value)) {}

    /// Construct error result
    Result(E error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T valueOr(T defaultValue) const {
        if (ok()) return std::get<T>(data_);
        return defaultValue;
    }

    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Specialization for void success type
 */
template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(E error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }
    bool isError() const { return error_.has_value(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

using VoidResult = Result<void, Error>;

/// Create a void success result
inline VoidResult Ok() {
    return VoidResult();
}

/// Create an error
inline Error Err(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

} // namespace RelayPipe
