#pragma once

/**
 * @file Result.h
 * @brief Consistent error handling types for PeerBeam
 *
 * Provides a Result<T, E> type similar to Rust's Result or C++23's std::expected.
 * Crypto primitives throw; everything above them reports through Result.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace PeerBeam {

/**
 * @brief Error codes for PeerBeam operations
 */
enum class ErrorCode {
    Success = 0,

    // Crypto errors (100-199)
    CryptoUnavailable = 100,
    MalformedKey = 101,
    AuthenticationFailed = 102,
    IntegrityMismatch = 103,

    // Protocol errors (200-299)
    UnknownMessage = 200,
    UnexpectedFrame = 201,
    PeerKeyTimeout = 202,
    InvalidState = 203,

    // Channel errors (300-399)
    ChannelClosed = 300,
    SendFailed = 301,
    ConnectionFailed = 302,

    // File errors (400-499)
    FileNotFound = 400,
    FileReadError = 401,
    FileWriteError = 402,

    // Configuration errors (600-699)
    ConfigError = 600,

    // General errors (900-999)
    InvalidArgument = 900,
    InternalError = 999
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::CryptoUnavailable: return "Crypto unavailable";
        case ErrorCode::MalformedKey: return "Malformed key";
        case ErrorCode::AuthenticationFailed: return "Integrity/authenticity failure";
        case ErrorCode::IntegrityMismatch: return "Integrity check failed";
        case ErrorCode::UnknownMessage: return "Unknown message";
        case ErrorCode::UnexpectedFrame: return "Unexpected frame";
        case ErrorCode::PeerKeyTimeout: return "Timed out waiting for peer key";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::ChannelClosed: return "Channel closed";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadError: return "File read error";
        case ErrorCode::FileWriteError: return "File write error";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
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
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 *
 * Usage:
 * @code
 * Result<std::string> saved = receiver.saveTo(dir);
 * if (!saved) {
 *     logger.log(LogLevel::ERROR, saved.error().toString(), "CLI");
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

    /// Check if result is success
    bool ok() const { return std::holds_alternative<T>(data_); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Check if result is error
    bool isError() const { return std::holds_alternative<E>(data_); }

    /// Get success value (throws if error)
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }

    /// Get error (throws if success)
    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Specialization for void success type
 */
template<typename E>
class Result<void, E> {
public:
    /// Construct success result
    Result() : error_(std::nullopt) {}

    /// Construct error result
    Result(E error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }
    bool isError() const { return error_.has_value(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

/// Create a void success result
inline Result<void> Ok() {
    return Result<void>();
}

/// Create an error result with message
template<typename T = void>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

} // namespace PeerBeam
