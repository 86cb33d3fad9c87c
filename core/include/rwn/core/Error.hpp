/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the error taxonomy of the rollback engine and a lightweight
 * Error value type carrying the code, a human-readable message, and the
 * source location where the error was raised.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWN_CORE_ERROR_HPP
    #define RWN_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace rwn::core {

/**
 * @brief Engine-wide error code enumeration.
 *
 * Recoverable codes describe a rejected request (the host retries or skips
 * a frame). Codes for which isFatal() returns true end the match.
 */
enum class ErrorCode : u16
{
    kNone = 0,

    kInvalidPlayer,
    kFrameTooOld,
    kNotFound,
    kInputBufferFull,
    kPredictionThreshold,
    kPredictionWindowExceeded,
    kDisconnected,
    kDesyncDetected,
    kNotSynchronized,
    kInvalidConfig,
    kInvalidRequest,
    kInvalidState,
    kMismatchedChecksum,
    kMalformedMessage,
    kIoError,
    kInternalError,
};

/// @brief Returns true for errors after which the session must not continue.
[[nodiscard]] constexpr bool isFatal(ErrorCode code) noexcept
{
    return code == ErrorCode::kDesyncDetected
        || code == ErrorCode::kPredictionWindowExceeded
        || code == ErrorCode::kMismatchedChecksum;
}

/// @brief Stable name of an error code, for logs and test output.
[[nodiscard]] std::string_view errorCodeName(ErrorCode code) noexcept;

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Intended to be stored inside Expected<T>.
 */
class Error final
{
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : code_(code), message_(std::move(message)), location_(loc) {}

    [[nodiscard]] ErrorCode           code()     const { return code_; }
    [[nodiscard]] const std::string & message()  const { return message_; }
    [[nodiscard]] std::source_location location() const { return location_; }
    [[nodiscard]] bool                fatal()    const { return isFatal(code_); }

    /// @brief "<CodeName>: <message>", as written to the log.
    [[nodiscard]] std::string describe() const;

private:
    ErrorCode            code_;
    std::string          message_;
    std::source_location location_;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace rwn::core

#endif // RWN_CORE_ERROR_HPP
