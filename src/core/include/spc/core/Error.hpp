/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the error codes raised by the safety core and a lightweight
 * Error value type carrying the code, a human-readable message, and the
 * source location where the error was raised.  Codes are grouped by the
 * category of failure: invalid input, violated precondition, unavailable
 * resource, internal fault.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_CORE_ERROR_HPP
    #define SPC_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>
    #include <utility>

namespace spc::core {

/**
 * @brief Safety-core error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    // Invalid input
    kInvalidArgument,
    kUnknownKind,
    kEmptyInput,

    // Precondition violations
    kInvalidState,
    kMonitorStopped,
    kNotLocked,
    kAlreadyLocked,
    kWindowExpired,
    kAlreadyTerminal,
    kNotEnrolled,
    kEnrollmentIncomplete,
    kAlreadyEnrolled,

    // Resource unavailable
    kResourceUnavailable,
    kIoError,
    kQueueFull,

    kInternalError,
};

/**
 * @brief Returns a short human-readable label for the given error code.
 */
[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kNone:                 return "None";
        case ErrorCode::kInvalidArgument:      return "InvalidArgument";
        case ErrorCode::kUnknownKind:          return "UnknownKind";
        case ErrorCode::kEmptyInput:           return "EmptyInput";
        case ErrorCode::kInvalidState:         return "InvalidState";
        case ErrorCode::kMonitorStopped:       return "MonitorStopped";
        case ErrorCode::kNotLocked:            return "NotLocked";
        case ErrorCode::kAlreadyLocked:        return "AlreadyLocked";
        case ErrorCode::kWindowExpired:        return "WindowExpired";
        case ErrorCode::kAlreadyTerminal:      return "AlreadyTerminal";
        case ErrorCode::kNotEnrolled:          return "NotEnrolled";
        case ErrorCode::kEnrollmentIncomplete: return "EnrollmentIncomplete";
        case ErrorCode::kAlreadyEnrolled:      return "AlreadyEnrolled";
        case ErrorCode::kResourceUnavailable:  return "ResourceUnavailable";
        case ErrorCode::kIoError:              return "IoError";
        case ErrorCode::kQueueFull:            return "QueueFull";
        case ErrorCode::kInternalError:        return "InternalError";
    }
    return "Unknown";
}

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Error is a lightweight value type intended to be stored inside
 * Expected<T>.
 */
class Error final {
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
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode            code()     const { return _code; }
    [[nodiscard]] const std::string   &message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /**
     * @brief Formats the error as "[Code] message (file:line)".
     */
    [[nodiscard]] std::string format() const;

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
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

} // namespace spc::core

#endif // SPC_CORE_ERROR_HPP
