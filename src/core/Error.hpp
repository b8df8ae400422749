// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace onyx
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigDirectoryUnresolvable,
    ConfigParseError,
    ConfigWriteError,
    ValidationError,
    WindowCreationError,
    WindowNotFound,
    ShortcutRegistrationError,
    ScriptError,
    LaunchError,
};

/// @brief Returns a short, stable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::IoError: return "io";
        case ErrorCode::ConfigDirectoryUnresolvable: return "config-directory-unresolvable";
        case ErrorCode::ConfigParseError: return "config-parse";
        case ErrorCode::ConfigWriteError: return "config-write";
        case ErrorCode::ValidationError: return "validation";
        case ErrorCode::WindowCreationError: return "window-creation";
        case ErrorCode::WindowNotFound: return "window-not-found";
        case ErrorCode::ShortcutRegistrationError: return "shortcut-registration";
        case ErrorCode::ScriptError: return "script";
        case ErrorCode::LaunchError: return "launch";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace onyx

template <>
struct std::formatter<onyx::Error>: std::formatter<std::string>
{
    auto format(const onyx::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", onyx::errorCodeName(error.code), error.message), ctx);
    }
};
