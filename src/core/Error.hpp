// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace manzai
{

/// @brief Error codes for categorizing failures across the stage.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    InvalidState,
    IoError,
    ConfigError,
    ProtocolError,
    ModelLoadError,
    DeviceUnavailable,
    AudioLoadError,
    AudioPlaybackError,
    MirrorDisconnected,
};

/// @brief Returns a short identifier for an error code, used in log lines.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::ModelLoadError: return "ModelLoadError";
        case ErrorCode::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorCode::AudioLoadError: return "AudioLoadError";
        case ErrorCode::AudioPlaybackError: return "AudioPlaybackError";
        case ErrorCode::MirrorDisconnected: return "MirrorDisconnected";
    }
    return "Unknown";
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

} // namespace manzai

template <>
struct std::formatter<manzai::Error>: std::formatter<std::string>
{
    auto format(const manzai::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", manzai::errorCodeName(error.code), error.message), ctx);
    }
};
