// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace lode
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    LaunchError,
    TransportError,
    ProtocolError,
    PersistenceError,
    SyncError,
    WorkerError,
    Cancelled,
};

/// @brief Returns a stable, human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::ConfigError: return "CONFIG_ERROR";
        case ErrorCode::LaunchError: return "LAUNCH_ERROR";
        case ErrorCode::TransportError: return "TRANSPORT_ERROR";
        case ErrorCode::ProtocolError: return "PROTOCOL_ERROR";
        case ErrorCode::PersistenceError: return "PERSISTENCE_ERROR";
        case ErrorCode::SyncError: return "SYNC_ERROR";
        case ErrorCode::WorkerError: return "WORKER_ERROR";
        case ErrorCode::Cancelled: return "CANCELLED";
    }
    return "UNKNOWN";
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

} // namespace lode

template <>
struct std::formatter<lode::Error>: std::formatter<std::string>
{
    auto format(const lode::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", lode::errorCodeName(error.code), error.message), ctx);
    }
};
