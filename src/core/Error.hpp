// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcprouter
{

/// @brief Error codes for categorizing failures across the router.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigurationError,
    UnknownServerError,
    ConnectError,
    CallError,
    CloseError,
    TransportError,
    ProtocolError,
    EmbeddingError,
    MatchError,
};

/// @brief Returns a stable, human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigurationError: return "ConfigurationError";
        case ErrorCode::UnknownServerError: return "UnknownServerError";
        case ErrorCode::ConnectError: return "ConnectError";
        case ErrorCode::CallError: return "CallError";
        case ErrorCode::CloseError: return "CloseError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::EmbeddingError: return "EmbeddingError";
        case ErrorCode::MatchError: return "MatchError";
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

} // namespace mcprouter

template <>
struct std::formatter<mcprouter::Error>: std::formatter<std::string>
{
    auto format(const mcprouter::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcprouter::errorCodeName(error.code), error.message), ctx);
    }
};
