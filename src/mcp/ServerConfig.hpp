// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcprouter
{

/// @brief How a server is reached.
enum class ServerKind : std::uint8_t
{
    Stdio,
    Http,
};

/// @brief Immutable description of how to reach one MCP server.
///
/// Stdio servers use command, args and env; HTTP servers use url and headers.
struct ServerConfig
{
    ServerKind kind = ServerKind::Stdio;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string url;
    std::map<std::string, std::string> headers;
};

/// @brief One configured backend. Identity is its name.
struct Server
{
    std::string name;
    ServerConfig config;
};

/// @brief All configured servers, keyed by name.
using ServerRegistry = std::map<std::string, Server, std::less<>>;

/// @brief Parses one entry of the "mcpServers" object.
///
/// Accepted members are command, args, env, url, headers and type. Unknown
/// members, wrong member types, and entries with both or neither of command
/// and url are rejected.
/// @param name The server name (the key of the entry).
/// @param entry The entry's JSON value.
/// @return The parsed configuration or a ConfigurationError.
[[nodiscard]] auto parseServerConfig(std::string_view name, const nlohmann::json& entry) -> Result<ServerConfig>;

/// @brief Parses the "mcpServers" object of a configuration document.
///
/// A document without "mcpServers" yields an empty registry. Any malformed
/// entry fails the whole registry.
/// @param document The configuration document.
/// @return The registry or a ConfigurationError.
[[nodiscard]] auto parseServerRegistry(const nlohmann::json& document) -> Result<ServerRegistry>;

/// @brief Serializes a server configuration back into its document form.
[[nodiscard]] auto toJson(const ServerConfig& config) -> nlohmann::json;

} // namespace mcprouter
