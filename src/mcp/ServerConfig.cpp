// SPDX-License-Identifier: Apache-2.0
#include "ServerConfig.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <optional>

namespace mcprouter
{

namespace
{
    constexpr auto KnownMembers = std::array<std::string_view, 6> {
        "command", "args", "env", "url", "headers", "type",
    };

    auto invalid(std::string_view name, std::string_view reason) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ConfigurationError,
                         std::format("Invalid configuration for server '{}': {}", name, reason));
    }
} // namespace

auto parseServerConfig(std::string_view name, const nlohmann::json& entry) -> Result<ServerConfig>
{
    if (name.empty())
        return makeError(ErrorCode::ConfigurationError, "Server names must not be empty");
    if (!entry.is_object())
        return invalid(name, "entry must be an object");

    for (const auto& member: entry.items())
    {
        if (std::ranges::find(KnownMembers, member.key()) == KnownMembers.end())
            return invalid(name, std::format("unknown member '{}'", member.key()));
    }

    auto const hasCommand = entry.contains("command");
    auto const hasUrl = entry.contains("url");
    if (hasCommand == hasUrl)
        return invalid(name, "exactly one of 'command' or 'url' is required");

    auto config = ServerConfig {};
    config.kind = hasCommand ? ServerKind::Stdio : ServerKind::Http;

    if (entry.contains("type"))
    {
        if (!entry["type"].is_string())
            return invalid(name, "'type' must be a string");

        auto const type = entry["type"].get<std::string>();
        auto declared = std::optional<ServerKind> {};
        if (type == "stdio")
            declared = ServerKind::Stdio;
        else if (type == "http" || type == "streamable-http" || type == "streamableHttp")
            declared = ServerKind::Http;

        if (!declared)
            return invalid(name, std::format("unknown type '{}'", type));
        if (*declared != config.kind)
            return invalid(name, std::format("type '{}' does not match the given members", type));
    }

    if (config.kind == ServerKind::Stdio)
    {
        if (entry.contains("headers"))
            return invalid(name, "stdio servers take no 'headers'");

        auto command = json::getString(entry, "command");
        if (!command || command->empty())
            return invalid(name, "'command' must be a non-empty string");
        config.command = std::move(*command);

        if (entry.contains("args"))
        {
            auto args = json::toStringArray(entry["args"], "args");
            if (!args)
                return invalid(name, args.error().message);
            config.args = std::move(*args);
        }

        if (entry.contains("env") && !entry["env"].is_null())
        {
            auto env = json::toStringMap(entry["env"], "env");
            if (!env)
                return invalid(name, env.error().message);
            config.env = std::move(*env);
        }
    }
    else
    {
        if (entry.contains("args") || entry.contains("env"))
            return invalid(name, "HTTP servers take no 'args' or 'env'");

        auto url = json::getString(entry, "url");
        if (!url || !(url->starts_with("http://") || url->starts_with("https://")))
            return invalid(name, "'url' must be an http:// or https:// URL");
        config.url = std::move(*url);

        if (entry.contains("headers"))
        {
            auto headers = json::toStringMap(entry["headers"], "headers");
            if (!headers)
                return invalid(name, headers.error().message);
            config.headers = std::move(*headers);
        }
    }

    return config;
}

auto parseServerRegistry(const nlohmann::json& document) -> Result<ServerRegistry>
{
    if (!document.is_object())
        return makeError(ErrorCode::ConfigurationError, "Configuration document must be a JSON object");

    auto registry = ServerRegistry {};
    if (!document.contains("mcpServers") || document["mcpServers"].is_null())
        return registry;

    auto const& servers = document["mcpServers"];
    if (!servers.is_object())
        return makeError(ErrorCode::ConfigurationError, "'mcpServers' must be an object");

    for (const auto& [name, entry]: servers.items())
    {
        auto config = parseServerConfig(name, entry);
        if (!config)
            return std::unexpected(config.error());
        registry.emplace(name, Server { .name = name, .config = std::move(*config) });
    }

    return registry;
}

auto toJson(const ServerConfig& config) -> nlohmann::json
{
    auto result = nlohmann::json::object();
    if (config.kind == ServerKind::Stdio)
    {
        result["command"] = config.command;
        if (!config.args.empty())
            result["args"] = config.args;
        if (!config.env.empty())
            result["env"] = config.env;
    }
    else
    {
        result["url"] = config.url;
        if (!config.headers.empty())
            result["headers"] = config.headers;
    }
    return result;
}

} // namespace mcprouter
