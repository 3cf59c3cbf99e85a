// SPDX-License-Identifier: Apache-2.0
#include "CopilotServer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/McpClient.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <istream>
#include <ostream>
#include <string>

namespace mcprouter
{

namespace
{
    constexpr auto ServerName = std::string_view { "mcprouter" };
    constexpr auto ServerVersion = std::string_view { "0.1.0" };

    constexpr auto SupportedProtocolVersions = std::array<std::string_view, 3> {
        "2025-03-26",
        "2024-11-05",
        "2025-06-18",
    };

    auto textResult(std::string text, bool isError) -> nlohmann::json
    {
        return nlohmann::json {
            { "content", nlohmann::json::array({ { { "type", "text" }, { "text", std::move(text) } } }) },
            { "isError", isError },
        };
    }

    auto errorResult(const Error& error) -> nlohmann::json
    {
        return textResult(std::format("{}", error), true);
    }
} // namespace

CopilotServer::CopilotServer(Router& router): _router(router)
{
}

auto CopilotServer::toolDefinitions() -> nlohmann::json
{
    return nlohmann::json::array({
        {
            { "name", "route" },
            { "description",
              "Find the tools best suited to a task. Describe the task in natural language; "
              "the result lists candidate servers and tools with their parameters and scores." },
            { "inputSchema",
              {
                  { "type", "object" },
                  { "properties",
                    { { "query", { { "type", "string" }, { "description", "What the tool should do" } } } } },
                  { "required", nlohmann::json::array({ "query" }) },
              } },
        },
        {
            { "name", "execute_tool" },
            { "description", "Call a tool on one of the configured MCP servers and return its result." },
            { "inputSchema",
              {
                  { "type", "object" },
                  { "properties",
                    {
                        { "server_name", { { "type", "string" } } },
                        { "tool_name", { { "type", "string" } } },
                        { "params", { { "type", "object" } } },
                    } },
                  { "required", nlohmann::json::array({ "server_name", "tool_name" }) },
              } },
        },
    });
}

auto CopilotServer::handleMessage(const nlohmann::json& message) -> std::optional<nlohmann::json>
{
    auto const kind = jsonrpc::classify(message);

    if (kind == jsonrpc::MessageKind::Notification)
    {
        log::trace("Notification: {}", message.value("method", ""));
        return std::nullopt;
    }

    if (kind == jsonrpc::MessageKind::Response)
    {
        log::debug("Ignoring unsolicited response");
        return std::nullopt;
    }

    if (kind == jsonrpc::MessageKind::Invalid)
    {
        auto const id = message.is_object() && message.contains("id") ? message["id"] : nlohmann::json {};
        return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidRequest, "Invalid JSON-RPC request");
    }

    auto const& id = message["id"];
    auto const method = message["method"].get<std::string>();
    auto const params = message.contains("params") ? message["params"] : nlohmann::json::object();

    if (method == "initialize")
        return jsonrpc::makeResult(id, handleInitialize(params));

    if (method == "ping")
        return jsonrpc::makeResult(id, nlohmann::json::object());

    if (method == "tools/list")
        return jsonrpc::makeResult(id, nlohmann::json { { "tools", toolDefinitions() } });

    if (method == "tools/call")
        return handleToolCall(id, params);

    return jsonrpc::makeErrorResponse(
        id, jsonrpc::codes::MethodNotFound, std::format("Method not found: {}", method));
}

auto CopilotServer::handleInitialize(const nlohmann::json& params) const -> nlohmann::json
{
    auto version = json::getStringOr(params, "protocolVersion", McpClient::ProtocolVersion);
    if (std::ranges::find(SupportedProtocolVersions, version) == SupportedProtocolVersions.end())
        version = std::string(McpClient::ProtocolVersion);

    log::info("Client initialized session (protocol {}), {} server(s) available", version, _router.servers().size());

    return nlohmann::json {
        { "protocolVersion", version },
        { "capabilities", { { "tools", nlohmann::json::object() } } },
        { "serverInfo", { { "name", ServerName }, { "version", ServerVersion } } },
    };
}

auto CopilotServer::handleToolCall(const nlohmann::json& id, const nlohmann::json& params) -> nlohmann::json
{
    auto const name = json::getString(params, "name");
    if (!name)
        return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, "tools/call requires a tool name");

    auto const arguments = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();
    if (!arguments.is_object())
        return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, "Tool arguments must be an object");

    if (*name == "route")
    {
        auto const query = json::getString(arguments, "query");
        if (!query)
            return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, "route requires a 'query' string");

        auto matches = _router.route(*query);
        if (!matches)
            return jsonrpc::makeResult(id, errorResult(matches.error()));

        auto const structured = toJson(*matches);
        auto result = textResult(json::dump(structured, 2), false);
        result["structuredContent"] = structured;
        return jsonrpc::makeResult(id, std::move(result));
    }

    if (*name == "execute_tool")
    {
        auto const serverName = json::getString(arguments, "server_name");
        auto const toolName = json::getString(arguments, "tool_name");
        if (!serverName || !toolName)
        {
            return jsonrpc::makeErrorResponse(
                id, jsonrpc::codes::InvalidParams, "execute_tool requires 'server_name' and 'tool_name' strings");
        }

        auto const toolParams = arguments.contains("params") ? arguments["params"] : nlohmann::json::object();
        if (!toolParams.is_object())
            return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, "'params' must be an object");

        auto result = _router.callTool(*serverName, *toolName, toolParams);
        if (!result)
            return jsonrpc::makeResult(id, errorResult(result.error()));
        return jsonrpc::makeResult(id, std::move(*result));
    }

    return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, std::format("Unknown tool: {}", *name));
}

auto CopilotServer::run(std::istream& input, std::ostream& output) -> VoidResult
{
    auto line = std::string {};
    while (std::getline(input, line))
    {
        if (line.empty() || line == "\r")
            continue;

        auto response = std::optional<nlohmann::json> {};
        auto message = json::parse(line);
        if (!message)
        {
            log::warning("{}", message.error().message);
            response = jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::ParseError, "Parse error");
        }
        else
        {
            response = handleMessage(*message);
        }

        if (!response)
            continue;

        output << json::dump(*response) << '\n';
        output.flush();
        if (!output)
            return makeError(ErrorCode::IoError, "Failed to write response");
    }

    log::info("Input closed, stopping server");
    return {};
}

} // namespace mcprouter
