// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <format>

namespace mcprouter
{

McpClient::McpClient(std::unique_ptr<Transport> transport): _transport(std::move(transport))
{
}

McpClient::~McpClient() = default;

auto McpClient::initialize() -> Result<McpServerCapabilities>
{
    auto const lock = std::lock_guard(_mutex);

    if (_initialized)
        return _capabilities;

    auto params = nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", "mcprouter" },
              { "version", "0.1.0" },
          } },
    };

    return sendRequest("initialize", std::move(params))
        .and_then([this](const nlohmann::json& result) -> Result<McpServerCapabilities> {
            if (!result.is_object())
                return makeError(ErrorCode::ProtocolError, "initialize result must be an object");

            auto const serverInfo = result.contains("serverInfo") ? result["serverInfo"] : nlohmann::json::object();
            _capabilities.protocolVersion = json::getStringOr(result, "protocolVersion", "");
            _capabilities.serverName = json::getStringOr(serverInfo, "name", "unknown");
            _capabilities.serverVersion = json::getStringOr(serverInfo, "version", "unknown");

            if (result.contains("capabilities") && result["capabilities"].is_object())
            {
                auto const& caps = result["capabilities"];
                _capabilities.hasTools = caps.contains("tools");
                _capabilities.hasResources = caps.contains("resources");
                _capabilities.hasPrompts = caps.contains("prompts");
            }

            if (auto sent = _transport->send(jsonrpc::makeNotification("notifications/initialized")); !sent)
                return std::unexpected(sent.error());

            _initialized = true;
            log::debug("MCP session ready: {} v{} (protocol {})",
                       _capabilities.serverName,
                       _capabilities.serverVersion,
                       _capabilities.protocolVersion);

            return _capabilities;
        });
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    auto const lock = std::lock_guard(_mutex);

    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    return sendRequest("tools/call", std::move(params)).transform([&name](nlohmann::json result) {
        log::trace("Tool '{}' returned: {}", name, json::dump(result));
        return result;
    });
}

auto McpClient::close() -> VoidResult
{
    auto const lock = std::lock_guard(_mutex);
    _initialized = false;
    return _transport->close();
}

auto McpClient::capabilities() const -> const McpServerCapabilities&
{
    return _capabilities;
}

auto McpClient::isInitialized() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _initialized;
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>
{
    auto const id = _nextId++;
    auto request = jsonrpc::makeRequest(id, method, std::move(params));

    try
    {
        return _transport->send(request).and_then([this, id]() { return awaitResponse(id); });
    }
    catch (const nlohmann::json::exception& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("Malformed message in '{}' exchange: {}", method, e.what()));
    }
}

auto McpClient::awaitResponse(int64_t id) -> Result<nlohmann::json>
{
    while (true)
    {
        auto message = _transport->receive();
        if (!message)
            return std::unexpected(message.error());

        switch (jsonrpc::classify(*message))
        {
            case jsonrpc::MessageKind::Notification:
                log::trace("Ignoring server notification: {}", message->value("method", ""));
                continue;

            case jsonrpc::MessageKind::Request: {
                // The only server-initiated request we answer is ping.
                auto const& requestId = (*message)["id"];
                auto const reply = (*message)["method"] == "ping"
                                       ? jsonrpc::makeResult(requestId, nlohmann::json::object())
                                       : jsonrpc::makeErrorResponse(
                                             requestId, jsonrpc::codes::MethodNotFound, "Method not supported");
                if (auto sent = _transport->send(reply); !sent)
                    return std::unexpected(sent.error());
                continue;
            }

            case jsonrpc::MessageKind::Invalid:
                return makeError(ErrorCode::ProtocolError,
                                 std::format("Invalid JSON-RPC message: {}", json::dump(*message)));

            case jsonrpc::MessageKind::Response: break;
        }

        auto response = jsonrpc::parseResponse(*message);
        if (!response)
            return std::unexpected(response.error());

        if (response->id != id)
        {
            log::warning("Discarding response with unexpected id {} (waiting for {})", json::dump(response->id), id);
            continue;
        }

        if (response->error)
        {
            return makeError(ErrorCode::ProtocolError,
                             std::format("RPC error {}: {}", response->error->code, response->error->message));
        }

        return response->result.value_or(nlohmann::json::object());
    }
}

} // namespace mcprouter
