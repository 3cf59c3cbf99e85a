// SPDX-License-Identifier: Apache-2.0
#include "Connection.hpp"

#include <core/Log.hpp>
#include <mcp/HttpTransport.hpp>
#include <mcp/StdioTransport.hpp>

#include <format>

namespace mcprouter
{

auto makeTransport(const ServerConfig& config) -> Result<std::unique_ptr<Transport>>
{
    if (config.kind == ServerKind::Http)
    {
        return std::make_unique<HttpTransport>(HttpTransportConfig {
            .url = config.url,
            .headers = http::Headers(config.headers.begin(), config.headers.end()),
        });
    }

    auto transport = std::make_unique<StdioTransport>();
    auto started = transport->start(StdioTransportConfig {
        .command = config.command,
        .args = config.args,
        .env = config.env,
    });
    if (!started)
        return std::unexpected(started.error());

    return transport;
}

McpConnection::McpConnection(Server server, TransportFactory transportFactory):
    _server(std::move(server)), _transportFactory(std::move(transportFactory))
{
}

McpConnection::~McpConnection()
{
    if (auto result = close(); !result)
        log::warning("{}", result.error().message);
}

auto McpConnection::connect() -> VoidResult
{
    auto const lock = std::lock_guard(_mutex);
    if (_client)
        return makeError(ErrorCode::ConnectError, std::format("Server '{}' is already connected", _server.name));

    auto transport = _transportFactory(_server.config);
    if (!transport)
    {
        return makeError(ErrorCode::ConnectError,
                         std::format("Cannot reach server '{}': {}", _server.name, transport.error().message));
    }

    auto client = std::make_shared<McpClient>(std::move(*transport));
    auto capabilities = client->initialize();
    if (!capabilities)
    {
        if (auto closed = client->close(); !closed)
            log::debug("Discarding half-open session to '{}': {}", _server.name, closed.error().message);
        return makeError(ErrorCode::ConnectError,
                         std::format("Handshake with server '{}' failed: {}", _server.name, capabilities.error().message));
    }

    if (!capabilities->hasTools)
        log::warning("Server '{}' does not advertise the tools capability", _server.name);

    _client = std::move(client);
    log::info("Connected to server '{}' ({} v{})", _server.name, capabilities->serverName, capabilities->serverVersion);
    return {};
}

auto McpConnection::callTool(std::string_view name, const nlohmann::json& params) -> Result<nlohmann::json>
{
    auto client = std::shared_ptr<McpClient> {};
    {
        auto const lock = std::lock_guard(_mutex);
        client = _client;
    }

    if (!client)
        return makeError(ErrorCode::CallError, std::format("Server '{}' is not connected", _server.name));

    auto result = client->callTool(name, params);
    if (!result)
    {
        return makeError(ErrorCode::CallError,
                         std::format("Tool '{}' on server '{}' failed: {}", name, _server.name, result.error().message));
    }
    return result;
}

auto McpConnection::close() -> VoidResult
{
    auto client = std::shared_ptr<McpClient> {};
    {
        auto const lock = std::lock_guard(_mutex);
        client = std::move(_client);
    }

    if (!client)
        return {};

    // Waits for an in-flight call on this client to finish.
    auto result = client->close();
    if (!result)
    {
        return makeError(ErrorCode::CloseError,
                         std::format("Closing server '{}' failed: {}", _server.name, result.error().message));
    }

    log::debug("Closed connection to server '{}'", _server.name);
    return {};
}

} // namespace mcprouter
