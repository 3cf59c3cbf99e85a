// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace mcprouter
{

/// @brief An established (or establishable) session to one server.
class Connection
{
  public:
    virtual ~Connection() = default;

    /// @brief Performs the session handshake. Blocks until ready or failed.
    /// @return Success or a ConnectError.
    [[nodiscard]] virtual auto connect() -> VoidResult = 0;

    /// @brief Invokes a tool on the server.
    /// @param name The tool name, passed through uninterpreted.
    /// @param params The tool arguments, passed through uninterpreted.
    /// @return The server's raw result or a CallError.
    [[nodiscard]] virtual auto callTool(std::string_view name, const nlohmann::json& params)
        -> Result<nlohmann::json> = 0;

    /// @brief Releases the session. Blocks until released or failed.
    /// @return Success or a CloseError.
    [[nodiscard]] virtual auto close() -> VoidResult = 0;
};

/// @brief Creates a transport for a server configuration.
using TransportFactory = std::function<Result<std::unique_ptr<Transport>>(const ServerConfig&)>;

/// @brief Builds the stdio or HTTP transport a configuration asks for, already started.
[[nodiscard]] auto makeTransport(const ServerConfig& config) -> Result<std::unique_ptr<Transport>>;

/// @brief Connection speaking MCP over the transport its configuration names.
class McpConnection: public Connection
{
  public:
    /// @param server The server to connect to.
    /// @param transportFactory Creates the transport on connect(); defaults to makeTransport.
    explicit McpConnection(Server server, TransportFactory transportFactory = makeTransport);
    ~McpConnection() override;

    McpConnection(const McpConnection&) = delete;
    McpConnection& operator=(const McpConnection&) = delete;

    [[nodiscard]] auto connect() -> VoidResult override;
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& params)
        -> Result<nlohmann::json> override;
    [[nodiscard]] auto close() -> VoidResult override;

    [[nodiscard]] auto serverName() const -> const std::string& { return _server.name; }

  private:
    Server _server;
    TransportFactory _transportFactory;
    std::shared_ptr<McpClient> _client;
    std::mutex _mutex;
};

} // namespace mcprouter
