// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/Transport.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace mcprouter
{

/// @brief MCP server information reported during initialization.
struct McpServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    std::string protocolVersion;
    std::string serverName;
    std::string serverVersion;
};

/// @brief Client side of one Model Context Protocol session.
///
/// Handles the MCP lifecycle: initialize, call tools, close. Requests are
/// serialized, so a client may be shared between threads.
class McpClient
{
  public:
    /// @brief Protocol revision requested during initialize.
    static constexpr auto ProtocolVersion = std::string_view { "2025-03-26" };

    /// @brief Constructs an McpClient with the given transport.
    /// @param transport The transport to use for communication.
    explicit McpClient(std::unique_ptr<Transport> transport);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Performs the MCP initialize handshake.
    /// @return The server's capabilities or an error.
    [[nodiscard]] auto initialize() -> Result<McpServerCapabilities>;

    /// @brief Calls a tool on the server.
    /// @param name The tool name.
    /// @param arguments The tool arguments.
    /// @return The server's CallToolResult object, uninterpreted, or an error.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>;

    /// @brief Closes the underlying transport.
    [[nodiscard]] auto close() -> VoidResult;

    /// @brief Returns the server capabilities (valid after initialize).
    [[nodiscard]] auto capabilities() const -> const McpServerCapabilities&;

    /// @brief Returns true if the client has been initialized.
    [[nodiscard]] auto isInitialized() const -> bool;

  private:
    std::unique_ptr<Transport> _transport;
    McpServerCapabilities _capabilities;
    int64_t _nextId = 1;
    bool _initialized = false;
    mutable std::mutex _mutex;

    [[nodiscard]] auto sendRequest(std::string_view method, nlohmann::json params = nullptr)
        -> Result<nlohmann::json>;
    [[nodiscard]] auto awaitResponse(int64_t id) -> Result<nlohmann::json>;
};

} // namespace mcprouter
