// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <match/Matcher.hpp>
#include <mcp/Connection.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcprouter/Config.hpp>

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcprouter
{

/// @brief Lifecycle of the connection to one server.
enum class ConnectionState : std::uint8_t
{
    Absent,      ///< Never connected, or cleared by shutdown.
    Connecting,  ///< A handshake is in flight; other callers wait for it.
    Established, ///< Connected and reused by every later call.
    Failed,      ///< The last handshake failed; the next call tries again.
};

/// @brief Returns the name of a connection state.
[[nodiscard]] constexpr auto connectionStateName(ConnectionState state) -> std::string_view
{
    switch (state)
    {
        case ConnectionState::Absent: return "absent";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Established: return "established";
        case ConnectionState::Failed: return "failed";
    }
    return "unknown";
}

/// @brief Creates an unconnected Connection for a server.
using ConnectionFactory = std::function<std::unique_ptr<Connection>(const Server&)>;

/// @brief Creates the matcher from the runtime parameters.
using MatcherFactory = std::function<Result<std::unique_ptr<Matcher>>(const RuntimeParameters&)>;

/// @brief Collaborators of a Router. Empty members select the production implementations.
struct RouterDependencies
{
    MatcherFactory makeMatcher;
    ConnectionFactory makeConnection;
};

/// @brief Builds the production matcher: a ToolMatcher backed by the OpenAI-compatible embedding service.
[[nodiscard]] auto makeDefaultMatcher(const RuntimeParameters& runtime) -> Result<std::unique_ptr<Matcher>>;

/// @brief Routes queries to tools and invokes tools over lazily established, shared connections.
///
/// Connections are opened on the first call that targets a server and reused
/// afterwards. At most one connection per server exists at any time:
/// concurrent first calls to the same server share one handshake.
/// A dead connection is not recovered; its calls fail until shutdown().
///
/// All member functions are safe to call concurrently.
class Router
{
  public:
    /// @brief Matcher sizing applied to every router.
    static constexpr auto DefaultMatcherSettings = MatcherSettings {
        .embeddingDimensions = 1024,
        .topServers = 5,
        .topTools = 3,
    };

    /// @brief Builds a router. Opens no connections.
    ///
    /// Fails with ConfigurationError on a malformed server entry, a missing
    /// credential, or a missing/unreadable/unloadable tool index. A config
    /// path that does not exist yields a router without servers.
    /// @param source The server configuration document or file.
    /// @param runtime Embedding service and index parameters.
    /// @param dependencies Optional replacements for the matcher and connections.
    [[nodiscard]] static auto create(const ConfigSource& source,
                                     const RuntimeParameters& runtime,
                                     RouterDependencies dependencies = {}) -> Result<std::unique_ptr<Router>>;

    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    /// @brief Ranks tools for a query. Never touches a connection.
    /// @return The matcher's result, unchanged.
    [[nodiscard]] auto route(std::string_view query) const -> Result<MatchResult>;

    /// @brief Invokes a tool, connecting to its server first if needed.
    /// @param serverName A server of the registry.
    /// @param toolName Passed through to the connection.
    /// @param params Passed through to the connection; null means no arguments.
    /// @return The connection's result verbatim, or UnknownServerError, ConnectError, CallError.
    [[nodiscard]] auto callTool(std::string_view serverName,
                                std::string_view toolName,
                                const nlohmann::json& params = nlohmann::json::object()) -> Result<nlohmann::json>;

    /// @brief Closes every established connection concurrently and empties the pool.
    ///
    /// Every close is attempted even if others fail. Waits for in-flight
    /// handshakes to settle first. The router stays usable: later calls
    /// connect afresh.
    /// @return Success, or a CloseError naming every server whose close failed.
    [[nodiscard]] auto shutdown() -> VoidResult;

    /// @brief The configured servers.
    [[nodiscard]] auto servers() const -> const ServerRegistry&;

    [[nodiscard]] auto hasServer(std::string_view name) const -> bool;

    [[nodiscard]] auto connectionState(std::string_view name) const -> ConnectionState;

    /// @brief Number of established connections.
    [[nodiscard]] auto connectionCount() const -> size_t;

  private:
    using ConnectOutcome = Result<std::shared_ptr<Connection>>;

    struct PoolEntry
    {
        ConnectionState state = ConnectionState::Absent;
        std::shared_ptr<Connection> connection;
        std::shared_future<ConnectOutcome> pending;
    };

    Router(ServerRegistry servers, std::unique_ptr<Matcher> matcher, ConnectionFactory makeConnection);

    [[nodiscard]] auto acquireConnection(const Server& server) -> ConnectOutcome;
    [[nodiscard]] auto connect(const Server& server) -> ConnectOutcome;

    ServerRegistry _servers;
    std::unique_ptr<Matcher> _matcher;
    ConnectionFactory _makeConnection;

    mutable std::mutex _poolMutex;
    std::condition_variable _poolSettled;
    std::map<std::string, PoolEntry, std::less<>> _pool;
};

} // namespace mcprouter
