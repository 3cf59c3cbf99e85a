// SPDX-License-Identifier: Apache-2.0
#include "Router.hpp"

#include <core/Log.hpp>
#include <match/EmbeddingClient.hpp>
#include <match/ToolMatcher.hpp>

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

namespace mcprouter
{

auto makeDefaultMatcher(const RuntimeParameters& runtime) -> Result<std::unique_ptr<Matcher>>
{
    auto embeddings = std::make_shared<OpenAiEmbeddingClient>(EmbeddingServiceConfig {
        .baseUrl = runtime.embeddingBaseUrl,
        .apiKey = runtime.apiKey,
        .dimensions = Router::DefaultMatcherSettings.embeddingDimensions,
    });
    return std::make_unique<ToolMatcher>(std::move(embeddings));
}

auto Router::create(const ConfigSource& source, const RuntimeParameters& runtime, RouterDependencies dependencies)
    -> Result<std::unique_ptr<Router>>
{
    auto document = loadConfigDocument(source);
    if (!document)
        return std::unexpected(document.error());

    auto servers = parseServerRegistry(*document);
    if (!servers)
        return std::unexpected(servers.error());

    if (auto valid = validateRuntimeParameters(runtime); !valid)
        return std::unexpected(valid.error());

    if (!dependencies.makeMatcher)
        dependencies.makeMatcher = makeDefaultMatcher;
    if (!dependencies.makeConnection)
        dependencies.makeConnection = [](const Server& server) { return std::make_unique<McpConnection>(server); };

    auto matcher = dependencies.makeMatcher(runtime);
    if (!matcher)
        return std::unexpected(matcher.error());
    if (!*matcher)
        return makeError(ErrorCode::ConfigurationError, "Matcher factory returned no matcher");

    if (auto configured = (*matcher)->configure(DefaultMatcherSettings); !configured)
    {
        return makeError(ErrorCode::ConfigurationError,
                         std::format("Cannot configure matcher: {}", configured.error().message));
    }

    if (auto loaded = (*matcher)->loadIndex(runtime.toolIndexPath); !loaded)
    {
        return makeError(ErrorCode::ConfigurationError,
                         std::format("Cannot load tool index {}: {}", runtime.toolIndexPath, loaded.error().message));
    }

    log::info("Router ready with {} configured server(s)", servers->size());
    return std::unique_ptr<Router>(
        new Router(std::move(*servers), std::move(*matcher), std::move(dependencies.makeConnection)));
}

Router::Router(ServerRegistry servers, std::unique_ptr<Matcher> matcher, ConnectionFactory makeConnection):
    _servers(std::move(servers)), _matcher(std::move(matcher)), _makeConnection(std::move(makeConnection))
{
}

Router::~Router()
{
    if (auto result = shutdown(); !result)
        log::error("{}", result.error().message);
}

auto Router::route(std::string_view query) const -> Result<MatchResult>
{
    try
    {
        return _matcher->match(query);
    }
    catch (const std::exception& e)
    {
        return makeError(ErrorCode::MatchError, std::format("Matching '{}' failed: {}", query, e.what()));
    }
}

auto Router::callTool(std::string_view serverName, std::string_view toolName, const nlohmann::json& params)
    -> Result<nlohmann::json>
{
    auto const it = _servers.find(serverName);
    if (it == _servers.end())
    {
        return makeError(ErrorCode::UnknownServerError,
                         std::format("Server '{}' is not defined in the configuration", serverName));
    }

    auto connection = acquireConnection(it->second);
    if (!connection)
        return std::unexpected(connection.error());

    log::debug("Calling {}/{}", serverName, toolName);
    try
    {
        return (*connection)->callTool(toolName, params.is_null() ? nlohmann::json::object() : params);
    }
    catch (const std::exception& e)
    {
        return makeError(ErrorCode::CallError, std::format("{}/{} failed: {}", serverName, toolName, e.what()));
    }
}

auto Router::acquireConnection(const Server& server) -> ConnectOutcome
{
    auto promise = std::promise<ConnectOutcome> {};
    {
        auto lock = std::unique_lock(_poolMutex);
        auto& entry = _pool[server.name];

        switch (entry.state)
        {
            case ConnectionState::Established: return entry.connection;

            case ConnectionState::Connecting: {
                auto pending = entry.pending;
                lock.unlock();
                log::debug("Waiting for the pending connection to server '{}'", server.name);
                return pending.get();
            }

            case ConnectionState::Absent:
            case ConnectionState::Failed: break;
        }

        entry.state = ConnectionState::Connecting;
        entry.connection.reset();
        entry.pending = promise.get_future().share();
    }

    auto outcome = connect(server);

    {
        auto const lock = std::lock_guard(_poolMutex);
        auto& entry = _pool[server.name];
        entry.pending = {};
        if (outcome)
        {
            entry.state = ConnectionState::Established;
            entry.connection = *outcome;
        }
        else
        {
            entry.state = ConnectionState::Failed;
        }
    }
    _poolSettled.notify_all();

    promise.set_value(outcome);
    return outcome;
}

auto Router::connect(const Server& server) -> ConnectOutcome
{
    log::info("Connection to server '{}' not found, connecting on demand...", server.name);

    // Never throws: the caller settles the pool entry from the returned outcome.
    try
    {
        auto connection = std::shared_ptr<Connection>(_makeConnection(server));
        if (!connection)
        {
            return makeError(ErrorCode::ConnectError,
                             std::format("No connection available for server '{}'", server.name));
        }

        if (auto connected = connection->connect(); !connected)
        {
            if (connected.error().code == ErrorCode::ConnectError)
                return std::unexpected(connected.error());
            return makeError(ErrorCode::ConnectError,
                             std::format("Connecting to server '{}' failed: {}", server.name, connected.error().message));
        }

        return connection;
    }
    catch (const std::exception& e)
    {
        return makeError(ErrorCode::ConnectError,
                         std::format("Connecting to server '{}' failed: {}", server.name, e.what()));
    }
}

auto Router::shutdown() -> VoidResult
{
    auto established = std::vector<std::pair<std::string, std::shared_ptr<Connection>>> {};
    {
        auto lock = std::unique_lock(_poolMutex);
        _poolSettled.wait(lock, [this] {
            return std::ranges::none_of(
                _pool, [](const auto& item) { return item.second.state == ConnectionState::Connecting; });
        });

        for (auto& [name, entry]: _pool)
        {
            if (entry.state == ConnectionState::Established)
                established.emplace_back(name, std::move(entry.connection));
        }
        _pool.clear();
    }

    if (established.empty())
        return {};

    log::info("Closing {} connection(s)", established.size());

    auto closes = std::vector<std::future<VoidResult>> {};
    closes.reserve(established.size());
    for (const auto& [name, connection]: established)
        closes.push_back(std::async(std::launch::async, [connection] { return connection->close(); }));

    auto failures = std::vector<std::string> {};
    for (size_t i = 0; i < closes.size(); ++i)
    {
        auto const result = closes[i].get();
        if (!result)
        {
            log::warning("Closing server '{}' failed: {}", established[i].first, result.error().message);
            failures.push_back(std::format("{}: {}", established[i].first, result.error().message));
        }
    }

    if (failures.empty())
        return {};

    auto message = std::format("Failed to close {} of {} connection(s)", failures.size(), established.size());
    for (const auto& failure: failures)
        message += std::format("; {}", failure);
    return makeError(ErrorCode::CloseError, std::move(message));
}

auto Router::servers() const -> const ServerRegistry&
{
    return _servers;
}

auto Router::hasServer(std::string_view name) const -> bool
{
    return _servers.contains(name);
}

auto Router::connectionState(std::string_view name) const -> ConnectionState
{
    auto const lock = std::lock_guard(_poolMutex);
    auto const it = _pool.find(name);
    return it != _pool.end() ? it->second.state : ConnectionState::Absent;
}

auto Router::connectionCount() const -> size_t
{
    auto const lock = std::lock_guard(_poolMutex);
    return static_cast<size_t>(std::ranges::count_if(
        _pool, [](const auto& item) { return item.second.state == ConnectionState::Established; }));
}

} // namespace mcprouter
