// SPDX-License-Identifier: Apache-2.0
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcprouter/Config.hpp>
#include <mcprouter/CopilotServer.hpp>
#include <router/Router.hpp>
#include <router/RouterScope.hpp>

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <format>
#include <iostream>
#include <print>

namespace
{

auto applyLogLevel(const std::string& logLevel, bool verbose) -> bool
{
    if (auto const* value = std::getenv(mcprouter::LogLevelVariable.data()); value && *value)
    {
        if (auto const level = mcprouter::log::parseLevel(value))
            mcprouter::log::setLevel(*level);
        else
            mcprouter::log::warning("Ignoring unknown log level '{}' in {}", value, mcprouter::LogLevelVariable);
    }

    if (verbose)
        mcprouter::log::setLevel(mcprouter::log::Level::Debug);

    if (!logLevel.empty())
    {
        auto const level = mcprouter::log::parseLevel(logLevel);
        if (!level)
        {
            mcprouter::log::error("Unknown log level '{}'", logLevel);
            return false;
        }
        mcprouter::log::setLevel(*level);
    }
    return true;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcprouter - routes tasks to MCP tools and calls them over lazy connections" };
    app.require_subcommand(1);

    auto configPath = mcprouter::defaultConfigPath();
    auto envFile = std::string { ".env" };
    auto logLevel = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to the MCP server configuration")->capture_default_str();
    app.add_option("--env-file", envFile, "Dotenv file loaded before reading the environment")
        ->capture_default_str();
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    auto query = std::string {};
    auto* routeCommand = app.add_subcommand("route", "Rank the tools best suited to a query");
    routeCommand->add_option("query", query, "Task description")->required();

    auto serverName = std::string {};
    auto toolName = std::string {};
    auto paramsText = std::string { "{}" };
    auto* callCommand = app.add_subcommand("call", "Call a tool on a configured server");
    callCommand->add_option("server", serverName, "Server name")->required();
    callCommand->add_option("tool", toolName, "Tool name")->required();
    callCommand->add_option("--params", paramsText, "Tool arguments as a JSON object")->capture_default_str();

    auto* serversCommand = app.add_subcommand("servers", "List the configured servers");
    auto* serveCommand = app.add_subcommand("serve", "Serve route and execute_tool as an MCP server on stdio");

    CLI11_PARSE(app, argc, argv);

    if (auto loaded = mcprouter::loadDotEnv(envFile); !loaded)
    {
        mcprouter::log::error("Failed to load {}: {}", envFile, loaded.error().message);
        return 1;
    }
    else if (*loaded > 0)
    {
        mcprouter::log::debug("Loaded {} variable(s) from {}", *loaded, envFile);
    }

    if (!applyLogLevel(logLevel, verbose))
        return 1;

    auto router = mcprouter::Router::create(std::filesystem::path(configPath),
                                            mcprouter::RuntimeParameters::fromEnvironment());
    if (!router)
    {
        mcprouter::log::error("{}", router.error());
        return 1;
    }

    auto scope = mcprouter::RouterScope(**router);
    auto exitCode = 0;

    if (routeCommand->parsed())
    {
        auto matches = scope->route(query);
        if (!matches)
        {
            mcprouter::log::error("{}", matches.error());
            exitCode = 1;
        }
        else
        {
            std::println("{}", mcprouter::json::dump(mcprouter::toJson(*matches), 2));
        }
    }
    else if (callCommand->parsed())
    {
        auto params = mcprouter::json::parse(paramsText, mcprouter::ErrorCode::InvalidArgument);
        if (!params || !params->is_object())
        {
            mcprouter::log::error("--params must be a JSON object");
            exitCode = 1;
        }
        else if (auto result = scope->callTool(serverName, toolName, *params); !result)
        {
            mcprouter::log::error("{}", result.error());
            exitCode = 1;
        }
        else
        {
            std::println("{}", mcprouter::json::dump(*result, 2));
        }
    }
    else if (serversCommand->parsed())
    {
        auto listing = nlohmann::json::object();
        for (const auto& [name, server]: scope->servers())
            listing[name] = mcprouter::toJson(server.config);
        std::println("{}", mcprouter::json::dump(listing, 2));
    }
    else if (serveCommand->parsed())
    {
        auto server = mcprouter::CopilotServer(scope.router());
        if (auto served = server.run(std::cin, std::cout); !served)
        {
            mcprouter::log::error("{}", served.error());
            exitCode = 1;
        }
    }

    if (auto closed = scope.release(); !closed)
    {
        mcprouter::log::error("{}", closed.error());
        exitCode = 1;
    }

    return exitCode;
}
