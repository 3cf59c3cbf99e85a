// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace mcprouter
{

namespace
{
    auto getEnv(std::string_view name) -> std::string
    {
        auto const* const value = std::getenv(std::string(name).c_str());
        return value ? std::string(value) : std::string {};
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r");
        return text.substr(first, last - first + 1);
    }

    auto unquote(std::string_view value) -> std::string_view
    {
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            return value.substr(1, value.size() - 2);

        // Unquoted values may carry a trailing comment.
        if (auto const hash = value.find(" #"); hash != std::string_view::npos)
            return trim(value.substr(0, hash));
        return value;
    }
} // namespace

auto RuntimeParameters::fromEnvironment() -> RuntimeParameters
{
    auto parameters = RuntimeParameters {};

    if (auto baseUrl = getEnv(EmbeddingBaseUrlVariable); !baseUrl.empty())
        parameters.embeddingBaseUrl = std::move(baseUrl);

    parameters.apiKey = getEnv(EmbeddingApiKeyVariable);

    parameters.toolIndexPath = getEnv(ToolIndexVariable);
    if (parameters.toolIndexPath.empty())
        parameters.toolIndexPath = defaultToolIndexPath();

    return parameters;
}

auto validateRuntimeParameters(const RuntimeParameters& parameters) -> VoidResult
{
    if (parameters.apiKey.empty())
    {
        return makeError(ErrorCode::ConfigurationError,
                         std::format("{} environment variable not set", EmbeddingApiKeyVariable));
    }

    if (parameters.embeddingBaseUrl.empty())
        return makeError(ErrorCode::ConfigurationError, "Embedding service base URL must not be empty");

    if (parameters.toolIndexPath.empty())
    {
        return makeError(ErrorCode::ConfigurationError,
                         std::format("{} not set and no default tool index available", ToolIndexVariable));
    }

    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(parameters.toolIndexPath, ec))
    {
        return makeError(ErrorCode::ConfigurationError,
                         std::format("Tool index not found at: {}", parameters.toolIndexPath));
    }

    if (!std::ifstream(parameters.toolIndexPath).is_open())
    {
        return makeError(ErrorCode::ConfigurationError,
                         std::format("Tool index is not readable: {}", parameters.toolIndexPath));
    }

    return {};
}

auto loadConfigDocument(const ConfigSource& source) -> Result<nlohmann::json>
{
    if (auto const* document = std::get_if<nlohmann::json>(&source))
    {
        if (!document->is_object())
            return makeError(ErrorCode::ConfigurationError, "Configuration document must be a JSON object");
        return *document;
    }

    auto const& path = std::get<std::filesystem::path>(source);
    auto ec = std::error_code {};
    if (!std::filesystem::exists(path, ec))
    {
        log::warning("Config file not found at {}. Starting with empty server list.", path.string());
        return nlohmann::json { { "mcpServers", nlohmann::json::object() } };
    }

    auto file = std::ifstream(path);
    if (!file.is_open())
        return makeError(ErrorCode::ConfigurationError, std::format("Cannot open config file: {}", path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto document = json::parse(ss.str(), ErrorCode::ConfigurationError);
    if (!document)
    {
        return makeError(ErrorCode::ConfigurationError,
                         std::format("Config file {} is not valid JSON: {}", path.string(), document.error().message));
    }

    if (!document->is_object())
        return makeError(ErrorCode::ConfigurationError, std::format("Config file {} must hold a JSON object", path.string()));

    log::debug("Loaded config file {}", path.string());
    return document;
}

auto loadDotEnv(const std::filesystem::path& path) -> Result<int>
{
    auto ec = std::error_code {};
    if (!std::filesystem::exists(path, ec))
        return 0;

    auto file = std::ifstream(path);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open env file: {}", path.string()));

    auto count = 0;
    auto lineNumber = 0;
    auto line = std::string {};
    while (std::getline(file, line))
    {
        ++lineNumber;
        auto text = trim(line);
        if (text.empty() || text.front() == '#')
            continue;

        if (text.starts_with("export "))
            text = trim(text.substr(7));

        auto const eq = text.find('=');
        if (eq == std::string_view::npos || eq == 0)
        {
            return makeError(ErrorCode::ConfigurationError,
                             std::format("{}:{}: expected KEY=VALUE", path.string(), lineNumber));
        }

        auto const key = std::string(trim(text.substr(0, eq)));
        auto const value = std::string(unquote(trim(text.substr(eq + 1))));

        if (std::getenv(key.c_str()))
            continue;

        if (::setenv(key.c_str(), value.c_str(), 0) != 0)
            return makeError(ErrorCode::IoError, std::format("Cannot set environment variable {}", key));
        ++count;
    }

    log::debug("Loaded {} variable(s) from {}", count, path.string());
    return count;
}

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/mcprouter";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcprouter";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultToolIndexPath() -> std::string
{
    return defaultConfigDir() + "/tool_index.json";
}

} // namespace mcprouter
