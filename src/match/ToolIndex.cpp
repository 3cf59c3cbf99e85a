// SPDX-License-Identifier: Apache-2.0
#include "ToolIndex.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <cmath>
#include <format>
#include <fstream>
#include <sstream>
#include <utility>

namespace mcprouter
{

namespace
{
    auto readEmbedding(const nlohmann::json& obj, std::string_view key, std::string_view owner, int dimensions)
        -> Result<Embedding>
    {
        auto const keyStr = std::string(key);
        if (!obj.contains(keyStr))
            return makeError(ErrorCode::ConfigurationError, std::format("{}: missing '{}'", owner, key));

        auto embedding = json::toFloatArray(obj[keyStr], key, ErrorCode::ConfigurationError);
        if (!embedding)
            return makeError(ErrorCode::ConfigurationError, std::format("{}: {}", owner, embedding.error().message));

        if (std::cmp_not_equal(embedding->size(), dimensions))
        {
            return makeError(ErrorCode::ConfigurationError,
                             std::format("{}: '{}' has {} dimensions, expected {}", owner, key, embedding->size(), dimensions));
        }
        return embedding;
    }

    auto parseTool(const nlohmann::json& toolJson, std::string_view serverName, int dimensions) -> Result<IndexedTool>
    {
        auto name = json::getString(toolJson, "name");
        if (!name)
            return makeError(ErrorCode::ConfigurationError, std::format("server '{}': tool without a name", serverName));

        auto const owner = std::format("tool '{}/{}'", serverName, *name);
        auto embedding = readEmbedding(toolJson, "description_embedding", owner, dimensions);
        if (!embedding)
            return std::unexpected(embedding.error());

        return IndexedTool {
            .name = std::move(*name),
            .description = json::getStringOr(toolJson, "description", ""),
            .parameters = toolJson.value("parameter", nlohmann::json::object()),
            .descriptionEmbedding = std::move(*embedding),
        };
    }
} // namespace

auto ToolIndex::toolCount() const -> size_t
{
    auto count = size_t { 0 };
    for (const auto& server: servers)
        count += server.tools.size();
    return count;
}

auto parseToolIndex(const nlohmann::json& document, int dimensions) -> Result<ToolIndex>
{
    if (!document.is_array())
        return makeError(ErrorCode::ConfigurationError, "Tool index must be a JSON array of servers");

    auto index = ToolIndex {};
    index.servers.reserve(document.size());

    for (const auto& serverJson: document)
    {
        auto name = json::getString(serverJson, "server_name");
        if (!name)
            return makeError(ErrorCode::ConfigurationError, "Tool index entry without 'server_name'");

        auto const owner = std::format("server '{}'", *name);
        auto server = IndexedServer {
            .name = *name,
            .summary = json::getStringOr(serverJson, "server_summary", ""),
            .description = json::getStringOr(serverJson, "server_description", ""),
        };

        auto description = readEmbedding(serverJson, "description_embedding", owner, dimensions);
        if (!description)
            return std::unexpected(description.error());
        server.descriptionEmbedding = std::move(*description);

        // Older indexes carry no summary embedding; the description then stands alone.
        if (serverJson.contains("summary_embedding"))
        {
            auto summary = readEmbedding(serverJson, "summary_embedding", owner, dimensions);
            if (!summary)
                return std::unexpected(summary.error());
            server.summaryEmbedding = std::move(*summary);
        }

        if (serverJson.contains("tools"))
        {
            if (!serverJson["tools"].is_array())
                return makeError(ErrorCode::ConfigurationError, std::format("{}: 'tools' must be an array", owner));

            for (const auto& toolJson: serverJson["tools"])
            {
                auto tool = parseTool(toolJson, server.name, dimensions);
                if (!tool)
                    return std::unexpected(tool.error());
                server.tools.push_back(std::move(*tool));
            }
        }

        index.servers.push_back(std::move(server));
    }

    return index;
}

auto loadToolIndex(const std::filesystem::path& path, int dimensions) -> Result<ToolIndex>
{
    auto file = std::ifstream(path);
    if (!file.is_open())
        return makeError(ErrorCode::ConfigurationError, std::format("Cannot open tool index: {}", path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto document = json::parse(ss.str(), ErrorCode::ConfigurationError);
    if (!document)
    {
        return makeError(ErrorCode::ConfigurationError,
                         std::format("Tool index {} is not valid JSON: {}", path.string(), document.error().message));
    }

    auto index = parseToolIndex(*document, dimensions);
    if (index)
        log::info("Loaded tool index {}: {} servers, {} tools", path.string(), index->servers.size(), index->toolCount());
    return index;
}

auto cosineSimilarity(const Embedding& a, const Embedding& b) -> float
{
    if (a.size() != b.size() || a.empty())
        return 0.0f;

    auto dot = 0.0;
    auto normA = 0.0;
    auto normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i)
    {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }

    auto const denom = std::sqrt(normA) * std::sqrt(normB);
    return denom > 0.0 ? static_cast<float>(dot / denom) : 0.0f;
}

} // namespace mcprouter
