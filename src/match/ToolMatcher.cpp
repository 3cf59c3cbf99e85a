// SPDX-License-Identifier: Apache-2.0
#include "ToolMatcher.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace mcprouter
{

namespace
{
    auto isBlank(std::string_view text) -> bool
    {
        return std::ranges::all_of(text, [](unsigned char c) { return std::isspace(c) != 0; });
    }

    struct ScoredServer
    {
        const IndexedServer* server = nullptr;
        float score = 0.0f;
    };
} // namespace

ToolMatcher::ToolMatcher(std::shared_ptr<const EmbeddingClient> embeddings): _embeddings(std::move(embeddings))
{
}

auto ToolMatcher::configure(const MatcherSettings& settings) -> VoidResult
{
    if (settings.embeddingDimensions <= 0 || settings.topServers <= 0 || settings.topTools <= 0)
    {
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Matcher settings must be positive (dimensions {}, servers {}, tools {})",
                                     settings.embeddingDimensions,
                                     settings.topServers,
                                     settings.topTools));
    }

    if (_index && settings.embeddingDimensions != _settings.embeddingDimensions)
        return makeError(ErrorCode::InvalidArgument, "Cannot change dimensions after an index was loaded");

    _settings = settings;
    return {};
}

auto ToolMatcher::loadIndex(const std::filesystem::path& path) -> VoidResult
{
    auto index = loadToolIndex(path, _settings.embeddingDimensions);
    if (!index)
        return std::unexpected(index.error());
    return setIndex(std::move(*index));
}

auto ToolMatcher::setIndex(ToolIndex index) -> VoidResult
{
    auto const fits = [this](const Embedding& e) {
        return std::cmp_equal(e.size(), _settings.embeddingDimensions);
    };

    for (const auto& server: index.servers)
    {
        auto const summaryFits = server.summaryEmbedding.empty() || fits(server.summaryEmbedding);
        auto const toolsFit = std::ranges::all_of(
            server.tools, [&fits](const IndexedTool& tool) { return fits(tool.descriptionEmbedding); });
        if (!fits(server.descriptionEmbedding) || !summaryFits || !toolsFit)
        {
            return makeError(ErrorCode::ConfigurationError,
                             std::format("Index entry '{}' does not have {} dimensions",
                                         server.name,
                                         _settings.embeddingDimensions));
        }
    }

    _index = std::move(index);
    return {};
}

auto ToolMatcher::match(std::string_view query) const -> Result<MatchResult>
{
    if (!_index)
        return makeError(ErrorCode::MatchError, "No tool index loaded");
    if (isBlank(query))
        return makeError(ErrorCode::InvalidArgument, "Query must not be empty");
    if (!_embeddings)
        return makeError(ErrorCode::MatchError, "No embedding client configured");

    auto queryEmbedding = _embeddings->embed(query);
    if (!queryEmbedding)
        return std::unexpected(queryEmbedding.error());

    auto scored = std::vector<ScoredServer> {};
    scored.reserve(_index->servers.size());
    for (const auto& server: _index->servers)
    {
        auto score = cosineSimilarity(*queryEmbedding, server.descriptionEmbedding);
        if (!server.summaryEmbedding.empty())
            score = std::max(score, cosineSimilarity(*queryEmbedding, server.summaryEmbedding));
        scored.push_back(ScoredServer { .server = &server, .score = score });
    }

    std::ranges::sort(scored, [](const ScoredServer& a, const ScoredServer& b) {
        if (a.score != b.score)
            return a.score > b.score;
        return a.server->name < b.server->name;
    });
    if (std::cmp_greater(scored.size(), _settings.topServers))
        scored.resize(static_cast<size_t>(_settings.topServers));

    auto result = MatchResult {};
    for (const auto& [server, serverScore]: scored)
    {
        result.servers.push_back(ServerMatch { .name = server->name, .summary = server->summary, .score = serverScore });

        for (const auto& tool: server->tools)
        {
            auto const toolScore = cosineSimilarity(*queryEmbedding, tool.descriptionEmbedding);
            result.tools.push_back(ToolMatch {
                .server = server->name,
                .tool = tool.name,
                .description = tool.description,
                .parameters = tool.parameters,
                .score = (serverScore * toolScore) * std::max(serverScore, toolScore),
            });
        }
    }

    std::ranges::sort(result.tools, [](const ToolMatch& a, const ToolMatch& b) {
        if (a.score != b.score)
            return a.score > b.score;
        if (a.server != b.server)
            return a.server < b.server;
        return a.tool < b.tool;
    });
    if (std::cmp_greater(result.tools.size(), _settings.topTools))
        result.tools.resize(static_cast<size_t>(_settings.topTools));

    if (auto const* best = result.best())
        log::debug("Best match for '{}': {}/{} ({:.4f})", query, best->server, best->tool, best->score);

    return result;
}

} // namespace mcprouter
