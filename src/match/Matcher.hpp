// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace mcprouter
{

/// @brief A server ranked against a query.
struct ServerMatch
{
    std::string name;
    std::string summary;
    float score = 0.0f;

    auto operator==(const ServerMatch&) const -> bool = default;
};

/// @brief A tool ranked against a query.
struct ToolMatch
{
    std::string server;
    std::string tool;
    std::string description;
    nlohmann::json parameters;
    float score = 0.0f;

    auto operator==(const ToolMatch&) const -> bool = default;
};

/// @brief Ranked candidates for one query, best first.
struct MatchResult
{
    std::vector<ServerMatch> servers;
    std::vector<ToolMatch> tools;

    /// @brief Returns the best tool, or nullptr when nothing matched.
    [[nodiscard]] auto best() const -> const ToolMatch* { return tools.empty() ? nullptr : &tools.front(); }

    auto operator==(const MatchResult&) const -> bool = default;
};

/// @brief Serializes a match result as {"matched_servers": [...], "matched_tools": [...]}.
[[nodiscard]] auto toJson(const MatchResult& result) -> nlohmann::json;

/// @brief Sizing parameters of a matcher.
struct MatcherSettings
{
    int embeddingDimensions = 1024;
    int topServers = 5;
    int topTools = 3;
};

/// @brief Ranks tools across all known servers against a free-text query.
///
/// Implementations must be deterministic for a fixed index and must allow
/// concurrent match() calls once loaded.
class Matcher
{
  public:
    virtual ~Matcher() = default;

    /// @brief Sets dimensionality and candidate counts. Called before loadIndex().
    [[nodiscard]] virtual auto configure(const MatcherSettings& settings) -> VoidResult = 0;

    /// @brief Loads the precomputed tool index.
    [[nodiscard]] virtual auto loadIndex(const std::filesystem::path& path) -> VoidResult = 0;

    /// @brief Ranks servers and tools for a query.
    [[nodiscard]] virtual auto match(std::string_view query) const -> Result<MatchResult> = 0;
};

} // namespace mcprouter
