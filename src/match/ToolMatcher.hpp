// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <match/EmbeddingClient.hpp>
#include <match/Matcher.hpp>
#include <match/ToolIndex.hpp>

#include <memory>
#include <optional>

namespace mcprouter
{

/// @brief Two-stage semantic matcher over a precomputed tool index.
///
/// Servers are ranked first by the better of their summary and description
/// similarity to the query; only tools of the top servers are then ranked.
/// A tool's final score is (s * t) * max(s, t), where s is its server's
/// score and t its own description similarity.
class ToolMatcher: public Matcher
{
  public:
    explicit ToolMatcher(std::shared_ptr<const EmbeddingClient> embeddings);

    [[nodiscard]] auto configure(const MatcherSettings& settings) -> VoidResult override;
    [[nodiscard]] auto loadIndex(const std::filesystem::path& path) -> VoidResult override;
    [[nodiscard]] auto match(std::string_view query) const -> Result<MatchResult> override;

    /// @brief Installs an already parsed index.
    [[nodiscard]] auto setIndex(ToolIndex index) -> VoidResult;

    [[nodiscard]] auto settings() const -> const MatcherSettings& { return _settings; }

  private:
    std::shared_ptr<const EmbeddingClient> _embeddings;
    MatcherSettings _settings;
    std::optional<ToolIndex> _index;
};

} // namespace mcprouter
