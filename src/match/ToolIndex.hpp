// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace mcprouter
{

/// @brief Embedding vector as produced by the embedding service.
using Embedding = std::vector<float>;

/// @brief One tool of an indexed server.
struct IndexedTool
{
    std::string name;
    std::string description;
    nlohmann::json parameters;
    Embedding descriptionEmbedding;
};

/// @brief One server of the precomputed index.
struct IndexedServer
{
    std::string name;
    std::string summary;
    std::string description;
    Embedding summaryEmbedding;
    Embedding descriptionEmbedding;
    std::vector<IndexedTool> tools;
};

/// @brief The precomputed tool index.
struct ToolIndex
{
    std::vector<IndexedServer> servers;

    [[nodiscard]] auto toolCount() const -> size_t;
};

/// @brief Parses an index document.
///
/// The document is an array of servers, each with "server_name",
/// "server_summary", "server_description", "summary_embedding",
/// "description_embedding" and "tools" (each with "name", "description",
/// "description_embedding" and optional "parameter"). Every embedding must
/// have exactly @p dimensions entries.
/// @return The index or a ConfigurationError naming the offending entry.
[[nodiscard]] auto parseToolIndex(const nlohmann::json& document, int dimensions) -> Result<ToolIndex>;

/// @brief Reads and parses an index file.
[[nodiscard]] auto loadToolIndex(const std::filesystem::path& path, int dimensions) -> Result<ToolIndex>;

/// @brief Cosine similarity of two equally sized vectors; 0 when either is all zeros.
[[nodiscard]] auto cosineSimilarity(const Embedding& a, const Embedding& b) -> float;

} // namespace mcprouter
