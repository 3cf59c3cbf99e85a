// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <match/ToolIndex.hpp>

#include <chrono>
#include <string>

namespace mcprouter
{

/// @brief Turns text into an embedding vector.
class EmbeddingClient
{
  public:
    virtual ~EmbeddingClient() = default;

    /// @brief Embeds one text. Must be safe to call from several threads.
    /// @return The embedding or an EmbeddingError.
    [[nodiscard]] virtual auto embed(std::string_view text) const -> Result<Embedding> = 0;
};

/// @brief Connection settings of an OpenAI-compatible embedding service.
struct EmbeddingServiceConfig
{
    std::string baseUrl;
    std::string apiKey;
    std::string model = "text-embedding-v4";
    int dimensions = 1024;
    std::chrono::milliseconds timeout = std::chrono::seconds(30);
};

/// @brief Embedding client for the OpenAI-compatible POST /embeddings endpoint.
class OpenAiEmbeddingClient: public EmbeddingClient
{
  public:
    explicit OpenAiEmbeddingClient(EmbeddingServiceConfig config);

    [[nodiscard]] auto embed(std::string_view text) const -> Result<Embedding> override;

    [[nodiscard]] auto config() const -> const EmbeddingServiceConfig& { return _config; }

  private:
    EmbeddingServiceConfig _config;
};

/// @brief Builds the request body for an embeddings call.
[[nodiscard]] auto makeEmbeddingRequest(const EmbeddingServiceConfig& config, std::string_view text) -> nlohmann::json;

/// @brief Extracts the first embedding from an embeddings response body.
/// @return The embedding or an EmbeddingError (including service-reported errors).
[[nodiscard]] auto parseEmbeddingResponse(const nlohmann::json& response) -> Result<Embedding>;

} // namespace mcprouter
