// SPDX-License-Identifier: Apache-2.0
#include "EmbeddingClient.hpp"

#include <core/Http.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <utility>

namespace mcprouter
{

auto makeEmbeddingRequest(const EmbeddingServiceConfig& config, std::string_view text) -> nlohmann::json
{
    return nlohmann::json {
        { "model", config.model },
        { "input", text },
        { "dimensions", config.dimensions },
        { "encoding_format", "float" },
    };
}

auto parseEmbeddingResponse(const nlohmann::json& response) -> Result<Embedding>
{
    if (response.contains("error"))
    {
        auto const& err = response["error"];
        auto const message = err.is_object() ? json::getStringOr(err, "message", json::dump(err)) : json::dump(err);
        return makeError(ErrorCode::EmbeddingError, std::format("Embedding service error: {}", message));
    }

    if (!response.contains("data") || !response["data"].is_array() || response["data"].empty())
        return makeError(ErrorCode::EmbeddingError, "Embedding response carries no data");

    auto const& first = response["data"][0];
    if (!first.is_object() || !first.contains("embedding"))
        return makeError(ErrorCode::EmbeddingError, "Embedding response entry carries no embedding");

    return json::toFloatArray(first["embedding"], "embedding", ErrorCode::EmbeddingError);
}

OpenAiEmbeddingClient::OpenAiEmbeddingClient(EmbeddingServiceConfig config): _config(std::move(config))
{
    while (_config.baseUrl.ends_with('/'))
        _config.baseUrl.pop_back();
}

auto OpenAiEmbeddingClient::embed(std::string_view text) const -> Result<Embedding>
{
    auto const url = _config.baseUrl + "/embeddings";
    auto const body = json::dump(makeEmbeddingRequest(_config, text));

    auto options = http::RequestOptions { .timeout = _config.timeout };
    options.headers["Content-Type"] = "application/json";
    options.headers["Authorization"] = std::format("Bearer {}", _config.apiKey);

    auto response = http::post(url, body, options);
    if (!response)
        return makeError(ErrorCode::EmbeddingError, response.error().message);

    auto parsed = json::parse(response->body, ErrorCode::EmbeddingError);
    if (!response->isSuccess())
    {
        auto reason = response->body;
        if (parsed)
        {
            if (auto detail = parseEmbeddingResponse(*parsed); !detail)
                reason = detail.error().message;
        }
        return makeError(ErrorCode::EmbeddingError,
                         std::format("Embedding service answered HTTP {}: {}", response->status, reason));
    }

    if (!parsed)
        return std::unexpected(parsed.error());

    auto embedding = parseEmbeddingResponse(*parsed);
    if (embedding && std::cmp_not_equal(embedding->size(), _config.dimensions))
    {
        return makeError(ErrorCode::EmbeddingError,
                         std::format("Embedding has {} dimensions, expected {}", embedding->size(), _config.dimensions));
    }

    log::trace("Embedded {} characters", text.size());
    return embedding;
}

} // namespace mcprouter
