// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Http.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <deque>
#include <string>
#include <vector>

namespace mcprouter
{

/// @brief Configuration for an MCP server reached over streamable HTTP.
struct HttpTransportConfig
{
    std::string url;
    http::Headers headers;
    std::chrono::milliseconds timeout = std::chrono::seconds(60);
};

/// @brief Transport for the MCP streamable HTTP binding.
///
/// Every outgoing message is POSTed to the endpoint. The reply, either a
/// single JSON document or an SSE stream, is queued for receive().
class HttpTransport: public Transport
{
  public:
    explicit HttpTransport(HttpTransportConfig config);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    [[nodiscard]] auto close() -> VoidResult override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Session id assigned by the server, empty until initialize succeeded.
    [[nodiscard]] auto sessionId() const -> const std::string& { return _sessionId; }

  private:
    [[nodiscard]] auto enqueueBody(const http::Response& response) -> VoidResult;

    HttpTransportConfig _config;
    std::string _sessionId;
    std::deque<nlohmann::json> _pending;
    bool _closed = false;
};

/// @brief Extracts the JSON payloads of the `data:` fields of an SSE stream.
/// @param body The complete event-stream body.
/// @return One JSON value per event, or a ProtocolError.
[[nodiscard]] auto parseEventStream(std::string_view body) -> Result<std::vector<nlohmann::json>>;

} // namespace mcprouter
