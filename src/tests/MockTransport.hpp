// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <cstdint>
#include <memory>
#include <queue>
#include <string_view>
#include <vector>

namespace mcprouter::test
{

/// @brief Transport replaying queued messages, for testing without real processes.
class MockTransport: public Transport
{
  public:
    std::queue<nlohmann::json> responses;
    std::vector<nlohmann::json> sentMessages;
    VoidResult closeResult {};
    int closeCount = 0;
    bool connected = true;

    auto send(const nlohmann::json& message) -> VoidResult override
    {
        if (!connected)
            return makeError(ErrorCode::TransportError, "Mock transport closed");
        sentMessages.push_back(message);
        return {};
    }

    auto receive() -> Result<nlohmann::json> override
    {
        if (responses.empty())
            return makeError(ErrorCode::TransportError, "No more mock responses");
        auto msg = responses.front();
        responses.pop();
        return msg;
    }

    auto close() -> VoidResult override
    {
        ++closeCount;
        connected = false;
        return closeResult;
    }

    auto isConnected() const -> bool override { return connected; }

    void queueResponse(nlohmann::json response) { responses.push(std::move(response)); }

    void queueInitializeResult(int64_t id = 1, std::string_view serverName = "test-server")
    {
        queueResponse(nlohmann::json {
            { "jsonrpc", "2.0" },
            { "id", id },
            { "result",
              {
                  { "protocolVersion", "2025-03-26" },
                  { "serverInfo", { { "name", serverName }, { "version", "1.0" } } },
                  { "capabilities", { { "tools", nlohmann::json::object() } } },
              } },
        });
    }

    void queueTextResult(int64_t id, std::string_view text)
    {
        queueResponse(nlohmann::json {
            { "jsonrpc", "2.0" },
            { "id", id },
            { "result",
              {
                  { "content", nlohmann::json::array({ { { "type", "text" }, { "text", text } } }) },
                  { "isError", false },
              } },
        });
    }
};

/// @brief Transport forwarding to a MockTransport the test keeps alive.
class SharedMockTransport: public Transport
{
  public:
    explicit SharedMockTransport(std::shared_ptr<MockTransport> mock): _mock(std::move(mock)) {}

    auto send(const nlohmann::json& message) -> VoidResult override { return _mock->send(message); }
    auto receive() -> Result<nlohmann::json> override { return _mock->receive(); }
    auto close() -> VoidResult override { return _mock->close(); }
    auto isConnected() const -> bool override { return _mock->isConnected(); }

  private:
    std::shared_ptr<MockTransport> _mock;
};

} // namespace mcprouter::test
