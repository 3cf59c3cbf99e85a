// SPDX-License-Identifier: Apache-2.0
#include <mcp/Connection.hpp>

#include <catch2/catch_test_macros.hpp>

#include "MockTransport.hpp"

using namespace mcprouter;
using mcprouter::test::MockTransport;
using mcprouter::test::SharedMockTransport;

namespace
{

auto stdioServer(std::string name) -> Server
{
    return Server {
        .name = std::move(name),
        .config = ServerConfig { .kind = ServerKind::Stdio, .command = "unused" },
    };
}

/// Hands out transports backed by one MockTransport the test can inspect.
struct TransportSlot
{
    std::shared_ptr<MockTransport> mock = std::make_shared<MockTransport>();
    bool reachable = true;
    int requests = 0;

    auto factory() -> TransportFactory
    {
        return [this](const ServerConfig&) -> Result<std::unique_ptr<Transport>> {
            ++requests;
            if (!reachable)
                return makeError(ErrorCode::TransportError, "spawn failed");
            return std::make_unique<SharedMockTransport>(mock);
        };
    }
};

} // namespace

TEST_CASE("McpConnection connects and calls tools", "[connection]")
{
    auto slot = TransportSlot {};
    slot.mock->queueInitializeResult();
    slot.mock->queueTextResult(2, "42");

    auto connection = McpConnection(stdioServer("calc"), slot.factory());
    REQUIRE(connection.connect().has_value());
    CHECK(slot.requests == 1);

    auto result = connection.callTool("add", { { "a", 40 }, { "b", 2 } });
    REQUIRE(result.has_value());
    CHECK((*result)["content"][0]["text"] == "42");

    CHECK(slot.mock->sentMessages.back()["params"]["arguments"]["a"] == 40);
}

TEST_CASE("McpConnection maps an unreachable server to ConnectError", "[connection]")
{
    auto slot = TransportSlot {};
    slot.reachable = false;

    auto connection = McpConnection(stdioServer("gone"), slot.factory());
    auto result = connection.connect();

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectError);
    CHECK(result.error().message.find("gone") != std::string::npos);
}

TEST_CASE("McpConnection closes the transport after a failed handshake", "[connection]")
{
    auto slot = TransportSlot {};
    // No initialize response queued: the handshake fails on receive.

    auto connection = McpConnection(stdioServer("mute"), slot.factory());
    auto result = connection.connect();

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectError);
    CHECK(slot.mock->closeCount == 1);
}

TEST_CASE("McpConnection maps tool failures to CallError", "[connection]")
{
    auto slot = TransportSlot {};
    slot.mock->queueInitializeResult();

    auto connection = McpConnection(stdioServer("calc"), slot.factory());
    REQUIRE(connection.connect().has_value());

    // Nothing queued for the call: the transport reports an error.
    auto result = connection.callTool("add", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::CallError);
}

TEST_CASE("McpConnection rejects calls before connect", "[connection]")
{
    auto slot = TransportSlot {};
    auto connection = McpConnection(stdioServer("calc"), slot.factory());

    auto result = connection.callTool("add", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::CallError);
    CHECK(slot.requests == 0);
}

TEST_CASE("McpConnection close maps transport failures to CloseError", "[connection]")
{
    auto slot = TransportSlot {};
    slot.mock->queueInitializeResult();
    slot.mock->closeResult = makeError(ErrorCode::CloseError, "process killed");

    auto connection = McpConnection(stdioServer("stubborn"), slot.factory());
    REQUIRE(connection.connect().has_value());

    auto closed = connection.close();
    REQUIRE(!closed.has_value());
    CHECK(closed.error().code == ErrorCode::CloseError);
    CHECK(closed.error().message.find("stubborn") != std::string::npos);
    CHECK(slot.mock->closeCount == 1);

    // A second close has nothing left to release.
    CHECK(connection.close().has_value());
}
