// SPDX-License-Identifier: Apache-2.0
#include <router/Router.hpp>
#include <router/RouterScope.hpp>

#include <catch2/catch_test_macros.hpp>

#include "MockTransport.hpp"
#include "RouterStubs.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace mcprouter;
using namespace std::chrono_literals;
using mcprouter::test::MockTransport;
using mcprouter::test::RouterFixture;
using mcprouter::test::SharedMockTransport;

TEST_CASE("Router construction opens no connections", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.create();

    CHECK(router->servers().size() == 3);
    CHECK(router->hasServer("c"));
    CHECK(router->connectionCount() == 0);
    CHECK(router->connectionState("a") == ConnectionState::Absent);
    CHECK(fixture.totalCreated() == 0);
}

TEST_CASE("Router rejects unknown servers without touching the pool", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.create();

    auto result = router->callTool("nope", "x", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::UnknownServerError);
    CHECK(result.error().message.find("nope") != std::string::npos);
    CHECK(router->connectionState("nope") == ConnectionState::Absent);
    CHECK(router->connectionCount() == 0);
    CHECK(fixture.totalCreated() == 0);
}

TEST_CASE("Router connects on first call and reuses the connection", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.create();
    auto& backend = fixture.backends.at("a");

    auto first = router->callTool("a", "t1", { { "x", 1 } });
    REQUIRE(first.has_value());
    CHECK((*first)["tool"] == "t1");
    CHECK((*first)["params"]["x"] == 1);
    CHECK(router->connectionState("a") == ConnectionState::Established);

    auto second = router->callTool("a", "t2", nullptr);
    REQUIRE(second.has_value());
    CHECK((*second)["params"] == nlohmann::json::object());

    CHECK(backend.created == 1);
    CHECK(backend.connects == 1);
    CHECK(backend.calls == 2);
    CHECK(router->connectionCount() == 1);
    CHECK(fixture.backends.at("b").created == 0);
}

TEST_CASE("Router shares one handshake between concurrent first calls", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.create();
    auto& backend = fixture.backends.at("a");
    backend.connectDelay = 100ms;

    auto successes = std::atomic<int> { 0 };
    auto threads = std::vector<std::thread> {};
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&router, &successes, i] {
            if (router->callTool("a", std::format("t{}", i), nlohmann::json::object()))
                ++successes;
        });
    }
    for (auto& thread: threads)
        thread.join();

    CHECK(successes == 8);
    CHECK(backend.created == 1);
    CHECK(backend.connects == 1);
    CHECK(backend.calls == 8);
}

TEST_CASE("Router reports a failed shared handshake to every waiter and retries later", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.create();
    auto& backend = fixture.backends.at("a");
    backend.connectDelay = 100ms;
    backend.failingConnects = 1;

    auto failures = std::atomic<int> { 0 };
    auto threads = std::vector<std::thread> {};
    for (int i = 0; i < 4; ++i)
    {
        threads.emplace_back([&router, &failures] {
            auto result = router->callTool("a", "t", nlohmann::json::object());
            if (!result && result.error().code == ErrorCode::ConnectError)
                ++failures;
        });
    }
    for (auto& thread: threads)
        thread.join();

    CHECK(failures == 4);
    CHECK(backend.created == 1);
    CHECK(router->connectionState("a") == ConnectionState::Failed);
    CHECK(router->connectionCount() == 0);

    backend.connectDelay = 0ms;
    auto retry = router->callTool("a", "t", nlohmann::json::object());
    REQUIRE(retry.has_value());
    CHECK(backend.created == 2);
    CHECK(router->connectionState("a") == ConnectionState::Established);
}

TEST_CASE("Router settles the pool when a server sends a malformed handshake", "[router]")
{
    auto fixture = RouterFixture {};
    auto transports = std::vector<std::shared_ptr<MockTransport>> {};

    auto dependencies = fixture.dependencies();
    dependencies.makeConnection = [&transports](const Server& server) -> std::unique_ptr<Connection> {
        auto mock = std::make_shared<MockTransport>();
        if (transports.empty())
        {
            mock->queueResponse({ { "jsonrpc", "2.0" }, { "id", 1 }, { "result", nlohmann::json::array() } });
        }
        else
        {
            mock->queueInitializeResult();
            mock->queueTextResult(2, "recovered");
        }
        transports.push_back(mock);
        return std::make_unique<McpConnection>(
            server, [mock](const ServerConfig&) -> Result<std::unique_ptr<Transport>> {
                return std::make_unique<SharedMockTransport>(mock);
            });
    };

    auto created = Router::create(RouterFixture::document(), fixture.runtime(), std::move(dependencies));
    REQUIRE(created.has_value());
    auto& router = *created;

    auto failed = router->callTool("a", "t", nlohmann::json::object());
    REQUIRE(!failed.has_value());
    CHECK(failed.error().code == ErrorCode::ConnectError);
    CHECK(router->connectionState("a") == ConnectionState::Failed);

    auto retry = router->callTool("a", "t", nlohmann::json::object());
    REQUIRE(retry.has_value());
    CHECK((*retry)["content"][0]["text"] == "recovered");
    CHECK(transports.size() == 2);

    CHECK(router->shutdown().has_value());
    CHECK(transports[1]->closeCount == 1);
}

TEST_CASE("Router turns exceptions from a connection into errors", "[router]")
{
    auto fixture = RouterFixture {};
    auto& backend = fixture.backends.at("a");

    SECTION("during the handshake")
    {
        backend.throwOnConnect = true;

        auto result = fixture.create()->callTool("a", "t", nlohmann::json::object());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConnectError);
    }

    SECTION("during a call")
    {
        backend.throwOnCall = true;
        auto router = fixture.create();

        auto result = router->callTool("a", "t", nlohmann::json::object());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::CallError);
        CHECK(router->connectionState("a") == ConnectionState::Established);
        CHECK(router->shutdown().has_value());
    }
}

TEST_CASE("Router maps connect and call failures", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.create();

    SECTION("any handshake failure becomes a ConnectError")
    {
        auto& backend = fixture.backends.at("b");
        backend.failingConnects = 1;
        backend.connectFailure = ErrorCode::TransportError;

        auto result = router->callTool("b", "t", nlohmann::json::object());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConnectError);
        CHECK(result.error().message.find("b refused") != std::string::npos);
    }

    SECTION("tool failures surface as CallError and keep the connection")
    {
        auto& backend = fixture.backends.at("a");
        backend.failCalls = true;

        auto result = router->callTool("a", "broken", nlohmann::json::object());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::CallError);
        CHECK(router->connectionState("a") == ConnectionState::Established);
    }
}

TEST_CASE("Router shutdown closes every connection once and allows reuse", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.create();

    REQUIRE(router->callTool("a", "t", nlohmann::json::object()));
    REQUIRE(router->callTool("b", "t", nlohmann::json::object()));
    REQUIRE(router->connectionCount() == 2);

    REQUIRE(router->shutdown());
    CHECK(fixture.backends.at("a").closes == 1);
    CHECK(fixture.backends.at("b").closes == 1);
    CHECK(fixture.backends.at("c").closes == 0);
    CHECK(router->connectionCount() == 0);
    CHECK(router->connectionState("a") == ConnectionState::Absent);

    REQUIRE(router->shutdown());
    CHECK(fixture.backends.at("a").closes == 1);

    REQUIRE(router->callTool("a", "again", nlohmann::json::object()));
    CHECK(fixture.backends.at("a").created == 2);
    CHECK(router->connectionCount() == 1);
}

TEST_CASE("Router shutdown attempts every close despite failures", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.create();
    fixture.backends.at("a").failClose = true;

    REQUIRE(router->callTool("a", "t", nlohmann::json::object()));
    REQUIRE(router->callTool("b", "t", nlohmann::json::object()));

    auto result = router->shutdown();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::CloseError);
    CHECK(result.error().message.find("a: a would not stop") != std::string::npos);
    CHECK(result.error().message.find("b:") == std::string::npos);

    CHECK(fixture.backends.at("a").closes == 1);
    CHECK(fixture.backends.at("b").closes == 1);
    CHECK(router->connectionCount() == 0);
}

TEST_CASE("Router shutdown closes connections concurrently", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.create();

    auto started = std::atomic<int> { 0 };
    for (auto& [name, backend]: fixture.backends)
    {
        backend.closeRendezvous = &started;
        backend.rendezvousSize = 3;
    }

    for (auto const* name: { "a", "b", "c" })
        REQUIRE(router->callTool(name, "t", nlohmann::json::object()));

    CHECK(router->shutdown().has_value());
    CHECK(started == 3);
}

TEST_CASE("Router shutdown waits for a handshake in flight", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.create();
    auto& backend = fixture.backends.at("a");
    backend.connectDelay = 200ms;

    auto caller = std::thread([&router] { (void) router->callTool("a", "t", nlohmann::json::object()); });

    auto const deadline = std::chrono::steady_clock::now() + 2s;
    while (router->connectionState("a") != ConnectionState::Connecting && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(1ms);
    REQUIRE(router->connectionState("a") == ConnectionState::Connecting);

    CHECK(router->shutdown().has_value());
    caller.join();

    CHECK(backend.closes == 1);
    CHECK(router->connectionCount() == 0);
}

TEST_CASE("Router route delegates to the matcher", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.create();

    auto first = router->route("forecast");
    auto second = router->route("forecast");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(*first == *second);
    REQUIRE(first->best() != nullptr);
    CHECK(first->best()->tool == "forecast");
    CHECK(router->connectionCount() == 0);

    auto empty = router->route("");
    REQUIRE(!empty.has_value());
    CHECK(empty.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Router creation tolerates a missing config file", "[router]")
{
    auto fixture = RouterFixture {};
    auto const missing = std::filesystem::temp_directory_path() / "mcprouter_no_such_dir" / "config.json";

    auto router = Router::create(missing, fixture.runtime(), fixture.dependencies());
    REQUIRE(router.has_value());
    CHECK((*router)->servers().empty());

    auto call = (*router)->callTool("a", "t", nlohmann::json::object());
    REQUIRE(!call.has_value());
    CHECK(call.error().code == ErrorCode::UnknownServerError);
}

TEST_CASE("Router creation fails on configuration errors", "[router]")
{
    auto fixture = RouterFixture {};
    auto runtime = fixture.runtime();
    auto document = RouterFixture::document();

    SECTION("missing credential")
    {
        runtime.apiKey.clear();
    }

    SECTION("missing tool index")
    {
        runtime.toolIndexPath = (std::filesystem::temp_directory_path() / "mcprouter_no_such_index.json").string();
    }

    SECTION("malformed server entry")
    {
        document["mcpServers"]["broken"] = { { "command", "x" }, { "url", "http://localhost" } };
    }

    SECTION("unloadable tool index")
    {
        fixture.failIndexLoad = true;
    }

    auto router = Router::create(document, runtime, fixture.dependencies());
    REQUIRE(!router.has_value());
    CHECK(router.error().code == ErrorCode::ConfigurationError);
    CHECK(fixture.totalCreated() == 0);
}

TEST_CASE("RouterScope shuts the router down on scope exit", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.create();

    {
        auto scope = RouterScope(*router);
        REQUIRE(scope->callTool("a", "t", nlohmann::json::object()));
        CHECK(scope.router().connectionCount() == 1);
    }

    CHECK(fixture.backends.at("a").closes == 1);
    CHECK(router->connectionCount() == 0);
}

TEST_CASE("RouterScope shuts down when an exception leaves the scope", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.create();

    try
    {
        auto scope = RouterScope(*router);
        REQUIRE(scope->callTool("b", "t", nlohmann::json::object()));
        throw std::runtime_error("caller failed");
    }
    catch (const std::runtime_error& e)
    {
        CHECK(std::string(e.what()) == "caller failed");
    }

    CHECK(fixture.backends.at("b").closes == 1);
    CHECK(router->connectionCount() == 0);
}

TEST_CASE("RouterScope release reports close failures once", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.create();
    fixture.backends.at("a").failClose = true;

    auto scope = RouterScope(*router);
    REQUIRE(scope->callTool("a", "t", nlohmann::json::object()));

    auto released = scope.release();
    REQUIRE(!released.has_value());
    CHECK(released.error().code == ErrorCode::CloseError);

    CHECK(scope.release().has_value());
    CHECK(fixture.backends.at("a").closes == 1);
}
