// SPDX-License-Identifier: Apache-2.0
#include <mcp/ServerConfig.hpp>
#include <mcprouter/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace mcprouter;

namespace
{

auto writeTempFile(std::string_view name, std::string_view content) -> std::filesystem::path
{
    auto const path = std::filesystem::temp_directory_path() / name;
    auto file = std::ofstream(path);
    file << content;
    return path;
}

} // namespace

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
}

TEST_CASE("defaultToolIndexPath lives in the config directory", "[config]")
{
    auto const path = defaultToolIndexPath();
    CHECK(path.starts_with(defaultConfigDir()));
    CHECK(path.ends_with("tool_index.json"));
}

TEST_CASE("parseServerConfig parses a stdio server", "[config]")
{
    auto const entry = nlohmann::json {
        { "command", "npx" },
        { "args", { "-y", "@modelcontextprotocol/server-filesystem", "/tmp" } },
        { "env", { { "DEBUG", "1" } } },
    };

    auto config = parseServerConfig("fs", entry);
    REQUIRE(config.has_value());
    CHECK(config->kind == ServerKind::Stdio);
    CHECK(config->command == "npx");
    REQUIRE(config->args.size() == 3);
    CHECK(config->args[2] == "/tmp");
    CHECK(config->env.at("DEBUG") == "1");
    CHECK(config->url.empty());
}

TEST_CASE("parseServerConfig parses an HTTP server", "[config]")
{
    auto const entry = nlohmann::json {
        { "type", "streamable-http" },
        { "url", "https://mcp.example.com/mcp" },
        { "headers", { { "Authorization", "Bearer abc" } } },
    };

    auto config = parseServerConfig("remote", entry);
    REQUIRE(config.has_value());
    CHECK(config->kind == ServerKind::Http);
    CHECK(config->url == "https://mcp.example.com/mcp");
    CHECK(config->headers.at("Authorization") == "Bearer abc");
    CHECK(config->command.empty());
}

TEST_CASE("parseServerConfig rejects malformed entries", "[config]")
{
    auto const reject = [](const nlohmann::json& entry) {
        auto config = parseServerConfig("bad", entry);
        REQUIRE(!config.has_value());
        CHECK(config.error().code == ErrorCode::ConfigurationError);
        CHECK(config.error().message.find("'bad'") != std::string::npos);
    };

    SECTION("not an object")
    {
        reject(nlohmann::json::array({ "npx" }));
    }

    SECTION("neither command nor url")
    {
        reject({ { "args", { "x" } } });
    }

    SECTION("both command and url")
    {
        reject({ { "command", "npx" }, { "url", "http://localhost:3000" } });
    }

    SECTION("unknown member")
    {
        reject({ { "command", "npx" }, { "cwd", "/tmp" } });
    }

    SECTION("empty command")
    {
        reject({ { "command", "" } });
    }

    SECTION("non-string argument")
    {
        reject({ { "command", "npx" }, { "args", { "-y", 3 } } });
    }

    SECTION("non-string environment value")
    {
        reject({ { "command", "npx" }, { "env", { { "PORT", 8080 } } } });
    }

    SECTION("url without http scheme")
    {
        reject({ { "url", "ftp://example.com" } });
    }

    SECTION("args on an HTTP server")
    {
        reject({ { "url", "http://localhost:3000" }, { "args", { "x" } } });
    }

    SECTION("headers on a stdio server")
    {
        reject({ { "command", "npx" }, { "headers", { { "X", "y" } } } });
    }

    SECTION("type contradicting members")
    {
        reject({ { "type", "stdio" }, { "url", "http://localhost:3000" } });
    }

    SECTION("unknown type")
    {
        reject({ { "type", "sse" }, { "url", "http://localhost:3000" } });
    }
}

TEST_CASE("parseServerRegistry keys servers by name", "[config]")
{
    auto const document = nlohmann::json {
        { "mcpServers",
          {
              { "weather", { { "command", "weather-mcp" } } },
              { "search", { { "url", "http://localhost:8080/mcp" } } },
          } },
    };

    auto registry = parseServerRegistry(document);
    REQUIRE(registry.has_value());
    REQUIRE(registry->size() == 2);
    CHECK(registry->at("weather").name == "weather");
    CHECK(registry->at("weather").config.command == "weather-mcp");
    CHECK(registry->at("search").config.kind == ServerKind::Http);
}

TEST_CASE("parseServerRegistry accepts documents without servers", "[config]")
{
    auto registry = parseServerRegistry(nlohmann::json::object());
    REQUIRE(registry.has_value());
    CHECK(registry->empty());
}

TEST_CASE("parseServerRegistry fails on any malformed entry", "[config]")
{
    auto const document = nlohmann::json {
        { "mcpServers",
          {
              { "good", { { "command", "ok" } } },
              { "broken", { { "command", 42 } } },
          } },
    };

    auto registry = parseServerRegistry(document);
    REQUIRE(!registry.has_value());
    CHECK(registry.error().code == ErrorCode::ConfigurationError);
    CHECK(registry.error().message.find("broken") != std::string::npos);
}

TEST_CASE("toJson writes the document form of a server", "[config]")
{
    auto const entry = nlohmann::json { { "command", "uvx" }, { "args", { "mcp-server-time" } } };
    auto config = parseServerConfig("time", entry);
    REQUIRE(config.has_value());
    CHECK(toJson(*config) == entry);

    auto const remote = nlohmann::json { { "url", "http://localhost:9000/mcp" } };
    auto httpConfig = parseServerConfig("remote", remote);
    REQUIRE(httpConfig.has_value());
    CHECK(toJson(*httpConfig) == remote);
}

TEST_CASE("loadConfigDocument tolerates a missing file", "[config]")
{
    auto const path = std::filesystem::temp_directory_path() / "mcprouter_test_missing" / "config.json";

    auto document = loadConfigDocument(path);
    REQUIRE(document.has_value());
    REQUIRE(document->contains("mcpServers"));
    CHECK((*document)["mcpServers"].empty());
}

TEST_CASE("loadConfigDocument reads a config file", "[config]")
{
    auto const path = writeTempFile("mcprouter_test_config.json",
                                    R"({ "mcpServers": { "echo": { "command": "cat" } } })");

    auto document = loadConfigDocument(path);
    REQUIRE(document.has_value());
    CHECK((*document)["mcpServers"]["echo"]["command"] == "cat");

    std::filesystem::remove(path);
}

TEST_CASE("loadConfigDocument rejects invalid JSON", "[config]")
{
    auto const path = writeTempFile("mcprouter_test_invalid.json", "{ not json");

    auto document = loadConfigDocument(path);
    REQUIRE(!document.has_value());
    CHECK(document.error().code == ErrorCode::ConfigurationError);

    std::filesystem::remove(path);
}

TEST_CASE("loadConfigDocument passes in-memory documents through", "[config]")
{
    auto const source = nlohmann::json { { "mcpServers", { { "a", { { "command", "a" } } } } } };

    auto document = loadConfigDocument(source);
    REQUIRE(document.has_value());
    CHECK(*document == source);

    auto rejected = loadConfigDocument(nlohmann::json::array());
    REQUIRE(!rejected.has_value());
    CHECK(rejected.error().code == ErrorCode::ConfigurationError);
}

TEST_CASE("validateRuntimeParameters requires credential and index", "[config]")
{
    auto const indexPath = writeTempFile("mcprouter_test_index.json", "[]");

    auto parameters = RuntimeParameters {
        .embeddingBaseUrl = "http://localhost:8000/v1",
        .apiKey = "secret",
        .toolIndexPath = indexPath.string(),
    };

    CHECK(validateRuntimeParameters(parameters).has_value());

    SECTION("missing credential")
    {
        parameters.apiKey.clear();
        auto result = validateRuntimeParameters(parameters);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigurationError);
        CHECK(result.error().message.find(EmbeddingApiKeyVariable) != std::string::npos);
    }

    SECTION("missing index file")
    {
        parameters.toolIndexPath = (std::filesystem::temp_directory_path() / "mcprouter_no_such_index.json").string();
        auto result = validateRuntimeParameters(parameters);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigurationError);
    }

    SECTION("index path is a directory")
    {
        parameters.toolIndexPath = std::filesystem::temp_directory_path().string();
        auto result = validateRuntimeParameters(parameters);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigurationError);
    }

    std::filesystem::remove(indexPath);
}

TEST_CASE("RuntimeParameters reads the environment", "[config]")
{
    ::setenv(EmbeddingBaseUrlVariable.data(), "http://embeddings.local/v1", 1);
    ::setenv(EmbeddingApiKeyVariable.data(), "key-123", 1);
    ::setenv(ToolIndexVariable.data(), "/data/index.json", 1);

    auto parameters = RuntimeParameters::fromEnvironment();
    CHECK(parameters.embeddingBaseUrl == "http://embeddings.local/v1");
    CHECK(parameters.apiKey == "key-123");
    CHECK(parameters.toolIndexPath == "/data/index.json");

    ::unsetenv(EmbeddingBaseUrlVariable.data());
    ::unsetenv(EmbeddingApiKeyVariable.data());
    ::unsetenv(ToolIndexVariable.data());

    auto defaults = RuntimeParameters::fromEnvironment();
    CHECK(defaults.embeddingBaseUrl == DefaultEmbeddingBaseUrl);
    CHECK(defaults.apiKey.empty());
    CHECK(defaults.toolIndexPath == defaultToolIndexPath());
}

TEST_CASE("loadDotEnv sets variables without overriding", "[config]")
{
    ::unsetenv("MCPROUTER_TEST_PLAIN");
    ::unsetenv("MCPROUTER_TEST_QUOTED");
    ::unsetenv("MCPROUTER_TEST_EXPORTED");
    ::setenv("MCPROUTER_TEST_PRESET", "kept", 1);

    auto const path = writeTempFile("mcprouter_test.env",
                                    "# credentials\n"
                                    "\n"
                                    "MCPROUTER_TEST_PLAIN=plain # trailing comment\n"
                                    "MCPROUTER_TEST_QUOTED=\"with spaces\"\n"
                                    "export MCPROUTER_TEST_EXPORTED='single'\n"
                                    "MCPROUTER_TEST_PRESET=replaced\n");

    auto loaded = loadDotEnv(path);
    REQUIRE(loaded.has_value());
    CHECK(*loaded == 3);
    CHECK(std::string(std::getenv("MCPROUTER_TEST_PLAIN")) == "plain");
    CHECK(std::string(std::getenv("MCPROUTER_TEST_QUOTED")) == "with spaces");
    CHECK(std::string(std::getenv("MCPROUTER_TEST_EXPORTED")) == "single");
    CHECK(std::string(std::getenv("MCPROUTER_TEST_PRESET")) == "kept");

    std::filesystem::remove(path);
}

TEST_CASE("loadDotEnv ignores a missing file and rejects malformed lines", "[config]")
{
    auto missing = loadDotEnv(std::filesystem::temp_directory_path() / "mcprouter_no_such.env");
    REQUIRE(missing.has_value());
    CHECK(*missing == 0);

    auto const path = writeTempFile("mcprouter_bad.env", "JUST_A_WORD\n");
    auto malformed = loadDotEnv(path);
    REQUIRE(!malformed.has_value());
    CHECK(malformed.error().code == ErrorCode::ConfigurationError);

    std::filesystem::remove(path);
}
