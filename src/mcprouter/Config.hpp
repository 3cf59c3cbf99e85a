// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

namespace mcprouter
{

/// @brief Environment variable naming the embedding service base URL.
constexpr auto EmbeddingBaseUrlVariable = std::string_view { "MCPROUTER_EMBEDDING_BASE_URL" };

/// @brief Environment variable carrying the embedding service credential.
constexpr auto EmbeddingApiKeyVariable = std::string_view { "MCPROUTER_EMBEDDING_API_KEY" };

/// @brief Environment variable naming the precomputed tool index file.
constexpr auto ToolIndexVariable = std::string_view { "MCPROUTER_TOOL_INDEX" };

/// @brief Environment variable selecting the default log level.
constexpr auto LogLevelVariable = std::string_view { "MCPROUTER_LOG_LEVEL" };

/// @brief Embedding service used when no base URL is configured.
constexpr auto DefaultEmbeddingBaseUrl = std::string_view { "https://dashscope.aliyuncs.com/compatible-mode/v1" };

/// @brief Where the server configuration comes from: an in-memory document or a file.
using ConfigSource = std::variant<nlohmann::json, std::filesystem::path>;

/// @brief Parameters the router cannot start without, normally taken from the environment.
struct RuntimeParameters
{
    std::string embeddingBaseUrl = std::string(DefaultEmbeddingBaseUrl);
    std::string apiKey;
    std::string toolIndexPath;

    /// @brief Reads the parameters from the process environment.
    ///
    /// The base URL falls back to DefaultEmbeddingBaseUrl and the index path
    /// to defaultToolIndexPath(). The credential has no default.
    [[nodiscard]] static auto fromEnvironment() -> RuntimeParameters;
};

/// @brief Checks that the credential is present and the tool index is a readable file.
/// @return Success or a ConfigurationError.
[[nodiscard]] auto validateRuntimeParameters(const RuntimeParameters& parameters) -> VoidResult;

/// @brief Resolves a configuration source into a document.
///
/// A path that does not exist yields {"mcpServers": {}} and a warning.
/// An unreadable file or invalid JSON is a ConfigurationError.
[[nodiscard]] auto loadConfigDocument(const ConfigSource& source) -> Result<nlohmann::json>;

/// @brief Loads KEY=VALUE lines from a dotenv file into the environment.
///
/// Blank lines and '#' comments are skipped, an "export " prefix and
/// matching quotes around the value are stripped. Variables that are
/// already set are left alone. A missing file is not an error.
/// @return The number of variables set, or an error for an unreadable file or malformed line.
[[nodiscard]] auto loadDotEnv(const std::filesystem::path& path) -> Result<int>;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/mcprouter or ~/.config/mcprouter
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default server configuration file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default tool index file path.
[[nodiscard]] auto defaultToolIndexPath() -> std::string;

} // namespace mcprouter
