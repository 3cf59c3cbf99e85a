// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <router/Router.hpp>

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <optional>

namespace mcprouter
{

/// @brief MCP server on stdio that puts a Router behind two tools.
///
/// "route" ranks tools for a query; "execute_tool" calls a tool on one of the
/// configured servers and returns its result unchanged.
class CopilotServer
{
  public:
    explicit CopilotServer(Router& router);

    /// @brief Handles one incoming JSON-RPC message.
    /// @return The response to write, or nothing for notifications.
    [[nodiscard]] auto handleMessage(const nlohmann::json& message) -> std::optional<nlohmann::json>;

    /// @brief Serves newline-delimited JSON-RPC until the input ends.
    /// @return Success at end of input, or an IoError if the output fails.
    [[nodiscard]] auto run(std::istream& input, std::ostream& output) -> VoidResult;

    /// @brief The tool list announced by tools/list.
    [[nodiscard]] static auto toolDefinitions() -> nlohmann::json;

  private:
    [[nodiscard]] auto handleInitialize(const nlohmann::json& params) const -> nlohmann::json;
    [[nodiscard]] auto handleToolCall(const nlohmann::json& id, const nlohmann::json& params) -> nlohmann::json;

    Router& _router;
};

} // namespace mcprouter
