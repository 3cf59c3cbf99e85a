// SPDX-License-Identifier: Apache-2.0
#include "Matcher.hpp"

namespace mcprouter
{

auto toJson(const MatchResult& result) -> nlohmann::json
{
    auto servers = nlohmann::json::array();
    for (const auto& server: result.servers)
    {
        servers.push_back(nlohmann::json {
            { "server_name", server.name },
            { "server_summary", server.summary },
            { "score", server.score },
        });
    }

    auto tools = nlohmann::json::array();
    for (const auto& tool: result.tools)
    {
        tools.push_back(nlohmann::json {
            { "server_name", tool.server },
            { "tool_name", tool.tool },
            { "description", tool.description },
            { "parameter", tool.parameters },
            { "score", tool.score },
        });
    }

    return nlohmann::json {
        { "matched_servers", std::move(servers) },
        { "matched_tools", std::move(tools) },
    };
}

} // namespace mcprouter
