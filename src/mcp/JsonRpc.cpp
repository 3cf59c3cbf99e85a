// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcprouter::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto classify(const nlohmann::json& message) -> MessageKind
{
    if (!message.is_object() || json::getStringOr(message, "jsonrpc", "") != "2.0")
        return MessageKind::Invalid;

    if (message.contains("method"))
    {
        if (!message["method"].is_string())
            return MessageKind::Invalid;
        return message.contains("id") ? MessageKind::Request : MessageKind::Notification;
    }

    if (message.contains("result") || message.contains("error"))
        return MessageKind::Response;

    return MessageKind::Invalid;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (classify(message) != MessageKind::Response)
        return makeError(ErrorCode::ProtocolError, "Not a JSON-RPC 2.0 response");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else
    {
        auto const& err = message["error"];
        if (!err.is_object())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC error member must be an object");

        if (err.contains("code") && !err["code"].is_number_integer())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC error code must be an integer");

        response.error = RpcError {
            .code = err.contains("code") ? err["code"].get<int>() : 0,
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = err.contains("data") ? err["data"] : nlohmann::json {},
        };
    }

    return response;
}

} // namespace mcprouter::jsonrpc
