// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace mcprouter
{

namespace
{
    constexpr auto SessionHeader = std::string_view { "Mcp-Session-Id" };
} // namespace

auto parseEventStream(std::string_view body) -> Result<std::vector<nlohmann::json>>
{
    auto events = std::vector<nlohmann::json> {};
    auto data = std::string {};

    auto flush = [&]() -> VoidResult {
        if (data.empty())
            return {};
        auto parsed = json::parse(data);
        data.clear();
        if (!parsed)
            return std::unexpected(parsed.error());
        events.push_back(std::move(*parsed));
        return {};
    };

    while (!body.empty())
    {
        auto const eol = body.find('\n');
        auto line = body.substr(0, eol);
        body = eol == std::string_view::npos ? std::string_view {} : body.substr(eol + 1);

        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        if (line.empty())
        {
            if (auto result = flush(); !result)
                return std::unexpected(result.error());
            continue;
        }

        if (line.starts_with("data:"))
        {
            line.remove_prefix(5);
            if (line.starts_with(' '))
                line.remove_prefix(1);
            if (!data.empty())
                data += '\n';
            data += line;
        }
        // event:, id:, retry: and comments carry nothing we need.
    }

    if (auto result = flush(); !result)
        return std::unexpected(result.error());

    return events;
}

HttpTransport::HttpTransport(HttpTransportConfig config): _config(std::move(config))
{
}

HttpTransport::~HttpTransport()
{
    if (auto result = close(); !result)
        log::warning("{}", result.error().message);
}

auto HttpTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (_closed)
        return makeError(ErrorCode::TransportError, "Transport closed");

    auto options = http::RequestOptions {
        .headers = http::Headers(_config.headers.begin(), _config.headers.end()),
        .timeout = _config.timeout,
    };
    options.headers["Content-Type"] = "application/json";
    options.headers["Accept"] = "application/json, text/event-stream";
    if (!_sessionId.empty())
        options.headers[std::string(SessionHeader)] = _sessionId;

    auto response = http::post(_config.url, json::dump(message), options);
    if (!response)
        return std::unexpected(response.error());

    if (!response->isSuccess())
    {
        return makeError(ErrorCode::TransportError,
                         std::format("{} answered HTTP {}: {}", _config.url, response->status, response->body));
    }

    if (auto const session = response->header(SessionHeader); !session.empty())
        _sessionId = session;

    return enqueueBody(*response);
}

auto HttpTransport::enqueueBody(const http::Response& response) -> VoidResult
{
    // 202 Accepted answers notifications and carries no body.
    if (response.status == 202 || response.body.empty())
        return {};

    auto const contentType = response.header("content-type");
    if (contentType.starts_with("text/event-stream"))
    {
        auto events = parseEventStream(response.body);
        if (!events)
            return std::unexpected(events.error());
        for (auto& event: *events)
            _pending.push_back(std::move(event));
        return {};
    }

    auto parsed = json::parse(response.body);
    if (!parsed)
        return std::unexpected(parsed.error());

    if (parsed->is_array())
    {
        for (auto& item: *parsed)
            _pending.push_back(std::move(item));
    }
    else
    {
        _pending.push_back(std::move(*parsed));
    }
    return {};
}

auto HttpTransport::receive() -> Result<nlohmann::json>
{
    if (_pending.empty())
        return makeError(ErrorCode::TransportError, std::format("No pending message from {}", _config.url));

    auto message = std::move(_pending.front());
    _pending.pop_front();
    return message;
}

auto HttpTransport::close() -> VoidResult
{
    if (_closed)
        return {};

    _closed = true;
    _pending.clear();

    if (_sessionId.empty())
        return {};

    auto options = http::RequestOptions {
        .headers = http::Headers(_config.headers.begin(), _config.headers.end()),
        .timeout = _config.timeout,
    };
    options.headers[std::string(SessionHeader)] = _sessionId;
    _sessionId.clear();

    auto response = http::del(_config.url, options);
    if (!response)
        return makeError(ErrorCode::CloseError, response.error().message);

    // 405 means the server does not support explicit session termination.
    if (!response->isSuccess() && response->status != 405 && response->status != 404)
    {
        return makeError(ErrorCode::CloseError,
                         std::format("{} rejected session termination with HTTP {}", _config.url, response->status));
    }

    return {};
}

auto HttpTransport::isConnected() const -> bool
{
    return !_closed;
}

} // namespace mcprouter
