// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace mcprouter::http
{

/// @brief Orders header names ignoring ASCII case, so "accept" and "Accept" name the same header.
struct HeaderNameLess
{
    using is_transparent = void;

    auto operator()(std::string_view a, std::string_view b) const -> bool
    {
        return std::ranges::lexicographical_compare(a, b, [](unsigned char x, unsigned char y) {
            return std::tolower(x) < std::tolower(y);
        });
    }
};

/// @brief HTTP headers, keyed by case-insensitive header name.
using Headers = std::map<std::string, std::string, HeaderNameLess>;

/// @brief A completed HTTP exchange.
struct Response
{
    long status = 0;
    std::string body;
    /// Response headers with lower-cased names.
    Headers headers;

    /// @brief Returns the value of a response header (name is case-insensitive), or empty.
    [[nodiscard]] auto header(std::string_view name) const -> std::string;

    [[nodiscard]] auto isSuccess() const -> bool { return status >= 200 && status < 300; }
};

/// @brief Options shared by all requests.
struct RequestOptions
{
    Headers headers;
    std::chrono::milliseconds timeout = std::chrono::seconds(30);
};

/// @brief Performs a blocking POST request.
///
/// Only transport-level failures (DNS, connect, timeout) are errors; any HTTP
/// status is returned as a Response for the caller to interpret.
/// @param url The absolute request URL.
/// @param body The request body.
/// @param options Headers and timeout.
/// @return The response or a TransportError.
[[nodiscard]] auto post(std::string_view url, std::string_view body, const RequestOptions& options)
    -> Result<Response>;

/// @brief Performs a blocking DELETE request.
[[nodiscard]] auto del(std::string_view url, const RequestOptions& options) -> Result<Response>;

} // namespace mcprouter::http
