// SPDX-License-Identifier: Apache-2.0
#include "Http.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <memory>
#include <mutex>

namespace mcprouter::http
{

namespace
{
    struct CurlDeleter
    {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

    using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
    using HeaderList = std::unique_ptr<curl_slist, CurlDeleter>;

    auto toLower(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    auto trim(std::string_view text) -> std::string_view
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            text.remove_prefix(1);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            text.remove_suffix(1);
        return text;
    }

    auto writeBody(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t
    {
        auto* out = static_cast<std::string*>(userdata);
        out->append(ptr, size * nmemb);
        return size * nmemb;
    }

    auto writeHeader(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t
    {
        auto* headers = static_cast<Headers*>(userdata);
        auto const line = std::string_view(ptr, size * nmemb);
        auto const colon = line.find(':');
        if (colon != std::string_view::npos)
            (*headers)[toLower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
        return size * nmemb;
    }

    void ensureGlobalInit()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    auto perform(std::string_view method,
                 std::string_view url,
                 const std::string* body,
                 const RequestOptions& options) -> Result<Response>
    {
        ensureGlobalInit();

        auto handle = CurlHandle(curl_easy_init());
        if (!handle)
            return makeError(ErrorCode::TransportError, "Failed to initialize HTTP client");

        auto headerList = HeaderList {};
        for (const auto& [name, value]: options.headers)
        {
            auto const line = std::format("{}: {}", name, value);
            auto* appended = curl_slist_append(headerList.get(), line.c_str());
            if (!appended)
                return makeError(ErrorCode::TransportError, "Failed to build HTTP headers");
            (void) headerList.release();
            headerList.reset(appended);
        }

        auto const urlStr = std::string(url);
        auto response = Response {};

        auto* curl = handle.get();
        curl_easy_setopt(curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList.get());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeBody);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, writeHeader);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        if (body)
        {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
        }
        else
        {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, std::string(method).c_str());
        }

        auto const code = curl_easy_perform(curl);
        if (code != CURLE_OK)
        {
            return makeError(ErrorCode::TransportError,
                             std::format("{} {} failed: {}", method, url, curl_easy_strerror(code)));
        }

        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        log::trace("{} {} -> {}", method, url, response.status);
        return response;
    }
} // namespace

auto Response::header(std::string_view name) const -> std::string
{
    auto const it = headers.find(name);
    return it != headers.end() ? it->second : std::string {};
}

auto post(std::string_view url, std::string_view body, const RequestOptions& options) -> Result<Response>
{
    auto const bodyStr = std::string(body);
    return perform("POST", url, &bodyStr, options);
}

auto del(std::string_view url, const RequestOptions& options) -> Result<Response>
{
    return perform("DELETE", url, nullptr, options);
}

} // namespace mcprouter::http
