// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace mcprouter::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @param code The error code reported on a parse failure.
/// @return The parsed JSON value or an Error.
[[nodiscard]] inline auto parse(std::string_view input, ErrorCode code = ErrorCode::ProtocolError)
    -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(code, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Serializes a JSON value, replacing invalid UTF-8 with U+FFFD instead of throwing.
/// @param value The JSON value.
/// @param indent Indentation width, or -1 for the compact form.
[[nodiscard]] inline auto dump(const nlohmann::json& value, int indent = -1) -> std::string
{
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value or an Error.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return obj[keyStr].get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Converts a JSON array of strings, rejecting any non-string element.
/// @param value The JSON value, expected to be an array.
/// @param what Name used in the error message.
[[nodiscard]] inline auto toStringArray(const nlohmann::json& value, std::string_view what)
    -> Result<std::vector<std::string>>
{
    if (!value.is_array())
        return makeError(ErrorCode::ConfigurationError, std::format("'{}' must be an array of strings", what));

    auto result = std::vector<std::string> {};
    result.reserve(value.size());
    for (const auto& item: value)
    {
        if (!item.is_string())
            return makeError(ErrorCode::ConfigurationError,
                             std::format("'{}' must contain only strings", what));
        result.push_back(item.get<std::string>());
    }
    return result;
}

/// @brief Converts a JSON object of string values, rejecting any non-string value.
/// @param value The JSON value, expected to be an object.
/// @param what Name used in the error message.
[[nodiscard]] inline auto toStringMap(const nlohmann::json& value, std::string_view what)
    -> Result<std::map<std::string, std::string>>
{
    if (!value.is_object())
        return makeError(ErrorCode::ConfigurationError,
                         std::format("'{}' must be an object of strings", what));

    auto result = std::map<std::string, std::string> {};
    for (const auto& [key, item]: value.items())
    {
        if (!item.is_string())
            return makeError(ErrorCode::ConfigurationError,
                             std::format("'{}.{}' must be a string", what, key));
        result[key] = item.get<std::string>();
    }
    return result;
}

/// @brief Converts a JSON array of numbers into floats.
/// @param value The JSON value, expected to be a numeric array.
/// @param what Name used in the error message.
/// @param code The error code reported on a type mismatch.
[[nodiscard]] inline auto toFloatArray(const nlohmann::json& value, std::string_view what, ErrorCode code)
    -> Result<std::vector<float>>
{
    if (!value.is_array())
        return makeError(code, std::format("'{}' must be an array of numbers", what));

    auto result = std::vector<float> {};
    result.reserve(value.size());
    for (const auto& item: value)
    {
        if (!item.is_number())
            return makeError(code, std::format("'{}' must contain only numbers", what));
        result.push_back(item.get<float>());
    }
    return result;
}

} // namespace mcprouter::json
