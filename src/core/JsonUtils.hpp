// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

#include "Error.hpp"

namespace onyx::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @param code The error code reported when the input is not valid JSON.
/// @return The parsed JSON value or an Error.
[[nodiscard]] inline auto parse(std::string_view input, ErrorCode code = ErrorCode::InvalidArgument)
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

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param code The error code reported when the field is missing or not a string.
/// @return The string value or an Error.
[[nodiscard]] inline auto getString(const nlohmann::json& obj,
                                    std::string_view key,
                                    ErrorCode code = ErrorCode::InvalidArgument) -> Result<std::string>
{
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_string())
        return makeError(code, std::format("Missing or invalid string field: {}", key));
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

/// @brief Encodes a string as a JavaScript string literal (JSON string syntax).
[[nodiscard]] inline auto quote(std::string_view text) -> std::string
{
    return nlohmann::json(std::string(text)).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

/// @brief Returns true if the text can be stored in a JSON document as-is.
[[nodiscard]] inline auto isValidUtf8(std::string_view text) -> bool
{
    try
    {
        (void) nlohmann::json(std::string(text)).dump();
        return true;
    }
    catch (const nlohmann::json::type_error&)
    {
        return false;
    }
}

} // namespace onyx::json
