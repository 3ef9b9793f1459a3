// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace lode::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON object or an Error.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Serializes a JSON value, replacing invalid UTF-8 instead of throwing.
/// @param value The value to serialize.
/// @param indent -1 for a single line, otherwise the pretty-print indentation.
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
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return it->get<std::string>();
}

/// @brief Extracts a string field that may be absent or null.
/// @return nullopt when absent or null, the value when a string, an Error otherwise.
[[nodiscard]] inline auto getOptionalString(const nlohmann::json& obj, std::string_view key)
    -> Result<std::optional<std::string>>
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || it->is_null())
        return std::optional<std::string> {};
    if (!it->is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Invalid string field: {}", key));
    return std::optional<std::string> { it->get<std::string>() };
}

/// @brief Extracts a required unsigned integer field that must fit the target type.
/// @tparam T The unsigned integer type to extract.
template <typename T>
[[nodiscard]] auto getUnsigned(const nlohmann::json& obj, std::string_view key) -> Result<T>
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_number_unsigned())
        return makeError(ErrorCode::ProtocolError,
                         std::format("Missing or invalid unsigned integer field: {}", key));
    auto const value = it->get<std::uint64_t>();
    if (value > std::numeric_limits<T>::max())
        return makeError(ErrorCode::ProtocolError, std::format("Integer field out of range: {}", key));
    return static_cast<T>(value);
}

/// @brief Extracts an unsigned integer field that may be absent or null.
template <typename T>
[[nodiscard]] auto getOptionalUnsigned(const nlohmann::json& obj, std::string_view key)
    -> Result<std::optional<T>>
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || it->is_null())
        return std::optional<T> {};
    auto value = getUnsigned<T>(obj, key);
    if (!value)
        return std::unexpected(value.error());
    return std::optional<T> { *value };
}

/// @brief Extracts a required boolean field from a JSON object.
[[nodiscard]] inline auto getBool(const nlohmann::json& obj, std::string_view key) -> Result<bool>
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_boolean())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid boolean field: {}", key));
    return it->get<bool>();
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
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional unsigned integer field, falling back to a default.
[[nodiscard]] inline auto getUintOr(const nlohmann::json& obj, std::string_view key, std::uint32_t defaultValue)
    -> std::uint32_t
{
    auto value = getUnsigned<std::uint32_t>(obj, key);
    return value ? *value : defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The boolean value or the default.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_boolean())
        return it->get<bool>();
    return defaultValue;
}

} // namespace lode::json
