#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file json.h
 * @brief Minimal JSON value, parser and serializer for the stdio protocol.
 */

namespace envdebug::mcp
{

/**
 * @brief A JSON value. Objects are ordered by key so serialized output is stable.
 */
struct Json
{
    using Object = std::map<std::string, Json>;
    using Array = std::vector<Json>;

    std::variant<std::nullptr_t, bool, double, std::string, Object, Array> value;

    [[nodiscard]] bool is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
    [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(value); }
    [[nodiscard]] bool is_number() const { return std::holds_alternative<double>(value); }
    [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(value); }
    [[nodiscard]] bool is_object() const { return std::holds_alternative<Object>(value); }
    [[nodiscard]] bool is_array() const { return std::holds_alternative<Array>(value); }

    [[nodiscard]] const Object* as_object() const { return std::get_if<Object>(&value); }
    [[nodiscard]] const Array* as_array() const { return std::get_if<Array>(&value); }
    [[nodiscard]] const std::string* as_string() const { return std::get_if<std::string>(&value); }
    [[nodiscard]] const double* as_number() const { return std::get_if<double>(&value); }
    [[nodiscard]] const bool* as_bool() const { return std::get_if<bool>(&value); }
};

/**
 * @brief Parse a complete JSON document; trailing non-whitespace is rejected.
 *
 * Strings must be UTF-8 without raw control characters, numbers must follow the
 * JSON grammar, and arrays/objects may nest at most 256 levels deep.
 */
[[nodiscard]] std::optional<Json> parse_json(std::string_view input);

/**
 * @brief Escape `input` for use inside a JSON string literal (no surrounding quotes).
 *
 * Bytes that are not part of a well-formed UTF-8 sequence are written as `\ufffd`.
 */
[[nodiscard]] std::string json_escape(std::string_view input);

/** @brief Serialize `value` as compact JSON on a single line. */
[[nodiscard]] std::string json_serialize(const Json& value);

[[nodiscard]] std::optional<std::string> json_get_string(const Json::Object& obj,
                                                         const std::string& key);
[[nodiscard]] std::optional<Json> json_get_object(const Json::Object& obj,
                                                  const std::string& key);

} // namespace envdebug::mcp
