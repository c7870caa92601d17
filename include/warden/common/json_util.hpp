#pragma once

#include "warden/common/result.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace warden::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Quote and escape a string as a JSON string literal.
[[nodiscard]] std::string json_string(const std::string &value);

/// Unescape a JSON-encoded string body (handles \uXXXX as UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Find the position of a JSON key in a JSON string.
[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Extract a string field value from a JSON document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a numeric field value (as string) from a JSON document.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

/// Top-level members of a JSON object, values kept as raw JSON text.
using JsonMembers = std::vector<std::pair<std::string, std::string>>;
[[nodiscard]] JsonMembers json_object_members(const std::string &object_json);

/// Raw value of a top-level member, or empty when absent.
[[nodiscard]] std::string json_member(const JsonMembers &members, const std::string &key);

/// Decodes a raw JSON string literal; returns empty for non-strings.
[[nodiscard]] std::string json_value_as_string(const std::string &raw);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Re-serialize a JSON value compactly with object keys sorted, so documents that
/// differ only in key order or whitespace compare equal.
[[nodiscard]] Result<std::string> json_canonicalize(const std::string &json);

} // namespace warden::common
