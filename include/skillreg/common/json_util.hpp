#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace skillreg::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Offset of the first byte that breaks strict UTF-8 (overlong forms, surrogates and code
/// points above U+10FFFF included), or nullopt when `text` is valid.
[[nodiscard]] std::optional<std::size_t> find_invalid_utf8(const std::string &text);

/// Unescape a JSON-encoded string (standard escapes and \uXXXX, emitted as UTF-8).
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

/// Extract a nested JSON array field (including brackets) from a JSON document.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Parse a JSON array of strings like ["a","b"]. Non-string elements are skipped.
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &array_json);

/// Parse a flat JSON object into a key→value map (top-level only). String values are
/// unescaped; objects, arrays and literals are kept as raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace skillreg::common
