#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>

namespace mnemobox::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string, including \uXXXX escapes and surrogate pairs.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Parse a flat JSON object into a key→value map (top-level only). String values are
/// unescaped; objects, arrays and literals are kept as raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Serialize a string map as a JSON object with sorted keys.
[[nodiscard]] std::string json_object(const std::map<std::string, std::string> &values);

} // namespace mnemobox::common
