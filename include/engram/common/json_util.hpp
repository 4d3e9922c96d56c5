#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace engram::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string (\n, \r, \t, \b, \f, \uXXXX and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Extract a string field value from a JSON document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Parse `[0.1, -2e-3, ...]` into floats. Empty optional on any malformed element.
[[nodiscard]] std::optional<std::vector<float>> json_parse_float_array(const std::string &array);

/// Ordered string→string object, the shape memory context is stored in.
using JsonFlatMap = std::map<std::string, std::string>;

/// Parse a flat JSON object into a key→value map (top-level only; nested values kept raw).
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Serialise a string→string map as a JSON object with keys in map order.
[[nodiscard]] std::string json_write_flat(const JsonFlatMap &values);

} // namespace engram::common
