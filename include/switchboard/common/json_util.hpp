#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace switchboard::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Reverse of json_escape; `\uXXXX` escapes are decoded to UTF-8.
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Field lookups search for the first `"field":` occurrence anywhere in the document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Top-level members of an object. Strings are unescaped, objects/arrays/literals kept raw.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Fixed-point rendering used for dollar amounts and ratios in JSON bodies.
[[nodiscard]] std::string json_number(double value, int precision = 6);

} // namespace switchboard::common
