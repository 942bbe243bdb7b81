#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace cmdgate::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON string body, including \uXXXX sequences and surrogate pairs (as UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Lookups read the top-level members of a JSON object and return "" (or `fallback`) when
/// the member is missing or holds another type.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] bool json_get_bool(const std::string &json, const std::string &field, bool fallback);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Top-level fields of a JSON object: strings unescaped, everything else as raw text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// The object elements of a JSON array, each as raw text; other elements are skipped.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace cmdgate::common
