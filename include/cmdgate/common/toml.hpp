#pragma once

#include "cmdgate/common/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace cmdgate::common {

/// The value shapes the config file uses: strings, booleans, integers, floats and arrays
/// of strings.
using TomlValue = std::variant<std::string, bool, std::int64_t, double, std::vector<std::string>>;

[[nodiscard]] std::string toml_type_name(const TomlValue &value);

/// Typed view of a TOML file keyed by dotted path (`section.key`). Lookups fall back when
/// the key is absent and fail when it holds the wrong type.
class TomlDocument {
public:
  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::size_t size() const { return values_.size(); }
  [[nodiscard]] std::vector<std::string> keys() const;

  [[nodiscard]] Result<std::string> string_or(const std::string &key,
                                              const std::string &fallback) const;
  [[nodiscard]] Result<bool> bool_or(const std::string &key, bool fallback) const;
  [[nodiscard]] Result<std::uint64_t> unsigned_or(const std::string &key,
                                                  std::uint64_t fallback) const;
  /// Integers are accepted and widened.
  [[nodiscard]] Result<double> double_or(const std::string &key, double fallback) const;
  [[nodiscard]] Result<std::vector<std::string>>
  strings_or(const std::string &key, const std::vector<std::string> &fallback) const;

  /// Fails when the key already exists.
  [[nodiscard]] Status insert(std::string key, TomlValue value);

private:
  std::map<std::string, TomlValue> values_;
};

/// Errors name the 1-based line they were found on.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

[[nodiscard]] std::string quote_toml_string(const std::string &value);
[[nodiscard]] std::string toml_string_array(const std::vector<std::string> &values);

} // namespace cmdgate::common
