#pragma once

#include "cmdgate/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace cmdgate::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &sep);

/// Number of UTF-8 code points in `value`.
[[nodiscard]] std::size_t utf8_length(const std::string &value);
/// Byte offset reached after skipping `chars` code points from `from`, clamped to the end.
[[nodiscard]] std::size_t utf8_advance(const std::string &value, std::size_t from,
                                       std::size_t chars);

/// Cuts `value` to `max_chars` code points and appends `marker` when anything was removed.
/// Never splits a multi-byte sequence.
[[nodiscard]] std::string truncate_with_marker(const std::string &value, std::size_t max_chars,
                                               const std::string &marker);

/// Local wall-clock time as `YYYY-MM-DDTHH:MM:SS`.
[[nodiscard]] std::string iso_timestamp_now();

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

} // namespace cmdgate::common
