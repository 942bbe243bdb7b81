#pragma once

#include "cmdgate/common/result.hpp"
#include "cmdgate/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cmdgate::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Parses TOML text into a Config; missing keys keep their defaults.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Fails on the first hard problem; on success returns non-fatal warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// `NAME=value` lines of a .env file; `export`, quotes and trailing ` #` comments are handled
/// and lines with invalid names are skipped.
[[nodiscard]] std::vector<std::pair<std::string, std::string>>
parse_dotenv(const std::string &content);

/// Loads .env files (CMDGATE_ENV_FILE, the config dir, the working dir) without replacing
/// variables that are already set, then applies CMDGATE_* overrides.
void apply_env_overrides(Config &config);

} // namespace cmdgate::config
