#include "cmdgate/config/config.hpp"

#include "cmdgate/common/fs.hpp"
#include "cmdgate/common/toml.hpp"
#include "cmdgate/observability/factory.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

namespace cmdgate::config {

namespace {

constexpr const char *kConfigDirName = ".cmdgate";
constexpr const char *kConfigFileName = "config.toml";
std::optional<std::filesystem::path> g_path_override;

// --config wins over CMDGATE_CONFIG_PATH.
std::optional<std::filesystem::path> requested_location() {
  if (g_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_path_override->string()));
  }
  if (const char *env = std::getenv("CMDGATE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

struct ConfigLocation {
  std::filesystem::path dir;
  std::filesystem::path file;
};

// A requested path naming a directory (or ending in '/') holds config.toml; anything else
// is the file itself. Without a request the file lives in ~/.cmdgate.
common::Result<ConfigLocation> locate_config() {
  using Out = common::Result<ConfigLocation>;
  const auto requested = requested_location();
  if (!requested.has_value()) {
    const auto home = common::home_dir();
    if (!home.ok()) {
      return Out::failure(home.error());
    }
    const auto dir = home.value() / kConfigDirName;
    return Out::success(ConfigLocation{.dir = dir, .file = dir / kConfigFileName});
  }

  std::error_code ec;
  if (requested->filename().empty() || std::filesystem::is_directory(*requested, ec)) {
    return Out::success(ConfigLocation{.dir = *requested, .file = *requested / kConfigFileName});
  }
  std::filesystem::path dir = requested->parent_path();
  if (dir.empty()) {
    dir = std::filesystem::current_path(ec);
    if (ec) {
      return Out::failure("unable to resolve current directory: " + ec.message());
    }
  }
  return Out::success(ConfigLocation{.dir = dir, .file = *requested});
}

std::string expand_config_value(const std::string &value) {
  const bool has_reference = value.find_first_of("$~") != std::string::npos;
  return has_reference ? common::expand_path(value) : value;
}

std::string read_dotenv_value(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.empty()) {
    return value;
  }
  const char quote = value.front();
  if ((quote == '"' || quote == '\'') && value.size() >= 2) {
    const auto close = value.find_last_of(quote);
    if (close > 0) {
      const std::string body = value.substr(1, close - 1);
      if (quote == '\'') {
        return body;
      }
      std::string out;
      for (std::size_t i = 0; i < body.size(); ++i) {
        if (body[i] == '\\' && i + 1 < body.size()) {
          const char next = body[++i];
          out.push_back(next == 'n' ? '\n' : next == 't' ? '\t' : next);
        } else {
          out.push_back(body[i]);
        }
      }
      return out;
    }
  }
  // Unquoted values end at a " #" comment.
  const auto comment = value.find(" #");
  return comment == std::string::npos ? value : common::trim(value.substr(0, comment));
}

bool is_env_name(const std::string &name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](const char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
  });
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("CMDGATE_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Earlier files win: variables are only set when still missing.
  if (auto location = locate_config(); location.ok()) {
    candidates.push_back(location.value().dir / ".env");
  }
  std::error_code ec;
  if (const auto cwd = std::filesystem::current_path(ec); !ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    std::ifstream file(candidate);
    if (!file) {
      continue;
    }
    std::stringstream content;
    content << file.rdbuf();
    for (const auto &[name, value] : parse_dotenv(content.str())) {
      const char *existing = std::getenv(name.c_str());
      if (existing == nullptr || *existing == '\0') {
        setenv(name.c_str(), value.c_str(), 1);
      }
    }
  }
}

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

// Copies typed values into Config fields, keeping the first type error.
class FieldReader {
public:
  explicit FieldReader(const common::TomlDocument &doc) : doc_(doc) {}

  void read(const std::string &key, std::string &out) { keep(doc_.string_or(key, out), out); }
  void read(const std::string &key, bool &out) { keep(doc_.bool_or(key, out), out); }
  void read(const std::string &key, double &out) { keep(doc_.double_or(key, out), out); }
  void read(const std::string &key, std::vector<std::string> &out) {
    keep(doc_.strings_or(key, out), out);
  }

  template <typename Int> void read_unsigned(const std::string &key, Int &out) {
    auto value = doc_.unsigned_or(key, out);
    if (value.ok() && value.value() > std::numeric_limits<Int>::max()) {
      fail(key + ": value is too large");
      return;
    }
    if (!value.ok()) {
      fail(value.error());
      return;
    }
    out = static_cast<Int>(value.value());
  }

  [[nodiscard]] const std::optional<std::string> &error() const { return error_; }

private:
  template <typename T> void keep(common::Result<T> value, T &out) {
    if (!value.ok()) {
      fail(value.error());
      return;
    }
    out = value.take();
  }

  void fail(const std::string &message) {
    if (!error_.has_value()) {
      error_ = message;
    }
  }

  const common::TomlDocument &doc_;
  std::optional<std::string> error_;
};

} // namespace

std::vector<std::pair<std::string, std::string>> parse_dotenv(const std::string &content) {
  std::vector<std::pair<std::string, std::string>> entries;
  for (const auto &raw_line : common::split_lines(content)) {
    std::string line = common::trim(raw_line);
    if (line.empty() || line.front() == '#') {
      continue;
    }
    if (common::starts_with(line, "export ")) {
      line = common::trim(line.substr(7));
    }
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    std::string name = common::trim(line.substr(0, eq));
    if (!is_env_name(name)) {
      continue;
    }
    entries.emplace_back(std::move(name), read_dotenv_value(line.substr(eq + 1)));
  }
  return entries;
}

common::Result<std::filesystem::path> config_dir() {
  auto location = locate_config();
  if (!location.ok()) {
    return common::Result<std::filesystem::path>::failure(location.error());
  }
  return common::ensure_dir(location.value().dir);
}

common::Result<std::filesystem::path> config_path() {
  auto location = locate_config();
  if (!location.ok()) {
    return common::Result<std::filesystem::path>::failure(location.error());
  }
  return common::Result<std::filesystem::path>::success(location.value().file);
}

bool config_exists() {
  const auto location = locate_config();
  std::error_code ec;
  return location.ok() && std::filesystem::is_regular_file(location.value().file, ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_path_override = std::move(path);
}

void clear_config_path_override() { g_path_override.reset(); }

std::optional<std::filesystem::path> config_path_override() { return requested_location(); }

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *api_key = non_empty_env("CMDGATE_API_KEY"); api_key != nullptr) {
    config.provider.api_key = std::string(api_key);
  }
  if (const char *model = non_empty_env("CMDGATE_MODEL"); model != nullptr) {
    config.provider.model = model;
  }
  if (const char *url = non_empty_env("CMDGATE_PROVIDER_URL"); url != nullptr) {
    config.provider.base_url = url;
  }
  if (const char *token = non_empty_env("CMDGATE_DISCORD_TOKEN"); token != nullptr) {
    if (!config.channels.discord.has_value()) {
      config.channels.discord = DiscordConfig{};
    }
    config.channels.discord->bot_token = token;
  }

  // A key that expanded to nothing counts as unset.
  if (config.provider.api_key.has_value() && common::trim(*config.provider.api_key).empty()) {
    config.provider.api_key = std::nullopt;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  FieldReader in(parsed.value());

  Config config;
  in.read("os_type", config.os_type);
  in.read("command_prefix", config.command_prefix);

  in.read("policy.dangerous_commands", config.policy.dangerous_commands);
  in.read_unsigned("policy.max_command_length", config.policy.max_command_length);
  in.read("policy.auto_approve_safe", config.policy.auto_approve_safe);
  in.read_unsigned("policy.ticket_ttl_seconds", config.policy.ticket_ttl_seconds);

  in.read_unsigned("history.limit", config.history.limit);
  in.read_unsigned("history.retain_recent", config.history.retain_recent);
  in.read_unsigned("history.stride", config.history.stride);
  in.read_unsigned("history.context_entries", config.history.context_entries);

  in.read_unsigned("exec.timeout_seconds", config.exec.timeout_seconds);
  in.read_unsigned("exec.workers", config.exec.workers);
  in.read_unsigned("exec.queue_capacity", config.exec.queue_capacity);
  in.read_unsigned("exec.output_budget", config.exec.output_budget);

  in.read("provider.base_url", config.provider.base_url);
  if (parsed.value().has("provider.api_key")) {
    std::string api_key;
    in.read("provider.api_key", api_key);
    config.provider.api_key = expand_config_value(api_key);
  }
  in.read("provider.model", config.provider.model);
  in.read("provider.temperature", config.provider.temperature);
  in.read_unsigned("provider.timeout_ms", config.provider.timeout_ms);
  config.provider.base_url = expand_config_value(config.provider.base_url);
  config.provider.model = expand_config_value(config.provider.model);

  const auto keys = parsed.value().keys();
  const bool has_discord = std::any_of(keys.begin(), keys.end(), [](const std::string &key) {
    return common::starts_with(key, "channels.discord.");
  });
  if (has_discord) {
    DiscordConfig discord;
    in.read("channels.discord.bot_token", discord.bot_token);
    in.read("channels.discord.channel_id", discord.channel_id);
    in.read("channels.discord.allowed_users", discord.allowed_users);
    in.read_unsigned("channels.discord.poll_interval_ms", discord.poll_interval_ms);
    discord.bot_token = expand_config_value(discord.bot_token);
    discord.channel_id = expand_config_value(discord.channel_id);
    config.channels.discord = std::move(discord);
  }

  in.read("observability.backend", config.observability.backend);

  if (in.error().has_value()) {
    return common::Result<Config>::failure(*in.error());
  }
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  Config config = parsed.take();
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  file << "os_type = " << common::quote_toml_string(config.os_type) << "\n";
  file << "command_prefix = " << common::quote_toml_string(config.command_prefix) << "\n";

  file << "\n[policy]\n";
  file << "dangerous_commands = " << common::toml_string_array(config.policy.dangerous_commands)
       << "\n";
  file << "max_command_length = " << config.policy.max_command_length << "\n";
  file << "auto_approve_safe = " << bool_to_toml(config.policy.auto_approve_safe) << "\n";
  file << "ticket_ttl_seconds = " << config.policy.ticket_ttl_seconds << "\n";

  file << "\n[history]\n";
  file << "limit = " << config.history.limit << "\n";
  file << "retain_recent = " << config.history.retain_recent << "\n";
  file << "stride = " << config.history.stride << "\n";
  file << "context_entries = " << config.history.context_entries << "\n";

  file << "\n[exec]\n";
  file << "timeout_seconds = " << config.exec.timeout_seconds << "\n";
  file << "workers = " << config.exec.workers << "\n";
  file << "queue_capacity = " << config.exec.queue_capacity << "\n";
  file << "output_budget = " << config.exec.output_budget << "\n";

  file << "\n[provider]\n";
  file << "base_url = " << common::quote_toml_string(config.provider.base_url) << "\n";
  if (config.provider.api_key.has_value()) {
    file << "api_key = " << common::quote_toml_string(*config.provider.api_key) << "\n";
  }
  file << "model = " << common::quote_toml_string(config.provider.model) << "\n";
  file << "temperature = " << config.provider.temperature << "\n";
  file << "timeout_ms = " << config.provider.timeout_ms << "\n";

  if (config.channels.discord.has_value()) {
    const auto &discord = *config.channels.discord;
    file << "\n[channels.discord]\n";
    file << "bot_token = " << common::quote_toml_string(discord.bot_token) << "\n";
    file << "channel_id = " << common::quote_toml_string(discord.channel_id) << "\n";
    file << "allowed_users = " << common::toml_string_array(discord.allowed_users) << "\n";
    file << "poll_interval_ms = " << discord.poll_interval_ms << "\n";
  }

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed to flush temporary config file");
  }

  std::error_code rename_ec;
  std::filesystem::rename(tmp_path, path, rename_ec);
  if (rename_ec) {
    std::filesystem::remove(tmp_path, rename_ec);
    return common::Status::error("Failed to replace config file");
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Out = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.policy.max_command_length == 0) {
    return Out::failure("policy.max_command_length must be greater than 0");
  }
  if (config.history.limit == 0) {
    return Out::failure("history.limit must be greater than 0");
  }
  if (config.history.stride == 0) {
    return Out::failure("history.stride must be greater than 0");
  }
  if (config.exec.timeout_seconds == 0) {
    return Out::failure("exec.timeout_seconds must be greater than 0");
  }
  if (config.exec.workers == 0) {
    return Out::failure("exec.workers must be greater than 0");
  }
  if (config.exec.queue_capacity == 0) {
    return Out::failure("exec.queue_capacity must be greater than 0");
  }
  if (config.exec.output_budget == 0) {
    return Out::failure("exec.output_budget must be greater than 0");
  }
  if (config.provider.temperature < 0.0 || config.provider.temperature > 2.0) {
    return Out::failure("provider.temperature must be between 0.0 and 2.0");
  }
  if (common::trim(config.command_prefix).empty()) {
    return Out::failure("command_prefix must not be empty");
  }
  const std::string url = common::to_lower(config.provider.base_url);
  if (!common::starts_with(url, "http://") && !common::starts_with(url, "https://")) {
    return Out::failure("provider.base_url must start with http:// or https://");
  }

  for (const auto &backend : observability::parse_backend_list(config.observability.backend)) {
    if (backend != "log" && backend != "noop") {
      return Out::failure("Invalid observability.backend: " + config.observability.backend);
    }
  }

  if (config.history.limit < config.history.retain_recent) {
    warnings.push_back("history.limit is below history.retain_recent; compaction keeps only "
                       "the newest limit entries verbatim");
  }
  if (config.policy.auto_approve_safe) {
    warnings.push_back("policy.auto_approve_safe runs every command without approval");
  }
  if (!config.provider.api_key.has_value()) {
    warnings.push_back("provider.api_key is not set; the ask action will fail");
  }
  for (const auto &term : config.policy.dangerous_commands) {
    if (common::trim(term).empty()) {
      warnings.push_back("policy.dangerous_commands contains an empty entry (ignored)");
      break;
    }
  }
  if (config.channels.discord.has_value()) {
    if (config.channels.discord->channel_id.empty()) {
      warnings.push_back("channels.discord.channel_id is empty");
    }
    if (config.channels.discord->poll_interval_ms == 0) {
      return Out::failure("channels.discord.poll_interval_ms must be greater than 0");
    }
  }

  return Out::success(std::move(warnings));
}

} // namespace cmdgate::config
