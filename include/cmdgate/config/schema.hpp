#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cmdgate::config {

struct PolicyConfig {
  std::vector<std::string> dangerous_commands = {
      "rm -rf",   "del /f",      "format",     "fdisk",     "mkfs",  "dd if=",
      "shutdown", "reboot",      "halt",       "poweroff",  "taskkill /f",
      "reg delete", "netsh",     "iptables",   "chmod 777", "chown", "wget",
      "curl",     "powershell",  "cmd",        "bash",      "sh"};
  std::size_t max_command_length = 1000;
  bool auto_approve_safe = false;
  std::uint64_t ticket_ttl_seconds = 0;
};

struct HistoryConfig {
  std::size_t limit = 50;
  std::size_t retain_recent = 20;
  std::size_t stride = 5;
  std::size_t context_entries = 5;
};

struct ExecConfig {
  std::uint32_t timeout_seconds = 30;
  std::size_t workers = 2;
  std::size_t queue_capacity = 32;
  std::size_t output_budget = 1800;
};

struct ProviderConfig {
  std::string base_url = "https://api.openai.com/v1";
  std::optional<std::string> api_key;
  std::string model = "gpt-4o-mini";
  double temperature = 0.7;
  std::uint64_t timeout_ms = 60'000;
};

struct DiscordConfig {
  std::string bot_token;
  std::string channel_id;
  std::vector<std::string> allowed_users;
  std::uint64_t poll_interval_ms = 2000;
};

struct ChannelsConfig {
  std::optional<DiscordConfig> discord;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::string os_type = "linux";
  std::string command_prefix = "!";
  PolicyConfig policy;
  HistoryConfig history;
  ExecConfig exec;
  ProviderConfig provider;
  ChannelsConfig channels;
  ObservabilityConfig observability;
};

} // namespace cmdgate::config
