#include "cmdgate/cli/commands.hpp"

#include "cmdgate/common/fs.hpp"
#include "cmdgate/config/config.hpp"
#include "cmdgate/observability/factory.hpp"
#include "cmdgate/observability/global.hpp"
#include "cmdgate/runtime/app.hpp"
#include "cmdgate/security/classifier.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace cmdgate::cli {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) { g_stop_requested.store(true); }

std::string version_string() {
#ifdef CMDGATE_VERSION
  std::string version = CMDGATE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "cmdgate " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: cmdgate [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  run [--channel cli|discord]  start the command pipeline on a chat surface\n";
  std::cout << "  check <command...>           classify a command without running it\n";
  std::cout << "  config init [--force]        write the default config file\n";
  std::cout << "  config validate              report problems in the config file\n";
  std::cout << "  config path                  print the config file location\n";
  std::cout << "  version                      show version\n";
  std::cout << "  help                         show this message\n";
}

int run_run(std::vector<std::string> args) {
  std::string channel_name = "cli";
  std::string value;
  if (take_option(args, "--channel", "-c", value)) {
    channel_name = value;
  }
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return kExitUsage;
  }

  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return kExitError;
  }
  const auto &cfg = context.value().config();
  observability::set_global_observer(observability::create_observer(cfg));

  auto warnings = config::validate_config(cfg);
  if (warnings.ok()) {
    for (const auto &warning : warnings.value()) {
      std::cerr << "warning: " << warning << "\n";
    }
  }

  auto pipeline = context.value().create_pipeline();
  if (!pipeline.ok()) {
    std::cerr << pipeline.error() << "\n";
    return kExitError;
  }
  auto channel = context.value().create_channel(channel_name);
  if (!channel.ok()) {
    std::cerr << channel.error() << "\n";
    return kExitUsage;
  }

  g_stop_requested.store(false);
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  runtime::attach_channel(pipeline.value(), channel.value(), cfg.exec.output_budget);
  auto status = runtime::run_until_stopped(pipeline.value(), channel.value(), g_stop_requested);

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  if (!status.ok()) {
    std::cerr << "channel failed: " << status.error() << "\n";
    return kExitError;
  }
  return kExitOk;
}

int run_check(std::vector<std::string> args) {
  const std::string command = common::trim(join_tokens(args));
  if (command.empty()) {
    std::cerr << "usage: cmdgate check <command...>\n";
    return kExitUsage;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return kExitError;
  }

  const security::RiskClassifier classifier(cfg.value().policy.dangerous_commands);
  const auto result = classifier.classify(command);
  std::cout << "command: " << command << "\n";
  std::cout << "safe: " << (result.safe ? "yes" : "no") << "\n";
  std::cout << "risk level: " << security::risk_level_to_string(result.risk_level) << "\n";
  for (const auto &warning : result.warnings) {
    std::cout << "- " << warning << "\n";
  }
  return kExitOk;
}

int run_config(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: cmdgate config <init|validate|path>\n";
    return kExitUsage;
  }
  const std::string action = args.front();
  args.erase(args.begin());

  if (action == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return kExitError;
    }
    std::cout << path.value().string() << "\n";
    return kExitOk;
  }

  if (action == "init") {
    const bool force = take_flag(args, "--force");
    if (config::config_exists() && !force) {
      std::cerr << "config already exists (use --force to overwrite)\n";
      return kExitError;
    }
    auto saved = config::save_config(config::Config{});
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return kExitError;
    }
    auto path = config::config_path();
    std::cout << "wrote " << (path.ok() ? path.value().string() : std::string("config")) << "\n";
    return kExitOk;
  }

  if (action == "validate") {
    auto cfg = config::load_config();
    if (!cfg.ok()) {
      std::cerr << cfg.error() << "\n";
      return kExitError;
    }
    auto problems = config::validate_config(cfg.value());
    if (!problems.ok()) {
      std::cerr << "invalid: " << problems.error() << "\n";
      return kExitError;
    }
    for (const auto &warning : problems.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "config ok\n";
    return kExitOk;
  }

  std::cerr << "unknown config command: " << action << "\n";
  return kExitUsage;
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return kExitOk;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return kExitUsage;
  }
  if (args.empty()) {
    print_help();
    return kExitOk;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return kExitOk;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return kExitOk;
  }
  if (subcommand == "run") {
    return run_run(std::move(args));
  }
  if (subcommand == "check") {
    return run_check(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return kExitUsage;
}

} // namespace cmdgate::cli
