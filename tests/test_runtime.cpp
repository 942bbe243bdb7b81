#include "test_framework.hpp"

#include "cmdgate/channels/cli_channel.hpp"
#include "cmdgate/channels/discord/discord.hpp"
#include "cmdgate/cli/commands.hpp"
#include "cmdgate/config/config.hpp"
#include "cmdgate/runtime/app.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <filesystem>
#include <sstream>

namespace {

int run_cli_args(std::vector<std::string> args) {
  std::vector<char *> argv;
  argv.push_back(const_cast<char *>("cmdgate"));
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return cmdgate::cli::run_cli(static_cast<int>(argv.size() - 1), argv.data());
}

} // namespace

void register_runtime_tests(std::vector<cmdgate::tests::TestCase> &tests) {
  using cmdgate::tests::require;
  namespace rt = cmdgate::runtime;

  tests.push_back({"runtime_builds_pipeline", [] {
                     rt::RuntimeContext context(cmdgate::testing::mock_config());
                     auto pipeline = context.create_pipeline(
                         std::make_shared<cmdgate::testing::MockProvider>());
                     require(pipeline.ok(), "pipeline: " + pipeline.error());
                     require(pipeline.value().dispatcher->registry().actions().size() == 7,
                             "all actions registered");
                     require(pipeline.value().gate->policy().max_command_length == 1000,
                             "policy from config");
                     pipeline.value().queue->shutdown();
                   }});

  tests.push_back({"runtime_channel_selection", [] {
                     auto config = cmdgate::testing::mock_config();
                     rt::RuntimeContext context(config);
                     require(context.create_channel("cli").ok(), "cli");
                     require(!context.create_channel("discord").ok(), "discord needs config");
                     require(!context.create_channel("irc").ok(), "unknown channel");

                     config.channels.discord = cmdgate::config::DiscordConfig{
                         .bot_token = "t", .channel_id = "1"};
                     rt::RuntimeContext with_discord(config);
                     auto discord = with_discord.create_channel("Discord");
                     require(discord.ok(), "configured discord");
                     require(discord.value()->name() == "discord", "discord channel");
                   }});

  tests.push_back({"runtime_cli_session_end_to_end", [] {
                     auto config = cmdgate::testing::mock_config();
                     config.policy.dangerous_commands = {"shutdown"};
                     rt::RuntimeContext context(config);
                     auto provider = std::make_shared<cmdgate::testing::MockProvider>();
                     provider->set_response("Here you go.\nCOMMAND: echo suggested");
                     auto pipeline = context.create_pipeline(provider);
                     require(pipeline.ok(), "pipeline");

                     std::istringstream in("hello there\n!exec echo e2e\n!exec echo shutdown\n"
                                           "!ask say something\n");
                     std::ostringstream out;
                     auto channel = std::make_shared<cmdgate::channels::CliChannel>(in, out);
                     rt::attach_channel(pipeline.value(), channel, config.exec.output_budget);
                     std::atomic<bool> stop{false};
                     require(rt::run_until_stopped(pipeline.value(), channel, stop).ok(), "ran");

                     const auto text = out.str();
                     require(text.find("hello there") == std::string::npos, "plain chat ignored");
                     require(text.find("running command: `echo e2e`") != std::string::npos,
                             "executing notice");
                     require(text.find("output:\n```\ne2e\n") != std::string::npos,
                             "result delivered before shutdown finished");
                     require(text.find("potentially dangerous command") != std::string::npos,
                             "approval prompt");
                     require(text.find("assistant:\nHere you go.") != std::string::npos,
                             "assistant prose");
                     require(text.find("output:\n```\nsuggested\n") != std::string::npos,
                             "suggested command ran");
                     require(pipeline.value().histories->get("cli:cli:local")->size() == 2,
                             "session keyed by channel and recipient");
                   }});

  tests.push_back({"runtime_stop_flag_ends_loop", [] {
                     rt::RuntimeContext context(cmdgate::testing::mock_config());
                     auto pipeline = context.create_pipeline(
                         std::make_shared<cmdgate::testing::MockProvider>());
                     require(pipeline.ok(), "pipeline");
                     auto http = std::make_shared<cmdgate::testing::FakeHttpClient>();
                     cmdgate::channels::discord::DiscordOptions options;
                     options.bot_token = "t";
                     options.channel_id = "1";
                     options.poll_interval_ms = 10;
                     auto channel =
                         std::make_shared<cmdgate::channels::discord::DiscordChannel>(options, http);
                     rt::attach_channel(pipeline.value(), channel, 1800);
                     std::atomic<bool> stop{true};
                     require(rt::run_until_stopped(pipeline.value(), channel, stop).ok(), "ran");
                     require(!pipeline.value().queue->submit("true").ok(), "queue drained");
                   }});

  tests.push_back({"cli_version_help_and_unknown", [] {
                     require(run_cli_args({"version"}) == 0, "version");
                     require(run_cli_args({"help"}) == 0, "help");
                     require(run_cli_args({"frobnicate"}) == 2, "unknown command is usage error");
                     require(run_cli_args({"--config"}) == 2, "missing config value");
                   }});

  tests.push_back({"cli_check_classifies", [] {
                     cmdgate::testing::TempDir dir;
                     const std::string path = (dir.path() / "config.toml").string();
                     require(run_cli_args({"--config", path, "check", "rm", "-rf", "/tmp"}) == 0,
                             "check runs");
                     require(run_cli_args({"--config", path, "check"}) == 2, "check needs text");
                     cmdgate::config::clear_config_path_override();
                   }});

  tests.push_back({"cli_config_init_and_validate", [] {
                     cmdgate::testing::TempDir dir;
                     const std::string path = (dir.path() / "config.toml").string();
                     require(run_cli_args({"--config=" + path, "config", "init"}) == 0, "init");
                     require(std::filesystem::exists(path), "file written");
                     require(run_cli_args({"--config", path, "config", "init"}) == 1,
                             "refuses to overwrite");
                     require(run_cli_args({"--config", path, "config", "init", "--force"}) == 0,
                             "force overwrite");
                     require(run_cli_args({"--config", path, "config", "validate"}) == 0,
                             "defaults validate");
                     dir.create_file("config.toml", "[exec]\nworkers = 0\n");
                     require(run_cli_args({"--config", path, "config", "validate"}) == 1,
                             "invalid config");
                     require(run_cli_args({"--config", path, "config"}) == 2, "missing action");
                     cmdgate::config::clear_config_path_override();
                   }});
}
