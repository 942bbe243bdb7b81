#include "cmdgate/runtime/app.hpp"

#include "cmdgate/channels/cli_channel.hpp"
#include "cmdgate/channels/discord/discord.hpp"
#include "cmdgate/common/fs.hpp"
#include "cmdgate/config/config.hpp"
#include "cmdgate/observability/global.hpp"
#include "cmdgate/providers/compatible.hpp"

#include <chrono>
#include <cstdint>
#include <thread>

namespace cmdgate::runtime {

namespace {

std::string session_key_for(const channels::ChannelMessage &message) {
  return message.channel + ":" + message.recipient;
}

} // namespace

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<RuntimeContext>::failure("invalid config: " + validated.error());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(loaded.take()));
}

const config::Config &RuntimeContext::config() const { return config_; }

common::Result<Pipeline>
RuntimeContext::create_pipeline(std::shared_ptr<providers::Provider> provider) const {
  Pipeline pipeline;

  pipeline.classifier =
      std::make_shared<const security::RiskClassifier>(config_.policy.dangerous_commands);
  pipeline.ledger = std::make_shared<security::ApprovalLedger>(
      std::chrono::seconds(static_cast<std::int64_t>(config_.policy.ticket_ttl_seconds)));

  auto runner = std::make_shared<const exec::CommandRunner>(exec::RunnerOptions{
      .timeout = std::chrono::seconds(config_.exec.timeout_seconds),
  });
  pipeline.queue = std::make_shared<exec::ExecutionQueue>(
      runner, exec::QueueOptions{.workers = config_.exec.workers,
                                 .capacity = config_.exec.queue_capacity});

  pipeline.gate = std::make_shared<gate::CommandGate>(
      gate::GatePolicy{.max_command_length = config_.policy.max_command_length,
                       .auto_approve_safe = config_.policy.auto_approve_safe},
      pipeline.classifier, pipeline.ledger, pipeline.queue);

  pipeline.histories = std::make_shared<history::HistoryStore>(
      history::HistoryOptions{.limit = config_.history.limit,
                              .retain_recent = config_.history.retain_recent,
                              .stride = config_.history.stride});

  if (provider == nullptr) {
    provider = std::make_shared<providers::CompatibleProvider>(
        "openai-compatible", config_.provider.base_url, config_.provider.api_key.value_or(""),
        std::make_shared<providers::CurlHttpClient>(), config_.provider.timeout_ms);
  }
  pipeline.assistant = std::make_shared<agent::Assistant>(
      std::move(provider), agent::AssistantOptions{.os_type = config_.os_type,
                                                   .model = config_.provider.model,
                                                   .temperature = config_.provider.temperature,
                                                   .context_entries =
                                                       config_.history.context_entries});

  pipeline.dispatcher = std::make_shared<dispatch::Dispatcher>(
      dispatch::DispatcherOptions{.prefix = config_.command_prefix,
                                  .output_budget = config_.exec.output_budget},
      pipeline.gate, pipeline.assistant, pipeline.histories);
  if (auto status = pipeline.dispatcher->init(); !status.ok()) {
    return common::Result<Pipeline>::failure(status.error());
  }

  return common::Result<Pipeline>::success(std::move(pipeline));
}

common::Result<std::shared_ptr<channels::IChannel>>
RuntimeContext::create_channel(const std::string &name) const {
  using Out = common::Result<std::shared_ptr<channels::IChannel>>;
  const std::string normalized = common::to_lower(common::trim(name));
  if (normalized.empty() || normalized == "cli") {
    return Out::success(std::make_shared<channels::CliChannel>());
  }
  if (normalized == "discord") {
    if (!config_.channels.discord.has_value()) {
      return Out::failure("discord channel is not configured ([channels.discord])");
    }
    const auto &discord = *config_.channels.discord;
    return Out::success(std::make_shared<channels::discord::DiscordChannel>(
        channels::discord::DiscordOptions{.bot_token = discord.bot_token,
                                          .channel_id = discord.channel_id,
                                          .allowed_users = discord.allowed_users,
                                          .poll_interval_ms = discord.poll_interval_ms}));
  }
  return Out::failure("unknown channel: " + name);
}

void attach_channel(const Pipeline &pipeline, const std::shared_ptr<channels::IChannel> &channel,
                    const std::size_t output_budget) {
  std::weak_ptr<channels::IChannel> weak_channel = channel;
  auto dispatcher = pipeline.dispatcher;
  channel->on_message([weak_channel, dispatcher,
                       output_budget](const channels::ChannelMessage &message) {
    auto target = weak_channel.lock();
    if (target == nullptr) {
      return;
    }
    const std::string recipient = message.recipient;
    const std::string channel_name = message.channel;
    const dispatch::ReplySink sink = [target, recipient, channel_name,
                                      output_budget](const dispatch::Reply &reply) {
      auto sent = target->send(recipient, dispatch::render_reply(reply, output_budget));
      if (!sent.ok()) {
        observability::record_error(channel_name, sent.error());
        return;
      }
      observability::record_channel_message(channel_name, "outbound");
    };
    observability::record_channel_message(message.channel, "inbound");
    (void)dispatcher->handle(session_key_for(message), message.content, sink);
  });
}

common::Status run_until_stopped(const Pipeline &pipeline,
                                 const std::shared_ptr<channels::IChannel> &channel,
                                 const std::atomic<bool> &stop) {
  if (auto started = channel->start(); !started.ok()) {
    return started;
  }
  while (!stop.load() && channel->health_check()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  channel->stop();
  pipeline.queue->shutdown();
  return common::Status::success();
}

} // namespace cmdgate::runtime
