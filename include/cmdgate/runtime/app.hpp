#pragma once

#include "cmdgate/agent/assistant.hpp"
#include "cmdgate/channels/channel.hpp"
#include "cmdgate/common/result.hpp"
#include "cmdgate/config/schema.hpp"
#include "cmdgate/dispatch/dispatcher.hpp"
#include "cmdgate/exec/queue.hpp"
#include "cmdgate/gate/gate.hpp"
#include "cmdgate/history/history.hpp"
#include "cmdgate/providers/traits.hpp"
#include "cmdgate/security/classifier.hpp"
#include "cmdgate/security/ledger.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace cmdgate::runtime {

/// Everything one running bot needs, wired from a single config.
struct Pipeline {
  std::shared_ptr<const security::RiskClassifier> classifier;
  std::shared_ptr<security::ApprovalLedger> ledger;
  std::shared_ptr<exec::ExecutionQueue> queue;
  std::shared_ptr<gate::CommandGate> gate;
  std::shared_ptr<history::HistoryStore> histories;
  std::shared_ptr<agent::Assistant> assistant;
  std::shared_ptr<dispatch::Dispatcher> dispatcher;
};

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;

  /// `provider` overrides the configured completion engine (used by tests).
  [[nodiscard]] common::Result<Pipeline>
  create_pipeline(std::shared_ptr<providers::Provider> provider = nullptr) const;

  [[nodiscard]] common::Result<std::shared_ptr<channels::IChannel>>
  create_channel(const std::string &name) const;

private:
  config::Config config_;
};

/// Routes every inbound message through the dispatcher and replies on the same channel.
void attach_channel(const Pipeline &pipeline, const std::shared_ptr<channels::IChannel> &channel,
                    std::size_t output_budget);

/// Blocks until `stop` is set or the channel reports it can no longer deliver messages,
/// then stops the channel and drains pending executions.
[[nodiscard]] common::Status run_until_stopped(const Pipeline &pipeline,
                                               const std::shared_ptr<channels::IChannel> &channel,
                                               const std::atomic<bool> &stop);

} // namespace cmdgate::runtime
