#pragma once

#include "cmdgate/agent/assistant.hpp"
#include "cmdgate/common/result.hpp"
#include "cmdgate/dispatch/registry.hpp"
#include "cmdgate/dispatch/reply.hpp"
#include "cmdgate/gate/gate.hpp"
#include "cmdgate/history/history.hpp"

#include <memory>
#include <optional>
#include <string>

namespace cmdgate::dispatch {

struct ParsedAction {
  std::string name;
  std::string argument;
};

/// `!name rest of line` -> {name, rest}. Returns nullopt when `text` lacks the prefix.
[[nodiscard]] std::optional<ParsedAction> parse_action(const std::string &text,
                                                       const std::string &prefix);

struct DispatcherOptions {
  std::string prefix = "!";
  std::size_t output_budget = 1800;
  std::size_t history_display_entries = 10;
};

class Dispatcher {
public:
  Dispatcher(DispatcherOptions options, std::shared_ptr<gate::CommandGate> gate,
             std::shared_ptr<agent::Assistant> assistant,
             std::shared_ptr<history::HistoryStore> histories);

  /// Registers the built-in actions and validates the table.
  [[nodiscard]] common::Status init();

  /// Returns false when `text` is not addressed to the bot (no prefix).
  bool handle(const std::string &session_key, const std::string &text, const ReplySink &sink);

  [[nodiscard]] const ActionRegistry &registry() const { return registry_; }
  [[nodiscard]] const DispatcherOptions &options() const { return options_; }

private:
  void handle_ask(const ActionContext &ctx);
  void handle_exec(const ActionContext &ctx);
  void handle_approve(const ActionContext &ctx);
  void handle_history(const ActionContext &ctx);
  void handle_clear(const ActionContext &ctx);
  void handle_pending(const ActionContext &ctx);
  void handle_help(const ActionContext &ctx);

  void gate_command(const std::string &command, const ReplySink &sink);
  void execute(const std::string &command, const ReplySink &sink);

  DispatcherOptions options_;
  std::shared_ptr<gate::CommandGate> gate_;
  std::shared_ptr<agent::Assistant> assistant_;
  std::shared_ptr<history::HistoryStore> histories_;
  ActionRegistry registry_;
};

} // namespace cmdgate::dispatch
