#pragma once

#include "cmdgate/common/result.hpp"
#include "cmdgate/dispatch/reply.hpp"

#include <functional>
#include <string>
#include <vector>

namespace cmdgate::dispatch {

struct ActionContext {
  std::string session_key;
  std::string argument;
  ReplySink sink;
};

using ActionHandler = std::function<void(const ActionContext &)>;

struct ActionSpec {
  std::string name;
  std::string usage;
  std::string description;
  ActionHandler handler;
};

/// Finite table of chat actions. Names are lowercase and unique.
class ActionRegistry {
public:
  [[nodiscard]] common::Status add(ActionSpec spec);
  [[nodiscard]] const ActionSpec *find(const std::string &name) const;
  [[nodiscard]] const std::vector<ActionSpec> &actions() const { return actions_; }

  /// Fails when any required action is missing.
  [[nodiscard]] common::Status validate(const std::vector<std::string> &required) const;

private:
  std::vector<ActionSpec> actions_;
};

[[nodiscard]] const std::vector<std::string> &required_actions();

} // namespace cmdgate::dispatch
