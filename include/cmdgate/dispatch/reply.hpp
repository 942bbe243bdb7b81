#pragma once

#include "cmdgate/exec/runner.hpp"
#include "cmdgate/gate/gate.hpp"
#include "cmdgate/security/classifier.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cmdgate::dispatch {

enum class ReplyKind {
  Info,
  AiText,
  ApprovalRequired,
  Executing,
  ExecutionResult,
  Error,
  Unrecognized,
};

[[nodiscard]] std::string reply_kind_to_string(ReplyKind kind);

struct Reply {
  ReplyKind kind = ReplyKind::Info;
  std::string text;
  std::string command;
  std::string ticket_id;
  security::RiskLevel risk_level = security::RiskLevel::Low;
  std::vector<std::string> warnings;
  std::optional<exec::ExecutionResult> result;
  std::optional<gate::GateErrorKind> error_kind;
};

/// May be invoked from an execution worker thread.
using ReplySink = std::function<void(const Reply &)>;

[[nodiscard]] Reply info_reply(std::string text);
[[nodiscard]] Reply error_reply(gate::GateErrorKind kind, std::string text);

/// Plain-text rendering used by every chat surface.
[[nodiscard]] std::string render_reply(const Reply &reply, std::size_t output_budget = 1800);

} // namespace cmdgate::dispatch
