#pragma once

#include "cmdgate/common/result.hpp"
#include "cmdgate/exec/queue.hpp"
#include "cmdgate/security/classifier.hpp"
#include "cmdgate/security/ledger.hpp"

#include <future>
#include <memory>
#include <string>

namespace cmdgate::gate {

enum class GateErrorKind {
  PolicyRejection,
  UnsafeCommand,
  TicketNotFound,
  ExecutionTimeout,
  ExecutionLaunchFailure,
  CompletionFailure,
};

[[nodiscard]] std::string gate_error_kind_to_string(GateErrorKind kind);

enum class DecisionKind { Rejected, PendingApproval, AutoRun };

struct GateDecision {
  DecisionKind kind = DecisionKind::Rejected;
  std::string command;
  security::ClassificationResult classification;
  std::string ticket_id;
  std::string reason;
};

struct GatePolicy {
  std::size_t max_command_length = 1000;
  /// Runs every command without parking, whatever its verdict.
  bool auto_approve_safe = false;
};

class CommandGate {
public:
  CommandGate(GatePolicy policy, std::shared_ptr<const security::RiskClassifier> classifier,
              std::shared_ptr<security::ApprovalLedger> ledger,
              std::shared_ptr<exec::ExecutionQueue> queue);

  /// Length check, classification, then park or clear for auto-run. Never executes.
  [[nodiscard]] GateDecision evaluate(const std::string &text);

  [[nodiscard]] common::Result<std::future<exec::ExecutionResult>>
  dispatch(const std::string &command, exec::ExecutionQueue::Completion on_complete = {});

  /// Atomically takes the ticket out of the ledger; a second approval of the same id fails.
  [[nodiscard]] common::Result<security::ApprovalTicket> approve(const std::string &ticket_id);

  [[nodiscard]] std::vector<security::ApprovalTicket> pending() const;
  [[nodiscard]] const GatePolicy &policy() const { return policy_; }

private:
  GatePolicy policy_;
  std::shared_ptr<const security::RiskClassifier> classifier_;
  std::shared_ptr<security::ApprovalLedger> ledger_;
  std::shared_ptr<exec::ExecutionQueue> queue_;
};

} // namespace cmdgate::gate
