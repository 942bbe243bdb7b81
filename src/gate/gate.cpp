#include "cmdgate/gate/gate.hpp"

#include "cmdgate/common/fs.hpp"
#include "cmdgate/observability/global.hpp"

namespace cmdgate::gate {

std::string gate_error_kind_to_string(const GateErrorKind kind) {
  switch (kind) {
  case GateErrorKind::PolicyRejection:
    return "policy_rejection";
  case GateErrorKind::UnsafeCommand:
    return "unsafe_command";
  case GateErrorKind::TicketNotFound:
    return "ticket_not_found";
  case GateErrorKind::ExecutionTimeout:
    return "execution_timeout";
  case GateErrorKind::ExecutionLaunchFailure:
    return "execution_launch_failure";
  case GateErrorKind::CompletionFailure:
    return "completion_failure";
  }
  return "policy_rejection";
}

CommandGate::CommandGate(GatePolicy policy,
                         std::shared_ptr<const security::RiskClassifier> classifier,
                         std::shared_ptr<security::ApprovalLedger> ledger,
                         std::shared_ptr<exec::ExecutionQueue> queue)
    : policy_(policy), classifier_(std::move(classifier)), ledger_(std::move(ledger)),
      queue_(std::move(queue)) {}

GateDecision CommandGate::evaluate(const std::string &text) {
  GateDecision decision;
  decision.command = common::trim(text);

  if (decision.command.empty()) {
    decision.kind = DecisionKind::Rejected;
    decision.reason = "command is empty";
    return decision;
  }
  if (common::utf8_length(decision.command) > policy_.max_command_length) {
    decision.kind = DecisionKind::Rejected;
    decision.reason = "command is too long";
    return decision;
  }

  decision.classification = classifier_->classify(decision.command);
  observability::record_command_classified(
      decision.command, security::risk_level_to_string(decision.classification.risk_level),
      decision.classification.safe);

  if (decision.classification.safe || policy_.auto_approve_safe) {
    decision.kind = DecisionKind::AutoRun;
    return decision;
  }

  decision.kind = DecisionKind::PendingApproval;
  decision.ticket_id = ledger_->park(decision.command);
  observability::record_ticket_parked(decision.ticket_id);
  observability::record_metric(
      observability::PendingTicketsMetric{.count = ledger_->size()});
  return decision;
}

common::Result<std::future<exec::ExecutionResult>>
CommandGate::dispatch(const std::string &command, exec::ExecutionQueue::Completion on_complete) {
  return queue_->submit(command, std::move(on_complete));
}

common::Result<security::ApprovalTicket> CommandGate::approve(const std::string &ticket_id) {
  auto ticket = ledger_->resolve(common::trim(ticket_id));
  observability::record_ticket_resolved(ticket_id, ticket.ok());
  return ticket;
}

std::vector<security::ApprovalTicket> CommandGate::pending() const { return ledger_->pending(); }

} // namespace cmdgate::gate
