#include "test_framework.hpp"

#include "cmdgate/gate/gate.hpp"
#include "cmdgate/observability/global.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

namespace {

namespace gt = cmdgate::gate;
namespace sec = cmdgate::security;
namespace ex = cmdgate::exec;

struct GateFixture {
  std::shared_ptr<sec::ApprovalLedger> ledger = std::make_shared<sec::ApprovalLedger>();
  std::shared_ptr<ex::ExecutionQueue> queue =
      std::make_shared<ex::ExecutionQueue>(std::make_shared<const ex::CommandRunner>());
  std::shared_ptr<gt::CommandGate> gate;

  explicit GateFixture(gt::GatePolicy policy = {},
                       std::vector<std::string> terms = {"rm -rf", "shutdown", "reboot"}) {
    gate = std::make_shared<gt::CommandGate>(
        policy, std::make_shared<const sec::RiskClassifier>(std::move(terms)), ledger, queue);
  }
};

} // namespace

void register_gate_tests(std::vector<cmdgate::tests::TestCase> &tests) {
  using cmdgate::tests::require;

  tests.push_back({"gate_safe_command_auto_runs", [] {
                     GateFixture fx;
                     const auto decision = fx.gate->evaluate("  ls -la  ");
                     require(decision.kind == gt::DecisionKind::AutoRun, "safe runs directly");
                     require(decision.command == "ls -la", "command trimmed");
                     require(fx.ledger->size() == 0, "nothing parked");
                   }});

  tests.push_back({"gate_unsafe_command_is_parked", [] {
                     GateFixture fx;
                     const auto decision = fx.gate->evaluate("rm -rf /tmp/x");
                     require(decision.kind == gt::DecisionKind::PendingApproval, "parked");
                     require(decision.ticket_id == sec::ticket_id_for("rm -rf /tmp/x"),
                             "ticket id from text");
                     require(decision.classification.risk_level == sec::RiskLevel::Medium,
                             "medium risk");
                     require(fx.gate->pending().size() == 1, "one pending");
                   }});

  tests.push_back({"gate_pattern_only_command_is_parked", [] {
                     GateFixture fx;
                     const auto decision = fx.gate->evaluate("echo hello | cat");
                     require(decision.kind == gt::DecisionKind::PendingApproval,
                             "unsafe even at low risk");
                     require(decision.classification.risk_level == sec::RiskLevel::Low, "low");
                   }});

  tests.push_back({"gate_rejects_empty_and_long_commands", [] {
                     GateFixture fx(gt::GatePolicy{.max_command_length = 10});
                     const auto empty = fx.gate->evaluate("   ");
                     require(empty.kind == gt::DecisionKind::Rejected, "empty rejected");
                     require(empty.reason == "command is empty", "empty reason");
                     const auto exact = fx.gate->evaluate("echo 12345");
                     require(exact.kind == gt::DecisionKind::AutoRun, "limit is inclusive");
                     const auto long_cmd = fx.gate->evaluate("echo 123456");
                     require(long_cmd.kind == gt::DecisionKind::Rejected, "long rejected");
                     require(long_cmd.reason == "command is too long", "long reason");
                     require(fx.ledger->size() == 0, "rejections never park");
                   }});

  tests.push_back({"gate_length_limit_counts_characters", [] {
                     GateFixture fx(gt::GatePolicy{.max_command_length = 10});
                     // 10 characters, 15 bytes.
                     const auto cyrillic =
                         fx.gate->evaluate("echo " + cmdgate::testing::repeat("\xD0\xBF", 5));
                     require(cyrillic.kind == gt::DecisionKind::AutoRun, "within limit");
                   }});

  tests.push_back({"gate_auto_approve_runs_unsafe_commands", [] {
                     GateFixture fx(gt::GatePolicy{.auto_approve_safe = true});
                     const auto decision = fx.gate->evaluate("shutdown -h now");
                     require(decision.kind == gt::DecisionKind::AutoRun, "no approval needed");
                     require(!decision.classification.safe, "still classified unsafe");
                   }});

  tests.push_back({"gate_approve_consumes_ticket", [] {
                     GateFixture fx;
                     const auto decision = fx.gate->evaluate("reboot");
                     auto first = fx.gate->approve(" " + decision.ticket_id + " ");
                     require(first.ok(), "approval succeeds");
                     require(first.value().command == "reboot", "command returned");
                     require(!fx.gate->approve(decision.ticket_id).ok(), "second approval fails");
                   }});

  tests.push_back({"gate_dispatch_executes_through_queue", [] {
                     GateFixture fx;
                     auto submitted = fx.gate->dispatch("echo gated");
                     require(submitted.ok(), "dispatch");
                     require(submitted.value().get().stdout_text == "gated\n", "executed");
                   }});

  tests.push_back({"gate_records_observer_events", [] {
                     auto recorder = std::make_unique<cmdgate::testing::RecordingObserver>();
                     auto *observer = recorder.get();
                     cmdgate::observability::set_global_observer(std::move(recorder));

                     GateFixture fx;
                     const auto decision = fx.gate->evaluate("rm -rf /");
                     (void)fx.gate->approve(decision.ticket_id);

                     bool classified = false;
                     bool parked = false;
                     bool resolved = false;
                     for (const auto &event : observer->events()) {
                       if (const auto *c =
                               std::get_if<cmdgate::observability::CommandClassifiedEvent>(&event)) {
                         classified = !c->safe && c->risk_level == "medium";
                       }
                       if (std::holds_alternative<cmdgate::observability::TicketParkedEvent>(event)) {
                         parked = true;
                       }
                       if (const auto *r =
                               std::get_if<cmdgate::observability::TicketResolvedEvent>(&event)) {
                         resolved = r->found;
                       }
                     }
                     cmdgate::observability::set_global_observer(nullptr);
                     require(classified, "classified event");
                     require(parked, "parked event");
                     require(resolved, "resolved event");
                   }});

  tests.push_back({"gate_error_kind_names", [] {
                     require(gt::gate_error_kind_to_string(gt::GateErrorKind::TicketNotFound) ==
                                 "ticket_not_found",
                             "snake case names");
                   }});
}
