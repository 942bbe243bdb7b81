#include "test_framework.hpp"

#include "cmdgate/observability/factory.hpp"
#include "cmdgate/observability/global.hpp"
#include "cmdgate/observability/log_observer.hpp"
#include "cmdgate/observability/multi_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <sstream>

void register_observability_tests(std::vector<cmdgate::tests::TestCase> &tests) {
  using cmdgate::tests::require;
  namespace obs = cmdgate::observability;

  tests.push_back({"log_observer_formats_events", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_event(obs::CommandClassifiedEvent{
                         .command = "rm -rf /", .risk_level = "medium", .safe = false});
                     observer.record_event(obs::TicketResolvedEvent{.ticket_id = "abcd1234",
                                                                   .found = false});
                     observer.record_event(obs::ErrorEvent{.component = "exec", .message = "boom"});
                     observer.record_metric(obs::QueueDepthMetric{.depth = 3});
                     const auto text = out.str();
                     require(text.find("[INFO] command.classified risk=medium safe=false "
                                       "command=\"rm -rf /\"\n") != std::string::npos,
                             "classified line: " + text);
                     require(text.find("[WARN] ticket.resolved id=abcd1234 found=false") !=
                                 std::string::npos,
                             "missing ticket warns");
                     require(text.find("[ERROR] exec: boom") != std::string::npos, "error line");
                     require(text.find("[DEBUG] metric.queue_depth=3") != std::string::npos,
                             "metric line");
                   }});

  tests.push_back({"log_observer_truncates_long_commands", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_event(obs::CommandExecutedEvent{
                         .command = std::string(200, 'z'), .exit_code = 0, .succeeded = true});
                     require(out.str().find("command=\"" + std::string(80, 'z') + "...\"") !=
                                 std::string::npos,
                             "command cut at 80");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     auto first = std::make_unique<cmdgate::testing::RecordingObserver>();
                     auto second = std::make_unique<cmdgate::testing::RecordingObserver>();
                     auto *a = first.get();
                     auto *b = second.get();
                     std::vector<std::unique_ptr<obs::IObserver>> backends;
                     backends.push_back(std::move(first));
                     backends.push_back(nullptr);
                     backends.push_back(std::move(second));
                     obs::MultiObserver multi(std::move(backends));
                     require(multi.size() == 2, "null ignored");
                     require(multi.describe() == "recording+recording", "names in order");
                     multi.record_event(obs::TicketParkedEvent{.ticket_id = "x"});
                     multi.record_metric(obs::PendingTicketsMetric{.count = 1});
                     require(a->events().size() == 1 && b->events().size() == 1, "both got event");
                     require(a->metrics().size() == 1 && b->metrics().size() == 1, "both got metric");
                   }});

  tests.push_back({"observer_factory_backends", [] {
                     cmdgate::config::Config config;
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none");
                     config.observability.backend = "LOG";
                     require(obs::create_observer(config)->name() == "log", "log");
                     config.observability.backend = "log,noop";
                     require(obs::create_observer(config)->name() == "multi", "combined");
                     config.observability.backend = " log , LOG ";
                     require(obs::create_observer(config)->name() == "log", "repeats collapse");
                     config.observability.backend = "";
                     require(obs::create_observer(config)->name() == "noop", "empty");
                   }});

  tests.push_back({"observer_backend_list_parsing", [] {
                     const auto names = obs::parse_backend_list("Log, none,,log ,noop");
                     require(names == std::vector<std::string>{"log", "noop"},
                             "lowercase, deduplicated, none as noop");
                     require(obs::parse_backend_list(" , ").empty(), "blanks dropped");
                   }});

  tests.push_back({"global_observer_records_helpers", [] {
                     auto recorder = std::make_unique<cmdgate::testing::RecordingObserver>();
                     auto *observer = recorder.get();
                     obs::set_global_observer(std::move(recorder));
                     obs::record_command_executed("ls", 0, true, false, std::chrono::milliseconds(4));
                     obs::record_completion("m", std::chrono::milliseconds(10), false);
                     obs::record_channel_message("cli", "inbound");
                     const auto events = observer->events();
                     obs::set_global_observer(nullptr);

                     require(events.size() == 3, "three events");
                     const auto *executed = std::get_if<obs::CommandExecutedEvent>(&events[0]);
                     require(executed != nullptr && executed->duration.count() == 4, "executed");
                     const auto *completion = std::get_if<obs::CompletionEvent>(&events[1]);
                     require(completion != nullptr && !completion->success, "completion");
                     require(std::holds_alternative<obs::ChannelMessageEvent>(events[2]), "message");
                     obs::record_error("after", "reset");
                     require(obs::get_global_observer() == nullptr, "no observer installed");
                   }});
}
