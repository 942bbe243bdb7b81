#include "test_framework.hpp"

#include "cmdgate/security/ledger.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <thread>

void register_ledger_tests(std::vector<cmdgate::tests::TestCase> &tests) {
  using cmdgate::tests::require;
  namespace sec = cmdgate::security;

  tests.push_back({"ledger_ticket_id_is_sha256_prefix", [] {
                     require(sec::ticket_id_for("abc") == "ba7816bf", "sha256(abc) prefix");
                     require(sec::ticket_id_for("") == "e3b0c442", "sha256 of empty text");
                     require(sec::ticket_id_for("rm -rf /").size() == 8, "8 hex chars");
                   }});

  tests.push_back({"ledger_park_then_resolve_once", [] {
                     sec::ApprovalLedger ledger;
                     const auto id = ledger.park("rm -rf /tmp/x");
                     require(id == sec::ticket_id_for("rm -rf /tmp/x"), "id derives from text");
                     require(ledger.size() == 1, "one ticket");

                     auto first = ledger.resolve(id);
                     require(first.ok(), "first resolve succeeds");
                     require(first.value().command == "rm -rf /tmp/x", "command returned");

                     auto second = ledger.resolve(id);
                     require(!second.ok(), "second resolve fails");
                     require(second.error() == "ticket not found or already executed",
                             "not found message");
                     require(ledger.size() == 0, "ledger empty");
                   }});

  tests.push_back({"ledger_unknown_id_fails", [] {
                     sec::ApprovalLedger ledger;
                     require(!ledger.resolve("00000000").ok(), "unknown id");
                   }});

  tests.push_back({"ledger_same_text_refreshes_ticket", [] {
                     auto now = std::make_shared<std::chrono::system_clock::time_point>(
                         std::chrono::system_clock::time_point{} + std::chrono::hours(1));
                     sec::ApprovalLedger ledger(std::chrono::seconds{0}, [now] { return *now; });
                     const auto first = ledger.park("reboot");
                     *now += std::chrono::seconds(5);
                     const auto second = ledger.park("reboot");
                     require(first == second, "same id for same text");
                     require(ledger.size() == 1, "no duplicate ticket");
                     require(ledger.pending().front().created_at == *now, "timestamp refreshed");
                   }});

  tests.push_back({"ledger_collision_probes_new_id", [] {
                     auto id_fn = [](const std::string &text) -> std::string {
                       if (text.find('#') == std::string::npos) {
                         return "deadbeef";
                       }
                       return "id:" + text;
                     };
                     sec::ApprovalLedger ledger(std::chrono::seconds{0}, {}, id_fn);
                     const auto a = ledger.park("shutdown");
                     const auto b = ledger.park("reboot");
                     require(a == "deadbeef", "first text keeps the base id");
                     require(b == "id:reboot#1", "second text probes");
                     require(ledger.resolve(a).value().command == "shutdown", "a intact");
                     require(ledger.resolve(b).value().command == "reboot", "b intact");
                   }});

  tests.push_back({"ledger_reparking_probed_text_keeps_its_id", [] {
                     auto id_fn = [](const std::string &text) -> std::string {
                       if (text.find('#') == std::string::npos) {
                         return "deadbeef";
                       }
                       return "id:" + text;
                     };
                     sec::ApprovalLedger ledger(std::chrono::seconds{0}, {}, id_fn);
                     const auto a = ledger.park("shutdown");
                     const auto b = ledger.park("reboot");
                     require(ledger.resolve(a).ok(), "base occupant resolved");
                     const auto again = ledger.park("reboot");
                     require(again == b, "same text returns its existing id, got " + again);
                     require(ledger.size() == 1, "one ticket for one command");
                     require(ledger.resolve(b).ok(), "approved once");
                     require(!ledger.resolve("deadbeef").ok(), "no second ticket to approve");
                   }});

  tests.push_back({"ledger_pending_is_oldest_first", [] {
                     auto now = std::make_shared<std::chrono::system_clock::time_point>(
                         std::chrono::system_clock::time_point{} + std::chrono::hours(1));
                     sec::ApprovalLedger ledger(std::chrono::seconds{0}, [now] { return *now; });
                     (void)ledger.park("first");
                     *now += std::chrono::seconds(1);
                     (void)ledger.park("second");
                     *now += std::chrono::seconds(1);
                     (void)ledger.park("third");
                     const auto pending = ledger.pending();
                     require(pending.size() == 3, "three tickets");
                     require(pending[0].command == "first", "oldest first");
                     require(pending[2].command == "third", "newest last");
                   }});

  tests.push_back({"ledger_ttl_expires_tickets", [] {
                     auto now = std::make_shared<std::chrono::system_clock::time_point>(
                         std::chrono::system_clock::time_point{} + std::chrono::hours(1));
                     sec::ApprovalLedger ledger(std::chrono::seconds{60}, [now] { return *now; });
                     const auto id = ledger.park("halt");
                     *now += std::chrono::seconds(59);
                     require(ledger.size() == 1, "still alive before ttl");
                     *now += std::chrono::seconds(1);
                     require(!ledger.resolve(id).ok(), "expired ticket cannot be approved");
                   }});

  tests.push_back({"ledger_concurrent_resolve_succeeds_once", [] {
                     for (int round = 0; round < 20; ++round) {
                       sec::ApprovalLedger ledger;
                       const auto id = ledger.park("dd if=/dev/zero of=/tmp/x count=1");
                       std::atomic<int> successes{0};
                       std::vector<std::future<void>> jobs;
                       for (int i = 0; i < 8; ++i) {
                         jobs.push_back(std::async(std::launch::async, [&] {
                           if (ledger.resolve(id).ok()) {
                             successes.fetch_add(1);
                           }
                         }));
                       }
                       for (auto &job : jobs) {
                         job.get();
                       }
                       require(successes.load() == 1, "exactly one approval wins");
                     }
                   }});

  tests.push_back({"ledger_concurrent_park_distinct_commands", [] {
                     sec::ApprovalLedger ledger;
                     std::vector<std::thread> threads;
                     for (int t = 0; t < 4; ++t) {
                       threads.emplace_back([&ledger, t] {
                         for (int i = 0; i < 25; ++i) {
                           (void)ledger.park("cmd-" + std::to_string(t) + "-" + std::to_string(i));
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(ledger.size() == 100, "every command parked");
                   }});
}
