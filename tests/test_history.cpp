#include "test_framework.hpp"

#include "cmdgate/common/fs.hpp"
#include "cmdgate/history/history.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <thread>

void register_history_tests(std::vector<cmdgate::tests::TestCase> &tests) {
  using cmdgate::tests::require;
  namespace hist = cmdgate::history;

  tests.push_back({"history_appends_in_order", [] {
                     hist::ConversationHistory history;
                     history.append(hist::Role::User, "hi");
                     history.append(hist::Role::Assistant, "hello");
                     const auto entries = history.snapshot();
                     require(entries.size() == 2, "two entries");
                     require(entries[0].role == hist::Role::User, "user first");
                     require(entries[1].content == "hello", "assistant second");
                     require(!entries[0].timestamp.empty(), "timestamp set");
                   }});

  tests.push_back({"history_small_limit_keeps_tail_plus_sample", [] {
                     hist::ConversationHistory history(
                         hist::HistoryOptions{.limit = 10, .retain_recent = 20, .stride = 5});
                     for (int i = 0; i < 15; ++i) {
                       history.append(hist::Role::User, "m" + std::to_string(i));
                     }
                     const auto entries = history.snapshot();
                     require(entries.size() == 11, "10 recent plus 1 sampled, got " +
                                                       std::to_string(entries.size()));
                     require(entries.front().content == "m0", "oldest sample survives");
                     require(entries[1].content == "m5", "verbatim tail starts at m5");
                     require(entries.back().content == "m14", "newest kept");
                   }});

  tests.push_back({"history_default_compaction_bounds_size", [] {
                     hist::ConversationHistory history;
                     for (int i = 0; i < 51; ++i) {
                       history.append(hist::Role::User, "e" + std::to_string(i));
                     }
                     const auto entries = history.snapshot();
                     // 31 older entries sampled every 5th (7) + 20 recent.
                     require(entries.size() == 27, "compacted size " + std::to_string(entries.size()));
                     require(entries[0].content == "e0", "e0 sampled");
                     require(entries[1].content == "e5", "e5 sampled");
                     require(entries[6].content == "e30", "e30 sampled");
                     require(entries[7].content == "e31", "tail begins at e31");
                     require(entries.back().content == "e50", "newest kept");
                   }});

  tests.push_back({"history_no_compaction_at_limit", [] {
                     hist::ConversationHistory history(
                         hist::HistoryOptions{.limit = 4, .retain_recent = 2, .stride = 2});
                     for (int i = 0; i < 4; ++i) {
                       history.append(hist::Role::User, std::to_string(i));
                     }
                     require(history.size() == 4, "exactly at limit is kept");
                   }});

  tests.push_back({"history_clear", [] {
                     hist::ConversationHistory history;
                     history.append(hist::Role::User, "x");
                     history.clear();
                     require(history.size() == 0, "cleared");
                     require(history.recent_context().empty(), "no context");
                   }});

  tests.push_back({"history_recent_context_format", [] {
                     hist::ConversationHistory history;
                     history.append(hist::Role::User, "old");
                     for (int i = 0; i < 5; ++i) {
                       history.append(i % 2 == 0 ? hist::Role::User : hist::Role::Assistant,
                                      "n" + std::to_string(i));
                     }
                     const auto context = history.recent_context(5);
                     require(context.find("old") == std::string::npos, "only last five");
                     require(context.rfind("User: n0\nAI: n1\n", 0) == 0, "labels and order");
                   }});

  tests.push_back({"history_recent_context_truncates_long_entries", [] {
                     hist::ConversationHistory history;
                     history.append(hist::Role::Assistant, std::string(300, 'a'));
                     const auto context = history.recent_context();
                     require(context == "AI: " + std::string(200, 'a') + "...\n", "cut at 200");
                   }});

  tests.push_back({"history_recent_context_counts_characters", [] {
                     using cmdgate::testing::repeat;
                     hist::ConversationHistory history;
                     const std::string fits = "x" + repeat("\xD0\xBF", 150);
                     history.append(hist::Role::User, fits);
                     history.append(hist::Role::Assistant, repeat("\xD0\xBF", 300));
                     const auto context = history.recent_context();
                     require(cmdgate::testing::is_valid_utf8(context), "valid utf-8");
                     require(context == "User: " + fits + "\nAI: " + repeat("\xD0\xBF", 200) +
                                            "...\n",
                             "151 chars kept whole, 300 cut at 200");
                     require(cmdgate::common::utf8_length(fits) == 151, "length in code points");
                   }});

  tests.push_back({"history_role_names", [] {
                     require(hist::role_to_string(hist::Role::User) == "user", "user");
                     require(hist::role_to_string(hist::Role::Assistant) == "assistant",
                             "assistant");
                   }});

  tests.push_back({"history_store_isolates_sessions", [] {
                     hist::HistoryStore store;
                     store.get("discord:1")->append(hist::Role::User, "a");
                     require(store.get("discord:1")->size() == 1, "same history returned");
                     require(store.get("cli:cli:local")->size() == 0, "other session empty");
                     require(store.session_count() == 2, "two sessions");
                   }});

  tests.push_back({"history_concurrent_appends", [] {
                     hist::ConversationHistory history(
                         hist::HistoryOptions{.limit = 1000, .retain_recent = 1000, .stride = 1});
                     std::vector<std::thread> threads;
                     for (int t = 0; t < 4; ++t) {
                       threads.emplace_back([&history] {
                         for (int i = 0; i < 50; ++i) {
                           history.append(hist::Role::User, "x");
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(history.size() == 200, "no lost appends");
                   }});
}
