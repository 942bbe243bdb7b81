#include "test_framework.hpp"

#include "cmdgate/channels/allowlist.hpp"
#include "cmdgate/channels/cli_channel.hpp"
#include "cmdgate/channels/discord/discord.hpp"
#include "cmdgate/common/fs.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <mutex>
#include <sstream>
#include <thread>

namespace {

namespace ch = cmdgate::channels;
namespace dc = cmdgate::channels::discord;
using cmdgate::testing::FakeHttpClient;
using cmdgate::testing::http_response;

dc::DiscordOptions discord_options() {
  dc::DiscordOptions options;
  options.bot_token = "bot-token";
  options.channel_id = "555";
  options.api_base = "https://discord.test/api";
  return options;
}

struct Inbox {
  std::mutex mutex;
  std::vector<ch::ChannelMessage> messages;

  ch::MessageCallback callback() {
    return [this](const ch::ChannelMessage &message) {
      std::lock_guard<std::mutex> lock(mutex);
      messages.push_back(message);
    };
  }

  std::vector<ch::ChannelMessage> snapshot() {
    std::lock_guard<std::mutex> lock(mutex);
    return messages;
  }
};

} // namespace

void register_channels_tests(std::vector<cmdgate::tests::TestCase> &tests) {
  using cmdgate::tests::require;

  tests.push_back({"allowlist_matching", [] {
                     require(!ch::Allowlist(std::vector<std::string>{}).admits("alice"), "empty list admits nobody");
                     require(ch::Allowlist({"*"}).admits("alice"), "wildcard");
                     const ch::Allowlist list({"bob", " Alice ", "@carol", "<@!42>", ""});
                     require(list.admits("alice"), "case and space");
                     require(list.admits("carol"), "leading @ dropped");
                     require(list.admits("42"), "mention form reduced to the id");
                     require(list.admits_any({"mallory", "42"}), "any identity");
                     require(!list.admits("mallory"), "not listed");
                     require(!list.admits(""), "blank identity never matches");
                     require(!list.empty() && ch::Allowlist({" "}).empty(), "blank entries skipped");
                   }});

  tests.push_back({"cli_channel_reads_lines_and_writes_replies", [] {
                     std::istringstream in("!exec ls\n\n!history\n");
                     std::ostringstream out;
                     ch::CliChannel channel(in, out);
                     Inbox inbox;
                     channel.on_message(inbox.callback());
                     require(channel.start().ok(), "starts");

                     const auto deadline =
                         std::chrono::steady_clock::now() + std::chrono::seconds(2);
                     while (channel.health_check() && std::chrono::steady_clock::now() < deadline) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(5));
                     }
                     require(!channel.health_check(), "unhealthy once input ends");
                     channel.stop();

                     const auto messages = inbox.snapshot();
                     require(messages.size() == 2, "blank line skipped");
                     require(messages[0].content == "!exec ls", "first line");
                     require(messages[0].recipient == ch::kCliRecipient, "cli recipient");
                     require(messages[0].channel == "cli", "channel name");
                     require(messages[1].id == "2", "sequence ids");

                     require(channel.send(ch::kCliRecipient, "reply text").ok(), "send");
                     require(out.str() == "reply text\n", "written to output");
                   }});

  tests.push_back({"discord_split_message", [] {
                     require(dc::split_message("short").size() == 1, "fits in one");
                     const auto parts = dc::split_message(std::string(4000, 'x'), 1900);
                     require(parts.size() == 3, "three parts");
                     require(parts[0].size() == 1900 && parts[2].size() == 200, "sizes");
                     const auto lines = dc::split_message("aaaa\nbbbb\ncc", 8);
                     require(lines[0] == "aaaa\n", "breaks on newline");
                   }});

  tests.push_back({"discord_split_counts_characters", [] {
                     const auto parts =
                         dc::split_message(cmdgate::testing::repeat("\xD0\xBF", 4000), 1900);
                     require(parts.size() == 3, "three parts");
                     require(cmdgate::common::utf8_length(parts[0]) == 1900 &&
                                 cmdgate::common::utf8_length(parts[1]) == 1900 &&
                                 cmdgate::common::utf8_length(parts[2]) == 200,
                             "sizes in characters");
                     for (const auto &part : parts) {
                       require(cmdgate::testing::is_valid_utf8(part), "each part valid utf-8");
                     }
                     const auto single = dc::split_message("\xE2\x82\xAC\xE2\x82\xAC", 1);
                     require(single.size() == 2 && single[0] == "\xE2\x82\xAC",
                             "three-byte sequence kept whole");
                   }});

  tests.push_back({"discord_snowflake_order", [] {
                     require(dc::snowflake_less("99", "100"), "longer is newer");
                     require(dc::snowflake_less("100", "101"), "same length compares text");
                     require(!dc::snowflake_less("101", "101"), "strict");
                   }});

  tests.push_back({"discord_start_requires_credentials", [] {
                     auto options = discord_options();
                     options.bot_token.clear();
                     dc::DiscordChannel channel(options, std::make_shared<FakeHttpClient>());
                     require(!channel.start().ok(), "token required");
                   }});

  tests.push_back({"discord_first_poll_is_baseline", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->push_response(http_response(
                         200, R"([{"id":"100","content":"!exec old","author":{"id":"1","username":"alice"}}])"));
                     dc::DiscordChannel channel(discord_options(), http);
                     Inbox inbox;
                     channel.on_message(inbox.callback());
                     require(channel.poll_once().ok(), "baseline poll");
                     require(inbox.snapshot().empty(), "history is not replayed");
                     require(channel.last_seen_id() == "100", "baseline recorded");
                     const auto requests = http->requests();
                     require(requests[0].url == "https://discord.test/api/channels/555/messages?limit=1",
                             "baseline url");
                     require(requests[0].headers.at("Authorization") == "Bot bot-token", "bot auth");
                   }});

  tests.push_back({"discord_poll_delivers_new_messages_in_order", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->push_response(http_response(200, R"([{"id":"100","content":"x","author":{"id":"1"}}])"));
                     http->push_response(http_response(200, R"([
                       {"id":"103","content":"!exec second","author":{"id":"2","username":"bob"}},
                       {"id":"102","content":"!exec first","author":{"id":"1","username":"alice"}},
                       {"id":"104","content":"from a bot","author":{"id":"3","username":"me","bot":true}},
                       {"id":"105","content":"   ","author":{"id":"1","username":"alice"}}
                     ])"));
                     dc::DiscordChannel channel(discord_options(), http);
                     Inbox inbox;
                     channel.on_message(inbox.callback());
                     require(channel.poll_once().ok(), "baseline");
                     require(channel.poll_once().ok(), "second poll");

                     const auto messages = inbox.snapshot();
                     require(messages.size() == 2, "bot and blank messages skipped");
                     require(messages[0].content == "!exec first", "oldest first");
                     require(messages[0].sender == "alice", "username as sender");
                     require(messages[0].recipient == "555", "reply to the channel");
                     require(messages[1].channel == "discord", "channel name");
                     require(channel.last_seen_id() == "105", "cursor advanced");
                     require(http->requests()[1].url ==
                                 "https://discord.test/api/channels/555/messages?limit=50&after=100",
                             "incremental url");
                   }});

  tests.push_back({"discord_allowlist_filters_authors", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->push_response(http_response(200, "[]"));
                     http->push_response(http_response(200, R"([
                       {"id":"201","content":"!help","author":{"id":"7","username":"mallory"}},
                       {"id":"202","content":"!help","author":{"id":"8","username":"carol"}},
                       {"id":"203","content":"!help","author":{"id":"42","username":"dave"}}
                     ])"));
                     auto options = discord_options();
                     options.allowed_users = {"carol", "42"};
                     dc::DiscordChannel channel(options, http);
                     Inbox inbox;
                     channel.on_message(inbox.callback());
                     require(channel.poll_once().ok(), "baseline");
                     require(channel.poll_once().ok(), "poll");
                     const auto messages = inbox.snapshot();
                     require(messages.size() == 2, "only allowed authors");
                     require(messages[0].sender == "carol", "by username");
                     require(messages[1].sender == "dave", "by id");
                   }});

  tests.push_back({"discord_auth_failure_marks_unhealthy", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->push_response(http_response(401, "unauthorized"));
                     dc::DiscordChannel channel(discord_options(), http);
                     require(!channel.poll_once().ok(), "poll fails");
                     require(!channel.health_check(), "unhealthy");
                   }});

  tests.push_back({"discord_server_error_stays_healthy", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->push_response(http_response(502, "bad gateway"));
                     dc::DiscordChannel channel(discord_options(), http);
                     require(!channel.poll_once().ok(), "poll fails");
                     require(channel.health_check(), "transient errors are retried");
                   }});

  tests.push_back({"discord_send_splits_and_posts", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->set_fallback(http_response(200, "{}"));
                     dc::DiscordChannel channel(discord_options(), http);
                     require(channel.send("555", std::string(2000, 'y')).ok(), "send");
                     const auto requests = http->requests();
                     require(requests.size() == 2, "split into two posts");
                     require(requests[0].method == "POST", "post");
                     require(requests[0].url == "https://discord.test/api/channels/555/messages",
                             "message endpoint");
                     require(requests[1].body == "{\"content\":\"" + std::string(100, 'y') + "\"}",
                             "remainder body");
                     require(!channel.send("555", "  ").ok(), "blank text rejected");
                   }});

  tests.push_back({"discord_poll_loop_runs_until_stopped", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     auto options = discord_options();
                     options.poll_interval_ms = 10;
                     dc::DiscordChannel channel(options, http);
                     require(channel.start().ok(), "starts");
                     const auto deadline =
                         std::chrono::steady_clock::now() + std::chrono::seconds(2);
                     while (http->requests().size() < 3 &&
                            std::chrono::steady_clock::now() < deadline) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(5));
                     }
                     channel.stop();
                     require(http->requests().size() >= 3, "polled repeatedly");
                     require(channel.health_check(), "still healthy");
                   }});
}
