#pragma once

#include "cmdgate/channels/allowlist.hpp"
#include "cmdgate/channels/channel.hpp"
#include "cmdgate/providers/traits.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cmdgate::channels::discord {

struct DiscordOptions {
  std::string bot_token;
  std::string channel_id;
  /// Usernames or user ids; empty admits everyone in the channel.
  std::vector<std::string> allowed_users;
  std::uint64_t poll_interval_ms = 2000;
  std::string api_base = "https://discord.com/api/v10";
};

/// Discord chat surface over the REST API: polls one channel for new messages and posts
/// replies into it. Messages written by bots (including this one) are ignored.
class DiscordChannel final : public IChannel {
public:
  explicit DiscordChannel(
      DiscordOptions options,
      std::shared_ptr<providers::HttpClient> http_client = std::make_shared<providers::CurlHttpClient>());
  ~DiscordChannel() override;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Status start() override;
  void stop() override;
  [[nodiscard]] common::Status send(const std::string &recipient,
                                    const std::string &message) override;
  void on_message(MessageCallback callback) override;
  [[nodiscard]] bool health_check() override;

  /// One poll round. The first call only records the newest message id so history that
  /// predates startup is never replayed.
  [[nodiscard]] common::Status poll_once();
  [[nodiscard]] std::string last_seen_id() const;

private:
  void poll_loop();
  [[nodiscard]] common::Status check_response(const providers::HttpResponse &response,
                                              std::string_view operation) const;
  [[nodiscard]] bool is_allowed(const std::string &username, const std::string &user_id) const;
  [[nodiscard]] providers::HttpHeaders auth_headers() const;

  DiscordOptions options_;
  Allowlist allowlist_;
  std::shared_ptr<providers::HttpClient> http_client_;
  std::atomic<bool> running_{false};
  std::atomic<bool> healthy_{true};
  bool baseline_done_ = false;

  mutable std::mutex mutex_;
  std::condition_variable stop_cv_;
  std::string last_seen_id_;
  MessageCallback callback_;
  std::thread poll_thread_;
};

/// Discord ids are decimal snowflakes; longer means newer.
[[nodiscard]] bool snowflake_less(const std::string &lhs, const std::string &rhs);

/// Splits text into pieces that fit one Discord message.
[[nodiscard]] std::vector<std::string> split_message(const std::string &text,
                                                     std::size_t max_chars = 1900);

} // namespace cmdgate::channels::discord
