#pragma once

#include "cmdgate/channels/channel.hpp"

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <thread>

namespace cmdgate::channels {

inline constexpr const char *kCliRecipient = "cli:local";

/// Reads one message per stdin line and prints replies to stdout.
class CliChannel final : public IChannel {
public:
  CliChannel();
  CliChannel(std::istream &in, std::ostream &out);
  ~CliChannel() override;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Status start() override;
  void stop() override;
  [[nodiscard]] common::Status send(const std::string &recipient,
                                    const std::string &message) override;
  void on_message(MessageCallback callback) override;
  [[nodiscard]] bool health_check() override;


private:
  void read_loop();

  std::istream &in_;
  std::ostream &out_;
  std::atomic<bool> running_{false};
  std::atomic<bool> input_done_{false};
  std::thread input_thread_;
  std::mutex callback_mutex_;
  std::mutex output_mutex_;
  MessageCallback callback_;
};

} // namespace cmdgate::channels
