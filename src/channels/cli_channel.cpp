#include "cmdgate/channels/cli_channel.hpp"

#include <ctime>
#include <iostream>

namespace cmdgate::channels {

CliChannel::CliChannel() : in_(std::cin), out_(std::cout) {}

CliChannel::CliChannel(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

CliChannel::~CliChannel() { stop(); }

std::string_view CliChannel::name() const { return "cli"; }

common::Status CliChannel::start() {
  if (running_) {
    return common::Status::success();
  }

  running_ = true;
  input_done_ = false;
  input_thread_ = std::thread([this]() { read_loop(); });
  return common::Status::success();
}

void CliChannel::read_loop() {
  std::uint64_t sequence = 0;
  while (running_) {
    std::string line;
    if (!std::getline(in_, line)) {
      break;
    }
    if (line.empty()) {
      continue;
    }

    MessageCallback callback_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      callback_copy = callback_;
    }
    if (callback_copy) {
      ChannelMessage msg;
      msg.id = std::to_string(++sequence);
      msg.sender = "stdin";
      msg.recipient = kCliRecipient;
      msg.channel = "cli";
      msg.content = line;
      msg.timestamp = static_cast<std::uint64_t>(std::time(nullptr));
      callback_copy(msg);
    }
  }
  input_done_ = true;
  running_ = false;
}

void CliChannel::stop() {
  running_ = false;
  if (!input_thread_.joinable()) {
    return;
  }
  // A reader blocked on a terminal cannot be interrupted; leave it behind.
  if (input_done_) {
    input_thread_.join();
  } else {
    input_thread_.detach();
  }
}

common::Status CliChannel::send(const std::string &recipient, const std::string &message) {
  (void)recipient;
  std::lock_guard<std::mutex> lock(output_mutex_);
  out_ << message << "\n";
  out_.flush();
  return common::Status::success();
}

void CliChannel::on_message(MessageCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  callback_ = std::move(callback);
}

bool CliChannel::health_check() { return running_ && !input_done_; }

} // namespace cmdgate::channels
