#pragma once

#include "cmdgate/common/result.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace cmdgate::channels {

struct ChannelMessage {
  std::string id;
  std::string sender;
  std::string recipient; // where replies go (channel id, "cli:local")
  std::string content;
  std::string channel;
  std::uint64_t timestamp = 0;
};

using MessageCallback = std::function<void(const ChannelMessage &)>;

class IChannel {
public:
  virtual ~IChannel() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Status start() = 0;
  virtual void stop() = 0;
  [[nodiscard]] virtual common::Status send(const std::string &recipient,
                                            const std::string &message) = 0;
  virtual void on_message(MessageCallback callback) = 0;
  /// False once the channel can no longer deliver messages.
  [[nodiscard]] virtual bool health_check() = 0;
};

} // namespace cmdgate::channels
