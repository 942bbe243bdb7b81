#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace cmdgate::observability {

struct CommandClassifiedEvent {
  std::string command;
  std::string risk_level;
  bool safe = false;
};

struct TicketParkedEvent {
  std::string ticket_id;
};

struct TicketResolvedEvent {
  std::string ticket_id;
  bool found = false;
};

struct CommandExecutedEvent {
  std::string command;
  int exit_code = -1;
  bool succeeded = false;
  bool timed_out = false;
  std::chrono::milliseconds duration{0};
};

struct CompletionEvent {
  std::string model;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct ChannelMessageEvent {
  std::string channel;
  std::string direction;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<CommandClassifiedEvent, TicketParkedEvent, TicketResolvedEvent,
                 CommandExecutedEvent, CompletionEvent, ChannelMessageEvent, ErrorEvent>;

struct QueueDepthMetric {
  std::uint64_t depth = 0;
};

struct PendingTicketsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<QueueDepthMetric, PendingTicketsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace cmdgate::observability
