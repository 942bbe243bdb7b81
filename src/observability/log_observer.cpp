#include "cmdgate/observability/log_observer.hpp"

#include "cmdgate/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace cmdgate::observability {

namespace {

constexpr std::size_t kLoggedCommandChars = 80;

std::string bool_text(const bool value) { return value ? "true" : "false"; }

std::string quoted_command(const std::string &command) {
  return "\"" + common::truncate_with_marker(command, kLoggedCommandChars, "...") + "\"";
}

} // namespace

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, CommandClassifiedEvent>) {
          log_line(evt.safe ? "DEBUG" : "INFO",
                   "command.classified risk=" + evt.risk_level + " safe=" + bool_text(evt.safe) +
                       " command=" + quoted_command(evt.command));
        } else if constexpr (std::is_same_v<T, TicketParkedEvent>) {
          log_line("INFO", "ticket.parked id=" + evt.ticket_id);
        } else if constexpr (std::is_same_v<T, TicketResolvedEvent>) {
          log_line(evt.found ? "INFO" : "WARN",
                   "ticket.resolved id=" + evt.ticket_id + " found=" + bool_text(evt.found));
        } else if constexpr (std::is_same_v<T, CommandExecutedEvent>) {
          log_line(evt.succeeded ? "INFO" : "WARN",
                   "command.executed exit_code=" + std::to_string(evt.exit_code) +
                       " succeeded=" + bool_text(evt.succeeded) +
                       " timed_out=" + bool_text(evt.timed_out) +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " command=" + quoted_command(evt.command));
        } else if constexpr (std::is_same_v<T, CompletionEvent>) {
          log_line(evt.success ? "INFO" : "WARN",
                   "completion model=" + evt.model + " success=" + bool_text(evt.success) +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ChannelMessageEvent>) {
          log_line("DEBUG", "channel.message channel=" + evt.channel + " direction=" + evt.direction);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          log_line("DEBUG", "metric.queue_depth=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, PendingTicketsMetric>) {
          log_line("DEBUG", "metric.pending_tickets=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace cmdgate::observability
