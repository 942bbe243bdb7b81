#include "cmdgate/observability/global.hpp"

#include <mutex>

namespace cmdgate::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    previous = std::move(g_observer);
    g_observer = std::move(observer);
  }
  if (previous != nullptr) {
    previous->flush();
  }
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

// Events can arrive from worker threads while the observer is being swapped, so each
// call holds its own reference.
void record_event(const ObserverEvent &event) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_command_classified(const std::string &command, const std::string &risk_level,
                               const bool safe) {
  record_event(CommandClassifiedEvent{.command = command, .risk_level = risk_level, .safe = safe});
}

void record_ticket_parked(const std::string &ticket_id) {
  record_event(TicketParkedEvent{.ticket_id = ticket_id});
}

void record_ticket_resolved(const std::string &ticket_id, const bool found) {
  record_event(TicketResolvedEvent{.ticket_id = ticket_id, .found = found});
}

void record_command_executed(const std::string &command, const int exit_code,
                             const bool succeeded, const bool timed_out,
                             const std::chrono::milliseconds duration) {
  record_event(CommandExecutedEvent{.command = command,
                                    .exit_code = exit_code,
                                    .succeeded = succeeded,
                                    .timed_out = timed_out,
                                    .duration = duration});
}

void record_completion(const std::string &model, const std::chrono::milliseconds duration,
                       const bool success) {
  record_event(CompletionEvent{.model = model, .duration = duration, .success = success});
}

void record_channel_message(const std::string &channel, const std::string &direction) {
  record_event(ChannelMessageEvent{.channel = channel, .direction = direction});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace cmdgate::observability
