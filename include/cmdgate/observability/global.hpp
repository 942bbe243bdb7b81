#pragma once

#include "cmdgate/observability/observer.hpp"

#include <memory>

namespace cmdgate::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_command_classified(const std::string &command, const std::string &risk_level,
                               bool safe);
void record_ticket_parked(const std::string &ticket_id);
void record_ticket_resolved(const std::string &ticket_id, bool found);
void record_command_executed(const std::string &command, int exit_code, bool succeeded,
                             bool timed_out, std::chrono::milliseconds duration);
void record_completion(const std::string &model, std::chrono::milliseconds duration,
                       bool success);
void record_channel_message(const std::string &channel, const std::string &direction);
void record_error(const std::string &component, const std::string &message);

} // namespace cmdgate::observability
