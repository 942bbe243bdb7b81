#include "cmdgate/observability/multi_observer.hpp"

#include <algorithm>
#include <iterator>

namespace cmdgate::observability {

namespace {

std::vector<std::unique_ptr<IObserver>> without_nulls(std::vector<std::unique_ptr<IObserver>> in) {
  std::vector<std::unique_ptr<IObserver>> out;
  out.reserve(in.size());
  std::copy_if(std::make_move_iterator(in.begin()), std::make_move_iterator(in.end()),
               std::back_inserter(out),
               [](const std::unique_ptr<IObserver> &observer) { return observer != nullptr; });
  return out;
}

} // namespace

MultiObserver::MultiObserver(std::vector<std::unique_ptr<IObserver>> observers)
    : observers_(without_nulls(std::move(observers))) {}

std::string MultiObserver::describe() const {
  std::string out;
  for (const auto &observer : observers_) {
    if (!out.empty()) {
      out += "+";
    }
    out += observer->name();
  }
  return out;
}

void MultiObserver::record_event(const ObserverEvent &event) {
  std::for_each(observers_.begin(), observers_.end(),
                [&event](const auto &observer) { observer->record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  std::for_each(observers_.begin(), observers_.end(),
                [&metric](const auto &observer) { observer->record_metric(metric); });
}

void MultiObserver::flush() {
  std::for_each(observers_.begin(), observers_.end(),
                [](const auto &observer) { observer->flush(); });
}

} // namespace cmdgate::observability
