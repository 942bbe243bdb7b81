#pragma once

#include "cmdgate/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cmdgate::observability {

/// Forwards to several backends in order. The set is fixed at construction because events
/// arrive concurrently from channel and execution worker threads.
class MultiObserver final : public IObserver {
public:
  explicit MultiObserver(std::vector<std::unique_ptr<IObserver>> observers);

  [[nodiscard]] std::size_t size() const { return observers_.size(); }
  /// Backend names joined with `+`, e.g. `log+noop`.
  [[nodiscard]] std::string describe() const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  const std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace cmdgate::observability
