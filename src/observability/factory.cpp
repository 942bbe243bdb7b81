#include "cmdgate/observability/factory.hpp"

#include "cmdgate/common/fs.hpp"
#include "cmdgate/observability/log_observer.hpp"
#include "cmdgate/observability/multi_observer.hpp"
#include "cmdgate/observability/noop_observer.hpp"

#include <algorithm>
#include <sstream>

namespace cmdgate::observability {

namespace {

std::unique_ptr<IObserver> make_backend(const std::string &name) {
  if (name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::vector<std::string> parse_backend_list(const std::string &backend) {
  std::vector<std::string> names;
  std::stringstream stream(common::to_lower(backend));
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = common::trim(item);
    if (item == "none") {
      item = "noop";
    }
    if (!item.empty() && std::find(names.begin(), names.end(), item) == names.end()) {
      names.push_back(item);
    }
  }
  return names;
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto names = parse_backend_list(config.observability.backend);
  if (names.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (names.size() == 1) {
    return make_backend(names.front());
  }

  std::vector<std::unique_ptr<IObserver>> backends;
  backends.reserve(names.size());
  for (const auto &name : names) {
    backends.push_back(make_backend(name));
  }
  return std::make_unique<MultiObserver>(std::move(backends));
}

} // namespace cmdgate::observability
