#pragma once

#include "cmdgate/config/schema.hpp"
#include "cmdgate/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cmdgate::observability {

/// Splits `observability.backend` ("log", "none", "log,noop") into lowercase names in
/// first-seen order; repeats and blanks are dropped and "none" reads as "noop".
[[nodiscard]] std::vector<std::string> parse_backend_list(const std::string &backend);

/// One observer per listed backend, wrapped in a MultiObserver when there are several.
/// An empty list yields a NoopObserver; an unrecognised name logs.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace cmdgate::observability
