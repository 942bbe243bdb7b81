#include "cmdgate/dispatch/registry.hpp"

#include <algorithm>

namespace cmdgate::dispatch {

namespace {

bool is_valid_action_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](const char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '_' || ch == '-';
  });
}

} // namespace

const std::vector<std::string> &required_actions() {
  static const std::vector<std::string> names = {"ask", "exec", "approve", "history", "clear"};
  return names;
}

common::Status ActionRegistry::add(ActionSpec spec) {
  if (!is_valid_action_name(spec.name)) {
    return common::Status::error("invalid action name: '" + spec.name + "'");
  }
  if (find(spec.name) != nullptr) {
    return common::Status::error("duplicate action: " + spec.name);
  }
  if (!spec.handler) {
    return common::Status::error("action has no handler: " + spec.name);
  }
  actions_.push_back(std::move(spec));
  return common::Status::success();
}

const ActionSpec *ActionRegistry::find(const std::string &name) const {
  const auto it = std::find_if(actions_.begin(), actions_.end(),
                               [&name](const ActionSpec &spec) { return spec.name == name; });
  return it == actions_.end() ? nullptr : &*it;
}

common::Status ActionRegistry::validate(const std::vector<std::string> &required) const {
  for (const auto &name : required) {
    if (find(name) == nullptr) {
      return common::Status::error("required action missing: " + name);
    }
  }
  return common::Status::success();
}

} // namespace cmdgate::dispatch
