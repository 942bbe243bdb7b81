#include "cmdgate/channels/allowlist.hpp"

#include "cmdgate/common/fs.hpp"

namespace cmdgate::channels {

std::string normalize_identity(const std::string_view value) {
  std::string identity = common::to_lower(common::trim(std::string(value)));
  if (identity.size() > 3 && identity.rfind("<@", 0) == 0 && identity.back() == '>') {
    identity = identity.substr(2, identity.size() - 3);
    if (!identity.empty() && identity.front() == '!') {
      identity.erase(0, 1);
    }
  } else if (!identity.empty() && identity.front() == '@') {
    identity.erase(0, 1);
  }
  return identity;
}

Allowlist::Allowlist(const std::vector<std::string> &entries) {
  for (const auto &entry : entries) {
    std::string identity = normalize_identity(entry);
    if (identity == "*") {
      wildcard_ = true;
    } else if (!identity.empty()) {
      identities_.insert(std::move(identity));
    }
  }
}

bool Allowlist::admits(const std::string_view identity) const {
  if (wildcard_) {
    return true;
  }
  const std::string normalized = normalize_identity(identity);
  return !normalized.empty() && identities_.count(normalized) != 0;
}

bool Allowlist::admits_any(const std::initializer_list<std::string_view> identities) const {
  for (const auto identity : identities) {
    if (admits(identity)) {
      return true;
    }
  }
  return false;
}

} // namespace cmdgate::channels
