#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace cmdgate::channels {

/// Who may talk to the gate on a chat surface. Entries are usernames or numeric user ids,
/// compared case-insensitively; a leading `@` and Discord's `<@id>` mention form are
/// accepted. `*` admits everyone, an empty list nobody.
class Allowlist {
public:
  Allowlist() = default;
  explicit Allowlist(const std::vector<std::string> &entries);

  [[nodiscard]] bool empty() const { return !wildcard_ && identities_.empty(); }
  [[nodiscard]] bool admits(std::string_view identity) const;
  /// True when any of the sender's identities (name, id) is listed.
  [[nodiscard]] bool admits_any(std::initializer_list<std::string_view> identities) const;

private:
  bool wildcard_ = false;
  std::unordered_set<std::string> identities_;
};

/// Reduces an allowlist entry or sender identity to its comparable form.
[[nodiscard]] std::string normalize_identity(std::string_view value);

} // namespace cmdgate::channels
