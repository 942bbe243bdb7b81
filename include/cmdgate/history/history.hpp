#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cmdgate::history {

enum class Role { User, Assistant };

[[nodiscard]] std::string role_to_string(Role role);

struct HistoryEntry {
  Role role = Role::User;
  std::string content;
  std::string timestamp;
};

struct HistoryOptions {
  std::size_t limit = 50;
  std::size_t retain_recent = 20;
  std::size_t stride = 5;
};

/// Bounded conversation log. Once an append pushes the size past `limit`, the newest
/// `min(retain_recent, limit)` entries are kept verbatim and every `stride`-th entry
/// before them survives, oldest first.
class ConversationHistory {
public:
  explicit ConversationHistory(HistoryOptions options = {});

  void append(Role role, std::string content);
  [[nodiscard]] std::vector<HistoryEntry> snapshot() const;
  [[nodiscard]] std::size_t size() const;
  void clear();

  /// Last `entries` entries as "User: ..." / "AI: ..." lines, each cut to 200 chars.
  [[nodiscard]] std::string recent_context(std::size_t entries = 5) const;

  [[nodiscard]] const HistoryOptions &options() const { return options_; }

private:
  void compact_locked();

  HistoryOptions options_;
  mutable std::mutex mutex_;
  std::vector<HistoryEntry> entries_;
};

/// One history per conversation, created on first use.
class HistoryStore {
public:
  explicit HistoryStore(HistoryOptions options = {});

  [[nodiscard]] std::shared_ptr<ConversationHistory> get(const std::string &session_key);
  [[nodiscard]] std::size_t session_count() const;

private:
  HistoryOptions options_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<ConversationHistory>> sessions_;
};

} // namespace cmdgate::history
