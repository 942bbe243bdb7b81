#include "cmdgate/history/history.hpp"

#include "cmdgate/common/fs.hpp"

#include <algorithm>

namespace cmdgate::history {

namespace {

constexpr std::size_t kContextEntryChars = 200;

} // namespace

std::string role_to_string(const Role role) {
  switch (role) {
  case Role::User:
    return "user";
  case Role::Assistant:
    return "assistant";
  }
  return "user";
}

ConversationHistory::ConversationHistory(HistoryOptions options) : options_(options) {
  if (options_.stride == 0) {
    options_.stride = 1;
  }
}

void ConversationHistory::append(const Role role, std::string content) {
  HistoryEntry entry{
      .role = role, .content = std::move(content), .timestamp = common::iso_timestamp_now()};
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back(std::move(entry));
  if (entries_.size() > options_.limit) {
    compact_locked();
  }
}

void ConversationHistory::compact_locked() {
  const std::size_t recent = std::min(options_.retain_recent, options_.limit);
  if (entries_.size() <= recent) {
    return;
  }
  const std::size_t older = entries_.size() - recent;

  std::vector<HistoryEntry> compacted;
  compacted.reserve(recent + older / options_.stride + 1);
  for (std::size_t i = 0; i < older; i += options_.stride) {
    compacted.push_back(std::move(entries_[i]));
  }
  for (std::size_t i = older; i < entries_.size(); ++i) {
    compacted.push_back(std::move(entries_[i]));
  }
  entries_ = std::move(compacted);
}

std::vector<HistoryEntry> ConversationHistory::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

std::size_t ConversationHistory::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void ConversationHistory::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

std::string ConversationHistory::recent_context(const std::size_t entries) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t start = entries_.size() > entries ? entries_.size() - entries : 0;

  std::string context;
  for (std::size_t i = start; i < entries_.size(); ++i) {
    const auto &entry = entries_[i];
    context += entry.role == Role::User ? "User: " : "AI: ";
    context += common::truncate_with_marker(entry.content, kContextEntryChars, "...");
    context += "\n";
  }
  return context;
}

HistoryStore::HistoryStore(HistoryOptions options) : options_(options) {}

std::shared_ptr<ConversationHistory> HistoryStore::get(const std::string &session_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &slot = sessions_[session_key];
  if (slot == nullptr) {
    slot = std::make_shared<ConversationHistory>(options_);
  }
  return slot;
}

std::size_t HistoryStore::session_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

} // namespace cmdgate::history
