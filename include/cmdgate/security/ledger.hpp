#pragma once

#include "cmdgate/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cmdgate::security {

struct ApprovalTicket {
  std::string id;
  std::string command;
  std::chrono::system_clock::time_point created_at;
};

/// First 8 lowercase hex chars of SHA-256(text).
[[nodiscard]] std::string ticket_id_for(const std::string &text);

/// Process-lifetime store of commands waiting for a human approval. Every ticket is
/// consumed at most once; park and resolve are atomic with respect to each other.
class ApprovalLedger {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;
  using IdFunction = std::function<std::string(const std::string &)>;

  explicit ApprovalLedger(std::chrono::seconds ttl = std::chrono::seconds{0}, Clock clock = {},
                          IdFunction id_fn = {});

  /// Parking the same text twice returns the same id and refreshes its timestamp. A
  /// different text landing on an occupied id probes `text#1`, `text#2`, ... instead.
  [[nodiscard]] std::string park(const std::string &command);

  [[nodiscard]] common::Result<ApprovalTicket> resolve(const std::string &id);

  /// Outstanding tickets, oldest first.
  [[nodiscard]] std::vector<ApprovalTicket> pending();
  [[nodiscard]] std::size_t size();

private:
  void prune_expired_locked(std::chrono::system_clock::time_point now);

  std::chrono::seconds ttl_;
  Clock clock_;
  IdFunction id_fn_;
  std::mutex mutex_;
  std::unordered_map<std::string, ApprovalTicket> tickets_;
};

} // namespace cmdgate::security
