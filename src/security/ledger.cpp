#include "cmdgate/security/ledger.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace cmdgate::security {

namespace {

constexpr std::size_t kTicketIdLength = 8;

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

} // namespace

std::string ticket_id_for(const std::string &text) {
  return sha256_hex(text).substr(0, kTicketIdLength);
}

ApprovalLedger::ApprovalLedger(const std::chrono::seconds ttl, Clock clock, IdFunction id_fn)
    : ttl_(ttl), clock_(std::move(clock)), id_fn_(std::move(id_fn)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
  if (!id_fn_) {
    id_fn_ = ticket_id_for;
  }
}

void ApprovalLedger::prune_expired_locked(const std::chrono::system_clock::time_point now) {
  if (ttl_.count() <= 0) {
    return;
  }
  for (auto it = tickets_.begin(); it != tickets_.end();) {
    if (now - it->second.created_at >= ttl_) {
      it = tickets_.erase(it);
    } else {
      ++it;
    }
  }
}

std::string ApprovalLedger::park(const std::string &command) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = clock_();
  prune_expired_locked(now);

  // The text may sit further down its probe chain after an earlier occupant was resolved.
  auto existing = std::find_if(tickets_.begin(), tickets_.end(), [&command](const auto &entry) {
    return entry.second.command == command;
  });
  if (existing != tickets_.end()) {
    existing->second.created_at = now;
    return existing->first;
  }

  std::string id = id_fn_(command);
  for (std::size_t attempt = 1; tickets_.count(id) != 0; ++attempt) {
    id = id_fn_(command + "#" + std::to_string(attempt));
  }
  tickets_.emplace(id, ApprovalTicket{.id = id, .command = command, .created_at = now});
  return id;
}

common::Result<ApprovalTicket> ApprovalLedger::resolve(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  prune_expired_locked(clock_());

  auto it = tickets_.find(id);
  if (it == tickets_.end()) {
    return common::Result<ApprovalTicket>::failure("ticket not found or already executed");
  }
  ApprovalTicket ticket = std::move(it->second);
  tickets_.erase(it);
  return common::Result<ApprovalTicket>::success(std::move(ticket));
}

std::vector<ApprovalTicket> ApprovalLedger::pending() {
  std::lock_guard<std::mutex> lock(mutex_);
  prune_expired_locked(clock_());

  std::vector<ApprovalTicket> out;
  out.reserve(tickets_.size());
  for (const auto &[id, ticket] : tickets_) {
    out.push_back(ticket);
  }
  std::sort(out.begin(), out.end(), [](const ApprovalTicket &a, const ApprovalTicket &b) {
    if (a.created_at != b.created_at) {
      return a.created_at < b.created_at;
    }
    return a.id < b.id;
  });
  return out;
}

std::size_t ApprovalLedger::size() {
  std::lock_guard<std::mutex> lock(mutex_);
  prune_expired_locked(clock_());
  return tickets_.size();
}

} // namespace cmdgate::security
