#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "mux/session.hpp"

namespace kuberde::relay {

// Per-identity activity, kept after the session goes away
struct AgentStats {
  std::string identity;
  bool online = false;
  std::string subject;
  std::string remote_address;
  Timestamp connected_at;
  Timestamp last_activity;
  Timestamp credential_expiry;
  size_t active_connections = 0;
  uint64_t total_connections = 0;
  uint64_t bytes_in = 0;   // client -> agent
  uint64_t bytes_out = 0;  // agent -> client

  // GET /mgmt/agents/{id} body
  json to_json() const;
};

/**
 * Live agent sessions keyed by workload identity, at most one per identity.
 *
 * admit() supersedes: the previous session is handed back to the caller to close.
 * remove() only drops the entry when it still refers to the given session, so a
 * superseded session's close callback cannot evict its successor.
 */
class SessionRegistry {
 public:
  explicit SessionRegistry(Clock clock = nullptr);

  std::shared_ptr<mux::MuxSession> admit(const std::string& identity, std::shared_ptr<mux::MuxSession> session, const std::string& subject,
                                         Timestamp credential_expiry);

  bool remove(const std::string& identity, uint64_t session_id);

  // Live session or nullptr
  std::shared_ptr<mux::MuxSession> find(const std::string& identity) const;

  // First live session among candidate identities, with the identity that matched
  std::pair<std::string, std::shared_ptr<mux::MuxSession>> find_any(const std::vector<std::string>& identities) const;

  bool update_credential(const std::string& identity, uint64_t session_id, Timestamp expiry);

  void connection_opened(const std::string& identity);

  void connection_closed(const std::string& identity, uint64_t bytes_in, uint64_t bytes_out);

  std::optional<AgentStats> stats(const std::string& identity) const;

  std::vector<AgentStats> all_stats() const;

  std::vector<std::shared_ptr<mux::MuxSession>> live_sessions() const;

  size_t size() const;

  struct SweepResult {
    std::vector<std::string> removed;                        // sessions found closed
    std::vector<std::shared_ptr<mux::MuxSession>> expired;  // credential lapsed, caller closes
  };

  // Drops closed sessions, refreshes activity for identities with open connections,
  // and detaches sessions whose credential expired more than `grace` ago
  SweepResult sweep(std::chrono::seconds grace);

 private:
  struct Entry {
    std::shared_ptr<mux::MuxSession> session;
    Timestamp credential_expiry;
  };

  AgentStats& stats_locked(const std::string& identity);

  Clock clock_;
  mutable std::mutex mutex_;
  std::map<std::string, Entry> sessions_;
  std::map<std::string, AgentStats> stats_;
};

}  // namespace kuberde::relay
