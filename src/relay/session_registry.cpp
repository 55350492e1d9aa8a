#include "relay/session_registry.hpp"

#include "core/time_util.hpp"

namespace kuberde::relay {

json AgentStats::to_json() const {
  json j = {
      {"agentID", identity},
      {"online", online},
      {"activeConnections", active_connections},
      {"totalConnections", total_connections},
      {"bytesIn", bytes_in},
      {"bytesOut", bytes_out},
  };
  if (last_activity.time_since_epoch().count() > 0) j["lastActivity"] = format_rfc3339(last_activity);
  if (connected_at.time_since_epoch().count() > 0) j["connectedAt"] = format_rfc3339(connected_at);
  if (credential_expiry.time_since_epoch().count() > 0) j["credentialExpiry"] = format_rfc3339(credential_expiry);
  if (!subject.empty()) j["subject"] = subject;
  if (!remote_address.empty()) j["remoteAddress"] = remote_address;
  return j;
}

SessionRegistry::SessionRegistry(Clock clock) : clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

AgentStats& SessionRegistry::stats_locked(const std::string& identity) {
  auto& stats = stats_[identity];
  stats.identity = identity;
  return stats;
}

std::shared_ptr<mux::MuxSession> SessionRegistry::admit(const std::string& identity, std::shared_ptr<mux::MuxSession> session,
                                                        const std::string& subject, Timestamp credential_expiry) {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);

  std::shared_ptr<mux::MuxSession> previous;
  auto it = sessions_.find(identity);
  if (it != sessions_.end()) {
    previous = std::move(it->second.session);
  }

  auto remote = session->remote_address();
  sessions_[identity] = Entry{std::move(session), credential_expiry};

  auto& stats = stats_locked(identity);
  stats.online = true;
  stats.subject = subject;
  stats.remote_address = remote;
  stats.connected_at = now;
  stats.last_activity = now;
  stats.credential_expiry = credential_expiry;
  return previous;
}

bool SessionRegistry::remove(const std::string& identity, uint64_t session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(identity);
  if (it == sessions_.end() || it->second.session->id() != session_id) {
    return false;
  }
  sessions_.erase(it);
  stats_locked(identity).online = false;
  return true;
}

std::shared_ptr<mux::MuxSession> SessionRegistry::find(const std::string& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(identity);
  if (it == sessions_.end() || it->second.session->is_closed()) {
    return nullptr;
  }
  return it->second.session;
}

std::pair<std::string, std::shared_ptr<mux::MuxSession>> SessionRegistry::find_any(const std::vector<std::string>& identities) const {
  for (const auto& identity : identities) {
    if (auto session = find(identity)) {
      return {identity, session};
    }
  }
  return {std::string(), nullptr};
}

bool SessionRegistry::update_credential(const std::string& identity, uint64_t session_id, Timestamp expiry) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(identity);
  if (it == sessions_.end() || it->second.session->id() != session_id) {
    return false;
  }
  it->second.credential_expiry = expiry;
  stats_locked(identity).credential_expiry = expiry;
  return true;
}

void SessionRegistry::connection_opened(const std::string& identity) {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stats = stats_locked(identity);
  stats.active_connections++;
  stats.total_connections++;
  stats.last_activity = now;
}

void SessionRegistry::connection_closed(const std::string& identity, uint64_t bytes_in, uint64_t bytes_out) {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stats = stats_locked(identity);
  if (stats.active_connections > 0) stats.active_connections--;
  stats.bytes_in += bytes_in;
  stats.bytes_out += bytes_out;
  stats.last_activity = now;
}

std::optional<AgentStats> SessionRegistry::stats(const std::string& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = stats_.find(identity);
  if (it == stats_.end()) return std::nullopt;
  return it->second;
}

std::vector<AgentStats> SessionRegistry::all_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AgentStats> out;
  out.reserve(stats_.size());
  for (const auto& entry : stats_) {
    out.push_back(entry.second);
  }
  return out;
}

std::vector<std::shared_ptr<mux::MuxSession>> SessionRegistry::live_sessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<mux::MuxSession>> out;
  for (const auto& entry : sessions_) {
    if (!entry.second.session->is_closed()) out.push_back(entry.second.session);
  }
  return out;
}

size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

SessionRegistry::SweepResult SessionRegistry::sweep(std::chrono::seconds grace) {
  SweepResult result;
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);

  for (auto it = sessions_.begin(); it != sessions_.end();) {
    const auto& identity = it->first;
    auto& entry = it->second;

    if (entry.session->is_closed()) {
      result.removed.push_back(identity);
      stats_locked(identity).online = false;
      it = sessions_.erase(it);
      continue;
    }

    bool has_expiry = entry.credential_expiry.time_since_epoch().count() > 0;
    if (has_expiry && now > entry.credential_expiry + grace) {
      result.expired.push_back(entry.session);
      stats_locked(identity).online = false;
      it = sessions_.erase(it);
      continue;
    }

    auto& stats = stats_locked(identity);
    if (stats.active_connections > 0) {
      stats.last_activity = now;
    }
    ++it;
  }
  return result;
}

}  // namespace kuberde::relay
