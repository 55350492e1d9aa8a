#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace kuberde::auth {

// Server-side record behind an interactive login
struct SessionRecord {
  std::string id;
  std::string subject;
  std::string username;
  std::vector<std::string> roles;
  Timestamp created;
  Timestamp expires;
};

/**
 * In-memory interactive session records.
 *
 * Tokens carrying a "sid" claim are only valid while their record exists, so
 * revoke() invalidates every token of the session immediately.
 */
class SessionStore {
 public:
  explicit SessionStore(Clock clock = nullptr);

  SessionRecord create(const std::string& subject, const std::string& username, const std::vector<std::string>& roles, std::chrono::seconds ttl);

  // nullopt when unknown, revoked or expired
  std::optional<SessionRecord> get(const std::string& id) const;

  bool revoke(const std::string& id);

  size_t purge_expired();

  size_t size() const;

 private:
  Clock clock_;
  mutable std::mutex mutex_;
  std::map<std::string, SessionRecord> records_;
};

}  // namespace kuberde::auth
