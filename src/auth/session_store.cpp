#include "auth/session_store.hpp"

#include "core/encoding.hpp"

namespace kuberde::auth {

SessionStore::SessionStore(Clock clock) : clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

SessionRecord SessionStore::create(const std::string& subject, const std::string& username, const std::vector<std::string>& roles,
                                   std::chrono::seconds ttl) {
  SessionRecord record;
  record.id = random_token(24);
  record.subject = subject;
  record.username = username;
  record.roles = roles;
  record.created = clock_();
  record.expires = record.created + ttl;

  std::lock_guard<std::mutex> lock(mutex_);
  records_[record.id] = record;
  return record;
}

std::optional<SessionRecord> SessionStore::get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end() || clock_() >= it->second.expires) {
    return std::nullopt;
  }
  return it->second;
}

bool SessionStore::revoke(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.erase(id) > 0;
}

size_t SessionStore::purge_expired() {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  size_t removed = 0;
  for (auto it = records_.begin(); it != records_.end();) {
    if (now >= it->second.expires) {
      it = records_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

size_t SessionStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

}  // namespace kuberde::auth
