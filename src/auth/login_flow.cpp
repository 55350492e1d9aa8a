#include "auth/login_flow.hpp"

#include "core/encoding.hpp"
#include "net/http_message.hpp"

namespace kuberde::auth {

// ============================================================
// PKCE
// ============================================================

PkceChallenge PkceChallenge::generate() {
  PkceChallenge challenge;
  // 48 random bytes -> 64 base64url characters, within the 43..128 range
  challenge.code_verifier = random_token(48);
  auto digest = sha256(challenge.code_verifier);
  challenge.code_challenge = base64url_encode(std::string(digest.begin(), digest.end()));
  return challenge;
}

// ============================================================
// LoginFlow
// ============================================================

LoginFlow::LoginFlow(OidcConfig config, std::chrono::seconds state_ttl, Clock clock)
    : config_(std::move(config)),
      state_ttl_(state_ttl),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

std::string LoginFlow::begin(const std::string& return_to) {
  auto pkce = PkceChallenge::generate();
  std::string state = random_token(16);
  auto now = clock_();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_locked(now);
    pending_[state] = Pending{pkce.code_verifier, return_to, now};
  }

  std::map<std::string, std::string> params = {
      {"response_type", "code"},
      {"client_id", config_.client_id},
      {"redirect_uri", config_.redirect_url},
      {"scope", config_.scopes},
      {"state", state},
      {"code_challenge", pkce.code_challenge},
      {"code_challenge_method", "S256"},
  };
  char sep = config_.authorize_url.find('?') == std::string::npos ? '?' : '&';
  return config_.authorize_url + sep + net::form_encode(params);
}

std::optional<LoginFlow::Pending> LoginFlow::take(const std::string& state) {
  std::lock_guard<std::mutex> lock(mutex_);
  purge_locked(clock_());
  auto it = pending_.find(state);
  if (it == pending_.end()) return std::nullopt;
  Pending pending = std::move(it->second);
  pending_.erase(it);
  return pending;
}

std::map<std::string, std::string> LoginFlow::exchange_form(const std::string& code, const std::string& code_verifier) const {
  std::map<std::string, std::string> form = {
      {"grant_type", "authorization_code"},
      {"code", code},
      {"redirect_uri", config_.redirect_url},
      {"client_id", config_.client_id},
      {"code_verifier", code_verifier},
  };
  if (!config_.client_secret.empty()) {
    form["client_secret"] = config_.client_secret;
  }
  return form;
}

size_t LoginFlow::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

void LoginFlow::purge_locked(Timestamp now) {
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (now - it->second.created >= state_ttl_) {
      it = pending_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace kuberde::auth
