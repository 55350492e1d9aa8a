#include "auth/issuer.hpp"

#include <openssl/crypto.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace kuberde::auth {

namespace {

bool secrets_equal(const std::string& a, const std::string& b) {
  return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace

json IssuedToken::to_json() const {
  return json{{"access_token", access_token}, {"token_type", "Bearer"}, {"expires_in", expires_in.count()}};
}

TokenIssuer::TokenIssuer(AuthConfig config, std::shared_ptr<SessionStore> sessions, Clock clock)
    : config_(std::move(config)),
      sessions_(std::move(sessions)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

IssuedToken TokenIssuer::mint(Claims claims, std::chrono::seconds ttl) const {
  auto now = clock_();
  claims.issuer = config_.issuer;
  claims.issued_at = now;
  claims.expiry = now + ttl;

  IssuedToken token;
  token.access_token = sign_hs256(claims, config_.signing_key);
  token.expires_in = ttl;
  token.expiry = claims.expiry;
  token.session_id = claims.session_id;
  return token;
}

Result<IssuedToken> TokenIssuer::client_credentials(const std::string& client_id, const std::string& client_secret) const {
  if (!enabled()) {
    return Result<IssuedToken>::failure(ErrorCode::Unavailable, "token issuing is not configured");
  }
  for (const auto& client : config_.clients) {
    if (client.client_id != client_id) continue;
    if (!secrets_equal(client.client_secret, client_secret)) break;

    Claims claims;
    claims.subject = client.subject.empty() ? "client:" + client.client_id : client.subject;
    claims.username = client.client_id;
    claims.roles = client.roles;
    claims.agent_id = client.agent_id;
    spdlog::debug("[{}] issued client credential (roles: {})", client.client_id, claims.roles.size());
    return Result<IssuedToken>::success(mint(std::move(claims), config_.token_ttl));
  }
  return Result<IssuedToken>::failure(ErrorCode::Unauthorized, "invalid client credentials");
}

Result<IssuedToken> TokenIssuer::start_session(const std::string& subject, const std::string& username, const std::vector<std::string>& roles) const {
  if (!enabled() || !sessions_) {
    return Result<IssuedToken>::failure(ErrorCode::Unavailable, "sessions are not configured");
  }
  auto record = sessions_->create(subject, username, roles, config_.session_ttl);

  Claims claims;
  claims.subject = subject;
  claims.username = username;
  claims.roles = roles;
  claims.session_id = record.id;
  return Result<IssuedToken>::success(mint(std::move(claims), config_.session_ttl));
}

Result<IssuedToken> TokenIssuer::refresh_session(const Claims& current) const {
  if (!enabled() || !sessions_) {
    return Result<IssuedToken>::failure(ErrorCode::Unavailable, "sessions are not configured");
  }
  if (current.session_id.empty()) {
    return Result<IssuedToken>::failure(ErrorCode::Unauthorized, "credential is not bound to a session");
  }
  auto record = sessions_->get(current.session_id);
  if (!record) {
    return Result<IssuedToken>::failure(ErrorCode::Unauthorized, "session ended");
  }

  // Never outlive the session record
  auto remaining = std::chrono::duration_cast<std::chrono::seconds>(record->expires - clock_());
  auto ttl = std::min(config_.session_token_ttl, remaining);
  if (ttl.count() <= 0) {
    return Result<IssuedToken>::failure(ErrorCode::Expired, "session expired");
  }

  Claims claims;
  claims.subject = record->subject;
  claims.username = record->username;
  claims.roles = record->roles;
  claims.session_id = record->id;
  return Result<IssuedToken>::success(mint(std::move(claims), ttl));
}

bool TokenIssuer::end_session(const std::string& session_id) const {
  return sessions_ && !session_id.empty() && sessions_->revoke(session_id);
}

}  // namespace kuberde::auth
