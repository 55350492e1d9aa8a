#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "auth/jwt.hpp"
#include "auth/session_store.hpp"
#include "core/config.hpp"
#include "core/types.hpp"

namespace kuberde::auth {

// OAuth2 token response
struct IssuedToken {
  std::string access_token;
  std::chrono::seconds expires_in{0};
  Timestamp expiry;
  std::string session_id;

  // {"access_token","token_type":"Bearer","expires_in"}
  json to_json() const;
};

/**
 * Mints HS256 credentials signed with the deployment key.
 *
 * Machine clients use the client-credentials grant; interactive logins get a
 * session record plus a session-bound token.
 */
class TokenIssuer {
 public:
  TokenIssuer(AuthConfig config, std::shared_ptr<SessionStore> sessions, Clock clock = nullptr);

  bool enabled() const {
    return !config_.signing_key.empty();
  }

  // grant_type=client_credentials
  Result<IssuedToken> client_credentials(const std::string& client_id, const std::string& client_secret) const;

  // New session record for an authenticated user; the token lives as long as the record
  Result<IssuedToken> start_session(const std::string& subject, const std::string& username, const std::vector<std::string>& roles) const;

  // Short-lived token bound to the caller's live session
  Result<IssuedToken> refresh_session(const Claims& current) const;

  bool end_session(const std::string& session_id) const;

  IssuedToken mint(Claims claims, std::chrono::seconds ttl) const;

 private:
  AuthConfig config_;
  std::shared_ptr<SessionStore> sessions_;
  Clock clock_;
};

}  // namespace kuberde::auth
