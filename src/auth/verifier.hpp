#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "auth/jwt.hpp"
#include "auth/session_store.hpp"
#include "core/config.hpp"
#include "core/types.hpp"

namespace kuberde::auth {

struct VerifierOptions {
  std::vector<std::string> issuers;  // accepted "iss" values, empty = any
  std::chrono::seconds leeway{30};
};

/**
 * Verify(token) -> Claims | Unauthorized | Expired
 *
 * Signature and claim checks are stateless. Tokens carrying "sid" additionally
 * require a live record in the session store.
 */
class TokenVerifier {
 public:
  TokenVerifier(std::shared_ptr<const KeySet> keys, VerifierOptions options, std::shared_ptr<SessionStore> sessions = nullptr, Clock clock = nullptr);

  Result<Claims> verify(const std::string& token) const;

  // Replaces the key set, e.g. after a JWKS reload
  void set_keys(std::shared_ptr<const KeySet> keys);

  std::shared_ptr<SessionStore> sessions() const {
    return sessions_;
  }

 private:
  std::shared_ptr<const KeySet> keys() const;

  mutable std::mutex mutex_;
  std::shared_ptr<const KeySet> keys_;
  VerifierOptions options_;
  std::shared_ptr<SessionStore> sessions_;
  Clock clock_;
};

// Key set from AuthConfig: signing_key for HS256, jwks_file for RS256
Result<std::shared_ptr<KeySet>> load_key_set(const AuthConfig& config);

// Own issuer plus the identity provider's, when configured
VerifierOptions verifier_options(const AuthConfig& config);

}  // namespace kuberde::auth
