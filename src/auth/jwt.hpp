#pragma once

#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace kuberde::auth {

using JwtTraits = jwt::traits::nlohmann_json;

// Claims carried by every bearer credential
struct Claims {
  std::string subject;   // sub
  std::string username;  // preferred_username
  std::vector<std::string> roles;
  Timestamp expiry;
  Timestamp issued_at;
  std::string issuer;
  std::string session_id;  // sid: interactive session record
  std::string agent_id;    // machine credential bound to one identity

  bool has_role(const std::string& role) const;

  // preferred_username, falling back to sub
  const std::string& name() const {
    return username.empty() ? subject : username;
  }

  json to_json() const;

  // Accepts roles as "roles" or Keycloak-style "realm_access.roles"
  static Claims from_json(const json& j);
};

// Compact JWS decoded by jwt-cpp, with its segments as JSON
struct DecodedToken {
  json header;
  json payload;
  std::shared_ptr<const jwt::decoded_jwt<JwtTraits>> jwt;

  std::string algorithm() const {
    return header.value("alg", "");
  }

  std::string key_id() const {
    return header.value("kid", "");
  }
};

Result<DecodedToken> decode_token(const std::string& token);

// Compact HS256 JWT for the given claims
std::string sign_hs256(const Claims& claims, const std::string& secret);

/**
 * Verification keys: the deployment's HS256 secret plus RS256 public keys from a
 * published JWKS, selected by "kid" (any RSA key when the token has no kid).
 */
class KeySet {
 public:
  KeySet() = default;

  void set_hmac_secret(std::string secret) {
    hmac_secret_ = std::move(secret);
  }

  bool has_hmac() const {
    return !hmac_secret_.empty();
  }

  size_t rsa_key_count() const {
    return rsa_keys_.size();
  }

  // {"kty":"RSA","kid":...,"n":...,"e":...}; other key types are skipped with ok status
  Status add_jwk(const json& jwk);

  // {"keys":[...]}
  Status load_jwks(const json& jwks);

  Status load_jwks_file(const std::filesystem::path& path);

  /**
   * Checks the signature, then exp / nbf / iat against `now` with `leeway`.
   * Expired when the signature is good but the token lapsed, Unauthorized otherwise.
   */
  Status verify(const DecodedToken& token, Timestamp now, std::chrono::seconds leeway) const;

 private:
  struct RsaKey {
    std::string kid;
    jwt::algorithm::rs256 algorithm;
  };

  std::string hmac_secret_;
  std::vector<RsaKey> rsa_keys_;
};

}  // namespace kuberde::auth
