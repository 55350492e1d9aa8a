#include "auth/verifier.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "core/time_util.hpp"

namespace kuberde::auth {

TokenVerifier::TokenVerifier(std::shared_ptr<const KeySet> keys, VerifierOptions options, std::shared_ptr<SessionStore> sessions, Clock clock)
    : keys_(std::move(keys)),
      options_(std::move(options)),
      sessions_(std::move(sessions)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

void TokenVerifier::set_keys(std::shared_ptr<const KeySet> keys) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_ = std::move(keys);
}

std::shared_ptr<const KeySet> TokenVerifier::keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_;
}

Result<Claims> TokenVerifier::verify(const std::string& token) const {
  if (token.empty()) {
    return Result<Claims>::failure(ErrorCode::Unauthorized, "missing credential");
  }

  auto decoded = decode_token(token);
  if (!decoded.ok()) {
    return Result<Claims>::failure(decoded.status);
  }

  const json& payload = decoded.value->payload;
  if (!payload.contains("exp") || !payload["exp"].is_number()) {
    return Result<Claims>::failure(ErrorCode::Unauthorized, "token has no expiry");
  }
  Claims claims = Claims::from_json(payload);

  auto key_set = keys();
  if (!key_set) {
    return Result<Claims>::failure(ErrorCode::Unauthorized, "no verification keys loaded");
  }
  auto checked = key_set->verify(*decoded.value, clock_(), options_.leeway);
  if (checked.code == ErrorCode::Expired) {
    return Result<Claims>::failure(ErrorCode::Expired, "token expired at " + format_rfc3339(claims.expiry));
  }
  if (!checked.ok()) {
    return Result<Claims>::failure(checked);
  }

  if (!options_.issuers.empty() && std::find(options_.issuers.begin(), options_.issuers.end(), claims.issuer) == options_.issuers.end()) {
    return Result<Claims>::failure(ErrorCode::Unauthorized, "untrusted issuer '" + claims.issuer + "'");
  }
  if (claims.subject.empty()) {
    return Result<Claims>::failure(ErrorCode::Unauthorized, "token has no subject");
  }

  if (!claims.session_id.empty()) {
    if (!sessions_) {
      return Result<Claims>::failure(ErrorCode::Unauthorized, "session tokens are not accepted here");
    }
    auto record = sessions_->get(claims.session_id);
    if (!record) {
      return Result<Claims>::failure(ErrorCode::Unauthorized, "session ended");
    }
    if (record->subject != claims.subject) {
      return Result<Claims>::failure(ErrorCode::Unauthorized, "session belongs to another subject");
    }
  }

  return Result<Claims>::success(std::move(claims));
}

Result<std::shared_ptr<KeySet>> load_key_set(const AuthConfig& config) {
  auto keys = std::make_shared<KeySet>();
  if (!config.signing_key.empty()) {
    keys->set_hmac_secret(config.signing_key);
  }
  if (!config.jwks_file.empty()) {
    auto status = keys->load_jwks_file(config.jwks_file);
    if (!status.ok()) {
      return Result<std::shared_ptr<KeySet>>::failure(status);
    }
    spdlog::info("auth: loaded {} RSA key(s) from {}", keys->rsa_key_count(), config.jwks_file);
  }
  if (!keys->has_hmac() && keys->rsa_key_count() == 0) {
    return Result<std::shared_ptr<KeySet>>::failure(ErrorCode::InvalidArgument, "no signing_key and no JWKS configured");
  }
  return Result<std::shared_ptr<KeySet>>::success(std::move(keys));
}

VerifierOptions verifier_options(const AuthConfig& config) {
  VerifierOptions options;
  options.leeway = config.leeway;
  if (!config.issuer.empty()) options.issuers.push_back(config.issuer);
  if (!config.oidc.issuer.empty()) options.issuers.push_back(config.oidc.issuer);
  return options;
}

}  // namespace kuberde::auth
