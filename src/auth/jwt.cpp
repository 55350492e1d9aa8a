#include "auth/jwt.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

#include "core/time_util.hpp"

namespace kuberde::auth {

// ============================================================
// Claims
// ============================================================

bool Claims::has_role(const std::string& role) const {
  return std::find(roles.begin(), roles.end(), role) != roles.end();
}

json Claims::to_json() const {
  json j = {
      {"sub", subject},
      {"roles", roles},
      {"exp", to_unix_seconds(expiry)},
      {"iat", to_unix_seconds(issued_at)},
  };
  if (!username.empty()) j["preferred_username"] = username;
  if (!issuer.empty()) j["iss"] = issuer;
  if (!session_id.empty()) j["sid"] = session_id;
  if (!agent_id.empty()) j["agent_id"] = agent_id;
  return j;
}

Claims Claims::from_json(const json& j) {
  Claims claims;
  claims.subject = j.value("sub", "");
  claims.username = j.value("preferred_username", "");
  claims.issuer = j.value("iss", "");
  claims.session_id = j.value("sid", "");
  claims.agent_id = j.value("agent_id", "");

  if (j.contains("exp") && j["exp"].is_number()) {
    claims.expiry = from_unix_seconds(j["exp"].get<int64_t>());
  }
  if (j.contains("iat") && j["iat"].is_number()) {
    claims.issued_at = from_unix_seconds(j["iat"].get<int64_t>());
  }

  auto collect = [&claims](const json& arr) {
    if (!arr.is_array()) return;
    for (const auto& role : arr) {
      if (role.is_string()) claims.roles.push_back(role.get<std::string>());
    }
  };
  if (j.contains("roles")) collect(j["roles"]);
  if (j.contains("realm_access") && j["realm_access"].is_object() && j["realm_access"].contains("roles")) {
    collect(j["realm_access"]["roles"]);
  }
  return claims;
}

// ============================================================
// Compact JWS
// ============================================================

Result<DecodedToken> decode_token(const std::string& token) {
  DecodedToken decoded;
  try {
    auto parsed = std::make_shared<const jwt::decoded_jwt<JwtTraits>>(jwt::decode<JwtTraits>(token));
    decoded.header = json::parse(parsed->get_header());
    decoded.payload = json::parse(parsed->get_payload());
    decoded.jwt = std::move(parsed);
  } catch (const std::exception& e) {
    return Result<DecodedToken>::failure(ErrorCode::Unauthorized, std::string("malformed token: ") + e.what());
  }
  return Result<DecodedToken>::success(std::move(decoded));
}

std::string sign_hs256(const Claims& claims, const std::string& secret) {
  json payload = claims.to_json();
  auto builder = jwt::create<JwtTraits>();
  builder.set_type("JWT");
  for (const auto& item : payload.items()) {
    builder.set_payload_claim(item.key(), jwt::basic_claim<JwtTraits>(item.value()));
  }
  return builder.sign(jwt::algorithm::hs256{secret});
}

// ============================================================
// KeySet
// ============================================================

namespace {

// Verification time comes from the caller's clock, not the wall clock
struct FixedClock {
  Timestamp at;

  jwt::date now() const {
    return at;
  }
};

template <typename Algorithm>
Status check(const jwt::decoded_jwt<JwtTraits>& token, const Algorithm& algorithm, Timestamp now, std::chrono::seconds leeway) {
  auto verifier = jwt::verify<FixedClock, JwtTraits>(FixedClock{now});
  verifier.allow_algorithm(algorithm).leeway(static_cast<size_t>(leeway.count()));

  std::error_code ec;
  try {
    verifier.verify(token, ec);
  } catch (const std::exception& e) {
    return Status::failure(ErrorCode::Unauthorized, std::string("unverifiable token: ") + e.what());
  }
  if (!ec) return Status::success();
  if (ec == jwt::error::token_verification_error::token_expired) {
    return Status::failure(ErrorCode::Expired, "token expired");
  }
  return Status::failure(ErrorCode::Unauthorized, ec.message());
}

}  // namespace

Status KeySet::add_jwk(const json& jwk) {
  if (!jwk.is_object()) {
    return Status::failure(ErrorCode::InvalidArgument, "JWK must be an object");
  }

  try {
    jwt::jwk<JwtTraits> key(jwk);
    if (key.get_key_type() != "RSA") {
      spdlog::debug("jwks: skipping key type {}", key.get_key_type());
      return Status::success();
    }
    if (key.has_use() && key.get_use() != "sig") {
      return Status::success();
    }
    if (!key.has_jwk_claim("n") || !key.has_jwk_claim("e")) {
      return Status::failure(ErrorCode::InvalidArgument, "RSA JWK without n/e");
    }

    std::error_code ec;
    std::string pem =
        jwt::helper::create_public_key_from_rsa_components(key.get_jwk_claim("n").as_string(), key.get_jwk_claim("e").as_string(), ec);
    if (ec) {
      return Status::failure(ErrorCode::InvalidArgument, "RSA JWK could not be imported: " + ec.message());
    }
    rsa_keys_.push_back(RsaKey{key.has_key_id() ? key.get_key_id() : "", jwt::algorithm::rs256(pem)});
  } catch (const std::exception& e) {
    return Status::failure(ErrorCode::InvalidArgument, std::string("invalid RSA JWK: ") + e.what());
  }
  return Status::success();
}

Status KeySet::load_jwks(const json& jwks) {
  if (!jwks.is_object() || !jwks.contains("keys") || !jwks["keys"].is_array()) {
    return Status::failure(ErrorCode::InvalidArgument, "JWKS must contain a \"keys\" array");
  }
  for (const auto& jwk : jwks["keys"]) {
    auto status = add_jwk(jwk);
    if (!status.ok()) {
      spdlog::warn("jwks: {} (kid={})", status.message, jwk.is_object() ? jwk.value("kid", "") : "");
    }
  }
  return Status::success();
}

Status KeySet::load_jwks_file(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file) {
    return Status::failure(ErrorCode::NotFound, "cannot open " + path.string());
  }
  try {
    return load_jwks(json::parse(file));
  } catch (const json::exception& e) {
    return Status::failure(ErrorCode::InvalidArgument, path.string() + ": " + e.what());
  }
}

Status KeySet::verify(const DecodedToken& token, Timestamp now, std::chrono::seconds leeway) const {
  if (!token.jwt) {
    return Status::failure(ErrorCode::Unauthorized, "token was not decoded");
  }
  std::string alg = token.algorithm();

  if (alg == "HS256") {
    if (hmac_secret_.empty()) {
      return Status::failure(ErrorCode::Unauthorized, "HS256 tokens are not accepted");
    }
    return check(*token.jwt, jwt::algorithm::hs256{hmac_secret_}, now, leeway);
  }

  if (alg == "RS256") {
    std::string kid = token.key_id();
    Status last = Status::failure(ErrorCode::Unauthorized, "unknown signing key " + kid);
    for (const auto& key : rsa_keys_) {
      if (!kid.empty() && !key.kid.empty() && key.kid != kid) continue;
      last = check(*token.jwt, key.algorithm, now, leeway);
      // A good signature settles it, expired or not
      if (last.ok() || last.code == ErrorCode::Expired) return last;
    }
    return last;
  }

  return Status::failure(ErrorCode::Unauthorized, "unsupported algorithm '" + alg + "'");
}

}  // namespace kuberde::auth
