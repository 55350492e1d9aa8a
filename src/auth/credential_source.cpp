#include "auth/credential_source.hpp"

#include <spdlog/spdlog.h>

#include "auth/jwt.hpp"
#include "net/http_client.hpp"
#include "net/http_message.hpp"

namespace kuberde::auth {

namespace {

Clock or_system_clock(Clock clock) {
  if (clock) return clock;
  return [] { return std::chrono::system_clock::now(); };
}

}  // namespace

std::optional<Timestamp> peek_expiry(const std::string& token) {
  auto decoded = decode_token(token);
  if (!decoded.ok()) return std::nullopt;
  const auto& payload = decoded.value->payload;
  if (!payload.contains("exp") || !payload["exp"].is_number()) return std::nullopt;
  return Claims::from_json(payload).expiry;
}

// ============================================================
// ClientCredentialsSource
// ============================================================

ClientCredentialsSource::ClientCredentialsSource(std::shared_ptr<net::HttpClient> http, std::string token_url, std::string client_id,
                                                 std::string client_secret, std::chrono::milliseconds timeout, Clock clock)
    : http_(std::move(http)),
      token_url_(std::move(token_url)),
      client_id_(std::move(client_id)),
      client_secret_(std::move(client_secret)),
      timeout_(timeout),
      clock_(or_system_clock(std::move(clock))) {}

Result<Credential> ClientCredentialsSource::fetch() {
  net::HttpOptions opts;
  opts.method = "POST";
  opts.timeout = timeout_;
  opts.headers["Content-Type"] = "application/x-www-form-urlencoded";
  opts.headers["Accept"] = "application/json";
  opts.body = net::form_encode({
      {"grant_type", "client_credentials"},
      {"client_id", client_id_},
      {"client_secret", client_secret_},
  });

  auto issued_at = clock_();
  auto response = http_->request(token_url_, opts).get();
  if (response.status_code == 0) {
    return Result<Credential>::failure(ErrorCode::Unavailable, "token endpoint unreachable: " + response.error);
  }
  if (!response.ok()) {
    return Result<Credential>::failure(error_code_from_http_status(response.status_code),
                                       "token endpoint answered " + std::to_string(response.status_code));
  }

  try {
    auto body = json::parse(response.body);
    Credential credential;
    credential.token = body.value("access_token", "");
    if (credential.token.empty()) {
      return Result<Credential>::failure(ErrorCode::Unauthorized, "token response without access_token");
    }
    credential.issued_at = issued_at;
    if (body.contains("expires_in") && body["expires_in"].is_number()) {
      credential.expiry = issued_at + std::chrono::seconds(body["expires_in"].get<int64_t>());
    } else if (auto exp = peek_expiry(credential.token)) {
      credential.expiry = *exp;
    } else {
      credential.expiry = issued_at + std::chrono::minutes(5);
    }
    return Result<Credential>::success(std::move(credential));
  } catch (const json::exception& e) {
    return Result<Credential>::failure(ErrorCode::Internal, std::string("invalid token response: ") + e.what());
  }
}

// ============================================================
// StaticTokenSource
// ============================================================

StaticTokenSource::StaticTokenSource(std::string token, Clock clock) : token_(std::move(token)), clock_(or_system_clock(std::move(clock))) {}

Result<Credential> StaticTokenSource::fetch() {
  if (token_.empty()) {
    return Result<Credential>::failure(ErrorCode::Unauthorized, "no static token configured");
  }
  Credential credential;
  credential.token = token_;
  credential.issued_at = clock_();
  if (auto exp = peek_expiry(token_)) {
    credential.expiry = *exp;
    if (credential.expiry <= credential.issued_at) {
      return Result<Credential>::failure(ErrorCode::Expired, "static token has expired");
    }
  } else {
    // Opaque token: re-read once a day
    credential.expiry = credential.issued_at + std::chrono::hours(24);
  }
  return Result<Credential>::success(std::move(credential));
}

Result<std::shared_ptr<CredentialSource>> make_credential_source(std::shared_ptr<net::HttpClient> http, const std::string& token_url,
                                                                 const std::string& client_id, const std::string& client_secret,
                                                                 const std::string& static_token) {
  using SourceResult = Result<std::shared_ptr<CredentialSource>>;
  if (!token_url.empty() && !client_id.empty()) {
    return SourceResult::success(std::make_shared<ClientCredentialsSource>(std::move(http), token_url, client_id, client_secret));
  }
  if (!static_token.empty()) {
    return SourceResult::success(std::make_shared<StaticTokenSource>(static_token));
  }
  return SourceResult::failure(ErrorCode::InvalidArgument, "no credential configured: set AUTH_TOKEN_URL and AUTH_CLIENT_ID, or AUTH_TOKEN");
}

}  // namespace kuberde::auth
