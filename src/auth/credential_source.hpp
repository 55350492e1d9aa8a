#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "core/types.hpp"

namespace kuberde::net {
class HttpClient;
}

namespace kuberde::auth {

// A bearer credential and its validity window
struct Credential {
  std::string token;
  Timestamp issued_at;
  Timestamp expiry;
};

// Where a machine actor gets its bearer credential from. fetch() blocks, bounded by a timeout.
class CredentialSource {
 public:
  virtual ~CredentialSource() = default;

  virtual Result<Credential> fetch() = 0;
};

// OAuth2 client-credentials grant against a token endpoint
class ClientCredentialsSource : public CredentialSource {
 public:
  ClientCredentialsSource(std::shared_ptr<net::HttpClient> http, std::string token_url, std::string client_id, std::string client_secret,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(10000), Clock clock = nullptr);

  Result<Credential> fetch() override;

 private:
  std::shared_ptr<net::HttpClient> http_;
  std::string token_url_;
  std::string client_id_;
  std::string client_secret_;
  std::chrono::milliseconds timeout_;
  Clock clock_;
};

// Fixed token, e.g. AUTH_TOKEN. Expiry is read from the token's "exp" claim when present.
class StaticTokenSource : public CredentialSource {
 public:
  explicit StaticTokenSource(std::string token, Clock clock = nullptr);

  Result<Credential> fetch() override;

 private:
  std::string token_;
  Clock clock_;
};

// Client credentials when token_url and client_id are set, else the static token.
// InvalidArgument when neither is configured.
Result<std::shared_ptr<CredentialSource>> make_credential_source(std::shared_ptr<net::HttpClient> http, const std::string& token_url,
                                                                 const std::string& client_id, const std::string& client_secret,
                                                                 const std::string& static_token);

// Unverified read of the "exp" claim
std::optional<Timestamp> peek_expiry(const std::string& token);

}  // namespace kuberde::auth
