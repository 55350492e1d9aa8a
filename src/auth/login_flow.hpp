#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "core/types.hpp"

namespace kuberde::auth {

// PKCE (RFC 7636) verifier / S256 challenge pair
struct PkceChallenge {
  std::string code_verifier;
  std::string code_challenge;

  static PkceChallenge generate();
};

/**
 * Authorization-code + PKCE login against the configured identity provider.
 *
 * begin() records a one-shot state entry and returns the provider URL to redirect to;
 * complete() consumes the state on callback and yields the form for the code exchange.
 */
class LoginFlow {
 public:
  struct Pending {
    std::string code_verifier;
    std::string return_to;
    Timestamp created;
  };

  explicit LoginFlow(OidcConfig config, std::chrono::seconds state_ttl = std::chrono::seconds(600), Clock clock = nullptr);

  bool enabled() const {
    return config_.enabled();
  }

  // Provider authorize URL with response_type=code, state and code_challenge
  std::string begin(const std::string& return_to);

  // One-shot: a state can be completed once, and only before it expires
  std::optional<Pending> take(const std::string& state);

  // Form fields for POST {token_url}
  std::map<std::string, std::string> exchange_form(const std::string& code, const std::string& code_verifier) const;

  const OidcConfig& config() const {
    return config_;
  }

  size_t pending_count() const;

 private:
  void purge_locked(Timestamp now);

  OidcConfig config_;
  std::chrono::seconds state_ttl_;
  Clock clock_;
  mutable std::mutex mutex_;
  std::map<std::string, Pending> pending_;
};

}  // namespace kuberde::auth
