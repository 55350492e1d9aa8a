#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "auth/credential_source.hpp"
#include "core/backoff.hpp"
#include "core/types.hpp"

namespace kuberde::auth {

/**
 * Keeps a machine credential fresh on its own thread.
 *
 * Renews at `fraction` of the validity window. Failures are retried with backoff;
 * once the retry budget is exhausted on_fatal runs and the refresher stops.
 */
class TokenRefresher {
 public:
  using RefreshHandler = std::function<void(const Credential&)>;
  using FatalHandler = std::function<void(const Status&)>;

  TokenRefresher(std::shared_ptr<CredentialSource> source, double fraction, BackoffConfig retry, Clock clock = nullptr);

  ~TokenRefresher();

  TokenRefresher(const TokenRefresher&) = delete;
  TokenRefresher& operator=(const TokenRefresher&) = delete;

  // First fetch on the caller's thread, retried within the same budget
  Status fetch_initial();

  void start(RefreshHandler on_refresh, FatalHandler on_fatal);

  void stop();

  std::string token() const;

  Credential current() const;

  // Delay from now until the refresh point of a credential, never negative
  static std::chrono::milliseconds refresh_delay(const Credential& credential, double fraction, Timestamp now);

 private:
  void run();

  // Sleeps up to d; false when stopped
  bool wait_for(std::chrono::milliseconds d);

  std::shared_ptr<CredentialSource> source_;
  double fraction_;
  BackoffConfig retry_;
  Clock clock_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  Credential current_;
  bool stopping_ = false;
  RefreshHandler on_refresh_;
  FatalHandler on_fatal_;
  std::thread thread_;
};

}  // namespace kuberde::auth
