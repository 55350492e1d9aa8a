#include "auth/token_refresher.hpp"

#include <spdlog/spdlog.h>

#include "core/time_util.hpp"

namespace kuberde::auth {

TokenRefresher::TokenRefresher(std::shared_ptr<CredentialSource> source, double fraction, BackoffConfig retry, Clock clock)
    : source_(std::move(source)),
      fraction_(fraction > 0.0 && fraction < 1.0 ? fraction : 0.8),
      retry_(retry),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

TokenRefresher::~TokenRefresher() {
  stop();
}

std::chrono::milliseconds TokenRefresher::refresh_delay(const Credential& credential, double fraction, Timestamp now) {
  auto validity = std::chrono::duration_cast<std::chrono::milliseconds>(credential.expiry - credential.issued_at);
  auto refresh_at = credential.issued_at + std::chrono::milliseconds(static_cast<int64_t>(validity.count() * fraction));
  auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(refresh_at - now);
  return delay.count() > 0 ? delay : std::chrono::milliseconds(0);
}

Status TokenRefresher::fetch_initial() {
  Backoff backoff(retry_);
  while (true) {
    auto result = source_->fetch();
    if (result.ok()) {
      std::lock_guard<std::mutex> lock(mutex_);
      current_ = *result.value;
      spdlog::info("credential obtained, valid until {}", format_rfc3339(current_.expiry));
      return Status::success();
    }
    if (result.code() == ErrorCode::Unauthorized || backoff.exhausted()) {
      return result.status;
    }
    auto delay = backoff.next();
    spdlog::warn("credential fetch failed ({}), retry in {}ms", result.status.to_string(), delay.count());
    if (!wait_for(delay)) {
      return Status::failure(ErrorCode::Unavailable, "stopped");
    }
  }
}

void TokenRefresher::start(RefreshHandler on_refresh, FatalHandler on_fatal) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable()) return;
  stopping_ = false;
  on_refresh_ = std::move(on_refresh);
  on_fatal_ = std::move(on_fatal);
  thread_ = std::thread([this] { run(); });
}

void TokenRefresher::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (!thread_.joinable()) return;
  if (thread_.get_id() == std::this_thread::get_id()) {
    thread_.detach();
  } else {
    thread_.join();
  }
}

std::string TokenRefresher::token() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_.token;
}

Credential TokenRefresher::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

bool TokenRefresher::wait_for(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, d, [this] { return stopping_; });
  return !stopping_;
}

void TokenRefresher::run() {
  Backoff backoff(retry_);
  bool retrying = false;

  while (true) {
    if (!retrying) {
      auto delay = refresh_delay(current(), fraction_, clock_());
      if (!wait_for(delay)) return;
    }

    auto result = source_->fetch();
    if (result.ok()) {
      retrying = false;
      backoff.reset();
      {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = *result.value;
      }
      spdlog::info("credential refreshed, valid until {}", format_rfc3339(result.value->expiry));
      if (on_refresh_) on_refresh_(*result.value);
      continue;
    }

    if (backoff.exhausted()) {
      spdlog::critical("credential refresh failed after {} retries: {}", backoff.attempts(), result.status.to_string());
      if (on_fatal_) on_fatal_(result.status);
      return;
    }
    auto retry_in = backoff.next();
    spdlog::warn("credential refresh failed ({}), retry {} in {}ms", result.status.to_string(), backoff.attempts(), retry_in.count());
    if (!wait_for(retry_in)) return;
    retrying = true;
  }
}

}  // namespace kuberde::auth
