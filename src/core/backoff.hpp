#pragma once

#include <chrono>

namespace kuberde {

// Exponential backoff parameters: delay(n) = min(initial * multiplier^n, max)
struct BackoffConfig {
  std::chrono::milliseconds initial{1000};
  std::chrono::milliseconds max{30000};
  double multiplier = 2.0;
  int max_attempts = 0;  // 0 = unbounded
};

std::chrono::milliseconds compute_backoff(int attempt, const BackoffConfig& config);

// Stateful backoff sequence for reconnect / retry loops
class Backoff {
 public:
  explicit Backoff(BackoffConfig config) : config_(config) {}

  // Delay before the next attempt; advances the attempt counter
  std::chrono::milliseconds next();

  void reset() {
    attempt_ = 0;
  }

  int attempts() const {
    return attempt_;
  }

  bool exhausted() const {
    return config_.max_attempts > 0 && attempt_ >= config_.max_attempts;
  }

  const BackoffConfig& config() const {
    return config_;
  }

 private:
  BackoffConfig config_;
  int attempt_ = 0;
};

}  // namespace kuberde
