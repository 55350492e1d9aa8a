#include "core/backoff.hpp"

#include <cmath>
#include <cstdint>

namespace kuberde {

std::chrono::milliseconds compute_backoff(int attempt, const BackoffConfig& config) {
  if (attempt < 0) attempt = 0;
  double factor = std::pow(config.multiplier < 1.0 ? 1.0 : config.multiplier, attempt);
  double delay = static_cast<double>(config.initial.count()) * factor;
  if (delay > static_cast<double>(config.max.count()) || std::isinf(delay)) {
    return config.max;
  }
  return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

std::chrono::milliseconds Backoff::next() {
  auto delay = compute_backoff(attempt_, config_);
  ++attempt_;
  return delay;
}

}  // namespace kuberde
