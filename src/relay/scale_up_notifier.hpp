#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "core/types.hpp"

namespace kuberde::net {
class HttpClient;
}

namespace kuberde::relay {

/**
 * Tells the controller that a lookup hit an idle workload.
 *
 * POST {controller_url}/scale-up {"agentID","key","idempotencyKey"}, fire-and-forget.
 * Signals for one identity are debounced by the cooldown; the client is expected
 * to retry its connection, which re-signals once the cooldown has passed.
 */
class ScaleUpNotifier {
 public:
  using TokenProvider = std::function<std::string()>;

  ScaleUpNotifier(std::shared_ptr<net::HttpClient> http, std::string controller_url, std::chrono::milliseconds cooldown,
                  TokenProvider token_provider = nullptr, Clock clock = nullptr);

  bool enabled() const {
    return http_ && !controller_url_.empty();
  }

  // False when disabled or debounced
  bool notify(const std::string& agent_id, const std::string& key);

  // Request body for one signal
  static json payload(const std::string& agent_id, const std::string& key);

 private:
  std::shared_ptr<net::HttpClient> http_;
  std::string controller_url_;
  std::chrono::milliseconds cooldown_;
  TokenProvider token_provider_;
  Clock clock_;
  std::mutex mutex_;
  std::map<std::string, Timestamp> last_sent_;
};

}  // namespace kuberde::relay
