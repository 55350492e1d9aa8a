#include "relay/scale_up_notifier.hpp"

#include <spdlog/spdlog.h>

#include "net/http_client.hpp"

namespace kuberde::relay {

ScaleUpNotifier::ScaleUpNotifier(std::shared_ptr<net::HttpClient> http, std::string controller_url, std::chrono::milliseconds cooldown,
                                 TokenProvider token_provider, Clock clock)
    : http_(std::move(http)),
      controller_url_(std::move(controller_url)),
      cooldown_(cooldown),
      token_provider_(std::move(token_provider)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {
  while (!controller_url_.empty() && controller_url_.back() == '/') controller_url_.pop_back();
}

json ScaleUpNotifier::payload(const std::string& agent_id, const std::string& key) {
  // One scale-up per identity is in flight at a time, so the identity is the idempotency key
  return json{{"agentID", agent_id}, {"key", key}, {"idempotencyKey", agent_id}};
}

bool ScaleUpNotifier::notify(const std::string& agent_id, const std::string& key) {
  if (!enabled()) return false;

  auto now = clock_();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_sent_.find(agent_id);
    if (it != last_sent_.end() && now - it->second < cooldown_) {
      spdlog::debug("[{}] scale-up already signalled", agent_id);
      return false;
    }
    last_sent_[agent_id] = now;
  }

  net::HttpOptions opts;
  opts.method = "POST";
  opts.timeout = std::chrono::milliseconds(5000);
  opts.headers["Content-Type"] = "application/json";
  std::string token = token_provider_ ? token_provider_() : std::string();
  if (!token.empty()) {
    opts.headers["Authorization"] = "Bearer " + token;
  }
  opts.body = payload(agent_id, key).dump();

  spdlog::info("[{}] idle workload hit on {}, requesting scale-up", agent_id, key);
  http_->request(controller_url_ + "/scale-up", opts, [agent_id](net::HttpResponse response) {
    if (response.status_code == 0) {
      spdlog::warn("[{}] scale-up signal failed: {}", agent_id, response.error);
    } else if (!response.ok()) {
      spdlog::warn("[{}] controller rejected scale-up: {} {}", agent_id, response.status_code, response.body);
    } else {
      spdlog::debug("[{}] scale-up accepted ({})", agent_id, response.status_code);
    }
  });
  return true;
}

}  // namespace kuberde::relay
