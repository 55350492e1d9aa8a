#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/route.hpp"
#include "core/types.hpp"

namespace kuberde::net {
class HttpClient;
}

namespace kuberde::controller {

// Relay-side activity of one workload identity (GET /mgmt/agents/{id})
struct AgentActivity {
  bool online = false;
  std::optional<Timestamp> last_activity;
  size_t active_connections = 0;

  static AgentActivity from_json(const json& j);
};

// Routes owned by one workload, active and idle-marked
struct RouteListing {
  std::vector<RouteSpec> routes;
  std::vector<RouteSpec> idle;
};

// The relay's management API as seen by the controller
class RelayClient {
 public:
  virtual ~RelayClient() = default;

  // Conflict when the key is bound to another identity
  virtual Status register_route(const RouteSpec& route) = 0;

  // NotFound when nothing was bound
  virtual Status deregister_route(const RouteKey& key, bool idle) = 0;

  virtual Result<RouteListing> list_routes(const std::string& workload) = 0;

  virtual Result<AgentActivity> agent_activity(const std::string& identity) = 0;
};

// RelayClient over HTTP with the controller's system credential
class HttpRelayClient : public RelayClient {
 public:
  using TokenProvider = std::function<std::string()>;

  HttpRelayClient(std::shared_ptr<net::HttpClient> http, std::string base_url, TokenProvider token_provider, std::chrono::milliseconds timeout);

  Status register_route(const RouteSpec& route) override;

  Status deregister_route(const RouteKey& key, bool idle) override;

  Result<RouteListing> list_routes(const std::string& workload) override;

  Result<AgentActivity> agent_activity(const std::string& identity) override;

 private:
  struct Reply {
    int status_code = 0;
    std::string body;
    Status status;
  };

  Reply call(const std::string& method, const std::string& path, const std::string& body = {});

  std::shared_ptr<net::HttpClient> http_;
  std::string base_url_;
  TokenProvider token_provider_;
  std::chrono::milliseconds timeout_;
};

}  // namespace kuberde::controller
