#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "core/route.hpp"
#include "core/types.hpp"

namespace kuberde::relay {

enum class RegisterOutcome { Created, Updated, Unchanged };

std::string to_string(RegisterOutcome outcome);

struct RouteTableOptions {
  uint16_t tcp_port_min = 30000;
  uint16_t tcp_port_max = 32767;
  std::set<uint16_t> reserved_ports;  // ports the relay itself listens on
  std::string agent_domain;           // HTTP routes are {prefix}.{agent_domain}
  bool derive_default_routes = true;  // {service}.{workload identity} without an explicit entry
};

struct RouteLookup {
  RouteSpec route;
  bool idle = false;     // deregistered for idle scaling; route is the last binding
  bool derived = false;  // HTTP default derived from the hostname
};

/**
 * The relay's routing table: RouteKey -> (agent identity, service).
 *
 * Every access goes through the table's lock, so mutations of one key are
 * serialized. Idle markers remember routes removed by idle scaling so that a
 * later hit can ask the controller to scale the workload back up.
 */
class RouteTable {
 public:
  explicit RouteTable(RouteTableOptions options = {});

  // Conflict when the key is bound to another identity, InvalidKey for bad ports/prefixes
  Result<RegisterOutcome> register_route(const RouteSpec& route);

  // idle = true keeps an idle marker for the key. NotFound when neither route nor marker existed.
  Status deregister_route(const RouteKey& key, bool idle = false);

  // Explicit routes, then idle markers. NoRoute otherwise.
  Result<RouteLookup> lookup(const RouteKey& key) const;

  // Host header -> explicit route for its prefix, or the derived default
  Result<RouteLookup> resolve_host(const std::string& host) const;

  // Active routes, optionally filtered by owning workload identity
  std::vector<RouteSpec> list(const std::string& workload = {}) const;

  // Idle markers, optionally filtered by owning workload identity
  std::vector<RouteSpec> list_idle(const std::string& workload = {}) const;

  // TCP ports that need a listener: active routes plus idle markers
  std::set<uint16_t> tcp_ports() const;

  bool has_tcp_port(uint16_t port) const;

  size_t size() const;

  Status validate_key(const RouteKey& key) const;

  // "files.user-alice-ws.example.com" -> "files.user-alice-ws"; empty when outside the agent domain
  std::string host_prefix(const std::string& host) const;

  const RouteTableOptions& options() const {
    return options_;
  }

 private:
  RouteTableOptions options_;
  mutable std::mutex mutex_;
  std::map<RouteKey, RouteSpec> routes_;
  std::map<RouteKey, RouteSpec> idle_;
};

// Derived default for a hostname prefix: first label = service, remaining labels = workload identity
std::optional<RouteSpec> derive_http_route(const std::string& prefix);

// Session keys to try for a route: its workload, the agent id, and the agent id without the service suffix
std::vector<std::string> session_candidates(const RouteSpec& route);

}  // namespace kuberde::relay
