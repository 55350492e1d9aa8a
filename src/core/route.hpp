#pragma once

#include <cstdint>
#include <string>

#include "core/types.hpp"

namespace kuberde {

enum class RouteKind { Tcp, Http };

std::string to_string(RouteKind kind);

// Externally reachable key: a TCP port or an HTTP hostname prefix
struct RouteKey {
  RouteKind kind = RouteKind::Tcp;
  uint16_t port = 0;
  std::string hostname_prefix;

  static RouteKey tcp(uint16_t port) {
    return RouteKey{RouteKind::Tcp, port, ""};
  }

  static RouteKey http(std::string prefix) {
    return RouteKey{RouteKind::Http, 0, std::move(prefix)};
  }

  std::string to_string() const;

  bool operator==(const RouteKey& other) const {
    return kind == other.kind && port == other.port && hostname_prefix == other.hostname_prefix;
  }

  bool operator!=(const RouteKey& other) const {
    return !(*this == other);
  }

  bool operator<(const RouteKey& other) const {
    if (kind != other.kind) return kind < other.kind;
    if (port != other.port) return port < other.port;
    return hostname_prefix < other.hostname_prefix;
  }
};

// RouteEntry: key -> (agent identity, service name), owned by the workload identity
struct RouteSpec {
  RouteKey key;
  std::string agent_id;
  std::string service;
  std::string workload;  // defaults to agent_id when empty

  const std::string& owner_workload() const {
    return workload.empty() ? agent_id : workload;
  }

  // Management API body: {agentID, service, port | hostnamePrefix, workloadID}
  json to_json() const;

  static Result<RouteSpec> from_json(RouteKind kind, const json& j);

  bool operator==(const RouteSpec& other) const {
    return key == other.key && agent_id == other.agent_id && service == other.service && owner_workload() == other.owner_workload();
  }

  bool operator!=(const RouteSpec& other) const {
    return !(*this == other);
  }
};

}  // namespace kuberde
