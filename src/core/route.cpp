#include "core/route.hpp"

namespace kuberde {

std::string to_string(RouteKind kind) {
  return kind == RouteKind::Tcp ? "TCP" : "HTTP";
}

std::string RouteKey::to_string() const {
  if (kind == RouteKind::Tcp) return "tcp:" + std::to_string(port);
  return "http:" + hostname_prefix;
}

json RouteSpec::to_json() const {
  json j{{"kind", kuberde::to_string(key.kind)}, {"agentID", agent_id}, {"service", service}, {"workloadID", owner_workload()}};
  if (key.kind == RouteKind::Tcp) {
    j["port"] = key.port;
  } else {
    j["hostnamePrefix"] = key.hostname_prefix;
  }
  return j;
}

Result<RouteSpec> RouteSpec::from_json(RouteKind kind, const json& j) {
  if (!j.is_object()) {
    return Result<RouteSpec>::failure(ErrorCode::InvalidArgument, "route body must be a JSON object");
  }

  RouteSpec spec;
  try {
    spec.agent_id = j.value("agentID", "");
    spec.service = j.value("service", "");
    spec.workload = j.value("workloadID", "");

    if (kind == RouteKind::Tcp) {
      if (!j.contains("port") || !j["port"].is_number_integer()) {
        return Result<RouteSpec>::failure(ErrorCode::InvalidKey, "port is required");
      }
      int64_t port = j["port"].get<int64_t>();
      if (port <= 0 || port > 65535) {
        return Result<RouteSpec>::failure(ErrorCode::InvalidKey, "port out of range: " + std::to_string(port));
      }
      spec.key = RouteKey::tcp(static_cast<uint16_t>(port));
    } else {
      spec.key = RouteKey::http(j.value("hostnamePrefix", ""));
      if (spec.key.hostname_prefix.empty()) {
        return Result<RouteSpec>::failure(ErrorCode::InvalidKey, "hostnamePrefix is required");
      }
    }
  } catch (const json::exception& e) {
    return Result<RouteSpec>::failure(ErrorCode::InvalidArgument, std::string("malformed route body: ") + e.what());
  }

  if (spec.agent_id.empty() || spec.service.empty()) {
    return Result<RouteSpec>::failure(ErrorCode::InvalidArgument, "agentID and service are required");
  }
  return Result<RouteSpec>::success(std::move(spec));
}

}  // namespace kuberde
