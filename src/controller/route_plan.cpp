#include "controller/route_plan.hpp"

#include <algorithm>

#include "core/identity.hpp"

namespace kuberde::controller {

std::vector<RouteSpec> desired_routes(const AgentWorkload& workload, uint16_t port_min, uint16_t port_max) {
  std::vector<RouteSpec> out;
  std::string identity = workload.identity();
  for (const auto& service : workload.services) {
    RouteSpec route;
    route.agent_id = make_service_identity(identity, service.name);
    route.service = service.name;
    route.workload = identity;
    if (service.protocol == Protocol::Http) {
      route.key = RouteKey::http(service.name + "." + identity);
    } else {
      uint16_t port = service.external_port ? *service.external_port : hash_to_port(identity + "/" + service.name, port_min, port_max);
      route.key = RouteKey::tcp(port);
    }
    out.push_back(std::move(route));
  }
  return out;
}

RouteDiff diff_routes(const std::vector<RouteSpec>& desired, const std::vector<RouteSpec>& observed) {
  RouteDiff diff;
  for (const auto& route : desired) {
    if (std::find(observed.begin(), observed.end(), route) == observed.end()) diff.to_register.push_back(route);
  }
  for (const auto& route : observed) {
    auto wanted = std::find_if(desired.begin(), desired.end(), [&route](const RouteSpec& d) { return d.key == route.key; });
    if (wanted == desired.end()) diff.to_remove.push_back(route.key);
  }
  return diff;
}

}  // namespace kuberde::controller
