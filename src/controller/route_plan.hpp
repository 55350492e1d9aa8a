#pragma once

#include <cstdint>
#include <vector>

#include "controller/workload.hpp"
#include "core/route.hpp"

namespace kuberde::controller {

// One RouteEntry per service: TCP on externalPort (or a port hashed from identity/service
// into [port_min, port_max]), HTTP on "{service}.{identity}"
std::vector<RouteSpec> desired_routes(const AgentWorkload& workload, uint16_t port_min, uint16_t port_max);

struct RouteDiff {
  std::vector<RouteSpec> to_register;  // missing or bound differently
  std::vector<RouteKey> to_remove;     // observed keys no longer desired

  bool empty() const {
    return to_register.empty() && to_remove.empty();
  }
};

RouteDiff diff_routes(const std::vector<RouteSpec>& desired, const std::vector<RouteSpec>& observed);

}  // namespace kuberde::controller
