#include "relay/route_table.hpp"

#include <algorithm>

#include "core/identity.hpp"
#include "net/http_message.hpp"

namespace kuberde::relay {

std::string to_string(RegisterOutcome outcome) {
  switch (outcome) {
    case RegisterOutcome::Created:
      return "created";
    case RegisterOutcome::Updated:
      return "updated";
    case RegisterOutcome::Unchanged:
      return "unchanged";
  }
  return "unknown";
}

RouteTable::RouteTable(RouteTableOptions options) : options_(std::move(options)) {}

Status RouteTable::validate_key(const RouteKey& key) const {
  if (key.kind == RouteKind::Tcp) {
    if (key.port < options_.tcp_port_min || key.port > options_.tcp_port_max) {
      return Status::failure(ErrorCode::InvalidKey, "port " + std::to_string(key.port) + " outside " + std::to_string(options_.tcp_port_min) + "-" +
                                                        std::to_string(options_.tcp_port_max));
    }
    if (options_.reserved_ports.count(key.port)) {
      return Status::failure(ErrorCode::InvalidKey, "port " + std::to_string(key.port) + " is reserved by the relay");
    }
    return Status::success();
  }

  const auto& prefix = key.hostname_prefix;
  if (prefix.empty() || prefix.size() > 253) {
    return Status::failure(ErrorCode::InvalidKey, "invalid hostname prefix '" + prefix + "'");
  }
  size_t start = 0;
  while (start <= prefix.size()) {
    auto dot = prefix.find('.', start);
    std::string label = prefix.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
    if (!is_dns_label(label)) {
      return Status::failure(ErrorCode::InvalidKey, "invalid hostname prefix '" + prefix + "'");
    }
    if (dot == std::string::npos) break;
    start = dot + 1;
  }
  return Status::success();
}

Result<RegisterOutcome> RouteTable::register_route(const RouteSpec& route) {
  auto valid = validate_key(route.key);
  if (!valid.ok()) {
    return Result<RegisterOutcome>::failure(valid);
  }
  if (route.agent_id.empty() || route.service.empty()) {
    return Result<RegisterOutcome>::failure(ErrorCode::InvalidArgument, "agentID and service are required");
  }

  RouteSpec stored = route;
  if (stored.workload.empty()) stored.workload = stored.agent_id;

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = routes_.find(route.key);
  if (it == routes_.end()) {
    auto idle = idle_.find(route.key);
    if (idle != idle_.end() && idle->second.owner_workload() != stored.owner_workload()) {
      return Result<RegisterOutcome>::failure(ErrorCode::Conflict, route.key.to_string() + " is held idle for " + idle->second.owner_workload());
    }
    if (idle != idle_.end()) idle_.erase(idle);
    routes_.emplace(route.key, std::move(stored));
    return Result<RegisterOutcome>::success(RegisterOutcome::Created);
  }
  if (it->second.agent_id != stored.agent_id) {
    return Result<RegisterOutcome>::failure(ErrorCode::Conflict, route.key.to_string() + " is bound to " + it->second.agent_id);
  }
  if (it->second == stored) {
    return Result<RegisterOutcome>::success(RegisterOutcome::Unchanged);
  }
  it->second = std::move(stored);
  return Result<RegisterOutcome>::success(RegisterOutcome::Updated);
}

Status RouteTable::deregister_route(const RouteKey& key, bool idle) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = routes_.find(key);
  if (it == routes_.end()) {
    if (!idle && idle_.erase(key) > 0) return Status::success();
    if (idle && idle_.count(key)) return Status::success();
    return Status::failure(ErrorCode::NotFound, "no route for " + key.to_string());
  }
  if (idle) {
    idle_[key] = it->second;
  }
  routes_.erase(it);
  return Status::success();
}

Result<RouteLookup> RouteTable::lookup(const RouteKey& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = routes_.find(key);
  if (it != routes_.end()) {
    return Result<RouteLookup>::success(RouteLookup{it->second, false, false});
  }
  auto idle = idle_.find(key);
  if (idle != idle_.end()) {
    return Result<RouteLookup>::success(RouteLookup{idle->second, true, false});
  }
  return Result<RouteLookup>::failure(ErrorCode::NoRoute, "no route for " + key.to_string());
}

std::string RouteTable::host_prefix(const std::string& host) const {
  if (options_.agent_domain.empty()) return {};
  std::string h = net::to_lower(host);
  while (!h.empty() && h.back() == '.') h.pop_back();
  std::string suffix = "." + net::to_lower(options_.agent_domain);
  if (h.size() <= suffix.size() || h.compare(h.size() - suffix.size(), suffix.size(), suffix) != 0) {
    return {};
  }
  return h.substr(0, h.size() - suffix.size());
}

Result<RouteLookup> RouteTable::resolve_host(const std::string& host) const {
  std::string prefix = host_prefix(host);
  if (prefix.empty()) {
    return Result<RouteLookup>::failure(ErrorCode::NoRoute, "host '" + host + "' is outside the agent domain");
  }

  auto explicit_route = lookup(RouteKey::http(prefix));
  if (explicit_route.ok()) return explicit_route;

  if (options_.derive_default_routes) {
    if (auto derived = derive_http_route(prefix)) {
      return Result<RouteLookup>::success(RouteLookup{*derived, false, true});
    }
  }
  return Result<RouteLookup>::failure(ErrorCode::NoRoute, "no route for host '" + host + "'");
}

std::vector<RouteSpec> RouteTable::list(const std::string& workload) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RouteSpec> out;
  for (const auto& entry : routes_) {
    if (workload.empty() || entry.second.owner_workload() == workload) {
      out.push_back(entry.second);
    }
  }
  return out;
}

std::vector<RouteSpec> RouteTable::list_idle(const std::string& workload) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RouteSpec> out;
  for (const auto& entry : idle_) {
    if (workload.empty() || entry.second.owner_workload() == workload) {
      out.push_back(entry.second);
    }
  }
  return out;
}

std::set<uint16_t> RouteTable::tcp_ports() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<uint16_t> ports;
  for (const auto* table : {&routes_, &idle_}) {
    for (const auto& entry : *table) {
      if (entry.first.kind == RouteKind::Tcp) ports.insert(entry.first.port);
    }
  }
  return ports;
}

bool RouteTable::has_tcp_port(uint16_t port) const {
  auto key = RouteKey::tcp(port);
  std::lock_guard<std::mutex> lock(mutex_);
  return routes_.count(key) > 0 || idle_.count(key) > 0;
}

size_t RouteTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return routes_.size();
}

std::optional<RouteSpec> derive_http_route(const std::string& prefix) {
  auto dot = prefix.find('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 >= prefix.size()) return std::nullopt;

  std::string service = prefix.substr(0, dot);
  std::string workload = prefix.substr(dot + 1);
  if (!is_dns_label(service) || !is_valid_identity(workload)) return std::nullopt;

  RouteSpec route;
  route.key = RouteKey::http(prefix);
  route.service = service;
  route.workload = workload;
  route.agent_id = make_service_identity(workload, service);
  return route;
}

std::vector<std::string> session_candidates(const RouteSpec& route) {
  std::vector<std::string> out;
  auto add = [&out](const std::string& id) {
    if (!id.empty() && std::find(out.begin(), out.end(), id) == out.end()) out.push_back(id);
  };
  add(route.workload);
  add(route.agent_id);
  add(strip_service_suffix(route.agent_id, route.service));
  return out;
}

}  // namespace kuberde::relay
