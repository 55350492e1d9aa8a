#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"

namespace kuberde::agent {

// Where a selected stream is dialed
struct LocalTarget {
  std::string host = "127.0.0.1";
  uint16_t port = 0;

  std::string to_string() const {
    return host + ":" + std::to_string(port);
  }
};

/**
 * Immutable serviceName -> local port table, built once at startup.
 *
 * With a service list every selector must name a listed service. Without one the
 * legacy single target receives every stream regardless of the selector.
 */
class ServiceTable {
 public:
  ServiceTable() = default;

  explicit ServiceTable(std::vector<ServiceSpec> services, std::optional<LocalTarget> fallback = std::nullopt);

  // {"services":[{"name","port","protocol"}]}
  static Result<ServiceTable> parse(const std::string& services_json);

  // KUBERDE_SERVICES when set, otherwise LOCAL_TARGET (default 127.0.0.1:22)
  static Result<ServiceTable> from_config(const AgentConfig& config);

  // NotFound for an unknown selector
  Result<LocalTarget> resolve(const std::string& selector) const;

  const std::vector<ServiceSpec>& services() const {
    return services_;
  }

  bool has_fallback() const {
    return fallback_.has_value();
  }

  // "ssh:22, web:8080" for the startup log
  std::string describe() const;

 private:
  std::vector<ServiceSpec> services_;
  std::optional<LocalTarget> fallback_;
};

// "host:port" or ":port"
Result<LocalTarget> parse_local_target(const std::string& target);

}  // namespace kuberde::agent
