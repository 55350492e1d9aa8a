#include "agent/service_table.hpp"

#include <stdexcept>

namespace kuberde::agent {

namespace {

constexpr const char* kDefaultLocalTarget = "127.0.0.1:22";

}  // namespace

ServiceTable::ServiceTable(std::vector<ServiceSpec> services, std::optional<LocalTarget> fallback)
    : services_(std::move(services)), fallback_(std::move(fallback)) {}

Result<ServiceTable> ServiceTable::parse(const std::string& services_json) {
  json j;
  try {
    j = json::parse(services_json);
  } catch (const json::exception& e) {
    return Result<ServiceTable>::failure(ErrorCode::InvalidArgument, std::string("KUBERDE_SERVICES is not valid JSON: ") + e.what());
  }

  const json* list = &j;
  if (j.is_object()) {
    if (!j.contains("services")) {
      return Result<ServiceTable>::failure(ErrorCode::InvalidArgument, "KUBERDE_SERVICES has no \"services\" list");
    }
    list = &j["services"];
  }
  if (!list->is_array()) {
    return Result<ServiceTable>::failure(ErrorCode::InvalidArgument, "\"services\" must be an array");
  }

  std::vector<ServiceSpec> services;
  for (const auto& entry : *list) {
    auto spec = ServiceSpec::from_json(entry);
    if (!spec.ok()) return Result<ServiceTable>::failure(spec.status);
    services.push_back(*spec.value);
  }

  auto valid = validate_services(services);
  if (!valid.ok()) return Result<ServiceTable>::failure(valid);
  return Result<ServiceTable>::success(ServiceTable(std::move(services)));
}

Result<ServiceTable> ServiceTable::from_config(const AgentConfig& config) {
  if (!config.services_json.empty()) {
    return parse(config.services_json);
  }

  auto target = parse_local_target(config.local_target.empty() ? kDefaultLocalTarget : config.local_target);
  if (!target.ok()) return Result<ServiceTable>::failure(target.status);
  return Result<ServiceTable>::success(ServiceTable({}, *target.value));
}

Result<LocalTarget> ServiceTable::resolve(const std::string& selector) const {
  for (const auto& service : services_) {
    if (service.name == selector) {
      return Result<LocalTarget>::success(LocalTarget{"127.0.0.1", service.port});
    }
  }
  if (fallback_ && services_.empty()) {
    return Result<LocalTarget>::success(*fallback_);
  }
  return Result<LocalTarget>::failure(ErrorCode::NotFound, "unknown service '" + selector + "'");
}

std::string ServiceTable::describe() const {
  if (services_.empty()) {
    return fallback_ ? "* -> " + fallback_->to_string() : "(none)";
  }
  std::string out;
  for (const auto& service : services_) {
    if (!out.empty()) out += ", ";
    out += service.name + ":" + std::to_string(service.port);
  }
  return out;
}

Result<LocalTarget> parse_local_target(const std::string& target) {
  auto colon = target.rfind(':');
  if (colon == std::string::npos) {
    return Result<LocalTarget>::failure(ErrorCode::InvalidArgument, "local target '" + target + "' must be host:port");
  }

  LocalTarget out;
  if (colon > 0) out.host = target.substr(0, colon);
  try {
    int port = std::stoi(target.substr(colon + 1));
    if (port <= 0 || port > 65535) throw std::out_of_range("port");
    out.port = static_cast<uint16_t>(port);
  } catch (const std::exception&) {
    return Result<LocalTarget>::failure(ErrorCode::InvalidArgument, "local target '" + target + "' has an invalid port");
  }
  return Result<LocalTarget>::success(out);
}

}  // namespace kuberde::agent
