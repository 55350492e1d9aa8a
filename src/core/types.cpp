#include "core/types.hpp"

#include <set>

namespace kuberde {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "ok";
    case ErrorCode::NoRoute:
      return "no_route";
    case ErrorCode::AgentUnavailable:
      return "agent_unavailable";
    case ErrorCode::Unauthorized:
      return "unauthorized";
    case ErrorCode::Expired:
      return "expired";
    case ErrorCode::Forbidden:
      return "forbidden";
    case ErrorCode::IdentityConflict:
      return "identity_conflict";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::InvalidKey:
      return "invalid_key";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::ReconcileConflict:
      return "reconcile_conflict";
    case ErrorCode::Timeout:
      return "timeout";
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::Internal:
      return "internal";
  }
  return "unknown";
}

int http_status_for(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return 200;
    case ErrorCode::NoRoute:
    case ErrorCode::NotFound:
      return 404;
    case ErrorCode::AgentUnavailable:
      return 502;
    case ErrorCode::Unauthorized:
    case ErrorCode::Expired:
      return 401;
    case ErrorCode::Forbidden:
      return 403;
    case ErrorCode::IdentityConflict:
    case ErrorCode::Conflict:
    case ErrorCode::ReconcileConflict:
      return 409;
    case ErrorCode::InvalidKey:
    case ErrorCode::InvalidArgument:
      return 400;
    case ErrorCode::Timeout:
      return 504;
    case ErrorCode::Unavailable:
      return 503;
    case ErrorCode::Internal:
      return 500;
  }
  return 500;
}

ErrorCode error_code_from_http_status(int status) {
  if (status >= 200 && status < 300) return ErrorCode::Ok;
  switch (status) {
    case 0:
      return ErrorCode::Unavailable;
    case 400:
      return ErrorCode::InvalidKey;
    case 401:
      return ErrorCode::Unauthorized;
    case 403:
      return ErrorCode::Forbidden;
    case 404:
      return ErrorCode::NotFound;
    case 409:
      return ErrorCode::Conflict;
    case 502:
      return ErrorCode::AgentUnavailable;
    case 503:
      return ErrorCode::Unavailable;
    case 504:
      return ErrorCode::Timeout;
    default:
      return ErrorCode::Internal;
  }
}

std::string Status::to_string() const {
  if (message.empty()) return kuberde::to_string(code);
  return kuberde::to_string(code) + ": " + message;
}

std::string to_string(Protocol protocol) {
  switch (protocol) {
    case Protocol::Tcp:
      return "TCP";
    case Protocol::Http:
      return "HTTP";
  }
  return "TCP";
}

std::optional<Protocol> protocol_from_string(const std::string& str) {
  if (str == "TCP" || str == "tcp") return Protocol::Tcp;
  if (str == "HTTP" || str == "http") return Protocol::Http;
  return std::nullopt;
}

json ServiceSpec::to_json() const {
  json j{{"name", name}, {"port", port}, {"protocol", kuberde::to_string(protocol)}};
  if (external_port) {
    j["externalPort"] = *external_port;
  }
  return j;
}

Result<ServiceSpec> ServiceSpec::from_json(const json& j) {
  if (!j.is_object()) {
    return Result<ServiceSpec>::failure(ErrorCode::InvalidArgument, "service entry must be an object");
  }

  ServiceSpec spec;
  try {
    spec.name = j.value("name", "");

    int64_t port = j.value("port", int64_t(0));
    if (port <= 0 || port > 65535) {
      return Result<ServiceSpec>::failure(ErrorCode::InvalidArgument, "service '" + spec.name + "': port out of range");
    }
    spec.port = static_cast<uint16_t>(port);

    auto protocol = protocol_from_string(j.value("protocol", "TCP"));
    if (!protocol) {
      return Result<ServiceSpec>::failure(ErrorCode::InvalidArgument, "service '" + spec.name + "': protocol must be TCP or HTTP");
    }
    spec.protocol = *protocol;

    if (j.contains("externalPort") && !j["externalPort"].is_null()) {
      int64_t external = j["externalPort"].get<int64_t>();
      if (external <= 0 || external > 65535) {
        return Result<ServiceSpec>::failure(ErrorCode::InvalidArgument, "service '" + spec.name + "': externalPort out of range");
      }
      spec.external_port = static_cast<uint16_t>(external);
    }
  } catch (const json::exception& e) {
    return Result<ServiceSpec>::failure(ErrorCode::InvalidArgument, std::string("malformed service entry: ") + e.what());
  }

  return Result<ServiceSpec>::success(std::move(spec));
}

Status validate_services(const std::vector<ServiceSpec>& services) {
  std::set<std::string> seen;
  for (const auto& svc : services) {
    if (!is_dns_label(svc.name)) {
      return Status::failure(ErrorCode::InvalidArgument, "invalid service name '" + svc.name + "'");
    }
    if (!seen.insert(svc.name).second) {
      return Status::failure(ErrorCode::InvalidArgument, "duplicate service name '" + svc.name + "'");
    }
    if (svc.port == 0) {
      return Status::failure(ErrorCode::InvalidArgument, "service '" + svc.name + "' has no port");
    }
    if (svc.external_port && svc.protocol != Protocol::Tcp) {
      return Status::failure(ErrorCode::InvalidArgument, "service '" + svc.name + "': externalPort is only valid for TCP");
    }
  }
  return Status::success();
}

bool is_dns_label(const std::string& s) {
  if (s.empty() || s.size() > 63) return false;
  for (char c : s) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    if (!ok) return false;
  }
  return s.front() != '-' && s.back() != '-';
}

}  // namespace kuberde
