#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kuberde {

using json = nlohmann::json;

using Timestamp = std::chrono::system_clock::time_point;
using Clock = std::function<Timestamp()>;

// Error taxonomy shared by the relay, the agent and the controller
enum class ErrorCode {
  Ok,
  NoRoute,           // inbound key has no RouteEntry
  AgentUnavailable,  // route exists, session dead or absent
  Unauthorized,      // credential missing or invalid
  Expired,           // credential expired
  Forbidden,         // valid credential, not allowed to act on the identity
  IdentityConflict,  // a second session claimed a live identity
  Conflict,          // key already bound to a different identity
  InvalidKey,        // malformed or out-of-range route key
  NotFound,
  ReconcileConflict,  // concurrent mutation of the declarative resource
  Timeout,
  InvalidArgument,
  Unavailable,
  Internal
};

std::string to_string(ErrorCode code);

// HTTP status code used when an ErrorCode crosses an HTTP boundary
int http_status_for(ErrorCode code);

ErrorCode error_code_from_http_status(int status);

struct Status {
  ErrorCode code = ErrorCode::Ok;
  std::string message;

  bool ok() const {
    return code == ErrorCode::Ok;
  }

  static Status success() {
    return Status{};
  }

  static Status failure(ErrorCode code, std::string message) {
    return Status{code, std::move(message)};
  }

  std::string to_string() const;
};

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  Status status;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return !value.has_value();
  }

  ErrorCode code() const {
    return status.code;
  }

  static Result success(T val) {
    return Result{std::move(val), Status::success()};
  }

  static Result failure(ErrorCode code, std::string err) {
    return Result{std::nullopt, Status::failure(code, std::move(err))};
  }

  static Result failure(Status status) {
    return Result{std::nullopt, std::move(status)};
  }
};

// Service protocols understood by the routing layer
enum class Protocol { Tcp, Http };

std::string to_string(Protocol protocol);

std::optional<Protocol> protocol_from_string(const std::string& str);

// One service exposed by an agent: name -> local port
struct ServiceSpec {
  std::string name;
  uint16_t port = 0;
  Protocol protocol = Protocol::Tcp;
  std::optional<uint16_t> external_port;  // TCP only; derived when absent

  json to_json() const;
  static Result<ServiceSpec> from_json(const json& j);

  bool operator==(const ServiceSpec& other) const {
    return name == other.name && port == other.port && protocol == other.protocol && external_port == other.external_port;
  }
};

// Checks the ServiceSpec list invariants: non-empty DNS-label names, unique names, valid ports
Status validate_services(const std::vector<ServiceSpec>& services);

// DNS-1123 label: [a-z0-9]([-a-z0-9]*[a-z0-9])?, at most 63 characters
bool is_dns_label(const std::string& s);

}  // namespace kuberde
