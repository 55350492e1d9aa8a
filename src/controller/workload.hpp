#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace kuberde::controller {

constexpr const char* kApiGroup = "kuberde.io";
constexpr const char* kApiVersion = "v1beta1";
constexpr const char* kResourcePlural = "agentworkloads";
constexpr const char* kResourceKind = "AgentWorkload";
constexpr const char* kFinalizer = "kuberde.io/routes";

enum class Phase { Pending, Reconciling, Ready, Idle, Terminating, Failed };

std::string to_string(Phase phase);

std::optional<Phase> phase_from_string(const std::string& str);

struct EnvVar {
  std::string name;
  std::string value;

  bool operator==(const EnvVar& other) const {
    return name == other.name && value == other.value;
  }
};

// spec.workloadContainer
struct WorkloadContainer {
  std::string image;
  std::string image_pull_policy;  // empty = cluster default
  std::vector<std::string> command;
  std::vector<std::string> args;
  std::vector<EnvVar> env;
  std::vector<uint16_t> ports;
  json resources;  // passed through to the pod spec
};

struct WorkloadStatus {
  Phase phase = Phase::Pending;
  std::optional<Timestamp> last_activity;
  std::string message;
  int64_t observed_generation = 0;
  int32_t replicas = 0;

  json to_json() const;

  static WorkloadStatus from_json(const json& j);

  bool operator==(const WorkloadStatus& other) const;

  bool operator!=(const WorkloadStatus& other) const {
    return !(*this == other);
  }
};

/**
 * AgentWorkload (kuberde.io/v1beta1) as read from the cluster API.
 *
 * Metadata is always populated. Spec problems do not fail the parse; they are
 * reported through spec_error so the controller can surface them in status.
 */
struct AgentWorkload {
  // metadata
  std::string name;
  std::string namespace_;
  std::string uid;
  std::string resource_version;
  int64_t generation = 0;
  std::vector<std::string> finalizers;
  std::optional<Timestamp> creation_timestamp;
  std::optional<Timestamp> deletion_timestamp;

  // spec
  std::string owner;
  std::string server_url;
  std::vector<ServiceSpec> services;
  WorkloadContainer container;
  std::chrono::milliseconds ttl{0};  // 0 = never scaled down
  std::string auth_secret;

  WorkloadStatus status;
  Status spec_error;

  // Workload-level agent identity: user-{owner}-{name}
  std::string identity() const;

  bool being_deleted() const {
    return deletion_timestamp.has_value();
  }

  bool has_finalizer() const;

  static Result<AgentWorkload> from_json(const json& j);

  json to_json() const;
};

}  // namespace kuberde::controller
