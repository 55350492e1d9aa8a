#pragma once

#include <cstdint>
#include <string>

#include "controller/workload.hpp"
#include "core/types.hpp"

namespace kuberde::controller {

constexpr const char* kTemplateHashAnnotation = "kuberde.io/template-hash";
constexpr const char* kAgentIdAnnotation = "kuberde.io/agent-id";

// Cluster-wide inputs to the desired Deployment
struct DeploymentParams {
  std::string agent_image;
  std::string default_server_url;  // when spec.serverUrl is empty
  std::string agent_token_url;
};

// The parts of an observed Deployment the controller acts on
struct DeploymentState {
  std::string name;
  std::string resource_version;
  int32_t replicas = 0;
  int32_t ready_replicas = 0;
  std::string template_hash;

  static DeploymentState from_json(const json& j);
};

// Identity, shortened with a hash suffix when it exceeds the 63-character name limit
std::string deployment_name(const AgentWorkload& workload);

// Deployment with the agent sidecar plus the workload container
json build_deployment(const AgentWorkload& workload, const DeploymentParams& params, int32_t replicas);

// SHA-256 over the serialized pod template, 16 hex characters
std::string template_hash(const json& pod_template);

// Drift by template hash or replica count
bool needs_update(const DeploymentState& observed, const json& desired);

}  // namespace kuberde::controller
