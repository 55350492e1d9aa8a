#include "controller/deployment.hpp"

#include <set>

#include "core/encoding.hpp"
#include "core/identity.hpp"

namespace kuberde::controller {

namespace {

constexpr size_t kMaxNameLength = 63;
constexpr size_t kMaxPortNameLength = 15;

json secret_env(const std::string& name, const std::string& secret, const std::string& key) {
  return json{{"name", name}, {"valueFrom", {{"secretKeyRef", {{"name", secret}, {"key", key}}}}}};
}

json agent_container(const AgentWorkload& workload, const DeploymentParams& params) {
  json services = json::array();
  for (const auto& service : workload.services) {
    services.push_back(service.to_json());
  }

  std::string server_url = workload.server_url.empty() ? params.default_server_url : workload.server_url;
  json env = json::array({
      {{"name", "SERVER_URL"}, {"value", server_url}},
      {{"name", "AGENT_ID"}, {"value", workload.identity()}},
      {{"name", "KUBERDE_SERVICES"}, {"value", json{{"services", services}}.dump()}},
  });
  if (!params.agent_token_url.empty()) {
    env.push_back({{"name", "AUTH_TOKEN_URL"}, {"value", params.agent_token_url}});
  }
  if (!workload.auth_secret.empty()) {
    env.push_back(secret_env("AUTH_CLIENT_ID", workload.auth_secret, "CLIENT_ID"));
    env.push_back(secret_env("AUTH_CLIENT_SECRET", workload.auth_secret, "CLIENT_SECRET"));
  }

  return json{
      {"name", "kuberde-agent"},
      {"image", params.agent_image},
      {"env", env},
      {"resources", {{"requests", {{"cpu", "50m"}, {"memory", "64Mi"}}}, {"limits", {{"cpu", "200m"}, {"memory", "128Mi"}}}}},
  };
}

json workload_container(const AgentWorkload& workload) {
  const auto& spec = workload.container;
  json container = {{"name", "workload"}, {"image", spec.image}};
  if (!spec.image_pull_policy.empty()) container["imagePullPolicy"] = spec.image_pull_policy;
  if (!spec.command.empty()) container["command"] = spec.command;
  if (!spec.args.empty()) container["args"] = spec.args;
  if (!spec.env.empty()) {
    json env = json::array();
    for (const auto& e : spec.env) {
      env.push_back({{"name", e.name}, {"value", e.value}});
    }
    container["env"] = env;
  }
  // One port per service, then any extra container ports
  json ports = json::array();
  std::set<uint16_t> seen;
  for (const auto& service : workload.services) {
    if (!seen.insert(service.port).second) continue;
    json port = {{"containerPort", service.port}, {"protocol", "TCP"}};
    if (service.name.size() <= kMaxPortNameLength) port["name"] = service.name;
    ports.push_back(port);
  }
  for (auto port : spec.ports) {
    if (seen.insert(port).second) ports.push_back({{"containerPort", port}, {"protocol", "TCP"}});
  }
  if (!ports.empty()) container["ports"] = ports;
  if (spec.resources.is_object()) container["resources"] = spec.resources;
  return container;
}

}  // namespace

DeploymentState DeploymentState::from_json(const json& j) {
  DeploymentState state;
  if (!j.is_object()) return state;
  const auto& meta = j.contains("metadata") ? j["metadata"] : json::object();
  state.name = meta.value("name", "");
  state.resource_version = meta.value("resourceVersion", "");
  if (meta.contains("annotations") && meta["annotations"].is_object()) {
    state.template_hash = meta["annotations"].value(kTemplateHashAnnotation, "");
  }
  if (j.contains("spec") && j["spec"].is_object()) {
    state.replicas = j["spec"].value("replicas", int32_t(1));
  }
  if (j.contains("status") && j["status"].is_object()) {
    state.ready_replicas = j["status"].value("readyReplicas", int32_t(0));
  }
  return state;
}

std::string deployment_name(const AgentWorkload& workload) {
  std::string identity = workload.identity();
  if (identity.size() <= kMaxNameLength) return identity;
  std::string suffix = short_hash(identity);
  std::string head = sanitize_name(identity, kMaxNameLength - suffix.size() - 1);
  return head + "-" + suffix;
}

std::string template_hash(const json& pod_template) {
  return sha256_hex(pod_template.dump()).substr(0, 16);
}

json build_deployment(const AgentWorkload& workload, const DeploymentParams& params, int32_t replicas) {
  std::string identity = workload.identity();
  json labels = {
      {"app.kubernetes.io/name", "kuberde-agent"},
      {"app.kubernetes.io/managed-by", "kuberde-operator"},
      {"kuberde.io/instance", short_hash(identity)},
  };

  json pod_template = {
      {"metadata", {{"labels", labels}}},
      {"spec", {{"containers", json::array({agent_container(workload, params), workload_container(workload)})}}},
  };

  json meta = {
      {"name", deployment_name(workload)},
      {"namespace", workload.namespace_},
      {"labels", labels},
      {"annotations", {{kAgentIdAnnotation, identity}, {kTemplateHashAnnotation, template_hash(pod_template)}}},
  };
  if (!workload.uid.empty()) {
    meta["ownerReferences"] = json::array({{
        {"apiVersion", std::string(kApiGroup) + "/" + kApiVersion},
        {"kind", kResourceKind},
        {"name", workload.name},
        {"uid", workload.uid},
        {"controller", true},
        {"blockOwnerDeletion", true},
    }});
  }

  return json{
      {"apiVersion", "apps/v1"},
      {"kind", "Deployment"},
      {"metadata", meta},
      {"spec", {{"replicas", replicas}, {"selector", {{"matchLabels", labels}}}, {"template", pod_template}}},
  };
}

bool needs_update(const DeploymentState& observed, const json& desired) {
  std::string hash = desired["metadata"]["annotations"].value(kTemplateHashAnnotation, "");
  int32_t replicas = desired["spec"].value("replicas", int32_t(1));
  return observed.template_hash != hash || observed.replicas != replicas;
}

}  // namespace kuberde::controller
