#include <gtest/gtest.h>

#include "controller/deployment.hpp"
#include "core/identity.hpp"

using namespace kuberde;
using namespace kuberde::controller;

namespace {

AgentWorkload sample_workload() {
  AgentWorkload wl;
  wl.name = "ws";
  wl.namespace_ = "kuberde";
  wl.uid = "0f6e";
  wl.owner = "alice";
  wl.services = {ServiceSpec{"ssh", 22, Protocol::Tcp, std::nullopt}, ServiceSpec{"web", 8080, Protocol::Http, std::nullopt}};
  wl.container.image = "ghcr.io/example/dev:1.2";
  wl.container.ports = {22, 8080};
  wl.auth_secret = "alice-ws-agent";
  return wl;
}

DeploymentParams sample_params() {
  return DeploymentParams{"kuberde/agent:1.0", "ws://kuberde-server:8080/ws", "http://idp/token"};
}

std::string env_value(const json& container, const std::string& name) {
  for (const auto& e : container["env"]) {
    if (e["name"] == name) return e.contains("value") ? e["value"].get<std::string>() : "<secret>";
  }
  return "<missing>";
}

}  // namespace

// --- DeploymentTest ---

TEST(DeploymentTest, AgentSidecarEnvironment) {
  auto deployment = build_deployment(sample_workload(), sample_params(), 1);
  EXPECT_EQ(deployment["metadata"]["name"].get<std::string>(), "user-alice-ws");
  EXPECT_EQ(deployment["spec"]["replicas"].get<int>(), 1);
  EXPECT_EQ(deployment["metadata"]["annotations"][kAgentIdAnnotation].get<std::string>(), "user-alice-ws");

  const auto& containers = deployment["spec"]["template"]["spec"]["containers"];
  ASSERT_EQ(containers.size(), 2u);
  const auto& agent = containers[0];
  EXPECT_EQ(agent["image"].get<std::string>(), "kuberde/agent:1.0");
  EXPECT_EQ(env_value(agent, "SERVER_URL"), "ws://kuberde-server:8080/ws");
  EXPECT_EQ(env_value(agent, "AGENT_ID"), "user-alice-ws");
  EXPECT_EQ(env_value(agent, "AUTH_TOKEN_URL"), "http://idp/token");
  EXPECT_EQ(env_value(agent, "AUTH_CLIENT_SECRET"), "<secret>");

  auto services = json::parse(env_value(agent, "KUBERDE_SERVICES"));
  ASSERT_EQ(services["services"].size(), 2u);
  EXPECT_EQ(services["services"][1]["name"].get<std::string>(), "web");

  const auto& workload = containers[1];
  EXPECT_EQ(workload["image"].get<std::string>(), "ghcr.io/example/dev:1.2");
  EXPECT_EQ(workload["ports"][1]["containerPort"].get<int>(), 8080);
}

TEST(DeploymentTest, ContainerPortPerService) {
  auto wl = sample_workload();
  wl.services = {ServiceSpec{"ssh", 22, Protocol::Tcp, std::nullopt}, ServiceSpec{"files", 8080, Protocol::Http, std::nullopt},
                 ServiceSpec{"notebook-server-main", 8888, Protocol::Http, std::nullopt}};
  wl.container.ports = {9090, 22};

  auto deployment = build_deployment(wl, sample_params(), 1);
  const auto& ports = deployment["spec"]["template"]["spec"]["containers"][1]["ports"];
  ASSERT_EQ(ports.size(), 4u);
  EXPECT_EQ(ports[0]["containerPort"].get<int>(), 22);
  EXPECT_EQ(ports[0]["name"].get<std::string>(), "ssh");
  EXPECT_EQ(ports[1]["containerPort"].get<int>(), 8080);
  EXPECT_EQ(ports[1]["name"].get<std::string>(), "files");
  // Port names longer than 15 characters are rejected by the API server
  EXPECT_EQ(ports[2]["containerPort"].get<int>(), 8888);
  EXPECT_FALSE(ports[2].contains("name"));
  EXPECT_EQ(ports[3]["containerPort"].get<int>(), 9090);
  EXPECT_FALSE(ports[3].contains("name"));

  // Services alone are enough to expose their ports
  wl.container.ports.clear();
  deployment = build_deployment(wl, sample_params(), 1);
  EXPECT_EQ(deployment["spec"]["template"]["spec"]["containers"][1]["ports"].size(), 3u);
}

TEST(DeploymentTest, SpecServerUrlWins) {
  auto wl = sample_workload();
  wl.server_url = "ws://other/ws";
  wl.auth_secret.clear();
  auto params = sample_params();
  params.agent_token_url.clear();

  auto deployment = build_deployment(wl, params, 1);
  const auto& agent = deployment["spec"]["template"]["spec"]["containers"][0];
  EXPECT_EQ(env_value(agent, "SERVER_URL"), "ws://other/ws");
  EXPECT_EQ(env_value(agent, "AUTH_TOKEN_URL"), "<missing>");
  EXPECT_EQ(env_value(agent, "AUTH_CLIENT_ID"), "<missing>");
}

TEST(DeploymentTest, OwnerReference) {
  auto deployment = build_deployment(sample_workload(), sample_params(), 1);
  const auto& owner = deployment["metadata"]["ownerReferences"][0];
  EXPECT_EQ(owner["kind"].get<std::string>(), "AgentWorkload");
  EXPECT_EQ(owner["uid"].get<std::string>(), "0f6e");
  EXPECT_TRUE(owner["controller"].get<bool>());

  auto no_uid = sample_workload();
  no_uid.uid.clear();
  EXPECT_FALSE(build_deployment(no_uid, sample_params(), 1)["metadata"].contains("ownerReferences"));
}

TEST(DeploymentTest, LongNamesAreShortened) {
  auto wl = sample_workload();
  wl.name = std::string(70, 'w');
  auto name = deployment_name(wl);
  EXPECT_LE(name.size(), 63u);
  EXPECT_EQ(name.substr(name.size() - 9), "-" + short_hash(wl.identity()));
  EXPECT_EQ(deployment_name(sample_workload()), "user-alice-ws");
}

TEST(DeploymentTest, TemplateHashTracksPodTemplate) {
  auto wl = sample_workload();
  auto first = build_deployment(wl, sample_params(), 1);
  auto scaled = build_deployment(wl, sample_params(), 0);
  EXPECT_EQ(first["metadata"]["annotations"][kTemplateHashAnnotation], scaled["metadata"]["annotations"][kTemplateHashAnnotation]);

  wl.container.image = "ghcr.io/example/dev:1.3";
  auto changed = build_deployment(wl, sample_params(), 1);
  EXPECT_NE(first["metadata"]["annotations"][kTemplateHashAnnotation], changed["metadata"]["annotations"][kTemplateHashAnnotation]);
  EXPECT_EQ(template_hash(first["spec"]["template"]).size(), 16u);
}

TEST(DeploymentTest, DriftDetection) {
  auto desired = build_deployment(sample_workload(), sample_params(), 1);

  json observed_json = desired;
  observed_json["metadata"]["resourceVersion"] = "7";
  observed_json["status"] = {{"readyReplicas", 1}};
  auto observed = DeploymentState::from_json(observed_json);
  EXPECT_EQ(observed.resource_version, "7");
  EXPECT_EQ(observed.ready_replicas, 1);
  EXPECT_FALSE(needs_update(observed, desired));

  EXPECT_TRUE(needs_update(observed, build_deployment(sample_workload(), sample_params(), 0)));

  auto edited = sample_workload();
  edited.container.args = {"--verbose"};
  EXPECT_TRUE(needs_update(observed, build_deployment(edited, sample_params(), 1)));
}

TEST(DeploymentTest, StateDefaults) {
  auto state = DeploymentState::from_json(json{{"metadata", {{"name", "x"}}}, {"spec", json::object()}});
  EXPECT_EQ(state.name, "x");
  EXPECT_EQ(state.replicas, 1);
  EXPECT_EQ(state.ready_replicas, 0);
  EXPECT_TRUE(state.template_hash.empty());
}
