#include "controller/workload.hpp"

#include <algorithm>

#include "core/identity.hpp"
#include "core/time_util.hpp"

namespace kuberde::controller {

namespace {

std::optional<Timestamp> read_time(const json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_string()) return std::nullopt;
  return parse_rfc3339(j[key].get<std::string>());
}

std::vector<std::string> read_strings(const json& j, const char* key) {
  std::vector<std::string> out;
  if (!j.contains(key) || !j[key].is_array()) return out;
  for (const auto& item : j[key]) {
    if (item.is_string()) out.push_back(item.get<std::string>());
  }
  return out;
}

Status parse_container(const json& j, WorkloadContainer& container) {
  if (!j.is_object()) {
    return Status::failure(ErrorCode::InvalidArgument, "spec.workloadContainer must be an object");
  }
  container.image = j.value("image", "");
  if (container.image.empty()) {
    return Status::failure(ErrorCode::InvalidArgument, "spec.workloadContainer.image is required");
  }
  container.image_pull_policy = j.value("imagePullPolicy", "");
  container.command = read_strings(j, "command");
  container.args = read_strings(j, "args");

  if (j.contains("env") && j["env"].is_array()) {
    for (const auto& e : j["env"]) {
      std::string name = e.value("name", "");
      if (name.empty()) return Status::failure(ErrorCode::InvalidArgument, "spec.workloadContainer.env entries need a name");
      container.env.push_back(EnvVar{name, e.value("value", "")});
    }
  }

  if (j.contains("ports") && j["ports"].is_array()) {
    for (const auto& p : j["ports"]) {
      int64_t port = p.is_object() ? p.value("containerPort", int64_t(0)) : (p.is_number_integer() ? p.get<int64_t>() : 0);
      if (port <= 0 || port > 65535) {
        return Status::failure(ErrorCode::InvalidArgument, "spec.workloadContainer.ports: invalid port " + p.dump());
      }
      container.ports.push_back(static_cast<uint16_t>(port));
    }
  }
  if (j.contains("resources") && j["resources"].is_object()) {
    container.resources = j["resources"];
  }
  return Status::success();
}

Status parse_spec(const json& spec, AgentWorkload& wl) {
  wl.owner = spec.value("owner", "");
  if (wl.owner.empty()) return Status::failure(ErrorCode::InvalidArgument, "spec.owner is required");
  if (!is_valid_identity(wl.identity())) {
    return Status::failure(ErrorCode::InvalidArgument, "owner '" + wl.owner + "' and name '" + wl.name + "' do not form a valid agent identity");
  }

  wl.server_url = spec.value("serverUrl", "");
  wl.auth_secret = spec.value("authSecret", "");

  if (spec.contains("ttl") && !spec["ttl"].is_null()) {
    auto ttl = parse_duration(spec["ttl"].get<std::string>());
    if (!ttl) return Status::failure(ErrorCode::InvalidArgument, "spec.ttl '" + spec["ttl"].get<std::string>() + "' is not a duration");
    wl.ttl = *ttl;
  }

  if (!spec.contains("services") || !spec["services"].is_array() || spec["services"].empty()) {
    return Status::failure(ErrorCode::InvalidArgument, "spec.services must list at least one service");
  }
  for (const auto& entry : spec["services"]) {
    json normalized = entry;
    if (normalized.is_object() && !normalized.contains("port") && normalized.contains("localPort")) {
      normalized["port"] = normalized["localPort"];
    }
    auto service = ServiceSpec::from_json(normalized);
    if (!service.ok()) return service.status;
    wl.services.push_back(*service.value);
  }
  auto valid = validate_services(wl.services);
  if (!valid.ok()) return valid;

  if (!spec.contains("workloadContainer")) {
    return Status::failure(ErrorCode::InvalidArgument, "spec.workloadContainer is required");
  }
  return parse_container(spec["workloadContainer"], wl.container);
}

}  // namespace

std::string to_string(Phase phase) {
  switch (phase) {
    case Phase::Pending:
      return "Pending";
    case Phase::Reconciling:
      return "Reconciling";
    case Phase::Ready:
      return "Ready";
    case Phase::Idle:
      return "Idle";
    case Phase::Terminating:
      return "Terminating";
    case Phase::Failed:
      return "Failed";
  }
  return "Pending";
}

std::optional<Phase> phase_from_string(const std::string& str) {
  for (auto phase : {Phase::Pending, Phase::Reconciling, Phase::Ready, Phase::Idle, Phase::Terminating, Phase::Failed}) {
    if (to_string(phase) == str) return phase;
  }
  return std::nullopt;
}

// ============================================================
// WorkloadStatus
// ============================================================

json WorkloadStatus::to_json() const {
  json j = {
      {"phase", to_string(phase)},
      {"message", message},
      {"observedGeneration", observed_generation},
      {"replicas", replicas},
  };
  if (last_activity) j["lastActivity"] = format_rfc3339(*last_activity);
  return j;
}

WorkloadStatus WorkloadStatus::from_json(const json& j) {
  WorkloadStatus status;
  if (!j.is_object()) return status;
  status.phase = phase_from_string(j.value("phase", "")).value_or(Phase::Pending);
  status.last_activity = read_time(j, "lastActivity");
  status.message = j.value("message", "");
  status.observed_generation = j.value("observedGeneration", int64_t(0));
  status.replicas = j.value("replicas", int32_t(0));
  return status;
}

bool WorkloadStatus::operator==(const WorkloadStatus& other) const {
  // Compared at the second precision they are serialized with
  auto seconds = [](const std::optional<Timestamp>& ts) -> std::optional<int64_t> {
    if (!ts) return std::nullopt;
    return to_unix_seconds(*ts);
  };
  return phase == other.phase && seconds(last_activity) == seconds(other.last_activity) && message == other.message &&
         observed_generation == other.observed_generation && replicas == other.replicas;
}

// ============================================================
// AgentWorkload
// ============================================================

std::string AgentWorkload::identity() const {
  return make_identity(owner, name);
}

bool AgentWorkload::has_finalizer() const {
  return std::find(finalizers.begin(), finalizers.end(), kFinalizer) != finalizers.end();
}

Result<AgentWorkload> AgentWorkload::from_json(const json& j) {
  if (!j.is_object() || !j.contains("metadata") || !j["metadata"].is_object()) {
    return Result<AgentWorkload>::failure(ErrorCode::InvalidArgument, "resource has no metadata");
  }

  AgentWorkload wl;
  try {
    const auto& meta = j["metadata"];
    wl.name = meta.value("name", "");
    if (wl.name.empty()) {
      return Result<AgentWorkload>::failure(ErrorCode::InvalidArgument, "metadata.name is required");
    }
    wl.namespace_ = meta.value("namespace", "");
    wl.uid = meta.value("uid", "");
    wl.resource_version = meta.value("resourceVersion", "");
    wl.generation = meta.value("generation", int64_t(0));
    wl.finalizers = read_strings(meta, "finalizers");
    wl.creation_timestamp = read_time(meta, "creationTimestamp");
    wl.deletion_timestamp = read_time(meta, "deletionTimestamp");

    if (j.contains("status")) wl.status = WorkloadStatus::from_json(j["status"]);

    if (!j.contains("spec") || !j["spec"].is_object()) {
      wl.spec_error = Status::failure(ErrorCode::InvalidArgument, "spec is required");
    } else {
      wl.spec_error = parse_spec(j["spec"], wl);
    }
  } catch (const json::exception& e) {
    wl.spec_error = Status::failure(ErrorCode::InvalidArgument, std::string("malformed resource: ") + e.what());
  }
  return Result<AgentWorkload>::success(std::move(wl));
}

json AgentWorkload::to_json() const {
  json meta = {
      {"name", name},
      {"namespace", namespace_},
      {"uid", uid},
      {"resourceVersion", resource_version},
      {"generation", generation},
      {"finalizers", finalizers},
  };
  if (creation_timestamp) meta["creationTimestamp"] = format_rfc3339(*creation_timestamp);
  if (deletion_timestamp) meta["deletionTimestamp"] = format_rfc3339(*deletion_timestamp);

  json services_json = json::array();
  for (const auto& service : services) {
    services_json.push_back(service.to_json());
  }

  json env = json::array();
  for (const auto& e : container.env) {
    env.push_back(json{{"name", e.name}, {"value", e.value}});
  }
  json workload_container = {
      {"image", container.image},
      {"command", container.command},
      {"args", container.args},
      {"env", env},
      {"ports", container.ports},
  };
  if (!container.image_pull_policy.empty()) workload_container["imagePullPolicy"] = container.image_pull_policy;
  if (container.resources.is_object()) workload_container["resources"] = container.resources;

  json spec = {
      {"owner", owner},
      {"serverUrl", server_url},
      {"services", services_json},
      {"workloadContainer", workload_container},
      {"ttl", format_duration(ttl)},
      {"authSecret", auth_secret},
  };

  return json{
      {"apiVersion", std::string(kApiGroup) + "/" + kApiVersion},
      {"kind", kResourceKind},
      {"metadata", meta},
      {"spec", spec},
      {"status", status.to_json()},
  };
}

}  // namespace kuberde::controller
