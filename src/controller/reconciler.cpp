#include "controller/reconciler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

#include "controller/route_plan.hpp"
#include "core/backoff.hpp"
#include "core/time_util.hpp"

namespace kuberde::controller {

namespace {

bool tolerable(const Status& status) {
  return status.ok() || status.code == ErrorCode::NotFound;
}

bool has_key(const std::vector<RouteSpec>& routes, const RouteKey& key) {
  return std::any_of(routes.begin(), routes.end(), [&key](const RouteSpec& r) { return r.key == key; });
}

}  // namespace

Reconciler::Reconciler(ClusterClient& cluster, RelayClient& relay, const ControllerConfig& config, Clock clock)
    : cluster_(cluster), relay_(relay), config_(config), clock_(std::move(clock)) {
  params_.agent_image = config_.agent_image;
  params_.default_server_url = config_.default_server_url;
  params_.agent_token_url = config_.agent_token_url.empty() ? config_.token_url : config_.agent_token_url;
  if (!clock_) clock_ = [] { return std::chrono::system_clock::now(); };
}

// ============================================================================
// Entry points
// ============================================================================

Result<std::vector<ReconcileReport>> Reconciler::reconcile_all() {
  auto workloads = cluster_.list_workloads();
  if (!workloads.ok()) return Result<std::vector<ReconcileReport>>::failure(workloads.status);

  std::vector<ReconcileReport> reports;
  for (const auto& workload : *workloads.value) {
    if (cancelled_) {
      spdlog::info("Reconcile pass cancelled after {} of {} workloads", reports.size(), workloads.value->size());
      break;
    }
    auto report = reconcile(workload);
    if (!report.status.ok()) {
      spdlog::warn("[{}] reconcile failed: {}", report.identity, report.status.to_string());
    }
    reports.push_back(std::move(report));
  }
  return Result<std::vector<ReconcileReport>>::success(std::move(reports));
}

ReconcileReport Reconciler::reconcile(const std::string& name) {
  auto workload = cluster_.get_workload(name);
  if (!workload.ok()) {
    ReconcileReport report;
    report.name = name;
    if (workload.code() == ErrorCode::NotFound) {
      report.deleted = true;
    } else {
      report.status = workload.status;
    }
    return report;
  }
  return reconcile(*workload.value);
}

ReconcileReport Reconciler::reconcile(const AgentWorkload& observed) {
  if (observed.being_deleted()) return finalize(observed);

  AgentWorkload workload = observed;
  std::string identity = workload.identity();
  ReconcileReport report{workload.name, identity, workload.status.phase, false, Status::success()};

  auto status = ensure_finalizer(workload);
  if (!status.ok()) {
    report.status = status;
    return report;
  }

  WorkloadStatus next = workload.status;
  next.observed_generation = workload.generation;

  if (!workload.spec_error.ok()) {
    next.phase = Phase::Failed;
    next.message = workload.spec_error.message;
    report.phase = Phase::Failed;
    report.status = workload.spec_error;
    auto written = write_status(workload, next);
    if (!written.ok()) spdlog::warn("[{}] status update failed: {}", workload.name, written.to_string());
    return report;
  }

  AgentActivity activity;
  auto stats = relay_.agent_activity(identity);
  if (stats.ok()) {
    activity = *stats.value;
  } else if (stats.code() != ErrorCode::NotFound) {
    spdlog::debug("[{}] relay activity unavailable: {}", identity, stats.status.message);
  }

  Timestamp now = clock_();
  Timestamp last = effective_activity(workload, activity);
  next.last_activity = last;
  bool idle_due = workload.ttl.count() > 0 && now >= last + workload.ttl;

  Status step = Status::success();
  if (idle_due) {
    step = scale_down(workload);
    if (step.ok()) {
      if (workload.status.phase != Phase::Idle) {
        spdlog::info("[{}] idle for {}, scaled to zero", identity, format_duration(workload.ttl));
      }
      next.phase = Phase::Idle;
      next.replicas = 0;
      next.message = "scaled to zero after " + format_duration(workload.ttl) + " without activity";
    }
  } else {
    auto deployment = ensure_deployment(workload);
    step = deployment.status;
    if (deployment.ok()) {
      step = converge_routes(workload);
      next.replicas = deployment.value->ready_replicas;
    }
    bool ready = step.ok() && deployment.ok() && deployment.value->ready_replicas >= 1 && activity.online;
    next.phase = ready ? Phase::Ready : Phase::Reconciling;
    if (step.ok()) next.message = ready ? "" : "waiting for agent";
  }
  if (!step.ok()) {
    if (next.phase == Phase::Pending || next.phase == Phase::Failed) next.phase = Phase::Reconciling;
    next.message = step.message;
  }

  report.phase = next.phase;
  report.status = step;
  auto written = write_status(workload, next);
  if (!written.ok() && report.status.ok()) report.status = written;
  return report;
}

ReconcileReport Reconciler::scale_up(const std::string& name) {
  auto workload = cluster_.get_workload(name);
  if (!workload.ok()) {
    ReconcileReport report;
    report.name = name;
    report.status = workload.status;
    return report;
  }
  if (workload.value->being_deleted()) return finalize(*workload.value);

  WorkloadStatus next = workload.value->status;
  next.last_activity = clock_();
  if (next.phase != Phase::Ready) {
    next.phase = Phase::Reconciling;
    next.message = "scale-up requested";
  }
  auto written = write_status(*workload.value, next);
  if (!written.ok()) {
    ReconcileReport report{name, workload.value->identity(), workload.value->status.phase, false, written};
    return report;
  }
  spdlog::info("[{}] scale-up requested", workload.value->identity());
  return reconcile(*workload.value);
}

// ============================================================================
// Teardown
// ============================================================================

ReconcileReport Reconciler::finalize(AgentWorkload workload) {
  std::string identity = workload.identity();
  ReconcileReport report{workload.name, identity, Phase::Terminating, false, Status::success()};
  if (!workload.has_finalizer()) {
    report.deleted = true;
    return report;
  }

  if (workload.status.phase != Phase::Terminating) {
    WorkloadStatus next = workload.status;
    next.phase = Phase::Terminating;
    next.message = "releasing routes";
    auto written = write_status(workload, next);
    if (!written.ok()) spdlog::warn("[{}] status update failed: {}", workload.name, written.to_string());
  }

  auto status = release_routes(identity);
  if (!status.ok()) {
    report.status = status;
    return report;
  }

  status = cluster_.delete_deployment(deployment_name(workload));
  if (!tolerable(status)) {
    report.status = status;
    return report;
  }

  std::vector<std::string> remaining;
  for (const auto& f : workload.finalizers) {
    if (f != kFinalizer) remaining.push_back(f);
  }
  status = cluster_.set_finalizers(workload, remaining);
  if (!tolerable(status)) {
    report.status = status;
    return report;
  }
  spdlog::info("[{}] released", identity);
  report.deleted = true;
  return report;
}

Status Reconciler::release_routes(const std::string& identity) {
  auto listing = relay_.list_routes(identity);
  if (!listing.ok()) return listing.status;

  Status first = Status::success();
  for (const auto* routes : {&listing.value->routes, &listing.value->idle}) {
    for (const auto& route : *routes) {
      auto status = relay_.deregister_route(route.key, false);
      if (!tolerable(status) && first.ok()) first = status;
    }
  }
  return first;
}

// ============================================================================
// Steps
// ============================================================================

Status Reconciler::ensure_finalizer(AgentWorkload& workload) {
  if (workload.has_finalizer()) return Status::success();
  auto finalizers = workload.finalizers;
  finalizers.push_back(kFinalizer);
  auto status = cluster_.set_finalizers(workload, finalizers);
  if (!status.ok()) return status;
  refresh(workload);
  return Status::success();
}

Timestamp Reconciler::effective_activity(const AgentWorkload& workload, const AgentActivity& activity) const {
  if (activity.active_connections > 0) return clock_();

  std::optional<Timestamp> last = workload.status.last_activity;
  auto newer = [&last](const std::optional<Timestamp>& candidate) {
    if (candidate && (!last || *candidate > *last)) last = candidate;
  };
  newer(activity.last_activity);
  newer(workload.creation_timestamp);
  return last ? *last : clock_();
}

Status Reconciler::scale_down(const AgentWorkload& workload) {
  std::string identity = workload.identity();
  auto listing = relay_.list_routes(identity);
  if (!listing.ok()) return listing.status;

  auto desired = desired_routes(workload, config_.tcp_port_min, config_.tcp_port_max);
  for (const auto& route : listing.value->routes) {
    bool keep_idle = has_key(desired, route.key);
    auto status = relay_.deregister_route(route.key, keep_idle);
    if (!tolerable(status)) return status;
  }

  // A restarted relay has lost its idle markers; park the desired routes again
  for (const auto& route : desired) {
    if (has_key(listing.value->routes, route.key) || has_key(listing.value->idle, route.key)) continue;
    auto status = relay_.register_route(route);
    if (status.ok()) status = relay_.deregister_route(route.key, true);
    if (!tolerable(status)) {
      spdlog::warn("[{}] could not park {}: {}", identity, route.key.to_string(), status.message);
    }
  }

  auto deployment = cluster_.get_deployment(deployment_name(workload));
  if (!deployment.ok()) return tolerable(deployment.status) ? Status::success() : deployment.status;
  if (deployment.value->replicas == 0) return Status::success();
  return cluster_.scale_deployment(deployment.value->name, 0);
}

Result<DeploymentState> Reconciler::ensure_deployment(const AgentWorkload& workload) {
  std::string name = deployment_name(workload);
  std::string identity = workload.identity();
  json desired = build_deployment(workload, params_, 1);
  std::string hash = desired["metadata"]["annotations"][kTemplateHashAnnotation].get<std::string>();

  auto observed = cluster_.get_deployment(name);
  if (!observed.ok()) {
    if (observed.code() != ErrorCode::NotFound) return observed;
    auto status = cluster_.create_deployment(desired);
    if (!status.ok()) return Result<DeploymentState>::failure(status);
    spdlog::info("[{}] created deployment {}", identity, name);
    DeploymentState created;
    created.name = name;
    created.replicas = 1;
    created.template_hash = hash;
    return Result<DeploymentState>::success(created);
  }

  if (!needs_update(*observed.value, desired)) return observed;

  DeploymentState updated = *observed.value;
  Status status;
  if (updated.template_hash == hash) {
    status = cluster_.scale_deployment(name, 1);
    if (status.ok()) spdlog::info("[{}] scaled deployment {} to 1", identity, name);
  } else {
    desired["metadata"]["resourceVersion"] = updated.resource_version;
    status = cluster_.replace_deployment(desired);
    if (status.ok()) spdlog::info("[{}] updated deployment {} (template {})", identity, name, hash);
  }
  if (!status.ok()) return Result<DeploymentState>::failure(status);
  updated.replicas = 1;
  updated.template_hash = hash;
  return Result<DeploymentState>::success(updated);
}

Status Reconciler::converge_routes(const AgentWorkload& workload) {
  std::string identity = workload.identity();
  auto listing = relay_.list_routes(identity);
  if (!listing.ok()) return listing.status;

  auto desired = desired_routes(workload, config_.tcp_port_min, config_.tcp_port_max);
  auto diff = diff_routes(desired, listing.value->routes);

  Status result = Status::success();
  auto note = [&result](const Status& status) {
    if (!tolerable(status) && result.ok()) result = status;
  };

  for (const auto& key : diff.to_remove) {
    note(relay_.deregister_route(key, false));
  }
  for (const auto& idle : listing.value->idle) {
    if (!has_key(desired, idle.key)) note(relay_.deregister_route(idle.key, false));
  }
  for (const auto& route : diff.to_register) {
    auto status = relay_.register_route(route);
    if (status.ok()) {
      spdlog::info("[{}] registered {} -> {}", identity, route.key.to_string(), route.service);
    } else {
      spdlog::warn("[{}] register {} failed: {}", identity, route.key.to_string(), status.message);
    }
    note(status);
  }
  return result;
}

// ============================================================================
// Status
// ============================================================================

Status Reconciler::write_status(AgentWorkload& workload, WorkloadStatus status) {
  if (status == workload.status) return Status::success();

  Backoff backoff(config_.status_retry);
  while (true) {
    auto result = cluster_.update_status(workload, status);
    if (result.ok()) {
      workload.status = status;
      refresh(workload);
      return result;
    }
    if (result.code != ErrorCode::ReconcileConflict || backoff.exhausted()) return result;

    std::this_thread::sleep_for(backoff.next());
    auto fresh = cluster_.get_workload(workload.name);
    if (!fresh.ok()) return tolerable(fresh.status) ? Status::success() : fresh.status;

    const auto& seen = fresh.value->status.last_activity;
    if (seen && (!status.last_activity || *seen > *status.last_activity)) status.last_activity = seen;
    workload = *fresh.value;
    if (status == workload.status) return Status::success();
    spdlog::debug("[{}] status conflict, retrying at resourceVersion {}", workload.name, workload.resource_version);
  }
}

void Reconciler::refresh(AgentWorkload& workload) {
  auto fresh = cluster_.get_workload(workload.name);
  if (fresh.ok()) {
    workload = *fresh.value;
  } else {
    spdlog::debug("[{}] re-read failed: {}", workload.name, fresh.status.message);
  }
}

}  // namespace kuberde::controller
