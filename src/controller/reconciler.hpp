#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "controller/cluster_client.hpp"
#include "controller/deployment.hpp"
#include "controller/relay_client.hpp"
#include "controller/workload.hpp"
#include "core/config.hpp"
#include "core/types.hpp"

namespace kuberde::controller {

// Outcome of one reconcile of one workload
struct ReconcileReport {
  std::string name;
  std::string identity;
  Phase phase = Phase::Pending;
  bool deleted = false;  // finalized and released during this pass
  Status status;
};

/**
 * Drives AgentWorkloads towards their desired state.
 *
 * Each pass is idempotent: it reads the resource, the Deployment and the relay's
 * routes afresh, performs only the missing steps and records the outcome in the
 * resource status. A failed step is left for the next pass.
 */
class Reconciler {
 public:
  Reconciler(ClusterClient& cluster, RelayClient& relay, const ControllerConfig& config, Clock clock);

  // Lists and reconciles every workload; fails only when the list itself fails
  Result<std::vector<ReconcileReport>> reconcile_all();

  // NotFound resources are reported as deleted
  ReconcileReport reconcile(const std::string& name);

  ReconcileReport reconcile(const AgentWorkload& workload);

  // Marks the workload active now and reconciles it back to one replica
  ReconcileReport scale_up(const std::string& name);

  // Stops reconcile_all between workloads
  void cancel() {
    cancelled_ = true;
  }

  void resume() {
    cancelled_ = false;
  }

 private:
  ReconcileReport finalize(AgentWorkload workload);

  Status ensure_finalizer(AgentWorkload& workload);

  // Newest of: recorded status, relay activity, creation time
  Timestamp effective_activity(const AgentWorkload& workload, const AgentActivity& activity) const;

  Status scale_down(const AgentWorkload& workload);

  Result<DeploymentState> ensure_deployment(const AgentWorkload& workload);

  Status converge_routes(const AgentWorkload& workload);

  Status release_routes(const std::string& identity);

  // Writes status when it differs, re-reading and retrying on ReconcileConflict.
  // On success workload holds the latest resourceVersion.
  Status write_status(AgentWorkload& workload, WorkloadStatus status);

  void refresh(AgentWorkload& workload);

  ClusterClient& cluster_;
  RelayClient& relay_;
  ControllerConfig config_;
  DeploymentParams params_;
  Clock clock_;
  std::atomic<bool> cancelled_{false};
};

}  // namespace kuberde::controller
