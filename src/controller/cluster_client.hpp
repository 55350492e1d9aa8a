#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "controller/deployment.hpp"
#include "controller/workload.hpp"
#include "core/types.hpp"

namespace kuberde::controller {

/**
 * The controller's view of the cluster API, scoped to one namespace.
 *
 * Writes that carry a resourceVersion fail with ReconcileConflict when the object
 * changed underneath; missing objects are NotFound.
 */
class ClusterClient {
 public:
  virtual ~ClusterClient() = default;

  virtual Result<std::vector<AgentWorkload>> list_workloads() = 0;

  virtual Result<AgentWorkload> get_workload(const std::string& name) = 0;

  // Status subresource, guarded by workload.resource_version
  virtual Status update_status(const AgentWorkload& workload, const WorkloadStatus& status) = 0;

  // Guarded by workload.resource_version
  virtual Status set_finalizers(const AgentWorkload& workload, const std::vector<std::string>& finalizers) = 0;

  virtual Result<DeploymentState> get_deployment(const std::string& name) = 0;

  virtual Status create_deployment(const json& deployment) = 0;

  // Full replace; metadata.resourceVersion of the argument is the precondition
  virtual Status replace_deployment(const json& deployment) = 0;

  virtual Status scale_deployment(const std::string& name, int32_t replicas) = 0;

  virtual Status delete_deployment(const std::string& name) = 0;
};

}  // namespace kuberde::controller
