#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "controller/cluster_client.hpp"

namespace kuberde::fakes {

// In-memory namespace: AgentWorkloads and Deployments with resourceVersion preconditions
class FakeCluster : public controller::ClusterClient {
 public:
  void add(controller::AgentWorkload workload) {
    std::lock_guard<std::mutex> lock(mutex_);
    workload.resource_version = bump();
    workloads_[workload.name] = std::move(workload);
  }

  // Edits a stored workload the way a user's apply would
  template <typename Fn>
  void edit(const std::string& name, Fn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& workload = workloads_.at(name);
    fn(workload);
    workload.generation++;
    workload.resource_version = bump();
  }

  void mark_deleted(const std::string& name, Timestamp when) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& workload = workloads_.at(name);
    workload.deletion_timestamp = when;
    workload.resource_version = bump();
  }

  bool has_workload(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workloads_.count(name) > 0;
  }

  controller::AgentWorkload workload(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workloads_.at(name);
  }

  bool has_deployment(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deployments_.count(name) > 0;
  }

  json deployment(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deployments_.at(name);
  }

  // Pods become ready as soon as the Deployment asks for them
  void set_auto_ready(bool ready) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto_ready_ = ready;
  }

  // The next n status writes lose against a concurrent writer
  void inject_status_conflicts(int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_conflicts_ = n;
  }

  void fail_lists(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_lists_ = fail;
  }

  std::atomic<int> status_writes{0};
  std::atomic<int> creates{0};
  std::atomic<int> replaces{0};
  std::atomic<int> scales{0};
  std::atomic<int> deletes{0};

  Result<std::vector<controller::AgentWorkload>> list_workloads() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_lists_) return Result<std::vector<controller::AgentWorkload>>::failure(ErrorCode::Unavailable, "apiserver down");
    std::vector<controller::AgentWorkload> out;
    for (const auto& [name, workload] : workloads_) out.push_back(workload);
    return Result<std::vector<controller::AgentWorkload>>::success(std::move(out));
  }

  Result<controller::AgentWorkload> get_workload(const std::string& name) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workloads_.find(name);
    if (it == workloads_.end()) return Result<controller::AgentWorkload>::failure(ErrorCode::NotFound, name + " not found");
    return Result<controller::AgentWorkload>::success(it->second);
  }

  Status update_status(const controller::AgentWorkload& workload, const controller::WorkloadStatus& status) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workloads_.find(workload.name);
    if (it == workloads_.end()) return Status::failure(ErrorCode::NotFound, workload.name + " not found");
    if (status_conflicts_ > 0) {
      status_conflicts_--;
      it->second.resource_version = bump();
      return Status::failure(ErrorCode::ReconcileConflict, "the object has been modified");
    }
    if (it->second.resource_version != workload.resource_version) {
      return Status::failure(ErrorCode::ReconcileConflict, "stale resourceVersion " + workload.resource_version);
    }
    it->second.status = status;
    it->second.resource_version = bump();
    status_writes++;
    return Status::success();
  }

  Status set_finalizers(const controller::AgentWorkload& workload, const std::vector<std::string>& finalizers) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workloads_.find(workload.name);
    if (it == workloads_.end()) return Status::failure(ErrorCode::NotFound, workload.name + " not found");
    if (it->second.resource_version != workload.resource_version) {
      return Status::failure(ErrorCode::ReconcileConflict, "stale resourceVersion " + workload.resource_version);
    }
    it->second.finalizers = finalizers;
    it->second.resource_version = bump();
    if (it->second.being_deleted() && finalizers.empty()) workloads_.erase(it);
    return Status::success();
  }

  Result<controller::DeploymentState> get_deployment(const std::string& name) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deployments_.find(name);
    if (it == deployments_.end()) return Result<controller::DeploymentState>::failure(ErrorCode::NotFound, name + " not found");
    json observed = it->second;
    if (auto_ready_) observed["status"]["readyReplicas"] = observed["spec"].value("replicas", 1);
    return Result<controller::DeploymentState>::success(controller::DeploymentState::from_json(observed));
  }

  Status create_deployment(const json& deployment) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string name = deployment["metadata"]["name"].get<std::string>();
    if (deployments_.count(name)) return Status::failure(ErrorCode::Conflict, name + " already exists");
    deployments_[name] = deployment;
    deployments_[name]["metadata"]["resourceVersion"] = bump();
    creates++;
    return Status::success();
  }

  Status replace_deployment(const json& deployment) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string name = deployment["metadata"]["name"].get<std::string>();
    auto it = deployments_.find(name);
    if (it == deployments_.end()) return Status::failure(ErrorCode::NotFound, name + " not found");
    if (deployment["metadata"].value("resourceVersion", "") != it->second["metadata"].value("resourceVersion", "")) {
      return Status::failure(ErrorCode::ReconcileConflict, "stale deployment " + name);
    }
    it->second = deployment;
    it->second["metadata"]["resourceVersion"] = bump();
    replaces++;
    return Status::success();
  }

  Status scale_deployment(const std::string& name, int32_t replicas) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deployments_.find(name);
    if (it == deployments_.end()) return Status::failure(ErrorCode::NotFound, name + " not found");
    it->second["spec"]["replicas"] = replicas;
    it->second["metadata"]["resourceVersion"] = bump();
    scales++;
    return Status::success();
  }

  Status delete_deployment(const std::string& name) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (deployments_.erase(name) == 0) return Status::failure(ErrorCode::NotFound, name + " not found");
    deletes++;
    return Status::success();
  }

 private:
  std::string bump() {
    return std::to_string(++version_);
  }

  mutable std::mutex mutex_;
  std::map<std::string, controller::AgentWorkload> workloads_;
  std::map<std::string, json> deployments_;
  int64_t version_ = 100;
  int status_conflicts_ = 0;
  bool auto_ready_ = false;
  bool fail_lists_ = false;
};

}  // namespace kuberde::fakes
