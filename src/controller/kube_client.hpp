#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "controller/cluster_client.hpp"

namespace kuberde::net {
class HttpClient;
struct HttpResponse;
}  // namespace kuberde::net

namespace kuberde::controller {

// ClusterClient over the Kubernetes REST API
class KubeClient : public ClusterClient {
 public:
  // token_file is re-read per request since projected service account tokens rotate
  KubeClient(std::shared_ptr<net::HttpClient> http, std::string api_url, std::string ns, std::string token_file,
             std::chrono::milliseconds timeout);

  Result<std::vector<AgentWorkload>> list_workloads() override;

  Result<AgentWorkload> get_workload(const std::string& name) override;

  Status update_status(const AgentWorkload& workload, const WorkloadStatus& status) override;

  Status set_finalizers(const AgentWorkload& workload, const std::vector<std::string>& finalizers) override;

  Result<DeploymentState> get_deployment(const std::string& name) override;

  Status create_deployment(const json& deployment) override;

  Status replace_deployment(const json& deployment) override;

  Status scale_deployment(const std::string& name, int32_t replicas) override;

  Status delete_deployment(const std::string& name) override;

  // Maps an API server reply to the error taxonomy
  static Status status_from(const net::HttpResponse& response, const std::string& what);

 private:
  net::HttpResponse call(const std::string& method, const std::string& path, const std::string& body = {},
                         const std::string& content_type = "application/json");

  std::string workloads_path() const;

  std::string deployments_path() const;

  std::shared_ptr<net::HttpClient> http_;
  std::string api_url_;
  std::string namespace_;
  std::string token_file_;
  std::chrono::milliseconds timeout_;
};

}  // namespace kuberde::controller
