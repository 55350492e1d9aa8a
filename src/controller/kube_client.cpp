#include "controller/kube_client.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

#include "net/http_client.hpp"

namespace kuberde::controller {

namespace {

constexpr const char* kMergePatch = "application/merge-patch+json";

std::string read_token(const std::string& path) {
  if (path.empty()) return {};
  std::ifstream file(path);
  if (!file) return {};
  std::stringstream buffer;
  buffer << file.rdbuf();
  std::string token = buffer.str();
  while (!token.empty() && (token.back() == '\n' || token.back() == '\r' || token.back() == ' ')) token.pop_back();
  return token;
}

template <typename T>
Result<T> parse_body(const net::HttpResponse& response, const std::string& what, T (*convert)(const json&)) {
  try {
    return Result<T>::success(convert(json::parse(response.body)));
  } catch (const json::exception& e) {
    return Result<T>::failure(ErrorCode::Internal, what + ": invalid JSON from API server: " + e.what());
  }
}

}  // namespace

KubeClient::KubeClient(std::shared_ptr<net::HttpClient> http, std::string api_url, std::string ns, std::string token_file,
                       std::chrono::milliseconds timeout)
    : http_(std::move(http)), api_url_(std::move(api_url)), namespace_(std::move(ns)), token_file_(std::move(token_file)), timeout_(timeout) {
  while (!api_url_.empty() && api_url_.back() == '/') api_url_.pop_back();
}

std::string KubeClient::workloads_path() const {
  return std::string("/apis/") + kApiGroup + "/" + kApiVersion + "/namespaces/" + namespace_ + "/" + kResourcePlural;
}

std::string KubeClient::deployments_path() const {
  return "/apis/apps/v1/namespaces/" + namespace_ + "/deployments";
}

net::HttpResponse KubeClient::call(const std::string& method, const std::string& path, const std::string& body, const std::string& content_type) {
  net::HttpOptions opts;
  opts.method = method;
  opts.timeout = timeout_;
  opts.headers["Accept"] = "application/json";
  if (!body.empty()) {
    opts.headers["Content-Type"] = content_type;
    opts.body = body;
  }
  auto token = read_token(token_file_);
  if (!token.empty()) opts.headers["Authorization"] = "Bearer " + token;

  auto response = http_->request(api_url_ + path, opts).get();
  spdlog::trace("{} {} -> {}", method, path, response.status_code);
  return response;
}

Status KubeClient::status_from(const net::HttpResponse& response, const std::string& what) {
  if (response.ok()) return Status::success();
  if (response.status_code == 0) {
    return Status::failure(ErrorCode::Unavailable, what + ": " + response.error);
  }

  std::string detail = response.body;
  auto body = json::parse(response.body, nullptr, false);
  if (!body.is_discarded() && body.is_object() && body.contains("message") && body["message"].is_string()) {
    detail = body["message"].get<std::string>();
  }

  ErrorCode code;
  switch (response.status_code) {
    case 400:
    case 422:
      code = ErrorCode::InvalidArgument;
      break;
    case 401:
      code = ErrorCode::Unauthorized;
      break;
    case 403:
      code = ErrorCode::Forbidden;
      break;
    case 404:
      code = ErrorCode::NotFound;
      break;
    case 409:
      code = ErrorCode::ReconcileConflict;
      break;
    case 429:
    case 503:
      code = ErrorCode::Unavailable;
      break;
    default:
      code = ErrorCode::Internal;
  }
  return Status::failure(code, what + ": " + std::to_string(response.status_code) + " " + detail);
}

Result<std::vector<AgentWorkload>> KubeClient::list_workloads() {
  auto response = call("GET", workloads_path());
  auto status = status_from(response, "list " + std::string(kResourcePlural));
  if (!status.ok()) return Result<std::vector<AgentWorkload>>::failure(status);

  std::vector<AgentWorkload> out;
  try {
    auto body = json::parse(response.body);
    for (const auto& item : body.value("items", json::array())) {
      auto workload = AgentWorkload::from_json(item);
      if (!workload.ok()) {
        spdlog::warn("Skipping unreadable {}: {}", kResourceKind, workload.status.message);
        continue;
      }
      out.push_back(std::move(*workload.value));
    }
  } catch (const json::exception& e) {
    return Result<std::vector<AgentWorkload>>::failure(ErrorCode::Internal, std::string("list: invalid JSON from API server: ") + e.what());
  }
  return Result<std::vector<AgentWorkload>>::success(std::move(out));
}

Result<AgentWorkload> KubeClient::get_workload(const std::string& name) {
  auto response = call("GET", workloads_path() + "/" + name);
  auto status = status_from(response, "get " + name);
  if (!status.ok()) return Result<AgentWorkload>::failure(status);

  try {
    return AgentWorkload::from_json(json::parse(response.body));
  } catch (const json::exception& e) {
    return Result<AgentWorkload>::failure(ErrorCode::Internal, "get " + name + ": invalid JSON from API server: " + e.what());
  }
}

Status KubeClient::update_status(const AgentWorkload& workload, const WorkloadStatus& status) {
  json patch = {{"metadata", {{"resourceVersion", workload.resource_version}}}, {"status", status.to_json()}};
  auto response = call("PATCH", workloads_path() + "/" + workload.name + "/status", patch.dump(), kMergePatch);
  return status_from(response, "update status of " + workload.name);
}

Status KubeClient::set_finalizers(const AgentWorkload& workload, const std::vector<std::string>& finalizers) {
  json patch = {{"metadata", {{"resourceVersion", workload.resource_version}, {"finalizers", finalizers}}}};
  auto response = call("PATCH", workloads_path() + "/" + workload.name, patch.dump(), kMergePatch);
  return status_from(response, "set finalizers of " + workload.name);
}

Result<DeploymentState> KubeClient::get_deployment(const std::string& name) {
  auto response = call("GET", deployments_path() + "/" + name);
  auto status = status_from(response, "get deployment " + name);
  if (!status.ok()) return Result<DeploymentState>::failure(status);
  return parse_body<DeploymentState>(response, "get deployment " + name, &DeploymentState::from_json);
}

Status KubeClient::create_deployment(const json& deployment) {
  std::string name = deployment["metadata"].value("name", "");
  auto response = call("POST", deployments_path(), deployment.dump());
  if (response.status_code == 409) {
    return Status::failure(ErrorCode::Conflict, "deployment " + name + " already exists");
  }
  return status_from(response, "create deployment " + name);
}

Status KubeClient::replace_deployment(const json& deployment) {
  std::string name = deployment["metadata"].value("name", "");
  auto response = call("PUT", deployments_path() + "/" + name, deployment.dump());
  return status_from(response, "replace deployment " + name);
}

Status KubeClient::scale_deployment(const std::string& name, int32_t replicas) {
  json patch = {{"spec", {{"replicas", replicas}}}};
  auto response = call("PATCH", deployments_path() + "/" + name, patch.dump(), kMergePatch);
  return status_from(response, "scale deployment " + name);
}

Status KubeClient::delete_deployment(const std::string& name) {
  json options = {{"kind", "DeleteOptions"}, {"apiVersion", "v1"}, {"propagationPolicy", "Background"}};
  auto response = call("DELETE", deployments_path() + "/" + name, options.dump());
  return status_from(response, "delete deployment " + name);
}

}  // namespace kuberde::controller
