#include "controller/controller.hpp"

#include <spdlog/spdlog.h>

#include <asio.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <thread>

#include "auth/authorizer.hpp"
#include "auth/credential_source.hpp"
#include "auth/issuer.hpp"
#include "auth/token_refresher.hpp"
#include "auth/verifier.hpp"
#include "controller/kube_client.hpp"
#include "controller/reconciler.hpp"
#include "net/http_client.hpp"
#include "net/http_message.hpp"
#include "net/http_server.hpp"

namespace kuberde::controller {

int scale_up_http_status(ScaleUpAnswer answer) {
  switch (answer) {
    case ScaleUpAnswer::Accepted:
      return 202;
    case ScaleUpAnswer::AlreadyRunning:
      return 200;
    case ScaleUpAnswer::Unknown:
      return 404;
    case ScaleUpAnswer::NotReady:
      return 503;
  }
  return 500;
}

// ============================================================================
// Controller::Impl
// ============================================================================

class Controller::Impl {
 public:
  Impl(ControllerConfig config, std::shared_ptr<ClusterClient> cluster, std::shared_ptr<RelayClient> relay)
      : config_(std::move(config)), cluster_(std::move(cluster)), relay_(std::move(relay)), authorizer_(config_.auth.admin_roles) {}

  ~Impl() {
    stop();
  }

  Status start();
  void stop();
  void wait();

  ScaleUpAnswer request_scale_up(const std::string& identity);
  void trigger_pass();

  struct Known {
    std::string name;
    Phase phase = Phase::Pending;
  };

  ControllerConfig config_;
  asio::io_context io_ctx_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;

  std::shared_ptr<net::HttpClient> kube_http_;
  std::shared_ptr<net::HttpClient> http_client_;
  std::shared_ptr<ClusterClient> cluster_;
  std::shared_ptr<RelayClient> relay_;
  std::unique_ptr<auth::TokenRefresher> refresher_;
  std::unique_ptr<auth::TokenIssuer> issuer_;
  std::shared_ptr<auth::TokenVerifier> verifier_;
  auth::Authorizer authorizer_;
  std::unique_ptr<Reconciler> reconciler_;
  std::shared_ptr<net::HttpServer> health_;
  std::thread loop_thread_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  std::set<std::string> queued_;
  std::map<std::string, Known> known_;  // identity -> workload, refreshed every pass
  bool pass_requested_ = false;
  bool running_ = false;
  bool stopped_ = false;
  std::atomic<bool> ready_{false};
  std::atomic<bool> live_{true};

 private:
  Status setup_credentials();
  Status setup_clients();
  void install_routes();
  std::string relay_token() const;

  void run_loop();
  void run_pass();
  void remember(const ReconcileReport& report);

  void handle_scale_up(const net::HttpRequest& req, net::Responder respond);
};

Status Controller::Impl::setup_credentials() {
  auto keys = auth::load_key_set(config_.auth);
  if (keys.ok()) {
    verifier_ = std::make_shared<auth::TokenVerifier>(*keys.value, auth::verifier_options(config_.auth));
  } else {
    spdlog::warn("No verification keys configured, /scale-up accepts unauthenticated calls");
  }
  if (!config_.auth.signing_key.empty()) {
    issuer_ = std::make_unique<auth::TokenIssuer>(config_.auth, nullptr);
  }

  bool has_source = !config_.static_token.empty() || (!config_.token_url.empty() && !config_.client_id.empty());
  if (!has_source) {
    if (!issuer_) spdlog::warn("No relay credential configured, management calls are unauthenticated");
    return Status::success();
  }

  auto source = auth::make_credential_source(http_client_, config_.token_url, config_.client_id, config_.client_secret, config_.static_token);
  if (!source.ok()) return source.status;

  refresher_ = std::make_unique<auth::TokenRefresher>(*source.value, config_.refresh_fraction, config_.refresh_retry);
  auto status = refresher_->fetch_initial();
  if (!status.ok()) return status;
  refresher_->start(
      [](const auth::Credential& credential) {
        auto valid = std::chrono::duration_cast<std::chrono::seconds>(credential.expiry - credential.issued_at);
        spdlog::debug("Relay credential renewed, valid for {}s", valid.count());
      },
      [this](const Status& failure) {
        spdlog::critical("Relay credential refresh exhausted: {}", failure.to_string());
        live_ = false;
      });
  return Status::success();
}

std::string Controller::Impl::relay_token() const {
  if (refresher_) return refresher_->token();
  if (issuer_) {
    auth::Claims claims;
    claims.subject = "system:kuberde-operator";
    claims.username = "kuberde-operator";
    claims.roles = {"system"};
    return issuer_->mint(claims, std::chrono::seconds(300)).access_token;
  }
  return {};
}

Status Controller::Impl::setup_clients() {
  if (!relay_) {
    if (config_.relay_url.empty()) {
      return Status::failure(ErrorCode::InvalidArgument, "relay_url is not set (KUBERDE_RELAY_URL)");
    }
    relay_ = std::make_shared<HttpRelayClient>(http_client_, config_.relay_url, [this] { return relay_token(); }, config_.request_timeout);
  }
  if (!cluster_) {
    if (config_.kube_api_url.empty()) {
      return Status::failure(ErrorCode::InvalidArgument, "kube_api_url is not set and KUBERNETES_SERVICE_HOST is missing");
    }
    net::TlsOptions tls;
    tls.ca_file = config_.ca_file;
    tls.insecure_skip_verify = config_.insecure_skip_verify;
    kube_http_ = std::make_shared<net::HttpClient>(io_ctx_, tls);
    cluster_ = std::make_shared<KubeClient>(kube_http_, config_.kube_api_url, config_.watch_namespace, config_.token_file, config_.request_timeout);
  }
  return Status::success();
}

Status Controller::Impl::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return Status::failure(ErrorCode::InvalidArgument, "controller already started");
    running_ = true;
    stopped_ = false;
  }

  io_ctx_.restart();
  work_.emplace(io_ctx_.get_executor());
  io_thread_ = std::thread([this] { io_ctx_.run(); });
  http_client_ = std::make_shared<net::HttpClient>(io_ctx_);

  auto status = setup_credentials();
  if (status.ok()) status = setup_clients();
  if (!status.ok()) {
    spdlog::error("Controller setup failed: {}", status.to_string());
    stop();
    return status;
  }

  reconciler_ = std::make_unique<Reconciler>(*cluster_, *relay_, config_, nullptr);

  health_ = std::make_shared<net::HttpServer>(io_ctx_);
  install_routes();
  status = health_->listen(config_.health_address, config_.health_port);
  if (!status.ok()) {
    spdlog::error("Health listener on {}:{} failed: {}", config_.health_address, config_.health_port, status.message);
    stop();
    return status;
  }

  loop_thread_ = std::thread([this] { run_loop(); });
  spdlog::info("kuberde-operator watching namespace {} (relay {}, interval {}ms, health port {})", config_.watch_namespace, config_.relay_url,
               config_.reconcile_interval.count(), health_->port());
  return Status::success();
}

void Controller::Impl::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    running_ = false;
  }
  cv_.notify_all();
  if (reconciler_) reconciler_->cancel();
  if (loop_thread_.joinable()) loop_thread_.join();
  if (refresher_) refresher_->stop();
  if (health_) health_->stop();

  work_.reset();
  io_ctx_.stop();
  if (io_thread_.joinable()) io_thread_.join();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
  spdlog::info("kuberde-operator stopped");
}

void Controller::Impl::wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return stopped_; });
}

// ============================================================================
// Reconcile thread
// ============================================================================

void Controller::Impl::run_loop() {
  auto next_pass = std::chrono::steady_clock::now();
  while (true) {
    std::string scale_up;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait_until(lock, next_pass, [this] { return !running_ || !queue_.empty() || pass_requested_; });
      if (!running_) break;
      if (!queue_.empty()) {
        scale_up = queue_.front();
        queue_.pop_front();
        queued_.erase(scale_up);
      } else {
        pass_requested_ = false;
        next_pass = std::chrono::steady_clock::now() + config_.reconcile_interval;
      }
    }

    if (!scale_up.empty()) {
      auto report = reconciler_->scale_up(scale_up);
      if (!report.status.ok()) spdlog::warn("[{}] scale-up failed: {}", report.identity, report.status.to_string());
      remember(report);
    } else {
      run_pass();
    }
  }
}

void Controller::Impl::run_pass() {
  auto reports = reconciler_->reconcile_all();
  if (!reports.ok()) {
    spdlog::warn("Listing {} failed: {}", kResourcePlural, reports.status.to_string());
    return;
  }

  std::map<std::string, Known> known;
  for (const auto& report : *reports.value) {
    if (!report.deleted && !report.identity.empty()) known[report.identity] = Known{report.name, report.phase};
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    known_ = std::move(known);
  }
  if (!ready_.exchange(true)) spdlog::info("First reconcile pass done, {} workload(s)", reports.value->size());
}

void Controller::Impl::remember(const ReconcileReport& report) {
  if (report.identity.empty()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  if (report.deleted) {
    known_.erase(report.identity);
  } else {
    known_[report.identity] = Known{report.name, report.phase};
  }
}

void Controller::Impl::trigger_pass() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pass_requested_ = true;
  }
  cv_.notify_all();
}

ScaleUpAnswer Controller::Impl::request_scale_up(const std::string& identity) {
  if (!ready_) return ScaleUpAnswer::NotReady;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = known_.find(identity);
    if (it == known_.end()) return ScaleUpAnswer::Unknown;
    if (it->second.phase == Phase::Ready) return ScaleUpAnswer::AlreadyRunning;
    // Duplicate signals collapse into the queued entry
    if (queued_.insert(it->second.name).second) queue_.push_back(it->second.name);
  }
  cv_.notify_all();
  return ScaleUpAnswer::Accepted;
}

// ============================================================================
// Health server
// ============================================================================

void Controller::Impl::install_routes() {
  health_->handle("GET", "/healthz", [this](const net::HttpRequest&, net::Responder respond) {
    respond(net::HttpReply::json_body(live_ ? 200 : 503, json{{"status", live_ ? "ok" : "credential refresh failed"}}));
  });
  health_->handle("GET", "/livez", [this](const net::HttpRequest&, net::Responder respond) {
    respond(net::HttpReply::json_body(live_ ? 200 : 503, json{{"status", live_ ? "ok" : "credential refresh failed"}}));
  });
  health_->handle("GET", "/readyz", [this](const net::HttpRequest&, net::Responder respond) {
    if (!ready_) {
      respond(net::HttpReply::json_body(503, json{{"status", "not ready"}}));
      return;
    }
    size_t count;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      count = known_.size();
    }
    respond(net::HttpReply::json_body(200, json{{"status", "ready"}, {"workloads", count}}));
  });
  health_->handle("POST", "/scale-up", [this](const net::HttpRequest& req, net::Responder respond) { handle_scale_up(req, std::move(respond)); });
}

void Controller::Impl::handle_scale_up(const net::HttpRequest& req, net::Responder respond) {
  if (verifier_) {
    auto claims = verifier_->verify(req.bearer_token());
    if (!claims.ok()) {
      respond(net::HttpReply::error(claims.status));
      return;
    }
    auto allowed = authorizer_.require_admin(*claims.value);
    if (!allowed.ok()) {
      respond(net::HttpReply::error(allowed));
      return;
    }
  }

  auto body = json::parse(req.body, nullptr, false);
  if (body.is_discarded() || !body.is_object() || !body.contains("agentID") || !body["agentID"].is_string()) {
    respond(net::HttpReply::error(Status::failure(ErrorCode::InvalidArgument, "body must be {\"agentID\": ...}")));
    return;
  }
  std::string identity = body["agentID"].get<std::string>();
  std::string key = body.value("key", "");

  auto answer = request_scale_up(identity);
  static const char* kAnswers[] = {"accepted", "running", "unknown", "not ready"};
  spdlog::info("[{}] scale-up signal for {}: {}", identity, key.empty() ? "-" : key, kAnswers[static_cast<int>(answer)]);
  respond(net::HttpReply::json_body(scale_up_http_status(answer), json{{"agentID", identity}, {"status", kAnswers[static_cast<int>(answer)]}}));
}

// ============================================================================
// Controller
// ============================================================================

Controller::Controller(ControllerConfig config, std::shared_ptr<ClusterClient> cluster, std::shared_ptr<RelayClient> relay)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(cluster), std::move(relay))) {}

Controller::~Controller() = default;

Status Controller::start() {
  return impl_->start();
}

void Controller::stop() {
  impl_->stop();
}

void Controller::wait() {
  impl_->wait();
}

uint16_t Controller::health_port() const {
  return impl_->health_ ? impl_->health_->port() : 0;
}

bool Controller::ready() const {
  return impl_->ready_;
}

ScaleUpAnswer Controller::request_scale_up(const std::string& identity) {
  return impl_->request_scale_up(identity);
}

void Controller::trigger_pass() {
  impl_->trigger_pass();
}

}  // namespace kuberde::controller
