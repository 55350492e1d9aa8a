#include "relay/relay_server.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "auth/authorizer.hpp"
#include "auth/issuer.hpp"
#include "auth/login_flow.hpp"
#include "auth/session_store.hpp"
#include "auth/verifier.hpp"
#include "core/encoding.hpp"
#include "core/identity.hpp"
#include "core/time_util.hpp"
#include "core/uuid.hpp"
#include "mux/session.hpp"
#include "mux/stream.hpp"
#include "net/http_client.hpp"
#include "net/http_message.hpp"
#include "net/http_server.hpp"
#include "relay/mgmt_api.hpp"
#include "relay/scale_up_notifier.hpp"
#include "relay/tcp_listener.hpp"
#include "tunnel/bridge.hpp"
#include "tunnel/handshake.hpp"

namespace kuberde::relay {

namespace {

using Socket = asio::ip::tcp::socket;

const std::string kConnectPrefix = "/connect/";
constexpr size_t kControlLineMax = 8192;

void close_socket(const std::shared_ptr<Socket>& socket) {
  asio::error_code ignored;
  socket->shutdown(Socket::shutdown_both, ignored);
  socket->close(ignored);
}

// Writes a complete reply on a taken-over connection, then closes it
void reply_and_close(const std::shared_ptr<Socket>& socket, const net::HttpReply& reply) {
  auto buffer = std::make_shared<std::string>(reply.serialize());
  asio::async_write(*socket, asio::buffer(*buffer), [socket, buffer](const asio::error_code&, size_t) { close_socket(socket); });
}

std::string host_of(const std::string& url) {
  auto parsed = net::ParsedUrl::parse(url);
  return parsed ? net::to_lower(parsed->host) : std::string();
}

std::string trim_slash(std::string url) {
  while (!url.empty() && url.back() == '/') url.pop_back();
  return url;
}

// Credential of a browser or CLI request: session cookie first, then bearer
std::string request_token(const net::HttpRequest& req, const std::string& cookie_name) {
  auto cookie = req.cookie(cookie_name);
  if (cookie && !cookie->empty()) return *cookie;
  return req.bearer_token();
}

}  // namespace

// ============================================================================
// RelayServer::Impl
// ============================================================================

class RelayServer::Impl {
 public:
  explicit Impl(ServerConfig config)
      : config_(std::move(config)),
        routes_(route_options(config_)),
        session_store_(std::make_shared<auth::SessionStore>()),
        authorizer_(config_.auth.admin_roles),
        issuer_(config_.auth, session_store_),
        login_(config_.auth.oidc),
        sweep_timer_(io_ctx_),
        public_host_(host_of(config_.public_url)) {}

  ~Impl() {
    stop();
  }

  Status start();
  void stop();
  void wait();

  Result<RegisterOutcome> register_route(const RouteSpec& route);
  Status deregister_route(const RouteKey& key, bool idle);

  uint16_t http_port() const {
    return http_ ? http_->port() : 0;
  }

  ServerConfig config_;
  asio::io_context io_ctx_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::vector<std::thread> threads_;

  RouteTable routes_;
  SessionRegistry sessions_;
  std::shared_ptr<auth::SessionStore> session_store_;
  std::shared_ptr<auth::TokenVerifier> verifier_;
  auth::Authorizer authorizer_;
  auth::TokenIssuer issuer_;
  auth::LoginFlow login_;

  std::shared_ptr<net::HttpClient> http_client_;
  std::shared_ptr<net::HttpServer> http_;
  std::unique_ptr<TcpListenerSet> listeners_;
  std::unique_ptr<ScaleUpNotifier> notifier_;
  std::unique_ptr<ManagementApi> mgmt_;
  asio::steady_timer sweep_timer_;
  std::string public_host_;

  std::mutex state_mutex_;
  std::condition_variable state_cv_;
  bool running_ = false;
  bool stopped_ = false;

 private:
  struct Target {
    std::string identity;
    std::shared_ptr<mux::MuxSession> session;
  };

  static RouteTableOptions route_options(const ServerConfig& config);

  Status load_keys();
  void install_routes();
  std::string system_token() const;

  // Tunnel side
  void handle_agent(const net::HttpRequest& req, std::shared_ptr<Socket> socket, std::string leftover);
  void admit_session(const std::string& identity, const auth::Claims& claims, std::shared_ptr<Socket> socket, std::string leftover);
  void handle_control_stream(const std::string& identity, const std::weak_ptr<mux::MuxSession>& session, std::shared_ptr<mux::MuxStream> stream);

  // Client side
  void handle_user_connect(const net::HttpRequest& req, std::shared_ptr<Socket> socket, std::string leftover);
  void handle_http_proxy(const net::HttpRequest& req, std::shared_ptr<Socket> socket, const std::string& raw_head, const std::string& leftover);
  void handle_tcp(std::shared_ptr<Socket> socket, uint16_t port);
  bool is_agent_host(const net::HttpRequest& req) const;
  Result<Target> select_target(const RouteLookup& lookup, const std::string& label);
  void bridge(std::shared_ptr<Socket> socket, const Target& target, const std::string& service, std::string initial, const std::string& label);

  // /auth/*
  void handle_token(const net::HttpRequest& req, net::Responder respond);
  void handle_login(const net::HttpRequest& req, net::Responder respond);
  void handle_callback(const net::HttpRequest& req, net::Responder respond);
  void handle_logout(const net::HttpRequest& req, net::Responder respond);
  void handle_refresh(const net::HttpRequest& req, net::Responder respond);
  void handle_me(const net::HttpRequest& req, net::Responder respond);
  std::string session_cookie(const std::string& value, std::chrono::seconds max_age) const;
  std::string safe_return_to(const std::string& target) const;
  std::string login_url_for(const net::HttpRequest& req) const;

  void schedule_sweep();
  void sweep();
};

RouteTableOptions RelayServer::Impl::route_options(const ServerConfig& config) {
  RouteTableOptions options;
  options.tcp_port_min = config.tcp_port_min;
  options.tcp_port_max = config.tcp_port_max;
  options.reserved_ports.insert(config.http_port);
  options.agent_domain = config.agent_domain;
  options.derive_default_routes = config.derive_default_routes;
  return options;
}

// ============================================================================
// Lifecycle
// ============================================================================

Status RelayServer::Impl::load_keys() {
  auto keys = auth::load_key_set(config_.auth);
  std::shared_ptr<auth::KeySet> key_set;
  if (keys.ok()) {
    key_set = *keys.value;
  } else if (!config_.auth.jwks_url.empty()) {
    key_set = std::make_shared<auth::KeySet>();
  } else {
    return keys.status;
  }

  if (!config_.auth.jwks_url.empty()) {
    net::HttpOptions opts;
    opts.timeout = std::chrono::milliseconds(10000);
    opts.max_retries = 2;
    auto response = http_client_->request(config_.auth.jwks_url, opts).get();
    if (!response.ok()) {
      return Status::failure(ErrorCode::Unavailable, "fetching JWKS from " + config_.auth.jwks_url + " failed: " +
                                                         (response.error.empty() ? std::to_string(response.status_code) : response.error));
    }
    try {
      auto loaded = key_set->load_jwks(json::parse(response.body));
      if (!loaded.ok()) return loaded;
    } catch (const json::exception& e) {
      return Status::failure(ErrorCode::InvalidArgument, std::string("JWKS is not valid JSON: ") + e.what());
    }
    spdlog::info("Loaded {} signing key(s) from {}", key_set->rsa_key_count(), config_.auth.jwks_url);
  }

  verifier_ = std::make_shared<auth::TokenVerifier>(key_set, auth::verifier_options(config_.auth), session_store_);
  return Status::success();
}

Status RelayServer::Impl::start() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (running_) return Status::failure(ErrorCode::InvalidArgument, "server already started");
    running_ = true;
    stopped_ = false;
  }

  io_ctx_.restart();
  work_.emplace(io_ctx_.get_executor());
  int thread_count = std::max(1, config_.io_threads);
  for (int i = 0; i < thread_count; ++i) {
    threads_.emplace_back([this] { io_ctx_.run(); });
  }

  http_client_ = std::make_shared<net::HttpClient>(io_ctx_);

  auto status = load_keys();
  if (!status.ok()) {
    spdlog::error("Auth setup failed: {}", status.to_string());
    stop();
    return status;
  }

  notifier_ = std::make_unique<ScaleUpNotifier>(http_client_, config_.controller_url, config_.scale_up_cooldown, [this] { return system_token(); });
  listeners_ = std::make_unique<TcpListenerSet>(io_ctx_, config_.listen_address,
                                                [this](std::shared_ptr<Socket> socket, uint16_t port) { handle_tcp(std::move(socket), port); });

  RouteHooks hooks;
  hooks.on_registered = [this](const RouteSpec& route) {
    return route.key.kind == RouteKind::Tcp ? listeners_->open(route.key.port) : Status::success();
  };
  hooks.on_deregistered = [this](const RouteKey& key, bool) {
    // An idle marker keeps the port, so the next hit can trigger a scale-up
    if (key.kind == RouteKind::Tcp && !routes_.has_tcp_port(key.port)) listeners_->close(key.port);
  };
  hooks.ready = [this] {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return running_;
  };
  mgmt_ = std::make_unique<ManagementApi>(routes_, sessions_, *verifier_, authorizer_, std::move(hooks));

  net::HttpServerOptions http_options;
  http_options.read_timeout = config_.handshake_timeout;
  http_ = std::make_shared<net::HttpServer>(io_ctx_, http_options);
  install_routes();

  status = http_->listen(config_.listen_address, config_.http_port);
  if (!status.ok()) {
    spdlog::error("HTTP listener on {}:{} failed: {}", config_.listen_address, config_.http_port, status.message);
    stop();
    return status;
  }

  asio::post(io_ctx_, [this] { schedule_sweep(); });
  spdlog::info("kuberde-server listening on {}:{} (tunnel path {}, TCP ports {}-{})", config_.listen_address, http_->port(), config_.tunnel_path,
               config_.tcp_port_min, config_.tcp_port_max);
  return Status::success();
}

void RelayServer::Impl::stop() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!running_) return;
    running_ = false;
  }

  spdlog::info("kuberde-server shutting down");
  if (http_) http_->stop();
  if (listeners_) listeners_->close_all();
  for (auto& session : sessions_.live_sessions()) {
    session->close("server shutting down");
  }

  work_.reset();
  io_ctx_.stop();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  sweep_timer_.cancel();

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    stopped_ = true;
  }
  state_cv_.notify_all();
}

void RelayServer::Impl::wait() {
  std::unique_lock<std::mutex> lock(state_mutex_);
  state_cv_.wait(lock, [this] { return stopped_; });
}

Result<RegisterOutcome> RelayServer::Impl::register_route(const RouteSpec& route) {
  auto previous = routes_.lookup(route.key);
  auto outcome = routes_.register_route(route);
  if (!outcome.ok() || *outcome.value != RegisterOutcome::Created || route.key.kind != RouteKind::Tcp || !listeners_) {
    return outcome;
  }
  auto opened = listeners_->open(route.key.port);
  if (!opened.ok()) {
    auto undo = routes_.deregister_route(route.key, previous.ok() && previous.value->idle);
    if (!undo.ok()) spdlog::error("[{}] rollback of {} failed: {}", route.agent_id, route.key.to_string(), undo.to_string());
    return Result<RegisterOutcome>::failure(opened);
  }
  return outcome;
}

Status RelayServer::Impl::deregister_route(const RouteKey& key, bool idle) {
  auto status = routes_.deregister_route(key, idle);
  if (status.ok() && key.kind == RouteKind::Tcp && listeners_ && !routes_.has_tcp_port(key.port)) {
    listeners_->close(key.port);
  }
  return status;
}

std::string RelayServer::Impl::system_token() const {
  if (!issuer_.enabled()) return {};
  auth::Claims claims;
  claims.subject = "system:kuberde-server";
  claims.username = "kuberde-server";
  claims.roles = {"system"};
  return issuer_.mint(claims, std::chrono::seconds(300)).access_token;
}

void RelayServer::Impl::install_routes() {
  http_->takeover([this](const net::HttpRequest& req) { return req.path == config_.tunnel_path && req.is_upgrade(); },
                  [this](net::HttpRequest req, std::shared_ptr<Socket> socket, std::string, std::string leftover) {
                    handle_agent(req, std::move(socket), std::move(leftover));
                  });
  http_->takeover([](const net::HttpRequest& req) { return req.path.compare(0, kConnectPrefix.size(), kConnectPrefix) == 0 && req.is_upgrade(); },
                  [this](net::HttpRequest req, std::shared_ptr<Socket> socket, std::string, std::string leftover) {
                    handle_user_connect(req, std::move(socket), std::move(leftover));
                  });
  http_->takeover([this](const net::HttpRequest& req) { return is_agent_host(req); },
                  [this](net::HttpRequest req, std::shared_ptr<Socket> socket, std::string raw_head, std::string leftover) {
                    handle_http_proxy(req, std::move(socket), raw_head, leftover);
                  });

  mgmt_->install(*http_);

  auto bind = [this](void (Impl::*method)(const net::HttpRequest&, net::Responder)) {
    return [this, method](const net::HttpRequest& req, net::Responder respond) { (this->*method)(req, std::move(respond)); };
  };
  http_->handle("POST", "/auth/token", bind(&Impl::handle_token));
  http_->handle("GET", "/auth/login", bind(&Impl::handle_login));
  http_->handle("GET", "/auth/callback", bind(&Impl::handle_callback));
  http_->handle("*", "/auth/logout", bind(&Impl::handle_logout));
  http_->handle("POST", "/auth/refresh", bind(&Impl::handle_refresh));
  http_->handle("GET", "/auth/me", bind(&Impl::handle_me));
}

// ============================================================================
// Agent tunnel
// ============================================================================

void RelayServer::Impl::handle_agent(const net::HttpRequest& req, std::shared_ptr<Socket> socket, std::string leftover) {
  std::string identity = req.query_param("id").value_or("");
  if (!is_valid_identity(identity)) {
    spdlog::warn("Tunnel request from {} without a valid agent id ('{}')", req.remote_address, identity);
    reply_and_close(socket, net::HttpReply::error(Status::failure(ErrorCode::InvalidArgument, "missing or malformed agent id")));
    return;
  }

  auto claims = verifier_->verify(req.bearer_token());
  if (!claims.ok()) {
    spdlog::warn("[{}] tunnel from {} rejected: {}", identity, req.remote_address, claims.status.to_string());
    reply_and_close(socket, net::HttpReply::error(claims.status));
    return;
  }
  auto allowed = authorizer_.authorize_agent(*claims.value, identity);
  if (!allowed.ok()) {
    spdlog::warn("[{}] tunnel from {} rejected: {}", identity, req.remote_address, allowed.to_string());
    reply_and_close(socket, net::HttpReply::error(allowed));
    return;
  }

  auto response = std::make_shared<std::string>(tunnel::build_upgrade_response());
  auth::Claims admitted = *claims.value;
  asio::async_write(*socket, asio::buffer(*response),
                    [this, socket, response, identity, admitted, leftover = std::move(leftover)](const asio::error_code& ec, size_t) mutable {
                      if (ec) {
                        spdlog::warn("[{}] writing upgrade response failed: {}", identity, ec.message());
                        close_socket(socket);
                        return;
                      }
                      admit_session(identity, admitted, socket, std::move(leftover));
                    });
}

void RelayServer::Impl::admit_session(const std::string& identity, const auth::Claims& claims, std::shared_ptr<Socket> socket,
                                      std::string leftover) {
  mux::SessionOptions options;
  options.keepalive_interval = config_.keepalive_interval;
  options.keepalive_timeout = config_.keepalive_timeout;
  options.name = identity;
  auto session = mux::MuxSession::create(std::move(*socket), mux::Role::Server, options, std::move(leftover));

  auto previous = sessions_.admit(identity, session, claims.name(), claims.expiry);
  if (previous) {
    spdlog::info("[{}] superseding session {} from {}", identity, previous->id(), previous->remote_address());
    previous->close("superseded");
  }
  spdlog::info("[{}] agent connected from {} (session {}, subject {})", identity, session->remote_address(), session->id(), claims.name());

  std::weak_ptr<mux::MuxSession> weak = session;
  uint64_t session_id = session->id();
  session->start([this, identity, weak](std::shared_ptr<mux::MuxStream> stream) { handle_control_stream(identity, weak, std::move(stream)); },
                 [this, identity, session_id](const std::string& reason) {
                   if (sessions_.remove(identity, session_id)) {
                     spdlog::info("[{}] agent disconnected: {}", identity, reason);
                   } else {
                     spdlog::debug("[{}] session {} closed: {}", identity, session_id, reason);
                   }
                 });
}

// Agent-opened streams carry "AUTH <token>\n" credential swaps
void RelayServer::Impl::handle_control_stream(const std::string& identity, const std::weak_ptr<mux::MuxSession>& session,
                                              std::shared_ptr<mux::MuxStream> stream) {
  tunnel::PreambleOptions options;
  options.max_bytes = kControlLineMax;
  options.timeout = config_.preamble_timeout;
  tunnel::read_preamble(stream, io_ctx_.get_executor(), options, [this, identity, session, stream](Result<std::string> line, std::string) {
    if (!line.ok()) {
      spdlog::debug("[{}] control stream dropped: {}", identity, line.status.message);
      return;
    }

    std::string reply;
    auto token = tunnel::parse_auth_line(*line.value);
    if (!token.ok()) {
      reply = "ERR " + token.status.message + "\n";
    } else {
      auto claims = verifier_->verify(*token.value);
      Status allowed = claims.ok() ? authorizer_.authorize_agent(*claims.value, identity) : claims.status;
      auto live = session.lock();
      if (!allowed.ok()) {
        reply = "ERR " + allowed.message + "\n";
      } else if (!live || !sessions_.update_credential(identity, live->id(), claims.value->expiry)) {
        reply = "ERR session is no longer current\n";
      } else {
        reply = "OK\n";
        spdlog::info("[{}] credential refreshed, valid until {}", identity, to_unix_seconds(claims.value->expiry));
      }
    }
    if (reply != "OK\n") spdlog::warn("[{}] credential refresh rejected: {}", identity, reply.substr(4, reply.size() - 5));

    stream->async_write(reply, [stream](const asio::error_code&, size_t) { stream->close(); });
  });
}

// ============================================================================
// Inbound connections
// ============================================================================

Result<RelayServer::Impl::Target> RelayServer::Impl::select_target(const RouteLookup& lookup, const std::string& label) {
  const auto& route = lookup.route;
  if (lookup.idle) {
    notifier_->notify(route.owner_workload(), label);
    return Result<Target>::failure(ErrorCode::AgentUnavailable, route.owner_workload() + " is scaled down, waking it up");
  }

  auto found = sessions_.find_any(session_candidates(route));
  if (!found.second) {
    if (lookup.derived) notifier_->notify(route.owner_workload(), label);
    return Result<Target>::failure(ErrorCode::AgentUnavailable, "no live session for " + route.agent_id);
  }
  return Result<Target>::success(Target{found.first, found.second});
}

void RelayServer::Impl::bridge(std::shared_ptr<Socket> socket, const Target& target, const std::string& service, std::string initial,
                               const std::string& label) {
  auto stream = target.session->open_stream();
  if (!stream) {
    spdlog::warn("[{}] {}: session closed before the stream could be opened", target.identity, label);
    close_socket(socket);
    return;
  }
  sessions_.connection_opened(target.identity);

  tunnel::BridgeOptions options;
  options.idle_timeout = config_.bridge_idle_timeout;
  options.half_close_linger = config_.half_close_linger;
  options.name = target.identity + " " + label;

  std::string identity = target.identity;
  auto pipe = tunnel::Bridge::create(std::move(socket), std::move(stream), options, [this, identity](const tunnel::BridgeStats& stats) {
    sessions_.connection_closed(identity, stats.bytes_to_stream, stats.bytes_to_socket);
  });
  pipe->start(service + "\n" + initial);
}

void RelayServer::Impl::handle_tcp(std::shared_ptr<Socket> socket, uint16_t port) {
  std::string label = "tcp:" + std::to_string(port);
  auto found = routes_.lookup(RouteKey::tcp(port));
  if (!found.ok()) {
    spdlog::info("[{}] {}", label, found.status.to_string());
    close_socket(socket);
    return;
  }

  auto target = select_target(*found.value, label);
  if (!target.ok()) {
    spdlog::info("[{}] {}", label, target.status.to_string());
    close_socket(socket);
    return;
  }
  bridge(std::move(socket), *target.value, found.value->route.service, {}, UUID::short_id(label));
}

void RelayServer::Impl::handle_user_connect(const net::HttpRequest& req, std::shared_ptr<Socket> socket, std::string leftover) {
  std::string identity = req.path.substr(kConnectPrefix.size());
  std::string service = req.query_param("service").value_or("ssh");
  if (!is_valid_identity(identity) || !is_dns_label(service)) {
    reply_and_close(socket, net::HttpReply::error(Status::failure(ErrorCode::InvalidArgument, "malformed agent id or service")));
    return;
  }

  auto claims = verifier_->verify(request_token(req, config_.auth.cookie_name));
  if (!claims.ok()) {
    reply_and_close(socket, net::HttpReply::error(claims.status));
    return;
  }
  auto allowed = authorizer_.authorize(*claims.value, identity);
  if (!allowed.ok()) {
    spdlog::warn("[{}] connect by {} denied: {}", identity, claims.value->name(), allowed.message);
    reply_and_close(socket, net::HttpReply::error(allowed));
    return;
  }

  std::string workload = strip_service_suffix(identity, service);
  auto found = sessions_.find_any({identity, workload});
  if (!found.second) {
    notifier_->notify(workload, "connect:" + service);
    auto reply = net::HttpReply::error(Status::failure(ErrorCode::AgentUnavailable, "agent " + identity + " is not connected"));
    reply.set_header("Retry-After", "5");
    reply_and_close(socket, reply);
    return;
  }

  Target target{found.first, found.second};
  auto response = std::make_shared<std::string>(tunnel::build_upgrade_response());
  std::string user = claims.value->name();
  asio::async_write(*socket, asio::buffer(*response),
                    [this, socket, response, target, service, user, leftover = std::move(leftover)](const asio::error_code& ec, size_t) mutable {
                      if (ec) {
                        close_socket(socket);
                        return;
                      }
                      spdlog::info("[{}] {} connected to {}", target.identity, user, service);
                      bridge(socket, target, service, std::move(leftover), UUID::short_id("connect"));
                    });
}

bool RelayServer::Impl::is_agent_host(const net::HttpRequest& req) const {
  std::string host = net::to_lower(req.host());
  if (host.empty() || host == public_host_) return false;
  return !routes_.host_prefix(host).empty();
}

void RelayServer::Impl::handle_http_proxy(const net::HttpRequest& req, std::shared_ptr<Socket> socket, const std::string& raw_head,
                                          const std::string& leftover) {
  auto found = routes_.resolve_host(req.host());
  if (!found.ok()) {
    reply_and_close(socket, net::HttpReply::error(found.status));
    return;
  }
  const auto& route = found.value->route;

  if (config_.require_browser_auth) {
    auto claims = verifier_->verify(request_token(req, config_.auth.cookie_name));
    if (!claims.ok()) {
      if (login_.enabled() && !config_.public_url.empty() && req.method == "GET") {
        reply_and_close(socket, net::HttpReply::redirect(login_url_for(req)));
      } else {
        reply_and_close(socket, net::HttpReply::error(claims.status));
      }
      return;
    }
    auto allowed = authorizer_.authorize(*claims.value, route.owner_workload());
    if (!allowed.ok()) {
      spdlog::warn("[{}] browser access by {} denied: {}", route.agent_id, claims.value->name(), allowed.message);
      reply_and_close(socket, net::HttpReply::error(allowed));
      return;
    }
  }

  std::string label = "http:" + route.key.hostname_prefix;
  auto target = select_target(*found.value, label);
  if (!target.ok()) {
    auto reply = net::HttpReply::error(target.status);
    if (found.value->idle || found.value->derived) reply.set_header("Retry-After", "5");
    reply_and_close(socket, reply);
    return;
  }
  bridge(std::move(socket), *target.value, route.service, raw_head + leftover, UUID::short_id("http"));
}

// ============================================================================
// /auth endpoints
// ============================================================================

std::string RelayServer::Impl::session_cookie(const std::string& value, std::chrono::seconds max_age) const {
  std::string cookie = config_.auth.cookie_name + "=" + value + "; Path=/; HttpOnly; SameSite=Lax; Max-Age=" + std::to_string(max_age.count());
  if (!config_.agent_domain.empty()) cookie += "; Domain=." + config_.agent_domain;
  if (config_.auth.secure_cookie) cookie += "; Secure";
  return cookie;
}

// Only local paths, the public host and agent hosts are valid redirect targets
std::string RelayServer::Impl::safe_return_to(const std::string& target) const {
  if (target.empty()) return "/";
  if (target[0] == '/') return target.compare(0, 2, "//") == 0 ? "/" : target;

  auto parsed = net::ParsedUrl::parse(target);
  if (!parsed) return "/";
  std::string host = net::to_lower(parsed->host);
  if (host == public_host_) return target;
  if (!config_.agent_domain.empty() && host.size() > config_.agent_domain.size() &&
      host.compare(host.size() - config_.agent_domain.size() - 1, std::string::npos, "." + config_.agent_domain) == 0) {
    return target;
  }
  return "/";
}

std::string RelayServer::Impl::login_url_for(const net::HttpRequest& req) const {
  std::string scheme = config_.auth.secure_cookie ? "https" : "http";
  std::string original = scheme + "://" + req.header("host") + req.target;
  return trim_slash(config_.public_url) + "/auth/login?return_to=" + net::url_encode(original);
}

void RelayServer::Impl::handle_token(const net::HttpRequest& req, net::Responder respond) {
  auto form = req.form();
  if (form["grant_type"] != "client_credentials") {
    respond(net::HttpReply::json_body(400, json{{"error", "unsupported_grant_type"}}));
    return;
  }

  std::string client_id = form["client_id"];
  std::string client_secret = form["client_secret"];
  std::string authorization = req.header("authorization");
  if (authorization.compare(0, 6, "Basic ") == 0) {
    auto decoded = base64url_decode(authorization.substr(6));
    auto colon = decoded ? decoded->find(':') : std::string::npos;
    if (colon != std::string::npos) {
      client_id = net::url_decode(decoded->substr(0, colon));
      client_secret = net::url_decode(decoded->substr(colon + 1));
    }
  }

  auto issued = issuer_.client_credentials(client_id, client_secret);
  if (!issued.ok()) {
    spdlog::warn("Token request for client '{}' from {} rejected: {}", client_id, req.remote_address, issued.status.message);
    int status = issued.status.code == ErrorCode::Unauthorized ? 401 : http_status_for(issued.status.code);
    respond(net::HttpReply::json_body(status, json{{"error", "invalid_client"}, {"error_description", issued.status.message}}));
    return;
  }
  respond(net::HttpReply::json_body(200, issued.value->to_json()));
}

void RelayServer::Impl::handle_login(const net::HttpRequest& req, net::Responder respond) {
  if (!login_.enabled()) {
    respond(net::HttpReply::error(Status::failure(ErrorCode::Unavailable, "interactive login is not configured")));
    return;
  }
  std::string return_to = safe_return_to(req.query_param("return_to").value_or("/"));
  respond(net::HttpReply::redirect(login_.begin(return_to)));
}

void RelayServer::Impl::handle_callback(const net::HttpRequest& req, net::Responder respond) {
  if (auto error = req.query_param("error")) {
    respond(net::HttpReply::error(Status::failure(ErrorCode::Unauthorized, "identity provider returned " + *error)));
    return;
  }
  auto state = req.query_param("state");
  auto code = req.query_param("code");
  auto pending = state ? login_.take(*state) : std::nullopt;
  if (!pending || !code) {
    respond(net::HttpReply::error(Status::failure(ErrorCode::InvalidArgument, "unknown or expired login state")));
    return;
  }

  net::HttpOptions opts;
  opts.method = "POST";
  opts.timeout = std::chrono::milliseconds(10000);
  opts.headers["Content-Type"] = "application/x-www-form-urlencoded";
  opts.headers["Accept"] = "application/json";
  opts.body = net::form_encode(login_.exchange_form(*code, pending->code_verifier));

  std::string return_to = pending->return_to;
  http_client_->request(login_.config().token_url, opts, [this, respond, return_to](net::HttpResponse response) {
    if (!response.ok()) {
      spdlog::warn("Code exchange failed: {} {}", response.status_code, response.error.empty() ? response.body : response.error);
      respond(net::HttpReply::error(Status::failure(ErrorCode::Unauthorized, "code exchange with the identity provider failed")));
      return;
    }

    std::string token;
    try {
      auto body = json::parse(response.body);
      token = body.value("id_token", body.value("access_token", ""));
    } catch (const json::exception& e) {
      respond(net::HttpReply::error(Status::failure(ErrorCode::Unauthorized, std::string("invalid token response: ") + e.what())));
      return;
    }

    auto claims = verifier_->verify(token);
    if (!claims.ok()) {
      spdlog::warn("Login rejected: {}", claims.status.to_string());
      respond(net::HttpReply::error(claims.status));
      return;
    }
    auto session = issuer_.start_session(claims.value->subject, claims.value->name(), claims.value->roles);
    if (!session.ok()) {
      respond(net::HttpReply::error(session.status));
      return;
    }

    spdlog::info("{} logged in", claims.value->name());
    auto reply = net::HttpReply::redirect(return_to);
    reply.set_header("Set-Cookie", session_cookie(session.value->access_token, config_.auth.session_ttl));
    respond(reply);
  });
}

void RelayServer::Impl::handle_logout(const net::HttpRequest& req, net::Responder respond) {
  auto claims = verifier_->verify(request_token(req, config_.auth.cookie_name));
  if (claims.ok() && !claims.value->session_id.empty() && issuer_.end_session(claims.value->session_id)) {
    spdlog::info("{} logged out", claims.value->name());
  }
  auto reply = net::HttpReply::json_body(200, json{{"status", "logged out"}});
  reply.set_header("Set-Cookie", session_cookie("", std::chrono::seconds(0)));
  respond(reply);
}

void RelayServer::Impl::handle_refresh(const net::HttpRequest& req, net::Responder respond) {
  auto claims = verifier_->verify(request_token(req, config_.auth.cookie_name));
  if (!claims.ok()) {
    respond(net::HttpReply::error(claims.status));
    return;
  }
  auto issued = issuer_.refresh_session(*claims.value);
  if (!issued.ok()) {
    respond(net::HttpReply::error(issued.status));
    return;
  }
  respond(net::HttpReply::json_body(200, issued.value->to_json()));
}

void RelayServer::Impl::handle_me(const net::HttpRequest& req, net::Responder respond) {
  auto claims = verifier_->verify(request_token(req, config_.auth.cookie_name));
  if (!claims.ok()) {
    respond(net::HttpReply::error(claims.status));
    return;
  }
  json body = claims.value->to_json();
  body["admin"] = authorizer_.is_admin(*claims.value);
  respond(net::HttpReply::json_body(200, body));
}

// ============================================================================
// Sweep
// ============================================================================

void RelayServer::Impl::schedule_sweep() {
  sweep_timer_.expires_after(config_.sweep_interval);
  sweep_timer_.async_wait([this](const asio::error_code& ec) {
    if (ec) return;
    sweep();
    schedule_sweep();
  });
}

void RelayServer::Impl::sweep() {
  auto result = sessions_.sweep(config_.auth.leeway);
  for (const auto& identity : result.removed) {
    spdlog::debug("[{}] dropped closed session", identity);
  }
  for (const auto& session : result.expired) {
    spdlog::warn("[{}] credential expired without refresh, closing session {}", session->name(), session->id());
    session->close("credential expired");
  }
  size_t purged = session_store_->purge_expired();
  if (purged > 0) spdlog::debug("Purged {} expired login session(s)", purged);
}

// ============================================================================
// RelayServer
// ============================================================================

RelayServer::RelayServer(ServerConfig config) : impl_(std::make_shared<Impl>(std::move(config))) {}

RelayServer::~RelayServer() {
  impl_->stop();
}

Status RelayServer::start() {
  return impl_->start();
}

void RelayServer::stop() {
  impl_->stop();
}

void RelayServer::wait() {
  impl_->wait();
}

uint16_t RelayServer::http_port() const {
  return impl_->http_port();
}

Result<RegisterOutcome> RelayServer::register_route(const RouteSpec& route) {
  return impl_->register_route(route);
}

Status RelayServer::deregister_route(const RouteKey& key, bool idle) {
  return impl_->deregister_route(key, idle);
}

RouteTable& RelayServer::routes() {
  return impl_->routes_;
}

SessionRegistry& RelayServer::sessions() {
  return impl_->sessions_;
}

const auth::TokenIssuer& RelayServer::issuer() const {
  return impl_->issuer_;
}

const ServerConfig& RelayServer::config() const {
  return impl_->config_;
}

}  // namespace kuberde::relay
