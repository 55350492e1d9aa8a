#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/backoff.hpp"
#include "core/types.hpp"

namespace kuberde {

// Logging
struct LogConfig {
  std::string level = "info";
  std::string file;  // empty = stderr only
  size_t max_size = 10 * 1024 * 1024;
  size_t max_files = 5;
};

// Machine client allowed to use the client-credentials grant
struct ClientCredential {
  std::string client_id;
  std::string client_secret;
  std::string subject;
  std::vector<std::string> roles;
  std::string agent_id;  // binds issued tokens to one agent identity
};

// Upstream identity provider for interactive login
struct OidcConfig {
  std::string authorize_url;
  std::string token_url;
  std::string client_id;
  std::string client_secret;
  std::string redirect_url;
  std::string scopes = "openid profile";
  std::string issuer;  // "iss" of provider-signed tokens verified against the JWKS

  bool enabled() const {
    return !authorize_url.empty() && !token_url.empty() && !client_id.empty();
  }
};

struct AuthConfig {
  std::string issuer = "kuberde";
  std::string signing_key;  // HS256 key for tokens minted by this deployment
  std::string jwks_file;    // published RS256 key set of the identity provider
  std::string jwks_url;
  std::chrono::seconds leeway{30};
  std::chrono::seconds token_ttl{900};           // machine tokens
  std::chrono::seconds session_ttl{8 * 3600};    // server-side session record
  std::chrono::seconds session_token_ttl{300};   // re-minted by /auth/refresh
  std::vector<std::string> admin_roles{"admin", "system"};
  std::string cookie_name = "kuberde_session";
  bool secure_cookie = false;
  std::vector<ClientCredential> clients;
  OidcConfig oidc;
};

// Relay server (kuberde-server)
struct ServerConfig {
  std::string listen_address = "0.0.0.0";
  uint16_t http_port = 8080;
  std::string tunnel_path = "/ws";
  std::string public_url;    // external base URL used for login redirects
  std::string agent_domain;  // HTTP routes live under *.{agent_domain}
  bool derive_default_routes = true;
  bool require_browser_auth = true;

  uint16_t tcp_port_min = 30000;
  uint16_t tcp_port_max = 32767;

  std::chrono::milliseconds keepalive_interval{15000};
  std::chrono::milliseconds keepalive_timeout{45000};
  std::chrono::milliseconds handshake_timeout{10000};
  std::chrono::milliseconds preamble_timeout{5000};
  std::chrono::milliseconds bridge_idle_timeout{0};  // 0 = no idle limit
  std::chrono::milliseconds half_close_linger{30000};
  std::chrono::milliseconds sweep_interval{10000};

  std::string controller_url;  // scale-up webhook target, empty = disabled
  std::chrono::milliseconds scale_up_cooldown{30000};

  int io_threads = 2;

  AuthConfig auth;
  LogConfig log;

  // Load from a JSON file; missing keys keep their defaults
  static ServerConfig load(const std::filesystem::path& path);

  // Apply environment overrides on top of base
  // Reads: KUBERDE_LISTEN_ADDR, KUBERDE_HTTP_PORT, KUBERDE_PUBLIC_URL, KUBERDE_AGENT_DOMAIN,
  //        KUBERDE_TCP_PORT_RANGE ("min-max"), KUBERDE_CONTROLLER_URL, KUBERDE_SIGNING_KEY, KUBERDE_LOG_LEVEL
  static ServerConfig from_env(ServerConfig base);
  static ServerConfig from_env() { return from_env(ServerConfig{}); }
};

// In-pod agent (kuberde-agent)
struct AgentConfig {
  std::string server_url;  // e.g. http://kuberde-server:8080/ws
  std::string agent_id;
  std::string services_json;  // {"services":[{name,port,protocol}]}
  std::string local_target;   // legacy single-service "host:port"

  std::string token_url;
  std::string client_id;
  std::string client_secret;
  std::string static_token;

  BackoffConfig reconnect{std::chrono::milliseconds(1000), std::chrono::milliseconds(30000), 2.0, 0};
  BackoffConfig refresh_retry{std::chrono::milliseconds(2000), std::chrono::milliseconds(60000), 2.0, 5};
  double refresh_fraction = 0.8;

  std::chrono::milliseconds handshake_timeout{10000};
  std::chrono::milliseconds preamble_timeout{5000};
  size_t preamble_max_bytes = 256;
  std::chrono::milliseconds local_dial_deadline{30000};
  std::chrono::milliseconds local_dial_interval{500};
  std::chrono::milliseconds keepalive_interval{15000};
  std::chrono::milliseconds keepalive_timeout{45000};
  std::chrono::milliseconds half_close_linger{30000};

  LogConfig log;

  static AgentConfig load(const std::filesystem::path& path);

  // Reads: SERVER_URL, AGENT_ID, KUBERDE_SERVICES, LOCAL_TARGET, AUTH_TOKEN_URL,
  //        AUTH_CLIENT_ID, AUTH_CLIENT_SECRET, AUTH_TOKEN, KUBERDE_LOG_LEVEL
  static AgentConfig from_env(AgentConfig base);
  static AgentConfig from_env() { return from_env(AgentConfig{}); }
};

// Controller (kuberde-operator)
struct ControllerConfig {
  std::string kube_api_url;  // default: https://$KUBERNETES_SERVICE_HOST:$KUBERNETES_SERVICE_PORT
  std::string watch_namespace = "kuberde";
  std::string token_file = "/var/run/secrets/kubernetes.io/serviceaccount/token";
  std::string ca_file = "/var/run/secrets/kubernetes.io/serviceaccount/ca.crt";
  bool insecure_skip_verify = false;

  std::string relay_url;  // management API base URL
  std::string token_url;
  std::string client_id;
  std::string client_secret;
  std::string static_token;

  std::string agent_image = "kuberde/agent:latest";
  std::string agent_token_url;     // AUTH_TOKEN_URL handed to agents, defaults to token_url
  std::string default_server_url;  // used when spec.serverUrl is empty

  std::chrono::milliseconds reconcile_interval{30000};
  std::chrono::milliseconds request_timeout{10000};
  std::string health_address = "0.0.0.0";
  uint16_t health_port = 8081;

  uint16_t tcp_port_min = 30000;
  uint16_t tcp_port_max = 32767;

  BackoffConfig status_retry{std::chrono::milliseconds(100), std::chrono::milliseconds(2000), 2.0, 5};
  BackoffConfig refresh_retry{std::chrono::milliseconds(2000), std::chrono::milliseconds(60000), 2.0, 5};
  double refresh_fraction = 0.8;

  AuthConfig auth;
  LogConfig log;

  static ControllerConfig load(const std::filesystem::path& path);

  // Reads: KUBERNETES_SERVICE_HOST/PORT, KUBERDE_NAMESPACE, KUBERDE_RELAY_URL, KUBERDE_AGENT_IMAGE,
  //        KUBERDE_SERVER_URL, KUBERDE_AGENT_TOKEN_URL, AUTH_TOKEN_URL, AUTH_CLIENT_ID, AUTH_CLIENT_SECRET, AUTH_TOKEN,
  //        KUBERDE_SIGNING_KEY, KUBERDE_LOG_LEVEL
  static ControllerConfig from_env(ControllerConfig base);
  static ControllerConfig from_env() { return from_env(ControllerConfig{}); }
};

namespace config_util {

// Accepts a Go-style duration string ("30s") or an integer number of milliseconds
std::optional<std::chrono::milliseconds> read_duration(const json& j, const std::string& key);

std::optional<std::string> get_env(const char* name);

// "30000-32767" -> (30000, 32767)
std::optional<std::pair<uint16_t, uint16_t>> parse_port_range(const std::string& str);

}  // namespace config_util

}  // namespace kuberde
