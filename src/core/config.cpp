#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

#include "core/time_util.hpp"

namespace kuberde {

namespace fs = std::filesystem;

namespace config_util {

std::optional<std::chrono::milliseconds> read_duration(const json& j, const std::string& key) {
  if (!j.contains(key) || j[key].is_null()) return std::nullopt;
  const auto& v = j[key];
  if (v.is_number_integer()) {
    return std::chrono::milliseconds(v.get<int64_t>());
  }
  if (v.is_string()) {
    auto parsed = parse_duration(v.get<std::string>());
    if (!parsed) {
      spdlog::warn("config: invalid duration for '{}': {}", key, v.get<std::string>());
    }
    return parsed;
  }
  spdlog::warn("config: '{}' must be a duration string or milliseconds", key);
  return std::nullopt;
}

std::optional<std::string> get_env(const char* name) {
  const char* value = std::getenv(name);
  if (!value || !*value) return std::nullopt;
  return std::string(value);
}

std::optional<std::pair<uint16_t, uint16_t>> parse_port_range(const std::string& str) {
  auto dash = str.find('-');
  if (dash == std::string::npos) return std::nullopt;
  try {
    int lo = std::stoi(str.substr(0, dash));
    int hi = std::stoi(str.substr(dash + 1));
    if (lo <= 0 || hi > 65535 || lo > hi) return std::nullopt;
    return std::make_pair(static_cast<uint16_t>(lo), static_cast<uint16_t>(hi));
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace config_util

namespace {

using config_util::get_env;
using config_util::read_duration;

template <typename Duration>
void load_duration(const json& j, const std::string& key, Duration& out) {
  if (auto d = read_duration(j, key)) {
    out = std::chrono::duration_cast<Duration>(*d);
  }
}

std::optional<json> read_json_file(const fs::path& path) {
  if (!fs::exists(path)) {
    spdlog::warn("config file {} not found, using defaults", path.string());
    return std::nullopt;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("config file {} cannot be opened, using defaults", path.string());
    return std::nullopt;
  }

  try {
    return json::parse(file);
  } catch (const json::exception& e) {
    spdlog::error("config file {} is not valid JSON: {}", path.string(), e.what());
    return std::nullopt;
  }
}

void load_log(const json& j, LogConfig& log) {
  if (!j.is_object()) return;
  log.level = j.value("level", log.level);
  log.file = j.value("file", log.file);
  log.max_size = j.value("max_size", log.max_size);
  log.max_files = j.value("max_files", log.max_files);
}

void load_backoff(const json& j, BackoffConfig& backoff) {
  if (!j.is_object()) return;
  load_duration(j, "initial", backoff.initial);
  load_duration(j, "max", backoff.max);
  backoff.multiplier = j.value("multiplier", backoff.multiplier);
  backoff.max_attempts = j.value("max_attempts", backoff.max_attempts);
}

void load_auth(const json& j, AuthConfig& auth) {
  if (!j.is_object()) return;
  auth.issuer = j.value("issuer", auth.issuer);
  auth.signing_key = j.value("signing_key", auth.signing_key);
  auth.jwks_file = j.value("jwks_file", auth.jwks_file);
  auth.jwks_url = j.value("jwks_url", auth.jwks_url);
  load_duration(j, "leeway", auth.leeway);
  load_duration(j, "token_ttl", auth.token_ttl);
  load_duration(j, "session_ttl", auth.session_ttl);
  load_duration(j, "session_token_ttl", auth.session_token_ttl);
  auth.cookie_name = j.value("cookie_name", auth.cookie_name);
  auth.secure_cookie = j.value("secure_cookie", auth.secure_cookie);

  if (j.contains("admin_roles")) {
    auth.admin_roles.clear();
    for (const auto& role : j["admin_roles"]) {
      auth.admin_roles.push_back(role.get<std::string>());
    }
  }

  if (j.contains("clients")) {
    for (const auto& client_json : j["clients"]) {
      ClientCredential client;
      client.client_id = client_json.value("client_id", "");
      client.client_secret = client_json.value("client_secret", "");
      client.subject = client_json.value("subject", client.client_id);
      client.agent_id = client_json.value("agent_id", "");
      if (client_json.contains("roles")) {
        for (const auto& role : client_json["roles"]) {
          client.roles.push_back(role.get<std::string>());
        }
      }
      if (client.client_id.empty() || client.client_secret.empty()) {
        spdlog::warn("config: skipping auth client without client_id/client_secret");
        continue;
      }
      auth.clients.push_back(std::move(client));
    }
  }

  if (j.contains("oidc")) {
    const auto& oidc = j["oidc"];
    auth.oidc.authorize_url = oidc.value("authorize_url", "");
    auth.oidc.token_url = oidc.value("token_url", "");
    auth.oidc.client_id = oidc.value("client_id", "");
    auth.oidc.client_secret = oidc.value("client_secret", "");
    auth.oidc.redirect_url = oidc.value("redirect_url", "");
    auth.oidc.scopes = oidc.value("scopes", auth.oidc.scopes);
    auth.oidc.issuer = oidc.value("issuer", "");
  }
}

void apply_port_range(const json& j, uint16_t& min, uint16_t& max) {
  if (!j.contains("tcp_port_range")) return;
  auto range = config_util::parse_port_range(j["tcp_port_range"].get<std::string>());
  if (!range) {
    spdlog::warn("config: invalid tcp_port_range, keeping {}-{}", min, max);
    return;
  }
  min = range->first;
  max = range->second;
}

}  // namespace

// ============================================================
// ServerConfig
// ============================================================

ServerConfig ServerConfig::load(const fs::path& path) {
  ServerConfig config;
  auto parsed = read_json_file(path);
  if (!parsed) return config;

  try {
    const json& j = *parsed;
    config.listen_address = j.value("listen_address", config.listen_address);
    config.http_port = j.value("http_port", config.http_port);
    config.tunnel_path = j.value("tunnel_path", config.tunnel_path);
    config.public_url = j.value("public_url", config.public_url);
    config.agent_domain = j.value("agent_domain", config.agent_domain);
    config.derive_default_routes = j.value("derive_default_routes", config.derive_default_routes);
    config.require_browser_auth = j.value("require_browser_auth", config.require_browser_auth);
    apply_port_range(j, config.tcp_port_min, config.tcp_port_max);

    load_duration(j, "keepalive_interval", config.keepalive_interval);
    load_duration(j, "keepalive_timeout", config.keepalive_timeout);
    load_duration(j, "handshake_timeout", config.handshake_timeout);
    load_duration(j, "preamble_timeout", config.preamble_timeout);
    load_duration(j, "bridge_idle_timeout", config.bridge_idle_timeout);
    load_duration(j, "half_close_linger", config.half_close_linger);
    load_duration(j, "sweep_interval", config.sweep_interval);

    config.controller_url = j.value("controller_url", config.controller_url);
    load_duration(j, "scale_up_cooldown", config.scale_up_cooldown);
    config.io_threads = j.value("io_threads", config.io_threads);

    if (j.contains("auth")) load_auth(j["auth"], config.auth);
    if (j.contains("log")) load_log(j["log"], config.log);
  } catch (const json::exception& e) {
    spdlog::error("config file {}: {}", path.string(), e.what());
  }
  return config;
}

ServerConfig ServerConfig::from_env(ServerConfig base) {
  if (auto v = get_env("KUBERDE_LISTEN_ADDR")) base.listen_address = *v;
  if (auto v = get_env("KUBERDE_HTTP_PORT")) {
    try {
      base.http_port = static_cast<uint16_t>(std::stoi(*v));
    } catch (const std::exception&) {
      spdlog::warn("KUBERDE_HTTP_PORT is not a number: {}", *v);
    }
  }
  if (auto v = get_env("KUBERDE_PUBLIC_URL")) base.public_url = *v;
  if (auto v = get_env("KUBERDE_AGENT_DOMAIN")) base.agent_domain = *v;
  if (auto v = get_env("KUBERDE_TCP_PORT_RANGE")) {
    if (auto range = config_util::parse_port_range(*v)) {
      base.tcp_port_min = range->first;
      base.tcp_port_max = range->second;
    } else {
      spdlog::warn("KUBERDE_TCP_PORT_RANGE is invalid: {}", *v);
    }
  }
  if (auto v = get_env("KUBERDE_CONTROLLER_URL")) base.controller_url = *v;
  if (auto v = get_env("KUBERDE_SIGNING_KEY")) base.auth.signing_key = *v;
  if (auto v = get_env("KUBERDE_LOG_LEVEL")) base.log.level = *v;
  return base;
}

// ============================================================
// AgentConfig
// ============================================================

AgentConfig AgentConfig::load(const fs::path& path) {
  AgentConfig config;
  auto parsed = read_json_file(path);
  if (!parsed) return config;

  try {
    const json& j = *parsed;
    config.server_url = j.value("server_url", config.server_url);
    config.agent_id = j.value("agent_id", config.agent_id);
    if (j.contains("services")) {
      config.services_json = json{{"services", j["services"]}}.dump();
    }
    config.local_target = j.value("local_target", config.local_target);
    config.token_url = j.value("token_url", config.token_url);
    config.client_id = j.value("client_id", config.client_id);
    config.client_secret = j.value("client_secret", config.client_secret);
    config.static_token = j.value("token", config.static_token);

    if (j.contains("reconnect")) load_backoff(j["reconnect"], config.reconnect);
    if (j.contains("refresh_retry")) load_backoff(j["refresh_retry"], config.refresh_retry);
    config.refresh_fraction = j.value("refresh_fraction", config.refresh_fraction);

    load_duration(j, "handshake_timeout", config.handshake_timeout);
    load_duration(j, "preamble_timeout", config.preamble_timeout);
    config.preamble_max_bytes = j.value("preamble_max_bytes", config.preamble_max_bytes);
    load_duration(j, "local_dial_deadline", config.local_dial_deadline);
    load_duration(j, "local_dial_interval", config.local_dial_interval);
    load_duration(j, "keepalive_interval", config.keepalive_interval);
    load_duration(j, "keepalive_timeout", config.keepalive_timeout);
    load_duration(j, "half_close_linger", config.half_close_linger);

    if (j.contains("log")) load_log(j["log"], config.log);
  } catch (const json::exception& e) {
    spdlog::error("config file {}: {}", path.string(), e.what());
  }
  return config;
}

AgentConfig AgentConfig::from_env(AgentConfig base) {
  if (auto v = get_env("SERVER_URL")) base.server_url = *v;
  if (auto v = get_env("AGENT_ID")) base.agent_id = *v;
  if (auto v = get_env("KUBERDE_SERVICES")) base.services_json = *v;
  if (auto v = get_env("LOCAL_TARGET")) base.local_target = *v;
  if (auto v = get_env("AUTH_TOKEN_URL")) base.token_url = *v;
  if (auto v = get_env("AUTH_CLIENT_ID")) base.client_id = *v;
  if (auto v = get_env("AUTH_CLIENT_SECRET")) base.client_secret = *v;
  if (auto v = get_env("AUTH_TOKEN")) base.static_token = *v;
  if (auto v = get_env("KUBERDE_LOG_LEVEL")) base.log.level = *v;
  return base;
}

// ============================================================
// ControllerConfig
// ============================================================

ControllerConfig ControllerConfig::load(const fs::path& path) {
  ControllerConfig config;
  auto parsed = read_json_file(path);
  if (!parsed) return config;

  try {
    const json& j = *parsed;
    config.kube_api_url = j.value("kube_api_url", config.kube_api_url);
    config.watch_namespace = j.value("namespace", config.watch_namespace);
    config.token_file = j.value("token_file", config.token_file);
    config.ca_file = j.value("ca_file", config.ca_file);
    config.insecure_skip_verify = j.value("insecure_skip_verify", config.insecure_skip_verify);

    config.relay_url = j.value("relay_url", config.relay_url);
    config.token_url = j.value("token_url", config.token_url);
    config.client_id = j.value("client_id", config.client_id);
    config.client_secret = j.value("client_secret", config.client_secret);
    config.static_token = j.value("token", config.static_token);

    config.agent_image = j.value("agent_image", config.agent_image);
    config.agent_token_url = j.value("agent_token_url", config.agent_token_url);
    config.default_server_url = j.value("default_server_url", config.default_server_url);

    load_duration(j, "reconcile_interval", config.reconcile_interval);
    load_duration(j, "request_timeout", config.request_timeout);
    config.health_address = j.value("health_address", config.health_address);
    config.health_port = j.value("health_port", config.health_port);
    apply_port_range(j, config.tcp_port_min, config.tcp_port_max);

    if (j.contains("status_retry")) load_backoff(j["status_retry"], config.status_retry);
    if (j.contains("refresh_retry")) load_backoff(j["refresh_retry"], config.refresh_retry);
    config.refresh_fraction = j.value("refresh_fraction", config.refresh_fraction);
    if (j.contains("auth")) load_auth(j["auth"], config.auth);
    if (j.contains("log")) load_log(j["log"], config.log);
  } catch (const json::exception& e) {
    spdlog::error("config file {}: {}", path.string(), e.what());
  }
  return config;
}

ControllerConfig ControllerConfig::from_env(ControllerConfig base) {
  if (base.kube_api_url.empty()) {
    auto host = get_env("KUBERNETES_SERVICE_HOST");
    auto port = get_env("KUBERNETES_SERVICE_PORT");
    if (host) {
      base.kube_api_url = "https://" + *host + ":" + port.value_or("443");
    }
  }
  if (auto v = get_env("KUBERDE_NAMESPACE")) base.watch_namespace = *v;
  if (auto v = get_env("KUBERDE_RELAY_URL")) base.relay_url = *v;
  if (auto v = get_env("KUBERDE_AGENT_IMAGE")) base.agent_image = *v;
  if (auto v = get_env("KUBERDE_SERVER_URL")) base.default_server_url = *v;
  if (auto v = get_env("KUBERDE_AGENT_TOKEN_URL")) base.agent_token_url = *v;
  if (auto v = get_env("AUTH_TOKEN_URL")) base.token_url = *v;
  if (auto v = get_env("AUTH_CLIENT_ID")) base.client_id = *v;
  if (auto v = get_env("AUTH_CLIENT_SECRET")) base.client_secret = *v;
  if (auto v = get_env("AUTH_TOKEN")) base.static_token = *v;
  if (auto v = get_env("KUBERDE_SIGNING_KEY")) base.auth.signing_key = *v;
  if (auto v = get_env("KUBERDE_LOG_LEVEL")) base.log.level = *v;
  return base;
}

}  // namespace kuberde
