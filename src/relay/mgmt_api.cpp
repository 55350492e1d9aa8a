#include "relay/mgmt_api.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "core/identity.hpp"

namespace kuberde::relay {

namespace {

bool truthy(const std::optional<std::string>& value) {
  return value && (*value == "true" || *value == "1" || *value == "yes");
}

Result<RouteKey> key_from_query(RouteKind kind, const net::HttpRequest& req) {
  if (kind == RouteKind::Tcp) {
    auto port = req.query_param("port");
    if (!port) return Result<RouteKey>::failure(ErrorCode::InvalidKey, "port query parameter is required");
    try {
      int value = std::stoi(*port);
      if (value <= 0 || value > 65535) throw std::out_of_range("port");
      return Result<RouteKey>::success(RouteKey::tcp(static_cast<uint16_t>(value)));
    } catch (const std::exception&) {
      return Result<RouteKey>::failure(ErrorCode::InvalidKey, "invalid port '" + *port + "'");
    }
  }
  auto prefix = req.query_param("hostnamePrefix");
  if (!prefix || prefix->empty()) return Result<RouteKey>::failure(ErrorCode::InvalidKey, "hostnamePrefix query parameter is required");
  return Result<RouteKey>::success(RouteKey::http(*prefix));
}

}  // namespace

ManagementApi::ManagementApi(RouteTable& routes, SessionRegistry& sessions, const auth::TokenVerifier& verifier, const auth::Authorizer& authorizer,
                             RouteHooks hooks)
    : routes_(routes), sessions_(sessions), verifier_(verifier), authorizer_(authorizer), hooks_(std::move(hooks)) {}

void ManagementApi::install(net::HttpServer& server) {
  auto bind = [this](net::HttpReply (ManagementApi::*method)(const net::HttpRequest&)) {
    return [this, method](const net::HttpRequest& req, net::Responder respond) { respond((this->*method)(req)); };
  };

  server.handle("POST", "/mgmt/services/tcp", [this](const net::HttpRequest& req, net::Responder respond) {
    respond(register_route(RouteKind::Tcp, req));
  });
  server.handle("POST", "/mgmt/services/http", [this](const net::HttpRequest& req, net::Responder respond) {
    respond(register_route(RouteKind::Http, req));
  });
  server.handle("DELETE", "/mgmt/services/tcp", [this](const net::HttpRequest& req, net::Responder respond) {
    respond(deregister_route(RouteKind::Tcp, req));
  });
  server.handle("DELETE", "/mgmt/services/http", [this](const net::HttpRequest& req, net::Responder respond) {
    respond(deregister_route(RouteKind::Http, req));
  });
  server.handle("GET", "/mgmt/routes", bind(&ManagementApi::list_routes));
  server.handle_prefix("GET", "/mgmt/agents/", bind(&ManagementApi::agent_stats));
  server.handle("GET", "/healthz", bind(&ManagementApi::healthz));
  server.handle("GET", "/readyz", bind(&ManagementApi::readyz));
}

Result<auth::Claims> ManagementApi::authenticate(const net::HttpRequest& req) const {
  auto claims = verifier_.verify(req.bearer_token());
  if (!claims.ok()) {
    spdlog::warn("mgmt {} {} from {} rejected: {}", req.method, req.path, req.remote_address, claims.status.message);
  }
  return claims;
}

net::HttpReply ManagementApi::register_route(RouteKind kind, const net::HttpRequest& req) {
  auto claims = authenticate(req);
  if (!claims.ok()) return net::HttpReply::error(claims.status);

  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::exception& e) {
    return net::HttpReply::error(Status::failure(ErrorCode::InvalidArgument, std::string("invalid JSON: ") + e.what()));
  }

  auto route = RouteSpec::from_json(kind, body);
  if (!route.ok()) return net::HttpReply::error(route.status);

  // The caller must own both the agent identity and the workload whose session the route dials
  const RouteSpec& spec = *route.value;
  for (const std::string* identity : {&spec.agent_id, &spec.owner_workload()}) {
    auto allowed = authorizer_.authorize(*claims.value, *identity);
    if (!allowed.ok()) {
      spdlog::warn("[{}] route registration by {} denied: {}", *identity, claims.value->name(), allowed.message);
      return net::HttpReply::error(allowed);
    }
  }
  if (!spec.workload.empty() && spec.agent_id != spec.workload && spec.agent_id != make_service_identity(spec.workload, spec.service)) {
    return net::HttpReply::error(
        Status::failure(ErrorCode::InvalidArgument, "agentID " + spec.agent_id + " does not belong to workload " + spec.workload));
  }

  auto previous = routes_.lookup(route.value->key);
  auto outcome = routes_.register_route(*route.value);
  if (!outcome.ok()) {
    spdlog::warn("[{}] register {} failed: {}", route.value->agent_id, route.value->key.to_string(), outcome.status.to_string());
    return net::HttpReply::error(outcome.status);
  }

  if (*outcome.value == RegisterOutcome::Created && hooks_.on_registered) {
    auto side_effect = hooks_.on_registered(*route.value);
    if (!side_effect.ok()) {
      // Roll back; a replaced idle marker stays an idle marker
      bool was_idle = previous.ok() && previous.value->idle;
      auto undo = routes_.deregister_route(route.value->key, was_idle);
      if (!undo.ok()) {
        spdlog::error("[{}] rollback of {} failed: {}", route.value->agent_id, route.value->key.to_string(), undo.to_string());
      }
      spdlog::error("[{}] register {} rolled back: {}", route.value->agent_id, route.value->key.to_string(), side_effect.message);
      return net::HttpReply::error(side_effect);
    }
  }

  spdlog::info("[{}] route {} -> {} {}", route.value->agent_id, route.value->key.to_string(), route.value->service, to_string(*outcome.value));
  json reply = route.value->to_json();
  reply["status"] = to_string(*outcome.value);
  return net::HttpReply::json_body(*outcome.value == RegisterOutcome::Created ? 201 : 200, reply);
}

net::HttpReply ManagementApi::deregister_route(RouteKind kind, const net::HttpRequest& req) {
  auto claims = authenticate(req);
  if (!claims.ok()) return net::HttpReply::error(claims.status);

  auto key = key_from_query(kind, req);
  if (!key.ok()) return net::HttpReply::error(key.status);

  auto existing = routes_.lookup(*key.value);
  if (!existing.ok()) return net::HttpReply::error(Status::failure(ErrorCode::NotFound, "no route for " + key.value->to_string()));

  auto allowed = authorizer_.authorize(*claims.value, existing.value->route.agent_id);
  if (!allowed.ok()) return net::HttpReply::error(allowed);

  bool idle = truthy(req.query_param("idle"));
  auto status = routes_.deregister_route(*key.value, idle);
  if (!status.ok()) return net::HttpReply::error(status);

  if (hooks_.on_deregistered) hooks_.on_deregistered(*key.value, idle);
  spdlog::info("[{}] route {} removed{}", existing.value->route.agent_id, key.value->to_string(), idle ? " (idle)" : "");
  return net::HttpReply::no_content();
}

net::HttpReply ManagementApi::list_routes(const net::HttpRequest& req) {
  auto claims = authenticate(req);
  if (!claims.ok()) return net::HttpReply::error(claims.status);

  std::string workload = req.query_param("workload").value_or("");
  auto allowed = workload.empty() ? authorizer_.require_admin(*claims.value) : authorizer_.authorize(*claims.value, workload);
  if (!allowed.ok()) return net::HttpReply::error(allowed);

  json items = json::array();
  for (const auto& route : routes_.list(workload)) {
    items.push_back(route.to_json());
  }
  json idle = json::array();
  for (const auto& route : routes_.list_idle(workload)) {
    idle.push_back(route.to_json());
  }
  return net::HttpReply::json_body(200, json{{"routes", items}, {"idle", idle}});
}

net::HttpReply ManagementApi::agent_stats(const net::HttpRequest& req) {
  auto claims = authenticate(req);
  if (!claims.ok()) return net::HttpReply::error(claims.status);

  std::string identity = req.path.substr(std::string("/mgmt/agents/").size());
  if (identity.empty() || identity.find('/') != std::string::npos) {
    return net::HttpReply::error(Status::failure(ErrorCode::InvalidArgument, "agent id is required"));
  }
  auto allowed = authorizer_.authorize(*claims.value, identity);
  if (!allowed.ok()) return net::HttpReply::error(allowed);

  auto stats = sessions_.stats(identity);
  if (!stats) {
    AgentStats empty;
    empty.identity = identity;
    return net::HttpReply::json_body(200, empty.to_json());
  }
  stats->online = sessions_.find(identity) != nullptr;
  return net::HttpReply::json_body(200, stats->to_json());
}

net::HttpReply ManagementApi::healthz(const net::HttpRequest&) {
  return net::HttpReply::json_body(200, json{{"status", "ok"}});
}

net::HttpReply ManagementApi::readyz(const net::HttpRequest&) {
  if (hooks_.ready && !hooks_.ready()) {
    return net::HttpReply::json_body(503, json{{"status", "not ready"}});
  }
  return net::HttpReply::json_body(200, json{{"status", "ready"}, {"agents", sessions_.size()}, {"routes", routes_.size()}});
}

}  // namespace kuberde::relay
