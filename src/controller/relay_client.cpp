#include "controller/relay_client.hpp"

#include <spdlog/spdlog.h>

#include "core/time_util.hpp"
#include "net/http_client.hpp"
#include "net/http_message.hpp"

namespace kuberde::controller {

AgentActivity AgentActivity::from_json(const json& j) {
  AgentActivity activity;
  if (!j.is_object()) return activity;
  activity.online = j.value("online", false);
  activity.active_connections = j.value("activeConnections", size_t(0));
  if (j.contains("lastActivity") && j["lastActivity"].is_string()) {
    activity.last_activity = parse_rfc3339(j["lastActivity"].get<std::string>());
  }
  return activity;
}

HttpRelayClient::HttpRelayClient(std::shared_ptr<net::HttpClient> http, std::string base_url, TokenProvider token_provider,
                                 std::chrono::milliseconds timeout)
    : http_(std::move(http)), base_url_(std::move(base_url)), token_provider_(std::move(token_provider)), timeout_(timeout) {
  while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

HttpRelayClient::Reply HttpRelayClient::call(const std::string& method, const std::string& path, const std::string& body) {
  net::HttpOptions opts;
  opts.method = method;
  opts.timeout = timeout_;
  opts.max_retries = 1;
  if (!body.empty()) {
    opts.headers["Content-Type"] = "application/json";
    opts.body = body;
  }
  std::string token = token_provider_ ? token_provider_() : std::string();
  if (!token.empty()) opts.headers["Authorization"] = "Bearer " + token;

  auto response = http_->request(base_url_ + path, opts).get();
  Reply reply{response.status_code, response.body, Status::success()};
  if (response.status_code == 0) {
    reply.status = Status::failure(ErrorCode::Unavailable, method + " " + path + ": " + response.error);
  } else if (!response.ok()) {
    std::string message = response.body;
    auto parsed = json::parse(response.body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("message") && parsed["message"].is_string()) {
      message = parsed["message"].get<std::string>();
    }
    reply.status = Status::failure(error_code_from_http_status(response.status_code), method + " " + path + ": " + message);
  }
  return reply;
}

Status HttpRelayClient::register_route(const RouteSpec& route) {
  std::string path = route.key.kind == RouteKind::Tcp ? "/mgmt/services/tcp" : "/mgmt/services/http";
  return call("POST", path, route.to_json().dump()).status;
}

Status HttpRelayClient::deregister_route(const RouteKey& key, bool idle) {
  std::string path = key.kind == RouteKind::Tcp ? "/mgmt/services/tcp?port=" + std::to_string(key.port)
                                                : "/mgmt/services/http?hostnamePrefix=" + net::url_encode(key.hostname_prefix);
  if (idle) path += "&idle=true";
  return call("DELETE", path).status;
}

Result<RouteListing> HttpRelayClient::list_routes(const std::string& workload) {
  auto reply = call("GET", "/mgmt/routes?workload=" + net::url_encode(workload));
  if (!reply.status.ok()) return Result<RouteListing>::failure(reply.status);

  RouteListing listing;
  try {
    auto body = json::parse(reply.body);
    auto read = [](const json& items, RouteKind kind, std::vector<RouteSpec>& out) {
      auto route = RouteSpec::from_json(kind, items);
      if (route.ok()) out.push_back(*route.value);
    };
    for (const auto* field : {"routes", "idle"}) {
      auto& out = std::string(field) == "routes" ? listing.routes : listing.idle;
      for (const auto& item : body.value(field, json::array())) {
        read(item, item.contains("port") ? RouteKind::Tcp : RouteKind::Http, out);
      }
    }
  } catch (const json::exception& e) {
    return Result<RouteListing>::failure(ErrorCode::Internal, std::string("invalid route listing: ") + e.what());
  }
  return Result<RouteListing>::success(std::move(listing));
}

Result<AgentActivity> HttpRelayClient::agent_activity(const std::string& identity) {
  auto reply = call("GET", "/mgmt/agents/" + identity);
  if (!reply.status.ok()) return Result<AgentActivity>::failure(reply.status);
  try {
    return Result<AgentActivity>::success(AgentActivity::from_json(json::parse(reply.body)));
  } catch (const json::exception& e) {
    return Result<AgentActivity>::failure(ErrorCode::Internal, std::string("invalid agent stats: ") + e.what());
  }
}

}  // namespace kuberde::controller
