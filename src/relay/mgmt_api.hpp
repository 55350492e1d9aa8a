#pragma once

#include <functional>
#include <memory>
#include <string>

#include "auth/authorizer.hpp"
#include "auth/verifier.hpp"
#include "net/http_message.hpp"
#include "net/http_server.hpp"
#include "relay/route_table.hpp"
#include "relay/session_registry.hpp"

namespace kuberde::relay {

// Side effects of route changes owned by the relay server (TCP listeners)
struct RouteHooks {
  std::function<Status(const RouteSpec&)> on_registered;  // failure rolls the registration back
  std::function<void(const RouteKey&, bool idle)> on_deregistered;
  std::function<bool()> ready;
};

/**
 * Management API used by the controller.
 *
 *   POST   /mgmt/services/tcp   {agentID, service, port, workloadID?}
 *   POST   /mgmt/services/http  {agentID, service, hostnamePrefix, workloadID?}
 *   DELETE /mgmt/services/tcp?port=&idle=
 *   DELETE /mgmt/services/http?hostnamePrefix=&idle=
 *   GET    /mgmt/routes[?workload=]  {routes, idle}
 *   GET    /mgmt/agents/{id}
 *   GET    /healthz, /readyz (unauthenticated)
 *
 * Callers need a valid credential that is administrative or owns the identity.
 * Registrations must also own the workload, and agentID must be that workload or one of its services.
 */
class ManagementApi {
 public:
  ManagementApi(RouteTable& routes, SessionRegistry& sessions, const auth::TokenVerifier& verifier, const auth::Authorizer& authorizer,
                RouteHooks hooks = {});

  void install(net::HttpServer& server);

  net::HttpReply register_route(RouteKind kind, const net::HttpRequest& req);

  net::HttpReply deregister_route(RouteKind kind, const net::HttpRequest& req);

  net::HttpReply list_routes(const net::HttpRequest& req);

  net::HttpReply agent_stats(const net::HttpRequest& req);

  net::HttpReply healthz(const net::HttpRequest& req);

  net::HttpReply readyz(const net::HttpRequest& req);

 private:
  Result<auth::Claims> authenticate(const net::HttpRequest& req) const;

  RouteTable& routes_;
  SessionRegistry& sessions_;
  const auth::TokenVerifier& verifier_;
  const auth::Authorizer& authorizer_;
  RouteHooks hooks_;
};

}  // namespace kuberde::relay
