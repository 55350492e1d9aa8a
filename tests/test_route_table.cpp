#include <gtest/gtest.h>

#include "relay/route_table.hpp"

using namespace kuberde;
using namespace kuberde::relay;

namespace {

RouteSpec tcp_route(uint16_t port, const std::string& workload, const std::string& service = "ssh") {
  RouteSpec route;
  route.key = RouteKey::tcp(port);
  route.agent_id = workload + "-" + service;
  route.service = service;
  route.workload = workload;
  return route;
}

RouteSpec http_route(const std::string& prefix, const std::string& workload, const std::string& service = "web") {
  RouteSpec route;
  route.key = RouteKey::http(prefix);
  route.agent_id = workload + "-" + service;
  route.service = service;
  route.workload = workload;
  return route;
}

RouteTableOptions options() {
  RouteTableOptions opts;
  opts.tcp_port_min = 30000;
  opts.tcp_port_max = 30100;
  opts.reserved_ports = {30050};
  opts.agent_domain = "example.com";
  return opts;
}

}  // namespace

// --- RouteTableTest ---

TEST(RouteTableTest, RegisterOutcomes) {
  RouteTable table(options());
  auto route = tcp_route(30001, "user-alice-ws");

  auto first = table.register_route(route);
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(*first.value, RegisterOutcome::Created);

  auto again = table.register_route(route);
  ASSERT_TRUE(again.ok());
  EXPECT_EQ(*again.value, RegisterOutcome::Unchanged);

  route.workload = "user-alice-other";
  auto updated = table.register_route(route);
  ASSERT_TRUE(updated.ok());
  EXPECT_EQ(*updated.value, RegisterOutcome::Updated);
  EXPECT_EQ(table.size(), 1u);
}

TEST(RouteTableTest, ConflictingAgent) {
  RouteTable table(options());
  ASSERT_TRUE(table.register_route(tcp_route(30001, "user-alice-ws")).ok());

  auto taken = table.register_route(tcp_route(30001, "user-bob-ws"));
  EXPECT_EQ(taken.code(), ErrorCode::Conflict);
  EXPECT_EQ(table.lookup(RouteKey::tcp(30001)).value->route.workload, "user-alice-ws");
}

TEST(RouteTableTest, KeyValidation) {
  RouteTable table(options());
  EXPECT_EQ(table.register_route(tcp_route(29999, "user-alice-ws")).code(), ErrorCode::InvalidKey);
  EXPECT_EQ(table.register_route(tcp_route(30101, "user-alice-ws")).code(), ErrorCode::InvalidKey);
  EXPECT_EQ(table.register_route(tcp_route(30050, "user-alice-ws")).code(), ErrorCode::InvalidKey);
  EXPECT_EQ(table.register_route(http_route("Bad_Prefix", "user-alice-ws")).code(), ErrorCode::InvalidKey);
  EXPECT_EQ(table.register_route(http_route("a..b", "user-alice-ws")).code(), ErrorCode::InvalidKey);
  EXPECT_TRUE(table.register_route(http_route("files.user-alice-ws", "user-alice-ws")).ok());

  RouteSpec missing_agent = tcp_route(30002, "user-alice-ws");
  missing_agent.agent_id.clear();
  EXPECT_EQ(table.register_route(missing_agent).code(), ErrorCode::InvalidArgument);
}

TEST(RouteTableTest, WorkloadDefaultsToAgent) {
  RouteTable table(options());
  RouteSpec route = tcp_route(30003, "user-alice-ws");
  route.workload.clear();
  ASSERT_TRUE(table.register_route(route).ok());
  EXPECT_EQ(table.list(route.agent_id).size(), 1u);
}

TEST(RouteTableTest, DeregisterAndNotFound) {
  RouteTable table(options());
  ASSERT_TRUE(table.register_route(tcp_route(30001, "user-alice-ws")).ok());

  EXPECT_TRUE(table.deregister_route(RouteKey::tcp(30001)).ok());
  EXPECT_EQ(table.lookup(RouteKey::tcp(30001)).code(), ErrorCode::NoRoute);
  EXPECT_EQ(table.deregister_route(RouteKey::tcp(30001)).code, ErrorCode::NotFound);
  EXPECT_TRUE(table.tcp_ports().empty());
}

TEST(RouteTableTest, IdleMarkers) {
  RouteTable table(options());
  ASSERT_TRUE(table.register_route(tcp_route(30001, "user-alice-ws")).ok());
  ASSERT_TRUE(table.deregister_route(RouteKey::tcp(30001), true).ok());

  EXPECT_EQ(table.size(), 0u);
  auto found = table.lookup(RouteKey::tcp(30001));
  ASSERT_TRUE(found.ok());
  EXPECT_TRUE(found.value->idle);
  EXPECT_EQ(found.value->route.workload, "user-alice-ws");
  EXPECT_TRUE(table.has_tcp_port(30001));
  EXPECT_EQ(table.list_idle("user-alice-ws").size(), 1u);

  // idle again is a no-op
  EXPECT_TRUE(table.deregister_route(RouteKey::tcp(30001), true).ok());

  // another workload cannot take an idle key
  EXPECT_EQ(table.register_route(tcp_route(30001, "user-bob-ws")).code(), ErrorCode::Conflict);

  // the owner gets it back and the marker goes away
  auto back = table.register_route(tcp_route(30001, "user-alice-ws"));
  ASSERT_TRUE(back.ok());
  EXPECT_EQ(*back.value, RegisterOutcome::Created);
  EXPECT_TRUE(table.list_idle().empty());
  EXPECT_FALSE(table.lookup(RouteKey::tcp(30001)).value->idle);
}

TEST(RouteTableTest, ClearingIdleMarker) {
  RouteTable table(options());
  ASSERT_TRUE(table.register_route(tcp_route(30001, "user-alice-ws")).ok());
  ASSERT_TRUE(table.deregister_route(RouteKey::tcp(30001), true).ok());

  EXPECT_TRUE(table.deregister_route(RouteKey::tcp(30001)).ok());
  EXPECT_FALSE(table.has_tcp_port(30001));
  EXPECT_TRUE(table.register_route(tcp_route(30001, "user-bob-ws")).ok());
}

TEST(RouteTableTest, ListFiltersByWorkload) {
  RouteTable table(options());
  ASSERT_TRUE(table.register_route(tcp_route(30001, "user-alice-ws")).ok());
  ASSERT_TRUE(table.register_route(http_route("web.user-alice-ws", "user-alice-ws")).ok());
  ASSERT_TRUE(table.register_route(tcp_route(30002, "user-bob-ws")).ok());

  EXPECT_EQ(table.list().size(), 3u);
  EXPECT_EQ(table.list("user-alice-ws").size(), 2u);
  EXPECT_EQ(table.list("user-carol-ws").size(), 0u);
  EXPECT_EQ(table.tcp_ports(), (std::set<uint16_t>{30001, 30002}));
}

TEST(RouteTableTest, ResolveHost) {
  RouteTable table(options());
  ASSERT_TRUE(table.register_route(http_route("files", "user-alice-ws", "files")).ok());

  auto explicit_route = table.resolve_host("FILES.example.com.");
  ASSERT_TRUE(explicit_route.ok());
  EXPECT_FALSE(explicit_route.value->derived);
  EXPECT_EQ(explicit_route.value->route.service, "files");

  auto derived = table.resolve_host("code.user-bob-dev.example.com");
  ASSERT_TRUE(derived.ok());
  EXPECT_TRUE(derived.value->derived);
  EXPECT_EQ(derived.value->route.service, "code");
  EXPECT_EQ(derived.value->route.workload, "user-bob-dev");
  EXPECT_EQ(derived.value->route.agent_id, "user-bob-dev-code");

  EXPECT_EQ(table.resolve_host("example.com").code(), ErrorCode::NoRoute);
  EXPECT_EQ(table.resolve_host("files.other.org").code(), ErrorCode::NoRoute);
  EXPECT_EQ(table.resolve_host("nothing.example.com").code(), ErrorCode::NoRoute);
}

TEST(RouteTableTest, DerivedRoutesCanBeDisabled) {
  auto opts = options();
  opts.derive_default_routes = false;
  RouteTable table(opts);
  EXPECT_EQ(table.resolve_host("code.user-bob-dev.example.com").code(), ErrorCode::NoRoute);
}

TEST(RouteTableTest, HostPrefixWithoutDomain) {
  RouteTable table;
  EXPECT_EQ(table.host_prefix("a.example.com"), "");
}

// --- SessionCandidatesTest ---

TEST(SessionCandidatesTest, OrderAndDedup) {
  auto route = tcp_route(30001, "user-alice-ws");
  EXPECT_EQ(session_candidates(route), (std::vector<std::string>{"user-alice-ws", "user-alice-ws-ssh"}));

  RouteSpec plain;
  plain.agent_id = "user-alice-ws";
  plain.service = "ssh";
  EXPECT_EQ(session_candidates(plain), (std::vector<std::string>{"user-alice-ws"}));

  RouteSpec other;
  other.agent_id = "user-bob-box-web";
  other.service = "web";
  other.workload = "team-box";
  EXPECT_EQ(session_candidates(other), (std::vector<std::string>{"team-box", "user-bob-box-web", "user-bob-box"}));
}
