#include <gtest/gtest.h>

#include "agent/service_table.hpp"

using namespace kuberde;
using namespace kuberde::agent;

// --- ServiceTableTest ---

TEST(ServiceTableTest, ParseServiceList) {
  auto table = ServiceTable::parse(R"({"services":[{"name":"ssh","port":22},{"name":"web","port":8080,"protocol":"http"}]})");
  ASSERT_TRUE(table.ok()) << table.status.to_string();
  ASSERT_EQ(table.value->services().size(), 2u);
  EXPECT_FALSE(table.value->has_fallback());
  EXPECT_EQ(table.value->describe(), "ssh:22, web:8080");

  auto web = table.value->resolve("web");
  ASSERT_TRUE(web.ok());
  EXPECT_EQ(web.value->to_string(), "127.0.0.1:8080");
  EXPECT_EQ(table.value->resolve("db").code(), ErrorCode::NotFound);
}

TEST(ServiceTableTest, BareArrayIsAccepted) {
  auto table = ServiceTable::parse(R"([{"name":"ssh","port":2222}])");
  ASSERT_TRUE(table.ok());
  EXPECT_EQ(table.value->resolve("ssh").value->port, 2222);
}

TEST(ServiceTableTest, RejectsBadInput) {
  EXPECT_EQ(ServiceTable::parse("not json").code(), ErrorCode::InvalidArgument);
  EXPECT_EQ(ServiceTable::parse(R"({"other":[]})").code(), ErrorCode::InvalidArgument);
  EXPECT_EQ(ServiceTable::parse(R"({"services":{}})").code(), ErrorCode::InvalidArgument);
  EXPECT_FALSE(ServiceTable::parse(R"({"services":[{"name":"ssh","port":22},{"name":"ssh","port":23}]})").ok());
  EXPECT_FALSE(ServiceTable::parse(R"({"services":[{"name":"ssh"}]})").ok());
}

TEST(ServiceTableTest, LegacyTargetTakesEverySelector) {
  AgentConfig config;
  config.local_target = "localhost:2200";
  auto table = ServiceTable::from_config(config);
  ASSERT_TRUE(table.ok());
  EXPECT_TRUE(table.value->has_fallback());

  for (const auto& selector : {"ssh", "web", ""}) {
    auto target = table.value->resolve(selector);
    ASSERT_TRUE(target.ok());
    EXPECT_EQ(target.value->to_string(), "localhost:2200");
  }
  EXPECT_EQ(table.value->describe(), "* -> localhost:2200");
}

TEST(ServiceTableTest, DefaultsToLocalSsh) {
  auto table = ServiceTable::from_config(AgentConfig{});
  ASSERT_TRUE(table.ok());
  EXPECT_EQ(table.value->resolve("anything").value->to_string(), "127.0.0.1:22");
}

TEST(ServiceTableTest, ServiceListWinsOverLegacyTarget) {
  AgentConfig config;
  config.local_target = "127.0.0.1:9999";
  config.services_json = R"({"services":[{"name":"ssh","port":22}]})";
  auto table = ServiceTable::from_config(config);
  ASSERT_TRUE(table.ok());
  EXPECT_FALSE(table.value->has_fallback());
  EXPECT_EQ(table.value->resolve("web").code(), ErrorCode::NotFound);
}

TEST(ServiceTableTest, EmptyTableDescribesNone) {
  ServiceTable table;
  EXPECT_EQ(table.describe(), "(none)");
  EXPECT_EQ(table.resolve("ssh").code(), ErrorCode::NotFound);
}

// --- LocalTargetTest ---

TEST(LocalTargetTest, Parse) {
  auto full = parse_local_target("10.0.0.5:5432");
  ASSERT_TRUE(full.ok());
  EXPECT_EQ(full.value->host, "10.0.0.5");
  EXPECT_EQ(full.value->port, 5432);

  auto port_only = parse_local_target(":8080");
  ASSERT_TRUE(port_only.ok());
  EXPECT_EQ(port_only.value->host, "127.0.0.1");

  EXPECT_EQ(parse_local_target("nohost").code(), ErrorCode::InvalidArgument);
  EXPECT_EQ(parse_local_target("host:0").code(), ErrorCode::InvalidArgument);
  EXPECT_EQ(parse_local_target("host:99999").code(), ErrorCode::InvalidArgument);
  EXPECT_EQ(parse_local_target("host:ssh").code(), ErrorCode::InvalidArgument);
}
