#include <gtest/gtest.h>

#include <asio.hpp>
#include <chrono>
#include <memory>
#include <thread>

#include "controller/controller.hpp"
#include "controller/reconciler.hpp"
#include "controller/route_plan.hpp"
#include "core/identity.hpp"
#include "fakes/fake_cluster.hpp"
#include "fakes/fake_relay.hpp"

using namespace kuberde;
using namespace kuberde::controller;

namespace {

const std::string kIdentity = "user-alice-ws";

AgentWorkload make_workload(Timestamp created, const std::string& name = "ws", const std::string& owner = "alice") {
  AgentWorkload wl;
  wl.name = name;
  wl.namespace_ = "kuberde";
  wl.uid = "uid-" + name;
  wl.generation = 1;
  wl.creation_timestamp = created;
  wl.owner = owner;
  wl.server_url = "ws://kuberde-server:8080/ws";
  wl.ttl = std::chrono::minutes(30);
  wl.container.image = "ghcr.io/example/dev:1.2";

  ServiceSpec ssh;
  ssh.name = "ssh";
  ssh.port = 22;
  ssh.external_port = 30022;
  ServiceSpec web;
  web.name = "web";
  web.port = 8080;
  web.protocol = Protocol::Http;
  wl.services = {ssh, web};
  return wl;
}

ControllerConfig fast_config() {
  ControllerConfig config;
  config.agent_image = "kuberde/agent:test";
  config.status_retry = BackoffConfig{std::chrono::milliseconds(1), std::chrono::milliseconds(4), 2.0, 5};
  return config;
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = std::chrono::milliseconds(5000)) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

class ReconcilerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = fast_config();
    cluster_.add(make_workload(now_));
    reconciler_ = std::make_unique<Reconciler>(cluster_, relay_, config_, [this] { return now_; });
  }

  AgentWorkload stored() const {
    return cluster_.workload("ws");
  }

  int replicas() const {
    return cluster_.deployment(kIdentity)["spec"]["replicas"].get<int>();
  }

  // First pass at creation time, then past the 30m TTL
  void go_idle() {
    reconciler_->reconcile("ws");
    now_ += std::chrono::minutes(31);
    auto report = reconciler_->reconcile("ws");
    ASSERT_EQ(report.phase, Phase::Idle) << report.status.to_string();
  }

  Timestamp now_ = std::chrono::system_clock::from_time_t(1740823200);
  ControllerConfig config_;
  fakes::FakeCluster cluster_;
  fakes::FakeRelay relay_;
  std::unique_ptr<Reconciler> reconciler_;
};

}  // namespace

// --- ReconcilerTest ---

TEST_F(ReconcilerTest, FirstPassCreatesDeploymentAndRoutes) {
  auto report = reconciler_->reconcile("ws");
  EXPECT_TRUE(report.status.ok()) << report.status.to_string();
  EXPECT_EQ(report.identity, kIdentity);
  EXPECT_EQ(report.phase, Phase::Reconciling);
  EXPECT_FALSE(report.deleted);

  auto wl = stored();
  EXPECT_TRUE(wl.has_finalizer());
  EXPECT_EQ(wl.status.phase, Phase::Reconciling);
  EXPECT_EQ(wl.status.message, "waiting for agent");
  EXPECT_EQ(wl.status.observed_generation, 1);

  EXPECT_EQ(cluster_.creates.load(), 1);
  EXPECT_EQ(replicas(), 1);

  EXPECT_EQ(relay_.table().list(kIdentity).size(), 2u);
  auto ssh = relay_.table().lookup(RouteKey::tcp(30022));
  ASSERT_TRUE(ssh.ok());
  EXPECT_EQ(ssh.value->route.agent_id, "user-alice-ws-ssh");
  EXPECT_EQ(ssh.value->route.service, "ssh");
  EXPECT_EQ(ssh.value->route.owner_workload(), kIdentity);
  auto web = relay_.table().lookup(RouteKey::http("web." + kIdentity));
  ASSERT_TRUE(web.ok());
  EXPECT_EQ(web.value->route.agent_id, "user-alice-ws-web");
}

TEST_F(ReconcilerTest, ReadyOnceAgentIsOnline) {
  reconciler_->reconcile("ws");
  cluster_.set_auto_ready(true);
  relay_.set_activity(kIdentity, AgentActivity{true, now_, 0});

  auto report = reconciler_->reconcile("ws");
  EXPECT_TRUE(report.status.ok());
  EXPECT_EQ(report.phase, Phase::Ready);
  EXPECT_EQ(stored().status.phase, Phase::Ready);
  EXPECT_EQ(stored().status.message, "");
  EXPECT_EQ(stored().status.replicas, 1);

  // Converged: a further pass changes nothing anywhere
  int registers = relay_.registers.load();
  int deregisters = relay_.deregisters.load();
  int writes = cluster_.status_writes.load();
  int scales = cluster_.scales.load();
  int replaces = cluster_.replaces.load();
  int deletes = cluster_.deletes.load();
  report = reconciler_->reconcile("ws");
  EXPECT_EQ(report.phase, Phase::Ready);
  EXPECT_EQ(relay_.registers.load(), registers);
  EXPECT_EQ(relay_.deregisters.load(), deregisters);
  EXPECT_EQ(cluster_.status_writes.load(), writes);
  EXPECT_EQ(cluster_.scales.load(), scales);
  EXPECT_EQ(cluster_.replaces.load(), replaces);
  EXPECT_EQ(cluster_.deletes.load(), deletes);
  EXPECT_EQ(cluster_.creates.load(), 1);
  EXPECT_EQ(relay_.table().list(kIdentity).size(), 2u);
}

TEST_F(ReconcilerTest, ScaleDownHappensExactlyAtTtl) {
  reconciler_->reconcile("ws");

  now_ += std::chrono::minutes(30) - std::chrono::milliseconds(1);
  auto report = reconciler_->reconcile("ws");
  EXPECT_NE(report.phase, Phase::Idle);
  EXPECT_EQ(replicas(), 1);
  EXPECT_EQ(relay_.table().list(kIdentity).size(), 2u);

  now_ += std::chrono::milliseconds(1);
  report = reconciler_->reconcile("ws");
  EXPECT_EQ(report.phase, Phase::Idle);
  EXPECT_EQ(replicas(), 0);
  EXPECT_TRUE(relay_.table().list(kIdentity).empty());
}

TEST_F(ReconcilerTest, IdleWorkloadScalesToZero) {
  go_idle();

  EXPECT_EQ(replicas(), 0);
  EXPECT_TRUE(relay_.table().list(kIdentity).empty());
  EXPECT_EQ(relay_.table().list_idle(kIdentity).size(), 2u);

  auto wl = stored();
  EXPECT_EQ(wl.status.phase, Phase::Idle);
  EXPECT_EQ(wl.status.replicas, 0);
  EXPECT_NE(wl.status.message.find("without activity"), std::string::npos) << wl.status.message;

  // Staying idle does not touch the Deployment again
  int scales = cluster_.scales.load();
  now_ += std::chrono::minutes(5);
  reconciler_->reconcile("ws");
  EXPECT_EQ(cluster_.scales.load(), scales);
  EXPECT_EQ(relay_.table().list_idle(kIdentity).size(), 2u);
}

TEST_F(ReconcilerTest, ActiveConnectionsPreventScaleDown) {
  reconciler_->reconcile("ws");
  now_ += std::chrono::hours(2);
  relay_.set_activity(kIdentity, AgentActivity{true, now_ - std::chrono::hours(2), 1});

  auto report = reconciler_->reconcile("ws");
  EXPECT_NE(report.phase, Phase::Idle);
  EXPECT_EQ(replicas(), 1);
  ASSERT_TRUE(stored().status.last_activity.has_value());
  EXPECT_TRUE(*stored().status.last_activity == now_);
}

TEST_F(ReconcilerTest, RelayActivityDefersScaleDown) {
  reconciler_->reconcile("ws");
  relay_.set_activity(kIdentity, AgentActivity{true, now_ + std::chrono::minutes(20), 0});
  now_ += std::chrono::minutes(40);

  auto report = reconciler_->reconcile("ws");
  EXPECT_NE(report.phase, Phase::Idle);
  EXPECT_EQ(replicas(), 1);
}

TEST_F(ReconcilerTest, NoTtlNeverScalesDown) {
  cluster_.edit("ws", [](AgentWorkload& wl) { wl.ttl = std::chrono::milliseconds(0); });
  reconciler_->reconcile("ws");
  now_ += std::chrono::hours(48);
  auto report = reconciler_->reconcile("ws");
  EXPECT_NE(report.phase, Phase::Idle);
  EXPECT_EQ(replicas(), 1);
}

TEST_F(ReconcilerTest, ScaleUpBringsIdleWorkloadBack) {
  go_idle();
  now_ += std::chrono::minutes(1);

  auto report = reconciler_->scale_up("ws");
  EXPECT_TRUE(report.status.ok()) << report.status.to_string();
  EXPECT_EQ(report.phase, Phase::Reconciling);

  EXPECT_EQ(replicas(), 1);
  EXPECT_EQ(cluster_.creates.load(), 1);
  EXPECT_EQ(relay_.table().list(kIdentity).size(), 2u);
  EXPECT_TRUE(relay_.table().list_idle(kIdentity).empty());

  auto wl = stored();
  ASSERT_TRUE(wl.status.last_activity.has_value());
  EXPECT_TRUE(*wl.status.last_activity == now_);

  // The fresh activity keeps it up on the next pass
  now_ += std::chrono::minutes(10);
  report = reconciler_->reconcile("ws");
  EXPECT_NE(report.phase, Phase::Idle);
}

TEST_F(ReconcilerTest, ScaleUpUnknownWorkload) {
  auto report = reconciler_->scale_up("nope");
  EXPECT_EQ(report.status.code, ErrorCode::NotFound);
  EXPECT_FALSE(report.deleted);
}

TEST_F(ReconcilerTest, RelayRestartReparksIdleRoutes) {
  go_idle();
  relay_.restart();
  ASSERT_TRUE(relay_.table().list_idle(kIdentity).empty());

  now_ += std::chrono::minutes(1);
  auto report = reconciler_->reconcile("ws");
  EXPECT_EQ(report.phase, Phase::Idle);
  EXPECT_TRUE(relay_.table().list(kIdentity).empty());
  EXPECT_EQ(relay_.table().list_idle(kIdentity).size(), 2u);
  EXPECT_EQ(replicas(), 0);
}

TEST_F(ReconcilerTest, RelayRestartRestoresActiveRoutes) {
  reconciler_->reconcile("ws");
  relay_.restart();

  auto report = reconciler_->reconcile("ws");
  EXPECT_TRUE(report.status.ok());
  EXPECT_EQ(relay_.table().list(kIdentity).size(), 2u);
  EXPECT_EQ(cluster_.creates.load(), 1);
}

TEST_F(ReconcilerTest, RelayOutageIsRetriedNextPass) {
  relay_.set_unavailable(true);
  auto report = reconciler_->reconcile("ws");
  EXPECT_EQ(report.status.code, ErrorCode::Unavailable);
  EXPECT_EQ(report.phase, Phase::Reconciling);
  EXPECT_EQ(stored().status.message, "relay unreachable");
  EXPECT_TRUE(cluster_.has_deployment(kIdentity));

  relay_.set_unavailable(false);
  report = reconciler_->reconcile("ws");
  EXPECT_TRUE(report.status.ok());
  EXPECT_EQ(relay_.table().list(kIdentity).size(), 2u);
  EXPECT_EQ(stored().status.message, "waiting for agent");
}

TEST_F(ReconcilerTest, SpecErrorIsReportedAsFailed) {
  cluster_.edit("ws", [](AgentWorkload& wl) { wl.spec_error = Status::failure(ErrorCode::InvalidArgument, "services[0]: port out of range"); });

  auto report = reconciler_->reconcile("ws");
  EXPECT_EQ(report.phase, Phase::Failed);
  EXPECT_EQ(report.status.code, ErrorCode::InvalidArgument);

  auto wl = stored();
  EXPECT_EQ(wl.status.phase, Phase::Failed);
  EXPECT_EQ(wl.status.message, "services[0]: port out of range");
  EXPECT_TRUE(wl.has_finalizer());
  EXPECT_FALSE(cluster_.has_deployment(kIdentity));
  EXPECT_EQ(relay_.table().size(), 0u);
}

TEST_F(ReconcilerTest, DeletionReleasesEverything) {
  reconciler_->reconcile("ws");
  ASSERT_EQ(relay_.table().list(kIdentity).size(), 2u);

  cluster_.mark_deleted("ws", now_);
  auto report = reconciler_->reconcile("ws");
  EXPECT_TRUE(report.status.ok()) << report.status.to_string();
  EXPECT_TRUE(report.deleted);
  EXPECT_EQ(report.phase, Phase::Terminating);

  EXPECT_FALSE(cluster_.has_workload("ws"));
  EXPECT_FALSE(cluster_.has_deployment(kIdentity));
  EXPECT_EQ(relay_.table().size(), 0u);
  EXPECT_FALSE(relay_.table().has_tcp_port(30022));
}

TEST_F(ReconcilerTest, DeletionAfterIdleDropsMarkers) {
  go_idle();
  cluster_.mark_deleted("ws", now_);

  auto report = reconciler_->reconcile("ws");
  EXPECT_TRUE(report.deleted);
  EXPECT_TRUE(relay_.table().list_idle(kIdentity).empty());
  EXPECT_FALSE(relay_.table().has_tcp_port(30022));
  EXPECT_FALSE(cluster_.has_deployment(kIdentity));
}

TEST_F(ReconcilerTest, GoneWorkloadsAreReportedDeleted) {
  auto report = reconciler_->reconcile("missing");
  EXPECT_TRUE(report.deleted);
  EXPECT_TRUE(report.status.ok());

  // Deleted before the finalizer was ever added: nothing to release
  cluster_.add(make_workload(now_, "bare"));
  cluster_.mark_deleted("bare", now_);
  report = reconciler_->reconcile("bare");
  EXPECT_TRUE(report.deleted);
  EXPECT_EQ(cluster_.deletes.load(), 0);
}

TEST_F(ReconcilerTest, StatusConflictIsRetried) {
  cluster_.inject_status_conflicts(2);
  auto report = reconciler_->reconcile("ws");
  EXPECT_TRUE(report.status.ok()) << report.status.to_string();
  EXPECT_EQ(cluster_.status_writes.load(), 1);
  EXPECT_EQ(stored().status.phase, Phase::Reconciling);
}

TEST_F(ReconcilerTest, StatusConflictGivesUpAfterRetryBudget) {
  cluster_.inject_status_conflicts(100);
  auto report = reconciler_->reconcile("ws");
  EXPECT_EQ(report.status.code, ErrorCode::ReconcileConflict);
  EXPECT_EQ(cluster_.status_writes.load(), 0);
}

TEST_F(ReconcilerTest, TemplateChangeReplacesDeployment) {
  reconciler_->reconcile("ws");
  std::string before = cluster_.deployment(kIdentity)["metadata"]["annotations"][kTemplateHashAnnotation].get<std::string>();

  cluster_.edit("ws", [](AgentWorkload& wl) { wl.container.image = "ghcr.io/example/dev:1.3"; });
  auto report = reconciler_->reconcile("ws");
  EXPECT_TRUE(report.status.ok()) << report.status.to_string();
  EXPECT_EQ(cluster_.replaces.load(), 1);
  EXPECT_EQ(cluster_.creates.load(), 1);

  json deployment = cluster_.deployment(kIdentity);
  EXPECT_NE(deployment["metadata"]["annotations"][kTemplateHashAnnotation].get<std::string>(), before);
  EXPECT_NE(deployment.dump().find("ghcr.io/example/dev:1.3"), std::string::npos);
  EXPECT_EQ(stored().status.observed_generation, 2);
}

TEST_F(ReconcilerTest, RemovedServiceDropsItsRoute) {
  reconciler_->reconcile("ws");
  cluster_.edit("ws", [](AgentWorkload& wl) { wl.services.pop_back(); });

  auto report = reconciler_->reconcile("ws");
  EXPECT_TRUE(report.status.ok());
  EXPECT_EQ(relay_.table().list(kIdentity).size(), 1u);
  EXPECT_FALSE(relay_.table().lookup(RouteKey::http("web." + kIdentity)).ok());
  EXPECT_TRUE(relay_.table().lookup(RouteKey::tcp(30022)).ok());
}

TEST_F(ReconcilerTest, ChangedExternalPortMovesRoute) {
  reconciler_->reconcile("ws");
  cluster_.edit("ws", [](AgentWorkload& wl) { wl.services[0].external_port = 30023; });

  reconciler_->reconcile("ws");
  EXPECT_FALSE(relay_.table().lookup(RouteKey::tcp(30022)).ok());
  auto moved = relay_.table().lookup(RouteKey::tcp(30023));
  ASSERT_TRUE(moved.ok());
  EXPECT_EQ(moved.value->route.service, "ssh");
}

TEST_F(ReconcilerTest, ForeignRouteIsReportedAsConflict) {
  RouteSpec foreign{RouteKey::tcp(30022), "user-bob-ws-ssh", "ssh", "user-bob-ws"};
  ASSERT_TRUE(relay_.table().register_route(foreign).ok());

  auto report = reconciler_->reconcile("ws");
  EXPECT_EQ(report.status.code, ErrorCode::Conflict);
  EXPECT_EQ(report.phase, Phase::Reconciling);
  EXPECT_NE(stored().status.message.find("bound to"), std::string::npos) << stored().status.message;

  // The other service still gets its route; the foreign binding is untouched
  EXPECT_TRUE(relay_.table().lookup(RouteKey::http("web." + kIdentity)).ok());
  EXPECT_EQ(relay_.table().lookup(RouteKey::tcp(30022)).value->route.agent_id, "user-bob-ws-ssh");
}

TEST_F(ReconcilerTest, ReconcileAllVisitsEveryWorkload) {
  cluster_.add(make_workload(now_, "db", "bob"));
  cluster_.edit("db", [](AgentWorkload& wl) { wl.services[0].external_port = 30033; });

  auto reports = reconciler_->reconcile_all();
  ASSERT_TRUE(reports.ok());
  ASSERT_EQ(reports.value->size(), 2u);
  EXPECT_EQ(relay_.table().list("user-bob-db").size(), 2u);
  EXPECT_EQ(relay_.table().list(kIdentity).size(), 2u);

  cluster_.fail_lists(true);
  auto failed = reconciler_->reconcile_all();
  EXPECT_EQ(failed.code(), ErrorCode::Unavailable);
}

TEST_F(ReconcilerTest, CancelStopsThePass) {
  reconciler_->cancel();
  auto reports = reconciler_->reconcile_all();
  ASSERT_TRUE(reports.ok());
  EXPECT_TRUE(reports.value->empty());
  EXPECT_EQ(cluster_.creates.load(), 0);

  reconciler_->resume();
  reports = reconciler_->reconcile_all();
  ASSERT_TRUE(reports.ok());
  EXPECT_EQ(reports.value->size(), 1u);
}

// --- RoutePlanTest ---

TEST(RoutePlanTest, DesiredRoutes) {
  auto wl = make_workload(std::chrono::system_clock::now());
  wl.services[0].external_port.reset();

  auto routes = desired_routes(wl, 30000, 30100);
  ASSERT_EQ(routes.size(), 2u);
  EXPECT_EQ(routes[0].key.kind, RouteKind::Tcp);
  EXPECT_EQ(routes[0].key.port, hash_to_port(kIdentity + "/ssh", 30000, 30100));
  EXPECT_GE(routes[0].key.port, 30000);
  EXPECT_LE(routes[0].key.port, 30100);
  EXPECT_EQ(routes[0].agent_id, "user-alice-ws-ssh");
  EXPECT_EQ(routes[0].workload, kIdentity);

  EXPECT_EQ(routes[1].key, RouteKey::http("web.user-alice-ws"));
  EXPECT_EQ(routes[1].service, "web");
}

TEST(RoutePlanTest, Diff) {
  auto wl = make_workload(std::chrono::system_clock::now());
  auto desired = desired_routes(wl, 30000, 32767);

  EXPECT_TRUE(diff_routes(desired, desired).empty());

  std::vector<RouteSpec> observed = desired;
  observed[0].agent_id = "user-alice-ws-old";
  observed.push_back(RouteSpec{RouteKey::tcp(30999), "user-alice-ws-db", "db", kIdentity});

  auto diff = diff_routes(desired, observed);
  ASSERT_EQ(diff.to_register.size(), 1u);
  EXPECT_EQ(diff.to_register[0].key, RouteKey::tcp(30022));
  ASSERT_EQ(diff.to_remove.size(), 1u);
  EXPECT_EQ(diff.to_remove[0], RouteKey::tcp(30999));
}

// --- ControllerTest ---

TEST(ControllerTest, ScaleUpHttpStatus) {
  EXPECT_EQ(scale_up_http_status(ScaleUpAnswer::Accepted), 202);
  EXPECT_EQ(scale_up_http_status(ScaleUpAnswer::AlreadyRunning), 200);
  EXPECT_EQ(scale_up_http_status(ScaleUpAnswer::Unknown), 404);
  EXPECT_EQ(scale_up_http_status(ScaleUpAnswer::NotReady), 503);
}

TEST(ControllerTest, ScaleUpSignalWakesIdleWorkload) {
  auto cluster = std::make_shared<fakes::FakeCluster>();
  auto relay = std::make_shared<fakes::FakeRelay>();
  cluster->add(make_workload(std::chrono::system_clock::now() - std::chrono::hours(2)));
  cluster->set_auto_ready(true);
  relay->set_activity(kIdentity, AgentActivity{true, std::chrono::system_clock::now() - std::chrono::hours(2), 0});

  ControllerConfig config = fast_config();
  config.health_address = "127.0.0.1";
  config.health_port = 0;
  config.reconcile_interval = std::chrono::milliseconds(50);

  Controller controller(config, cluster, relay);
  EXPECT_EQ(controller.request_scale_up(kIdentity), ScaleUpAnswer::NotReady);

  ASSERT_TRUE(controller.start().ok());
  ASSERT_TRUE(eventually([&] { return controller.ready(); }));
  ASSERT_TRUE(eventually([&] { return cluster->workload("ws").status.phase == Phase::Idle; }));

  EXPECT_EQ(controller.request_scale_up("user-nobody-x"), ScaleUpAnswer::Unknown);
  EXPECT_EQ(controller.request_scale_up(kIdentity), ScaleUpAnswer::Accepted);

  EXPECT_TRUE(eventually([&] { return cluster->has_deployment(kIdentity) && cluster->deployment(kIdentity)["spec"]["replicas"].get<int>() == 1; }));
  EXPECT_TRUE(eventually([&] { return controller.request_scale_up(kIdentity) == ScaleUpAnswer::AlreadyRunning; }));
  EXPECT_EQ(relay->table().list(kIdentity).size(), 2u);

  controller.stop();
}

TEST(ControllerTest, ReadyzAnswersAfterFirstPass) {
  auto cluster = std::make_shared<fakes::FakeCluster>();
  auto relay = std::make_shared<fakes::FakeRelay>();
  cluster->add(make_workload(std::chrono::system_clock::now()));

  ControllerConfig config = fast_config();
  config.health_address = "127.0.0.1";
  config.health_port = 0;
  config.reconcile_interval = std::chrono::milliseconds(50);

  Controller controller(config, cluster, relay);
  ASSERT_TRUE(controller.start().ok());
  ASSERT_NE(controller.health_port(), 0);
  ASSERT_TRUE(eventually([&] { return controller.ready(); }));

  asio::io_context io;
  asio::ip::tcp::socket socket(io);
  socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), controller.health_port()));
  std::string request = "GET /readyz HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n";
  asio::write(socket, asio::buffer(request));

  std::string head;
  asio::read_until(socket, asio::dynamic_buffer(head), "\r\n\r\n");
  EXPECT_EQ(head.rfind("HTTP/1.1 200", 0), 0u) << head;

  controller.stop();
}
