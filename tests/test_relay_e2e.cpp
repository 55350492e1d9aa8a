#include <gtest/gtest.h>

#include <array>
#include <asio.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "agent/service_table.hpp"
#include "agent/tunnel_agent.hpp"
#include "auth/issuer.hpp"
#include "mux/session.hpp"
#include "mux/stream.hpp"
#include "net/http_client.hpp"
#include "net/http_message.hpp"
#include "net/http_server.hpp"
#include "relay/relay_server.hpp"
#include "tunnel/handshake.hpp"

using namespace kuberde;
using asio::ip::tcp;

namespace {

const std::string kIdentity = "user-alice-ws";

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = std::chrono::milliseconds(5000)) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

uint16_t free_port() {
  asio::io_context io;
  tcp::acceptor acceptor(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  return acceptor.local_endpoint().port();
}

// Local service behind the agent: writes back whatever it reads
class EchoServer {
 public:
  EchoServer() : acceptor_(io_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    accept();
    thread_ = std::thread([this] { io_.run(); });
  }

  ~EchoServer() {
    io_.stop();
    thread_.join();
  }

  uint16_t port() const {
    return port_;
  }

 private:
  using Buffer = std::array<char, 4096>;

  void accept() {
    acceptor_.async_accept([this](const asio::error_code& ec, tcp::socket socket) {
      if (ec) return;
      echo(std::make_shared<tcp::socket>(std::move(socket)), std::make_shared<Buffer>());
      accept();
    });
  }

  static void echo(std::shared_ptr<tcp::socket> socket, std::shared_ptr<Buffer> buffer) {
    socket->async_read_some(asio::buffer(*buffer), [socket, buffer](const asio::error_code& ec, size_t n) {
      if (ec) return;
      asio::async_write(*socket, asio::buffer(buffer->data(), n), [socket, buffer](const asio::error_code& ec, size_t) {
        if (!ec) echo(socket, buffer);
      });
    });
  }

  asio::io_context io_;
  tcp::acceptor acceptor_;
  uint16_t port_ = 0;
  std::thread thread_;
};

// Stand-in for kuberde-operator's /scale-up endpoint
class ScaleUpSink {
 public:
  ScaleUpSink() : server_(std::make_shared<net::HttpServer>(io_)) {
    server_->handle("POST", "/scale-up", [this](const net::HttpRequest& req, net::Responder respond) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        signals_.push_back(json::parse(req.body, nullptr, false));
      }
      respond(net::HttpReply::json_body(202, json{{"status", "accepted"}}));
    });
    status_ = server_->listen("127.0.0.1", 0);
    work_.emplace(io_.get_executor());
    thread_ = std::thread([this] { io_.run(); });
  }

  ~ScaleUpSink() {
    server_->stop();
    work_.reset();
    io_.stop();
    thread_.join();
  }

  std::string url() const {
    return "http://127.0.0.1:" + std::to_string(server_->port());
  }

  std::vector<json> signals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signals_;
  }

  Status status_;

 private:
  asio::io_context io_;
  std::shared_ptr<net::HttpServer> server_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread thread_;
  mutable std::mutex mutex_;
  std::vector<json> signals_;
};

class RelayE2ETest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(sink_.status_.ok()) << sink_.status_.to_string();

    ServerConfig config;
    config.listen_address = "127.0.0.1";
    config.http_port = 0;
    config.tcp_port_min = 1024;
    config.tcp_port_max = 65535;
    config.agent_domain = "agents.test";
    config.io_threads = 2;
    config.controller_url = sink_.url();
    config.auth.signing_key = "e2e-signing-key-0123456789abcdef";
    server_ = std::make_unique<relay::RelayServer>(config);
    auto status = server_->start();
    ASSERT_TRUE(status.ok()) << status.to_string();
    base_url_ = "http://127.0.0.1:" + std::to_string(server_->http_port());

    work_.emplace(io_.get_executor());
    thread_ = std::thread([this] { io_.run(); });
    http_ = std::make_shared<net::HttpClient>(io_);
  }

  void TearDown() override {
    for (auto& agent : agents_) agent->stop();
    if (server_) server_->stop();
    work_.reset();
    io_.stop();
    if (thread_.joinable()) thread_.join();
    agents_.clear();
  }

  std::string token_for(const std::string& username, std::vector<std::string> roles = {}) {
    auth::Claims claims;
    claims.subject = "user:" + username;
    claims.username = username;
    claims.roles = std::move(roles);
    return server_->issuer().mint(claims, std::chrono::seconds(600)).access_token;
  }

  std::shared_ptr<agent::TunnelAgent> start_agent(const std::string& identity, const std::string& token) {
    AgentConfig config;
    config.server_url = base_url_ + "/ws";
    config.agent_id = identity;
    config.reconnect = BackoffConfig{std::chrono::milliseconds(50), std::chrono::milliseconds(200), 2.0, 0};

    ServiceSpec ssh;
    ssh.name = "ssh";
    ssh.port = echo_.port();
    ServiceSpec web;
    web.name = "web";
    web.port = echo_.port();
    web.protocol = Protocol::Http;

    auto agent = std::make_shared<agent::TunnelAgent>(io_, config, agent::ServiceTable({ssh, web}), [token] { return token; });
    agent->start();
    agents_.push_back(agent);
    return agent;
  }

  bool agent_online(const std::string& identity) {
    return eventually([&] { return server_->sessions().find(identity) != nullptr; });
  }

  net::HttpResponse call(const std::string& method, const std::string& path, const std::string& token, const std::string& body = {}) {
    net::HttpOptions opts;
    opts.method = method;
    opts.timeout = std::chrono::milliseconds(5000);
    if (!token.empty()) opts.headers["Authorization"] = "Bearer " + token;
    if (!body.empty()) {
      opts.headers["Content-Type"] = "application/json";
      opts.body = body;
    }
    return http_->request(base_url_ + path, opts).get();
  }

  tcp::socket dial(uint16_t port) {
    tcp::socket socket(client_io_);
    socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    return socket;
  }

  // Sends payload and reads the same number of bytes back
  std::string round_trip(tcp::socket& socket, const std::string& payload) {
    asio::write(socket, asio::buffer(payload));
    std::string reply(payload.size(), '\0');
    asio::read(socket, asio::buffer(&reply[0], reply.size()));
    return reply;
  }

  // True when the relay drops the connection within the limit instead of leaving it hanging
  bool closed_by_peer(tcp::socket& socket, std::chrono::milliseconds limit = std::chrono::milliseconds(3000)) {
    auto read = std::async(std::launch::async, [&socket] {
      asio::error_code ec;
      char byte = 0;
      socket.read_some(asio::buffer(&byte, 1), ec);
      return ec;
    });
    if (read.wait_for(limit) == std::future_status::ready) return static_cast<bool>(read.get());
    asio::error_code shutdown_ec;
    socket.shutdown(tcp::socket::shutdown_both, shutdown_ec);
    read.wait();
    return false;
  }

  // Sends a raw HTTP head and returns the response head
  std::string raw_request(tcp::socket& socket, const std::string& head) {
    asio::write(socket, asio::buffer(head));
    std::string response;
    asio::read_until(socket, asio::dynamic_buffer(response), "\r\n\r\n");
    return response;
  }

  EchoServer echo_;
  ScaleUpSink sink_;
  std::unique_ptr<relay::RelayServer> server_;
  std::string base_url_;

  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread thread_;
  std::shared_ptr<net::HttpClient> http_;
  std::vector<std::shared_ptr<agent::TunnelAgent>> agents_;

  asio::io_context client_io_;
};

}  // namespace

// --- RelayE2ETest ---

TEST_F(RelayE2ETest, TcpRouteReachesLocalService) {
  start_agent(kIdentity, token_for("alice"));
  ASSERT_TRUE(agent_online(kIdentity));

  uint16_t port = free_port();
  auto registered = server_->register_route(RouteSpec{RouteKey::tcp(port), "user-alice-ws-ssh", "ssh", kIdentity});
  ASSERT_TRUE(registered.ok()) << registered.status.to_string();

  auto socket = dial(port);
  EXPECT_EQ(round_trip(socket, "SSH-2.0-OpenSSH_9.6\r\n"), "SSH-2.0-OpenSSH_9.6\r\n");
  EXPECT_EQ(round_trip(socket, std::string(20000, 'x')), std::string(20000, 'x'));

  EXPECT_TRUE(eventually([&] {
    auto stats = server_->sessions().stats(kIdentity);
    return stats && stats->active_connections == 1 && stats->total_connections == 1;
  }));
  socket.close();
  EXPECT_TRUE(eventually([&] {
    auto stats = server_->sessions().stats(kIdentity);
    return stats && stats->active_connections == 0;
  }));
}

TEST_F(RelayE2ETest, ManagementApiRegistersAndReportsActivity) {
  start_agent(kIdentity, token_for("alice"));
  ASSERT_TRUE(agent_online(kIdentity));

  uint16_t port = free_port();
  std::string body = RouteSpec{RouteKey::tcp(port), "user-alice-ws-ssh", "ssh", kIdentity}.to_json().dump();

  EXPECT_EQ(call("POST", "/mgmt/services/tcp", "", body).status_code, 401);
  EXPECT_EQ(call("POST", "/mgmt/services/tcp", token_for("bob"), body).status_code, 403);

  std::string admin = token_for("kuberde-operator", {"system"});
  EXPECT_EQ(call("POST", "/mgmt/services/tcp", admin, body).status_code, 201);
  EXPECT_EQ(call("POST", "/mgmt/services/tcp", admin, body).status_code, 200);

  auto socket = dial(port);
  EXPECT_EQ(round_trip(socket, "ping"), "ping");

  auto listed = call("GET", "/mgmt/routes?workload=" + kIdentity, token_for("alice"));
  ASSERT_EQ(listed.status_code, 200);
  auto routes = json::parse(listed.body);
  EXPECT_EQ(routes["routes"].size(), 1u);
  EXPECT_TRUE(routes["idle"].empty());

  auto activity = call("GET", "/mgmt/agents/" + kIdentity, admin);
  ASSERT_EQ(activity.status_code, 200);
  auto stats = json::parse(activity.body);
  EXPECT_TRUE(stats.value("online", false));
  EXPECT_GE(stats.value("activeConnections", 0), 1);

  socket.close();
  auto removed = call("DELETE", "/mgmt/services/tcp?port=" + std::to_string(port), admin);
  EXPECT_EQ(removed.status_code, 204);
  EXPECT_FALSE(server_->routes().lookup(RouteKey::tcp(port)).ok());
}

TEST_F(RelayE2ETest, ConnectUpgradeBridgesToService) {
  start_agent(kIdentity, token_for("alice"));
  ASSERT_TRUE(agent_online(kIdentity));

  auto upgrade = [&](const std::string& token) {
    return "GET /connect/" + kIdentity + "?service=ssh HTTP/1.1\r\nHost: 127.0.0.1\r\nConnection: Upgrade\r\nUpgrade: kuberde-mux\r\n" +
           "Authorization: Bearer " + token + "\r\n\r\n";
  };

  auto denied = dial(server_->http_port());
  EXPECT_EQ(raw_request(denied, upgrade(token_for("bob"))).rfind("HTTP/1.1 403", 0), 0u);

  auto socket = dial(server_->http_port());
  auto head = raw_request(socket, upgrade(token_for("alice")));
  ASSERT_EQ(head.rfind("HTTP/1.1 101", 0), 0u) << head;
  EXPECT_EQ(round_trip(socket, "hello through the relay"), "hello through the relay");
}

TEST_F(RelayE2ETest, ConnectToOfflineAgentAsksToRetry) {
  auto socket = dial(server_->http_port());
  auto head = raw_request(socket, "GET /connect/" + kIdentity + "?service=ssh HTTP/1.1\r\nHost: 127.0.0.1\r\nConnection: Upgrade\r\n" +
                                      "Upgrade: kuberde-mux\r\nAuthorization: Bearer " + token_for("alice") + "\r\n\r\n");
  EXPECT_EQ(head.rfind("HTTP/1.1 502", 0), 0u) << head;
  EXPECT_NE(head.find("Retry-After"), std::string::npos);
}

TEST_F(RelayE2ETest, HttpHostIsProxiedToAgent) {
  start_agent(kIdentity, token_for("alice"));
  ASSERT_TRUE(agent_online(kIdentity));

  // The echo service answers with the forwarded request itself
  auto socket = dial(server_->http_port());
  std::string request = "GET /index.html HTTP/1.1\r\nHost: web.user-alice-ws.agents.test\r\nAuthorization: Bearer " + token_for("alice") + "\r\n\r\n";
  auto echoed = raw_request(socket, request);
  EXPECT_EQ(echoed.rfind("GET /index.html HTTP/1.1\r\n", 0), 0u) << echoed;

  auto anonymous = dial(server_->http_port());
  auto head = raw_request(anonymous, "GET / HTTP/1.1\r\nHost: web.user-alice-ws.agents.test\r\n\r\n");
  EXPECT_EQ(head.rfind("HTTP/1.1 401", 0), 0u) << head;
}

TEST_F(RelayE2ETest, IdleRouteSignalsScaleUp) {
  uint16_t port = free_port();
  ASSERT_TRUE(server_->register_route(RouteSpec{RouteKey::tcp(port), "user-alice-ws-ssh", "ssh", kIdentity}).ok());
  ASSERT_TRUE(server_->deregister_route(RouteKey::tcp(port), true).ok());

  // The listener stays open for the idle marker; the hit is closed and signalled
  auto socket = dial(port);
  std::array<char, 16> buffer;
  asio::error_code ec;
  socket.read_some(asio::buffer(buffer), ec);
  EXPECT_TRUE(ec);

  ASSERT_TRUE(eventually([&] { return !sink_.signals().empty(); }));
  auto signal = sink_.signals().front();
  EXPECT_EQ(signal.value("agentID", ""), kIdentity);
  EXPECT_EQ(signal.value("idempotencyKey", ""), kIdentity);
  EXPECT_EQ(signal.value("key", ""), "tcp:" + std::to_string(port));

  // A second hit inside the cooldown is not signalled again
  auto again = dial(port);
  again.read_some(asio::buffer(buffer), ec);
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  EXPECT_EQ(sink_.signals().size(), 1u);
}

TEST_F(RelayE2ETest, TunnelRejectsForeignCredential) {
  auto attempt = [&](const std::string& token) {
    std::promise<Result<tunnel::UpgradedConnection>> promise;
    auto future = promise.get_future();
    tunnel::async_upgrade(io_, base_url_ + "/ws?id=" + kIdentity, token, std::chrono::milliseconds(5000),
                          [&promise](Result<tunnel::UpgradedConnection> result) { promise.set_value(std::move(result)); });
    EXPECT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    return future.get();
  };

  EXPECT_EQ(attempt(token_for("bob")).code(), ErrorCode::Forbidden);
  EXPECT_EQ(attempt("").code(), ErrorCode::Unauthorized);
  EXPECT_TRUE(server_->sessions().find(kIdentity) == nullptr);
}

TEST_F(RelayE2ETest, CredentialRefreshOnLiveSession) {
  auto agent = start_agent(kIdentity, token_for("alice"));
  ASSERT_TRUE(agent_online(kIdentity));

  std::promise<Status> accepted;
  agent->refresh_credential(token_for("alice"), [&accepted](const Status& status) { accepted.set_value(status); });
  auto ok = accepted.get_future();
  ASSERT_EQ(ok.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_TRUE(ok.get().ok());

  std::promise<Status> rejected;
  agent->refresh_credential(token_for("bob"), [&rejected](const Status& status) { rejected.set_value(status); });
  auto denied = rejected.get_future();
  ASSERT_EQ(denied.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(denied.get().code, ErrorCode::Unauthorized);

  // A rejected swap leaves the session in place
  EXPECT_TRUE(server_->sessions().find(kIdentity) != nullptr);
  EXPECT_EQ(agent->state(), agent::AgentState::Streaming);
}

TEST_F(RelayE2ETest, RouteForForeignWorkloadIsForbidden) {
  start_agent("user-bob-ws", token_for("bob"));
  ASSERT_TRUE(agent_online("user-bob-ws"));

  // alice owns the agent identity but points the route at bob's session
  uint16_t port = free_port();
  std::string hijack = RouteSpec{RouteKey::tcp(port), "user-alice-x-ssh", "ssh", "user-bob-ws"}.to_json().dump();
  EXPECT_EQ(call("POST", "/mgmt/services/tcp", token_for("alice"), hijack).status_code, 403);
  EXPECT_FALSE(server_->routes().lookup(RouteKey::tcp(port)).ok());

  // agentID must be the workload itself or one of its service identities
  std::string mismatched = RouteSpec{RouteKey::tcp(port), "user-alice-x-ssh", "ssh", kIdentity}.to_json().dump();
  EXPECT_EQ(call("POST", "/mgmt/services/tcp", token_for("alice"), mismatched).status_code, 400);

  std::string own = RouteSpec{RouteKey::tcp(port), "user-alice-ws-ssh", "ssh", kIdentity}.to_json().dump();
  EXPECT_EQ(call("POST", "/mgmt/services/tcp", token_for("alice"), own).status_code, 201);
}

TEST_F(RelayE2ETest, NewSessionSupersedesOld) {
  std::promise<Result<tunnel::UpgradedConnection>> upgraded;
  tunnel::async_upgrade(io_, base_url_ + "/ws?id=" + kIdentity, token_for("alice"), std::chrono::milliseconds(5000),
                        [&upgraded](Result<tunnel::UpgradedConnection> result) { upgraded.set_value(std::move(result)); });
  auto connection = upgraded.get_future().get();
  ASSERT_TRUE(connection.ok()) << connection.status.to_string();

  mux::SessionOptions options;
  options.keepalive_interval = std::chrono::milliseconds(0);
  auto first = mux::MuxSession::create(std::move(*connection.value->socket), mux::Role::Client, options, connection.value->leftover);
  std::promise<std::string> first_closed;
  first->start(nullptr, [&first_closed](const std::string& reason) { first_closed.set_value(reason); });

  ASSERT_TRUE(agent_online(kIdentity));
  auto first_on_relay = server_->sessions().find(kIdentity);

  start_agent(kIdentity, token_for("alice"));
  auto closed = first_closed.get_future();
  ASSERT_EQ(closed.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_TRUE(first_on_relay->is_closed());
  EXPECT_TRUE(eventually([&] {
    auto current = server_->sessions().find(kIdentity);
    return current != nullptr && current != first_on_relay;
  }));
  EXPECT_EQ(server_->sessions().size(), 1u);
}

TEST_F(RelayE2ETest, DisconnectedAgentClosesInboundImmediately) {
  auto agent = start_agent(kIdentity, token_for("alice"));
  ASSERT_TRUE(agent_online(kIdentity));

  uint16_t port = free_port();
  ASSERT_TRUE(server_->register_route(RouteSpec{RouteKey::tcp(port), "user-alice-ws-ssh", "ssh", kIdentity}).ok());

  agent->stop();
  ASSERT_TRUE(eventually([&] { return server_->sessions().find(kIdentity) == nullptr; }));

  // The route is still registered, so the listener accepts and then drops the connection
  auto socket = dial(port);
  EXPECT_TRUE(closed_by_peer(socket));
  EXPECT_TRUE(server_->routes().lookup(RouteKey::tcp(port)).ok());
}

TEST_F(RelayE2ETest, DeregisteredPortHasNoRoute) {
  start_agent(kIdentity, token_for("alice"));
  ASSERT_TRUE(agent_online(kIdentity));

  uint16_t port = free_port();
  ASSERT_TRUE(server_->register_route(RouteSpec{RouteKey::tcp(port), "user-alice-ws-ssh", "ssh", kIdentity}).ok());
  ASSERT_TRUE(server_->deregister_route(RouteKey::tcp(port)).ok());
  EXPECT_EQ(server_->routes().lookup(RouteKey::tcp(port)).code(), ErrorCode::NoRoute);

  tcp::socket socket(client_io_);
  asio::error_code ec;
  socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port), ec);
  if (!ec) {
    EXPECT_TRUE(closed_by_peer(socket));
  } else {
    EXPECT_EQ(ec, asio::error::connection_refused);
  }
}

TEST_F(RelayE2ETest, AgentResetsUnknownSelector) {
  start_agent(kIdentity, token_for("alice"));
  ASSERT_TRUE(agent_online(kIdentity));

  auto session = server_->sessions().find(kIdentity);
  ASSERT_TRUE(session != nullptr);
  auto stream = session->open_stream();
  ASSERT_TRUE(stream != nullptr);

  std::promise<asio::error_code> read_error;
  stream->async_write("postgres\n", [](const asio::error_code&, size_t) {});
  stream->async_read([&read_error](const asio::error_code& ec, std::string) { read_error.set_value(ec); });

  auto future = read_error.get_future();
  ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(future.get(), asio::error::connection_reset);

  // The session itself survives
  EXPECT_FALSE(session->is_closed());
}
