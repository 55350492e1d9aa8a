#pragma once

#include <asio.hpp>
#include <memory>
#include <string>

#include "core/config.hpp"
#include "core/route.hpp"
#include "core/types.hpp"
#include "relay/route_table.hpp"
#include "relay/session_registry.hpp"

namespace kuberde::auth {
class TokenIssuer;
}

namespace kuberde::relay {

/**
 * kuberde-server: accepts agent tunnels, routes inbound TCP ports and HTTP hosts
 * onto streams of the matching agent session, and serves the management and
 * login endpoints on one HTTP port.
 *
 * Runs its own io threads (config.io_threads) between start() and stop().
 */
class RelayServer {
 public:
  explicit RelayServer(ServerConfig config);

  ~RelayServer();

  RelayServer(const RelayServer&) = delete;
  RelayServer& operator=(const RelayServer&) = delete;

  Status start();

  void stop();

  // Blocks until stop() was called
  void wait();

  uint16_t http_port() const;

  // RegisterRoute / DeregisterRoute without the HTTP layer, including TCP listener handling
  Result<RegisterOutcome> register_route(const RouteSpec& route);

  Status deregister_route(const RouteKey& key, bool idle = false);

  RouteTable& routes();

  SessionRegistry& sessions();

  const auth::TokenIssuer& issuer() const;

  const ServerConfig& config() const;

 private:
  class Impl;

  std::shared_ptr<Impl> impl_;
};

}  // namespace kuberde::relay
