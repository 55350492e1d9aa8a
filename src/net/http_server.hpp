#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "net/http_message.hpp"

namespace kuberde::net {

// Handler replies exactly once through the responder; it may reply asynchronously
using Responder = std::function<void(HttpReply)>;
using RequestHandler = std::function<void(const HttpRequest&, Responder)>;

// Takes ownership of the raw connection after the request head has been read.
// raw_head is the head exactly as received, leftover holds bytes read past it.
using TakeoverMatcher = std::function<bool(const HttpRequest&)>;
using TakeoverHandler = std::function<void(HttpRequest, std::shared_ptr<asio::ip::tcp::socket>, std::string raw_head, std::string leftover)>;

struct HttpServerOptions {
  std::chrono::milliseconds read_timeout{10000};
  size_t max_header_bytes = 16 * 1024;
  size_t max_body_bytes = 1024 * 1024;
};

// Minimal HTTP/1.1 server: one request per connection, exact-path and prefix routes,
// plus connection takeover for upgrades and raw proxying
class HttpServer : public std::enable_shared_from_this<HttpServer> {
 public:
  HttpServer(asio::io_context& io_ctx, HttpServerOptions options = {});

  ~HttpServer();

  // Exact path match; method "*" matches any method
  void handle(const std::string& method, const std::string& path, RequestHandler handler);

  // Longest-prefix match among prefix routes
  void handle_prefix(const std::string& method, const std::string& prefix, RequestHandler handler);

  // Checked before routes, in registration order
  void takeover(TakeoverMatcher matcher, TakeoverHandler handler);

  // Binds and starts accepting; port 0 picks an ephemeral port
  Status listen(const std::string& address, uint16_t port);

  uint16_t port() const {
    return port_.load();
  }

  void stop();

 private:
  struct Route {
    std::string method;
    std::string path;
    bool prefix = false;
    RequestHandler handler;
  };

  struct Takeover {
    TakeoverMatcher matcher;
    TakeoverHandler handler;
  };

  class Connection;

  void do_accept();

  // Returns true when a takeover claimed the connection
  bool dispatch_takeover(const HttpRequest& req, std::shared_ptr<asio::ip::tcp::socket> socket, const std::string& raw_head,
                         const std::string& leftover);

  void dispatch(const HttpRequest& req, Responder responder);

  asio::io_context& io_ctx_;
  HttpServerOptions options_;
  asio::ip::tcp::acceptor acceptor_;
  std::atomic<uint16_t> port_{0};

  std::mutex mutex_;
  std::vector<Route> routes_;
  std::vector<Takeover> takeovers_;
};

}  // namespace kuberde::net
