#include "net/http_server.hpp"

#include <spdlog/spdlog.h>

#include <array>

namespace kuberde::net {

// One inbound connection: read head, maybe body, dispatch, write reply, close
class HttpServer::Connection : public std::enable_shared_from_this<HttpServer::Connection> {
 public:
  Connection(std::shared_ptr<HttpServer> server, asio::ip::tcp::socket socket)
      : server_(std::move(server)),
        socket_(std::make_shared<asio::ip::tcp::socket>(std::move(socket))),
        timer_(socket_->get_executor()) {}

  void start() {
    auto self = shared_from_this();
    timer_.expires_after(server_->options_.read_timeout);
    timer_.async_wait([self](const asio::error_code& ec) {
      if (!ec && !self->handed_off_) {
        asio::error_code ignored;
        self->socket_->close(ignored);
      }
    });

    asio::error_code ec;
    auto endpoint = socket_->remote_endpoint(ec);
    if (!ec) {
      remote_address_ = endpoint.address().to_string();
    }
    read_head();
  }

 private:
  void read_head() {
    auto self = shared_from_this();
    socket_->async_read_some(asio::buffer(chunk_), [self](const asio::error_code& ec, size_t n) {
      if (ec) {
        self->timer_.cancel();
        return;
      }
      self->buffer_.append(self->chunk_.data(), n);

      auto end = self->buffer_.find("\r\n\r\n");
      if (end == std::string::npos) {
        if (self->buffer_.size() > self->server_->options_.max_header_bytes) {
          self->reply(HttpReply::text(431, "request head too large\n"));
          return;
        }
        self->read_head();
        return;
      }

      self->on_head(end + 4);
    });
  }

  void on_head(size_t head_size) {
    std::string raw_head = buffer_.substr(0, head_size);
    buffer_.erase(0, head_size);

    auto parsed = HttpRequest::parse_head(raw_head);
    if (!parsed.ok()) {
      reply(HttpReply::text(400, parsed.status.message + "\n"));
      return;
    }
    request_ = std::move(*parsed.value);
    request_.remote_address = remote_address_;

    if (server_->dispatch_takeover(request_, socket_, raw_head, buffer_)) {
      handed_off_ = true;
      timer_.cancel();
      return;
    }

    size_t length = request_.content_length();
    if (length > server_->options_.max_body_bytes) {
      reply(HttpReply::text(413, "request body too large\n"));
      return;
    }
    read_body(length);
  }

  void read_body(size_t length) {
    if (buffer_.size() >= length) {
      request_.body = buffer_.substr(0, length);
      buffer_.clear();
      timer_.cancel();

      auto self = shared_from_this();
      auto replied = std::make_shared<std::atomic<bool>>(false);
      server_->dispatch(request_, [self, replied](HttpReply reply) {
        if (replied->exchange(true)) {
          spdlog::warn("http: handler for {} {} replied twice", self->request_.method, self->request_.path);
          return;
        }
        asio::post(self->socket_->get_executor(), [self, reply = std::move(reply)]() mutable { self->reply(std::move(reply)); });
      });
      return;
    }

    auto self = shared_from_this();
    socket_->async_read_some(asio::buffer(chunk_), [self, length](const asio::error_code& ec, size_t n) {
      if (ec) {
        self->timer_.cancel();
        return;
      }
      self->buffer_.append(self->chunk_.data(), n);
      self->read_body(length);
    });
  }

  void reply(HttpReply reply) {
    timer_.cancel();
    auto self = shared_from_this();
    auto data = std::make_shared<std::string>(reply.serialize());
    asio::async_write(*socket_, asio::buffer(*data), [self, data](const asio::error_code&, size_t) {
      asio::error_code ignored;
      self->socket_->shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
      self->socket_->close(ignored);
    });
  }

  std::shared_ptr<HttpServer> server_;
  std::shared_ptr<asio::ip::tcp::socket> socket_;
  asio::steady_timer timer_;
  std::array<char, 4096> chunk_{};
  std::string buffer_;
  std::string remote_address_;
  HttpRequest request_;
  bool handed_off_ = false;
};

HttpServer::HttpServer(asio::io_context& io_ctx, HttpServerOptions options) : io_ctx_(io_ctx), options_(options), acceptor_(io_ctx) {}

HttpServer::~HttpServer() = default;

void HttpServer::handle(const std::string& method, const std::string& path, RequestHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  routes_.push_back(Route{method, path, false, std::move(handler)});
}

void HttpServer::handle_prefix(const std::string& method, const std::string& prefix, RequestHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  routes_.push_back(Route{method, prefix, true, std::move(handler)});
}

void HttpServer::takeover(TakeoverMatcher matcher, TakeoverHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  takeovers_.push_back(Takeover{std::move(matcher), std::move(handler)});
}

Status HttpServer::listen(const std::string& address, uint16_t port) {
  asio::error_code ec;
  auto addr = asio::ip::make_address(address, ec);
  if (ec) {
    return Status::failure(ErrorCode::InvalidArgument, "invalid listen address " + address + ": " + ec.message());
  }

  asio::ip::tcp::endpoint endpoint(addr, port);
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    asio::error_code ignored;
    acceptor_.close(ignored);
    return Status::failure(ErrorCode::Unavailable, "listen on " + address + ":" + std::to_string(port) + " failed: " + ec.message());
  }

  port_ = acceptor_.local_endpoint().port();
  spdlog::info("http: listening on {}:{}", address, port_.load());
  do_accept();
  return Status::success();
}

void HttpServer::stop() {
  asio::post(io_ctx_, [self = shared_from_this()]() {
    asio::error_code ignored;
    self->acceptor_.close(ignored);
  });
}

void HttpServer::do_accept() {
  auto self = shared_from_this();
  acceptor_.async_accept([self](const asio::error_code& ec, asio::ip::tcp::socket socket) {
    if (ec == asio::error::operation_aborted || !self->acceptor_.is_open()) {
      return;
    }
    if (!ec) {
      std::make_shared<Connection>(self, std::move(socket))->start();
    } else {
      spdlog::warn("http: accept failed: {}", ec.message());
    }
    self->do_accept();
  });
}

bool HttpServer::dispatch_takeover(const HttpRequest& req, std::shared_ptr<asio::ip::tcp::socket> socket, const std::string& raw_head,
                                   const std::string& leftover) {
  TakeoverHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& t : takeovers_) {
      if (t.matcher(req)) {
        handler = t.handler;
        break;
      }
    }
  }
  if (!handler) return false;

  handler(req, std::move(socket), raw_head, leftover);
  return true;
}

void HttpServer::dispatch(const HttpRequest& req, Responder responder) {
  const Route* best = nullptr;
  bool path_matched = false;
  RequestHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& route : routes_) {
      bool match = route.prefix ? req.path.compare(0, route.path.size(), route.path) == 0 : req.path == route.path;
      if (!match) continue;
      path_matched = true;
      if (route.method != "*" && route.method != req.method) continue;
      if (!best || (best->prefix && (!route.prefix || route.path.size() > best->path.size()))) {
        best = &route;
      }
    }
    if (best) handler = best->handler;
  }

  if (!handler) {
    if (path_matched) {
      responder(HttpReply::text(405, "method not allowed\n"));
    } else {
      responder(HttpReply::text(404, "not found\n"));
    }
    return;
  }

  spdlog::debug("http: {} {} from {}", req.method, req.path, req.remote_address);
  try {
    handler(req, responder);
  } catch (const std::exception& e) {
    spdlog::error("http: handler for {} {} threw: {}", req.method, req.path, e.what());
    responder(HttpReply::error(Status::failure(ErrorCode::Internal, e.what())));
  }
}

}  // namespace kuberde::net
