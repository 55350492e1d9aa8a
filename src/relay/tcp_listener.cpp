#include "relay/tcp_listener.hpp"

#include <spdlog/spdlog.h>

namespace kuberde::relay {

class TcpListenerSet::Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(asio::io_context& io_ctx, uint16_t port, InboundHandler handler)
      : io_ctx_(io_ctx), acceptor_(asio::make_strand(io_ctx)), port_(port), handler_(std::move(handler)) {}

  Status bind(const std::string& address) {
    asio::error_code ec;
    auto addr = asio::ip::make_address(address, ec);
    if (ec) {
      return Status::failure(ErrorCode::InvalidArgument, "invalid listen address " + address);
    }
    asio::ip::tcp::endpoint endpoint(addr, port_);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
      asio::error_code ignored;
      acceptor_.close(ignored);
      return Status::failure(ErrorCode::Unavailable, "cannot listen on port " + std::to_string(port_) + ": " + ec.message());
    }
    return Status::success();
  }

  void start() {
    do_accept();
  }

  void stop() {
    auto self = shared_from_this();
    asio::post(acceptor_.get_executor(), [self]() {
      asio::error_code ignored;
      self->acceptor_.close(ignored);
    });
  }

 private:
  void do_accept() {
    auto self = shared_from_this();
    auto socket = std::make_shared<asio::ip::tcp::socket>(io_ctx_);
    acceptor_.async_accept(*socket, [self, socket](const asio::error_code& ec) {
      if (ec == asio::error::operation_aborted || !self->acceptor_.is_open()) return;
      if (ec) {
        spdlog::warn("[tcp:{}] accept failed: {}", self->port_, ec.message());
      } else {
        self->handler_(socket, self->port_);
      }
      self->do_accept();
    });
  }

  asio::io_context& io_ctx_;
  asio::ip::tcp::acceptor acceptor_;
  uint16_t port_;
  InboundHandler handler_;
};

TcpListenerSet::TcpListenerSet(asio::io_context& io_ctx, std::string address, InboundHandler handler)
    : io_ctx_(io_ctx), address_(std::move(address)), handler_(std::move(handler)) {}

TcpListenerSet::~TcpListenerSet() {
  close_all();
}

Status TcpListenerSet::open(uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (listeners_.count(port)) return Status::success();

  auto listener = std::make_shared<Listener>(io_ctx_, port, handler_);
  auto status = listener->bind(address_);
  if (!status.ok()) return status;

  listener->start();
  listeners_[port] = listener;
  spdlog::info("[tcp:{}] listening", port);
  return Status::success();
}

void TcpListenerSet::close(uint16_t port) {
  std::shared_ptr<Listener> listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = listeners_.find(port);
    if (it == listeners_.end()) return;
    listener = std::move(it->second);
    listeners_.erase(it);
  }
  listener->stop();
  spdlog::info("[tcp:{}] listener closed", port);
}

void TcpListenerSet::close_all() {
  std::map<uint16_t, std::shared_ptr<Listener>> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners.swap(listeners_);
  }
  for (auto& entry : listeners) {
    entry.second->stop();
  }
}

bool TcpListenerSet::is_open(uint16_t port) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.count(port) > 0;
}

std::set<uint16_t> TcpListenerSet::ports() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<uint16_t> out;
  for (const auto& entry : listeners_) out.insert(entry.first);
  return out;
}

}  // namespace kuberde::relay
