#pragma once

#include <asio.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "core/types.hpp"

namespace kuberde::relay {

using InboundHandler = std::function<void(std::shared_ptr<asio::ip::tcp::socket> socket, uint16_t port)>;

// One acceptor per routed TCP port, opened and closed as routes come and go
class TcpListenerSet {
 public:
  TcpListenerSet(asio::io_context& io_ctx, std::string address, InboundHandler handler);

  ~TcpListenerSet();

  // Already open is ok; Unavailable when the port cannot be bound
  Status open(uint16_t port);

  void close(uint16_t port);

  void close_all();

  bool is_open(uint16_t port) const;

  std::set<uint16_t> ports() const;

 private:
  class Listener;

  asio::io_context& io_ctx_;
  std::string address_;
  InboundHandler handler_;
  mutable std::mutex mutex_;
  std::map<uint16_t, std::shared_ptr<Listener>> listeners_;
};

}  // namespace kuberde::relay
