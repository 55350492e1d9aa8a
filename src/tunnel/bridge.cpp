#include "tunnel/bridge.hpp"

#include <spdlog/spdlog.h>

namespace kuberde::tunnel {

std::shared_ptr<Bridge> Bridge::create(std::shared_ptr<asio::ip::tcp::socket> socket, std::shared_ptr<mux::MuxStream> stream, BridgeOptions options,
                                       BridgeDone on_done) {
  return std::shared_ptr<Bridge>(new Bridge(std::move(socket), std::move(stream), std::move(options), std::move(on_done)));
}

Bridge::Bridge(std::shared_ptr<asio::ip::tcp::socket> socket, std::shared_ptr<mux::MuxStream> stream, BridgeOptions options, BridgeDone on_done)
    : socket_(std::move(socket)),
      stream_(std::move(stream)),
      options_(std::move(options)),
      on_done_(std::move(on_done)),
      strand_(asio::make_strand(socket_->get_executor())),
      idle_timer_(strand_),
      linger_timer_(strand_) {}

void Bridge::start(std::string initial_to_stream, std::string initial_to_socket) {
  auto self = shared_from_this();
  asio::post(strand_, [self, up = std::move(initial_to_stream), down = std::move(initial_to_socket)]() mutable {
    self->touch();
    self->schedule_idle_check();

    if (up.empty()) {
      self->read_socket();
    } else {
      self->write_stream(std::move(up));
    }

    if (down.empty()) {
      self->read_stream();
    } else {
      self->write_socket(std::move(down));
    }
  });
}

void Bridge::stop() {
  auto self = shared_from_this();
  asio::post(strand_, [self]() { self->teardown("stopped"); });
}

// ============================================================
// socket -> stream
// ============================================================

void Bridge::read_socket() {
  auto self = shared_from_this();
  socket_->async_read_some(asio::buffer(chunk_), asio::bind_executor(strand_, [self](const asio::error_code& ec, size_t n) {
                             if (self->torn_down_) return;
                             if (ec == asio::error::eof) {
                               self->upstream_finished();
                               return;
                             }
                             if (ec) {
                               self->teardown("socket read: " + ec.message());
                               return;
                             }
                             self->write_stream(std::string(self->chunk_.data(), n));
                           }));
}

void Bridge::write_stream(std::string data) {
  auto self = shared_from_this();
  size_t size = data.size();
  touch();
  stream_->async_write(std::move(data), [self, size](const asio::error_code& ec, size_t) {
    asio::post(self->strand_, [self, ec, size]() {
      if (self->torn_down_) return;
      if (ec) {
        self->teardown("stream write: " + ec.message());
        return;
      }
      self->bytes_to_stream_ += size;
      self->read_socket();
    });
  });
}

void Bridge::upstream_finished() {
  up_done_ = true;
  stream_->close();
  check_finished();
}

// ============================================================
// stream -> socket
// ============================================================

void Bridge::read_stream() {
  auto self = shared_from_this();
  stream_->async_read([self](const asio::error_code& ec, std::string data) {
    asio::post(self->strand_, [self, ec, data = std::move(data)]() mutable {
      if (self->torn_down_) return;
      if (ec == asio::error::eof) {
        self->downstream_finished();
        return;
      }
      if (ec) {
        self->teardown("stream read: " + ec.message());
        return;
      }
      self->write_socket(std::move(data));
    });
  });
}

void Bridge::write_socket(std::string data) {
  auto self = shared_from_this();
  auto buffer = std::make_shared<std::string>(std::move(data));
  touch();
  asio::async_write(*socket_, asio::buffer(*buffer), asio::bind_executor(strand_, [self, buffer](const asio::error_code& ec, size_t n) {
                      if (self->torn_down_) return;
                      if (ec) {
                        self->teardown("socket write: " + ec.message());
                        return;
                      }
                      self->bytes_to_socket_ += n;
                      self->read_stream();
                    }));
}

void Bridge::downstream_finished() {
  down_done_ = true;
  asio::error_code ignored;
  socket_->shutdown(asio::ip::tcp::socket::shutdown_send, ignored);
  check_finished();
}

// ============================================================
// Shared cancellation scope
// ============================================================

void Bridge::check_finished() {
  if (up_done_ && down_done_) {
    teardown("completed");
    return;
  }
  if (options_.half_close_linger.count() <= 0) return;

  auto self = shared_from_this();
  linger_timer_.expires_after(options_.half_close_linger);
  linger_timer_.async_wait(asio::bind_executor(strand_, [self](const asio::error_code& ec) {
    if (ec || self->torn_down_) return;
    self->teardown("half-close linger expired");
  }));
}

void Bridge::teardown(const std::string& reason) {
  if (torn_down_) return;
  torn_down_ = true;

  idle_timer_.cancel();
  linger_timer_.cancel();

  asio::error_code ignored;
  socket_->shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  socket_->close(ignored);

  if (!(up_done_ && down_done_)) {
    stream_->reset();
  }

  spdlog::debug("[{}] bridge closed ({}): {} bytes to stream, {} bytes to socket", options_.name, reason, bytes_to_stream_.load(),
                bytes_to_socket_.load());

  if (on_done_) {
    auto cb = std::move(on_done_);
    on_done_ = nullptr;
    cb(BridgeStats{bytes_to_stream_.load(), bytes_to_socket_.load(), reason});
  }
}

void Bridge::touch() {
  last_activity_ = std::chrono::steady_clock::now();
}

void Bridge::schedule_idle_check() {
  if (options_.idle_timeout.count() <= 0) return;

  auto self = shared_from_this();
  auto deadline = last_activity_ + options_.idle_timeout;
  idle_timer_.expires_at(deadline);
  idle_timer_.async_wait(asio::bind_executor(strand_, [self](const asio::error_code& ec) {
    if (ec || self->torn_down_) return;
    if (std::chrono::steady_clock::now() - self->last_activity_ >= self->options_.idle_timeout) {
      self->teardown("idle timeout");
      return;
    }
    self->schedule_idle_check();
  }));
}

}  // namespace kuberde::tunnel
