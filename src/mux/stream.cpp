#include "mux/stream.hpp"

#include <algorithm>

#include "mux/session.hpp"

namespace kuberde::mux {

MuxStream::MuxStream(std::weak_ptr<MuxSession> session, uint32_t id, asio::strand<asio::any_io_executor> strand)
    : session_(std::move(session)), id_(id), strand_(std::move(strand)) {}

void MuxStream::async_read(ReadHandler handler) {
  auto self = shared_from_this();
  asio::post(strand_, [self, handler = std::move(handler)]() mutable {
    if (self->read_handler_) {
      asio::post(self->strand_, [handler]() { handler(asio::error::already_started, {}); });
      return;
    }
    self->read_handler_ = std::move(handler);
    self->pump_reads();
  });
}

void MuxStream::async_write(std::string data, WriteHandler handler) {
  auto self = shared_from_this();
  asio::post(strand_, [self, data = std::move(data), handler = std::move(handler)]() mutable {
    asio::error_code ec;
    if (self->reset_) {
      ec = asio::error::connection_reset;
    } else if (self->session_closed_) {
      ec = asio::error::connection_aborted;
    } else if (self->local_fin_ || self->fin_pending_) {
      ec = asio::error::shut_down;
    }

    if (ec || data.empty()) {
      if (handler) {
        asio::post(self->strand_, [handler, ec]() { handler(ec, 0); });
      }
      return;
    }

    self->pending_writes_.push_back(PendingWrite{std::move(data), 0, std::move(handler)});
    self->pump_writes();
  });
}

void MuxStream::close() {
  auto self = shared_from_this();
  asio::post(strand_, [self]() {
    if (self->local_fin_ || self->fin_pending_ || self->reset_ || self->session_closed_) return;
    self->fin_pending_ = true;
    if (self->pending_writes_.empty()) {
      self->send_fin();
    }
  });
}

void MuxStream::reset() {
  auto self = shared_from_this();
  asio::post(strand_, [self]() {
    if (self->reset_ || self->session_closed_ || self->finished_) return;
    self->reset_ = true;
    if (auto session = self->session_.lock()) {
      session->send_frame(FrameHeader{kProtocolVersion, FrameType::WindowUpdate, kFlagRst, self->id_, 0});
    }
    self->fail_all(asio::error::operation_aborted);
    self->maybe_finish();
  });
}

// ============================================================
// Session-driven events (strand)
// ============================================================

bool MuxStream::on_data(std::string payload) {
  if (payload.size() > recv_window_) return false;
  recv_window_ -= static_cast<uint32_t>(payload.size());

  // Data after our reset or the peer's FIN is dropped
  if (reset_ || remote_fin_) return true;

  recv_buf_ += payload;
  pump_reads();
  return true;
}

void MuxStream::on_window_update(uint32_t delta) {
  send_window_ += delta;
  pump_writes();
}

void MuxStream::on_remote_fin() {
  if (remote_fin_) return;
  remote_fin_ = true;
  pump_reads();
  maybe_finish();
}

void MuxStream::on_remote_reset() {
  if (reset_) return;
  reset_ = true;
  recv_buf_.clear();
  fail_all(asio::error::connection_reset);
  maybe_finish();
}

void MuxStream::on_session_closed() {
  if (session_closed_) return;
  session_closed_ = true;
  finished_ = true;
  fail_all(asio::error::connection_aborted);
}

// ============================================================
// Internals (strand)
// ============================================================

void MuxStream::pump_reads() {
  if (!read_handler_) return;

  auto handler = std::move(read_handler_);
  read_handler_ = nullptr;

  if (!recv_buf_.empty()) {
    std::string data = std::move(recv_buf_);
    recv_buf_.clear();

    // Window update once half of the window was consumed
    consumed_ += static_cast<uint32_t>(data.size());
    if (consumed_ >= kInitialWindow / 2 && !remote_fin_ && !reset_) {
      if (auto session = session_.lock()) {
        session->send_frame(FrameHeader{kProtocolVersion, FrameType::WindowUpdate, 0, id_, consumed_});
      }
      recv_window_ += consumed_;
      consumed_ = 0;
    }

    asio::post(strand_, [handler, data = std::move(data)]() mutable { handler(asio::error_code(), std::move(data)); });
    return;
  }

  asio::error_code ec;
  if (reset_) {
    ec = asio::error::connection_reset;
  } else if (session_closed_) {
    ec = asio::error::connection_aborted;
  } else if (remote_fin_) {
    ec = asio::error::eof;
  } else {
    // Nothing to deliver yet
    read_handler_ = std::move(handler);
    return;
  }
  asio::post(strand_, [handler, ec]() { handler(ec, {}); });
}

void MuxStream::pump_writes() {
  auto session = session_.lock();
  if (!session) {
    fail_all(asio::error::connection_aborted);
    return;
  }

  while (!pending_writes_.empty() && send_window_ > 0) {
    auto& write = pending_writes_.front();
    size_t remaining = write.data.size() - write.offset;
    size_t chunk = std::min<size_t>({remaining, send_window_, kMaxFramePayload});

    std::string payload = write.data.substr(write.offset, chunk);
    write.offset += chunk;
    send_window_ -= static_cast<uint32_t>(chunk);

    std::function<void(const asio::error_code&)> done;
    if (write.offset == write.data.size()) {
      auto handler = std::move(write.handler);
      size_t total = write.data.size();
      pending_writes_.pop_front();
      if (handler) {
        done = [handler, total](const asio::error_code& ec) { handler(ec, ec ? 0 : total); };
      }
    }

    session->send_frame(FrameHeader{kProtocolVersion, FrameType::Data, 0, id_, static_cast<uint32_t>(chunk)}, payload, std::move(done));
  }

  if (pending_writes_.empty() && fin_pending_) {
    send_fin();
  }
}

void MuxStream::send_fin() {
  fin_pending_ = false;
  local_fin_ = true;
  if (auto session = session_.lock()) {
    session->send_frame(FrameHeader{kProtocolVersion, FrameType::WindowUpdate, kFlagFin, id_, 0});
  }
  maybe_finish();
}

void MuxStream::maybe_finish() {
  if (finished_) return;
  if (!reset_ && !(local_fin_ && remote_fin_)) return;
  finished_ = true;
  if (auto session = session_.lock()) {
    session->remove_stream(id_);
  }
}

void MuxStream::fail_all(const asio::error_code& ec) {
  if (read_handler_) {
    auto handler = std::move(read_handler_);
    read_handler_ = nullptr;
    asio::post(strand_, [handler, ec]() { handler(ec, {}); });
  }

  auto writes = std::move(pending_writes_);
  pending_writes_.clear();
  for (auto& write : writes) {
    if (write.handler) {
      asio::post(strand_, [handler = std::move(write.handler), ec]() { handler(ec, 0); });
    }
  }
}

}  // namespace kuberde::mux
