#include "mux/session.hpp"

#include <spdlog/spdlog.h>

#include "mux/stream.hpp"

namespace kuberde::mux {

namespace {

std::atomic<uint64_t> g_next_session_id{1};

int64_t steady_now_ns() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now().time_since_epoch()).count();
}

}  // namespace

std::shared_ptr<MuxSession> MuxSession::create(asio::ip::tcp::socket socket, Role role, SessionOptions options, std::string initial_bytes) {
  return std::shared_ptr<MuxSession>(new MuxSession(std::move(socket), role, std::move(options), std::move(initial_bytes)));
}

MuxSession::MuxSession(asio::ip::tcp::socket socket, Role role, SessionOptions options, std::string initial_bytes)
    : socket_(std::move(socket)),
      strand_(asio::make_strand(socket_.get_executor())),
      keepalive_timer_(strand_),
      role_(role),
      options_(std::move(options)),
      id_(g_next_session_id.fetch_add(1)),
      next_stream_id_(role == Role::Client ? 1 : 2),
      rbuf_(std::move(initial_bytes)),
      read_chunk_(64 * 1024) {
  asio::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  if (!ec) {
    remote_address_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
  }
  asio::ip::tcp::no_delay no_delay(true);
  socket_.set_option(no_delay, ec);
  touch();
}

MuxSession::~MuxSession() {
  asio::error_code ignored;
  socket_.close(ignored);
}

void MuxSession::start(StreamHandler on_stream, CloseHandler on_close) {
  auto self = shared_from_this();
  asio::post(strand_, [self, on_stream = std::move(on_stream), on_close = std::move(on_close)]() mutable {
    if (self->started_) return;
    self->started_ = true;
    self->on_stream_ = std::move(on_stream);
    self->on_close_ = std::move(on_close);

    if (self->shutdown_) {
      if (self->on_close_) {
        auto cb = std::move(self->on_close_);
        self->on_close_ = nullptr;
        cb("closed before start");
      }
      return;
    }

    // Frames that arrived together with the handshake
    if (!self->process_buffer()) return;
    self->do_read();
    self->schedule_keepalive();
  });
}

std::shared_ptr<MuxStream> MuxSession::open_stream() {
  if (closed_.load()) return nullptr;

  uint32_t id = next_stream_id_.fetch_add(2);
  auto stream = std::shared_ptr<MuxStream>(new MuxStream(weak_from_this(), id, strand_));

  auto self = shared_from_this();
  asio::post(strand_, [self, stream]() {
    if (self->shutdown_) {
      stream->on_session_closed();
      return;
    }
    self->streams_[stream->id()] = stream;
    self->stream_count_ = self->streams_.size();
    self->send_frame(FrameHeader{kProtocolVersion, FrameType::WindowUpdate, kFlagSyn, stream->id(), 0});
  });
  return stream;
}

void MuxSession::close(const std::string& reason) {
  auto self = shared_from_this();
  asio::post(strand_, [self, reason]() {
    if (self->shutdown_) return;
    FrameHeader go_away{kProtocolVersion, FrameType::GoAway, 0, 0, static_cast<uint32_t>(GoAwayCode::Normal)};
    self->send_frame(go_away, {}, [self, reason](const asio::error_code&) { self->shutdown(reason); });
  });
}

std::chrono::steady_clock::time_point MuxSession::last_heard() const {
  return std::chrono::steady_clock::time_point(std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::nanoseconds(last_heard_ns_.load())));
}

void MuxSession::touch() {
  last_heard_ns_ = steady_now_ns();
}

// ============================================================
// Read path
// ============================================================

void MuxSession::do_read() {
  auto self = shared_from_this();
  socket_.async_read_some(asio::buffer(read_chunk_), asio::bind_executor(strand_, [self](const asio::error_code& ec, size_t n) {
                            if (self->shutdown_) return;
                            if (ec) {
                              self->shutdown(ec == asio::error::eof ? "connection closed by peer" : "read failed: " + ec.message());
                              return;
                            }
                            self->touch();
                            self->rbuf_.append(self->read_chunk_.data(), n);
                            if (!self->process_buffer()) return;
                            self->do_read();
                          }));
}

bool MuxSession::process_buffer() {
  size_t pos = 0;
  while (!shutdown_ && rbuf_.size() - pos >= kHeaderSize) {
    auto decoded = decode_header(reinterpret_cast<const uint8_t*>(rbuf_.data() + pos));
    if (!decoded.ok()) {
      protocol_error(decoded.status.message);
      return false;
    }
    const FrameHeader& header = *decoded.value;

    size_t payload_size = header.type == FrameType::Data ? header.length : 0;
    if (payload_size > kInitialWindow) {
      protocol_error("data frame of " + std::to_string(payload_size) + " bytes exceeds the receive window");
      return false;
    }
    if (rbuf_.size() - pos < kHeaderSize + payload_size) break;

    std::string payload = rbuf_.substr(pos + kHeaderSize, payload_size);
    pos += kHeaderSize + payload_size;
    handle_frame(header, std::move(payload));
  }

  if (shutdown_) return false;
  rbuf_.erase(0, pos);
  return true;
}

void MuxSession::handle_frame(const FrameHeader& header, std::string payload) {
  switch (header.type) {
    case FrameType::Ping:
      if (header.has(kFlagSyn)) {
        send_frame(FrameHeader{kProtocolVersion, FrameType::Ping, kFlagAck, 0, header.length});
      }
      return;
    case FrameType::GoAway:
      shutdown(header.length == static_cast<uint32_t>(GoAwayCode::Normal) ? "peer went away"
                                                                            : "peer went away with code " + std::to_string(header.length));
      return;
    case FrameType::Data:
    case FrameType::WindowUpdate:
      handle_stream_frame(header, std::move(payload));
      return;
  }
}

void MuxSession::handle_stream_frame(const FrameHeader& header, std::string payload) {
  if (header.stream_id == 0) {
    protocol_error(to_string(header.type) + " frame on stream 0");
    return;
  }

  std::shared_ptr<MuxStream> stream;
  if (header.has(kFlagSyn)) {
    if (!is_remote_id(header.stream_id) || streams_.count(header.stream_id)) {
      protocol_error("unexpected SYN for stream " + std::to_string(header.stream_id));
      return;
    }
    if (streams_.size() >= options_.max_streams || !on_stream_) {
      spdlog::warn("[{}] refusing stream {}: {} streams open", options_.name, header.stream_id, streams_.size());
      send_frame(FrameHeader{kProtocolVersion, FrameType::WindowUpdate, kFlagRst, header.stream_id, 0});
      return;
    }

    stream = std::shared_ptr<MuxStream>(new MuxStream(weak_from_this(), header.stream_id, strand_));
    streams_[header.stream_id] = stream;
    stream_count_ = streams_.size();
    send_frame(FrameHeader{kProtocolVersion, FrameType::WindowUpdate, kFlagAck, header.stream_id, 0});

    auto handler = on_stream_;
    asio::post(strand_, [handler, stream]() { handler(stream); });
  } else {
    auto it = streams_.find(header.stream_id);
    if (it == streams_.end()) {
      // Late frame for a stream that was already torn down
      return;
    }
    stream = it->second;
  }

  if (header.type == FrameType::Data) {
    if (!payload.empty() && !stream->on_data(std::move(payload))) {
      protocol_error("stream " + std::to_string(header.stream_id) + " exceeded its receive window");
      return;
    }
  } else if (header.length > 0) {
    stream->on_window_update(header.length);
  }

  if (header.has(kFlagRst)) {
    stream->on_remote_reset();
  } else if (header.has(kFlagFin)) {
    stream->on_remote_fin();
  }
}

bool MuxSession::is_remote_id(uint32_t stream_id) const {
  bool odd = (stream_id % 2) == 1;
  // Server accepts the client's odd ids and vice versa
  return role_ == Role::Server ? odd : !odd;
}

// ============================================================
// Write path
// ============================================================

void MuxSession::send_frame(const FrameHeader& header, const std::string& payload, std::function<void(const asio::error_code&)> done) {
  if (shutdown_) {
    if (done) {
      asio::post(strand_, [done]() { done(asio::error::operation_aborted); });
    }
    return;
  }

  write_queue_.push_back(OutFrame{encode_frame(header, payload), std::move(done)});
  if (!writing_) {
    do_write();
  }
}

void MuxSession::do_write() {
  if (write_queue_.empty()) {
    writing_ = false;
    return;
  }
  writing_ = true;

  auto self = shared_from_this();
  asio::async_write(socket_, asio::buffer(write_queue_.front().bytes), asio::bind_executor(strand_, [self](const asio::error_code& ec, size_t) {
                      if (self->write_queue_.empty()) return;
                      auto frame = std::move(self->write_queue_.front());
                      self->write_queue_.pop_front();
                      if (frame.done) frame.done(ec);

                      if (ec) {
                        self->writing_ = false;
                        self->shutdown("write failed: " + ec.message());
                        return;
                      }
                      if (self->shutdown_) {
                        self->writing_ = false;
                        return;
                      }
                      self->do_write();
                    }));
}

// ============================================================
// Keepalive & teardown
// ============================================================

void MuxSession::schedule_keepalive() {
  if (options_.keepalive_interval.count() <= 0) return;

  auto self = shared_from_this();
  keepalive_timer_.expires_after(options_.keepalive_interval);
  keepalive_timer_.async_wait(asio::bind_executor(strand_, [self](const asio::error_code& ec) {
    if (ec || self->shutdown_) return;

    auto silent = std::chrono::steady_clock::now() - self->last_heard();
    if (silent > self->options_.keepalive_timeout) {
      spdlog::warn("[{}] no traffic for {}ms, closing session", self->options_.name,
                   std::chrono::duration_cast<std::chrono::milliseconds>(silent).count());
      self->shutdown("keepalive timeout");
      return;
    }

    self->send_frame(FrameHeader{kProtocolVersion, FrameType::Ping, kFlagSyn, 0, ++self->ping_id_});
    self->schedule_keepalive();
  }));
}

void MuxSession::protocol_error(const std::string& message) {
  spdlog::error("[{}] mux protocol error: {}", options_.name, message);
  if (shutdown_) return;

  // Best effort GoAway before the socket is closed
  std::string go_away = encode_frame(FrameHeader{kProtocolVersion, FrameType::GoAway, 0, 0, static_cast<uint32_t>(GoAwayCode::ProtocolError)});
  asio::error_code ignored;
  if (!writing_) {
    asio::write(socket_, asio::buffer(go_away), ignored);
  }
  shutdown("protocol error: " + message);
}

void MuxSession::shutdown(const std::string& reason) {
  if (shutdown_) return;
  shutdown_ = true;
  closed_ = true;

  spdlog::debug("[{}] session {} closed: {}", options_.name, id_, reason);

  keepalive_timer_.cancel();
  asio::error_code ignored;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);

  // The in-flight frame (front) completes through its own handler
  size_t keep = writing_ ? 1 : 0;
  while (write_queue_.size() > keep) {
    auto frame = std::move(write_queue_.back());
    write_queue_.pop_back();
    if (frame.done) {
      asio::post(strand_, [done = std::move(frame.done)]() { done(asio::error::operation_aborted); });
    }
  }

  auto streams = std::move(streams_);
  streams_.clear();
  stream_count_ = 0;
  for (auto& [id, stream] : streams) {
    stream->on_session_closed();
  }

  on_stream_ = nullptr;
  if (on_close_) {
    auto cb = std::move(on_close_);
    on_close_ = nullptr;
    cb(reason);
  }
}

void MuxSession::remove_stream(uint32_t stream_id) {
  streams_.erase(stream_id);
  stream_count_ = streams_.size();
}

}  // namespace kuberde::mux
