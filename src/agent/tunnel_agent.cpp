#include "agent/tunnel_agent.hpp"

#include <spdlog/spdlog.h>

#include "mux/session.hpp"
#include "mux/stream.hpp"
#include "tunnel/bridge.hpp"
#include "tunnel/handshake.hpp"

namespace kuberde::agent {

std::string to_string(AgentState state) {
  switch (state) {
    case AgentState::Disconnected:
      return "Disconnected";
    case AgentState::Connecting:
      return "Connecting";
    case AgentState::Authenticated:
      return "Authenticated";
    case AgentState::Streaming:
      return "Streaming";
    case AgentState::Stopped:
      return "Stopped";
  }
  return "Unknown";
}

TunnelAgent::TunnelAgent(asio::io_context& io_ctx, AgentConfig config, ServiceTable services, TokenProvider token_provider)
    : io_ctx_(io_ctx),
      strand_(asio::make_strand(io_ctx)),
      reconnect_timer_(strand_),
      config_(std::move(config)),
      services_(std::move(services)),
      token_provider_(std::move(token_provider)),
      backoff_(config_.reconnect) {}

TunnelAgent::~TunnelAgent() = default;

std::string TunnelAgent::tunnel_url(const std::string& server_url, const std::string& agent_id) {
  char sep = server_url.find('?') == std::string::npos ? '?' : '&';
  return server_url + sep + "id=" + agent_id;
}

void TunnelAgent::set_state_listener(StateListener listener) {
  auto self = shared_from_this();
  asio::post(strand_, [self, listener = std::move(listener)]() mutable { self->state_listener_ = std::move(listener); });
}

void TunnelAgent::set_state(AgentState state) {
  if (state_.load() == AgentState::Stopped) return;
  auto previous = state_.exchange(state);
  if (previous == state) return;
  spdlog::debug("[{}] {} -> {}", config_.agent_id, to_string(previous), to_string(state));
  if (state_listener_) state_listener_(state);
}

void TunnelAgent::start() {
  spdlog::info("[{}] agent starting, services: {}", config_.agent_id, services_.describe());
  auto self = shared_from_this();
  asio::post(strand_, [self]() { self->connect(); });
}

void TunnelAgent::stop() {
  if (stopping_.exchange(true)) return;
  auto self = shared_from_this();
  asio::post(strand_, [self]() {
    self->reconnect_timer_.cancel();
    if (self->session_) {
      self->session_->close("agent stopping");
      self->session_.reset();
    }
    self->set_state(AgentState::Stopped);
    spdlog::info("[{}] agent stopped", self->config_.agent_id);
  });
}

// ============================================================
// Connect state machine
// ============================================================

void TunnelAgent::connect() {
  if (stopping_) return;
  set_state(AgentState::Connecting);

  std::string url = tunnel_url(config_.server_url, config_.agent_id);
  std::string token = token_provider_ ? token_provider_() : std::string();
  spdlog::info("[{}] connecting to {} (attempt {})", config_.agent_id, config_.server_url, backoff_.attempts() + 1);

  auto self = shared_from_this();
  tunnel::async_upgrade(io_ctx_, url, token, config_.handshake_timeout, [self](Result<tunnel::UpgradedConnection> result) {
    asio::post(self->strand_, [self, result = std::move(result)]() mutable {
      if (self->stopping_) {
        if (result.ok()) {
          asio::error_code ignored;
          result.value->socket->close(ignored);
        }
        return;
      }
      if (!result.ok()) {
        self->schedule_reconnect(result.status);
        return;
      }

      self->set_state(AgentState::Authenticated);

      mux::SessionOptions options;
      options.keepalive_interval = self->config_.keepalive_interval;
      options.keepalive_timeout = self->config_.keepalive_timeout;
      options.name = self->config_.agent_id;
      auto session = mux::MuxSession::create(std::move(*result.value->socket), mux::Role::Client, options, std::move(result.value->leftover));
      self->session_ = session;
      self->backoff_.reset();

      std::weak_ptr<TunnelAgent> weak = self;
      uint64_t session_id = session->id();
      session->start(
          [weak](std::shared_ptr<mux::MuxStream> stream) {
            if (auto agent = weak.lock()) agent->handle_stream(std::move(stream));
          },
          [weak, session_id](const std::string& reason) {
            if (auto agent = weak.lock()) {
              asio::post(agent->strand_, [agent, session_id, reason]() { agent->on_session_closed(session_id, reason); });
            }
          });

      self->set_state(AgentState::Streaming);
      spdlog::info("[{}] tunnel established, waiting for streams", self->config_.agent_id);
    });
  });
}

void TunnelAgent::on_session_closed(uint64_t session_id, const std::string& reason) {
  if (!session_ || session_->id() != session_id) return;
  session_.reset();
  if (stopping_) return;
  schedule_reconnect(Status::failure(ErrorCode::AgentUnavailable, "session closed: " + reason));
}

void TunnelAgent::schedule_reconnect(const Status& reason) {
  set_state(AgentState::Disconnected);
  auto delay = backoff_.next();
  spdlog::warn("[{}] {}; reconnecting in {}ms", config_.agent_id, reason.to_string(), delay.count());

  auto self = shared_from_this();
  reconnect_timer_.expires_after(delay);
  reconnect_timer_.async_wait([self](const asio::error_code& ec) {
    if (ec) return;
    self->connect();
  });
}

// ============================================================
// Streams
// ============================================================

void TunnelAgent::handle_stream(std::shared_ptr<mux::MuxStream> stream) {
  tunnel::PreambleOptions options;
  options.max_bytes = config_.preamble_max_bytes;
  options.timeout = config_.preamble_timeout;

  auto self = shared_from_this();
  tunnel::read_preamble(stream, strand_, options, [self, stream](Result<std::string> selector, std::string leftover) {
    if (!selector.ok()) {
      spdlog::warn("[{}] stream {} dropped: {}", self->config_.agent_id, stream->id(), selector.status.message);
      return;
    }
    auto target = self->services_.resolve(*selector.value);
    if (!target.ok()) {
      spdlog::warn("[{}] stream {}: {}", self->config_.agent_id, stream->id(), target.status.message);
      stream->reset();
      return;
    }
    auto deadline = std::chrono::steady_clock::now() + self->config_.local_dial_deadline;
    self->dial_local(stream, *selector.value, *target.value, std::move(leftover), deadline);
  });
}

// The workload container may still be starting, so refused dials are retried until the deadline
void TunnelAgent::dial_local(std::shared_ptr<mux::MuxStream> stream, const std::string& service, LocalTarget target, std::string leftover,
                             std::chrono::steady_clock::time_point deadline) {
  auto self = shared_from_this();
  auto socket = std::make_shared<asio::ip::tcp::socket>(io_ctx_);
  auto resolver = std::make_shared<asio::ip::tcp::resolver>(io_ctx_);

  auto on_connected = [self, stream, service, target, leftover, deadline, socket, resolver](const asio::error_code& ec) mutable {
    if (self->stopping_) {
      stream->reset();
      return;
    }
    if (ec) {
      if (std::chrono::steady_clock::now() >= deadline) {
        spdlog::warn("[{}] {}: local target {} unreachable: {}", self->config_.agent_id, service, target.to_string(), ec.message());
        stream->reset();
        return;
      }
      auto timer = std::make_shared<asio::steady_timer>(self->strand_);
      timer->expires_after(self->config_.local_dial_interval);
      timer->async_wait([self, stream, service, target, leftover = std::move(leftover), deadline, timer](const asio::error_code&) mutable {
        self->dial_local(stream, service, target, std::move(leftover), deadline);
      });
      return;
    }

    self->active_streams_++;
    spdlog::debug("[{}] stream {} -> {} ({})", self->config_.agent_id, stream->id(), target.to_string(), service);

    tunnel::BridgeOptions options;
    options.half_close_linger = self->config_.half_close_linger;
    options.name = self->config_.agent_id + " " + service;
    std::weak_ptr<TunnelAgent> weak = self;
    auto pipe = tunnel::Bridge::create(socket, stream, options, [weak](const tunnel::BridgeStats&) {
      if (auto agent = weak.lock()) agent->active_streams_--;
    });
    pipe->start({}, std::move(leftover));
  };

  auto strand = strand_;
  resolver->async_resolve(target.host, std::to_string(target.port),
                          asio::bind_executor(strand, [socket, strand, on_connected](const asio::error_code& ec,
                                                                                     asio::ip::tcp::resolver::results_type results) mutable {
                            if (ec) {
                              on_connected(ec);
                              return;
                            }
                            asio::async_connect(*socket, results,
                                                asio::bind_executor(strand, [on_connected](const asio::error_code& ec,
                                                                                           const asio::ip::tcp::endpoint&) mutable { on_connected(ec); }));
                          }));
}

// ============================================================
// Credential swap
// ============================================================

void TunnelAgent::refresh_credential(const std::string& token, RefreshDone done) {
  auto self = shared_from_this();
  auto finish = [done](const Status& status) {
    if (done) done(status);
  };

  asio::post(strand_, [self, token, finish]() {
    if (!self->session_) {
      finish(Status::failure(ErrorCode::AgentUnavailable, "no live session"));
      return;
    }
    auto stream = self->session_->open_stream();
    if (!stream) {
      finish(Status::failure(ErrorCode::AgentUnavailable, "session is closing"));
      return;
    }

    stream->async_write(tunnel::format_auth_line(token), [self, stream, finish](const asio::error_code& ec, size_t) {
      if (ec) {
        stream->reset();
        finish(Status::failure(ErrorCode::AgentUnavailable, "sending credential failed: " + ec.message()));
        return;
      }
      tunnel::PreambleOptions options;
      options.max_bytes = 1024;
      options.timeout = self->config_.handshake_timeout;
      tunnel::read_preamble(stream, self->strand_, options, [self, stream, finish](Result<std::string> reply, std::string) {
        if (!reply.ok()) {
          finish(reply.status);
          return;
        }
        stream->close();
        if (*reply.value == "OK") {
          spdlog::info("[{}] credential swapped on the live session", self->config_.agent_id);
          finish(Status::success());
          return;
        }
        std::string message = reply.value->compare(0, 4, "ERR ") == 0 ? reply.value->substr(4) : *reply.value;
        finish(Status::failure(ErrorCode::Unauthorized, "relay rejected credential: " + message));
      });
    });
  });
}

}  // namespace kuberde::agent
