#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "agent/service_table.hpp"
#include "core/backoff.hpp"
#include "core/config.hpp"
#include "core/types.hpp"

namespace kuberde::mux {
class MuxSession;
class MuxStream;
}  // namespace kuberde::mux

namespace kuberde::agent {

enum class AgentState { Disconnected, Connecting, Authenticated, Streaming, Stopped };

std::string to_string(AgentState state);

/**
 * In-pod agent: keeps one outbound tunnel to the relay and serves relay-opened streams.
 *
 *   Disconnected -> Connecting -> Authenticated -> Streaming
 *        ^              |               |             |
 *        +----------- backoff <---------+-------------+
 *   stop() from any state -> Stopped
 *
 * Each stream starts with "{service}\n". Known services are dialed on localhost and
 * bridged; unknown ones are reset. A failing stream never affects the session.
 */
class TunnelAgent : public std::enable_shared_from_this<TunnelAgent> {
 public:
  using TokenProvider = std::function<std::string()>;
  using StateListener = std::function<void(AgentState)>;
  using RefreshDone = std::function<void(const Status&)>;

  TunnelAgent(asio::io_context& io_ctx, AgentConfig config, ServiceTable services, TokenProvider token_provider);

  ~TunnelAgent();

  TunnelAgent(const TunnelAgent&) = delete;
  TunnelAgent& operator=(const TunnelAgent&) = delete;

  void start();

  void stop();

  // Sends "AUTH <token>" on a fresh stream of the live session and waits for "OK"
  void refresh_credential(const std::string& token, RefreshDone done = nullptr);

  AgentState state() const {
    return state_.load();
  }

  size_t active_streams() const {
    return active_streams_.load();
  }

  // Invoked on every transition, on the agent strand
  void set_state_listener(StateListener listener);

  // {server_url}?id={agent_id}
  static std::string tunnel_url(const std::string& server_url, const std::string& agent_id);

 private:
  void connect();
  void schedule_reconnect(const Status& reason);
  void on_session_closed(uint64_t session_id, const std::string& reason);
  void set_state(AgentState state);

  void handle_stream(std::shared_ptr<mux::MuxStream> stream);
  void dial_local(std::shared_ptr<mux::MuxStream> stream, const std::string& service, LocalTarget target, std::string leftover,
                  std::chrono::steady_clock::time_point deadline);

  asio::io_context& io_ctx_;
  asio::strand<asio::io_context::executor_type> strand_;
  asio::steady_timer reconnect_timer_;

  AgentConfig config_;
  ServiceTable services_;
  TokenProvider token_provider_;
  Backoff backoff_;

  // Strand-only
  std::shared_ptr<mux::MuxSession> session_;
  StateListener state_listener_;

  std::atomic<AgentState> state_{AgentState::Disconnected};
  std::atomic<bool> stopping_{false};
  std::atomic<size_t> active_streams_{0};
};

}  // namespace kuberde::agent
