#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "mux/frame.hpp"

namespace kuberde::mux {

class MuxStream;

// Client opens odd stream ids (agent), Server opens even ids (relay)
enum class Role { Client, Server };

struct SessionOptions {
  std::chrono::milliseconds keepalive_interval{15000};  // 0 disables pings
  std::chrono::milliseconds keepalive_timeout{45000};   // silence before the session is declared dead
  size_t max_streams = 1024;
  std::string name;  // log context, e.g. the agent identity
};

using StreamHandler = std::function<void(std::shared_ptr<MuxStream>)>;
using CloseHandler = std::function<void(const std::string& reason)>;

/**
 * One multiplexed connection carrying many logical streams.
 *
 * All session and stream state lives on a single strand. Public methods may be
 * called from any thread; handlers are invoked on the session strand.
 */
class MuxSession : public std::enable_shared_from_this<MuxSession> {
 public:
  // initial_bytes: bytes already read from the socket past the handshake
  static std::shared_ptr<MuxSession> create(asio::ip::tcp::socket socket, Role role, SessionOptions options, std::string initial_bytes = {});

  ~MuxSession();

  MuxSession(const MuxSession&) = delete;
  MuxSession& operator=(const MuxSession&) = delete;

  // Begins reading frames. on_stream receives peer-opened streams, on_close fires once.
  void start(StreamHandler on_stream, CloseHandler on_close);

  // Opens an outbound stream; nullptr once the session is closed
  std::shared_ptr<MuxStream> open_stream();

  // Sends GoAway, then closes the connection and every stream
  void close(const std::string& reason);

  bool is_closed() const {
    return closed_.load();
  }

  std::chrono::steady_clock::time_point last_heard() const;

  size_t stream_count() const {
    return stream_count_.load();
  }

  uint64_t id() const {
    return id_;
  }

  const std::string& name() const {
    return options_.name;
  }

  std::string remote_address() const {
    return remote_address_;
  }

 private:
  friend class MuxStream;

  struct OutFrame {
    std::string bytes;
    std::function<void(const asio::error_code&)> done;
  };

  MuxSession(asio::ip::tcp::socket socket, Role role, SessionOptions options, std::string initial_bytes);

  // Strand-only
  void do_read();
  bool process_buffer();
  void handle_frame(const FrameHeader& header, std::string payload);
  void handle_stream_frame(const FrameHeader& header, std::string payload);
  void send_frame(const FrameHeader& header, const std::string& payload = {}, std::function<void(const asio::error_code&)> done = nullptr);
  void do_write();
  void schedule_keepalive();
  void protocol_error(const std::string& message);
  void shutdown(const std::string& reason);
  void remove_stream(uint32_t stream_id);
  bool is_remote_id(uint32_t stream_id) const;
  void touch();

  asio::ip::tcp::socket socket_;
  asio::strand<asio::any_io_executor> strand_;
  asio::steady_timer keepalive_timer_;
  Role role_;
  SessionOptions options_;
  uint64_t id_;
  std::string remote_address_;

  std::atomic<bool> closed_{false};
  std::atomic<uint32_t> next_stream_id_;
  std::atomic<int64_t> last_heard_ns_{0};
  std::atomic<size_t> stream_count_{0};

  // Strand-only state
  bool shutdown_ = false;
  bool started_ = false;
  std::string rbuf_;
  std::vector<char> read_chunk_;
  std::deque<OutFrame> write_queue_;
  bool writing_ = false;
  uint32_t ping_id_ = 0;
  std::map<uint32_t, std::shared_ptr<MuxStream>> streams_;
  StreamHandler on_stream_;
  CloseHandler on_close_;
};

}  // namespace kuberde::mux
