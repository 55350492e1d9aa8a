#pragma once

#include <array>
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "mux/stream.hpp"

namespace kuberde::tunnel {

struct BridgeOptions {
  std::chrono::milliseconds idle_timeout{0};          // 0 = no limit
  std::chrono::milliseconds half_close_linger{30000};  // after one side finished, 0 = wait forever
  std::string name;                                    // log context
};

struct BridgeStats {
  uint64_t bytes_to_stream = 0;  // socket -> stream
  uint64_t bytes_to_socket = 0;  // stream -> socket
  std::string reason;
};

using BridgeDone = std::function<void(const BridgeStats&)>;

/**
 * Copies bytes between a TCP socket and a mux stream, one task per direction.
 *
 * Both directions share one cancellation scope: an error on either side, the idle
 * timeout or the half-close linger tears down both. A clean EOF is forwarded as a
 * half-close (FIN on the stream, shutdown(send) on the socket). on_done runs once.
 */
class Bridge : public std::enable_shared_from_this<Bridge> {
 public:
  static std::shared_ptr<Bridge> create(std::shared_ptr<asio::ip::tcp::socket> socket, std::shared_ptr<mux::MuxStream> stream, BridgeOptions options,
                                        BridgeDone on_done = nullptr);

  // Pending bytes already read from either side are delivered first
  void start(std::string initial_to_stream = {}, std::string initial_to_socket = {});

  void stop();

  uint64_t bytes_to_stream() const {
    return bytes_to_stream_.load();
  }

  uint64_t bytes_to_socket() const {
    return bytes_to_socket_.load();
  }

 private:
  Bridge(std::shared_ptr<asio::ip::tcp::socket> socket, std::shared_ptr<mux::MuxStream> stream, BridgeOptions options, BridgeDone on_done);

  void read_socket();
  void write_stream(std::string data);
  void read_stream();
  void write_socket(std::string data);

  void upstream_finished();
  void downstream_finished();
  void check_finished();
  void teardown(const std::string& reason);
  void touch();
  void schedule_idle_check();

  std::shared_ptr<asio::ip::tcp::socket> socket_;
  std::shared_ptr<mux::MuxStream> stream_;
  BridgeOptions options_;
  BridgeDone on_done_;
  asio::strand<asio::any_io_executor> strand_;
  asio::steady_timer idle_timer_;
  asio::steady_timer linger_timer_;
  std::array<char, 16 * 1024> chunk_{};

  std::atomic<uint64_t> bytes_to_stream_{0};
  std::atomic<uint64_t> bytes_to_socket_{0};

  // Strand-only
  std::chrono::steady_clock::time_point last_activity_;
  bool up_done_ = false;
  bool down_done_ = false;
  bool torn_down_ = false;
};

}  // namespace kuberde::tunnel
