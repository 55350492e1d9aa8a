#pragma once

#include <asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include "mux/frame.hpp"

namespace kuberde::mux {

class MuxSession;

/**
 * Logical stream inside a MuxSession.
 *
 * async_read delivers whatever bytes are buffered (at least one), then asio::error::eof
 * after the peer half-closed. async_write completes once the last frame of the buffer
 * was written to the connection; writes are bounded by the peer's receive window.
 * At most one read may be outstanding; writes are queued in order.
 */
class MuxStream : public std::enable_shared_from_this<MuxStream> {
 public:
  using ReadHandler = std::function<void(const asio::error_code&, std::string)>;
  using WriteHandler = std::function<void(const asio::error_code&, size_t)>;

  uint32_t id() const {
    return id_;
  }

  void async_read(ReadHandler handler);

  void async_write(std::string data, WriteHandler handler);

  // Half-close: FIN after queued writes drain. Reads continue until the peer closes.
  void close();

  // Abort both directions (RST)
  void reset();

  std::shared_ptr<MuxSession> session() const {
    return session_.lock();
  }

 private:
  friend class MuxSession;

  struct PendingWrite {
    std::string data;
    size_t offset = 0;
    WriteHandler handler;
  };

  MuxStream(std::weak_ptr<MuxSession> session, uint32_t id, asio::strand<asio::any_io_executor> strand);

  // Strand-only, driven by the session
  bool on_data(std::string payload);
  void on_window_update(uint32_t delta);
  void on_remote_fin();
  void on_remote_reset();
  void on_session_closed();

  void pump_reads();
  void pump_writes();
  void send_fin();
  void maybe_finish();
  void fail_all(const asio::error_code& ec);

  std::weak_ptr<MuxSession> session_;
  uint32_t id_;
  asio::strand<asio::any_io_executor> strand_;

  std::string recv_buf_;
  uint32_t recv_window_ = kInitialWindow;
  uint32_t consumed_ = 0;
  ReadHandler read_handler_;

  uint32_t send_window_ = kInitialWindow;
  std::deque<PendingWrite> pending_writes_;

  bool fin_pending_ = false;
  bool local_fin_ = false;
  bool remote_fin_ = false;
  bool reset_ = false;
  bool session_closed_ = false;
  bool finished_ = false;
};

}  // namespace kuberde::mux
