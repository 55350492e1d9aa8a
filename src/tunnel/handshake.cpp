#include "tunnel/handshake.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <sstream>

#include "net/http_client.hpp"
#include "net/http_message.hpp"

namespace kuberde::tunnel {

std::string build_upgrade_request(const std::string& host, const std::string& path_and_query, const std::string& token) {
  std::ostringstream req;
  req << "GET " << path_and_query << " HTTP/1.1\r\n";
  req << "Host: " << host << "\r\n";
  req << "Connection: Upgrade\r\n";
  req << "Upgrade: " << kUpgradeProtocol << "\r\n";
  if (!token.empty()) {
    req << "Authorization: Bearer " << token << "\r\n";
  }
  req << "\r\n";
  return req.str();
}

std::string build_upgrade_response() {
  std::ostringstream resp;
  resp << "HTTP/1.1 101 Switching Protocols\r\n";
  resp << "Connection: Upgrade\r\n";
  resp << "Upgrade: " << kUpgradeProtocol << "\r\n";
  resp << "\r\n";
  return resp.str();
}

std::string format_auth_line(const std::string& token) {
  return std::string(kAuthCommand) + " " + token + "\n";
}

Result<std::string> parse_auth_line(const std::string& line) {
  std::string prefix = std::string(kAuthCommand) + " ";
  if (line.compare(0, prefix.size(), prefix) != 0) {
    return Result<std::string>::failure(ErrorCode::InvalidArgument, "unknown control command");
  }
  std::string token = line.substr(prefix.size());
  while (!token.empty() && (token.back() == '\r' || token.back() == ' ')) {
    token.pop_back();
  }
  if (token.empty()) {
    return Result<std::string>::failure(ErrorCode::Unauthorized, "empty credential");
  }
  return Result<std::string>::success(std::move(token));
}

// ============================================================
// Preamble
// ============================================================

namespace {

struct PreambleState {
  std::shared_ptr<mux::MuxStream> stream;
  std::unique_ptr<asio::steady_timer> timer;
  PreambleOptions options;
  PreambleHandler handler;
  std::string buffer;
  bool done = false;

  void finish(Result<std::string> result, std::string leftover) {
    if (done) return;
    done = true;
    timer->cancel();
    if (!result.ok()) {
      stream->reset();
    }
    auto h = std::move(handler);
    handler = nullptr;
    h(std::move(result), std::move(leftover));
  }
};

void read_more(const std::shared_ptr<PreambleState>& state, const asio::any_io_executor& executor) {
  state->stream->async_read([state, executor](const asio::error_code& ec, std::string data) {
    // Serialize with the deadline timer
    asio::post(executor, [state, executor, ec, data = std::move(data)]() mutable {
      if (state->done) return;
      if (ec) {
        state->finish(Result<std::string>::failure(ErrorCode::Unavailable, "stream closed before preamble: " + ec.message()), {});
        return;
      }

      state->buffer += data;
      auto newline = state->buffer.find('\n');
      if (newline == std::string::npos) {
        if (state->buffer.size() > state->options.max_bytes) {
          state->finish(Result<std::string>::failure(ErrorCode::InvalidArgument, "preamble exceeds " + std::to_string(state->options.max_bytes) + " bytes"),
                        {});
          return;
        }
        read_more(state, executor);
        return;
      }

      if (newline > state->options.max_bytes) {
        state->finish(Result<std::string>::failure(ErrorCode::InvalidArgument, "preamble exceeds " + std::to_string(state->options.max_bytes) + " bytes"),
                      {});
        return;
      }

      std::string selector = state->buffer.substr(0, newline);
      if (!selector.empty() && selector.back() == '\r') selector.pop_back();
      std::string leftover = state->buffer.substr(newline + 1);
      state->finish(Result<std::string>::success(std::move(selector)), std::move(leftover));
    });
  });
}

}  // namespace

void read_preamble(const std::shared_ptr<mux::MuxStream>& stream, const asio::any_io_executor& executor, const PreambleOptions& options,
                   PreambleHandler handler) {
  auto strand = asio::make_strand(executor);
  auto state = std::make_shared<PreambleState>();
  state->stream = stream;
  state->timer = std::make_unique<asio::steady_timer>(strand);
  state->options = options;
  state->handler = std::move(handler);

  state->timer->expires_after(options.timeout);
  state->timer->async_wait([state, strand](const asio::error_code& ec) {
    if (ec) return;
    asio::post(strand, [state]() { state->finish(Result<std::string>::failure(ErrorCode::Timeout, "preamble deadline exceeded"), {}); });
  });

  read_more(state, strand);
}

// ============================================================
// Client-side upgrade
// ============================================================

namespace {

struct UpgradeState {
  asio::strand<asio::io_context::executor_type> strand;
  std::shared_ptr<asio::ip::tcp::socket> socket;
  asio::ip::tcp::resolver resolver;
  asio::steady_timer timer;
  UpgradeHandler handler;
  std::string request;
  std::string buffer;
  std::array<char, 4096> chunk{};
  bool done = false;
  bool timed_out = false;

  explicit UpgradeState(asio::io_context& io_ctx)
      : strand(asio::make_strand(io_ctx)), socket(std::make_shared<asio::ip::tcp::socket>(strand)), resolver(strand), timer(strand) {}

  void fail(ErrorCode code, const std::string& message) {
    if (done) return;
    done = true;
    timer.cancel();
    asio::error_code ignored;
    socket->close(ignored);
    auto h = std::move(handler);
    h(Result<UpgradedConnection>::failure(timed_out ? ErrorCode::Timeout : code, timed_out ? "tunnel handshake timed out" : message));
  }

  void succeed(std::string leftover) {
    if (done) return;
    done = true;
    timer.cancel();
    auto h = std::move(handler);
    h(Result<UpgradedConnection>::success(UpgradedConnection{socket, std::move(leftover)}));
  }
};

void read_upgrade_reply(const std::shared_ptr<UpgradeState>& state) {
  state->socket->async_read_some(asio::buffer(state->chunk), [state](const asio::error_code& ec, size_t n) {
    if (ec) {
      state->fail(ErrorCode::Unavailable, "reading handshake reply failed: " + ec.message());
      return;
    }
    state->buffer.append(state->chunk.data(), n);

    auto end = state->buffer.find("\r\n\r\n");
    if (end == std::string::npos) {
      if (state->buffer.size() > 16 * 1024) {
        state->fail(ErrorCode::Internal, "handshake reply head too large");
        return;
      }
      read_upgrade_reply(state);
      return;
    }

    std::string head = state->buffer.substr(0, end + 4);
    std::string leftover = state->buffer.substr(end + 4);
    auto status = net::parse_status_line(head.substr(0, head.find("\r\n")));
    if (!status) {
      state->fail(ErrorCode::Internal, "malformed handshake reply");
      return;
    }
    if (*status != 101) {
      std::string detail = leftover.substr(0, leftover.find('\n'));
      state->fail(error_code_from_http_status(*status), "relay answered " + std::to_string(*status) + (detail.empty() ? "" : ": " + detail));
      return;
    }
    state->succeed(std::move(leftover));
  });
}

}  // namespace

void async_upgrade(asio::io_context& io_ctx, const std::string& url, const std::string& token, std::chrono::milliseconds timeout,
                   UpgradeHandler handler) {
  auto state = std::make_shared<UpgradeState>(io_ctx);
  state->handler = std::move(handler);

  auto parsed = net::ParsedUrl::parse(url);
  if (!parsed) {
    asio::post(state->strand, [state, url]() { state->fail(ErrorCode::InvalidArgument, "invalid tunnel URL: " + url); });
    return;
  }
  if (parsed->is_https()) {
    // Encryption is provided by the enclosing transport (ingress / mesh)
    asio::post(state->strand, [state]() { state->fail(ErrorCode::InvalidArgument, "tunnel URL must be http:// or ws://"); });
    return;
  }

  state->request = build_upgrade_request(parsed->authority(), parsed->path + parsed->query, token);

  state->timer.expires_after(timeout);
  state->timer.async_wait([state](const asio::error_code& ec) {
    if (ec || state->done) return;
    state->timed_out = true;
    state->resolver.cancel();
    asio::error_code ignored;
    state->socket->close(ignored);
  });

  state->resolver.async_resolve(parsed->host, parsed->port_or_default(), [state](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
    if (ec) {
      state->fail(ErrorCode::Unavailable, "DNS resolution failed: " + ec.message());
      return;
    }
    asio::async_connect(*state->socket, results, [state](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
      if (ec) {
        state->fail(ErrorCode::Unavailable, "connect failed: " + ec.message());
        return;
      }
      asio::async_write(*state->socket, asio::buffer(state->request), [state](const asio::error_code& ec, size_t) {
        if (ec) {
          state->fail(ErrorCode::Unavailable, "sending handshake failed: " + ec.message());
          return;
        }
        read_upgrade_reply(state);
      });
    });
  });
}

}  // namespace kuberde::tunnel
