// kuberde-connect: reach a service of an agent through the relay
//
//   ssh -o ProxyCommand='kuberde-connect user-alice-ws' alice@ws     (stdin/stdout)
//   kuberde-connect --listen 2222 user-alice-ws                      (local port)
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <array>
#include <asio.hpp>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "kuberde/kuberde.hpp"
#include "net/http_message.hpp"
#include "tunnel/handshake.hpp"

using namespace kuberde;

namespace {

struct Options {
  std::string server_url;
  std::string token;
  std::string service = "ssh";
  std::string agent_id;
  uint16_t listen_port = 0;
  std::chrono::milliseconds timeout{15000};
};

// One-directional copy; done runs once with the terminating error (eof on a clean end)
template <typename From, typename To>
class Pump : public std::enable_shared_from_this<Pump<From, To>> {
 public:
  using Done = std::function<void(const asio::error_code&)>;

  Pump(std::shared_ptr<From> from, std::shared_ptr<To> to, Done done) : from_(std::move(from)), to_(std::move(to)), done_(std::move(done)) {}

  void start(std::string initial) {
    if (initial.empty()) {
      read();
      return;
    }
    pending_ = std::move(initial);
    auto self = this->shared_from_this();
    asio::async_write(*to_, asio::buffer(pending_), [self](const asio::error_code& ec, size_t) {
      if (ec) return self->done_(ec);
      self->read();
    });
  }

 private:
  void read() {
    auto self = this->shared_from_this();
    from_->async_read_some(asio::buffer(chunk_), [self](const asio::error_code& ec, size_t n) {
      if (ec) return self->done_(ec);
      asio::async_write(*self->to_, asio::buffer(self->chunk_.data(), n), [self](const asio::error_code& wec, size_t) {
        if (wec) return self->done_(wec);
        self->read();
      });
    });
  }

  std::shared_ptr<From> from_;
  std::shared_ptr<To> to_;
  Done done_;
  std::string pending_;
  std::array<char, 16 * 1024> chunk_{};
};

template <typename From, typename To>
void pump(std::shared_ptr<From> from, std::shared_ptr<To> to, std::string initial, typename Pump<From, To>::Done done) {
  std::make_shared<Pump<From, To>>(std::move(from), std::move(to), std::move(done))->start(std::move(initial));
}

std::string connect_url(const Options& options) {
  std::string base = options.server_url;
  while (!base.empty() && base.back() == '/') base.pop_back();
  return base + "/connect/" + options.agent_id + "?service=" + net::url_encode(options.service);
}

void print_usage(const char* argv0) {
  std::cout << "Usage: " << argv0 << " [options] AGENT_ID\n"
            << "\n"
            << "Options:\n"
            << "  --server URL     relay base URL (KUBERDE_SERVER)\n"
            << "  --token TOKEN    bearer credential (KUBERDE_TOKEN)\n"
            << "  --service NAME   service of the agent, default ssh\n"
            << "  --listen PORT    serve 127.0.0.1:PORT instead of stdin/stdout\n";
}

// stdin/stdout <-> one upgraded connection; exits when the remote side ends
int run_stdio(const Options& options) {
  asio::io_context io_ctx;
  int code = 0;

  tunnel::async_upgrade(io_ctx, connect_url(options), options.token, options.timeout, [&](Result<tunnel::UpgradedConnection> result) {
    if (!result.ok()) {
      spdlog::error("connect to {} failed: {}", options.agent_id, result.status.to_string());
      code = result.code() == ErrorCode::AgentUnavailable ? 75 : 1;
      return;
    }
    auto socket = result.value->socket;
    auto in = std::make_shared<asio::posix::stream_descriptor>(io_ctx, ::dup(STDIN_FILENO));
    auto out = std::make_shared<asio::posix::stream_descriptor>(io_ctx, ::dup(STDOUT_FILENO));

    pump(in, socket, {}, [socket](const asio::error_code&) {
      asio::error_code ignored;
      socket->shutdown(asio::ip::tcp::socket::shutdown_send, ignored);
    });
    pump(socket, out, std::move(result.value->leftover), [&io_ctx](const asio::error_code& ec) {
      if (ec && ec != asio::error::eof) spdlog::warn("connection closed: {}", ec.message());
      io_ctx.stop();
    });
  });

  io_ctx.run();
  return code;
}

void accept_next(asio::io_context& io_ctx, asio::ip::tcp::acceptor& acceptor, const Options& options) {
  acceptor.async_accept([&io_ctx, &acceptor, &options](const asio::error_code& ec, asio::ip::tcp::socket accepted) {
    if (ec) {
      if (ec != asio::error::operation_aborted) spdlog::error("accept failed: {}", ec.message());
      return;
    }
    auto local = std::make_shared<asio::ip::tcp::socket>(std::move(accepted));
    tunnel::async_upgrade(io_ctx, connect_url(options), options.token, options.timeout, [local, &options](Result<tunnel::UpgradedConnection> result) {
      if (!result.ok()) {
        spdlog::warn("connect to {} failed: {}", options.agent_id, result.status.to_string());
        asio::error_code ignored;
        local->close(ignored);
        return;
      }
      auto remote = result.value->socket;
      auto close_both = [local, remote](const asio::error_code&) {
        asio::error_code ignored;
        local->close(ignored);
        remote->close(ignored);
      };
      pump(local, remote, {}, close_both);
      pump(remote, local, std::move(result.value->leftover), close_both);
    });
    accept_next(io_ctx, acceptor, options);
  });
}

int run_listener(const Options& options) {
  asio::io_context io_ctx;
  asio::ip::tcp::acceptor acceptor(io_ctx);
  asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), options.listen_port);
  asio::error_code ec;
  acceptor.open(endpoint.protocol(), ec);
  if (!ec) acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
  if (!ec) acceptor.bind(endpoint, ec);
  if (!ec) acceptor.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    spdlog::error("listen on 127.0.0.1:{} failed: {}", options.listen_port, ec.message());
    return 1;
  }

  spdlog::info("Forwarding 127.0.0.1:{} to {} ({})", options.listen_port, options.agent_id, options.service);
  asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
  signals.async_wait([&io_ctx](const asio::error_code&, int) { io_ctx.stop(); });
  accept_next(io_ctx, acceptor, options);
  io_ctx.run();
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  Options options;
  if (const char* v = std::getenv("KUBERDE_SERVER")) options.server_url = v;
  if (const char* v = std::getenv("KUBERDE_TOKEN")) options.token = v;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--server" && i + 1 < argc) {
      options.server_url = argv[++i];
    } else if (arg == "--token" && i + 1 < argc) {
      options.token = argv[++i];
    } else if (arg == "--service" && i + 1 < argc) {
      options.service = argv[++i];
    } else if (arg == "--listen" && i + 1 < argc) {
      int port = std::atoi(argv[++i]);
      if (port <= 0 || port > 65535) {
        std::cerr << "Invalid port: " << argv[i] << "\n";
        return 2;
      }
      options.listen_port = static_cast<uint16_t>(port);
    } else if (arg == "--version") {
      std::cout << "kuberde-connect " << version() << "\n";
      return 0;
    } else if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else if (!arg.empty() && arg[0] != '-' && options.agent_id.empty()) {
      options.agent_id = arg;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage(argv[0]);
      return 2;
    }
  }

  if (options.agent_id.empty() || options.server_url.empty()) {
    print_usage(argv[0]);
    return 2;
  }

  // stdout may carry the tunnelled bytes, so logs stay on stderr at warn unless asked otherwise
  LogConfig log;
  log.level = std::getenv("KUBERDE_LOG_LEVEL") ? std::getenv("KUBERDE_LOG_LEVEL") : "warn";
  init("kuberde-connect", log);

  return options.listen_port ? run_listener(options) : run_stdio(options);
}
