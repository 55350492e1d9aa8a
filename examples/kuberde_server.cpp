// kuberde-server: agent tunnels, TCP/HTTP routing, management and login endpoints
#include <spdlog/spdlog.h>

#include <asio.hpp>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "kuberde/kuberde.hpp"

using namespace kuberde;

static void print_usage(const char* argv0) {
  std::cout << "Usage: " << argv0 << " [--config FILE]\n"
            << "\n"
            << "Settings are read from FILE (JSON) and then overridden by the environment\n"
            << "(KUBERDE_LISTEN_ADDR, KUBERDE_HTTP_PORT, KUBERDE_AGENT_DOMAIN, KUBERDE_SIGNING_KEY, ...).\n";
}

int main(int argc, char* argv[]) {
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--version") {
      std::cout << "kuberde-server " << version() << "\n";
      return 0;
    } else if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage(argv[0]);
      return 2;
    }
  }

  ServerConfig config = config_path.empty() ? ServerConfig{} : ServerConfig::load(config_path);
  config = ServerConfig::from_env(config);
  init("kuberde-server", config.log);

  relay::RelayServer server(config);
  auto status = server.start();
  if (!status.ok()) {
    spdlog::critical("Startup failed: {}", status.to_string());
    return 1;
  }

  asio::io_context signal_ctx;
  asio::signal_set signals(signal_ctx, SIGINT, SIGTERM);
  signals.async_wait([&server](const asio::error_code& ec, int signo) {
    if (ec) return;
    spdlog::info("Received signal {}, shutting down", signo);
    server.stop();
  });
  std::thread signal_thread([&signal_ctx] { signal_ctx.run(); });

  server.wait();
  signal_ctx.stop();
  signal_thread.join();
  return 0;
}
