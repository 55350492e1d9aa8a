// kuberde-operator: reconciles AgentWorkloads into Deployments and relay routes
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
            << "Runs in-cluster by default (service account token and CA). Environment:\n"
            << "  KUBERDE_NAMESPACE, KUBERDE_RELAY_URL, KUBERDE_AGENT_IMAGE, KUBERDE_SERVER_URL,\n"
            << "  AUTH_TOKEN_URL, AUTH_CLIENT_ID, AUTH_CLIENT_SECRET, AUTH_TOKEN, KUBERDE_LOG_LEVEL\n";
}

int main(int argc, char* argv[]) {
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--version") {
      std::cout << "kuberde-operator " << version() << "\n";
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

  ControllerConfig config = config_path.empty() ? ControllerConfig{} : ControllerConfig::load(config_path);
  config = ControllerConfig::from_env(config);
  init("kuberde-operator", config.log);

  controller::Controller controller(config);
  auto status = controller.start();
  if (!status.ok()) {
    spdlog::critical("Startup failed: {}", status.to_string());
    return 1;
  }

  asio::io_context signal_ctx;
  asio::signal_set signals(signal_ctx, SIGINT, SIGTERM);
  signals.async_wait([&controller](const asio::error_code& ec, int signo) {
    if (ec) return;
    spdlog::info("Received signal {}, shutting down", signo);
    controller.stop();
  });
  std::thread signal_thread([&signal_ctx] { signal_ctx.run(); });

  controller.wait();
  signal_ctx.stop();
  signal_thread.join();
  return 0;
}
