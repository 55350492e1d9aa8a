// kuberde-agent: in-pod side of the tunnel, bootstrapped from the environment
#include <spdlog/spdlog.h>

#include <asio.hpp>
#include <atomic>
#include <csignal>
#include <future>
#include <iostream>
#include <string>
#include <thread>

#include "agent/service_table.hpp"
#include "auth/credential_source.hpp"
#include "auth/token_refresher.hpp"
#include "kuberde/kuberde.hpp"
#include "net/http_client.hpp"

using namespace kuberde;

static void print_usage(const char* argv0) {
  std::cout << "Usage: " << argv0 << " [--config FILE]\n"
            << "\n"
            << "Environment:\n"
            << "  SERVER_URL          relay tunnel endpoint, e.g. http://kuberde-server:8080/ws\n"
            << "  AGENT_ID            user-{owner}-{workload}\n"
            << "  KUBERDE_SERVICES    {\"services\":[{\"name\",\"port\",\"protocol\"}]}\n"
            << "  LOCAL_TARGET        host:port used when no service table is given\n"
            << "  AUTH_TOKEN_URL, AUTH_CLIENT_ID, AUTH_CLIENT_SECRET, or AUTH_TOKEN\n";
}

int main(int argc, char* argv[]) {
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--version") {
      std::cout << "kuberde-agent " << version() << "\n";
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

  AgentConfig config = config_path.empty() ? AgentConfig{} : AgentConfig::load(config_path);
  config = AgentConfig::from_env(config);
  init("kuberde-agent", config.log);

  if (config.server_url.empty() || config.agent_id.empty()) {
    spdlog::critical("SERVER_URL and AGENT_ID are required");
    return 1;
  }
  auto services = agent::ServiceTable::from_config(config);
  if (!services.ok()) {
    spdlog::critical("Invalid service table: {}", services.status.to_string());
    return 1;
  }
  spdlog::info("[{}] services: {}", config.agent_id, services.value->describe());

  asio::io_context io_ctx;
  auto work = asio::make_work_guard(io_ctx);
  std::thread io_thread([&io_ctx] { io_ctx.run(); });
  auto shutdown_io = [&] {
    work.reset();
    io_ctx.stop();
    io_thread.join();
  };

  auto http = std::make_shared<net::HttpClient>(io_ctx);
  auto source = auth::make_credential_source(http, config.token_url, config.client_id, config.client_secret, config.static_token);
  if (!source.ok()) {
    spdlog::critical("No credential configured: {}", source.status.message);
    shutdown_io();
    return 1;
  }

  auth::TokenRefresher refresher(*source.value, config.refresh_fraction, config.refresh_retry);
  auto status = refresher.fetch_initial();
  if (!status.ok()) {
    spdlog::critical("Could not obtain a credential: {}", status.to_string());
    shutdown_io();
    return 1;
  }

  auto tunnel = std::make_shared<agent::TunnelAgent>(io_ctx, config, std::move(*services.value), [&refresher] { return refresher.token(); });

  std::promise<int> exit_code;
  auto exit_future = exit_code.get_future();
  std::atomic<bool> exiting{false};
  auto request_exit = [&exit_code, &exiting](int code) {
    if (!exiting.exchange(true)) exit_code.set_value(code);
  };

  std::string identity = config.agent_id;
  refresher.start(
      [tunnel, identity](const auth::Credential& credential) {
        tunnel->refresh_credential(credential.token, [identity](const Status& result) {
          if (!result.ok()) spdlog::warn("[{}] credential swap failed: {}", identity, result.to_string());
        });
      },
      [&request_exit, identity](const Status& failure) {
        spdlog::critical("[{}] credential refresh exhausted: {}", identity, failure.to_string());
        request_exit(1);
      });

  asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
  signals.async_wait([&request_exit](const asio::error_code& ec, int signo) {
    if (ec) return;
    spdlog::info("Received signal {}, shutting down", signo);
    request_exit(0);
  });

  tunnel->start();
  int code = exit_future.get();

  refresher.stop();
  tunnel->stop();
  asio::error_code ignored;
  signals.cancel(ignored);
  shutdown_io();
  return code;
}
