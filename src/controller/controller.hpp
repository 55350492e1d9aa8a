#pragma once

#include <memory>
#include <string>

#include "controller/cluster_client.hpp"
#include "controller/relay_client.hpp"
#include "core/config.hpp"
#include "core/types.hpp"

namespace kuberde::controller {

// Answer to a scale-up signal
enum class ScaleUpAnswer {
  Accepted,        // 202, queued for the reconcile thread
  AlreadyRunning,  // 200
  Unknown,         // 404, no workload with that identity
  NotReady         // 503, no successful list yet
};

int scale_up_http_status(ScaleUpAnswer answer);

/**
 * kuberde-operator: the reconcile loop, the scale-up queue and the health server.
 *
 * Without injected clients, start() builds a KubeClient from the in-cluster
 * service account and an HttpRelayClient carrying the system credential.
 */
class Controller {
 public:
  explicit Controller(ControllerConfig config, std::shared_ptr<ClusterClient> cluster = nullptr, std::shared_ptr<RelayClient> relay = nullptr);

  ~Controller();

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;

  Status start();

  void stop();

  // Blocks until stop() was called
  void wait();

  uint16_t health_port() const;

  // True once a list of the watched resources has succeeded
  bool ready() const;

  ScaleUpAnswer request_scale_up(const std::string& identity);

  // Runs one full reconcile pass on the reconcile thread's behalf
  void trigger_pass();

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

}  // namespace kuberde::controller
