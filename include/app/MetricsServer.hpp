#pragma once

#include <cstdint>
#include <string>
#include <thread>
#include "app/StatsBuffers.hpp"
#include "model/Stats.hpp"

namespace ideguard::app {

// Serialize watchdog stats into Prometheus text exposition format (version 0.0.4).
[[nodiscard]] std::string stats_to_prometheus(const ideguard::model::WatchdogStats& st);

// Minimal HTTP endpoint serving GET /metrics from StatsBuffers.
// Built on io_uring when IDEGUARD_HAVE_URING is defined; otherwise start()
// only reports that metrics are unavailable.
class MetricsServer {
public:
  MetricsServer(const StatsBuffers& buffers, uint16_t port);
  ~MetricsServer();
  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  void start();
  void stop();

  [[nodiscard]] static bool available();

private:
  void run(std::stop_token st);
  void handle_client(int client_fd);

  const StatsBuffers& buffers_;
  uint16_t port_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::jthread thread_;
};

} // namespace ideguard::app
