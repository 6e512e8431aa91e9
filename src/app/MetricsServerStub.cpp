#ifndef IDEGUARD_HAVE_URING

#include "app/MetricsServer.hpp"
#include <cstdio>

namespace ideguard::app {

MetricsServer::MetricsServer(const StatsBuffers& buffers, uint16_t port)
    : buffers_(buffers), port_(port) {}

MetricsServer::~MetricsServer() = default;

bool MetricsServer::available() { return false; }

void MetricsServer::start() {
  std::fprintf(stderr, "ideguard: metrics server: built without liburing, port %d ignored\n", port_);
}

void MetricsServer::stop() {}

} // namespace ideguard::app

#endif // !IDEGUARD_HAVE_URING
