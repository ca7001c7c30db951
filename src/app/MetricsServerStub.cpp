#include "app/MetricsServer.hpp"
#include <cstdio>

namespace procsight::app {

MetricsServer::MetricsServer(const SnapshotBuffers& buffers, uint16_t port)
    : buffers_(buffers), port_(port) {}

MetricsServer::~MetricsServer() = default;

void MetricsServer::start() {
  std::fprintf(stderr, "procsight: MetricsServer: built without liburing, exporter on :%d disabled\n", port_);
}

void MetricsServer::stop() {}

} // namespace procsight::app
