#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include "app/SnapshotBuffers.hpp"
#include "model/MetricRecord.hpp"
#include "model/Snapshot.hpp"

namespace procsight::app {

// Serialize a Snapshot into Prometheus text exposition format (version 0.0.4).
[[nodiscard]] std::string snapshot_to_prometheus(const procsight::model::Snapshot& snap);

// Same format for persisted records; one sample line per record and field.
[[nodiscard]] std::string records_to_prometheus(const std::vector<procsight::model::MetricRecord>& records);

// Flatten the evaluated reports of a snapshot into MetricRecords.
[[nodiscard]] std::vector<procsight::model::MetricRecord> to_metric_records(const procsight::model::Snapshot& snap);

struct HttpResponse {
  int status{200};
  std::string reason{"OK"};
  std::string content_type{"text/plain"};
  std::string body;
};

// Map the request line ("GET /metrics HTTP/1.1") to a response.
// Routes: /metrics, /healthz, / ; anything else is 404.
[[nodiscard]] HttpResponse route_request(std::string_view request_line, const SnapshotBuffers& buffers);
// Status line and headers, terminated by the blank line.
[[nodiscard]] std::string response_headers(const HttpResponse& resp);

class MetricsServer {
public:
  MetricsServer(const SnapshotBuffers& buffers, uint16_t port);
  ~MetricsServer();
  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  void start();
  void stop();

private:
  void run(std::stop_token st);
  void handle_client(int client_fd);

  const SnapshotBuffers& buffers_;
  uint16_t port_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::jthread thread_;
};

} // namespace procsight::app
