#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace procsight::model {

// Persisted shape of one evaluated sample.
struct MetricRecord {
  std::string process_id; // "<pid>:<name>"
  std::string process_name;
  int32_t pid{};
  int64_t timestamp_ms{};
  struct {
    double cpu{}, memory{};
    int32_t threads{};
    double io_read{}, io_write{}, net_sent{}, net_received{};
  } metrics;
  struct {
    double anomaly_score{};
    bool is_anomaly{false};
    std::string classification;
    double confidence{};
    std::vector<double> predictions;
  } ml;
};

} // namespace procsight::model
