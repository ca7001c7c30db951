#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "app/SnapshotBuffers.hpp"
#include "store/IMetricSink.hpp"

namespace procsight::app {

// Appends every published snapshot, as MetricRecords in Prometheus text, to
// hourly chunk files under log_dir. Old chunks are pruned on rotation.
class LogWriter : public procsight::store::IMetricSink {
public:
  LogWriter(const SnapshotBuffers& buffers, std::filesystem::path log_dir,
            std::chrono::milliseconds interval = std::chrono::milliseconds(1000),
            int retention_days = 7);
  ~LogWriter() override;
  LogWriter(const LogWriter&) = delete;
  LogWriter& operator=(const LogWriter&) = delete;

  void start();
  void stop();

  // Writes one timestamped block; an empty batch writes nothing.
  [[nodiscard]] bool write(const std::vector<procsight::model::MetricRecord>& batch) override;

  // Deletes procsight_*.prom chunks last modified before now - retention.
  // Returns the number of files removed.
  size_t prune_old_chunks();

  // "procsight_YYYY-MM-DD_HH.prom" for the local hour containing t.
  [[nodiscard]] static std::string chunk_name(std::time_t t);

  [[nodiscard]] const std::filesystem::path& log_dir() const { return log_dir_; }

private:
  void run(std::stop_token st);
  size_t prune_locked();
  [[nodiscard]] std::filesystem::path chunk_path() const;

  const SnapshotBuffers& buffers_;
  std::filesystem::path log_dir_;
  std::chrono::milliseconds interval_;
  int retention_days_;

  std::mutex file_mu_;
  std::ofstream file_;
  std::filesystem::path current_path_;
  std::jthread thread_;
};

} // namespace procsight::app
