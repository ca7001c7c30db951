#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>
#include "app/AnalysisEngine.hpp"
#include "app/Alerts.hpp"
#include "app/Config.hpp"
#include "app/SnapshotBuffers.hpp"
#include "collectors/IProcessCollector.hpp"
#include "collectors/SystemCollector.hpp"

namespace procsight::app {

// Periodic driver: sample, evaluate the busiest processes in parallel,
// raise alerts and publish a Snapshot per tick.
class Monitor {
public:
  Monitor(SnapshotBuffers& buffers, AnalysisEngine& analysis, AlertEngine& alerts,
          std::unique_ptr<procsight::collectors::IProcessCollector> proc, MonitorSettings settings,
          bool verbose = false);
  void start();
  void stop();
  ~Monitor();

  // One cycle from live collectors.
  void tick();
  // One cycle over already collected data.
  void evaluate(const procsight::model::SystemStats& stats, const procsight::model::ProcessTable& table);

  [[nodiscard]] uint64_t ticks() const { return ticks_.load(std::memory_order_acquire); }
  [[nodiscard]] bool training() const { return training_.load(std::memory_order_acquire); }
  // Blocks until a background training run (if any) has finished.
  void wait_for_training();

private:
  void run(std::stop_token st);
  std::vector<procsight::model::ProcessReport> evaluate_batch(const std::vector<procsight::model::Sample>& batch,
                                                              std::vector<procsight::model::Alert>& alerts);
  void maybe_train(uint64_t tick_no);

  SnapshotBuffers& buffers_;
  AnalysisEngine& analysis_;
  AlertEngine& alerts_;
  std::unique_ptr<procsight::collectors::IProcessCollector> proc_;
  procsight::collectors::SystemCollector system_{};
  MonitorSettings settings_;
  bool verbose_{false};

  std::jthread thread_{};
  std::mutex tick_mu_;
  std::atomic<uint64_t> ticks_{0};
  int64_t last_cleanup_ms_{0};

  std::mutex pool_mu_;
  std::vector<procsight::model::Sample> training_pool_;
  std::jthread trainer_{};
  std::atomic<bool> training_{false};
};

} // namespace procsight::app
