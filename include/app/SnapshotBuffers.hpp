#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include "model/Snapshot.hpp"

namespace procsight::app {

// Double buffer for Snapshot. The producer fills back() and publishes;
// readers on other threads take a copy with read().
class SnapshotBuffers {
public:
  SnapshotBuffers();
  // Non-copyable
  SnapshotBuffers(const SnapshotBuffers&) = delete;
  SnapshotBuffers& operator=(const SnapshotBuffers&) = delete;

  procsight::model::Snapshot& back();
  void publish(); // swap front/back, bump seq

  // Only safe on the producer thread.
  const procsight::model::Snapshot& front() const;
  [[nodiscard]] procsight::model::Snapshot read() const;
  uint64_t seq() const { return seq_.load(std::memory_order_acquire); }

private:
  procsight::model::Snapshot a_{};
  procsight::model::Snapshot b_{};
  mutable std::mutex swap_mu_;
  procsight::model::Snapshot* front_{&a_};
  procsight::model::Snapshot* back_{&b_};
  std::atomic<uint64_t> seq_{0};
};

} // namespace procsight::app
