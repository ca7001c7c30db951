#pragma once
#include "model/Sample.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace procsight::app {

// Bounded per-pid FIFO of recent samples. All operations are serialized.
class HistoryStore {
public:
  explicit HistoryStore(size_t capacity = 100) : capacity_(capacity ? capacity : 1) {}

  // Appends and drops the oldest entries so the buffer never exceeds capacity.
  void append(int32_t pid, const procsight::model::Sample& s);
  // Most recent n samples for pid, oldest first.
  [[nodiscard]] std::vector<procsight::model::Sample> window(int32_t pid, size_t n) const;
  [[nodiscard]] std::vector<procsight::model::Sample> all(int32_t pid) const { return window(pid, capacity_); }
  [[nodiscard]] size_t size(int32_t pid) const;
  [[nodiscard]] std::vector<int32_t> pids() const;
  void erase(int32_t pid);
  // Drops buffers of pids not in live; returns how many were dropped.
  size_t retain(const std::unordered_set<int32_t>& live);
  [[nodiscard]] size_t capacity() const { return capacity_; }

private:
  size_t capacity_;
  mutable std::mutex mu_;
  std::unordered_map<int32_t, std::deque<procsight::model::Sample>> buffers_;
};

} // namespace procsight::app
