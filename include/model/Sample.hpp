#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace procsight::model {

// One resource-usage observation of a single process.
struct Sample {
  int32_t pid{};
  std::string name;
  int64_t timestamp_ms{};  // wall clock, ms since epoch
  double cpu{};            // percent of one core, summed over cores
  double memory{};         // resident set size, MiB
  int32_t threads{};
  int32_t priority{};
  double io_read{};        // bytes/s
  double io_write{};       // bytes/s
  double net_sent{};       // bytes/s
  double net_received{};   // bytes/s
};

struct SystemStats {
  double cpu_pct{};   // 0..100
  double mem_pct{};   // 0..100
  double disk_pct{};  // 0..100
  unsigned cores{1};
  int64_t timestamp_ms{};
};

struct ProcessTable {
  std::vector<Sample> processes; // busiest first
  size_t total_processes{};
};

} // namespace procsight::model
