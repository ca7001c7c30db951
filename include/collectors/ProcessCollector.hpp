#pragma once
#include "collectors/IProcessCollector.hpp"
#include <chrono>
#include <string>
#include <unordered_map>

namespace procsight::collectors {

// Scans /proc/[pid]/{stat,io}; cpu and io rates come from deltas between calls.
class ProcessCollector : public IProcessCollector {
public:
  explicit ProcessCollector(size_t max_procs = 50);
  const char* name() const override { return "/proc scanner"; }
  bool sample(procsight::model::ProcessTable& out) override;

  struct StatFields {
    std::string comm;
    char state{'?'};
    uint64_t utime{}, stime{};
    int32_t priority{}, threads{};
    int64_t rss_pages{};
  };
  static bool parse_stat_line(const std::string& content, StatFields& out);
  static bool parse_io(const std::string& content, uint64_t& read_bytes, uint64_t& write_bytes);

private:
  struct Prev { uint64_t total_time{}; uint64_t read_bytes{}; uint64_t write_bytes{}; };
  std::unordered_map<int32_t, Prev> last_per_proc_{};
  uint64_t last_cpu_total_{};
  std::chrono::steady_clock::time_point last_run_{};
  bool have_last_{false};
  size_t max_procs_{};
  unsigned ncpu_{0};
};

} // namespace procsight::collectors
