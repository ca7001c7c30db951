#pragma once
#include <cstdint>
#include <string_view>

namespace procsight::collectors {

struct MemoryInfo {
  uint64_t total_kb{};
  uint64_t available_kb{};
  uint64_t used_kb{};
  double   used_pct{}; // 0..100
};

// Machine memory pressure from /proc/meminfo.
class MemoryCollector {
public:
  bool sample(MemoryInfo& out) const;
  // Kernels without MemAvailable count free + buffers + page cache as available.
  static bool parse_meminfo(std::string_view text, MemoryInfo& out);
};

} // namespace procsight::collectors
