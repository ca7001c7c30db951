#include "collectors/SystemCollector.hpp"
#include "util/Procfs.hpp"

#include <chrono>

namespace procsight::collectors {

bool SystemCollector::sample(procsight::model::SystemStats& out) {
  if (cores_ == 0) cores_ = procsight::util::cpu_count();
  out.cores = cores_;
  out.timestamp_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch()).count();
  bool ok = cpu_.sample(out.cpu_pct);
  MemoryInfo mi;
  if (mem_.sample(mi)) out.mem_pct = mi.used_pct; else ok = false;
  if (!fs_.sample(out.disk_pct)) out.disk_pct = 0.0;
  return ok;
}

} // namespace procsight::collectors
