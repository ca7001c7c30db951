#include "collectors/FsCollector.hpp"

#include <sys/statvfs.h>
#include <cstdint>

namespace procsight::collectors {

bool FsCollector::sample(double& used_pct) const {
  struct statvfs vfs{};
  if (::statvfs(mountpoint_.c_str(), &vfs) != 0) return false;
  uint64_t total = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
  uint64_t avail = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
  uint64_t used = (total > avail) ? (total - avail) : 0ULL;
  used_pct = (total > 0) ? (100.0 * (double)used / (double)total) : 0.0;
  return true;
}

} // namespace procsight::collectors
