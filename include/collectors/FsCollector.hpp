#pragma once
#include <string>

namespace procsight::collectors {

class FsCollector {
public:
  explicit FsCollector(std::string mountpoint = "/") : mountpoint_(std::move(mountpoint)) {}
  // Used share of the filesystem holding mountpoint, 0..100
  bool sample(double& used_pct) const;
private:
  std::string mountpoint_;
};

} // namespace procsight::collectors
