#pragma once
#include "collectors/CpuCollector.hpp"
#include "collectors/FsCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "model/Sample.hpp"

namespace procsight::collectors {

// cpu, memory and root filesystem usage in one reading
class SystemCollector {
public:
  explicit SystemCollector(std::string disk_mount = "/") : fs_(std::move(disk_mount)) {}
  // False when cpu or memory could not be read; disk falls back to 0.
  bool sample(procsight::model::SystemStats& out);
private:
  CpuCollector cpu_;
  MemoryCollector mem_;
  FsCollector fs_;
  unsigned cores_{0};
};

} // namespace procsight::collectors
