#pragma once
#include "model/Cpu.hpp"

namespace procsight::collectors {

// Machine-wide cpu utilisation from /proc/stat deltas. The first call
// only primes the baseline and reports 0.
class CpuCollector {
public:
  CpuCollector() = default;
  bool sample(double& usage_pct);
private:
  procsight::model::CpuTimes last_total_{};
  bool has_last_{false};
};

} // namespace procsight::collectors
