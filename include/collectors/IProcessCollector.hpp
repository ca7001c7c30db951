#pragma once
#include "model/Sample.hpp"

namespace procsight::collectors {

// Source of per-process samples for the monitor loop.
class IProcessCollector {
public:
  virtual ~IProcessCollector() = default;

  // Initialize collector. Return false if unavailable (permissions, platform).
  [[nodiscard]] virtual bool init() { return true; }

  // Sample current process state into out. Return true on success.
  [[nodiscard]] virtual bool sample(procsight::model::ProcessTable& out) = 0;

  virtual void shutdown() {}

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace procsight::collectors
