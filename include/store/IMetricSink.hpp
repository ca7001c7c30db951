#pragma once
#include "model/MetricRecord.hpp"

#include <vector>

namespace procsight::store {

class IMetricSink {
public:
  virtual ~IMetricSink() = default;
  [[nodiscard]] virtual bool write(const std::vector<procsight::model::MetricRecord>& batch) = 0;
};

} // namespace procsight::store
