#pragma once
#include "model/Alert.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace procsight::store {

// Durable alert storage. Failures are reported through return values.
class IAlertStore {
public:
  virtual ~IAlertStore() = default;
  [[nodiscard]] virtual bool insert(const procsight::model::Alert& a) = 0;
  [[nodiscard]] virtual bool update(const procsight::model::Alert& a) = 0;
  [[nodiscard]] virtual std::optional<procsight::model::Alert> find(const std::string& id) const = 0;
  // Newest first.
  [[nodiscard]] virtual std::optional<std::vector<procsight::model::Alert>> recent(size_t limit, bool unacknowledged_only) const = 0;
  [[nodiscard]] virtual std::optional<std::vector<procsight::model::Alert>> created_since(int64_t since_ms) const = 0;
  // Deletes resolved alerts created before cutoff_ms; returns the count.
  [[nodiscard]] virtual std::optional<size_t> erase_resolved_before(int64_t cutoff_ms) = 0;
};

} // namespace procsight::store
