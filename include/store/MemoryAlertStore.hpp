#pragma once
#include "store/IAlertStore.hpp"

#include <map>
#include <mutex>

namespace procsight::store {

class MemoryAlertStore : public IAlertStore {
public:
  bool insert(const procsight::model::Alert& a) override;
  bool update(const procsight::model::Alert& a) override;
  std::optional<procsight::model::Alert> find(const std::string& id) const override;
  std::optional<std::vector<procsight::model::Alert>> recent(size_t limit, bool unacknowledged_only) const override;
  std::optional<std::vector<procsight::model::Alert>> created_since(int64_t since_ms) const override;
  std::optional<size_t> erase_resolved_before(int64_t cutoff_ms) override;

  [[nodiscard]] size_t size() const;

private:
  mutable std::mutex mu_;
  std::map<std::string, procsight::model::Alert> alerts_;
};

} // namespace procsight::store
