#include "store/MemoryAlertStore.hpp"

#include <algorithm>

namespace procsight::store {

using procsight::model::Alert;

bool MemoryAlertStore::insert(const Alert& a) {
  std::lock_guard<std::mutex> lk(mu_);
  return alerts_.emplace(a.id, a).second;
}

bool MemoryAlertStore::update(const Alert& a) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = alerts_.find(a.id);
  if (it == alerts_.end()) return false;
  it->second = a;
  return true;
}

std::optional<Alert> MemoryAlertStore::find(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = alerts_.find(id);
  if (it == alerts_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::vector<Alert>> MemoryAlertStore::recent(size_t limit, bool unacknowledged_only) const {
  std::vector<Alert> out;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, a] : alerts_)
      if (!unacknowledged_only || !a.acknowledged) out.push_back(a);
  }
  std::sort(out.begin(), out.end(), [](const Alert& a, const Alert& b){
    if (a.created_at != b.created_at) return a.created_at > b.created_at;
    return a.id > b.id;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

std::optional<std::vector<Alert>> MemoryAlertStore::created_since(int64_t since_ms) const {
  std::vector<Alert> out;
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& [id, a] : alerts_)
    if (a.created_at >= since_ms) out.push_back(a);
  return out;
}

std::optional<size_t> MemoryAlertStore::erase_resolved_before(int64_t cutoff_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  return std::erase_if(alerts_, [&](const auto& kv){ return kv.second.resolved && kv.second.created_at < cutoff_ms; });
}

size_t MemoryAlertStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return alerts_.size();
}

} // namespace procsight::store
