#include "app/CooldownMap.hpp"

namespace procsight::app {

std::optional<int64_t> CooldownMap::get(const std::string& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = last_.find(key);
  if (it == last_.end()) return std::nullopt;
  return it->second;
}

void CooldownMap::set(const std::string& key, int64_t fired_at_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  last_[key] = fired_at_ms;
}

void CooldownMap::erase(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  last_.erase(key);
}

bool CooldownMap::try_claim(const std::string& key, int64_t now_ms, int64_t period_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  auto [it, inserted] = last_.try_emplace(key, now_ms);
  if (inserted) return true;
  if (now_ms - it->second < period_ms) return false;
  it->second = now_ms;
  return true;
}

size_t CooldownMap::prune(int64_t now_ms, int64_t period_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  return std::erase_if(last_, [&](const auto& kv){ return now_ms - kv.second >= period_ms; });
}

size_t CooldownMap::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_.size();
}

} // namespace procsight::app
