#include "app/HistoryStore.hpp"

#include <algorithm>

namespace procsight::app {

void HistoryStore::append(int32_t pid, const procsight::model::Sample& s) {
  std::lock_guard<std::mutex> lk(mu_);
  auto& buf = buffers_[pid];
  while (buf.size() >= capacity_) buf.pop_front();
  buf.push_back(s);
}

std::vector<procsight::model::Sample> HistoryStore::window(int32_t pid, size_t n) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = buffers_.find(pid);
  if (it == buffers_.end()) return {};
  const auto& buf = it->second;
  const size_t take = std::min(n, buf.size());
  return {buf.end() - static_cast<std::ptrdiff_t>(take), buf.end()};
}

size_t HistoryStore::size(int32_t pid) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = buffers_.find(pid);
  return it == buffers_.end() ? 0 : it->second.size();
}

std::vector<int32_t> HistoryStore::pids() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<int32_t> out;
  out.reserve(buffers_.size());
  for (const auto& [pid, _] : buffers_) out.push_back(pid);
  std::sort(out.begin(), out.end());
  return out;
}

void HistoryStore::erase(int32_t pid) {
  std::lock_guard<std::mutex> lk(mu_);
  buffers_.erase(pid);
}

size_t HistoryStore::retain(const std::unordered_set<int32_t>& live) {
  std::lock_guard<std::mutex> lk(mu_);
  return std::erase_if(buffers_, [&](const auto& kv){ return !live.contains(kv.first); });
}

} // namespace procsight::app
