#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace procsight::app {

// key -> last time (ms) an alert fired for it
class CooldownMap {
public:
  [[nodiscard]] std::optional<int64_t> get(const std::string& key) const;
  void set(const std::string& key, int64_t fired_at_ms);
  void erase(const std::string& key);
  // Records now_ms and returns true if key is not cooling down; check and
  // update happen under one lock.
  [[nodiscard]] bool try_claim(const std::string& key, int64_t now_ms, int64_t period_ms);
  // Drops keys whose window has passed; returns how many went.
  size_t prune(int64_t now_ms, int64_t period_ms);
  [[nodiscard]] size_t size() const;

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, int64_t> last_;
};

} // namespace procsight::app
