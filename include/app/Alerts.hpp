#pragma once
#include "app/CooldownMap.hpp"
#include "model/Alert.hpp"
#include "model/Analysis.hpp"
#include "model/Sample.hpp"
#include "store/IAlertStore.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace procsight::app {

struct ThresholdPair {
  double warning;
  double critical;
};

struct AlertRules {
  ThresholdPair cpu{70.0, 85.0};        // system cpu %
  ThresholdPair memory{75.0, 90.0};     // system memory %
  ThresholdPair disk{80.0, 95.0};       // root filesystem %
  ThresholdPair anomaly{0.6, 0.8};      // isolation score
  double process_cpu_pct = 90.0;        // per process, warning
  double prediction_cpu_pct = 85.0;     // mean forecast, warning
  std::chrono::milliseconds cooldown = std::chrono::seconds(60);
  size_t max_active = 1000;             // open alerts kept in memory
};

// Milliseconds since the Unix epoch.
using Clock = std::function<int64_t()>;
int64_t system_now_ms();

// Turns threshold breaches and model verdicts into stored alerts, at most
// one per key per cooldown window, and manages their lifecycle.
class AlertEngine {
public:
  explicit AlertEngine(procsight::store::IAlertStore& store, AlertRules rules = {}, Clock clock = system_now_ms);

  std::vector<procsight::model::Alert> check_system_thresholds(const procsight::model::SystemStats& stats);
  std::vector<procsight::model::Alert> check_process_thresholds(const procsight::model::Sample& sample,
                                                                const procsight::model::AnalysisResult& analysis);

  // std::nullopt when the store rejects the alert.
  std::optional<procsight::model::Alert> create_alert(const procsight::model::AlertData& data);
  std::optional<procsight::model::Alert> acknowledge_alert(const std::string& id, const std::string& actor = "system");
  std::optional<procsight::model::Alert> resolve_alert(const std::string& id);

  [[nodiscard]] std::vector<procsight::model::Alert> recent_alerts(size_t limit = 50, bool unacknowledged_only = false) const;
  [[nodiscard]] procsight::model::AlertStats alert_stats(std::chrono::milliseconds range = std::chrono::hours(24)) const;
  [[nodiscard]] std::vector<procsight::model::Alert> active_alerts() const;
  // Erases resolved alerts older than days from the store and forgets open
  // ones of the same age.
  size_t clear_old_alerts(int days = 30);
  // Drops cooldown keys whose window has passed, e.g. of exited pids.
  size_t prune_cooldowns();

  [[nodiscard]] const AlertRules& rules() const { return rules_; }
  [[nodiscard]] CooldownMap& cooldowns() { return cooldowns_; }

private:
  std::string next_id(int64_t now_ms);
  // Claims key, creates the alert, and releases the claim if the store fails.
  void fire(const std::string& key, const procsight::model::AlertData& data, std::vector<procsight::model::Alert>& out);

  procsight::store::IAlertStore& store_;
  AlertRules rules_;
  Clock clock_;
  CooldownMap cooldowns_;
  mutable std::mutex active_mu_;
  std::map<std::string, procsight::model::Alert> active_;
  std::atomic<uint64_t> counter_{0};
  std::mutex rng_mu_;
  std::mt19937_64 rng_{std::random_device{}()};
};

} // namespace procsight::app
