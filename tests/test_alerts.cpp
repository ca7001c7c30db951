#include "minitest.hpp"
#include "app/Alerts.hpp"
#include "store/MemoryAlertStore.hpp"
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace procsight;
using procsight::model::AlertType;
using procsight::model::AlertSource;

namespace {

struct FakeClock {
  std::shared_ptr<std::atomic<int64_t>> now = std::make_shared<std::atomic<int64_t>>(1'700'000'000'000);
  app::Clock fn() const { auto n = now; return [n]{ return n->load(); }; }
  void advance_s(int64_t s) { now->fetch_add(s * 1000); }
};

// Store that refuses every write.
class RejectingStore : public store::MemoryAlertStore {
public:
  bool insert(const model::Alert&) override { return false; }
};

model::SystemStats stats(double cpu, double mem = 10, double disk = 10) {
  model::SystemStats s;
  s.cpu_pct = cpu; s.mem_pct = mem; s.disk_pct = disk;
  return s;
}

} // namespace

TEST(alert_engine_critical_cpu_once_per_cooldown) {
  store::MemoryAlertStore st;
  FakeClock clk;
  app::AlertEngine eng(st, {}, clk.fn());

  auto first = eng.check_system_thresholds(stats(96));
  ASSERT_EQ(first.size(), 1u);
  ASSERT_TRUE(first[0].type == AlertType::Critical);
  ASSERT_TRUE(first[0].source == AlertSource::System);
  ASSERT_EQ(first[0].severity, 9);
  ASSERT_EQ(*first[0].metric, std::string("cpu"));
  ASSERT_NEAR(*first[0].details.current_value, 96.0, 0);
  ASSERT_NEAR(*first[0].details.threshold, 85.0, 0);

  clk.advance_s(30);
  ASSERT_TRUE(eng.check_system_thresholds(stats(96)).empty());

  clk.advance_s(31);
  ASSERT_EQ(eng.check_system_thresholds(stats(96)).size(), 1u);
  ASSERT_EQ(st.size(), 2u);
}

TEST(alert_engine_warning_band_and_tier_keys) {
  store::MemoryAlertStore st;
  FakeClock clk;
  app::AlertEngine eng(st, {}, clk.fn());

  auto w = eng.check_system_thresholds(stats(75, 80, 85));
  ASSERT_EQ(w.size(), 3u);
  for (const auto& a : w) {
    ASSERT_TRUE(a.type == AlertType::Warning);
    ASSERT_EQ(a.severity, 6);
  }
  // critical tier has its own cooldown key
  auto c = eng.check_system_thresholds(stats(90));
  ASSERT_EQ(c.size(), 1u);
  ASSERT_TRUE(c[0].type == AlertType::Critical);

  // exactly at the threshold is not a breach
  store::MemoryAlertStore st2;
  app::AlertEngine eng2(st2, {}, clk.fn());
  ASSERT_TRUE(eng2.check_system_thresholds(stats(70, 75, 80)).empty());
}

TEST(alert_engine_process_rules) {
  store::MemoryAlertStore st;
  FakeClock clk;
  app::AlertEngine eng(st, {}, clk.fn());

  model::Sample s;
  s.pid = 4242; s.name = "cruncher"; s.cpu = 95;
  model::AnalysisResult r;
  r.anomaly.score = 0.85;
  r.anomaly.is_anomaly = true;
  r.anomaly.severity = model::Tier::Critical;
  r.predictions = std::vector<double>{90, 88, 92};

  auto out = eng.check_process_thresholds(s, r);
  ASSERT_EQ(out.size(), 3u);
  ASSERT_TRUE(out[0].source == AlertSource::Threshold);
  ASSERT_EQ(*out[0].pid, 4242);
  ASSERT_TRUE(!out[0].ml_detected);

  ASSERT_TRUE(out[1].source == AlertSource::Anomaly);
  ASSERT_TRUE(out[1].type == AlertType::Critical);
  ASSERT_TRUE(out[1].ml_detected);
  ASSERT_EQ(*out[1].algorithm, std::string("Isolation Forest"));
  ASSERT_NEAR(*out[1].details.anomaly_score, 0.85, 0);

  ASSERT_TRUE(out[2].source == AlertSource::Prediction);
  ASSERT_EQ(*out[2].algorithm, std::string("LSTM"));
  ASSERT_NEAR(*out[2].details.prediction, 90.0, 1e-12);
  ASSERT_NEAR(*out[2].details.current_value, 95.0, 0);

  // same pid again inside the cooldown: nothing
  ASSERT_TRUE(eng.check_process_thresholds(s, r).empty());
  // a different pid has its own keys
  s.pid = 4243;
  ASSERT_EQ(eng.check_process_thresholds(s, r).size(), 3u);
}

TEST(alert_engine_prediction_mean_below_threshold) {
  store::MemoryAlertStore st;
  FakeClock clk;
  app::AlertEngine eng(st, {}, clk.fn());
  model::Sample s;
  s.pid = 1; s.name = "x"; s.cpu = 10;
  model::AnalysisResult r;
  r.predictions = std::vector<double>{95, 70, 80}; // mean 81.7
  ASSERT_TRUE(eng.check_process_thresholds(s, r).empty());
}

TEST(alert_engine_lifecycle) {
  store::MemoryAlertStore st;
  FakeClock clk;
  app::AlertEngine eng(st, {}, clk.fn());

  model::AlertData d;
  d.type = AlertType::Info;
  d.message = "hello";
  auto a = eng.create_alert(d);
  ASSERT_TRUE(a.has_value());
  ASSERT_EQ(a->severity, 3);
  ASSERT_EQ(eng.active_alerts().size(), 1u);

  d.severity = 8;
  auto b = eng.create_alert(d);
  ASSERT_EQ(b->severity, 8);
  ASSERT_NE(a->id, b->id);

  clk.advance_s(5);
  auto ack = eng.acknowledge_alert(a->id, "oncall");
  ASSERT_TRUE(ack && ack->acknowledged);
  ASSERT_EQ(*ack->acknowledged_by, std::string("oncall"));
  ASSERT_EQ(*ack->acknowledged_at, ack->updated_at);
  ASSERT_TRUE(ack->updated_at > ack->created_at);
  // acknowledging again returns the stored alert unchanged
  clk.advance_s(5);
  auto again = eng.acknowledge_alert(a->id, "someone-else");
  ASSERT_EQ(*again->acknowledged_by, std::string("oncall"));
  ASSERT_EQ(again->updated_at, ack->updated_at);

  auto c = eng.create_alert(d);
  auto by_default = eng.acknowledge_alert(c->id);
  ASSERT_EQ(*by_default->acknowledged_by, std::string("system"));

  auto res = eng.resolve_alert(b->id);
  ASSERT_TRUE(res && res->resolved && res->resolved_at.has_value());
  ASSERT_TRUE(eng.active_alerts().empty());

  ASSERT_TRUE(!eng.acknowledge_alert("no-such-id").has_value());
  ASSERT_TRUE(!eng.resolve_alert("no-such-id").has_value());

  auto unacked = eng.recent_alerts(10, true);
  ASSERT_EQ(unacked.size(), 1u);
  ASSERT_EQ(unacked[0].id, b->id);
}

TEST(alert_engine_stats_window) {
  store::MemoryAlertStore st;
  FakeClock clk;
  app::AlertEngine eng(st, {}, clk.fn());
  (void)eng.check_system_thresholds(stats(96));
  clk.advance_s(25 * 3600);
  model::Sample s;
  s.pid = 7; s.name = "p";
  model::AnalysisResult r;
  r.anomaly.is_anomaly = true;
  r.anomaly.severity = model::Tier::Warning;
  r.anomaly.score = 0.7;
  (void)eng.check_process_thresholds(s, r);

  auto day = eng.alert_stats();
  ASSERT_EQ(day.total, 1u);
  ASSERT_EQ(day.ml_detected, 1u);
  ASSERT_EQ(day.by_type.at("warning"), 1u);
  ASSERT_EQ(day.range_ms, 24 * 3600 * 1000);

  auto two_days = eng.alert_stats(std::chrono::hours(48));
  ASSERT_EQ(two_days.total, 2u);
  ASSERT_EQ(two_days.by_type.at("critical"), 1u);
}

TEST(alert_engine_clear_old_only_resolved) {
  store::MemoryAlertStore st;
  FakeClock clk;
  app::AlertEngine eng(st, {}, clk.fn());
  model::AlertData d;
  d.message = "old";
  auto keep = eng.create_alert(d);
  auto drop = eng.create_alert(d);
  (void)eng.resolve_alert(drop->id);
  clk.advance_s(31LL * 24 * 3600);
  ASSERT_EQ(eng.clear_old_alerts(30), 1u);
  ASSERT_TRUE(st.find(keep->id).has_value());
  ASSERT_TRUE(!st.find(drop->id).has_value());
}

TEST(alert_engine_store_failure_releases_cooldown) {
  RejectingStore st;
  FakeClock clk;
  app::AlertEngine eng(st, {}, clk.fn());
  ASSERT_TRUE(eng.check_system_thresholds(stats(96)).empty());
  ASSERT_TRUE(!eng.cooldowns().get("system:cpu:critical").has_value());
  model::AlertData d;
  ASSERT_TRUE(!eng.create_alert(d).has_value());
}

TEST(alert_engine_concurrent_checks_fire_once) {
  store::MemoryAlertStore st;
  FakeClock clk;
  app::AlertEngine eng(st, {}, clk.fn());
  std::atomic<size_t> fired{0};
  {
    std::vector<std::jthread> pool;
    for (int t = 0; t < 8; ++t)
      pool.emplace_back([&]{ fired += eng.check_system_thresholds(stats(99)).size(); });
  }
  ASSERT_EQ(fired.load(), 1u);
  ASSERT_EQ(st.size(), 1u);
}

TEST(cooldown_map_claims) {
  app::CooldownMap m;
  ASSERT_TRUE(m.try_claim("k", 1000, 60000));
  ASSERT_TRUE(!m.try_claim("k", 30000, 60000));
  ASSERT_EQ(*m.get("k"), 1000);
  ASSERT_TRUE(m.try_claim("k", 61000, 60000));
  ASSERT_EQ(*m.get("k"), 61000);
  m.set("j", 5);
  ASSERT_EQ(m.size(), 2u);
  m.erase("k");
  ASSERT_TRUE(!m.get("k").has_value());
}

TEST(cooldown_map_prune_drops_expired_windows) {
  app::CooldownMap m;
  ASSERT_TRUE(m.try_claim("process:1:cpu", 1000, 60000));
  ASSERT_TRUE(m.try_claim("process:2:cpu", 50000, 60000));
  ASSERT_EQ(m.prune(61000, 60000), 1u);
  ASSERT_TRUE(!m.get("process:1:cpu").has_value());
  // a key still inside its window keeps blocking
  ASSERT_TRUE(!m.try_claim("process:2:cpu", 61000, 60000));
  ASSERT_EQ(m.prune(110000, 60000), 1u);
  ASSERT_EQ(m.size(), 0u);
}

TEST(alert_engine_short_lived_pids_stay_bounded) {
  store::MemoryAlertStore st;
  FakeClock clk;
  app::AlertRules rules;
  rules.max_active = 50;
  app::AlertEngine eng(st, rules, clk.fn());
  model::AnalysisResult r;
  for (int32_t pid = 1; pid <= 2000; ++pid) {
    model::Sample s;
    s.pid = pid; s.name = "job"; s.cpu = 95;
    ASSERT_EQ(eng.check_process_thresholds(s, r).size(), 1u);
    clk.advance_s(120);
    (void)eng.prune_cooldowns();
  }
  ASSERT_TRUE(eng.cooldowns().size() < 2);
  auto active = eng.active_alerts();
  ASSERT_EQ(active.size(), 50u);
  // the newest alerts are the ones kept
  bool has_last = false;
  for (const auto& a : active) has_last = has_last || *a.pid == 2000;
  ASSERT_TRUE(has_last);
  ASSERT_EQ(st.size(), 2000u);
}

TEST(alert_engine_clear_old_forgets_aged_open_alerts) {
  store::MemoryAlertStore st;
  FakeClock clk;
  app::AlertEngine eng(st, {}, clk.fn());
  model::AlertData d;
  d.message = "stale";
  auto old = eng.create_alert(d);
  clk.advance_s(31LL * 24 * 3600);
  auto fresh = eng.create_alert(d);
  (void)eng.clear_old_alerts(30);
  auto active = eng.active_alerts();
  ASSERT_EQ(active.size(), 1u);
  ASSERT_EQ(active[0].id, fresh->id);
  // open alerts stay in the store
  ASSERT_TRUE(st.find(old->id).has_value());
}
