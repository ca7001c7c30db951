#include "minitest.hpp"
#include "app/Monitor.hpp"
#include "store/MemoryAlertStore.hpp"
#include <chrono>
#include <memory>
#include <thread>

using namespace procsight;

namespace {

// Replays a fixed table on every sample() call.
class ScriptedCollector : public collectors::IProcessCollector {
public:
  explicit ScriptedCollector(model::ProcessTable t) : table_(std::move(t)) {}
  bool sample(model::ProcessTable& out) override { out = table_; return true; }
  const char* name() const override { return "scripted"; }
private:
  model::ProcessTable table_;
};

model::Sample proc(int32_t pid, const char* name, double cpu) {
  model::Sample s;
  s.pid = pid;
  s.name = name;
  s.cpu = cpu;
  s.memory = 50;
  s.threads = 2;
  s.timestamp_ms = 1000;
  return s;
}

model::ProcessTable table_of(std::vector<model::Sample> procs) {
  model::ProcessTable t;
  t.total_processes = procs.size() + 10;
  t.processes = std::move(procs);
  return t;
}

struct Rig {
  app::SnapshotBuffers buffers;
  store::MemoryAlertStore store;
  app::AlertEngine alerts;
  app::AnalysisEngine analysis;
  app::Monitor monitor;

  explicit Rig(app::MonitorSettings settings, app::AlertRules rules = {})
    : alerts(store, rules),
      analysis(small_analysis()),
      monitor(buffers, analysis, alerts,
              std::make_unique<ScriptedCollector>(table_of({})), settings) {}

  static app::AnalysisConfig small_analysis() {
    app::AnalysisConfig cfg;
    cfg.anomaly.num_trees = 10;
    cfg.anomaly.seed = 1;
    cfg.predictor.hidden_units = 4;
    cfg.predictor.seed = 1;
    cfg.predictor_epochs = 1;
    cfg.forest.n_estimators = 5;
    cfg.synthetic_per_label = 5;
    return cfg;
  }
};

} // namespace

TEST(monitor_evaluate_publishes_snapshot) {
  app::MonitorSettings ms;
  ms.batch_size = 2;
  ms.eval_workers = 2;
  ms.train_after_ticks = 1000;
  Rig rig(ms);

  model::SystemStats stats;
  stats.cpu_pct = 96;
  stats.mem_pct = 40;
  stats.timestamp_ms = 5000;
  rig.monitor.evaluate(stats, table_of({proc(1, "hog", 95), proc(2, "b", 20), proc(3, "c", 1)}));

  ASSERT_EQ(rig.monitor.ticks(), 1u);
  ASSERT_EQ(rig.buffers.seq(), 1u);
  auto snap = rig.buffers.read();
  ASSERT_EQ(snap.seq, 1u);
  ASSERT_EQ(snap.reports.size(), 2u);
  ASSERT_EQ(snap.reports[0].sample.pid, 1);
  ASSERT_EQ(snap.reports[1].sample.pid, 2);
  ASSERT_EQ(snap.total_processes, 13u);
  ASSERT_EQ(snap.collector_name, std::string("scripted"));

  // system cpu critical + process cpu warning for pid 1
  ASSERT_EQ(snap.alerts.size(), 2u);
  ASSERT_TRUE(snap.alerts[0].source == model::AlertSource::System);
  ASSERT_TRUE(snap.alerts[1].source == model::AlertSource::Threshold);
  ASSERT_EQ(*snap.alerts[1].pid, 1);
  ASSERT_EQ(snap.alert_stats.total, 2u);
  ASSERT_TRUE(!snap.models.anomaly.trained);

  // evaluated processes were added to history; pid 3 was only seen
  ASSERT_EQ(rig.analysis.history().size(1), 1u);
  ASSERT_EQ(rig.analysis.history().size(3), 0u);
}

TEST(monitor_drops_history_of_exited_pids) {
  app::MonitorSettings ms;
  ms.train_after_ticks = 1000;
  Rig rig(ms);
  model::SystemStats stats;
  rig.monitor.evaluate(stats, table_of({proc(1, "a", 1), proc(2, "b", 1)}));
  ASSERT_EQ(rig.analysis.history().size(2), 1u);
  rig.monitor.evaluate(stats, table_of({proc(1, "a", 1)}));
  ASSERT_EQ(rig.analysis.history().size(1), 2u);
  ASSERT_EQ(rig.analysis.history().size(2), 0u);
  ASSERT_EQ(rig.monitor.ticks(), 2u);
}

TEST(monitor_trains_after_configured_ticks) {
  app::MonitorSettings ms;
  ms.train_after_ticks = 2;
  ms.batch_size = 5;
  Rig rig(ms);
  model::SystemStats stats;
  rig.monitor.evaluate(stats, table_of({proc(1, "nginx", 5)}));
  rig.monitor.evaluate(stats, table_of({proc(1, "nginx", 6)}));
  rig.monitor.wait_for_training();
  ASSERT_TRUE(!rig.monitor.training());
  // two samples are too few for the forest or the predictor; the classifier
  // always has the synthetic set
  auto st = rig.analysis.model_status();
  ASSERT_TRUE(st.classifier.trained);
  ASSERT_TRUE(!st.anomaly.trained);
}

TEST(monitor_start_stop_runs_ticks) {
  app::MonitorSettings ms;
  ms.interval_ms = 20;
  ms.train_after_ticks = 1000;
  Rig rig(ms);
  rig.monitor.start();
  auto t0 = std::chrono::steady_clock::now();
  while (rig.monitor.ticks() < 2 && std::chrono::steady_clock::now() - t0 < std::chrono::seconds(5))
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  rig.monitor.stop();
  ASSERT_TRUE(rig.monitor.ticks() >= 2);
  ASSERT_TRUE(rig.buffers.seq() >= 2);
}

TEST(monitor_prunes_expired_cooldowns_each_tick) {
  app::MonitorSettings ms;
  ms.train_after_ticks = 1000;
  app::AlertRules rules;
  rules.cooldown = std::chrono::milliseconds(0);
  Rig rig(ms, rules);
  model::SystemStats stats;
  rig.monitor.evaluate(stats, table_of({proc(1, "burst", 95)}));
  ASSERT_EQ(rig.buffers.read().alerts.size(), 1u);
  ASSERT_EQ(rig.alerts.cooldowns().size(), 0u);
  rig.monitor.evaluate(stats, table_of({proc(2, "burst", 95)}));
  ASSERT_EQ(rig.alerts.cooldowns().size(), 0u);
}
