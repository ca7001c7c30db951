#include "app/Monitor.hpp"
#include <algorithm>
#include <cstdio>
#include <unordered_set>

using namespace std::chrono;

namespace procsight::app {

static constexpr size_t kTrainingPoolMax = 20000;
static constexpr int64_t kCleanupEveryMs = 3600 * 1000;

Monitor::Monitor(SnapshotBuffers& buffers, AnalysisEngine& analysis, AlertEngine& alerts,
                 std::unique_ptr<procsight::collectors::IProcessCollector> proc, MonitorSettings settings,
                 bool verbose)
  : buffers_(buffers), analysis_(analysis), alerts_(alerts), proc_(std::move(proc)),
    settings_(settings), verbose_(verbose) {}

void Monitor::start() {
  if (thread_.joinable()) return;
  if (proc_ && !proc_->init())
    std::fprintf(stderr, "procsight: Monitor: process collector '%s' failed to initialize\n", proc_->name());
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Monitor::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  wait_for_training();
  if (proc_) proc_->shutdown();
}

Monitor::~Monitor() { stop(); }

void Monitor::wait_for_training() {
  if (trainer_.joinable()) trainer_.join();
}

void Monitor::run(std::stop_token st) {
  // Prime the delta-based collectors so the first tick reports real rates
  {
    procsight::model::SystemStats s;
    procsight::model::ProcessTable t;
    if (!system_.sample(s))
      std::fprintf(stderr, "procsight: Monitor: system stats unavailable\n");
    if (proc_ && !proc_->sample(t))
      std::fprintf(stderr, "procsight: Monitor: process scan failed\n");
    std::this_thread::sleep_for(250ms);
  }

  const auto interval = milliseconds(settings_.interval_ms);
  auto next_tick = steady_clock::now();
  while (!st.stop_requested()) {
    auto now = steady_clock::now();
    if (now >= next_tick) {
      tick();
      next_tick = now + interval;
    }
    // sleep until next tick, bounded so stop requests are seen promptly
    auto sleep_for = duration_cast<milliseconds>(next_tick - steady_clock::now());
    if (sleep_for < 10ms) sleep_for = 10ms;
    if (sleep_for > 100ms) sleep_for = 100ms;
    std::this_thread::sleep_for(sleep_for);
  }
}

void Monitor::tick() {
  procsight::model::SystemStats stats;
  procsight::model::ProcessTable table;
  if (!system_.sample(stats) && verbose_)
    std::fprintf(stderr, "procsight: Monitor: system stats incomplete\n");
  if (proc_ && !proc_->sample(table))
    std::fprintf(stderr, "procsight: Monitor: process scan failed\n");
  evaluate(stats, table);
}

std::vector<procsight::model::ProcessReport> Monitor::evaluate_batch(const std::vector<procsight::model::Sample>& batch,
                                                                     std::vector<procsight::model::Alert>& alerts) {
  std::vector<procsight::model::ProcessReport> reports(batch.size());
  std::vector<std::vector<procsight::model::Alert>> per_slot(batch.size());
  auto work = [&](size_t first, size_t stride){
    for (size_t i = first; i < batch.size(); i += stride) {
      reports[i].sample = batch[i];
      reports[i].analysis = analysis_.analyze(batch[i]);
      per_slot[i] = alerts_.check_process_thresholds(batch[i], reports[i].analysis);
    }
  };
  const size_t workers = std::min<size_t>(static_cast<size_t>(settings_.eval_workers), batch.size());
  if (workers <= 1) {
    work(0, 1);
  } else {
    std::vector<std::jthread> pool;
    pool.reserve(workers);
    for (size_t w = 0; w < workers; ++w) pool.emplace_back(work, w, workers);
  } // joined here
  for (auto& v : per_slot)
    for (auto& a : v) alerts.push_back(std::move(a));
  return reports;
}

void Monitor::evaluate(const procsight::model::SystemStats& stats, const procsight::model::ProcessTable& table) {
  std::lock_guard<std::mutex> lk(tick_mu_);
  const uint64_t tick_no = ticks_.load(std::memory_order_relaxed) + 1;

  std::vector<procsight::model::Sample> batch(table.processes.begin(),
      table.processes.begin() + static_cast<std::ptrdiff_t>(std::min(table.processes.size(), static_cast<size_t>(settings_.batch_size))));

  auto& s = buffers_.back();
  s.stats = stats;
  s.total_processes = table.total_processes;
  s.collector_name = proc_ ? proc_->name() : "";
  s.alerts = alerts_.check_system_thresholds(stats);
  s.reports = evaluate_batch(batch, s.alerts);

  std::unordered_set<int32_t> live;
  for (const auto& p : table.processes) live.insert(p.pid);
  analysis_.history().retain(live);
  alerts_.prune_cooldowns();

  {
    std::lock_guard<std::mutex> plk(pool_mu_);
    training_pool_.insert(training_pool_.end(), batch.begin(), batch.end());
    if (training_pool_.size() > kTrainingPoolMax)
      training_pool_.erase(training_pool_.begin(),
                           training_pool_.begin() + static_cast<std::ptrdiff_t>(training_pool_.size() - kTrainingPoolMax));
  }
  maybe_train(tick_no);

  const int64_t now_ms = stats.timestamp_ms ? stats.timestamp_ms : system_now_ms();
  if (now_ms - last_cleanup_ms_ >= kCleanupEveryMs) {
    size_t n = alerts_.clear_old_alerts(settings_.alert_retention_days);
    if (n > 0 && verbose_) std::fprintf(stderr, "procsight: Monitor: cleared %zu resolved alerts\n", n);
    last_cleanup_ms_ = now_ms;
  }

  s.models = analysis_.model_status();
  s.alert_stats = alerts_.alert_stats();
  if (verbose_)
    std::fprintf(stderr, "procsight: Monitor: tick %llu evaluated %zu of %zu processes, %zu alerts\n",
                 static_cast<unsigned long long>(tick_no), s.reports.size(), table.total_processes, s.alerts.size());
  buffers_.publish();
  ticks_.store(tick_no, std::memory_order_release);
}

void Monitor::maybe_train(uint64_t tick_no) {
  const auto first = static_cast<uint64_t>(settings_.train_after_ticks);
  bool due = (tick_no == first);
  if (settings_.retrain_every_ticks > 0 && tick_no > first)
    due = due || ((tick_no - first) % static_cast<uint64_t>(settings_.retrain_every_ticks) == 0);
  if (!due) return;
  bool expected = false;
  if (!training_.compare_exchange_strong(expected, true)) return; // previous run still going

  std::vector<procsight::model::Sample> pool;
  {
    std::lock_guard<std::mutex> plk(pool_mu_);
    pool = training_pool_;
  }
  if (trainer_.joinable()) trainer_.join();
  trainer_ = std::jthread([this, pool = std::move(pool)]{
    std::fprintf(stderr, "procsight: Monitor: training models on %zu samples\n", pool.size());
    if (!analysis_.initialize(pool))
      std::fprintf(stderr, "procsight: Monitor: some models failed to train\n");
    training_.store(false, std::memory_order_release);
  });
}

} // namespace procsight::app
