#include "app/Alerts.hpp"

#include <algorithm>
#include <cstdio>
#include <numeric>

namespace procsight::app {

using procsight::model::Alert;
using procsight::model::AlertData;
using procsight::model::AlertSource;
using procsight::model::AlertType;

int64_t system_now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
           std::chrono::system_clock::now().time_since_epoch()).count();
}

static std::string fmt_pct(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", v);
  return buf;
}

static std::string to_base36(uint64_t v) {
  static constexpr char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  std::string s;
  do { s.insert(s.begin(), digits[v % 36]); v /= 36; } while (v);
  return s;
}

AlertEngine::AlertEngine(procsight::store::IAlertStore& store, AlertRules rules, Clock clock)
  : store_(store), rules_(rules), clock_(std::move(clock)) {
  if (!clock_) clock_ = system_now_ms;
}

std::string AlertEngine::next_id(int64_t now_ms) {
  uint64_t r;
  {
    std::lock_guard<std::mutex> lk(rng_mu_);
    r = rng_() % (36ULL * 36 * 36 * 36 * 36 * 36);
  }
  return std::to_string(now_ms) + "-" + std::to_string(++counter_) + "-" + to_base36(r);
}

std::optional<Alert> AlertEngine::create_alert(const AlertData& data) {
  const int64_t now = clock_();
  Alert a;
  a.id = next_id(now);
  a.type = data.type;
  a.severity = data.severity.value_or(procsight::model::default_severity(data.type));
  a.source = data.source;
  a.pid = data.pid;
  a.process_name = data.process_name;
  a.metric = data.metric;
  a.message = data.message;
  a.details = data.details;
  a.ml_detected = data.ml_detected;
  a.algorithm = data.algorithm;
  a.created_at = now;
  a.updated_at = now;
  if (!store_.insert(a)) {
    std::fprintf(stderr, "procsight: AlertEngine: failed to store alert '%s'\n", a.message.c_str());
    return std::nullopt;
  }
  {
    std::lock_guard<std::mutex> lk(active_mu_);
    active_[a.id] = a;
    if (active_.size() > rules_.max_active) {
      auto oldest = std::min_element(active_.begin(), active_.end(), [](const auto& x, const auto& y){
        return x.second.created_at < y.second.created_at;
      });
      active_.erase(oldest);
    }
  }
  return a;
}

void AlertEngine::fire(const std::string& key, const AlertData& data, std::vector<Alert>& out) {
  const int64_t now = clock_();
  if (!cooldowns_.try_claim(key, now, rules_.cooldown.count())) return;
  if (auto a = create_alert(data)) {
    out.push_back(std::move(*a));
  } else {
    cooldowns_.erase(key);
  }
}

std::vector<Alert> AlertEngine::check_system_thresholds(const procsight::model::SystemStats& stats) {
  struct Check { const char* metric; const char* label; double value; ThresholdPair t; };
  const Check checks[] = {
    {"cpu", "CPU", stats.cpu_pct, rules_.cpu},
    {"memory", "memory", stats.mem_pct, rules_.memory},
    {"disk", "disk", stats.disk_pct, rules_.disk},
  };
  std::vector<Alert> out;
  for (const auto& c : checks) {
    AlertData d;
    d.source = AlertSource::System;
    d.metric = c.metric;
    d.details.current_value = c.value;
    if (c.value > c.t.critical) {
      d.type = AlertType::Critical;
      d.details.threshold = c.t.critical;
      d.message = std::string("Critical ") + c.label + " usage: " + fmt_pct(c.value);
      fire(std::string("system:") + c.metric + ":critical", d, out);
    } else if (c.value > c.t.warning) {
      d.type = AlertType::Warning;
      d.details.threshold = c.t.warning;
      d.message = std::string("High ") + c.label + " usage: " + fmt_pct(c.value);
      fire(std::string("system:") + c.metric + ":warning", d, out);
    }
  }
  return out;
}

std::vector<Alert> AlertEngine::check_process_thresholds(const procsight::model::Sample& sample,
                                                         const procsight::model::AnalysisResult& analysis) {
  std::vector<Alert> out;
  const std::string prefix = "process:" + std::to_string(sample.pid) + ":";
  const std::string who = sample.name + " (PID " + std::to_string(sample.pid) + ")";

  auto base = [&](AlertType type, AlertSource src, const char* metric){
    AlertData d;
    d.type = type;
    d.source = src;
    d.pid = sample.pid;
    d.process_name = sample.name;
    d.metric = metric;
    return d;
  };

  if (sample.cpu > rules_.process_cpu_pct) {
    auto d = base(AlertType::Warning, AlertSource::Threshold, "cpu");
    d.message = "Process " + who + " high CPU: " + fmt_pct(sample.cpu);
    d.details.current_value = sample.cpu;
    d.details.threshold = rules_.process_cpu_pct;
    fire(prefix + "cpu", d, out);
  }

  if (analysis.anomaly.is_anomaly) {
    const bool crit = analysis.anomaly.severity == procsight::model::Tier::Critical;
    auto d = base(crit ? AlertType::Critical : AlertType::Warning, AlertSource::Anomaly, "anomaly_score");
    char score[16];
    std::snprintf(score, sizeof(score), "%.2f", analysis.anomaly.score);
    d.message = "Anomalous behaviour in " + who + ", score " + score;
    d.details.anomaly_score = analysis.anomaly.score;
    d.details.threshold = crit ? rules_.anomaly.critical : rules_.anomaly.warning;
    d.ml_detected = true;
    d.algorithm = "Isolation Forest";
    fire(prefix + "anomaly", d, out);
  }

  if (analysis.predictions && !analysis.predictions->empty()) {
    const auto& p = *analysis.predictions;
    const double mean = std::accumulate(p.begin(), p.end(), 0.0) / static_cast<double>(p.size());
    if (mean > rules_.prediction_cpu_pct) {
      auto d = base(AlertType::Warning, AlertSource::Prediction, "cpu");
      d.message = "Predicted CPU for " + who + " averages " + fmt_pct(mean);
      d.details.prediction = mean;
      d.details.current_value = sample.cpu;
      d.details.threshold = rules_.prediction_cpu_pct;
      d.ml_detected = true;
      d.algorithm = "LSTM";
      fire(prefix + "prediction", d, out);
    }
  }
  return out;
}

std::optional<Alert> AlertEngine::acknowledge_alert(const std::string& id, const std::string& actor) {
  auto a = store_.find(id);
  if (!a) return std::nullopt;
  if (a->resolved || a->acknowledged) return a;
  const int64_t now = clock_();
  a->acknowledged = true;
  a->acknowledged_at = now;
  a->acknowledged_by = actor.empty() ? std::string("system") : actor;
  a->updated_at = now;
  if (!store_.update(*a)) {
    std::fprintf(stderr, "procsight: AlertEngine: failed to acknowledge alert %s\n", id.c_str());
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lk(active_mu_);
  active_.erase(id);
  return a;
}

std::optional<Alert> AlertEngine::resolve_alert(const std::string& id) {
  auto a = store_.find(id);
  if (!a) return std::nullopt;
  if (a->resolved) return a;
  const int64_t now = clock_();
  a->resolved = true;
  a->resolved_at = now;
  a->updated_at = now;
  if (!store_.update(*a)) {
    std::fprintf(stderr, "procsight: AlertEngine: failed to resolve alert %s\n", id.c_str());
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lk(active_mu_);
  active_.erase(id);
  return a;
}

std::vector<Alert> AlertEngine::recent_alerts(size_t limit, bool unacknowledged_only) const {
  auto r = store_.recent(limit, unacknowledged_only);
  if (!r) {
    std::fprintf(stderr, "procsight: AlertEngine: recent alert query failed\n");
    return {};
  }
  return std::move(*r);
}

procsight::model::AlertStats AlertEngine::alert_stats(std::chrono::milliseconds range) const {
  procsight::model::AlertStats st;
  st.range_ms = range.count();
  auto r = store_.created_since(clock_() - range.count());
  if (!r) {
    std::fprintf(stderr, "procsight: AlertEngine: alert stats query failed\n");
    return st;
  }
  st.total = r->size();
  for (const auto& a : *r) {
    st.by_type[procsight::model::alert_type_name(a.type)]++;
    if (a.ml_detected) st.ml_detected++;
  }
  return st;
}

std::vector<Alert> AlertEngine::active_alerts() const {
  std::lock_guard<std::mutex> lk(active_mu_);
  std::vector<Alert> out;
  out.reserve(active_.size());
  for (const auto& [id, a] : active_) out.push_back(a);
  return out;
}

size_t AlertEngine::clear_old_alerts(int days) {
  const int64_t cutoff = clock_() - static_cast<int64_t>(days) * 24 * 3600 * 1000;
  {
    std::lock_guard<std::mutex> lk(active_mu_);
    std::erase_if(active_, [cutoff](const auto& kv){ return kv.second.created_at < cutoff; });
  }
  auto n = store_.erase_resolved_before(cutoff);
  if (!n) {
    std::fprintf(stderr, "procsight: AlertEngine: failed to clear alerts older than %d days\n", days);
    return 0;
  }
  return *n;
}

size_t AlertEngine::prune_cooldowns() {
  return cooldowns_.prune(clock_(), rules_.cooldown.count());
}

} // namespace procsight::app
