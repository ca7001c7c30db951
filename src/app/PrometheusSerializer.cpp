#include "app/MetricsServer.hpp"
#include <charconv>
#include <string>
#include <vector>
#include <algorithm>
#include <string_view>

namespace {

void append_double(std::string& out, double v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_escaped(std::string& out, std::string_view sv, size_t max_len = 0) {
  size_t limit = (max_len > 0) ? std::min(sv.size(), max_len) : sv.size();
  for (size_t i = 0; i < limit; ++i) {
    char c = sv[i];
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

void emit_header(std::string& out, const char* name, const char* help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_gauge_d(std::string& out, const char* name, double value) {
  out += name;  out += ' ';  append_double(out, value);  out += '\n';
}

void emit_gauge_u(std::string& out, const char* name, uint64_t value) {
  out += name;  out += ' ';  append_uint(out, value);  out += '\n';
}

// 1-label variant: name{key="val"} value
void emit_labeled_u(std::string& out, const char* name,
                    const char* lk, std::string_view lv, uint64_t value) {
  out += name;  out += '{';  out += lk;  out += "=\"";
  append_escaped(out, lv);
  out += "\"} ";  append_uint(out, value);  out += '\n';
}

// 2-label: name{k1="v1",k2="v2"} value
void emit_labeled_2d(std::string& out, const char* name,
                     const char* k1, std::string_view v1,
                     const char* k2, std::string_view v2, double value) {
  out += name;  out += '{';
  out += k1;  out += "=\"";  append_escaped(out, v1);  out += "\",";
  out += k2;  out += "=\"";  append_escaped(out, v2, 32);  out += "\"} ";
  append_double(out, value);  out += '\n';
}

void emit_labeled_2u(std::string& out, const char* name,
                     const char* k1, std::string_view v1,
                     const char* k2, std::string_view v2, uint64_t value) {
  out += name;  out += '{';
  out += k1;  out += "=\"";  append_escaped(out, v1);  out += "\",";
  out += k2;  out += "=\"";  append_escaped(out, v2, 32);  out += "\"} ";
  append_uint(out, value);  out += '\n';
}

// 3-label: name{k1="v1",k2="v2",k3="v3"} value
void emit_labeled_3d(std::string& out, const char* name,
                     const char* k1, std::string_view v1,
                     const char* k2, std::string_view v2,
                     const char* k3, std::string_view v3, double value) {
  out += name;  out += '{';
  out += k1;  out += "=\"";  append_escaped(out, v1);  out += "\",";
  out += k2;  out += "=\"";  append_escaped(out, v2, 32);  out += "\",";
  out += k3;  out += "=\"";  append_escaped(out, v3);  out += "\"} ";
  append_double(out, value);  out += '\n';
}

std::string_view pid_label(char (&buf)[12], int32_t pid) {
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), pid);
  return std::string_view(buf, ptr);
}

} // anonymous namespace

namespace procsight::app {

using procsight::model::MetricRecord;
using procsight::model::Snapshot;

std::string snapshot_to_prometheus(const Snapshot& s) {
  std::string out;
  out.reserve(8192);

  // ---- System ----
  emit_header(out, "procsight_system_cpu_percent", "Aggregate CPU utilization", "gauge");
  emit_gauge_d(out, "procsight_system_cpu_percent", s.stats.cpu_pct);
  emit_header(out, "procsight_system_memory_percent", "Memory in use", "gauge");
  emit_gauge_d(out, "procsight_system_memory_percent", s.stats.mem_pct);
  emit_header(out, "procsight_system_disk_percent", "Root filesystem in use", "gauge");
  emit_gauge_d(out, "procsight_system_disk_percent", s.stats.disk_pct);
  emit_header(out, "procsight_system_cores", "Online CPU cores", "gauge");
  emit_gauge_u(out, "procsight_system_cores", s.stats.cores);

  emit_header(out, "procsight_processes_total", "Processes seen by the collector", "gauge");
  emit_gauge_u(out, "procsight_processes_total", s.total_processes);
  emit_header(out, "procsight_processes_evaluated", "Processes analyzed this tick", "gauge");
  emit_gauge_u(out, "procsight_processes_evaluated", s.reports.size());
  emit_header(out, "procsight_snapshot_seq", "Monitor tick of the published snapshot", "gauge");
  emit_gauge_u(out, "procsight_snapshot_seq", s.seq);

  // ---- Processes ----
  if (!s.reports.empty()) {
    char pid_buf[12];

    emit_header(out, "procsight_process_cpu_percent", "Per-process CPU utilization", "gauge");
    for (const auto& r : s.reports)
      emit_labeled_2d(out, "procsight_process_cpu_percent",
                      "pid", pid_label(pid_buf, r.sample.pid), "name", r.sample.name, r.sample.cpu);

    emit_header(out, "procsight_process_memory_mib", "Per-process resident memory", "gauge");
    for (const auto& r : s.reports)
      emit_labeled_2d(out, "procsight_process_memory_mib",
                      "pid", pid_label(pid_buf, r.sample.pid), "name", r.sample.name, r.sample.memory);

    emit_header(out, "procsight_process_threads", "Per-process thread count", "gauge");
    for (const auto& r : s.reports)
      emit_labeled_2u(out, "procsight_process_threads",
                      "pid", pid_label(pid_buf, r.sample.pid), "name", r.sample.name,
                      static_cast<uint64_t>(std::max(0, r.sample.threads)));

    emit_header(out, "procsight_process_io_read_bytes_per_second", "Per-process read rate", "gauge");
    for (const auto& r : s.reports)
      emit_labeled_2d(out, "procsight_process_io_read_bytes_per_second",
                      "pid", pid_label(pid_buf, r.sample.pid), "name", r.sample.name, r.sample.io_read);

    emit_header(out, "procsight_process_io_write_bytes_per_second", "Per-process write rate", "gauge");
    for (const auto& r : s.reports)
      emit_labeled_2d(out, "procsight_process_io_write_bytes_per_second",
                      "pid", pid_label(pid_buf, r.sample.pid), "name", r.sample.name, r.sample.io_write);

    emit_header(out, "procsight_process_anomaly_score", "Isolation forest anomaly score", "gauge");
    for (const auto& r : s.reports)
      emit_labeled_2d(out, "procsight_process_anomaly_score",
                      "pid", pid_label(pid_buf, r.sample.pid), "name", r.sample.name,
                      r.analysis.anomaly.score);

    emit_header(out, "procsight_process_is_anomaly", "1 when the anomaly score crossed the warning tier", "gauge");
    for (const auto& r : s.reports)
      emit_labeled_2u(out, "procsight_process_is_anomaly",
                      "pid", pid_label(pid_buf, r.sample.pid), "name", r.sample.name,
                      r.analysis.anomaly.is_anomaly ? 1 : 0);

    emit_header(out, "procsight_process_classification_confidence", "Behavior class and its confidence", "gauge");
    for (const auto& r : s.reports)
      emit_labeled_3d(out, "procsight_process_classification_confidence",
                      "pid", pid_label(pid_buf, r.sample.pid), "name", r.sample.name,
                      "label", r.analysis.classification.label, r.analysis.classification.confidence);

    bool any_prediction = false;
    for (const auto& r : s.reports)
      if (r.analysis.predictions && !r.analysis.predictions->empty()) { any_prediction = true; break; }
    if (any_prediction) {
      emit_header(out, "procsight_process_cpu_forecast_percent", "Forecast CPU utilization per step", "gauge");
      for (const auto& r : s.reports) {
        if (!r.analysis.predictions) continue;
        const auto& pred = *r.analysis.predictions;
        for (size_t i = 0; i < pred.size(); ++i) {
          char step[8];
          auto [sptr, sec] = std::to_chars(step, step + sizeof(step), i + 1);
          emit_labeled_3d(out, "procsight_process_cpu_forecast_percent",
                          "pid", pid_label(pid_buf, r.sample.pid), "name", r.sample.name,
                          "step", std::string_view(step, sptr), pred[i]);
        }
      }
    }
  }

  // ---- Alerts ----
  emit_header(out, "procsight_alerts_raised", "Alerts created this tick", "gauge");
  emit_gauge_u(out, "procsight_alerts_raised", s.alerts.size());
  emit_header(out, "procsight_alerts_recent", "Alerts created in the last 24 hours", "gauge");
  emit_gauge_u(out, "procsight_alerts_recent", s.alert_stats.total);
  if (!s.alert_stats.by_type.empty()) {
    emit_header(out, "procsight_alerts_recent_by_type", "Alerts in the last 24 hours per type", "gauge");
    for (const auto& [type, count] : s.alert_stats.by_type)
      emit_labeled_u(out, "procsight_alerts_recent_by_type", "type", type, count);
  }
  emit_header(out, "procsight_alerts_recent_ml", "ML detected alerts in the last 24 hours", "gauge");
  emit_gauge_u(out, "procsight_alerts_recent_ml", s.alert_stats.ml_detected);

  // ---- Models ----
  emit_header(out, "procsight_model_trained", "1 when the model has been trained", "gauge");
  emit_labeled_u(out, "procsight_model_trained", "model", "anomaly", s.models.anomaly.trained ? 1 : 0);
  emit_labeled_u(out, "procsight_model_trained", "model", "predictor", s.models.predictor.trained ? 1 : 0);
  emit_labeled_u(out, "procsight_model_trained", "model", "classifier", s.models.classifier.trained ? 1 : 0);
  emit_header(out, "procsight_model_anomaly_trees", "Isolation trees in the forest", "gauge");
  emit_gauge_u(out, "procsight_model_anomaly_trees", s.models.anomaly.num_trees);
  emit_header(out, "procsight_model_predictor_lookback", "Sequence length the predictor consumes", "gauge");
  emit_gauge_u(out, "procsight_model_predictor_lookback", s.models.predictor.input_shape);

  return out;
}

std::string records_to_prometheus(const std::vector<MetricRecord>& records) {
  std::string out;
  out.reserve(records.size() * 512);
  char pid_buf[12];
  for (const auto& r : records) {
    auto pid = pid_label(pid_buf, r.pid);
    emit_labeled_2d(out, "procsight_record_cpu_percent", "pid", pid, "name", r.process_name, r.metrics.cpu);
    emit_labeled_2d(out, "procsight_record_memory_mib", "pid", pid, "name", r.process_name, r.metrics.memory);
    emit_labeled_2u(out, "procsight_record_threads", "pid", pid, "name", r.process_name,
                    static_cast<uint64_t>(std::max(0, r.metrics.threads)));
    emit_labeled_2d(out, "procsight_record_io_read_bytes_per_second", "pid", pid, "name", r.process_name,
                    r.metrics.io_read);
    emit_labeled_2d(out, "procsight_record_io_write_bytes_per_second", "pid", pid, "name", r.process_name,
                    r.metrics.io_write);
    emit_labeled_2d(out, "procsight_record_anomaly_score", "pid", pid, "name", r.process_name,
                    r.ml.anomaly_score);
    emit_labeled_2u(out, "procsight_record_is_anomaly", "pid", pid, "name", r.process_name,
                    r.ml.is_anomaly ? 1 : 0);
    emit_labeled_3d(out, "procsight_record_classification_confidence", "pid", pid, "name", r.process_name,
                    "label", r.ml.classification, r.ml.confidence);
    for (size_t i = 0; i < r.ml.predictions.size(); ++i) {
      char step[8];
      auto [sptr, sec] = std::to_chars(step, step + sizeof(step), i + 1);
      emit_labeled_3d(out, "procsight_record_cpu_forecast_percent", "pid", pid, "name", r.process_name,
                      "step", std::string_view(step, sptr), r.ml.predictions[i]);
    }
  }
  return out;
}

std::vector<MetricRecord> to_metric_records(const Snapshot& s) {
  std::vector<MetricRecord> records;
  records.reserve(s.reports.size());
  for (const auto& rep : s.reports) {
    MetricRecord r;
    const auto& smp = rep.sample;
    r.process_id = std::to_string(smp.pid) + ":" + smp.name;
    r.process_name = smp.name;
    r.pid = smp.pid;
    r.timestamp_ms = smp.timestamp_ms;
    r.metrics.cpu = smp.cpu;
    r.metrics.memory = smp.memory;
    r.metrics.threads = smp.threads;
    r.metrics.io_read = smp.io_read;
    r.metrics.io_write = smp.io_write;
    r.metrics.net_sent = smp.net_sent;
    r.metrics.net_received = smp.net_received;
    r.ml.anomaly_score = rep.analysis.anomaly.score;
    r.ml.is_anomaly = rep.analysis.anomaly.is_anomaly;
    r.ml.classification = rep.analysis.classification.label;
    r.ml.confidence = rep.analysis.classification.confidence;
    if (rep.analysis.predictions) r.ml.predictions = *rep.analysis.predictions;
    records.push_back(std::move(r));
  }
  return records;
}

} // namespace procsight::app
