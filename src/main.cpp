#include "app/Alerts.hpp"
#include "app/AnalysisEngine.hpp"
#include "app/Config.hpp"
#include "app/LogWriter.hpp"
#include "app/MetricsServer.hpp"
#include "app/Monitor.hpp"
#include "app/SnapshotBuffers.hpp"
#include "collectors/ProcessCollector.hpp"
#include "model/Snapshot.hpp"
#include "store/MemoryAlertStore.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

namespace {

struct CliOptions {
  std::string config_path;
  std::optional<int> iterations;
  std::optional<int> interval_ms;
  std::optional<int> metrics_port;
  std::optional<std::string> log_dir;
  bool quiet{false};
  bool help{false};
};

void print_usage(std::FILE* to) {
  std::fprintf(to,
      "Usage: procsight [--config PATH] [--iterations N] [--interval-ms MS]\n"
      "                 [--metrics-port P] [--log-dir DIR] [--quiet]\n"
      "Notes: runs until Ctrl+C unless --iterations is given.\n");
}

bool parse_int(std::string_view s, int& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

// Returns false and prints a message on malformed input.
bool parse_args(int argc, char** argv, CliOptions& opt) {
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    auto value = [&](const char* flag) -> const char* {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "procsight: %s needs a value\n", flag);
        return nullptr;
      }
      return argv[++i];
    };
    auto int_value = [&](const char* flag, std::optional<int>& dst, int min) {
      const char* v = value(flag);
      int n = 0;
      if (!v) return false;
      if (!parse_int(v, n) || n < min) {
        std::fprintf(stderr, "procsight: invalid value for %s: %s\n", flag, v);
        return false;
      }
      dst = n;
      return true;
    };

    if (a == "-h" || a == "--help") {
      opt.help = true;
    } else if (a == "--quiet") {
      opt.quiet = true;
    } else if (a == "--config") {
      const char* v = value("--config");
      if (!v) return false;
      opt.config_path = v;
    } else if (a == "--log-dir") {
      const char* v = value("--log-dir");
      if (!v) return false;
      opt.log_dir = v;
    } else if (a == "--iterations") {
      if (!int_value("--iterations", opt.iterations, 1)) return false;
    } else if (a == "--interval-ms") {
      if (!int_value("--interval-ms", opt.interval_ms, 10)) return false;
    } else if (a == "--metrics-port") {
      if (!int_value("--metrics-port", opt.metrics_port, 0)) return false;
      if (*opt.metrics_port > 65535) {
        std::fprintf(stderr, "procsight: invalid value for --metrics-port: %d\n", *opt.metrics_port);
        return false;
      }
    } else {
      std::fprintf(stderr, "procsight: unknown option: %s\n", argv[i]);
      return false;
    }
  }
  return true;
}

void print_report(const procsight::model::Snapshot& s) {
  using namespace procsight::model;
  std::printf("tick %llu  cpu %5.1f%%  mem %5.1f%%  disk %5.1f%%  procs %zu  [%s]\n",
              static_cast<unsigned long long>(s.seq), s.stats.cpu_pct, s.stats.mem_pct,
              s.stats.disk_pct, s.total_processes, s.collector_name.c_str());
  std::printf("  models: anomaly=%s predictor=%s classifier=%s\n",
              s.models.anomaly.trained ? "trained" : "untrained",
              s.models.predictor.trained ? "trained" : "untrained",
              s.models.classifier.trained ? "trained" : "untrained");
  std::printf("  %7s %-16s %6s %9s %6s %-9s %-14s %5s %7s\n",
              "PID", "NAME", "CPU%", "MEM(MiB)", "SCORE", "TIER", "CLASS", "CONF", "NEXT%");
  for (const auto& r : s.reports) {
    const auto& a = r.analysis;
    char next[16] = "-";
    if (a.predictions && !a.predictions->empty())
      std::snprintf(next, sizeof(next), "%.1f", a.predictions->front());
    std::printf("  %7d %-16.16s %6.1f %9.1f %6.3f %-9s %-14.14s %5.2f %7s\n",
                r.sample.pid, r.sample.name.c_str(), r.sample.cpu, r.sample.memory,
                a.anomaly.score, tier_name(a.anomaly.severity),
                a.classification.label.c_str(), a.classification.confidence, next);
  }
  for (const auto& al : s.alerts) {
    std::printf("  ALERT %-8s sev=%d %s: %s\n", alert_type_name(al.type), al.severity,
                alert_source_name(al.source), al.message.c_str());
  }
  std::printf("  alerts(24h): %zu total, %zu ml\n\n", s.alert_stats.total, s.alert_stats.ml_detected);
  std::fflush(stdout);
}

} // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);

  CliOptions opt;
  if (!parse_args(argc, argv, opt)) {
    print_usage(stderr);
    return 2;
  }
  if (opt.help) {
    print_usage(stdout);
    return 0;
  }

  procsight::app::Config cfg = procsight::app::load_config(opt.config_path);
  if (opt.interval_ms) cfg.monitor.interval_ms = *opt.interval_ms;
  if (opt.metrics_port) cfg.metrics.port = *opt.metrics_port;
  if (opt.log_dir) cfg.metrics.log_dir = *opt.log_dir;
  if (!cfg.source_path.empty()) {
    std::fprintf(stderr, "procsight: Config: loaded %s\n", cfg.source_path.c_str());
  }

  procsight::store::MemoryAlertStore alert_store;
  procsight::app::AlertEngine alerts(alert_store, cfg.alerts);
  procsight::app::AnalysisEngine analysis(cfg.analysis);
  procsight::app::SnapshotBuffers buffers;

  auto collector = std::make_unique<procsight::collectors::ProcessCollector>(
      static_cast<size_t>(cfg.monitor.max_procs));
  procsight::app::Monitor monitor(buffers, analysis, alerts, std::move(collector), cfg.monitor, cfg.verbose);

  std::unique_ptr<procsight::app::MetricsServer> server;
  if (cfg.metrics.port > 0) {
    server = std::make_unique<procsight::app::MetricsServer>(buffers, static_cast<uint16_t>(cfg.metrics.port));
    server->start();
  }
  std::unique_ptr<procsight::app::LogWriter> log_writer;
  if (!cfg.metrics.log_dir.empty()) {
    log_writer = std::make_unique<procsight::app::LogWriter>(
        buffers, cfg.metrics.log_dir, std::chrono::milliseconds(cfg.monitor.interval_ms / 2 + 1),
        cfg.metrics.retention_days);
    log_writer->start();
  }

  monitor.start();

  uint64_t last_seq = 0;
  while (!g_stop.load()) {
    uint64_t seq = buffers.seq();
    if (seq != last_seq) {
      last_seq = seq;
      if (!opt.quiet) print_report(buffers.read());
      if (opt.iterations && monitor.ticks() >= static_cast<uint64_t>(*opt.iterations)) break;
    }
    std::this_thread::sleep_for(20ms);
  }

  monitor.stop();
  if (log_writer) log_writer->stop();
  if (server) server->stop();
  return 0;
}
