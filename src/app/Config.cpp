#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <string>
#include <string_view>
#include <system_error>

namespace procsight::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("PROCSIGHT_", 0) == 0) {
    alt = std::string("procsight_") + n.substr(10);
  } else if (n.rfind("procsight_", 0) == 0) {
    alt = std::string("PROCSIGHT_") + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  std::string_view sv(v);
  int out = defv;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return defv;
  return out;
}

double getenv_double(const char* name, double defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  std::string_view sv(v);
  double out = defv;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return defv;
  return out;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/procsight/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/procsight/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const procsight::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static double resolve_double(const procsight::util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, double def) {
  if (have_toml && toml.has(section, key))
    return toml.get_double(section, key, def);
  if (env_name)
    return getenv_double(env_name, def);
  return def;
}

static bool resolve_bool(const procsight::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const procsight::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

static size_t at_least(int v, int floor) { return static_cast<size_t>(v < floor ? floor : v); }

struct KnownSection {
  std::string_view name;
  std::initializer_list<std::string_view> keys;
};

static const KnownSection kKnown[] = {
  {"monitor",    {"interval_ms", "batch_size", "max_procs", "eval_workers", "train_after_ticks",
                  "retrain_every_ticks", "history_size", "verbose"}},
  {"thresholds", {"cpu_warning", "cpu_critical", "memory_warning", "memory_critical",
                  "disk_warning", "disk_critical", "anomaly_warning", "anomaly_critical",
                  "process_cpu", "prediction_cpu"}},
  {"alerts",     {"cooldown_s", "retention_days"}},
  {"anomaly",    {"num_trees", "sample_size", "contamination", "seed"}},
  {"predictor",  {"lookback", "hidden_units", "learning_rate", "epochs", "batch_size", "forecast_steps"}},
  {"classifier", {"model", "n_estimators", "max_features", "seed"}},
  {"metrics",    {"port", "log_dir", "retention_days"}},
};

// Reports lines, sections and keys that no setting reads.
static void warn_unknown(const procsight::util::TomlReader& toml, const std::string& file) {
  for (size_t line : toml.malformed_lines())
    std::fprintf(stderr, "procsight: Config: %s:%zu: not a [section] or key = value line\n", file.c_str(), line);
  for (const auto& sec : toml.sections()) {
    const KnownSection* known = nullptr;
    for (const auto& k : kKnown)
      if (k.name == sec) { known = &k; break; }
    if (!known) {
      std::fprintf(stderr, "procsight: Config: %s: unknown section [%s]\n", file.c_str(), sec.c_str());
      continue;
    }
    for (const auto& key : toml.keys(sec)) {
      bool ok = false;
      for (auto k : known->keys) ok = ok || k == key;
      if (!ok) std::fprintf(stderr, "procsight: Config: %s: unknown key %s in [%s]\n", file.c_str(), key.c_str(), sec.c_str());
    }
  }
}

Config load_config(const std::string& path) {
  Config c{};
  procsight::util::TomlReader toml;
  const std::string file = path.empty() ? config_file_path() : path;
  bool have_toml = !file.empty() && toml.load(file);
  if (have_toml) {
    c.source_path = file;
    warn_unknown(toml, file);
  }
  else if (!path.empty()) std::fprintf(stderr, "procsight: Config: cannot read %s, using defaults\n", path.c_str());

  // --- [monitor] ---
  auto& m = c.monitor;
  m.interval_ms         = resolve_int(toml, have_toml, "monitor", "interval_ms",         "PROCSIGHT_INTERVAL_MS", 2000);
  m.batch_size          = resolve_int(toml, have_toml, "monitor", "batch_size",          "PROCSIGHT_BATCH_SIZE", 10);
  m.max_procs           = resolve_int(toml, have_toml, "monitor", "max_procs",           "PROCSIGHT_MAX_PROCS", 50);
  m.eval_workers        = resolve_int(toml, have_toml, "monitor", "eval_workers",        "PROCSIGHT_EVAL_WORKERS", 4);
  m.train_after_ticks   = resolve_int(toml, have_toml, "monitor", "train_after_ticks",   "PROCSIGHT_TRAIN_AFTER_TICKS", 30);
  m.retrain_every_ticks = resolve_int(toml, have_toml, "monitor", "retrain_every_ticks", "PROCSIGHT_RETRAIN_EVERY_TICKS", 0);
  if (m.interval_ms < 100) m.interval_ms = 100;
  if (m.batch_size < 1) m.batch_size = 1;
  if (m.max_procs < m.batch_size) m.max_procs = m.batch_size;
  if (m.eval_workers < 1) m.eval_workers = 1;
  c.analysis.history_size = at_least(resolve_int(toml, have_toml, "monitor", "history_size", "PROCSIGHT_HISTORY_SIZE", 100), 1);

  // --- [thresholds] ---
  auto& a = c.alerts;
  a.cpu.warning        = resolve_double(toml, have_toml, "thresholds", "cpu_warning",      "PROCSIGHT_CPU_WARNING", 70.0);
  a.cpu.critical       = resolve_double(toml, have_toml, "thresholds", "cpu_critical",     "PROCSIGHT_CPU_CRITICAL", 85.0);
  a.memory.warning     = resolve_double(toml, have_toml, "thresholds", "memory_warning",   "PROCSIGHT_MEMORY_WARNING", 75.0);
  a.memory.critical    = resolve_double(toml, have_toml, "thresholds", "memory_critical",  "PROCSIGHT_MEMORY_CRITICAL", 90.0);
  a.disk.warning       = resolve_double(toml, have_toml, "thresholds", "disk_warning",     "PROCSIGHT_DISK_WARNING", 80.0);
  a.disk.critical      = resolve_double(toml, have_toml, "thresholds", "disk_critical",    "PROCSIGHT_DISK_CRITICAL", 95.0);
  a.anomaly.warning    = resolve_double(toml, have_toml, "thresholds", "anomaly_warning",  "PROCSIGHT_ANOMALY_WARNING", 0.6);
  a.anomaly.critical   = resolve_double(toml, have_toml, "thresholds", "anomaly_critical", "PROCSIGHT_ANOMALY_CRITICAL", 0.8);
  a.process_cpu_pct    = resolve_double(toml, have_toml, "thresholds", "process_cpu",      "PROCSIGHT_PROCESS_CPU", 90.0);
  a.prediction_cpu_pct = resolve_double(toml, have_toml, "thresholds", "prediction_cpu",   "PROCSIGHT_PREDICTION_CPU", 85.0);
  c.analysis.anomaly_thresholds = a.anomaly;

  // --- [alerts] ---
  a.cooldown = std::chrono::seconds(std::max(0, resolve_int(toml, have_toml, "alerts", "cooldown_s", "PROCSIGHT_ALERT_COOLDOWN_S", 60)));
  m.alert_retention_days = resolve_int(toml, have_toml, "alerts", "retention_days", "PROCSIGHT_ALERT_RETENTION_DAYS", 30);

  // --- [anomaly] ---
  auto& an = c.analysis.anomaly;
  an.num_trees     = at_least(resolve_int(toml, have_toml, "anomaly", "num_trees",   "PROCSIGHT_ANOMALY_TREES", 100), 1);
  an.sample_size   = at_least(resolve_int(toml, have_toml, "anomaly", "sample_size", "PROCSIGHT_ANOMALY_SAMPLE_SIZE", 256), 2);
  an.contamination = resolve_double(toml, have_toml, "anomaly", "contamination", nullptr, 0.1);
  if (int seed = resolve_int(toml, have_toml, "anomaly", "seed", "PROCSIGHT_ANOMALY_SEED", -1); seed >= 0)
    an.seed = static_cast<uint64_t>(seed);

  // --- [predictor] ---
  auto& p = c.analysis.predictor;
  p.lookback      = at_least(resolve_int(toml, have_toml, "predictor", "lookback",     "PROCSIGHT_PREDICTOR_LOOKBACK", 10), 1);
  p.hidden_units  = at_least(resolve_int(toml, have_toml, "predictor", "hidden_units", "PROCSIGHT_PREDICTOR_HIDDEN", 50), 1);
  p.learning_rate = resolve_double(toml, have_toml, "predictor", "learning_rate", "PROCSIGHT_PREDICTOR_LR", 0.01);
  if (!(p.learning_rate > 0.0 && p.learning_rate <= 1.0)) p.learning_rate = 0.01;
  c.analysis.predictor_epochs = at_least(resolve_int(toml, have_toml, "predictor", "epochs",         "PROCSIGHT_PREDICTOR_EPOCHS", 30), 1);
  c.analysis.predictor_batch  = at_least(resolve_int(toml, have_toml, "predictor", "batch_size",     "PROCSIGHT_PREDICTOR_BATCH", 16), 1);
  c.analysis.forecast_steps   = at_least(resolve_int(toml, have_toml, "predictor", "forecast_steps", "PROCSIGHT_FORECAST_STEPS", 5), 1);

  // --- [classifier] ---
  c.analysis.classifier_model = resolve_string(toml, have_toml, "classifier", "model", "PROCSIGHT_CLASSIFIER", "random_forest");
  c.analysis.forest.n_estimators = at_least(resolve_int(toml, have_toml, "classifier", "n_estimators", "PROCSIGHT_CLASSIFIER_TREES", 100), 1);
  c.analysis.forest.max_features = resolve_double(toml, have_toml, "classifier", "max_features", nullptr, 0.8);
  if (!(c.analysis.forest.max_features > 0.0 && c.analysis.forest.max_features <= 1.0)) c.analysis.forest.max_features = 0.8;
  c.analysis.forest.seed = static_cast<uint64_t>(resolve_int(toml, have_toml, "classifier", "seed", "PROCSIGHT_CLASSIFIER_SEED", 42));

  // --- [metrics] ---
  c.metrics.port           = resolve_int(toml, have_toml, "metrics", "port", "PROCSIGHT_METRICS_PORT", 0);
  c.metrics.log_dir        = resolve_string(toml, have_toml, "metrics", "log_dir", "PROCSIGHT_LOG_DIR", "");
  c.metrics.retention_days = resolve_int(toml, have_toml, "metrics", "retention_days", "PROCSIGHT_METRICS_RETENTION_DAYS", 7);

  c.verbose = resolve_bool(toml, have_toml, "monitor", "verbose", "PROCSIGHT_VERBOSE", false);
  return c;
}

} // namespace procsight::app
