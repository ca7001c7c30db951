#pragma once

#include "app/AnalysisEngine.hpp"
#include "app/Alerts.hpp"

#include <cstdint>
#include <string>

namespace procsight::app {

struct MonitorSettings {
  int interval_ms{2000};
  int batch_size{10};
  int max_procs{50};
  int eval_workers{4};
  int train_after_ticks{30};
  int retrain_every_ticks{0};
  int alert_retention_days{30};
};

struct MetricsSettings {
  int port{0};              // 0 disables the exporter
  std::string log_dir;      // empty disables the chunk log
  int retention_days{7};
};

struct Config {
  MonitorSettings monitor;
  AlertRules alerts;
  AnalysisConfig analysis;
  MetricsSettings metrics;
  bool verbose{false};
  std::string source_path;  // file the values came from, empty if none
};

// Environment variable helpers; PROCSIGHT_FOO also matches procsight_foo.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
double getenv_double(const char* name, double defv);

// $XDG_CONFIG_HOME/procsight/config.toml, else ~/.config/procsight/config.toml
std::string config_file_path();

// Resolve every setting from TOML -> env -> compiled default. An empty path
// means config_file_path(); a missing file is not an error.
Config load_config(const std::string& path = "");

} // namespace procsight::app
