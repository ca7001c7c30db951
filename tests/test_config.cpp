#include "minitest.hpp"
#include "app/Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using procsight::app::load_config;

static std::string config_tmp(const char* tag) {
  return (fs::temp_directory_path() /
          ("procsight_test_config_" + std::to_string(::getpid()) + "_" + tag + ".toml")).string();
}

TEST(config_defaults_without_file) {
  auto c = load_config("/tmp/procsight_test_config_does_not_exist.toml");
  ASSERT_TRUE(c.source_path.empty());
  ASSERT_EQ(c.monitor.interval_ms, 2000);
  ASSERT_EQ(c.monitor.batch_size, 10);
  ASSERT_EQ(c.monitor.max_procs, 50);
  ASSERT_NEAR(c.alerts.cpu.warning, 70.0, 0);
  ASSERT_NEAR(c.alerts.cpu.critical, 85.0, 0);
  ASSERT_NEAR(c.alerts.disk.critical, 95.0, 0);
  ASSERT_EQ(c.alerts.cooldown.count(), 60000);
  ASSERT_EQ(c.analysis.anomaly.num_trees, 100u);
  ASSERT_EQ(c.analysis.predictor.lookback, 10u);
  ASSERT_EQ(c.analysis.predictor.hidden_units, 50u);
  ASSERT_EQ(c.analysis.classifier_model, std::string("random_forest"));
  ASSERT_EQ(c.metrics.port, 0);
  ASSERT_TRUE(c.metrics.log_dir.empty());
  ASSERT_EQ(c.metrics.retention_days, 7);
  ASSERT_TRUE(!c.verbose);
}

TEST(config_file_then_env_then_default) {
  auto path = config_tmp("layered");
  std::ofstream(path) <<
    "[monitor]\n"
    "interval_ms = 500\n"
    "batch_size = 20\n"
    "max_procs = 5\n"
    "[thresholds]\n"
    "cpu_critical = 92.5\n"
    "anomaly_warning = 0.65\n"
    "[classifier]\n"
    "model = \"nearest_centroid\"\n"
    "[metrics]\n"
    "port = 9105\n";
  setenv("PROCSIGHT_INTERVAL_MS", "750", 1);   // file wins
  setenv("PROCSIGHT_CPU_WARNING", "60", 1);    // not in file, env applies
  setenv("procsight_ALERT_COOLDOWN_S", "15", 1);

  auto c = load_config(path);
  ASSERT_EQ(c.source_path, path);
  ASSERT_EQ(c.monitor.interval_ms, 500);
  ASSERT_EQ(c.monitor.batch_size, 20);
  ASSERT_EQ(c.monitor.max_procs, 20);          // raised to batch_size
  ASSERT_NEAR(c.alerts.cpu.critical, 92.5, 0);
  ASSERT_NEAR(c.alerts.cpu.warning, 60.0, 0);
  ASSERT_EQ(c.alerts.cooldown.count(), 15000);
  ASSERT_NEAR(c.analysis.anomaly_thresholds.warning, 0.65, 0);
  ASSERT_EQ(c.analysis.classifier_model, std::string("nearest_centroid"));
  ASSERT_EQ(c.metrics.port, 9105);

  unsetenv("PROCSIGHT_INTERVAL_MS");
  unsetenv("PROCSIGHT_CPU_WARNING");
  unsetenv("procsight_ALERT_COOLDOWN_S");
  fs::remove(path);
}

TEST(config_clamps_out_of_range_values) {
  auto path = config_tmp("clamp");
  std::ofstream(path) <<
    "[monitor]\n"
    "interval_ms = 5\n"
    "batch_size = 0\n"
    "eval_workers = -3\n"
    "[anomaly]\n"
    "num_trees = 0\n"
    "sample_size = 1\n"
    "[predictor]\n"
    "lookback = 0\n"
    "learning_rate = -0.5\n"
    "[classifier]\n"
    "max_features = 3\n"
    "[alerts]\n"
    "cooldown_s = -10\n";
  auto c = load_config(path);
  ASSERT_EQ(c.monitor.interval_ms, 100);
  ASSERT_EQ(c.monitor.batch_size, 1);
  ASSERT_EQ(c.monitor.eval_workers, 1);
  ASSERT_EQ(c.analysis.anomaly.num_trees, 1u);
  ASSERT_EQ(c.analysis.anomaly.sample_size, 2u);
  ASSERT_EQ(c.analysis.predictor.lookback, 1u);
  ASSERT_NEAR(c.analysis.predictor.learning_rate, 0.01, 0);
  ASSERT_NEAR(c.analysis.forest.max_features, 0.8, 0);
  ASSERT_EQ(c.alerts.cooldown.count(), 0);
  fs::remove(path);
}

TEST(config_env_helpers) {
  setenv("PROCSIGHT_TEST_KNOB", "42", 1);
  ASSERT_EQ(procsight::app::getenv_int("PROCSIGHT_TEST_KNOB", 7), 42);
  ASSERT_EQ(procsight::app::getenv_int("procsight_TEST_KNOB", 7), 42);
  setenv("PROCSIGHT_TEST_KNOB", "4x", 1);
  ASSERT_EQ(procsight::app::getenv_int("PROCSIGHT_TEST_KNOB", 7), 7);
  setenv("PROCSIGHT_TEST_KNOB", "0.25", 1);
  ASSERT_NEAR(procsight::app::getenv_double("PROCSIGHT_TEST_KNOB", 1.0), 0.25, 0);
  unsetenv("PROCSIGHT_TEST_KNOB");
  ASSERT_TRUE(procsight::app::getenv_compat("PROCSIGHT_TEST_KNOB") == nullptr);
}
