#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace procsight::model {

enum class AlertType { Info, Warning, Critical };
enum class AlertSource { Threshold, Ml, Anomaly, Prediction, System };

inline const char* alert_type_name(AlertType t) {
  switch (t) {
    case AlertType::Critical: return "critical";
    case AlertType::Warning: return "warning";
    default: return "info";
  }
}

inline const char* alert_source_name(AlertSource s) {
  switch (s) {
    case AlertSource::Threshold: return "threshold";
    case AlertSource::Ml: return "ml";
    case AlertSource::Anomaly: return "anomaly";
    case AlertSource::Prediction: return "prediction";
    default: return "system";
  }
}

// 1..10 ranking used for ordering and display
inline int default_severity(AlertType t) {
  switch (t) {
    case AlertType::Critical: return 9;
    case AlertType::Warning: return 6;
    case AlertType::Info: return 3;
  }
  return 5;
}

struct AlertDetails {
  std::optional<double> current_value;
  std::optional<double> threshold;
  std::optional<double> anomaly_score;
  std::optional<double> prediction;
  std::optional<double> confidence;
};

struct Alert {
  std::string id;
  AlertType type{AlertType::Info};
  int severity{5};
  AlertSource source{AlertSource::System};
  std::optional<int32_t> pid;
  std::optional<std::string> process_name;
  std::optional<std::string> metric;
  std::string message;
  AlertDetails details;
  bool ml_detected{false};
  std::optional<std::string> algorithm;
  bool acknowledged{false};
  std::optional<int64_t> acknowledged_at;
  std::optional<std::string> acknowledged_by;
  bool resolved{false};
  std::optional<int64_t> resolved_at;
  int64_t created_at{};
  int64_t updated_at{};
};

// Input to AlertEngine::create_alert; id and timestamps are assigned there.
struct AlertData {
  AlertType type{AlertType::Info};
  std::optional<int> severity; // overrides default_severity(type)
  AlertSource source{AlertSource::System};
  std::optional<int32_t> pid;
  std::optional<std::string> process_name;
  std::optional<std::string> metric;
  std::string message;
  AlertDetails details;
  bool ml_detected{false};
  std::optional<std::string> algorithm;
};

struct AlertStats {
  size_t total{};
  std::map<std::string, size_t> by_type;
  size_t ml_detected{};
  int64_t range_ms{};
};

} // namespace procsight::model
