#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace procsight::model {

enum class Tier { Normal, Warning, Critical };

inline const char* tier_name(Tier t) {
  switch (t) {
    case Tier::Critical: return "critical";
    case Tier::Warning: return "warning";
    default: return "normal";
  }
}

struct AnomalyResult {
  double score{};
  bool is_anomaly{false};
  Tier severity{Tier::Normal};
};

struct Classification {
  std::string label{"unknown"};
  double confidence{};
  std::map<std::string, double> probabilities; // empty when the model has no estimate
};

struct AnalysisResult {
  AnomalyResult anomaly;
  Classification classification;
  std::optional<std::vector<double>> predictions;
  int64_t timestamp_ms{};
};

struct ModelStatus {
  struct { bool trained{false}; size_t num_trees{}; } anomaly;
  struct { bool trained{false}; size_t input_shape{}; } predictor;
  struct { bool trained{false}; std::vector<std::string> classes; } classifier;
};

} // namespace procsight::model
