#pragma once
#include "app/Alerts.hpp"
#include "app/HistoryStore.hpp"
#include "ml/FeatureEngineer.hpp"
#include "ml/IsolationForest.hpp"
#include "ml/ProcessClassifier.hpp"
#include "ml/RandomForest.hpp"
#include "ml/SequencePredictor.hpp"
#include "model/Analysis.hpp"
#include "model/Sample.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace procsight::app {

struct AnalysisConfig {
  procsight::ml::IsolationForestConfig anomaly{};
  ThresholdPair anomaly_thresholds{0.6, 0.8};
  procsight::ml::SequencePredictorConfig predictor{};
  size_t predictor_epochs{30};
  size_t predictor_batch{16};
  size_t predictor_max_points{500};
  size_t forecast_steps{5};
  std::string classifier_model{"random_forest"}; // or "nearest_centroid"
  procsight::ml::RandomForestConfig forest{};
  size_t synthetic_per_label{20};
  size_t history_size{100};
  size_t min_training_samples{50};
};

// Owns the models and per-process history; one instance per daemon.
class AnalysisEngine {
public:
  explicit AnalysisEngine(AnalysisConfig cfg = {});

  // Scores sample against its history, then appends it. Never throws.
  procsight::model::AnalysisResult analyze(const procsight::model::Sample& sample);

  // std::nullopt until the predictor is trained and pid has a full lookback window.
  [[nodiscard]] std::optional<std::vector<double>> predict_future(int32_t pid, size_t steps) const;

  [[nodiscard]] procsight::model::ModelStatus model_status() const;

  // Fits every model it has enough data for. Training errors are logged and
  // leave the affected model as it was. Returns false if any model failed.
  bool initialize(const std::vector<procsight::model::Sample>& history);

  bool train_anomaly(const std::vector<std::vector<double>>& rows);
  bool train_predictor(std::span<const double> series);
  bool train_classifier(const std::vector<procsight::ml::LabeledSample>& examples);

  // Engineered feature rows for history replayed per pid in time order.
  [[nodiscard]] std::vector<std::vector<double>> replay_features(const std::vector<procsight::model::Sample>& history) const;

  [[nodiscard]] HistoryStore& history() { return history_; }
  [[nodiscard]] const HistoryStore& history() const { return history_; }
  [[nodiscard]] procsight::ml::FeatureEngineer& features() { return features_; }
  [[nodiscard]] const procsight::ml::IsolationForest& anomaly_model() const { return forest_; }
  [[nodiscard]] const procsight::ml::SequencePredictor& predictor() const { return predictor_; }
  [[nodiscard]] const procsight::ml::ProcessClassifier& classifier() const { return classifier_; }
  [[nodiscard]] const AnalysisConfig& config() const { return cfg_; }

private:
  procsight::model::Tier tier_for(double score) const;

  AnalysisConfig cfg_;
  HistoryStore history_;
  procsight::ml::FeatureEngineer features_;
  procsight::ml::IsolationForest forest_;
  procsight::ml::SequencePredictor predictor_;
  procsight::ml::ProcessClassifier classifier_;
};

} // namespace procsight::app
