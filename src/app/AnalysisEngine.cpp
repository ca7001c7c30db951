#include "app/AnalysisEngine.hpp"
#include "ml/NearestCentroid.hpp"
#include "ml/TrainingData.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <map>

namespace procsight::app {

using procsight::model::Sample;

static procsight::ml::ProcessClassifier::ModelFactory make_factory(const AnalysisConfig& cfg) {
  if (cfg.classifier_model == "nearest_centroid")
    return []{ return std::make_unique<procsight::ml::NearestCentroid>(); };
  if (cfg.classifier_model != "random_forest")
    std::fprintf(stderr, "procsight: AnalysisEngine: unknown classifier '%s', using random_forest\n",
                 cfg.classifier_model.c_str());
  auto forest = cfg.forest;
  return [forest]{ return std::make_unique<procsight::ml::RandomForest>(forest); };
}

AnalysisEngine::AnalysisEngine(AnalysisConfig cfg)
  : cfg_(std::move(cfg)),
    history_(cfg_.history_size),
    forest_(cfg_.anomaly),
    predictor_(cfg_.predictor),
    classifier_(make_factory(cfg_)) {}

procsight::model::Tier AnalysisEngine::tier_for(double score) const {
  if (score > cfg_.anomaly_thresholds.critical) return procsight::model::Tier::Critical;
  if (score > cfg_.anomaly_thresholds.warning) return procsight::model::Tier::Warning;
  return procsight::model::Tier::Normal;
}

procsight::model::AnalysisResult AnalysisEngine::analyze(const Sample& sample) {
  procsight::model::AnalysisResult r;
  r.timestamp_ms = sample.timestamp_ms;

  const auto past = history_.all(sample.pid);
  const auto feats = procsight::ml::FeatureEngineer::engineer_features(sample, past);
  r.anomaly.score = forest_.predict(feats.to_vector());
  r.anomaly.is_anomaly = r.anomaly.score > cfg_.anomaly_thresholds.warning;
  r.anomaly.severity = tier_for(r.anomaly.score);

  r.classification = classifier_.predict(sample);
  history_.append(sample.pid, sample);
  r.predictions = predict_future(sample.pid, cfg_.forecast_steps);
  return r;
}

std::optional<std::vector<double>> AnalysisEngine::predict_future(int32_t pid, size_t steps) const {
  if (!predictor_.trained()) return std::nullopt;
  const size_t lookback = predictor_.input_shape();
  const auto window = history_.window(pid, lookback);
  if (window.size() < lookback) return std::nullopt;
  std::vector<double> cpu;
  cpu.reserve(window.size());
  for (const auto& s : window) cpu.push_back(s.cpu);
  return predictor_.predict_multi_step(cpu, steps);
}

procsight::model::ModelStatus AnalysisEngine::model_status() const {
  procsight::model::ModelStatus st;
  st.anomaly.trained = forest_.trained();
  st.anomaly.num_trees = forest_.num_trees();
  st.predictor.trained = predictor_.trained();
  st.predictor.input_shape = predictor_.input_shape();
  st.classifier.trained = classifier_.trained();
  st.classifier.classes = procsight::ml::ProcessClassifier::labels();
  return st;
}

static std::map<int32_t, std::vector<Sample>> group_by_pid(const std::vector<Sample>& history) {
  std::map<int32_t, std::vector<Sample>> by_pid;
  for (const auto& s : history) by_pid[s.pid].push_back(s);
  for (auto& [pid, v] : by_pid)
    std::stable_sort(v.begin(), v.end(), [](const Sample& a, const Sample& b){ return a.timestamp_ms < b.timestamp_ms; });
  return by_pid;
}

std::vector<std::vector<double>> AnalysisEngine::replay_features(const std::vector<Sample>& history) const {
  std::vector<std::vector<double>> rows;
  rows.reserve(history.size());
  const size_t cap = history_.capacity();
  for (const auto& [pid, v] : group_by_pid(history)) {
    for (size_t i = 0; i < v.size(); ++i) {
      const size_t from = i > cap ? i - cap : 0;
      std::span<const Sample> past(v.data() + from, i - from);
      rows.push_back(procsight::ml::FeatureEngineer::engineer_features(v[i], past).to_vector());
    }
  }
  return rows;
}

bool AnalysisEngine::train_anomaly(const std::vector<std::vector<double>>& rows) {
  try {
    forest_.fit(rows);
    std::fprintf(stderr, "procsight: AnalysisEngine: anomaly model fitted on %zu rows\n", rows.size());
    return true;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "procsight: AnalysisEngine: anomaly training failed: %s\n", e.what());
    return false;
  }
}

bool AnalysisEngine::train_predictor(std::span<const double> series) {
  try {
    auto rep = predictor_.train(series, cfg_.predictor_epochs, cfg_.predictor_batch);
    std::fprintf(stderr, "procsight: AnalysisEngine: predictor trained on %zu pairs (loss %.5f, val %.5f)\n",
                 rep.train_pairs, rep.train_loss, rep.validation_loss);
    return true;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "procsight: AnalysisEngine: predictor training failed: %s\n", e.what());
    return false;
  }
}

bool AnalysisEngine::train_classifier(const std::vector<procsight::ml::LabeledSample>& examples) {
  try {
    classifier_.train(examples);
    std::fprintf(stderr, "procsight: AnalysisEngine: classifier (%s) trained on %zu examples\n",
                 classifier_.model_name().c_str(), examples.size());
    return true;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "procsight: AnalysisEngine: classifier training failed: %s\n", e.what());
    return false;
  }
}

bool AnalysisEngine::initialize(const std::vector<Sample>& history) {
  bool ok = true;
  if (history.size() > cfg_.min_training_samples) {
    ok = train_anomaly(replay_features(history)) && ok;

    const auto by_pid = group_by_pid(history);
    auto longest = std::max_element(by_pid.begin(), by_pid.end(),
                                     [](const auto& a, const auto& b){ return a.second.size() < b.second.size(); });
    if (longest != by_pid.end() && longest->second.size() > cfg_.min_training_samples) {
      const auto& v = longest->second;
      const size_t from = v.size() > cfg_.predictor_max_points ? v.size() - cfg_.predictor_max_points : 0;
      std::vector<double> cpu;
      for (size_t i = from; i < v.size(); ++i) cpu.push_back(v[i].cpu);
      ok = train_predictor(cpu) && ok;
    }
  }

  auto examples = procsight::ml::synthetic_examples(cfg_.synthetic_per_label, cfg_.forest.seed);
  for (const auto& s : history)
    if (auto label = procsight::ml::label_from_name(s)) examples.push_back({s, *label});
  ok = train_classifier(examples) && ok;
  return ok;
}

} // namespace procsight::app
