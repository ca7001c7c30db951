#pragma once
#include "ml/ClassifierModel.hpp"
#include "model/Analysis.hpp"
#include "model/Sample.hpp"

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace procsight::ml {

struct LabeledSample {
  procsight::model::Sample sample;
  std::string label;
};

// Maps a process to a workload label. The underlying model is produced by
// a factory so training can build a fresh instance off-lock.
class ProcessClassifier {
public:
  using ModelFactory = std::function<std::unique_ptr<IClassifierModel>()>;

  explicit ProcessClassifier(ModelFactory factory);

  static const std::vector<std::string>& labels();
  static const std::vector<std::string>& feature_names();
  [[nodiscard]] static std::vector<double> extract_features(const procsight::model::Sample& s);

  // Throws std::invalid_argument on an empty set or a label outside labels().
  void train(const std::vector<LabeledSample>& examples);

  // {"unknown", 0, {}} when untrained; never throws.
  [[nodiscard]] procsight::model::Classification predict(const procsight::model::Sample& s) const;
  [[nodiscard]] std::vector<procsight::model::Classification> predict_batch(const std::vector<procsight::model::Sample>& xs) const;

  // Sorted by importance, descending. Empty when unsupported or untrained.
  [[nodiscard]] std::vector<std::pair<std::string, double>> feature_importance() const;

  [[nodiscard]] bool trained() const;
  [[nodiscard]] std::string model_name() const;

private:
  ModelFactory factory_;
  mutable std::shared_mutex mu_;
  std::unique_ptr<IClassifierModel> model_;
};

} // namespace procsight::ml
