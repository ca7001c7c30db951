#pragma once
#include "ml/ClassifierModel.hpp"

#include <cstdint>
#include <random>

namespace procsight::ml {

struct RandomForestConfig {
  size_t n_estimators{100};
  double max_features{0.8};   // share of features tried at each split
  size_t max_depth{16};
  size_t min_samples_split{2};
  uint64_t seed{42};
};

struct ForestNode { int f; double t; int l; int r; bool leaf; std::vector<double> p; };
struct ForestTree { std::vector<ForestNode> n; };

// Bagged CART trees split on Gini impurity. Probabilities are the mean of
// the per-tree leaf class distributions.
class RandomForest : public IClassifierModel {
public:
  explicit RandomForest(RandomForestConfig cfg = {}) : cfg_(cfg) {}

  void fit(const std::vector<std::vector<double>>& x, const std::vector<int>& y, size_t n_classes) override;
  [[nodiscard]] int predict(std::span<const double> x) const override;
  [[nodiscard]] std::optional<std::vector<double>> predict_proba(std::span<const double> x) const override;
  [[nodiscard]] std::vector<double> feature_importance() const override { return importance_; }
  [[nodiscard]] const char* name() const override { return "random_forest"; }

  [[nodiscard]] size_t tree_count() const { return trees_.size(); }

private:
  struct Builder;

  RandomForestConfig cfg_;
  std::vector<ForestTree> trees_;
  std::vector<double> importance_;
  size_t n_classes_{0};
  size_t width_{0};
};

} // namespace procsight::ml
