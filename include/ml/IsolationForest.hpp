#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <shared_mutex>
#include <span>
#include <variant>
#include <vector>

namespace procsight::ml {

struct IsolationForestConfig {
  size_t num_trees{100};
  size_t sample_size{256};
  double contamination{0.1};       // expected outlier share; informational
  std::optional<uint64_t> seed;    // unset: seeded from std::random_device
};

// Unsupervised anomaly scorer: points isolated by few random splits score near 1.
class IsolationForest {
public:
  explicit IsolationForest(IsolationForestConfig cfg = {});

  // Builds a new ensemble and swaps it in. Throws std::invalid_argument on an
  // empty dataset or ragged rows; the previous ensemble is kept in that case.
  void fit(const std::vector<std::vector<double>>& data);

  // Score in (0,1]; returns 0 when untrained or the input is unusable.
  [[nodiscard]] double predict(std::span<const double> x) const;
  [[nodiscard]] std::vector<double> predict_batch(const std::vector<std::vector<double>>& xs) const;

  [[nodiscard]] bool trained() const;
  [[nodiscard]] size_t num_trees() const;
  [[nodiscard]] const IsolationForestConfig& config() const { return cfg_; }

  // Average unsuccessful-search path length in a BST of n points.
  static double c(double n);

private:
  struct Node;
  struct Leaf { size_t size{}; };
  struct Internal {
    size_t feature{};
    double split{};
    std::unique_ptr<Node> left;
    std::unique_ptr<Node> right;
  };
  struct Node { std::variant<Leaf, Internal> v; };

  using Rows = std::vector<const std::vector<double>*>;
  static std::unique_ptr<Node> build(const Rows& rows, size_t width, size_t depth, size_t max_depth, std::mt19937_64& rng);
  static double path_length(const Node& root, std::span<const double> x);

  IsolationForestConfig cfg_;
  mutable std::shared_mutex mu_;
  std::vector<std::unique_ptr<Node>> trees_;
  size_t width_{0};
  bool trained_{false};
};

} // namespace procsight::ml
