#pragma once
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace procsight::ml {

// A trainable multi-class model over dense feature rows. Class ids are
// 0..n_classes-1.
class IClassifierModel {
public:
  virtual ~IClassifierModel() = default;

  // Throws std::invalid_argument on empty or inconsistent input.
  virtual void fit(const std::vector<std::vector<double>>& x, const std::vector<int>& y, size_t n_classes) = 0;

  [[nodiscard]] virtual int predict(std::span<const double> x) const = 0;

  // Per-class probabilities; std::nullopt when the model has no estimate.
  [[nodiscard]] virtual std::optional<std::vector<double>> predict_proba(std::span<const double>) const {
    return std::nullopt;
  }

  // Normalized per-feature importance; empty when unsupported.
  [[nodiscard]] virtual std::vector<double> feature_importance() const { return {}; }

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace procsight::ml
