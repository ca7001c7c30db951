#pragma once
#include "ml/ClassifierModel.hpp"

namespace procsight::ml {

// Assigns the class whose standardized centroid is closest. Has no
// probability estimate.
class NearestCentroid : public IClassifierModel {
public:
  void fit(const std::vector<std::vector<double>>& x, const std::vector<int>& y, size_t n_classes) override;
  [[nodiscard]] int predict(std::span<const double> x) const override;
  [[nodiscard]] const char* name() const override { return "nearest_centroid"; }

private:
  std::vector<std::vector<double>> centroids_; // per class, in standardized space
  std::vector<bool> present_;                  // class had training rows
  std::vector<double> mean_, scale_;
};

} // namespace procsight::ml
