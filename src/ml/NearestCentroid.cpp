#include "ml/NearestCentroid.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace procsight::ml {

void NearestCentroid::fit(const std::vector<std::vector<double>>& x, const std::vector<int>& y, size_t n_classes) {
  if (x.empty() || x.size() != y.size() || n_classes == 0)
    throw std::invalid_argument("NearestCentroid: empty or mismatched training set");
  const size_t width = x.front().size();
  if (width == 0) throw std::invalid_argument("NearestCentroid: zero-width rows");

  std::vector<double> mean(width, 0.0), scale(width, 0.0);
  for (const auto& row : x) {
    if (row.size() != width) throw std::invalid_argument("NearestCentroid: ragged rows");
    for (size_t f = 0; f < width; ++f) mean[f] += row[f];
  }
  const double n = static_cast<double>(x.size());
  for (auto& m : mean) m /= n;
  for (const auto& row : x)
    for (size_t f = 0; f < width; ++f) scale[f] += (row[f] - mean[f]) * (row[f] - mean[f]);
  for (auto& s : scale) { s = std::sqrt(s / n); if (s == 0.0) s = 1.0; }

  std::vector<std::vector<double>> sums(n_classes, std::vector<double>(width, 0.0));
  std::vector<size_t> counts(n_classes, 0);
  for (size_t i = 0; i < x.size(); ++i) {
    if (y[i] < 0 || static_cast<size_t>(y[i]) >= n_classes) throw std::invalid_argument("NearestCentroid: label out of range");
    auto c = static_cast<size_t>(y[i]);
    for (size_t f = 0; f < width; ++f) sums[c][f] += (x[i][f] - mean[f]) / scale[f];
    counts[c]++;
  }
  std::vector<bool> present(n_classes, false);
  for (size_t c = 0; c < n_classes; ++c) {
    if (counts[c] == 0) continue;
    present[c] = true;
    for (auto& v : sums[c]) v /= static_cast<double>(counts[c]);
  }

  centroids_ = std::move(sums);
  present_ = std::move(present);
  mean_ = std::move(mean);
  scale_ = std::move(scale);
}

int NearestCentroid::predict(std::span<const double> x) const {
  if (centroids_.empty() || x.size() < mean_.size()) return -1;
  int best = -1;
  double best_d = std::numeric_limits<double>::infinity();
  for (size_t c = 0; c < centroids_.size(); ++c) {
    if (!present_[c]) continue;
    double d = 0.0;
    for (size_t f = 0; f < mean_.size(); ++f) {
      const double z = (x[f] - mean_[f]) / scale_[f] - centroids_[c][f];
      d += z * z;
    }
    if (d < best_d) { best_d = d; best = static_cast<int>(c); }
  }
  return best;
}

} // namespace procsight::ml
