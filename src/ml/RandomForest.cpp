#include "ml/RandomForest.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace procsight::ml {

static double gini(const std::vector<size_t>& counts, size_t n) {
  if (n == 0) return 0.0;
  double acc = 1.0;
  for (size_t c : counts) {
    double p = static_cast<double>(c) / static_cast<double>(n);
    acc -= p * p;
  }
  return acc;
}

struct RandomForest::Builder {
  const std::vector<std::vector<double>>& x;
  const std::vector<int>& y;
  size_t n_classes;
  size_t width;
  const RandomForestConfig& cfg;
  std::mt19937_64& rng;
  std::vector<double>& importance;
  double total;
  ForestTree tree{};
  std::vector<size_t> features{};

  int leaf(const std::vector<size_t>& counts, size_t n) {
    ForestNode node{-1, 0.0, -1, -1, true, std::vector<double>(n_classes, 0.0)};
    for (size_t c = 0; c < n_classes; ++c)
      node.p[c] = n ? static_cast<double>(counts[c]) / static_cast<double>(n) : 0.0;
    tree.n.push_back(std::move(node));
    return static_cast<int>(tree.n.size() - 1);
  }

  int grow(std::vector<size_t>& idx, size_t depth) {
    const size_t n = idx.size();
    std::vector<size_t> counts(n_classes, 0);
    for (size_t i : idx) counts[static_cast<size_t>(y[i])]++;
    const double parent = gini(counts, n);
    if (n < cfg.min_samples_split || depth >= cfg.max_depth || parent == 0.0) return leaf(counts, n);

    // partial Fisher-Yates: the first k entries become this node's candidates
    size_t k = static_cast<size_t>(std::lround(cfg.max_features * static_cast<double>(width)));
    k = std::clamp<size_t>(k, 1, width);
    for (size_t i = 0; i < k; ++i) {
      std::uniform_int_distribution<size_t> pick(i, width - 1);
      std::swap(features[i], features[pick(rng)]);
    }

    int best_f = -1;
    double best_t = 0.0, best_impurity = parent;
    std::vector<size_t> order(idx);
    for (size_t fi = 0; fi < k; ++fi) {
      const size_t f = features[fi];
      std::sort(order.begin(), order.end(), [&](size_t a, size_t b){ return x[a][f] < x[b][f]; });
      std::vector<size_t> left(n_classes, 0), right(counts);
      for (size_t pos = 0; pos + 1 < n; ++pos) {
        const size_t c = static_cast<size_t>(y[order[pos]]);
        left[c]++; right[c]--;
        const double v = x[order[pos]][f], next = x[order[pos + 1]][f];
        if (v == next) continue;
        const size_t nl = pos + 1, nr = n - nl;
        const double weighted = (static_cast<double>(nl) * gini(left, nl) + static_cast<double>(nr) * gini(right, nr))
                                / static_cast<double>(n);
        if (weighted < best_impurity) {
          best_impurity = weighted;
          best_f = static_cast<int>(f);
          best_t = v + (next - v) / 2.0;
        }
      }
    }
    if (best_f < 0) return leaf(counts, n);

    importance[static_cast<size_t>(best_f)] += (static_cast<double>(n) / total) * (parent - best_impurity);
    std::vector<size_t> li, ri;
    for (size_t i : idx) (x[i][static_cast<size_t>(best_f)] <= best_t ? li : ri).push_back(i);

    tree.n.push_back(ForestNode{best_f, best_t, -1, -1, false, {}});
    const int id = static_cast<int>(tree.n.size() - 1);
    const int l = grow(li, depth + 1);
    const int r = grow(ri, depth + 1);
    tree.n[static_cast<size_t>(id)].l = l;
    tree.n[static_cast<size_t>(id)].r = r;
    return id;
  }
};

void RandomForest::fit(const std::vector<std::vector<double>>& x, const std::vector<int>& y, size_t n_classes) {
  if (x.empty() || x.size() != y.size() || n_classes == 0)
    throw std::invalid_argument("RandomForest: empty or mismatched training set");
  const size_t width = x.front().size();
  if (width == 0) throw std::invalid_argument("RandomForest: zero-width rows");
  for (size_t i = 0; i < x.size(); ++i) {
    if (x[i].size() != width) throw std::invalid_argument("RandomForest: ragged rows");
    if (y[i] < 0 || static_cast<size_t>(y[i]) >= n_classes) throw std::invalid_argument("RandomForest: label out of range");
  }

  std::mt19937_64 rng(cfg_.seed);
  std::vector<double> importance(width, 0.0);
  std::vector<ForestTree> trees;
  const size_t estimators = std::max<size_t>(1, cfg_.n_estimators);
  trees.reserve(estimators);
  std::uniform_int_distribution<size_t> draw(0, x.size() - 1);
  for (size_t t = 0; t < estimators; ++t) {
    std::vector<size_t> idx(x.size());
    for (auto& i : idx) i = draw(rng);
    Builder b{x, y, n_classes, width, cfg_, rng, importance, static_cast<double>(x.size())};
    b.features.resize(width);
    std::iota(b.features.begin(), b.features.end(), size_t{0});
    b.grow(idx, 0);
    trees.push_back(std::move(b.tree));
  }

  const double sum = std::accumulate(importance.begin(), importance.end(), 0.0);
  if (sum > 0.0)
    for (auto& v : importance) v /= sum;

  trees_ = std::move(trees);
  importance_ = std::move(importance);
  n_classes_ = n_classes;
  width_ = width;
}

std::optional<std::vector<double>> RandomForest::predict_proba(std::span<const double> x) const {
  if (trees_.empty() || x.size() < width_) return std::nullopt;
  std::vector<double> acc(n_classes_, 0.0);
  for (const auto& t : trees_) {
    size_t i = 0;
    while (!t.n[i].leaf) {
      const auto& nd = t.n[i];
      i = static_cast<size_t>((x[static_cast<size_t>(nd.f)] <= nd.t) ? nd.l : nd.r);
    }
    for (size_t c = 0; c < n_classes_; ++c) acc[c] += t.n[i].p[c];
  }
  for (auto& v : acc) v /= static_cast<double>(trees_.size());
  return acc;
}

int RandomForest::predict(std::span<const double> x) const {
  auto p = predict_proba(x);
  if (!p) return -1;
  return static_cast<int>(std::max_element(p->begin(), p->end()) - p->begin());
}

} // namespace procsight::ml
