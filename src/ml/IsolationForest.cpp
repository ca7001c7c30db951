#include "ml/IsolationForest.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>

namespace procsight::ml {

static constexpr double kEulerGamma = 0.5772156649;

IsolationForest::IsolationForest(IsolationForestConfig cfg) : cfg_(cfg) {
  if (cfg_.num_trees == 0) cfg_.num_trees = 1;
  if (cfg_.sample_size == 0) cfg_.sample_size = 1;
}

double IsolationForest::c(double n) {
  if (n <= 1.0) return 0.0;
  return 2.0 * (std::log(n - 1.0) + kEulerGamma) - 2.0 * (n - 1.0) / n;
}

std::unique_ptr<IsolationForest::Node> IsolationForest::build(const Rows& rows, size_t width, size_t depth,
                                                              size_t max_depth, std::mt19937_64& rng) {
  auto leaf = [&]{ return std::make_unique<Node>(Node{Leaf{rows.size()}}); };
  if (rows.size() <= 1 || depth >= max_depth) return leaf();

  std::uniform_int_distribution<size_t> pick(0, width - 1);
  const size_t feature = pick(rng);
  double lo = (*rows.front())[feature], hi = lo;
  for (const auto* r : rows) { lo = std::min(lo, (*r)[feature]); hi = std::max(hi, (*r)[feature]); }
  std::uniform_real_distribution<double> uni(0.0, 1.0);
  const double split = lo + uni(rng) * (hi - lo);

  Rows left, right;
  for (const auto* r : rows) ((*r)[feature] < split ? left : right).push_back(r);
  if (left.empty() || right.empty()) return leaf();

  Internal in;
  in.feature = feature;
  in.split = split;
  in.left = build(left, width, depth + 1, max_depth, rng);
  in.right = build(right, width, depth + 1, max_depth, rng);
  return std::make_unique<Node>(Node{std::move(in)});
}

void IsolationForest::fit(const std::vector<std::vector<double>>& data) {
  if (data.empty()) throw std::invalid_argument("IsolationForest: empty dataset");
  const size_t width = data.front().size();
  if (width == 0) throw std::invalid_argument("IsolationForest: zero-width rows");
  for (const auto& row : data)
    if (row.size() != width) throw std::invalid_argument("IsolationForest: ragged rows");

  std::mt19937_64 rng(cfg_.seed ? *cfg_.seed : std::random_device{}());
  const size_t n = std::min(cfg_.sample_size, data.size());
  const auto max_depth = static_cast<size_t>(std::ceil(std::log2(static_cast<double>(cfg_.sample_size))));
  std::uniform_int_distribution<size_t> draw(0, data.size() - 1);

  std::vector<std::unique_ptr<Node>> trees;
  trees.reserve(cfg_.num_trees);
  Rows sample;
  for (size_t t = 0; t < cfg_.num_trees; ++t) {
    sample.clear();
    for (size_t i = 0; i < n; ++i) sample.push_back(&data[draw(rng)]);
    trees.push_back(build(sample, width, 0, max_depth, rng));
  }

  std::unique_lock<std::shared_mutex> lk(mu_);
  trees_ = std::move(trees);
  width_ = width;
  trained_ = true;
}

double IsolationForest::path_length(const Node& root, std::span<const double> x) {
  const Node* node = &root;
  double depth = 0.0;
  while (const auto* in = std::get_if<Internal>(&node->v)) {
    node = (x[in->feature] < in->split) ? in->left.get() : in->right.get();
    depth += 1.0;
  }
  return depth + c(static_cast<double>(std::get<Leaf>(node->v).size));
}

double IsolationForest::predict(std::span<const double> x) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  if (!trained_ || trees_.empty() || x.size() < width_) return 0.0;
  for (double v : x.first(width_))
    if (!std::isfinite(v)) return 0.0;

  double total = 0.0;
  for (const auto& tree : trees_) total += path_length(*tree, x);
  const double avg = total / static_cast<double>(trees_.size());
  const double norm = c(static_cast<double>(cfg_.sample_size));
  if (norm <= 0.0) return 0.0;
  const double score = std::pow(2.0, -avg / norm);
  return std::isfinite(score) ? score : 0.0;
}

std::vector<double> IsolationForest::predict_batch(const std::vector<std::vector<double>>& xs) const {
  std::vector<double> out;
  out.reserve(xs.size());
  for (const auto& x : xs) out.push_back(predict(x));
  return out;
}

bool IsolationForest::trained() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return trained_;
}

size_t IsolationForest::num_trees() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return trees_.size();
}

} // namespace procsight::ml
