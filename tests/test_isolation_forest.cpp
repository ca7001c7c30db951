#include "minitest.hpp"
#include "ml/IsolationForest.hpp"
#include <random>
#include <stdexcept>
#include <vector>

using procsight::ml::IsolationForest;
using procsight::ml::IsolationForestConfig;

static std::vector<std::vector<double>> cluster(size_t n, uint64_t seed) {
  std::mt19937_64 rng(seed);
  std::normal_distribution<double> d(10.0, 1.0);
  std::vector<std::vector<double>> rows(n);
  for (auto& r : rows) r = {d(rng), d(rng), d(rng)};
  return rows;
}

TEST(iforest_untrained_scores_zero) {
  IsolationForest f;
  std::vector<double> x{1, 2, 3};
  ASSERT_TRUE(!f.trained());
  ASSERT_EQ(f.num_trees(), 0u);
  ASSERT_NEAR(f.predict(x), 0.0, 0);
}

TEST(iforest_fit_rejects_bad_input) {
  IsolationForest f;
  ASSERT_THROWS(f.fit({}), std::invalid_argument);
  std::vector<std::vector<double>> ragged{{1, 2}, {1}};
  ASSERT_THROWS(f.fit(ragged), std::invalid_argument);
  ASSERT_TRUE(!f.trained());
}

TEST(iforest_outlier_scores_higher) {
  IsolationForestConfig cfg;
  cfg.num_trees = 100;
  cfg.sample_size = 128;
  cfg.seed = 7;
  IsolationForest f(cfg);
  f.fit(cluster(400, 1));
  ASSERT_TRUE(f.trained());
  ASSERT_EQ(f.num_trees(), 100u);

  std::vector<double> inlier{10.0, 10.0, 10.0};
  std::vector<double> outlier{60.0, -40.0, 90.0};
  double si = f.predict(inlier);
  double so = f.predict(outlier);
  ASSERT_TRUE(si > 0.0 && si <= 1.0);
  ASSERT_TRUE(so > 0.0 && so <= 1.0);
  ASSERT_TRUE(so > si);
  ASSERT_TRUE(so > 0.6);
  ASSERT_TRUE(si < 0.6);
}

TEST(iforest_seeded_fit_is_reproducible) {
  IsolationForestConfig cfg;
  cfg.num_trees = 20;
  cfg.sample_size = 64;
  cfg.seed = 99;
  IsolationForest a(cfg), b(cfg);
  auto data = cluster(200, 3);
  a.fit(data);
  b.fit(data);
  std::vector<double> x{12.0, 8.0, 11.0};
  ASSERT_NEAR(a.predict(x), b.predict(x), 1e-15);
}

TEST(iforest_unusable_input_scores_zero) {
  IsolationForestConfig cfg;
  cfg.num_trees = 10;
  cfg.seed = 5;
  IsolationForest f(cfg);
  f.fit(cluster(50, 2));
  std::vector<double> short_row{1.0};
  std::vector<double> nan_row{std::nan(""), 1.0, 1.0};
  ASSERT_NEAR(f.predict(short_row), 0.0, 0);
  ASSERT_NEAR(f.predict(nan_row), 0.0, 0);
}

TEST(iforest_batch_matches_single) {
  IsolationForestConfig cfg;
  cfg.num_trees = 10;
  cfg.seed = 11;
  IsolationForest f(cfg);
  auto data = cluster(100, 4);
  f.fit(data);
  std::vector<std::vector<double>> xs{data[0], data[1], {50, 50, 50}};
  auto scores = f.predict_batch(xs);
  ASSERT_EQ(scores.size(), 3u);
  for (size_t i = 0; i < xs.size(); ++i) ASSERT_NEAR(scores[i], f.predict(xs[i]), 0);
}

TEST(iforest_path_normalizer) {
  ASSERT_NEAR(IsolationForest::c(1), 0.0, 0);
  ASSERT_NEAR(IsolationForest::c(2), 2.0 * 0.5772156649 - 1.0, 1e-9);
  ASSERT_TRUE(IsolationForest::c(256) > IsolationForest::c(16));
}
