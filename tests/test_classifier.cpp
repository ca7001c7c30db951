#include "minitest.hpp"
#include "ml/NearestCentroid.hpp"
#include "ml/ProcessClassifier.hpp"
#include "ml/RandomForest.hpp"
#include "ml/TrainingData.hpp"
#include <memory>
#include <stdexcept>

using namespace procsight::ml;
using procsight::model::Sample;

static ProcessClassifier forest_classifier(size_t trees = 30) {
  return ProcessClassifier([trees]{
    RandomForestConfig cfg;
    cfg.n_estimators = trees;
    cfg.seed = 42;
    return std::make_unique<RandomForest>(cfg);
  });
}

static Sample ml_job() {
  Sample s;
  s.name = "trainer";
  s.cpu = 85; s.memory = 1500; s.threads = 20; s.priority = 5;
  s.io_read = 700; s.io_write = 350; s.net_sent = 70; s.net_received = 80;
  return s;
}

static Sample daemon_proc() {
  Sample s;
  s.name = "kworker";
  s.cpu = 0.5; s.memory = 4; s.threads = 1; s.priority = 0;
  return s;
}

TEST(classifier_untrained_is_unknown) {
  auto c = forest_classifier();
  ASSERT_TRUE(!c.trained());
  auto r = c.predict(ml_job());
  ASSERT_EQ(r.label, std::string("unknown"));
  ASSERT_NEAR(r.confidence, 0.0, 0);
  ASSERT_TRUE(r.probabilities.empty());
  ASSERT_TRUE(c.feature_importance().empty());
  ASSERT_EQ(c.model_name(), std::string("none"));
}

TEST(classifier_rejects_bad_training_sets) {
  auto c = forest_classifier();
  ASSERT_THROWS(c.train({}), std::invalid_argument);
  std::vector<LabeledSample> bad{{ml_job(), "gpu-miner"}};
  ASSERT_THROWS(c.train(bad), std::invalid_argument);
  ASSERT_TRUE(!c.trained());
}

TEST(classifier_forest_separates_archetypes) {
  auto c = forest_classifier();
  c.train(synthetic_examples(30, 7));
  ASSERT_TRUE(c.trained());
  ASSERT_EQ(c.model_name(), std::string("random_forest"));

  auto r = c.predict(ml_job());
  ASSERT_EQ(r.label, std::string("ml-training"));
  ASSERT_TRUE(r.confidence > 0.5 && r.confidence <= 1.0);
  ASSERT_EQ(r.probabilities.size(), ProcessClassifier::labels().size());
  double total = 0;
  for (const auto& [label, p] : r.probabilities) total += p;
  ASSERT_NEAR(total, 1.0, 1e-9);
  ASSERT_NEAR(r.probabilities.at("ml-training"), r.confidence, 1e-12);

  ASSERT_EQ(c.predict(daemon_proc()).label, std::string("system"));
}

TEST(classifier_feature_importance_sorted) {
  auto c = forest_classifier(20);
  c.train(synthetic_examples(20, 3));
  auto imp = c.feature_importance();
  ASSERT_EQ(imp.size(), ProcessClassifier::feature_names().size());
  double total = 0;
  for (size_t i = 0; i < imp.size(); ++i) {
    total += imp[i].second;
    if (i > 0) ASSERT_TRUE(imp[i - 1].second >= imp[i].second);
  }
  ASSERT_NEAR(total, 1.0, 1e-9);
}

TEST(classifier_nearest_centroid_has_no_confidence) {
  ProcessClassifier c([]{ return std::make_unique<NearestCentroid>(); });
  c.train(synthetic_examples(20, 5));
  auto r = c.predict(daemon_proc());
  ASSERT_EQ(r.label, std::string("system"));
  ASSERT_NEAR(r.confidence, 0.0, 0);
  ASSERT_TRUE(r.probabilities.empty());
  ASSERT_TRUE(c.feature_importance().empty());
}

TEST(classifier_batch_matches_single) {
  auto c = forest_classifier(10);
  c.train(synthetic_examples(10, 9));
  std::vector<Sample> xs{ml_job(), daemon_proc()};
  auto out = c.predict_batch(xs);
  ASSERT_EQ(out.size(), 2u);
  ASSERT_EQ(out[0].label, c.predict(xs[0]).label);
  ASSERT_EQ(out[1].label, c.predict(xs[1]).label);
}

TEST(random_forest_rejects_mismatched_labels) {
  RandomForest f;
  std::vector<std::vector<double>> x{{1, 2}, {3, 4}};
  std::vector<int> y{0};
  ASSERT_THROWS(f.fit(x, y, 2), std::invalid_argument);
  std::vector<double> q{1, 2};
  ASSERT_EQ(f.predict(q), -1);
  ASSERT_TRUE(!f.predict_proba(q).has_value());
}

TEST(training_data_shapes_and_name_heuristic) {
  auto ex = synthetic_examples(4, 1);
  ASSERT_EQ(ex.size(), 4u * ProcessClassifier::labels().size());
  Sample s;
  s.name = "postgres: writer";
  ASSERT_EQ(*label_from_name(s), std::string("database"));
  s.name = "python3";
  s.cpu = 10;
  ASSERT_TRUE(!label_from_name(s).has_value());
  s.cpu = 90;
  ASSERT_EQ(*label_from_name(s), std::string("ml-training"));
}

TEST(classifier_held_out_accuracy) {
  auto c = forest_classifier(30);
  c.train(synthetic_examples(20, 11));
  auto held_out = synthetic_examples(10, 12345);
  size_t hits = 0;
  for (const auto& ex : held_out)
    if (c.predict(ex.sample).label == ex.label) ++hits;
  ASSERT_TRUE(static_cast<double>(hits) / static_cast<double>(held_out.size()) > 0.8);
}
