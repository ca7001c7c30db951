#include "ml/ProcessClassifier.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace procsight::ml {

ProcessClassifier::ProcessClassifier(ModelFactory factory) : factory_(std::move(factory)) {}

const std::vector<std::string>& ProcessClassifier::labels() {
  static const std::vector<std::string> l = {"web-server", "database", "application", "cache", "ml-training", "system"};
  return l;
}

const std::vector<std::string>& ProcessClassifier::feature_names() {
  static const std::vector<std::string> n = {"cpu", "memory", "threads", "priority",
                                             "io_read", "io_write", "net_sent", "net_received"};
  return n;
}

std::vector<double> ProcessClassifier::extract_features(const procsight::model::Sample& s) {
  return {s.cpu, s.memory, s.threads > 0 ? static_cast<double>(s.threads) : 1.0,
          static_cast<double>(s.priority), s.io_read, s.io_write, s.net_sent, s.net_received};
}

void ProcessClassifier::train(const std::vector<LabeledSample>& examples) {
  if (examples.empty()) throw std::invalid_argument("ProcessClassifier: no training examples");
  const auto& names = labels();
  std::vector<std::vector<double>> x;
  std::vector<int> y;
  x.reserve(examples.size());
  y.reserve(examples.size());
  for (const auto& ex : examples) {
    auto it = std::find(names.begin(), names.end(), ex.label);
    if (it == names.end()) throw std::invalid_argument("ProcessClassifier: unknown label '" + ex.label + "'");
    x.push_back(extract_features(ex.sample));
    y.push_back(static_cast<int>(it - names.begin()));
  }
  auto fresh = factory_();
  if (!fresh) throw std::runtime_error("ProcessClassifier: model factory returned null");
  fresh->fit(x, y, names.size());

  std::unique_lock<std::shared_mutex> lk(mu_);
  model_ = std::move(fresh);
}

procsight::model::Classification ProcessClassifier::predict(const procsight::model::Sample& s) const {
  procsight::model::Classification out;
  std::shared_lock<std::shared_mutex> lk(mu_);
  if (!model_) return out;
  const auto x = extract_features(s);
  const auto& names = labels();
  if (auto proba = model_->predict_proba(x)) {
    auto best = std::max_element(proba->begin(), proba->end());
    if (best == proba->end()) return out;
    out.label = names[static_cast<size_t>(best - proba->begin())];
    out.confidence = *best;
    for (size_t c = 0; c < proba->size() && c < names.size(); ++c) out.probabilities[names[c]] = (*proba)[c];
    return out;
  }
  const int id = model_->predict(x);
  if (id >= 0 && static_cast<size_t>(id) < names.size()) out.label = names[static_cast<size_t>(id)];
  return out;
}

std::vector<procsight::model::Classification> ProcessClassifier::predict_batch(const std::vector<procsight::model::Sample>& xs) const {
  std::vector<procsight::model::Classification> out;
  out.reserve(xs.size());
  for (const auto& s : xs) out.push_back(predict(s));
  return out;
}

std::vector<std::pair<std::string, double>> ProcessClassifier::feature_importance() const {
  std::vector<std::pair<std::string, double>> out;
  std::shared_lock<std::shared_mutex> lk(mu_);
  if (!model_) return out;
  const auto imp = model_->feature_importance();
  const auto& names = feature_names();
  for (size_t f = 0; f < imp.size() && f < names.size(); ++f) out.emplace_back(names[f], imp[f]);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b){ return a.second > b.second; });
  return out;
}

bool ProcessClassifier::trained() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return model_ != nullptr;
}

std::string ProcessClassifier::model_name() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return model_ ? model_->name() : "none";
}

} // namespace procsight::ml
