#include "ml/FeatureEngineer.hpp"

#include <algorithm>
#include <cmath>

namespace procsight::ml {

double FeatureEngineer::mean(std::span<const double> v) {
  if (v.empty()) return 0.0;
  double s = 0.0;
  for (double x : v) s += x;
  return s / static_cast<double>(v.size());
}

double FeatureEngineer::stddev(std::span<const double> v) {
  if (v.empty()) return 0.0;
  double m = mean(v), acc = 0.0;
  for (double x : v) acc += (x - m) * (x - m);
  return std::sqrt(acc / static_cast<double>(v.size()));
}

// Ordinary least squares slope against index 0..n-1
double FeatureEngineer::slope(std::span<const double> v) {
  const size_t n = v.size();
  if (n < 2) return 0.0;
  double sx = 0, sy = 0, sxy = 0, sxx = 0;
  for (size_t i = 0; i < n; ++i) {
    double x = static_cast<double>(i);
    sx += x; sy += v[i]; sxy += x * v[i]; sxx += x * x;
  }
  double nn = static_cast<double>(n);
  double denom = nn * sxx - sx * sx;
  if (denom == 0.0) return 0.0;
  return (nn * sxy - sx * sy) / denom;
}

std::vector<double> FeatureEngineer::normalize(std::span<const double> values, const std::string& key) {
  if (values.empty()) return {};
  auto [lo, hi] = std::minmax_element(values.begin(), values.end());
  MinMax mm{*lo, *hi, *hi - *lo};
  if (mm.range == 0.0) mm.range = 1.0;
  std::vector<double> out;
  out.reserve(values.size());
  for (double v : values) out.push_back((v - mm.min) / mm.range);
  std::lock_guard<std::mutex> lk(mu_);
  scalers_[key] = mm;
  return out;
}

std::vector<double> FeatureEngineer::denormalize(std::span<const double> values, const std::string& key) const {
  MinMax mm;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = scalers_.find(key);
    if (it == scalers_.end()) throw UnknownScalerError(key);
    const auto* p = std::get_if<MinMax>(&it->second);
    if (!p) throw UnknownScalerError(key);
    mm = *p;
  }
  std::vector<double> out;
  out.reserve(values.size());
  for (double v : values) out.push_back(v * mm.range + mm.min);
  return out;
}

std::vector<double> FeatureEngineer::standardize(std::span<const double> values, const std::string& key) {
  if (values.empty()) return {};
  ZScore z{mean(values), stddev(values)};
  if (z.std == 0.0) z.std = 1.0;
  std::vector<double> out;
  out.reserve(values.size());
  for (double v : values) out.push_back((v - z.mean) / z.std);
  std::lock_guard<std::mutex> lk(mu_);
  scalers_[key] = z;
  return out;
}

bool FeatureEngineer::has_scaler(const std::string& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  return scalers_.contains(key);
}

ProcessFeatures FeatureEngineer::engineer_features(const procsight::model::Sample& sample,
                                                   std::span<const procsight::model::Sample> history) {
  ProcessFeatures f;
  f.cpu = sample.cpu;
  f.memory = sample.memory;
  f.threads = sample.threads > 0 ? static_cast<double>(sample.threads) : 1.0;
  f.cpu_per_thread = f.cpu / f.threads;
  f.memory_per_thread = f.memory / f.threads;
  if (history.empty()) return f;

  std::vector<double> cpu, mem;
  cpu.reserve(history.size()); mem.reserve(history.size());
  for (const auto& h : history) { cpu.push_back(h.cpu); mem.push_back(h.memory); }
  f.cpu_mean = mean(cpu);
  f.cpu_std = stddev(cpu);
  f.cpu_trend = slope(cpu);
  f.memory_mean = mean(mem);
  f.memory_std = stddev(mem);
  f.memory_trend = slope(mem);
  return f;
}

std::vector<std::optional<double>> FeatureEngineer::fill_missing(std::span<const std::optional<double>> series,
                                                                 FillStrategy strategy) {
  std::vector<double> valid;
  for (const auto& v : series)
    if (v && !std::isnan(*v)) valid.push_back(*v);
  std::vector<std::optional<double>> out(series.begin(), series.end());
  if (valid.empty()) return out;

  double fill = 0.0;
  switch (strategy) {
    case FillStrategy::Mean: fill = mean(valid); break;
    case FillStrategy::Median: {
      // upper median for even counts
      auto mid = valid.begin() + static_cast<std::ptrdiff_t>(valid.size() / 2);
      std::nth_element(valid.begin(), mid, valid.end());
      fill = *mid;
      break;
    }
    case FillStrategy::Zero: fill = 0.0; break;
  }
  for (auto& v : out)
    if (!v || std::isnan(*v)) v = fill;
  return out;
}

} // namespace procsight::ml
