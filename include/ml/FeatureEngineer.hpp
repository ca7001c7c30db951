#pragma once
#include "model/Sample.hpp"

#include <cstddef>
#include <iterator>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace procsight::ml {

// Raised by denormalize() when no min-max scaler was recorded for the key.
class UnknownScalerError : public std::out_of_range {
public:
  explicit UnknownScalerError(const std::string& key)
    : std::out_of_range("no min-max scaler for '" + key + "'") {}
};

enum class FillStrategy { Mean, Median, Zero };

struct ProcessFeatures {
  double cpu{}, memory{}, threads{1};
  double cpu_per_thread{}, memory_per_thread{};
  double cpu_mean{}, cpu_std{}, cpu_trend{};
  double memory_mean{}, memory_std{}, memory_trend{};

  static constexpr size_t kWidth = 11;
  [[nodiscard]] std::vector<double> to_vector() const {
    return {cpu, memory, threads, cpu_per_thread, memory_per_thread,
            cpu_mean, cpu_std, cpu_trend, memory_mean, memory_std, memory_trend};
  }
};

// Lazy sequence of fixed-length views over a series. Iterating twice
// yields the same windows; the series must outlive the range.
class WindowRange {
public:
  class iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::span<const double>;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = value_type;

    iterator() = default;
    iterator(std::span<const double> s, size_t w, size_t st, size_t pos) : series_(s), window_(w), stride_(st), pos_(pos) {}
    value_type operator*() const { return series_.subspan(pos_, window_); }
    iterator& operator++() { pos_ += stride_; if (pos_ + window_ > series_.size()) pos_ = end_pos(); return *this; }
    iterator operator++(int) { auto t = *this; ++*this; return t; }
    bool operator==(const iterator& o) const { return pos_ == o.pos_; }
  private:
    size_t end_pos() const { return series_.size() + 1; }
    std::span<const double> series_{};
    size_t window_{}, stride_{1}, pos_{};
  };

  WindowRange(std::span<const double> series, size_t window, size_t stride)
    : series_(series), window_(window), stride_(stride) {}

  [[nodiscard]] iterator begin() const {
    if (empty()) return end();
    return iterator(series_, window_, stride_, 0);
  }
  [[nodiscard]] iterator end() const { return iterator(series_, window_, stride_, series_.size() + 1); }
  [[nodiscard]] bool empty() const { return window_ == 0 || stride_ == 0 || series_.size() < window_; }
  [[nodiscard]] size_t size() const { return empty() ? 0 : (series_.size() - window_) / stride_ + 1; }

private:
  std::span<const double> series_;
  size_t window_, stride_;
};

class FeatureEngineer {
public:
  // Min-max scale to [0,1] and remember {min, max, range} under key.
  std::vector<double> normalize(std::span<const double> values, const std::string& key);
  // Inverse of normalize(); throws UnknownScalerError without a min-max scaler for key.
  [[nodiscard]] std::vector<double> denormalize(std::span<const double> values, const std::string& key) const;
  // Z-score with population std; a zero std is treated as 1.
  std::vector<double> standardize(std::span<const double> values, const std::string& key);
  [[nodiscard]] bool has_scaler(const std::string& key) const;

  [[nodiscard]] static ProcessFeatures engineer_features(const procsight::model::Sample& sample,
                                                         std::span<const procsight::model::Sample> history);
  // Missing and NaN entries are replaced; input returned unchanged if nothing is valid.
  [[nodiscard]] static std::vector<std::optional<double>> fill_missing(std::span<const std::optional<double>> series,
                                                                       FillStrategy strategy);
  [[nodiscard]] static WindowRange create_windows(std::span<const double> series, size_t window, size_t stride) {
    return WindowRange(series, window, stride);
  }

  // Descriptive helpers shared with the trainers.
  static double mean(std::span<const double> v);
  static double stddev(std::span<const double> v);
  static double slope(std::span<const double> v);

private:
  struct MinMax { double min{}, max{}, range{1}; };
  struct ZScore { double mean{}, std{1}; };
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::variant<MinMax, ZScore>> scalers_;
};

} // namespace procsight::ml
