#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

namespace procsight::ml {

struct SequencePredictorConfig {
  size_t lookback{10};
  size_t hidden_units{50};
  double learning_rate{0.01};
  double validation_split{0.2};
  std::optional<uint64_t> seed;
};

struct TrainReport {
  size_t epochs{};
  size_t train_pairs{};
  size_t validation_pairs{};
  double train_loss{};
  double validation_loss{};  // 0 when nothing was held out
};

// One-step-ahead forecaster for a scalar series: a single LSTM layer read
// out by a dense unit, trained with truncated BPTT and Adam on min-max
// scaled values.
class SequencePredictor {
public:
  explicit SequencePredictor(SequencePredictorConfig cfg = {});

  // Throws std::invalid_argument when series.size() <= lookback or epochs/batch_size is 0.
  TrainReport train(std::span<const double> series, size_t epochs, size_t batch_size);

  // Next value after window. Falls back to window.back() (0 for an empty
  // window) when untrained or inference is not finite.
  [[nodiscard]] double predict(std::span<const double> window) const;
  [[nodiscard]] std::vector<double> predict_multi_step(std::span<const double> window, size_t steps) const;

  [[nodiscard]] bool save(const std::string& path) const;
  [[nodiscard]] bool load(const std::string& path);

  [[nodiscard]] bool trained() const;
  [[nodiscard]] size_t input_shape() const;

private:
  struct State {
    size_t lookback{};
    size_t hidden{};
    std::vector<double> params;
    double min{};
    double range{1};
    bool trained{false};
  };
  struct Step { std::vector<double> i, f, g, o, c, c_prev, h_prev; };

  static size_t param_count(size_t hidden) { return 4 * hidden + 4 * hidden * hidden + 4 * hidden + hidden + 1; }
  static double forward(const State& s, std::span<const double> xs, std::vector<Step>* trace, std::vector<double>* h_last);
  static void backward(const State& s, std::span<const double> xs, const std::vector<Step>& trace,
                       const std::vector<double>& h_last, double dy, std::vector<double>& grad);
  void init_params(State& s, uint64_t seed) const;

  SequencePredictorConfig cfg_;
  mutable std::shared_mutex mu_;
  State state_;
};

} // namespace procsight::ml
