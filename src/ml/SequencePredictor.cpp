#include "ml/SequencePredictor.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <mutex>
#include <numeric>
#include <random>
#include <stdexcept>

namespace procsight::ml {

namespace {

inline double sigmoid(double x) { return 1.0 / (1.0 + std::exp(-x)); }

// Offsets into the flat parameter vector. Gates are packed [i, f, g, o].
struct Layout {
  size_t h, wx, wh, b, wy, by;
  explicit Layout(size_t hidden)
    : h(hidden), wx(0), wh(4 * hidden), b(4 * hidden + 4 * hidden * hidden),
      wy(b + 4 * hidden), by(wy + hidden) {}
};

struct Adam {
  std::vector<double> m, v;
  double lr, b1{0.9}, b2{0.999}, eps{1e-8};
  uint64_t t{0};
  Adam(size_t n, double rate) : m(n, 0.0), v(n, 0.0), lr(rate) {}
  void step(std::vector<double>& params, const std::vector<double>& grad) {
    ++t;
    const double c1 = 1.0 - std::pow(b1, static_cast<double>(t));
    const double c2 = 1.0 - std::pow(b2, static_cast<double>(t));
    for (size_t k = 0; k < params.size(); ++k) {
      m[k] = b1 * m[k] + (1.0 - b1) * grad[k];
      v[k] = b2 * v[k] + (1.0 - b2) * grad[k] * grad[k];
      params[k] -= lr * (m[k] / c1) / (std::sqrt(v[k] / c2) + eps);
    }
  }
};

constexpr double kClipNorm = 5.0;

} // namespace

SequencePredictor::SequencePredictor(SequencePredictorConfig cfg) : cfg_(cfg) {
  if (cfg_.lookback == 0) cfg_.lookback = 1;
  if (cfg_.hidden_units == 0) cfg_.hidden_units = 1;
  state_.lookback = cfg_.lookback;
  state_.hidden = cfg_.hidden_units;
}

void SequencePredictor::init_params(State& s, uint64_t seed) const {
  Layout L(s.hidden);
  s.params.assign(param_count(s.hidden), 0.0);
  std::mt19937_64 rng(seed);
  const double k = 1.0 / std::sqrt(static_cast<double>(s.hidden));
  std::uniform_real_distribution<double> uni(-k, k);
  for (size_t i = 0; i < L.b; ++i) s.params[i] = uni(rng);
  for (size_t u = 0; u < s.hidden; ++u) s.params[L.b + s.hidden + u] = 1.0; // forget gate bias
  for (size_t u = 0; u < s.hidden; ++u) s.params[L.wy + u] = uni(rng);
}

double SequencePredictor::forward(const State& s, std::span<const double> xs, std::vector<Step>* trace,
                                  std::vector<double>* h_last) {
  const Layout L(s.hidden);
  const size_t H = s.hidden;
  const auto& p = s.params;
  std::vector<double> h(H, 0.0), c(H, 0.0), hn(H), z(4 * H);
  if (trace) trace->clear();

  for (double x : xs) {
    for (size_t k = 0; k < 4 * H; ++k) {
      double acc = p[L.wx + k] * x + p[L.b + k];
      const double* row = &p[L.wh + k * H];
      for (size_t j = 0; j < H; ++j) acc += row[j] * h[j];
      z[k] = acc;
    }
    Step st;
    if (trace) {
      st.i.resize(H); st.f.resize(H); st.g.resize(H); st.o.resize(H);
      st.c.resize(H); st.c_prev = c; st.h_prev = h;
    }
    for (size_t u = 0; u < H; ++u) {
      const double ig = sigmoid(z[u]);
      const double fg = sigmoid(z[H + u]);
      const double gg = std::tanh(z[2 * H + u]);
      const double og = sigmoid(z[3 * H + u]);
      c[u] = fg * c[u] + ig * gg;
      hn[u] = og * std::tanh(c[u]);
      if (trace) { st.i[u] = ig; st.f[u] = fg; st.g[u] = gg; st.o[u] = og; st.c[u] = c[u]; }
    }
    h.swap(hn);
    if (trace) trace->push_back(std::move(st));
  }

  double y = p[L.by];
  for (size_t u = 0; u < H; ++u) y += p[L.wy + u] * h[u];
  if (h_last) *h_last = std::move(h);
  return y;
}

void SequencePredictor::backward(const State& s, std::span<const double> xs, const std::vector<Step>& trace,
                                 const std::vector<double>& h_last, double dy, std::vector<double>& grad) {
  const Layout L(s.hidden);
  const size_t H = s.hidden;
  const auto& p = s.params;

  grad[L.by] += dy;
  std::vector<double> dh(H), dc_next(H, 0.0), dz(4 * H), dh_prev(H);
  for (size_t u = 0; u < H; ++u) {
    grad[L.wy + u] += dy * h_last[u];
    dh[u] = dy * p[L.wy + u];
  }

  for (size_t t = trace.size(); t-- > 0;) {
    const Step& st = trace[t];
    const double x = xs[t];
    for (size_t u = 0; u < H; ++u) {
      const double tc = std::tanh(st.c[u]);
      const double d_o = dh[u] * tc;
      const double dc = dh[u] * st.o[u] * (1.0 - tc * tc) + dc_next[u];
      const double d_i = dc * st.g[u];
      const double d_g = dc * st.i[u];
      const double d_f = dc * st.c_prev[u];
      dc_next[u] = dc * st.f[u];
      dz[u]         = d_i * st.i[u] * (1.0 - st.i[u]);
      dz[H + u]     = d_f * st.f[u] * (1.0 - st.f[u]);
      dz[2 * H + u] = d_g * (1.0 - st.g[u] * st.g[u]);
      dz[3 * H + u] = d_o * st.o[u] * (1.0 - st.o[u]);
    }
    std::fill(dh_prev.begin(), dh_prev.end(), 0.0);
    for (size_t k = 0; k < 4 * H; ++k) {
      grad[L.wx + k] += dz[k] * x;
      grad[L.b + k] += dz[k];
      double* g_row = &grad[L.wh + k * H];
      const double* w_row = &p[L.wh + k * H];
      for (size_t j = 0; j < H; ++j) {
        g_row[j] += dz[k] * st.h_prev[j];
        dh_prev[j] += w_row[j] * dz[k];
      }
    }
    dh.swap(dh_prev);
  }
}

TrainReport SequencePredictor::train(std::span<const double> series, size_t epochs, size_t batch_size) {
  State next;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    next = state_;
  }
  const size_t lookback = next.lookback;
  if (series.size() <= lookback)
    throw std::invalid_argument("SequencePredictor: series must be longer than the lookback window");
  if (epochs == 0 || batch_size == 0)
    throw std::invalid_argument("SequencePredictor: epochs and batch_size must be positive");
  for (double v : series)
    if (!std::isfinite(v)) throw std::invalid_argument("SequencePredictor: non-finite value in series");

  const uint64_t seed = cfg_.seed ? *cfg_.seed : std::random_device{}();
  if (!next.trained) init_params(next, seed);

  auto [lo, hi] = std::minmax_element(series.begin(), series.end());
  next.min = *lo;
  next.range = (*hi - *lo) == 0.0 ? 1.0 : (*hi - *lo);
  std::vector<double> scaled;
  scaled.reserve(series.size());
  for (double v : series) scaled.push_back((v - next.min) / next.range);

  // pair k: inputs scaled[k .. k+lookback), target scaled[k+lookback]
  const size_t pairs = scaled.size() - lookback;
  size_t n_val = static_cast<size_t>(static_cast<double>(pairs) * cfg_.validation_split);
  if (n_val >= pairs) n_val = 0;
  const size_t n_train = pairs - n_val;

  std::vector<size_t> order(n_train);
  std::iota(order.begin(), order.end(), 0);
  std::mt19937_64 rng(seed ^ 0x9e3779b97f4a7c15ULL);
  Adam adam(next.params.size(), cfg_.learning_rate);
  std::vector<double> grad(next.params.size());
  std::vector<Step> trace;
  std::vector<double> h_last;

  TrainReport rep;
  rep.epochs = epochs;
  rep.train_pairs = n_train;
  rep.validation_pairs = n_val;
  for (size_t e = 0; e < epochs; ++e) {
    std::shuffle(order.begin(), order.end(), rng);
    double epoch_loss = 0.0;
    for (size_t start = 0; start < n_train; start += batch_size) {
      const size_t end = std::min(n_train, start + batch_size);
      const double bsz = static_cast<double>(end - start);
      std::fill(grad.begin(), grad.end(), 0.0);
      for (size_t b = start; b < end; ++b) {
        const size_t k = order[b];
        std::span<const double> xs(scaled.data() + k, lookback);
        const double target = scaled[k + lookback];
        const double y = forward(next, xs, &trace, &h_last);
        epoch_loss += (y - target) * (y - target);
        backward(next, xs, trace, h_last, 2.0 * (y - target) / bsz, grad);
      }
      double norm = 0.0;
      for (double g : grad) norm += g * g;
      norm = std::sqrt(norm);
      if (!std::isfinite(norm)) throw std::runtime_error("SequencePredictor: gradient diverged");
      if (norm > kClipNorm)
        for (double& g : grad) g *= kClipNorm / norm;
      adam.step(next.params, grad);
    }
    rep.train_loss = epoch_loss / static_cast<double>(n_train);
  }

  if (n_val > 0) {
    double loss = 0.0;
    for (size_t k = n_train; k < pairs; ++k) {
      const double y = forward(next, std::span<const double>(scaled.data() + k, lookback), nullptr, nullptr);
      loss += (y - scaled[k + lookback]) * (y - scaled[k + lookback]);
    }
    rep.validation_loss = loss / static_cast<double>(n_val);
  }

  next.trained = true;
  std::unique_lock<std::shared_mutex> lk(mu_);
  state_ = std::move(next);
  return rep;
}

double SequencePredictor::predict(std::span<const double> window) const {
  const double fallback = window.empty() ? 0.0 : window.back();
  std::shared_lock<std::shared_mutex> lk(mu_);
  if (!state_.trained || window.empty() || state_.range == 0.0) return fallback;
  if (window.size() > state_.lookback) window = window.last(state_.lookback);

  std::vector<double> xs;
  xs.reserve(window.size());
  for (double v : window) {
    if (!std::isfinite(v)) return fallback;
    xs.push_back((v - state_.min) / state_.range);
  }
  const double y = forward(state_, xs, nullptr, nullptr) * state_.range + state_.min;
  return std::isfinite(y) ? y : fallback;
}

std::vector<double> SequencePredictor::predict_multi_step(std::span<const double> window, size_t steps) const {
  const size_t lookback = input_shape();
  std::vector<double> buf(window.begin(), window.end());
  if (buf.size() > lookback) buf.erase(buf.begin(), buf.end() - static_cast<std::ptrdiff_t>(lookback));
  std::vector<double> out;
  out.reserve(steps);
  for (size_t s = 0; s < steps; ++s) {
    const double next = predict(buf);
    out.push_back(next);
    buf.push_back(next);
    if (buf.size() > lookback) buf.erase(buf.begin());
  }
  return out;
}

bool SequencePredictor::save(const std::string& path) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  if (!state_.trained) return false;
  std::ofstream out(path);
  if (!out) return false;
  out.precision(std::numeric_limits<double>::max_digits10);
  out << "procsight-lstm 1\n"
      << "lookback " << state_.lookback << '\n'
      << "hidden " << state_.hidden << '\n'
      << "scale " << state_.min << ' ' << state_.range << '\n'
      << "params " << state_.params.size() << '\n';
  for (size_t k = 0; k < state_.params.size(); ++k)
    out << state_.params[k] << ((k + 1) % 8 == 0 ? '\n' : ' ');
  out << '\n';
  return out.good();
}

bool SequencePredictor::load(const std::string& path) {
  std::ifstream in(path);
  if (!in) return false;
  std::string tag; int version = 0;
  if (!(in >> tag >> version) || tag != "procsight-lstm" || version != 1) return false;

  State s;
  std::string key;
  size_t count = 0;
  if (!(in >> key >> s.lookback) || key != "lookback" || s.lookback == 0) return false;
  if (!(in >> key >> s.hidden) || key != "hidden" || s.hidden == 0) return false;
  if (!(in >> key >> s.min >> s.range) || key != "scale" || s.range == 0.0) return false;
  if (!(in >> key >> count) || key != "params" || count != param_count(s.hidden)) return false;
  s.params.resize(count);
  for (auto& v : s.params)
    if (!(in >> v) || !std::isfinite(v)) return false;
  s.trained = true;

  std::unique_lock<std::shared_mutex> lk(mu_);
  state_ = std::move(s);
  return true;
}

bool SequencePredictor::trained() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return state_.trained;
}

size_t SequencePredictor::input_shape() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return state_.lookback;
}

} // namespace procsight::ml
