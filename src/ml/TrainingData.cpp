#include "ml/TrainingData.hpp"

#include <algorithm>
#include <cctype>
#include <random>

namespace procsight::ml {

namespace {

struct Range { double lo, span; };

struct Archetype {
  const char* label;
  Range cpu, memory, threads;
  int32_t priority;
  Range io_read, io_write, net_sent, net_received;
};

// cpu %, memory MiB, threads, priority, io and net in bytes/s
constexpr Archetype kArchetypes[] = {
  {"web-server",  {10, 30}, {200, 300},  {50, 100},  10, {100, 200},   {50, 100},   {500, 1000}, {1000, 2000}},
  {"database",    {15, 40}, {500, 500},  {100, 200}, 15, {1000, 2000}, {500, 1000}, {200, 300},  {300, 500}},
  {"application", {5, 25},  {100, 300},  {5, 25},    20, {50, 150},    {20, 80},    {50, 150},   {50, 150}},
  {"cache",       {2, 10},  {1000, 2000},{4, 12},    10, {10, 40},     {10, 40},    {2000, 3000},{2000, 3000}},
  {"ml-training", {60, 35}, {800, 1200}, {10, 30},   5,  {500, 500},   {200, 300},  {50, 100},   {50, 100}},
  {"system",      {0, 3},   {1, 20},     {1, 3},     0,  {0, 20},      {0, 20},     {0, 10},     {0, 10}},
};

} // namespace

std::vector<LabeledSample> synthetic_examples(size_t per_label, uint64_t seed) {
  std::mt19937_64 rng(seed);
  std::uniform_real_distribution<double> u(0.0, 1.0);
  auto draw = [&](const Range& r){ return r.lo + u(rng) * r.span; };
  std::vector<LabeledSample> out;
  out.reserve(per_label * std::size(kArchetypes));
  int32_t pid = 1;
  for (const auto& a : kArchetypes) {
    for (size_t i = 0; i < per_label; ++i) {
      LabeledSample ex;
      ex.label = a.label;
      ex.sample.pid = pid++;
      ex.sample.name = a.label;
      ex.sample.cpu = draw(a.cpu);
      ex.sample.memory = draw(a.memory);
      ex.sample.threads = static_cast<int32_t>(draw(a.threads));
      ex.sample.priority = a.priority;
      ex.sample.io_read = draw(a.io_read);
      ex.sample.io_write = draw(a.io_write);
      ex.sample.net_sent = draw(a.net_sent);
      ex.sample.net_received = draw(a.net_received);
      out.push_back(std::move(ex));
    }
  }
  return out;
}

std::optional<std::string> label_from_name(const procsight::model::Sample& s) {
  std::string n = s.name;
  std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  auto has = [&](const char* needle){ return n.find(needle) != std::string::npos; };
  if (has("nginx") || has("apache") || has("httpd")) return "web-server";
  if (has("postgres") || has("mysql") || has("mongo")) return "database";
  if (has("redis") || has("memcache")) return "cache";
  if (has("python") && s.cpu > 50.0) return "ml-training";
  if (has("system") || has("kernel")) return "system";
  return std::nullopt;
}

} // namespace procsight::ml
