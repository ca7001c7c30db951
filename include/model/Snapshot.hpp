#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "model/Alert.hpp"
#include "model/Analysis.hpp"
#include "model/Sample.hpp"

namespace procsight::model {

struct ProcessReport {
  Sample sample;
  AnalysisResult analysis;
};

// Everything one monitor tick produced.
struct Snapshot {
  uint64_t seq{};
  SystemStats stats;
  std::vector<ProcessReport> reports;  // evaluated batch, sorted by cpu desc
  size_t total_processes{};
  std::vector<Alert> alerts;           // created during this tick
  ModelStatus models;
  AlertStats alert_stats;              // last 24h
  std::string collector_name;
};

} // namespace procsight::model
