#include "app/LogWriter.hpp"
#include "app/MetricsServer.hpp"
#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <string_view>

namespace procsight::app {

LogWriter::LogWriter(const SnapshotBuffers& buffers, std::filesystem::path log_dir,
                     std::chrono::milliseconds interval, int retention_days)
    : buffers_(buffers), log_dir_(std::move(log_dir)), interval_(interval),
      retention_days_(retention_days) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir_, ec);
  if (ec) {
    std::fprintf(stderr, "procsight: LogWriter: failed to create %s: %s\n",
                 log_dir_.c_str(), ec.message().c_str());
  }
}

LogWriter::~LogWriter() { stop(); }

void LogWriter::start() {
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void LogWriter::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  std::lock_guard<std::mutex> lk(file_mu_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool LogWriter::write(const std::vector<procsight::model::MetricRecord>& batch) {
  if (batch.empty()) return true;
  std::lock_guard<std::mutex> lk(file_mu_);

  auto required_path = chunk_path();
  if (required_path != current_path_ || !file_.is_open()) {
    if (file_.is_open()) {
      file_.flush();
      file_.close();
    }
    file_.open(required_path, std::ios::app);
    if (!file_) {
      std::fprintf(stderr, "procsight: LogWriter: failed to open %s: %s\n",
                   required_path.c_str(), std::strerror(errno));
      current_path_.clear();
      return false;
    }
    bool rotated = !current_path_.empty();
    current_path_ = required_path;
    if (rotated) prune_locked();
  }

  // Block timestamp is the newest record in the batch
  int64_t ts = 0;
  for (const auto& r : batch) ts = std::max(ts, r.timestamp_ms);
  char ts_buf[32];
  auto [ptr, ec] = std::to_chars(ts_buf, ts_buf + sizeof(ts_buf), ts);

  static constexpr std::string_view kTsPrefix = "# procsight_scrape_timestamp_ms ";
  file_.write(kTsPrefix.data(), static_cast<std::streamsize>(kTsPrefix.size()));
  file_.write(ts_buf, ptr - ts_buf);
  file_.put('\n');

  std::string body = records_to_prometheus(batch);
  file_.write(body.data(), static_cast<std::streamsize>(body.size()));
  file_.flush();
  if (!file_) {
    std::fprintf(stderr, "procsight: LogWriter: write to %s failed\n", current_path_.c_str());
    file_.close();
    current_path_.clear();
    return false;
  }
  return true;
}

size_t LogWriter::prune_old_chunks() {
  std::lock_guard<std::mutex> lk(file_mu_);
  return prune_locked();
}

size_t LogWriter::prune_locked() {
  if (retention_days_ <= 0) return 0;
  auto cutoff = std::filesystem::file_time_type::clock::now() - std::chrono::hours(24 * retention_days_);
  size_t removed = 0;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(log_dir_, ec)) {
    const auto name = entry.path().filename().string();
    if (!name.starts_with("procsight_") || entry.path().extension() != ".prom") continue;
    if (entry.path() == current_path_) continue;
    std::error_code tec;
    auto mtime = entry.last_write_time(tec);
    if (tec || mtime >= cutoff) continue;
    std::error_code rec;
    if (std::filesystem::remove(entry.path(), rec)) {
      ++removed;
    } else if (rec) {
      std::fprintf(stderr, "procsight: LogWriter: failed to remove %s: %s\n",
                   entry.path().c_str(), rec.message().c_str());
    }
  }
  if (ec) {
    std::fprintf(stderr, "procsight: LogWriter: failed to list %s: %s\n",
                 log_dir_.c_str(), ec.message().c_str());
  }
  return removed;
}

void LogWriter::run(std::stop_token st) {
  std::fprintf(stderr, "procsight: LogWriter: writing to %s/ (interval %lldms, retention %dd)\n",
               log_dir_.c_str(), static_cast<long long>(interval_.count()), retention_days_);
  prune_old_chunks();

  uint64_t last_seq = 0;
  while (!st.stop_requested()) {
    auto wake = std::chrono::steady_clock::now() + interval_;
    uint64_t seq = buffers_.seq();
    // Each tick is logged once; a cold buffer (seq 0) has nothing to log
    if (seq != 0 && seq != last_seq) {
      last_seq = seq;
      auto records = to_metric_records(buffers_.read());
      if (!write(records)) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        continue;
      }
    }
    while (!st.stop_requested() && std::chrono::steady_clock::now() < wake) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
}

std::string LogWriter::chunk_name(std::time_t t) {
  std::tm tm{};
  ::localtime_r(&t, &tm);
  char buf[64];
  std::snprintf(buf, sizeof(buf), "procsight_%04d-%02d-%02d_%02d.prom",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour);
  return buf;
}

std::filesystem::path LogWriter::chunk_path() const {
  auto now_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  return log_dir_ / chunk_name(now_t);
}

} // namespace procsight::app
