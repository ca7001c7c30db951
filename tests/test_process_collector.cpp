#include "minitest.hpp"
#include "collectors/ProcessCollector.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using procsight::collectors::ProcessCollector;

namespace {

fs::path make_root_proc() {
  auto root = fs::temp_directory_path() / ("procsight_test_proc_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "proc");
  return root;
}

void write_stat(const fs::path& root, uint64_t user, uint64_t idle) {
  std::ofstream(root / "proc/stat")
    << "cpu  " << user << " 0 0 " << idle << " 0 0 0 0\n"
    << "cpu0 0 0 0 0 0 0 0 0\n"
    << "cpu1 0 0 0 0 0 0 0 0\n"
    << "intr 0\n";
}

std::string stat_line(int pid, const std::string& comm, uint64_t utime, uint64_t stime, int threads) {
  return std::to_string(pid) + " (" + comm + ") S 1 " + std::to_string(pid) +
         " 0 0 -1 4194304 10 0 0 0 " + std::to_string(utime) + " " + std::to_string(stime) +
         " 0 0 20 0 " + std::to_string(threads) + " 0 12345 1000000 256\n";
}

void write_proc(const fs::path& root, int pid, const std::string& comm,
                uint64_t utime, uint64_t stime, int threads,
                uint64_t read_bytes, uint64_t write_bytes) {
  auto dir = root / "proc" / std::to_string(pid);
  fs::create_directories(dir);
  std::ofstream(dir / "stat") << stat_line(pid, comm, utime, stime, threads);
  std::ofstream(dir / "io") << "rchar: 1\nwchar: 1\nsyscr: 1\nsyscw: 1\n"
                            << "read_bytes: " << read_bytes << "\n"
                            << "write_bytes: " << write_bytes << "\n"
                            << "cancelled_write_bytes: 0\n";
}

} // namespace

TEST(process_parse_stat_line_with_parens_in_comm) {
  ProcessCollector::StatFields f;
  ASSERT_TRUE(ProcessCollector::parse_stat_line(stat_line(100, "my (odd) proc", 200, 100, 4), f));
  ASSERT_EQ(f.comm, std::string("my (odd) proc"));
  ASSERT_EQ(f.state, 'S');
  ASSERT_EQ(f.utime, 200u);
  ASSERT_EQ(f.stime, 100u);
  ASSERT_EQ(f.priority, 20);
  ASSERT_EQ(f.threads, 4);
  ASSERT_EQ(f.rss_pages, 256);

  ASSERT_TRUE(!ProcessCollector::parse_stat_line("100 no-parens S 1", f));
  ASSERT_TRUE(!ProcessCollector::parse_stat_line("100 (short) S 1 2 3", f));
}

TEST(process_parse_io) {
  uint64_t r = 0, w = 0;
  ASSERT_TRUE(ProcessCollector::parse_io("rchar: 5\nread_bytes: 4096\nwrite_bytes: 8192\n", r, w));
  ASSERT_EQ(r, 4096u);
  ASSERT_EQ(w, 8192u);
  ASSERT_TRUE(!ProcessCollector::parse_io("rchar: 5\nread_bytes: 1\n", r, w));
}

TEST(process_collector_rates_from_deltas) {
  auto root = make_root_proc();
  write_stat(root, 0, 1000);
  write_proc(root, 100, "busy", 200, 100, 4, 1000, 0);
  write_proc(root, 200, "idle", 10, 10, 1, 0, 0);
  fs::create_directories(root / "proc/self");
  setenv("PROCSIGHT_PROC_ROOT", root.c_str(), 1);

  ProcessCollector c(10);
  procsight::model::ProcessTable t;
  ASSERT_TRUE(c.sample(t));
  ASSERT_EQ(t.total_processes, 2u);
  for (const auto& s : t.processes) ASSERT_NEAR(s.cpu, 0.0, 0);

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  // 1000 jiffies elapsed across 2 cpus; pid 100 used 250 of them
  write_stat(root, 600, 1400);
  write_proc(root, 100, "busy", 400, 150, 4, 51000, 0);
  write_proc(root, 200, "idle", 10, 10, 1, 0, 0);
  ASSERT_TRUE(c.sample(t));
  ASSERT_EQ(t.processes.size(), 2u);
  const auto& busy = t.processes[0];
  ASSERT_EQ(busy.pid, 100);
  ASSERT_EQ(busy.name, std::string("busy"));
  ASSERT_NEAR(busy.cpu, 50.0, 1e-9);
  ASSERT_EQ(busy.threads, 4);
  ASSERT_EQ(busy.priority, 20);
  ASSERT_NEAR(busy.memory, 256.0 * ::getpagesize() / (1024.0 * 1024.0), 1e-9);
  ASSERT_TRUE(busy.io_read > 0.0);
  ASSERT_NEAR(busy.io_write, 0.0, 0);
  ASSERT_TRUE(busy.timestamp_ms > 0);
  ASSERT_EQ(t.processes[1].pid, 200);
  ASSERT_NEAR(t.processes[1].cpu, 0.0, 0);

  unsetenv("PROCSIGHT_PROC_ROOT");
  fs::remove_all(root);
}

TEST(process_collector_keeps_busiest_k) {
  auto root = make_root_proc();
  write_stat(root, 0, 1000);
  for (int pid = 10; pid < 15; ++pid) write_proc(root, pid, "w" + std::to_string(pid), 0, 0, 1, 0, 0);
  setenv("PROCSIGHT_PROC_ROOT", root.c_str(), 1);

  ProcessCollector c(2);
  procsight::model::ProcessTable t;
  ASSERT_TRUE(c.sample(t));
  write_stat(root, 1000, 1000);
  for (int pid = 10; pid < 15; ++pid)
    write_proc(root, pid, "w" + std::to_string(pid), static_cast<uint64_t>(pid) * 10, 0, 1, 0, 0);
  ASSERT_TRUE(c.sample(t));
  ASSERT_EQ(t.total_processes, 5u);
  ASSERT_EQ(t.processes.size(), 2u);
  ASSERT_EQ(t.processes[0].pid, 14);
  ASSERT_EQ(t.processes[1].pid, 13);

  unsetenv("PROCSIGHT_PROC_ROOT");
  fs::remove_all(root);
}

TEST(process_collector_fails_without_proc_stat) {
  auto root = make_root_proc();
  setenv("PROCSIGHT_PROC_ROOT", root.c_str(), 1);
  ProcessCollector c;
  procsight::model::ProcessTable t;
  ASSERT_TRUE(!c.sample(t));
  unsetenv("PROCSIGHT_PROC_ROOT");
  fs::remove_all(root);
}
