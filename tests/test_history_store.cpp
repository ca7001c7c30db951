#include "minitest.hpp"
#include "app/HistoryStore.hpp"
#include <algorithm>
#include <thread>
#include <vector>

using procsight::app::HistoryStore;
using procsight::model::Sample;

static Sample at(int32_t pid, double cpu) {
  Sample s;
  s.pid = pid;
  s.cpu = cpu;
  return s;
}

TEST(history_bounded_fifo) {
  HistoryStore h(3);
  for (int i = 1; i <= 5; ++i) h.append(10, at(10, i));
  ASSERT_EQ(h.size(10), 3u);
  auto all = h.all(10);
  ASSERT_EQ(all.size(), 3u);
  ASSERT_NEAR(all.front().cpu, 3.0, 0);
  ASSERT_NEAR(all.back().cpu, 5.0, 0);
}

TEST(history_window_takes_most_recent) {
  HistoryStore h(10);
  for (int i = 0; i < 6; ++i) h.append(1, at(1, i));
  auto w = h.window(1, 2);
  ASSERT_EQ(w.size(), 2u);
  ASSERT_NEAR(w[0].cpu, 4.0, 0);
  ASSERT_NEAR(w[1].cpu, 5.0, 0);
  ASSERT_EQ(h.window(1, 50).size(), 6u);
  ASSERT_TRUE(h.window(99, 5).empty());
  ASSERT_EQ(h.size(99), 0u);
}

TEST(history_retain_and_erase) {
  HistoryStore h;
  h.append(1, at(1, 1));
  h.append(2, at(2, 1));
  h.append(3, at(3, 1));
  ASSERT_EQ(h.retain({1, 3}), 1u);
  auto pids = h.pids();
  std::sort(pids.begin(), pids.end());
  ASSERT_EQ(pids.size(), 2u);
  ASSERT_EQ(pids[0], 1);
  ASSERT_EQ(pids[1], 3);
  h.erase(1);
  ASSERT_EQ(h.size(1), 0u);
  ASSERT_EQ(h.capacity(), 100u);
}

TEST(history_concurrent_appends_stay_bounded) {
  HistoryStore h(50);
  {
    std::vector<std::jthread> pool;
    for (int t = 0; t < 4; ++t)
      pool.emplace_back([&h, t]{
        for (int i = 0; i < 500; ++i) h.append(t % 2, at(t % 2, i));
      });
  }
  ASSERT_EQ(h.size(0), 50u);
  ASSERT_EQ(h.size(1), 50u);
}
