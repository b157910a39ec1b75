// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <mutex>

namespace chaincraft {
namespace util {

// 0 means mock time is disabled (use real time)
static std::atomic<int64_t> g_mock_time{0};

// Steady clock anchor captured when mocking is first activated
static std::mutex g_anchor_mutex;
static bool g_anchor_set = false;
static int64_t g_anchor_mock = 0;
static std::chrono::steady_clock::time_point g_anchor_real;

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }

  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(g_anchor_mutex);
  if (!g_anchor_set) {
    g_anchor_set = true;
    g_anchor_mock = mock;
    g_anchor_real = std::chrono::steady_clock::now();
  }
  return g_anchor_real + std::chrono::seconds(mock - g_anchor_mock);
}

void SetMockTime(int64_t time) {
  std::lock_guard<std::mutex> lock(g_anchor_mutex);
  g_mock_time.store(time, std::memory_order_relaxed);

  if (time == 0) {
    g_anchor_set = false;
  } else if (!g_anchor_set) {
    g_anchor_set = true;
    g_anchor_mock = time;
    g_anchor_real = std::chrono::steady_clock::now();
  }
}

int64_t GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

} // namespace util
} // namespace chaincraft
