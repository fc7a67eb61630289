// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace stakenode {
namespace util {

// 0 means mock time is disabled
static std::atomic<int64_t> g_mock_time{0};

// Anchor pairing the first mock time with a real steady time point, so the
// simulated steady clock moves forward by exactly the mock delta
static std::mutex g_steady_mutex;
static bool g_steady_anchored = false;
static int64_t g_mock_anchor = 0;
static std::chrono::steady_clock::time_point g_steady_anchor;

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

  std::lock_guard<std::mutex> lock(g_steady_mutex);
  if (!g_steady_anchored) {
    g_steady_anchored = true;
    g_mock_anchor = mock;
    g_steady_anchor = std::chrono::steady_clock::now();
  }
  return g_steady_anchor + std::chrono::seconds(mock - g_mock_anchor);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
  if (time == 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_steady_anchored = false;
  }
}

int64_t GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

std::string FormatTime(int64_t unix_time) {
  std::time_t t = static_cast<std::time_t>(unix_time);
  std::tm tm_utc{};
  if (gmtime_r(&t, &tm_utc) == nullptr) {
    return "invalid";
  }

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S UTC");
  return oss.str();
}

} // namespace util
} // namespace stakenode
