// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <mutex>

namespace stratus {
namespace util {

// 0 means mock time is disabled
static std::atomic<int64_t> g_mock_time{0};

// Anchor pairing the real steady clock with the first mocked timestamp.
static std::mutex g_steady_mutex;
static std::chrono::steady_clock::time_point g_steady_anchor;
static int64_t g_mock_anchor{0};
static bool g_anchor_set{false};

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(g_steady_mutex);
  if (!g_anchor_set) {
    g_steady_anchor = std::chrono::steady_clock::now();
    g_mock_anchor = mock;
    g_anchor_set = true;
  }
  return g_steady_anchor + std::chrono::seconds(mock - g_mock_anchor);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);

  // Keep the anchor while mock time moves so offsets stay continuous
  if (time == 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_anchor_set = false;
  }
}

}  // namespace util
}  // namespace stratus
