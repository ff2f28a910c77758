// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace stratus {
namespace util {

// Current unix time in seconds (mock time if set).
int64_t GetTime();

// Monotonic clock used for expiry and interval checks. While mock time is
// active it advances with the mock clock, anchored at the first mocked call.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time in unix seconds. 0 disables mocking.
void SetMockTime(int64_t time);

// RAII mock time for tests: sets mock time on construction, disables it on
// destruction.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(0); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
};

}  // namespace util
}  // namespace stratus
