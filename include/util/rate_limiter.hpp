// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace stratus {
namespace util {

/**
 * RateLimiter - token bucket per logging callsite
 *
 * Each key starts with a full bucket of `burst` tokens that refills linearly
 * over `period`. The number of buckets is capped; when the cap is reached the
 * table is cleared, which at worst lets a burst through again.
 */
class RateLimiter {
public:
  static constexpr size_t MAX_BUCKETS = 4096;

  // Returns true if a message for `key` may be emitted now.
  bool Allow(const std::string& key, int burst, std::chrono::seconds period);

  // Drop all buckets (tests).
  void Reset();

  static RateLimiter& instance();

private:
  struct Bucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last_refill{};
  };

  std::mutex mutex_;
  std::unordered_map<std::string, Bucket> buckets_;
};

}  // namespace util
}  // namespace stratus
