// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace stratus {
namespace util {

bool RateLimiter::Allow(const std::string& key, int burst, std::chrono::seconds period) {
  if (burst <= 0) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  auto now = GetSteadyTime();
  auto it = buckets_.find(key);
  if (it == buckets_.end()) {
    if (buckets_.size() >= MAX_BUCKETS) {
      buckets_.clear();
    }
    it = buckets_.emplace(key, Bucket{static_cast<double>(burst), now}).first;
  }

  Bucket& bucket = it->second;
  if (period.count() > 0 && now > bucket.last_refill) {
    double elapsed = std::chrono::duration<double>(now - bucket.last_refill).count();
    double rate = static_cast<double>(burst) / static_cast<double>(period.count());
    bucket.tokens = std::min(bucket.tokens + rate * elapsed, static_cast<double>(burst));
    bucket.last_refill = now;
  }

  if (bucket.tokens >= 1.0) {
    bucket.tokens -= 1.0;
    return true;
  }
  return false;
}

void RateLimiter::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.clear();
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter instance;
  return instance;
}

}  // namespace util
}  // namespace stratus
