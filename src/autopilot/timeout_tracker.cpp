// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#include "autopilot/timeout_tracker.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <cmath>

namespace stratus {
namespace autopilot {

namespace {

TimeoutTracker::Options Sanitize(TimeoutTracker::Options options) {
  options.num_data_points = std::clamp<size_t>(options.num_data_points, 1, MAX_TRACKER_NUM_DATA_POINTS);
  if (!(options.percentile > 0.0)) {
    options.percentile = 1.0;
  } else if (options.percentile > 100.0) {
    options.percentile = 100.0;
  }
  return options;
}

}  // namespace

TimeoutTracker::TimeoutTracker(const Options& options) : options_(Sanitize(options)) {
  timings_.reserve(options_.num_data_points);
}

void TimeoutTracker::AddDataPoint(std::chrono::milliseconds latency) {
  if (latency.count() <= 0) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (timings_.size() < options_.num_data_points) {
    timings_.push_back(latency);
    return;
  }

  // Window full: overwrite the oldest sample
  timings_[next_] = latency;
  next_ = (next_ + 1) % timings_.size();
}

std::chrono::milliseconds TimeoutTracker::Timeout() const {
  std::vector<std::chrono::milliseconds> sorted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timings_.empty() || timings_.size() < options_.min_data_points) {
      return options_.default_timeout;
    }
    sorted = timings_;
  }

  std::sort(sorted.begin(), sorted.end());

  // Nearest rank: smallest sample with at least `percentile` percent of the
  // window at or below it
  double rank = std::ceil(options_.percentile / 100.0 * static_cast<double>(sorted.size()));
  size_t index = rank < 1.0 ? 0 : static_cast<size_t>(rank) - 1;
  index = std::min(index, sorted.size() - 1);

  LOG_AP_TRACE("TimeoutTracker: p{} of {} samples = {}ms", options_.percentile, sorted.size(), sorted[index].count());
  return sorted[index];
}

size_t TimeoutTracker::Count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timings_.size();
}

}  // namespace autopilot
}  // namespace stratus
