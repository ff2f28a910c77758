// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace stratus {
namespace autopilot {

// Defaults for the scan timeout estimator
static constexpr size_t DEFAULT_TRACKER_MIN_DATA_POINTS = 25;
static constexpr size_t DEFAULT_TRACKER_NUM_DATA_POINTS = 1000;
static constexpr double DEFAULT_TRACKER_PERCENTILE = 99.0;
static constexpr std::chrono::milliseconds DEFAULT_TRACKER_TIMEOUT{10000};
static constexpr size_t MAX_TRACKER_NUM_DATA_POINTS = 1000000;

struct TimeoutTrackerOptions {
  size_t min_data_points{DEFAULT_TRACKER_MIN_DATA_POINTS};  // below this, Timeout() returns default_timeout
  size_t num_data_points{DEFAULT_TRACKER_NUM_DATA_POINTS};  // window size
  double percentile{DEFAULT_TRACKER_PERCENTILE};            // in (0, 100]
  std::chrono::milliseconds default_timeout{DEFAULT_TRACKER_TIMEOUT};
};

// Sliding window percentile estimator over the latencies of successful host
// scans. The window is a ring buffer; the percentile is computed by sorting a
// copy on every read, which is fine for a window of a few thousand samples.
class TimeoutTracker {
public:
  using Options = TimeoutTrackerOptions;

  explicit TimeoutTracker(const Options& options = TimeoutTrackerOptions{});

  // Record the latency of a successful scan. Non-positive values are ignored.
  void AddDataPoint(std::chrono::milliseconds latency);

  // Nearest-rank percentile of the window, or the default timeout while the
  // window holds fewer than min_data_points samples.
  std::chrono::milliseconds Timeout() const;

  size_t Count() const;

  const Options& options() const { return options_; }

private:
  const Options options_;

  mutable std::mutex mutex_;
  std::vector<std::chrono::milliseconds> timings_;  // ring buffer, grows to num_data_points
  size_t next_{0};                                  // slot overwritten next once full
};

}  // namespace autopilot
}  // namespace stratus
