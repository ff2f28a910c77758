// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#include "autopilot/downtime_policy.hpp"

namespace stratus {
namespace autopilot {

uint64_t MinRecentScanFailures(std::chrono::seconds scan_interval, std::chrono::seconds max_downtime) {
  if (scan_interval.count() <= 0 || max_downtime.count() <= 0) {
    return 0;
  }

  auto missed_scans = static_cast<uint64_t>(max_downtime.count() / scan_interval.count());

  // ceil(0.7 * n) == n - floor(0.3 * n), split so 3 * n cannot overflow
  return missed_scans - 3 * (missed_scans / 10) - (3 * (missed_scans % 10)) / 10;
}

}  // namespace autopilot
}  // namespace stratus
