// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#ifndef STRATUS_AUTOPILOT_DOWNTIME_POLICY_HPP
#define STRATUS_AUTOPILOT_DOWNTIME_POLICY_HPP

#include <chrono>
#include <cstdint>

namespace stratus {
namespace autopilot {

/**
 * Number of consecutive recent scan failures a host needs before it may be
 * removed for being offline, given how often hosts are scanned and how much
 * downtime is tolerated.
 *
 * A host that is down for max_downtime misses floor(max_downtime / scan_interval)
 * scans. We require 70% of those (rounded up) to have failed, leaving room for
 * scans that were skipped or delayed:
 *
 *   scan interval 1d:  2 weeks -> 10,  1 week -> 5,  1 day -> 1,  1 hour -> 0
 *
 * Returns 0 when less than one scan interval of downtime is tolerated, or when
 * either argument is non-positive.
 */
uint64_t MinRecentScanFailures(std::chrono::seconds scan_interval, std::chrono::seconds max_downtime);

}  // namespace autopilot
}  // namespace stratus

#endif  // STRATUS_AUTOPILOT_DOWNTIME_POLICY_HPP
