// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#pragma once

/*
 Scanner collaborators

 HostStore — the host database (owned by the bus)
 ScanWorker — performs the actual host scan RPC (owned by a worker)

 Both are called concurrently from the scanner's worker threads and must be
 thread-safe.
*/

#include "types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stratus {
namespace autopilot {

struct HostAddress {
  std::string net_address;
  PublicKey public_key;
};

struct ScanResponse {
  std::chrono::milliseconds ping{0};  // round trip of the scan, 0 if unknown
  std::string error;                  // empty on success

  bool Succeeded() const { return error.empty(); }
};

class HostStore {
public:
  virtual ~HostStore() = default;

  // Page of hosts whose last scan happened before `last_scan_before` (unix
  // seconds). Paging must be stable for the duration of one sweep.
  // Throws on failure.
  virtual std::vector<HostAddress> HostsForScanning(int64_t last_scan_before, size_t offset, size_t limit) = 0;

  // Record the outcome of a scan so the store can maintain the host's
  // recent failure counter and uptime.
  virtual void RecordScanOutcome(const PublicKey& host_key, bool success) = 0;

  // Remove hosts that failed at least `min_recent_scan_failures` scans in a
  // row and have been offline for at least `max_downtime`. Returns the number
  // of hosts removed. Throws on failure.
  virtual uint64_t RemoveOfflineHosts(uint64_t min_recent_scan_failures, std::chrono::seconds max_downtime) = 0;
};

class ScanWorker {
public:
  virtual ~ScanWorker() = default;

  // Scan a host, giving up after `timeout`. Host-level failures are reported
  // in ScanResponse::error; an exception is treated the same way.
  virtual ScanResponse ScanHost(const PublicKey& host_key, const std::string& net_address,
                                std::chrono::milliseconds timeout) = 0;
};

}  // namespace autopilot
}  // namespace stratus
