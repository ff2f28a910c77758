// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#pragma once

/*
 Scanner — periodic sweep over the host database

 Purpose
 - Keep host settings, uptime and failure counters fresh by scanning every
   host once per scan interval
 - Learn how long a healthy scan takes and size scan timeouts from it
 - Remove hosts that have been unreachable for longer than tolerated

 Sweep
 1. TryPerformHostScan() is a no-op while a sweep is running or less than
    min_interval has passed since the previous sweep started. Otherwise it
    marks the scanner busy and runs the sweep on a background thread.
 2. The sweep thread pages through HostStore::HostsForScanning() and feeds
    hosts into a bounded queue drained by `threads` scan threads.
 3. A page shorter than batch_size ends paging; the queue is closed and the
    scan threads are joined.
 4. If the sweep ran to completion, offline hosts are removed using the
    threshold from MinRecentScanFailures().

 Cancellation
 - InterruptScan() and Stop() end paging and drop queued hosts. Scans that
   already started are left to finish within their timeout.
 - An interrupted sweep does not count towards min_interval.

 Threading
 - mutex_ guards the busy flag, timestamps, cached timeout and last result
 - thread_mutex_ serializes starting and joining the sweep thread
*/

#include "autopilot/config.hpp"
#include "autopilot/scanner_interfaces.hpp"
#include "autopilot/timeout_tracker.hpp"
#include "util/bounded_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace stratus {
namespace autopilot {

enum class ScanStatus {
  NotRun,
  Completed,
  Interrupted,
  Stopped,
  ListingFailed  // HostsForScanning threw, sweep ended early
};

std::string ScanStatusToString(ScanStatus status);

struct ScanResult {
  ScanStatus status{ScanStatus::NotRun};
  size_t pages{0};             // HostsForScanning calls made
  uint64_t hosts_scanned{0};
  uint64_t hosts_failed{0};
  uint64_t hosts_removed{0};
  std::string error;
};

class Scanner {
public:
  Scanner(HostStore& host_store, ScanWorker& scan_worker, const ScannerOptions& options = ScannerOptions{});
  ~Scanner();

  // Non-copyable
  Scanner(const Scanner&) = delete;
  Scanner& operator=(const Scanner&) = delete;

  // Start a sweep unless one is running, the last one started less than
  // min_interval ago, or the scanner is stopped. Returns true if started.
  bool TryPerformHostScan(const HostsConfig& config);

  bool IsScanning() const;

  // Block until no sweep is running, then return the result of the last one.
  ScanResult WaitForScan();

  ScanResult LastScanResult() const;

  // Abort the running sweep (if any). The scanner stays usable and the next
  // TryPerformHostScan() starts a new sweep without waiting for min_interval.
  void InterruptScan();

  // Abort the running sweep and refuse new ones. Joins the sweep thread.
  void Stop();

  bool IsStopped() const { return stopped_.load(std::memory_order_acquire); }

  // Timeout handed to the next scan: the tracker's estimate, refreshed at most
  // every timeout_min_interval and never below timeout_min_timeout.
  std::chrono::milliseconds CurrentTimeout();

  TimeoutTracker& tracker() { return tracker_; }
  const ScannerOptions& options() const { return options_; }

  // Test-only: forget when the last sweep started
  void TestOnlyResetLastScanStart();

private:
  using HostQueue = util::BoundedQueue<HostAddress>;

  struct SweepCounters {
    std::atomic<uint64_t> scanned{0};
    std::atomic<uint64_t> failed{0};
  };

  void RunScan(HostsConfig config);
  void ScanHosts(HostQueue& queue, SweepCounters& counters);
  void RemoveOfflineHosts(const HostsConfig& config, ScanResult& result);
  bool ShouldAbort() const;

  HostStore& host_store_;
  ScanWorker& scan_worker_;
  const ScannerOptions options_;
  TimeoutTracker tracker_;

  std::atomic<bool> stopped_{false};
  std::atomic<bool> interrupted_{false};

  mutable std::mutex mutex_;
  std::condition_variable scan_done_cv_;
  bool scanning_{false};
  std::optional<std::chrono::steady_clock::time_point> scanning_last_start_;
  std::chrono::milliseconds timeout_;
  std::optional<std::chrono::steady_clock::time_point> timeout_last_update_;
  std::shared_ptr<HostQueue> active_queue_;
  ScanResult last_result_;

  std::mutex thread_mutex_;
  std::thread scan_thread_;
};

}  // namespace autopilot
}  // namespace stratus
