// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#include "autopilot/scanner.hpp"

#include "autopilot/downtime_policy.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <exception>
#include <vector>

namespace stratus {
namespace autopilot {

namespace {

ScannerOptions Sanitize(ScannerOptions options) {
  options.batch_size = std::clamp<size_t>(options.batch_size, 1, MAX_SCAN_BATCH_SIZE);
  options.threads = std::clamp<size_t>(options.threads, 1, MAX_SCAN_THREADS);
  return options;
}

}  // namespace

std::string ScanStatusToString(ScanStatus status) {
  switch (status) {
  case ScanStatus::NotRun:
    return "not run";
  case ScanStatus::Completed:
    return "completed";
  case ScanStatus::Interrupted:
    return "interrupted";
  case ScanStatus::Stopped:
    return "stopped";
  case ScanStatus::ListingFailed:
    return "listing failed";
  }
  return "unknown";
}

Scanner::Scanner(HostStore& host_store, ScanWorker& scan_worker, const ScannerOptions& options)
    : host_store_(host_store),
      scan_worker_(scan_worker),
      options_(Sanitize(options)),
      tracker_(options_.tracker),
      timeout_(std::max(options_.tracker.default_timeout, options_.timeout_min_timeout)) {}

Scanner::~Scanner() {
  Stop();
}

bool Scanner::TryPerformHostScan(const HostsConfig& config) {
  std::lock_guard<std::mutex> thread_lock(thread_mutex_);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (IsStopped() || scanning_) {
      return false;
    }

    auto now = util::GetSteadyTime();
    if (scanning_last_start_ && now - *scanning_last_start_ < options_.min_interval) {
      LOG_AP_TRACE("Scanner: skipping host scan, last one started {}s ago",
                   std::chrono::duration_cast<std::chrono::seconds>(now - *scanning_last_start_).count());
      return false;
    }

    scanning_last_start_ = now;
    scanning_ = true;
    interrupted_.store(false, std::memory_order_release);
  }

  // The previous sweep thread has cleared scanning_ and is about to exit
  if (scan_thread_.joinable()) {
    scan_thread_.join();
  }

  LOG_AP_INFO("Scanner: starting host scan (batch size {}, {} threads)", options_.batch_size, options_.threads);
  scan_thread_ = std::thread(&Scanner::RunScan, this, config);
  return true;
}

bool Scanner::IsScanning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return scanning_;
}

ScanResult Scanner::WaitForScan() {
  std::unique_lock<std::mutex> lock(mutex_);
  scan_done_cv_.wait(lock, [this]() { return !scanning_; });
  return last_result_;
}

ScanResult Scanner::LastScanResult() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_result_;
}

void Scanner::InterruptScan() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!scanning_) {
    return;
  }

  LOG_AP_INFO("Scanner: interrupting host scan");
  interrupted_.store(true, std::memory_order_release);
  // The sweep did not finish, so the next attempt must not be debounced
  scanning_last_start_.reset();
  if (active_queue_) {
    active_queue_->Abort();
  }
}

void Scanner::Stop() {
  if (!stopped_.exchange(true, std::memory_order_acq_rel)) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_queue_) {
      active_queue_->Abort();
    }
  }

  std::lock_guard<std::mutex> thread_lock(thread_mutex_);
  if (scan_thread_.joinable()) {
    scan_thread_.join();
  }
}

std::chrono::milliseconds Scanner::CurrentTimeout() {
  auto now = util::GetSteadyTime();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timeout_last_update_ && now - *timeout_last_update_ < options_.timeout_min_interval) {
      return timeout_;
    }
    timeout_last_update_ = now;
  }

  auto updated = std::max(tracker_.Timeout(), options_.timeout_min_timeout);

  std::lock_guard<std::mutex> lock(mutex_);
  if (updated != timeout_) {
    LOG_AP_DEBUG("Scanner: scan timeout changed from {}ms to {}ms", timeout_.count(), updated.count());
  }
  timeout_ = updated;
  return updated;
}

void Scanner::TestOnlyResetLastScanStart() {
  std::lock_guard<std::mutex> lock(mutex_);
  scanning_last_start_.reset();
}

bool Scanner::ShouldAbort() const {
  return stopped_.load(std::memory_order_acquire) || interrupted_.load(std::memory_order_acquire);
}

void Scanner::RunScan(HostsConfig config) {
  auto started = util::GetSteadyTime();
  ScanResult result;
  SweepCounters counters;

  auto queue = std::make_shared<HostQueue>(options_.batch_size);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_queue_ = queue;
  }

  std::vector<std::thread> workers;
  workers.reserve(options_.threads);
  for (size_t i = 0; i < options_.threads; ++i) {
    workers.emplace_back([this, &queue, &counters]() { ScanHosts(*queue, counters); });
  }

  // Only hosts that were not scanned within the last interval are eligible
  const int64_t last_scan_before = util::GetTime() - options_.min_interval.count();

  size_t offset = 0;
  bool exhausted = false;
  bool listing_failed = false;
  while (!exhausted && !ShouldAbort()) {
    std::vector<HostAddress> hosts;
    try {
      ++result.pages;
      hosts = host_store_.HostsForScanning(last_scan_before, offset, options_.batch_size);
    } catch (const std::exception& e) {
      LOG_AP_ERROR("Scanner: could not get hosts for scanning (offset {}): {}", offset, e.what());
      result.error = e.what();
      listing_failed = true;
      break;
    }

    if (hosts.empty()) {
      break;
    }
    if (hosts.size() < options_.batch_size) {
      exhausted = true;
    }
    offset += hosts.size();

    for (auto& host : hosts) {
      if (!queue->Push(std::move(host))) {
        break;
      }
    }
  }

  // Drain barrier: let the scan threads finish what was queued
  queue->Close();
  for (auto& worker : workers) {
    worker.join();
  }

  result.hosts_scanned = counters.scanned.load();
  result.hosts_failed = counters.failed.load();
  if (listing_failed) {
    result.status = ScanStatus::ListingFailed;
  } else if (stopped_.load(std::memory_order_acquire)) {
    result.status = ScanStatus::Stopped;
  } else if (interrupted_.load(std::memory_order_acquire)) {
    result.status = ScanStatus::Interrupted;
  } else {
    result.status = ScanStatus::Completed;
    RemoveOfflineHosts(config, result);
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(util::GetSteadyTime() - started);
  LOG_AP_INFO("Scanner: host scan {} after {}ms: {} hosts scanned, {} failed, {} removed",
              ScanStatusToString(result.status), elapsed.count(), result.hosts_scanned, result.hosts_failed,
              result.hosts_removed);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_queue_.reset();
    last_result_ = result;
    scanning_ = false;
  }
  scan_done_cv_.notify_all();
}

void Scanner::ScanHosts(HostQueue& queue, SweepCounters& counters) {
  while (auto request = queue.Pop()) {
    if (ShouldAbort()) {
      break;
    }

    ScanResponse response;
    try {
      response = scan_worker_.ScanHost(request->public_key, request->net_address, CurrentTimeout());
    } catch (const std::exception& e) {
      response.error = e.what();
    }

    const bool success = response.Succeeded();
    if (success) {
      tracker_.AddDataPoint(response.ping);
    } else {
      counters.failed.fetch_add(1, std::memory_order_relaxed);
      LOG_AP_WARN_RL("Scanner: scan of host {} ({}) failed: {}", request->public_key.GetHex(), request->net_address,
                     response.error);
    }
    counters.scanned.fetch_add(1, std::memory_order_relaxed);

    try {
      host_store_.RecordScanOutcome(request->public_key, success);
    } catch (const std::exception& e) {
      LOG_AP_ERROR_RL("Scanner: failed to record scan of host {}: {}", request->public_key.GetHex(), e.what());
    }
  }
}

void Scanner::RemoveOfflineHosts(const HostsConfig& config, ScanResult& result) {
  if (config.max_downtime.count() <= 0) {
    return;
  }

  const uint64_t min_failures = MinRecentScanFailures(options_.min_interval, config.max_downtime);
  try {
    result.hosts_removed = host_store_.RemoveOfflineHosts(min_failures, config.max_downtime);
    if (result.hosts_removed > 0) {
      LOG_AP_INFO("Scanner: removed {} offline hosts (min recent failures {}, max downtime {}h)",
                  result.hosts_removed, min_failures,
                  std::chrono::duration_cast<std::chrono::hours>(config.max_downtime).count());
    }
  } catch (const std::exception& e) {
    LOG_AP_ERROR("Scanner: failed to remove offline hosts: {}", e.what());
    result.error = e.what();
  }
}

}  // namespace autopilot
}  // namespace stratus
