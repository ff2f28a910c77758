// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#pragma once

#include "autopilot/config.hpp"
#include "autopilot/scanner.hpp"
#include "autopilot/scanner_interfaces.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

namespace stratus {
namespace autopilot {

// Autopilot - periodic driver for host maintenance
//
// Runs a steady_timer on an io_context and, on every heartbeat, asks the
// scanner to start a sweep. The scanner decides on its own whether enough time
// has passed since the last one, so heartbeats can be much shorter than the
// scan interval.
//
// With an external io_context the caller runs the context; Start() then only
// arms the timer. Handlers still queued on that context when the Autopilot is
// destroyed become no-ops.
class Autopilot {
public:
  Autopilot(HostStore& host_store, ScanWorker& scan_worker, const AutopilotConfig& config = AutopilotConfig{},
            std::shared_ptr<asio::io_context> external_io_context = nullptr);
  ~Autopilot();

  // Non-copyable
  Autopilot(const Autopilot&) = delete;
  Autopilot& operator=(const Autopilot&) = delete;

  // Returns false if already running.
  bool Start();

  // Cancel the timer, stop the scanner and join threads. Idempotent.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Replace the host settings used by upcoming heartbeats. A running sweep is
  // interrupted so the next one picks up the new settings.
  void UpdateConfig(const HostsConfig& hosts);

  HostsConfig hosts_config() const;

  // Attempt a scan now instead of waiting for the next heartbeat.
  void TriggerScan();

  // Number of heartbeats handled so far
  uint64_t HeartbeatCount() const { return heartbeats_.load(std::memory_order_acquire); }

  Scanner& scanner() { return scanner_; }

private:
  // Shared with queued handlers so they can tell whether the Autopilot still exists
  struct HandlerGuard {
    std::mutex mutex;
    bool alive{true};
  };

  void ScheduleNextHeartbeat();
  void RunHeartbeat();
  void OnHandler(const std::shared_ptr<HandlerGuard>& guard, bool reschedule);

  const AutopilotConfig config_;
  Scanner scanner_;

  std::shared_ptr<asio::io_context> io_context_;
  const bool external_io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::unique_ptr<asio::steady_timer> heartbeat_timer_;
  std::thread io_thread_;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> heartbeats_{0};
  std::shared_ptr<HandlerGuard> handler_guard_;
  std::mutex start_stop_mutex_;

  mutable std::mutex hosts_mutex_;
  HostsConfig hosts_;
};

}  // namespace autopilot
}  // namespace stratus
