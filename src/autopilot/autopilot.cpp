// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#include "autopilot/autopilot.hpp"

#include "util/logging.hpp"

#include <asio/post.hpp>

namespace stratus {
namespace autopilot {

Autopilot::Autopilot(HostStore& host_store, ScanWorker& scan_worker, const AutopilotConfig& config,
                     std::shared_ptr<asio::io_context> external_io_context)
    : config_(config),
      scanner_(host_store, scan_worker, config.scanner),
      io_context_(external_io_context ? external_io_context : std::make_shared<asio::io_context>()),
      external_io_context_(external_io_context != nullptr),
      handler_guard_(std::make_shared<HandlerGuard>()),
      hosts_(config.hosts) {
  LOG_AP_TRACE("Autopilot initialized (heartbeat {}s, external_io_context: {})", config_.heartbeat.count(),
               external_io_context_ ? "yes" : "no");
}

Autopilot::~Autopilot() {
  // Waits for a handler that is running right now
  {
    std::lock_guard<std::mutex> lock(handler_guard_->mutex);
    handler_guard_->alive = false;
  }
  Stop();
}

bool Autopilot::Start() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }
  if (scanner_.IsStopped()) {
    LOG_AP_ERROR("Autopilot: cannot restart after Stop()");
    return false;
  }

  util::LogManager::SetComponentLevel("autopilot", config_.log_level);

  running_.store(true, std::memory_order_release);
  heartbeat_timer_ = std::make_unique<asio::steady_timer>(*io_context_);

  if (!external_io_context_) {
    // Keep the context alive between timer expirations
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        asio::make_work_guard(*io_context_));
    io_thread_ = std::thread([this]() { io_context_->run(); });
  }

  LOG_AP_INFO("Autopilot started");
  ScheduleNextHeartbeat();
  return true;
}

void Autopilot::Stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  LOG_AP_INFO("Autopilot stopping...");

  // Cancel pending timer callbacks
  if (heartbeat_timer_) {
    heartbeat_timer_->cancel();
  }

  // Stop the scanner before the io thread; a heartbeat may be inside TryPerformHostScan
  scanner_.Stop();

  if (!external_io_context_) {
    if (work_guard_) {
      work_guard_.reset();
    }
    io_context_->stop();
    if (io_thread_.joinable()) {
      io_thread_.join();
    }
    io_context_->restart();
    heartbeat_timer_.reset();
  }

  LOG_AP_INFO("Autopilot stopped");
}

void Autopilot::UpdateConfig(const HostsConfig& hosts) {
  {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    hosts_ = hosts;
  }
  scanner_.InterruptScan();
}

HostsConfig Autopilot::hosts_config() const {
  std::lock_guard<std::mutex> lock(hosts_mutex_);
  return hosts_;
}

void Autopilot::TriggerScan() {
  asio::post(*io_context_, [this, guard = handler_guard_]() { OnHandler(guard, false); });
}

void Autopilot::OnHandler(const std::shared_ptr<HandlerGuard>& guard, bool reschedule) {
  std::lock_guard<std::mutex> lock(guard->mutex);
  if (!guard->alive || !running_.load(std::memory_order_acquire)) {
    return;
  }
  RunHeartbeat();
  if (reschedule) {
    ScheduleNextHeartbeat();
  }
}

void Autopilot::RunHeartbeat() {
  if (scanner_.TryPerformHostScan(hosts_config())) {
    LOG_AP_DEBUG("Autopilot: heartbeat started a host scan");
  }
  // A counted tick has already made its scan attempt
  heartbeats_.fetch_add(1, std::memory_order_release);
}

void Autopilot::ScheduleNextHeartbeat() {
  if (!running_.load(std::memory_order_acquire) || !heartbeat_timer_) {
    return;
  }

  heartbeat_timer_->expires_after(config_.heartbeat);
  heartbeat_timer_->async_wait([this, guard = handler_guard_](const asio::error_code& ec) {
    if (!ec) {
      OnHandler(guard, true);
    }
  });
}

}  // namespace autopilot
}  // namespace stratus
