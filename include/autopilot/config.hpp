// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#pragma once

#include "autopilot/timeout_tracker.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace stratus {
namespace autopilot {

// Default configuration constants
static constexpr std::chrono::seconds DEFAULT_HEARTBEAT{10 * 60};
static constexpr std::chrono::seconds DEFAULT_MAX_DOWNTIME{14 * 24 * 60 * 60};
static constexpr size_t DEFAULT_SCAN_BATCH_SIZE{1000};
static constexpr size_t DEFAULT_SCAN_THREADS{100};
static constexpr std::chrono::seconds DEFAULT_SCAN_MIN_INTERVAL{24 * 60 * 60};
static constexpr std::chrono::seconds DEFAULT_TIMEOUT_MIN_INTERVAL{10 * 60};
static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT_MIN_TIMEOUT{10000};

// Upper bounds accepted from configuration
static constexpr size_t MAX_SCAN_BATCH_SIZE{100000};
static constexpr size_t MAX_SCAN_THREADS{10000};

// Host policy settings handed to every scan attempt
struct HostsConfig {
  std::chrono::seconds max_downtime{DEFAULT_MAX_DOWNTIME};  // 0 disables offline host removal
};

// Fixed scanner parameters
struct ScannerOptions {
  size_t batch_size{DEFAULT_SCAN_BATCH_SIZE};  // hosts per page, also the work queue capacity
  size_t threads{DEFAULT_SCAN_THREADS};        // concurrent scans
  std::chrono::seconds min_interval{DEFAULT_SCAN_MIN_INTERVAL};  // between sweep starts, and scan cadence
  std::chrono::seconds timeout_min_interval{DEFAULT_TIMEOUT_MIN_INTERVAL};  // between timeout refreshes
  std::chrono::milliseconds timeout_min_timeout{DEFAULT_TIMEOUT_MIN_TIMEOUT};  // lower bound on scan timeouts
  TimeoutTrackerOptions tracker;
};

struct AutopilotConfig {
  std::chrono::seconds heartbeat{DEFAULT_HEARTBEAT};  // autopilot loop period
  std::string log_level{"info"};
  HostsConfig hosts;
  ScannerOptions scanner;
};

// JSON layout:
// {
//   "heartbeat_sec": 600, "log_level": "info",
//   "hosts": { "max_downtime_hours": 336 },
//   "scanner": { "batch_size": 1000, "threads": 100, "interval_sec": 86400,
//                "timeout_interval_sec": 600, "min_timeout_ms": 10000,
//                "tracker": { "min_data_points": 25, "num_data_points": 1000,
//                             "percentile": 99, "default_timeout_ms": 10000 } }
// }
// Missing keys keep their defaults.
nlohmann::json AutopilotConfigToJson(const AutopilotConfig& config);

// Returns nullopt (and logs) if the document is malformed, has wrongly typed
// values, negative counts or durations, or counts above the MAX_* limits.
std::optional<AutopilotConfig> AutopilotConfigFromJson(const nlohmann::json& j);

// Load a config file. A missing file yields the defaults; an unreadable or
// malformed one yields nullopt.
std::optional<AutopilotConfig> LoadAutopilotConfig(const std::string& path);

}  // namespace autopilot
}  // namespace stratus
