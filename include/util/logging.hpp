// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace stratus {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Every subsystem logs through a named component logger ("bus" or
 * "autopilot") so verbosity can be tuned per component at runtime.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Only the first call performs initialization.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "stratus.log");

  // Flush and drop all loggers. Later logging calls auto-reinitialize.
  static void Shutdown();

  // Get logger for a component (default, bus, autopilot).
  // Unknown names return the default logger. Auto-initializes if needed.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a single component.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace stratus

// Convenience macros for logging
#define LOG_TRACE(...) stratus::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) stratus::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) stratus::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) stratus::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) stratus::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_BUS_TRACE(...) stratus::util::LogManager::GetLogger("bus")->trace(__VA_ARGS__)
#define LOG_BUS_DEBUG(...) stratus::util::LogManager::GetLogger("bus")->debug(__VA_ARGS__)
#define LOG_BUS_INFO(...) stratus::util::LogManager::GetLogger("bus")->info(__VA_ARGS__)
#define LOG_BUS_WARN(...) stratus::util::LogManager::GetLogger("bus")->warn(__VA_ARGS__)
#define LOG_BUS_ERROR(...) stratus::util::LogManager::GetLogger("bus")->error(__VA_ARGS__)

#define LOG_AP_TRACE(...) stratus::util::LogManager::GetLogger("autopilot")->trace(__VA_ARGS__)
#define LOG_AP_DEBUG(...) stratus::util::LogManager::GetLogger("autopilot")->debug(__VA_ARGS__)
#define LOG_AP_INFO(...) stratus::util::LogManager::GetLogger("autopilot")->info(__VA_ARGS__)
#define LOG_AP_WARN(...) stratus::util::LogManager::GetLogger("autopilot")->warn(__VA_ARGS__)
#define LOG_AP_ERROR(...) stratus::util::LogManager::GetLogger("autopilot")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// Host scans touch every host in the database on each sweep. An unreachable
// region of the network can produce thousands of identical failures per sweep,
// so failure logging triggered by remote hosts goes through a per-callsite
// token bucket (200 messages per hour).

#include "util/rate_limiter.hpp"

// Helper macro to generate callsite key from file:line
#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_WARN_RL(...)                                                                                               \
  do {                                                                                                                 \
    if (stratus::util::RateLimiter::instance().Allow(CALLSITE_KEY_, 200, std::chrono::hours(1))) {                     \
      stratus::util::LogManager::GetLogger()->warn(__VA_ARGS__);                                                       \
    }                                                                                                                  \
  } while (0)

#define LOG_AP_WARN_RL(...)                                                                                            \
  do {                                                                                                                 \
    if (stratus::util::RateLimiter::instance().Allow(CALLSITE_KEY_, 200, std::chrono::hours(1))) {                     \
      stratus::util::LogManager::GetLogger("autopilot")->warn(__VA_ARGS__);                                            \
    }                                                                                                                  \
  } while (0)

#define LOG_AP_ERROR_RL(...)                                                                                           \
  do {                                                                                                                 \
    if (stratus::util::RateLimiter::instance().Allow(CALLSITE_KEY_, 200, std::chrono::hours(1))) {                     \
      stratus::util::LogManager::GetLogger("autopilot")->error(__VA_ARGS__);                                           \
    }                                                                                                                  \
  } while (0)
