// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#include "autopilot/config.hpp"

#include "util/logging.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace stratus {
namespace autopilot {

json AutopilotConfigToJson(const AutopilotConfig& config) {
  const ScannerOptions& s = config.scanner;
  return json{
      {"heartbeat_sec", config.heartbeat.count()},
      {"log_level", config.log_level},
      {"hosts", {{"max_downtime_hours", std::chrono::duration_cast<std::chrono::hours>(config.hosts.max_downtime).count()}}},
      {"scanner",
       {{"batch_size", s.batch_size},
        {"threads", s.threads},
        {"interval_sec", s.min_interval.count()},
        {"timeout_interval_sec", s.timeout_min_interval.count()},
        {"min_timeout_ms", s.timeout_min_timeout.count()},
        {"tracker",
         {{"min_data_points", s.tracker.min_data_points},
          {"num_data_points", s.tracker.num_data_points},
          {"percentile", s.tracker.percentile},
          {"default_timeout_ms", s.tracker.default_timeout.count()}}}}},
  };
}

namespace {

// Counts are read signed: nlohmann converts -1 to SIZE_MAX without complaint
size_t ReadCount(const json& obj, const char* key, size_t current, size_t max) {
  int64_t value = obj.value(key, static_cast<int64_t>(current));
  if (value < 0 || static_cast<uint64_t>(value) > max) {
    throw std::invalid_argument(std::string(key) + " must be between 0 and " + std::to_string(max));
  }
  return static_cast<size_t>(value);
}

int64_t ReadNonNegative(const json& obj, const char* key, int64_t current) {
  int64_t value = obj.value(key, current);
  if (value < 0) {
    throw std::invalid_argument(std::string(key) + " must not be negative");
  }
  return value;
}

}  // namespace

std::optional<AutopilotConfig> AutopilotConfigFromJson(const json& j) {
  if (!j.is_object()) {
    LOG_AP_ERROR("AutopilotConfig: expected a JSON object");
    return std::nullopt;
  }

  AutopilotConfig config;
  try {
    config.heartbeat = std::chrono::seconds(j.value("heartbeat_sec", config.heartbeat.count()));
    config.log_level = j.value("log_level", config.log_level);

    if (j.contains("hosts")) {
      const json& hosts = j.at("hosts");
      auto default_hours = std::chrono::duration_cast<std::chrono::hours>(config.hosts.max_downtime).count();
      config.hosts.max_downtime = std::chrono::hours(ReadNonNegative(hosts, "max_downtime_hours", default_hours));
    }

    if (j.contains("scanner")) {
      const json& scanner = j.at("scanner");
      ScannerOptions& s = config.scanner;
      s.batch_size = ReadCount(scanner, "batch_size", s.batch_size, MAX_SCAN_BATCH_SIZE);
      s.threads = ReadCount(scanner, "threads", s.threads, MAX_SCAN_THREADS);
      s.min_interval = std::chrono::seconds(ReadNonNegative(scanner, "interval_sec", s.min_interval.count()));
      s.timeout_min_interval =
          std::chrono::seconds(ReadNonNegative(scanner, "timeout_interval_sec", s.timeout_min_interval.count()));
      s.timeout_min_timeout =
          std::chrono::milliseconds(ReadNonNegative(scanner, "min_timeout_ms", s.timeout_min_timeout.count()));

      if (scanner.contains("tracker")) {
        const json& tracker = scanner.at("tracker");
        s.tracker.min_data_points =
            ReadCount(tracker, "min_data_points", s.tracker.min_data_points, MAX_TRACKER_NUM_DATA_POINTS);
        s.tracker.num_data_points =
            ReadCount(tracker, "num_data_points", s.tracker.num_data_points, MAX_TRACKER_NUM_DATA_POINTS);
        s.tracker.percentile = tracker.value("percentile", s.tracker.percentile);
        s.tracker.default_timeout = std::chrono::milliseconds(
            ReadNonNegative(tracker, "default_timeout_ms", s.tracker.default_timeout.count()));
      }
    }
  } catch (const json::exception& e) {
    LOG_AP_ERROR("AutopilotConfig: invalid value: {}", e.what());
    return std::nullopt;
  } catch (const std::invalid_argument& e) {
    LOG_AP_ERROR("AutopilotConfig: invalid value: {}", e.what());
    return std::nullopt;
  }

  if (config.heartbeat.count() <= 0 || config.scanner.batch_size == 0 || config.scanner.threads == 0 ||
      config.scanner.tracker.num_data_points == 0) {
    LOG_AP_ERROR("AutopilotConfig: heartbeat, batch_size, threads and num_data_points must be positive");
    return std::nullopt;
  }
  if (!(config.scanner.tracker.percentile > 0.0 && config.scanner.tracker.percentile <= 100.0)) {
    LOG_AP_ERROR("AutopilotConfig: percentile must be in (0, 100]");
    return std::nullopt;
  }
  return config;
}

std::optional<AutopilotConfig> LoadAutopilotConfig(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    LOG_AP_INFO("AutopilotConfig: no config at {}, using defaults", path);
    return AutopilotConfig{};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_AP_ERROR("AutopilotConfig: cannot open {}", path);
    return std::nullopt;
  }

  try {
    json j;
    file >> j;
    return AutopilotConfigFromJson(j);
  } catch (const std::exception& e) {
    LOG_AP_ERROR("AutopilotConfig: failed to parse {}: {}", path, e.what());
    return std::nullopt;
  }
}

}  // namespace autopilot
}  // namespace stratus
