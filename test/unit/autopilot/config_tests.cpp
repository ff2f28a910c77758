// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license
// Unit tests for autopilot configuration loading

#include <catch2/catch_test_macros.hpp>

#include "autopilot/config.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

using namespace stratus::autopilot;
using json = nlohmann::json;

// Test fixture owning a scratch directory for config files
class ConfigTestFixture {
public:
    std::string test_dir;

    ConfigTestFixture() {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        test_dir = "/tmp/stratus_config_test_" + std::to_string(now);
        std::filesystem::create_directory(test_dir);
    }

    ~ConfigTestFixture() { std::filesystem::remove_all(test_dir); }

    std::string Write(const std::string& name, const std::string& contents) const {
        std::string path = test_dir + "/" + name;
        std::ofstream file(path);
        file << contents;
        return path;
    }
};

TEST_CASE("AutopilotConfig - Defaults", "[autopilot][config][unit]") {
    AutopilotConfig config;

    REQUIRE(config.heartbeat == std::chrono::minutes(10));
    REQUIRE(config.log_level == "info");
    REQUIRE(config.hosts.max_downtime == std::chrono::hours(24 * 14));
    REQUIRE(config.scanner.batch_size == 1000);
    REQUIRE(config.scanner.threads == 100);
    REQUIRE(config.scanner.min_interval == std::chrono::hours(24));
    REQUIRE(config.scanner.timeout_min_interval == std::chrono::minutes(10));
    REQUIRE(config.scanner.timeout_min_timeout == std::chrono::seconds(10));
    REQUIRE(config.scanner.tracker.min_data_points == 25);
    REQUIRE(config.scanner.tracker.num_data_points == 1000);
    REQUIRE(config.scanner.tracker.percentile == 99.0);
}

TEST_CASE("AutopilotConfig - JSON conversion", "[autopilot][config][unit]") {
    SECTION("Defaults survive a round trip") {
        json j = AutopilotConfigToJson(AutopilotConfig{});
        REQUIRE(j["heartbeat_sec"] == 600);
        REQUIRE(j["hosts"]["max_downtime_hours"] == 336);
        REQUIRE(j["scanner"]["interval_sec"] == 86400);

        auto config = AutopilotConfigFromJson(j);
        REQUIRE(config.has_value());
        REQUIRE(AutopilotConfigToJson(*config) == j);
    }

    SECTION("Empty object yields defaults") {
        auto config = AutopilotConfigFromJson(json::object());
        REQUIRE(config.has_value());
        REQUIRE(config->scanner.batch_size == DEFAULT_SCAN_BATCH_SIZE);
        REQUIRE(config->hosts.max_downtime == DEFAULT_MAX_DOWNTIME);
    }

    SECTION("Partial documents override only the given keys") {
        json j = {
            {"log_level", "debug"},
            {"hosts", {{"max_downtime_hours", 48}}},
            {"scanner", {{"threads", 8}, {"tracker", {{"percentile", 95.0}}}}},
        };
        auto config = AutopilotConfigFromJson(j);
        REQUIRE(config.has_value());
        REQUIRE(config->log_level == "debug");
        REQUIRE(config->hosts.max_downtime == std::chrono::hours(48));
        REQUIRE(config->scanner.threads == 8);
        REQUIRE(config->scanner.batch_size == DEFAULT_SCAN_BATCH_SIZE);
        REQUIRE(config->scanner.tracker.percentile == 95.0);
        REQUIRE(config->scanner.tracker.num_data_points == DEFAULT_TRACKER_NUM_DATA_POINTS);
        REQUIRE(config->heartbeat == DEFAULT_HEARTBEAT);
    }

    SECTION("Zero max downtime is allowed") {
        auto config = AutopilotConfigFromJson(json{{"hosts", {{"max_downtime_hours", 0}}}});
        REQUIRE(config.has_value());
        REQUIRE(config->hosts.max_downtime.count() == 0);
    }

    SECTION("Rejects non-objects") {
        REQUIRE_FALSE(AutopilotConfigFromJson(json::array({1, 2, 3})).has_value());
        REQUIRE_FALSE(AutopilotConfigFromJson(json("config")).has_value());
    }

    SECTION("Rejects wrongly typed values") {
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"heartbeat_sec", "ten minutes"}}).has_value());
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"scanner", {{"threads", "many"}}}}).has_value());
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"hosts", 42}}).has_value());
    }

    SECTION("Rejects non-positive heartbeat, batch size or thread count") {
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"heartbeat_sec", 0}}).has_value());
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"heartbeat_sec", -5}}).has_value());
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"scanner", {{"batch_size", 0}}}}).has_value());
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"scanner", {{"threads", 0}}}}).has_value());
    }
}

TEST_CASE("AutopilotConfig - Out of range values", "[autopilot][config][unit]") {
    SECTION("Negative counts are rejected instead of wrapping") {
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"scanner", {{"threads", -1}}}}).has_value());
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"scanner", {{"batch_size", -40}}}}).has_value());
        REQUIRE_FALSE(
            AutopilotConfigFromJson(json{{"scanner", {{"tracker", {{"num_data_points", -1}}}}}}).has_value());
        REQUIRE_FALSE(
            AutopilotConfigFromJson(json{{"scanner", {{"tracker", {{"min_data_points", -25}}}}}}).has_value());
    }

    SECTION("Counts above the limits are rejected") {
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"scanner", {{"threads", MAX_SCAN_THREADS + 1}}}}).has_value());
        REQUIRE_FALSE(
            AutopilotConfigFromJson(json{{"scanner", {{"batch_size", MAX_SCAN_BATCH_SIZE + 1}}}}).has_value());
        REQUIRE_FALSE(AutopilotConfigFromJson(
                          json{{"scanner", {{"tracker", {{"num_data_points", MAX_TRACKER_NUM_DATA_POINTS + 1}}}}}})
                          .has_value());

        auto config = AutopilotConfigFromJson(json{{"scanner", {{"threads", MAX_SCAN_THREADS}}}});
        REQUIRE(config.has_value());
        REQUIRE(config->scanner.threads == MAX_SCAN_THREADS);
    }

    SECTION("Negative durations are rejected") {
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"hosts", {{"max_downtime_hours", -1}}}}).has_value());
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"scanner", {{"interval_sec", -60}}}}).has_value());
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"scanner", {{"min_timeout_ms", -1}}}}).has_value());
    }

    SECTION("Percentile outside (0, 100] is rejected") {
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"scanner", {{"tracker", {{"percentile", 0}}}}}}).has_value());
        REQUIRE_FALSE(AutopilotConfigFromJson(json{{"scanner", {{"tracker", {{"percentile", 150}}}}}}).has_value());
    }

    SECTION("Negative thread count in a file") {
        ConfigTestFixture fixture;
        auto path = fixture.Write("negative.json", R"({ "scanner": { "threads": -1 } })");
        REQUIRE_FALSE(LoadAutopilotConfig(path).has_value());
    }
}

TEST_CASE("AutopilotConfig - Loading from disk", "[autopilot][config][unit]") {
    ConfigTestFixture fixture;

    SECTION("Missing file yields defaults") {
        auto config = LoadAutopilotConfig(fixture.test_dir + "/missing.json");
        REQUIRE(config.has_value());
        REQUIRE(config->heartbeat == DEFAULT_HEARTBEAT);
    }

    SECTION("Valid file") {
        auto path = fixture.Write("autopilot.json", R"({
            "heartbeat_sec": 30,
            "scanner": { "batch_size": 250, "interval_sec": 3600 }
        })");
        auto config = LoadAutopilotConfig(path);
        REQUIRE(config.has_value());
        REQUIRE(config->heartbeat == std::chrono::seconds(30));
        REQUIRE(config->scanner.batch_size == 250);
        REQUIRE(config->scanner.min_interval == std::chrono::hours(1));
    }

    SECTION("Malformed file") {
        auto path = fixture.Write("broken.json", "{ \"heartbeat_sec\": 30,");
        REQUIRE_FALSE(LoadAutopilotConfig(path).has_value());
    }

    SECTION("Invalid values in a well-formed file") {
        auto path = fixture.Write("invalid.json", R"({ "scanner": { "threads": 0 } })");
        REQUIRE_FALSE(LoadAutopilotConfig(path).has_value());
    }
}
