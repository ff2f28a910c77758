// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license
// Unit tests for the autopilot heartbeat loop

#include <catch2/catch_test_macros.hpp>

#include "autopilot/autopilot.hpp"
#include "common/mock_scan_collaborators.hpp"
#include "util/logging.hpp"

#include <asio/io_context.hpp>

#include <chrono>
#include <thread>

using namespace stratus::autopilot;
using stratus::test::MakeTestHosts;
using stratus::test::MockHostStore;
using stratus::test::MockScanWorker;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

AutopilotConfig TestConfig() {
    AutopilotConfig config;
    config.heartbeat = seconds(600);
    config.log_level = "off";
    config.scanner.batch_size = 40;
    config.scanner.threads = 3;
    config.scanner.min_interval = seconds(60);
    return config;
}

// Poll until the condition holds or the deadline passes
template <typename Pred>
bool WaitFor(Pred pred, milliseconds deadline = milliseconds(5000)) {
    auto until = std::chrono::steady_clock::now() + deadline;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > until) {
            return false;
        }
        std::this_thread::sleep_for(milliseconds(5));
    }
    return true;
}

}  // namespace

TEST_CASE("Autopilot - Start and stop", "[autopilot][unit]") {
    MockHostStore store(MakeTestHosts(10));
    MockScanWorker worker;
    AutopilotConfig config = TestConfig();
    config.log_level = "error";
    Autopilot autopilot(store, worker, config);

    REQUIRE_FALSE(autopilot.IsRunning());
    REQUIRE(autopilot.Start());
    REQUIRE(autopilot.IsRunning());

    // The configured level applies to the autopilot component
    REQUIRE(stratus::util::LogManager::GetLogger("autopilot")->level() == spdlog::level::err);
    stratus::util::LogManager::SetComponentLevel("autopilot", "off");

    // Already running
    REQUIRE_FALSE(autopilot.Start());

    autopilot.Stop();
    REQUIRE_FALSE(autopilot.IsRunning());
    REQUIRE(autopilot.scanner().IsStopped());

    // Stop is idempotent and the autopilot cannot be restarted
    autopilot.Stop();
    REQUIRE_FALSE(autopilot.Start());
}

TEST_CASE("Autopilot - Heartbeat starts a sweep", "[autopilot][unit]") {
    MockHostStore store(MakeTestHosts(100));
    MockScanWorker worker;
    AutopilotConfig config = TestConfig();
    config.heartbeat = seconds(1);
    Autopilot autopilot(store, worker, config);

    REQUIRE(autopilot.Start());
    REQUIRE(WaitFor([&]() { return autopilot.HeartbeatCount() >= 1; }));

    ScanResult result = autopilot.scanner().WaitForScan();
    REQUIRE(result.status == ScanStatus::Completed);
    REQUIRE(result.hosts_scanned == 100);
    REQUIRE(store.requests().size() == 3);

    // Further heartbeats within the scan interval do not start new sweeps
    REQUIRE(WaitFor([&]() { return autopilot.HeartbeatCount() >= 2; }));
    REQUIRE(store.requests().size() == 3);

    autopilot.Stop();
}

TEST_CASE("Autopilot - TriggerScan", "[autopilot][unit]") {
    MockHostStore store(MakeTestHosts(50));
    MockScanWorker worker;

    SECTION("Owned io_context") {
        Autopilot autopilot(store, worker, TestConfig());
        REQUIRE(autopilot.Start());

        autopilot.TriggerScan();
        REQUIRE(WaitFor([&]() { return autopilot.HeartbeatCount() == 1; }));
        REQUIRE(autopilot.scanner().WaitForScan().hosts_scanned == 50);

        autopilot.Stop();
    }

    SECTION("External io_context") {
        auto io_context = std::make_shared<asio::io_context>();
        Autopilot autopilot(store, worker, TestConfig(), io_context);
        REQUIRE(autopilot.Start());

        autopilot.TriggerScan();
        REQUIRE(autopilot.HeartbeatCount() == 0);

        // The caller drives the context
        io_context->poll();
        REQUIRE(autopilot.HeartbeatCount() == 1);
        REQUIRE(autopilot.scanner().WaitForScan().status == ScanStatus::Completed);

        autopilot.Stop();
        io_context->poll();
        REQUIRE(autopilot.HeartbeatCount() == 1);
    }

    SECTION("Queued handlers outlive the autopilot harmlessly") {
        auto io_context = std::make_shared<asio::io_context>();
        {
            Autopilot autopilot(store, worker, TestConfig(), io_context);
            REQUIRE(autopilot.Start());
            autopilot.TriggerScan();
            autopilot.TriggerScan();
        }

        // The context still holds both posted handlers and the cancelled timer wait
        REQUIRE(io_context->poll() >= 2);
        REQUIRE(store.requests().empty());
        REQUIRE(worker.scan_count() == 0);
    }

    SECTION("Ignored when not running") {
        auto io_context = std::make_shared<asio::io_context>();
        Autopilot autopilot(store, worker, TestConfig(), io_context);

        autopilot.TriggerScan();
        io_context->poll();
        REQUIRE(autopilot.HeartbeatCount() == 0);
        REQUIRE(store.requests().empty());
    }
}

TEST_CASE("Autopilot - UpdateConfig", "[autopilot][unit]") {
    MockHostStore store(MakeTestHosts(100));
    MockScanWorker worker;
    auto io_context = std::make_shared<asio::io_context>();
    Autopilot autopilot(store, worker, TestConfig(), io_context);

    REQUIRE(autopilot.hosts_config().max_downtime == DEFAULT_MAX_DOWNTIME);

    SECTION("Interrupts the running sweep") {
        REQUIRE(autopilot.Start());
        worker.Block();
        autopilot.TriggerScan();
        io_context->poll();
        REQUIRE(autopilot.scanner().IsScanning());

        HostsConfig hosts;
        hosts.max_downtime = std::chrono::hours(48);
        autopilot.UpdateConfig(hosts);
        worker.Release();

        REQUIRE(autopilot.scanner().WaitForScan().status == ScanStatus::Interrupted);
        REQUIRE(autopilot.hosts_config().max_downtime == std::chrono::hours(48));

        // The next tick restarts the sweep with the new settings
        autopilot.TriggerScan();
        io_context->poll();
        REQUIRE(autopilot.HeartbeatCount() == 2);
        ScanResult result = autopilot.scanner().WaitForScan();
        REQUIRE(result.status == ScanStatus::Completed);
        REQUIRE(result.hosts_scanned == 100);

        auto calls = store.remove_calls();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].second == std::chrono::hours(48));
        autopilot.Stop();
    }

    SECTION("Next sweep uses the new settings") {
        HostsConfig hosts;
        hosts.max_downtime = std::chrono::hours(2);
        autopilot.UpdateConfig(hosts);

        REQUIRE(autopilot.Start());
        autopilot.TriggerScan();
        io_context->poll();
        REQUIRE(autopilot.scanner().WaitForScan().status == ScanStatus::Completed);

        // 2h of downtime at a 60s interval: 120 intervals, 84 failures
        auto calls = store.remove_calls();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].first == 84);
        REQUIRE(calls[0].second == std::chrono::hours(2));
        autopilot.Stop();
    }
}
