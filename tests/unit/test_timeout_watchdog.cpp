// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor/supervisor_errors.h"

#include "../supervisor_test_fixture.h"

#include <catch2/catch_test_macros.hpp>

using namespace std::chrono_literals;

// ============================================================================
// Command completes before the deadline
// ============================================================================

TEST_CASE_METHOD(SupervisorTestFixture, "Watchdog: completed command returns its output",
                 "[supervisor][watchdog]") {
    process().next_outcome.output = "HDMI-1 connected\n";

    auto out = watchdog().run("xrandr --query", 15s);

    REQUIRE(out.has_value());
    REQUIRE(*out == "HDMI-1 connected\n");
    REQUIRE(process().run_commands == std::vector<std::string>{"xrandr --query"});
    REQUIRE(timer().arm_count == 1);
    REQUIRE(timer().last_timeout == 15s);
    REQUIRE_FALSE(timer().armed());
    REQUIRE_FALSE(watchdog().armed());
    REQUIRE(reboot().reboot_count == 0);
    REQUIRE(capture().messages().empty());
}

TEST_CASE_METHOD(SupervisorTestFixture, "Watchdog: default timeout is 60 seconds",
                 "[supervisor][watchdog]") {
    REQUIRE(watchdog().run("true").has_value());
    REQUIRE(timer().last_timeout == 60s);
}

TEST_CASE_METHOD(SupervisorTestFixture, "Watchdog: non-zero exit is returned, not escalated",
                 "[supervisor][watchdog]") {
    process().next_outcome.exit_code = 3;
    process().next_outcome.output = "partial";

    auto out = watchdog().run("gpio export 17", 5s);

    REQUIRE(out.has_value());
    REQUIRE(*out == "partial");
    REQUIRE(reboot().reboot_count == 0);
}

TEST_CASE_METHOD(SupervisorTestFixture, "Watchdog: non-positive timeout is clamped to 1s",
                 "[supervisor][watchdog]") {
    REQUIRE(watchdog().run("true", 0s).has_value());
    REQUIRE(timer().last_timeout == 1s);
}

TEST_CASE_METHOD(SupervisorTestFixture, "Watchdog: deadline after completion is a no-op",
                 "[supervisor][watchdog]") {
    DeadlineTimer::ExpiryCallback late;
    process().during_run = [&]() { late = timer().callback(); };

    REQUIRE(watchdog().run("xset -dpms", 10s).has_value());
    REQUIRE(late);

    // A deadline notification that was already in flight arrives now
    late();

    REQUIRE(reboot().reboot_count == 0);
    REQUIRE_FALSE(capture().contains("Timeout"));
}

TEST_CASE_METHOD(SupervisorTestFixture, "Watchdog: stale deadline cannot fire a later run",
                 "[supervisor][watchdog]") {
    DeadlineTimer::ExpiryCallback first_run_deadline;
    process().during_run = [&]() { first_run_deadline = timer().callback(); };
    REQUIRE(watchdog().run("first", 10s).has_value());

    // Second run is in flight when the first run's notification shows up
    process().during_run = [&]() { first_run_deadline(); };
    REQUIRE(watchdog().run("second", 10s).has_value());

    REQUIRE(reboot().reboot_count == 0);
    REQUIRE_FALSE(capture().contains("Timeout"));
}

// ============================================================================
// Deadline fires first
// ============================================================================

TEST_CASE_METHOD(SupervisorTestFixture, "Watchdog: deadline escalates exactly once",
                 "[supervisor][watchdog]") {
    process().during_run = [&]() { REQUIRE(timer().fire()); };

    auto out = watchdog().run("tvservice -p", 7s);

    REQUIRE_FALSE(out.has_value());
    REQUIRE(reboot().reboot_count == 1);
    REQUIRE(capture().count_containing("Timeout (7 secs) executing tvservice -p") == 1);
    REQUIRE_FALSE(watchdog().armed());

    // Completion after the deadline must not escalate a second time
    REQUIRE_FALSE(capture().contains("Error executing"));
}

TEST_CASE_METHOD(SupervisorTestFixture, "Watchdog: timeout message precedes the reboot",
                 "[supervisor][watchdog]") {
    int reboot_at_message_count = -1;
    reboot().on_reboot = [&]() {
        reboot_at_message_count = static_cast<int>(capture().messages().size());
    };
    process().during_run = [&]() { timer().fire(); };

    REQUIRE_FALSE(watchdog().run("hang", 3s).has_value());

    int timeout_index = capture().index_of("Timeout (3 secs) executing hang");
    REQUIRE(timeout_index >= 0);
    REQUIRE(timeout_index < reboot_at_message_count);
}

// ============================================================================
// Start failure and abnormal exit
// ============================================================================

TEST_CASE_METHOD(SupervisorTestFixture, "Watchdog: start failure escalates",
                 "[supervisor][watchdog]") {
    process().next_outcome = CommandOutcome{};
    process().next_outcome.error = "fork failed: Cannot allocate memory";

    auto out = watchdog().run("fbset -depth 16", 5s);

    REQUIRE_FALSE(out.has_value());
    REQUIRE(reboot().reboot_count == 1);
    REQUIRE(capture().contains(
        "Error executing fbset -depth 16 (fork failed: Cannot allocate memory)"));
    REQUIRE_FALSE(timer().armed());
}

TEST_CASE_METHOD(SupervisorTestFixture, "Watchdog: command killed by a signal escalates",
                 "[supervisor][watchdog]") {
    process().next_outcome.term_signal = 11;
    process().next_outcome.error = "killed by signal 11 (Segmentation fault)";

    auto out = watchdog().run("crashy", 5s);

    REQUIRE_FALSE(out.has_value());
    REQUIRE(capture().contains("Error executing crashy (killed by signal 11"));
    REQUIRE_FALSE(capture().contains("Timeout"));
}

TEST_CASE_METHOD(SupervisorTestFixture, "Watchdog: deadline that cannot be armed escalates",
                 "[supervisor][watchdog]") {
    timer().fail_arm = true;

    auto out = watchdog().run("modprobe -r brcmfmac", 10s);

    REQUIRE_FALSE(out.has_value());
    REQUIRE(process().run_commands.empty());
    REQUIRE(capture().contains(
        "Error executing modprobe -r brcmfmac (cannot arm deadline timer)"));
    REQUIRE(reboot().reboot_count == 1);
    REQUIRE_FALSE(watchdog().armed());

    // The watchdog is free again once the escalation returned
    timer().fail_arm = false;
    REQUIRE(watchdog().run("true", 5s).has_value());
}

// ============================================================================
// Misuse
// ============================================================================

TEST_CASE_METHOD(SupervisorTestFixture, "Watchdog: second call while armed is rejected",
                 "[supervisor][watchdog]") {
    bool rejected = false;
    process().during_run = [&]() {
        REQUIRE(watchdog().armed());
        REQUIRE(watchdog().current_command() == "outer");
        try {
            watchdog().run("inner", 5s);
        } catch (const WatchdogBusyError& e) {
            rejected = true;
            REQUIRE(std::string(e.what()).find("outer") != std::string::npos);
        }
    };

    auto out = watchdog().run("outer", 5s);

    REQUIRE(rejected);
    REQUIRE(out.has_value());
    REQUIRE(process().run_commands == std::vector<std::string>{"outer"});
    REQUIRE(reboot().reboot_count == 0);
}
