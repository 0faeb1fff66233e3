// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor/supervisor_errors.h"

#include "../supervisor_test_fixture.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

// ============================================================================
// launch()
// ============================================================================

TEST_CASE_METHOD(SupervisorTestFixture, "Registry: launch tracks and announces the process",
                 "[supervisor][registry]") {
    pid_t pid = registry().launch("chromium --kiosk http://localhost");

    REQUIRE(pid == MockProcessBackend::FIRST_PID);
    REQUIRE(registry().is_tracked(pid));
    REQUIRE(registry().size() == 1);

    auto entry = registry().lookup(pid);
    REQUIRE(entry.has_value());
    REQUIRE(entry->command == "chromium --kiosk http://localhost");
    REQUIRE_FALSE(entry->expected_exit);

    REQUIRE(capture().contains("BackgroundCommand chromium --kiosk http://localhost (PID 1000)"));
    REQUIRE(reboot().reboot_count == 0);
}

TEST_CASE_METHOD(SupervisorTestFixture, "Registry: every launch gets its own entry",
                 "[supervisor][registry]") {
    pid_t a = registry().launch("viewer a");
    pid_t b = registry().launch("viewer b");

    REQUIRE(a != b);
    REQUIRE(registry().size() == 2);
    auto pids = registry().tracked_pids();
    REQUIRE(std::find(pids.begin(), pids.end(), a) != pids.end());
    REQUIRE(std::find(pids.begin(), pids.end(), b) != pids.end());
}

TEST_CASE_METHOD(SupervisorTestFixture, "Registry: fork failure escalates",
                 "[supervisor][registry]") {
    process().fail_spawn = true;

    pid_t pid = registry().launch("feh /srv/slides");

    REQUIRE(pid == ProcessRegistry::ESCALATED_PID);
    REQUIRE(registry().size() == 0);
    REQUIRE(capture().contains(
        "Cannot start background command feh /srv/slides (Resource temporarily unavailable)"));
    REQUIRE(reboot().reboot_count == 1);
}

// ============================================================================
// terminate()
// ============================================================================

TEST_CASE_METHOD(SupervisorTestFixture, "Registry: terminate removes then kills",
                 "[supervisor][registry]") {
    pid_t pid = registry().launch("viewer");
    capture().clear();

    registry().terminate(pid);

    REQUIRE_FALSE(registry().is_tracked(pid));
    REQUIRE(process().killed == std::vector<pid_t>{pid});
    REQUIRE(capture().contains("Stopping viewer (PID 1000)"));
}

TEST_CASE_METHOD(SupervisorTestFixture, "Registry: terminate of an untracked PID throws",
                 "[supervisor][registry]") {
    registry().launch("viewer");

    REQUIRE_THROWS_AS(registry().terminate(4242), NotTrackedError);
    REQUIRE(process().killed.empty());
    REQUIRE(registry().size() == 1);
    REQUIRE(reboot().reboot_count == 0);

    try {
        registry().terminate(4242);
    } catch (const NotTrackedError& e) {
        REQUIRE(e.pid() == 4242);
        REQUIRE(std::string(e.what()) == "PID 4242 is not a background command");
    }
}

TEST_CASE_METHOD(SupervisorTestFixture, "Registry: terminating twice throws the second time",
                 "[supervisor][registry]") {
    pid_t pid = registry().launch("viewer");
    registry().terminate(pid);

    REQUIRE_THROWS_AS(registry().terminate(pid), NotTrackedError);
    REQUIRE(process().killed.size() == 1);
}

// ============================================================================
// terminate_all()
// ============================================================================

TEST_CASE_METHOD(SupervisorTestFixture, "Registry: terminate_all kills every process",
                 "[supervisor][registry]") {
    std::vector<pid_t> launched;
    for (int i = 0; i < 4; ++i) {
        launched.push_back(registry().launch("viewer " + std::to_string(i)));
    }

    registry().terminate_all();

    REQUIRE(registry().size() == 0);
    REQUIRE(process().killed.size() == 4);
    std::vector<pid_t> killed = process().killed;
    std::sort(killed.begin(), killed.end());
    REQUIRE(killed == launched);
    REQUIRE(capture().count_containing("Stopping viewer") == 4);
}

TEST_CASE_METHOD(SupervisorTestFixture, "Registry: terminate_all with nothing tracked",
                 "[supervisor][registry]") {
    registry().terminate_all();
    REQUIRE(process().killed.empty());
}

TEST_CASE_METHOD(SupervisorTestFixture, "Registry: forget drops an entry once",
                 "[supervisor][registry]") {
    pid_t pid = registry().launch("viewer");
    REQUIRE(registry().forget(pid));
    REQUIRE_FALSE(registry().forget(pid));
    REQUIRE_FALSE(registry().lookup(pid).has_value());
}
