// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor/timeout_watchdog.h"

#include "supervisor/deadline_timer.h"
#include "supervisor/process_backend.h"
#include "supervisor/reboot_policy.h"
#include "supervisor/supervisor_errors.h"

#include <spdlog/spdlog.h>

namespace kiosk {

TimeoutWatchdog::TimeoutWatchdog(ProcessBackend& backend, DeadlineTimer& timer,
                                 RebootEscalationPolicy& policy, EventSource* events)
    : backend_(backend), timer_(timer), policy_(policy), events_(events) {}

std::optional<std::string> TimeoutWatchdog::run(const std::string& command,
                                                std::chrono::seconds timeout) {
    if (timeout.count() <= 0) {
        spdlog::warn("[Watchdog] Timeout {}s for '{}' is not positive, using 1s", timeout.count(),
                     command);
        timeout = std::chrono::seconds(1);
    }

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (armed_) {
            spdlog::error("[Watchdog] Rejecting '{}': '{}' is still running", command, command_);
            throw WatchdogBusyError(command_, command);
        }
        armed_ = true;
        command_ = command;
        timeout_ = timeout;
        generation = ++generation_;
    }

    spdlog::debug("[Watchdog] Running '{}' with {}s timeout", command, timeout.count());
    if (!timer_.arm(timeout, [this, generation]() { on_deadline(generation); })) {
        // Without a deadline a hung command would go unnoticed, so it is not run
        disarm(generation);
        policy_.escalate("Error executing " + command + " (cannot arm deadline timer)");
        return std::nullopt;
    }

    CommandOutcome outcome;
    try {
        outcome = backend_.run_captured(command, events_);
    } catch (...) {
        if (disarm(generation)) {
            timer_.cancel();
        }
        throw;
    }

    if (!disarm(generation)) {
        // The deadline won and has already escalated
        spdlog::debug("[Watchdog] '{}' finished after its deadline fired", command);
        return std::nullopt;
    }
    timer_.cancel();

    if (!outcome.completed_normally()) {
        policy_.escalate("Error executing " + command + " (" + outcome.error + ")");
        return std::nullopt;
    }

    if (outcome.exit_code != 0) {
        spdlog::warn("[Watchdog] '{}' exited with code {}", command, outcome.exit_code);
    } else {
        spdlog::debug("[Watchdog] '{}' completed", command);
    }
    return outcome.output;
}

void TimeoutWatchdog::on_deadline(uint64_t generation) {
    std::string command;
    std::chrono::seconds timeout;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!armed_ || generation != generation_) {
            spdlog::debug("[Watchdog] Ignoring stale deadline (generation {})", generation);
            return;
        }
        armed_ = false;
        command = command_;
        timeout = timeout_;
        command_.clear();
    }

    spdlog::error("[Watchdog] '{}' exceeded {}s", command, timeout.count());
    policy_.escalate("Timeout (" + std::to_string(timeout.count()) + " secs) executing " + command);
}

bool TimeoutWatchdog::disarm(uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!armed_ || generation != generation_) {
        return false;
    }
    armed_ = false;
    command_.clear();
    return true;
}

bool TimeoutWatchdog::armed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_;
}

std::string TimeoutWatchdog::current_command() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return command_;
}

} // namespace kiosk
