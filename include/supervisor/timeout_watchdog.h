// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file timeout_watchdog.h
 * @brief Run one command under a hard deadline, reboot if it hangs
 *
 * Used for initialization commands that are known to wedge on bad hardware
 * (display mode switches, GPIO exports). Whichever happens first wins:
 *
 * - the command completes: the deadline is disarmed and the captured output
 *   is returned
 * - the deadline fires: "Timeout (<t> secs) executing <command>" is
 *   escalated exactly once and the call never meaningfully returns
 *
 * Only one timed command may be in flight. A deadline notification that
 * arrives after the command completed is ignored; the generation counter
 * guarantees a late notification can never be attributed to a later run.
 *
 * @code
 * auto out = watchdog.run("xrandr --output HDMI-1 --auto", std::chrono::seconds(15));
 * if (!out) {
 *     return; // escalated; only reachable with test doubles
 * }
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace kiosk {

class DeadlineTimer;
class EventSource;
class ProcessBackend;
class RebootEscalationPolicy;

class TimeoutWatchdog {
  public:
    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{60};

    /**
     * @param events Serviced while the command runs (may be nullptr)
     */
    TimeoutWatchdog(ProcessBackend& backend, DeadlineTimer& timer, RebootEscalationPolicy& policy,
                    EventSource* events);

    TimeoutWatchdog(const TimeoutWatchdog&) = delete;
    TimeoutWatchdog& operator=(const TimeoutWatchdog&) = delete;

    /**
     * @brief Run @p command, escalating if it does not finish within @p timeout
     *
     * A non-zero exit status is not a failure; it is logged and the output is
     * still returned. Failing to start the command, or the command dying from
     * a signal, escalates with "Error executing <command> (<reason>)".
     *
     * @return Captured stdout, or std::nullopt if escalation ran
     * @throws WatchdogBusyError if another timed command is already in flight
     */
    std::optional<std::string> run(const std::string& command,
                                   std::chrono::seconds timeout = DEFAULT_TIMEOUT);

    bool armed() const;

    /// Command currently being timed, empty when idle
    std::string current_command() const;

  private:
    /// Deadline notification for the run identified by @p generation
    void on_deadline(uint64_t generation);

    /// Compare-and-clear: true if this call disarmed @p generation
    bool disarm(uint64_t generation);

    ProcessBackend& backend_;
    DeadlineTimer& timer_;
    RebootEscalationPolicy& policy_;
    EventSource* events_;

    mutable std::mutex mutex_;
    bool armed_ = false;
    std::string command_;
    std::chrono::seconds timeout_{0};
    uint64_t generation_ = 0;
};

} // namespace kiosk
