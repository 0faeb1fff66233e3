// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>

namespace kiosk {

class ProcessBackend;
class ProcessRegistry;
class RebootEscalationPolicy;
class TimeoutWatchdog;

/**
 * @brief Classifies every child termination as expected or unexpected
 *
 * Runs on each SIGCHLD dispatch. Notifications coalesce, so one invocation
 * drains every reapable child. A child the registry still tracks was never
 * asked to stop: its death is unexpected and escalates. Anything else (the
 * watchdog's helper, or a process terminate() already removed) is expected.
 */
class ChildExitReactor {
  public:
    ChildExitReactor(ProcessBackend& backend, ProcessRegistry& registry,
                     const TimeoutWatchdog& watchdog, RebootEscalationPolicy& policy);

    ChildExitReactor(const ChildExitReactor&) = delete;
    ChildExitReactor& operator=(const ChildExitReactor&) = delete;

    /**
     * @brief Reap and classify until nothing is reapable
     *
     * @return Number of children reaped
     */
    size_t on_child_exit();

  private:
    ProcessBackend& backend_;
    ProcessRegistry& registry_;
    const TimeoutWatchdog& watchdog_;
    RebootEscalationPolicy& policy_;
};

} // namespace kiosk
