// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor/child_exit_reactor.h"

#include "supervisor/process_backend.h"
#include "supervisor/process_registry.h"
#include "supervisor/reboot_policy.h"
#include "supervisor/timeout_watchdog.h"

#include <spdlog/spdlog.h>

namespace kiosk {

ChildExitReactor::ChildExitReactor(ProcessBackend& backend, ProcessRegistry& registry,
                                   const TimeoutWatchdog& watchdog,
                                   RebootEscalationPolicy& policy)
    : backend_(backend), registry_(registry), watchdog_(watchdog), policy_(policy) {}

size_t ChildExitReactor::on_child_exit() {
    size_t reaped = 0;

    while (std::optional<ChildExit> exit = backend_.reap()) {
        ++reaped;

        // Stopped processes leave the registry before the kill, so any PID
        // still tracked here died on its own
        std::optional<TrackedProcess> process = registry_.lookup(exit->pid);
        if (!process) {
            if (exit->pid == backend_.current_helper()) {
                spdlog::debug("[Reactor] Command complete: {}", watchdog_.current_command());
            } else {
                spdlog::debug("[Reactor] PID {} exited ({}), not a background command",
                              exit->pid, describe_exit(*exit));
            }
            continue;
        }

        spdlog::error("[Reactor] Background command '{}' (PID {}) died: {}", process->command,
                      exit->pid, describe_exit(*exit));
        policy_.escalate("Reboot due to command exit: " + process->command + " (PID " +
                         std::to_string(exit->pid) + ")");

        // Escalation returned (test doubles): handle this exit only once
        registry_.forget(exit->pid);
    }

    return reaped;
}

} // namespace kiosk
