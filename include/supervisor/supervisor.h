// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file supervisor.h
 * @brief Process supervision and reboot watchdog for the kiosk
 *
 * One Supervisor per process owns every piece of supervision state: the
 * background process registry, the timed-command state, the escalation
 * state machine and the signal plumbing that feeds them. Callers (the
 * bundled daemon, the display and GPIO servers) get a reference to it.
 *
 * Wiring:
 * @code
 *   SIGCHLD --> ChildExitReactor --> ProcessRegistry lookup --+
 *   SIGALRM --> DeadlineTimer ----> TimeoutWatchdog ---------+--> RebootEscalationPolicy
 *   launch() fork failure --------------------------------------+        |
 *                                                            MessageSinks, UserPresenceQuery,
 *                                                            RebootBackend
 * @endcode
 */

#pragma once

#include "supervisor/child_exit_reactor.h"
#include "supervisor/deadline_timer.h"
#include "supervisor/event_source.h"
#include "supervisor/message_sinks.h"
#include "supervisor/proc_info.h"
#include "supervisor/process_backend.h"
#include "supervisor/process_registry.h"
#include "supervisor/reboot_policy.h"
#include "supervisor/timeout_watchdog.h"
#include "supervisor/user_presence.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kiosk {

class Config;

/**
 * @brief Typed view of the supervisor section of the config file
 */
struct SupervisorSettings {
    struct StartupCommand {
        std::string command;
        std::chrono::seconds timeout{0}; ///< 0 = default_timeout
    };

    RebootBlockingPolicy blocking_policy = RebootBlockingPolicy::AnyUsers;
    std::chrono::seconds default_timeout = TimeoutWatchdog::DEFAULT_TIMEOUT;
    std::chrono::seconds user_poll_interval = RebootEscalationPolicy::DEFAULT_POLL_INTERVAL;
    std::chrono::seconds reboot_grace = RebootEscalationPolicy::DEFAULT_GRACE_INTERVAL;
    bool boot_console = true;

    std::vector<StartupCommand> startup_commands;
    std::vector<std::string> background_commands;

    /**
     * @brief Read settings from @p config
     *
     * Invalid values are logged and replaced by their defaults; an unknown
     * blocking policy falls back to AnyUsers so a bad config never makes the
     * device reboot under a logged-in operator.
     */
    static SupervisorSettings from_config(Config& config);
};

/**
 * @brief Replaceable OS boundaries (tests inject fakes)
 *
 * A null timer means "SIGALRM timer on the supervisor's own event source".
 */
struct SupervisorDeps {
    std::unique_ptr<ProcessBackend> process;
    std::unique_ptr<UserPresenceQuery> users;
    std::unique_ptr<RebootBackend> reboot;
    std::unique_ptr<MessageSinks> sinks;
    std::unique_ptr<DeadlineTimer> timer;
};

class Supervisor {
  public:
    Supervisor(const SupervisorSettings& settings, SupervisorDeps deps);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /**
     * @brief Production wiring: fork/exec, utmp, syslog/console/stdout, real reboot
     *
     * @param dry_run Exit instead of rebooting when escalation completes
     */
    static std::unique_ptr<Supervisor> create(const SupervisorSettings& settings,
                                              bool dry_run = false);

    // --- Caller-facing operations ---

    /// @copydoc TimeoutWatchdog::run
    std::optional<std::string> run_with_timeout(const std::string& command,
                                                std::chrono::seconds timeout);
    std::optional<std::string> run_with_timeout(const std::string& command);

    /// @copydoc ProcessRegistry::launch
    pid_t launch(const std::string& command);

    /// @copydoc ProcessRegistry::terminate
    void terminate(pid_t pid);

    void terminate_all();

    /**
     * @brief Change which logins hold off a reboot
     *
     * Ignored while an escalation is in progress.
     */
    void set_reboot_blocking_policy(RebootBlockingPolicy policy);

    int blocking_user_count();

    /**
     * @brief Announce @p text on every message sink
     */
    void message(const std::string& text, bool failure = false);

    /**
     * @brief Report a fatal condition
     *
     * @return EscalationResult::Terminated (production never returns)
     */
    EscalationResult escalate(const std::string& text);

    std::vector<pid_t> child_pids(pid_t ppid) const;

    std::optional<pid_t> wait_for_child(pid_t ppid, std::chrono::seconds timeout) const;

    // --- Daemon lifecycle ---

    /**
     * @brief Run the configured startup commands, then launch background commands
     *
     * @return false if any of them escalated (only observable with test doubles)
     */
    bool start();

    /**
     * @brief Service signals until SIGTERM/SIGINT or request_stop(), then stop
     *        every tracked process
     */
    void run();

    void request_stop() {
        stop_requested_ = true;
    }

    bool stop_requested() const {
        return stop_requested_;
    }

    // --- Components (tests, advanced callers) ---

    SignalEventSource& events() {
        return *events_;
    }
    ProcessRegistry& registry() {
        return *registry_;
    }
    TimeoutWatchdog& watchdog() {
        return *watchdog_;
    }
    RebootEscalationPolicy& policy() {
        return *policy_;
    }
    ChildExitReactor& reactor() {
        return *reactor_;
    }
    ProcInfoReader& proc_info() {
        return proc_info_;
    }
    const SupervisorSettings& settings() const {
        return settings_;
    }

  private:
    SupervisorSettings settings_;

    // Declared first so it outlives every handler registered on it
    std::unique_ptr<SignalEventSource> events_;

    std::unique_ptr<ProcessBackend> process_;
    std::unique_ptr<UserPresenceQuery> users_;
    std::unique_ptr<RebootBackend> reboot_;
    std::unique_ptr<MessageSinks> sinks_;
    std::unique_ptr<DeadlineTimer> timer_;

    std::unique_ptr<RebootEscalationPolicy> policy_;
    std::unique_ptr<ProcessRegistry> registry_;
    std::unique_ptr<TimeoutWatchdog> watchdog_;
    std::unique_ptr<ChildExitReactor> reactor_;

    ProcInfoReader proc_info_;

    std::atomic<bool> stop_requested_{false};
};

} // namespace kiosk
