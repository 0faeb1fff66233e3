// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor/reboot_policy.h"

#include "supervisor/event_source.h"
#include "supervisor/message_sinks.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/reboot.h>
#include <thread>
#include <unistd.h>

namespace kiosk {

// =============================================================================
// Reboot backends
// =============================================================================

namespace {

/**
 * @brief Real reboot: systemd first, then the reboot binary, then the syscall
 *
 * Non-root daemons go through sudo; the kiosk image grants the service user
 * passwordless sudo for the reboot commands.
 */
class SystemRebootBackend : public RebootBackend {
  public:
    void reboot() override {
        spdlog::info("[Reboot] Initiating system restart");
        spdlog::default_logger()->flush();

        sync();

        // The reboot command must not start with our blocked signals or a
        // pending watchdog deadline
        reset_signal_state_for_exec();

        bool root = geteuid() == 0;
        std::error_code ec;
        if (std::filesystem::exists("/run/systemd/system", ec)) {
            spdlog::info("[Reboot] Using systemctl reboot");
            spdlog::default_logger()->flush();
            if (root) {
                execlp("systemctl", "systemctl", "reboot", static_cast<char*>(nullptr));
            } else {
                execlp("sudo", "sudo", "systemctl", "reboot", static_cast<char*>(nullptr));
            }
            spdlog::error("[Reboot] exec systemctl failed: {}", strerror(errno));
        }

        spdlog::info("[Reboot] Using /sbin/reboot");
        spdlog::default_logger()->flush();
        if (root) {
            execl("/sbin/reboot", "reboot", static_cast<char*>(nullptr));
        } else {
            execlp("sudo", "sudo", "/sbin/reboot", static_cast<char*>(nullptr));
        }
        spdlog::error("[Reboot] exec reboot failed: {}", strerror(errno));

        spdlog::warn("[Reboot] Using reboot syscall");
        spdlog::default_logger()->flush();
        ::reboot(RB_AUTOBOOT);

        spdlog::critical("[Reboot] All reboot methods failed: {}", strerror(errno));
        spdlog::default_logger()->flush();
        _exit(1);
    }

    void sleep_for(std::chrono::seconds duration) override {
        std::this_thread::sleep_for(duration);
    }
};

/// --dry-run: same waits, but the daemon just exits where it would reboot
class DryRunRebootBackend : public RebootBackend {
  public:
    void reboot() override {
        spdlog::warn("[Reboot] Dry run: not rebooting, exiting daemon instead");
        spdlog::default_logger()->flush();
        _exit(EXIT_CODE);
    }

    void sleep_for(std::chrono::seconds duration) override {
        std::this_thread::sleep_for(duration);
    }

  private:
    static constexpr int EXIT_CODE = 3;
};

} // namespace

std::unique_ptr<RebootBackend> RebootBackend::create(bool dry_run) {
    if (dry_run) {
        return std::make_unique<DryRunRebootBackend>();
    }
    return std::make_unique<SystemRebootBackend>();
}

// =============================================================================
// RebootEscalationPolicy
// =============================================================================

RebootEscalationPolicy::RebootEscalationPolicy(MessageSinks& sinks, UserPresenceQuery& users,
                                               RebootBackend& reboot)
    : sinks_(sinks), users_(users), reboot_(reboot) {}

const char* RebootEscalationPolicy::state_name(State state) {
    switch (state) {
    case State::Idle:
        return "Idle";
    case State::Announcing:
        return "Announcing";
    case State::Deferred:
        return "Deferred";
    case State::CountdownArmed:
        return "CountdownArmed";
    case State::Rebooting:
        return "Rebooting";
    }
    return "Unknown";
}

void RebootEscalationPolicy::enter(State next) {
    spdlog::debug("[Escalation] {} -> {}", state_name(state_), state_name(next));
    state_ = next;
}

void RebootEscalationPolicy::set_blocking_policy(RebootBlockingPolicy policy) {
    if (state_ != State::Idle) {
        spdlog::warn("[Escalation] Ignoring policy change to '{}' during escalation",
                     reboot_blocking_policy_name(policy));
        return;
    }
    policy_ = policy;
    spdlog::info("[Escalation] Reboot blocked by users: {}", reboot_blocking_policy_name(policy));
}

int RebootEscalationPolicy::blocking_user_count() {
    switch (policy_) {
    case RebootBlockingPolicy::NoUsers:
        return 0;
    case RebootBlockingPolicy::SSHUsers:
        return users_.count_interactive_users(true);
    case RebootBlockingPolicy::AnyUsers:
        return users_.count_interactive_users(false);
    }
    return 0;
}

EscalationResult RebootEscalationPolicy::escalate(const std::string& message) {
    if (state_ != State::Idle) {
        // Already on the way down; the running escalation owns the device
        spdlog::warn("[Escalation] Nested escalation while {}: {}", state_name(state_), message);
        sinks_.message(message, true);
        return EscalationResult::Terminated;
    }

    enter(State::Announcing);
    sinks_.message("", true);
    sinks_.message(message, true);

    int users = blocking_user_count();
    while (true) {
        if (users > 0) {
            enter(State::Deferred);
            spdlog::info("[Escalation] {} blocking user(s) logged in, deferring reboot", users);
            sinks_.message("No reboot, due to user login.", true);
            sinks_.message("", true);

            watch_users();

            enter(State::Announcing);
            sinks_.message("Reinstating reboot timer due to user logout.", true);
            users = blocking_user_count();
            continue;
        }

        enter(State::CountdownArmed);
        sinks_.message("Critical error - rebooting in " + std::to_string(grace_interval_.count()) +
                           " seconds.",
                       true);
        sinks_.message("", true);
        sinks_.message("", true);

        reboot_.sleep_for(grace_interval_);

        // Someone may have logged in to look at the problem during the grace period
        users = blocking_user_count();
        if (users == 0) {
            break;
        }
    }

    enter(State::Rebooting);
    sinks_.message("Rebooting ", true);
    reboot_.reboot();

    // Only reachable with a test double
    return EscalationResult::Terminated;
}

void RebootEscalationPolicy::watch_users() {
    while (true) {
        reboot_.sleep_for(poll_interval_);
        int users = blocking_user_count();
        if (users == 0) {
            spdlog::info("[Escalation] Blocking users logged out");
            return;
        }
        spdlog::debug("[Escalation] Still {} blocking user(s)", users);
    }
}

} // namespace kiosk
