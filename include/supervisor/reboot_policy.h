// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file reboot_policy.h
 * @brief Reboot Escalation Policy: the single exit for every fatal condition
 *
 * Once a monitored command has definitively failed, the only remediation for
 * an unattended kiosk is a full reboot. The reboot is held off while an
 * operator is logged in (they are probably debugging the failure), and
 * reinstated once they log out, whether or not they fixed anything.
 *
 * State machine:
 * @code
 *   Idle -> Announcing -+-> Deferred --(users gone)--> Announcing
 *                       |
 *                       +-> CountdownArmed --(grace elapsed, no users)--> Rebooting
 *                                  |
 *                                  +--(user logged in during grace)--> Deferred
 * @endcode
 *
 * The Deferred watch loop and the grace wait are deliberately blocking and
 * cannot be interrupted: by the time escalation starts, nothing else the
 * daemon could do matters.
 */

#pragma once

#include "supervisor/user_presence.h"

#include <chrono>
#include <memory>
#include <string>

namespace kiosk {

class MessageSinks;

/**
 * @brief The device-level actions escalation ends in
 */
class RebootBackend {
  public:
    virtual ~RebootBackend() = default;

    /**
     * @brief Reboot the device now
     *
     * Production implementations do not return. Test doubles record the call
     * and return.
     */
    virtual void reboot() = 0;

    /**
     * @brief Block for @p duration (grace interval, user poll interval)
     */
    virtual void sleep_for(std::chrono::seconds duration) = 0;

    /**
     * @brief Factory: systemctl / reboot binary / reboot(2) backend
     *
     * @param dry_run Log the decision and exit the daemon instead of rebooting
     */
    static std::unique_ptr<RebootBackend> create(bool dry_run = false);
};

/**
 * @brief Outcome of escalate()
 *
 * Terminated is the only value: once escalate() returns (which only a test
 * double lets it do), the caller must not continue with the failed work.
 */
enum class EscalationResult { Terminated };

class RebootEscalationPolicy {
  public:
    enum class State { Idle, Announcing, Deferred, CountdownArmed, Rebooting };

    static constexpr std::chrono::seconds DEFAULT_POLL_INTERVAL{10};
    static constexpr std::chrono::seconds DEFAULT_GRACE_INTERVAL{60};

    RebootEscalationPolicy(MessageSinks& sinks, UserPresenceQuery& users, RebootBackend& reboot);

    RebootEscalationPolicy(const RebootEscalationPolicy&) = delete;
    RebootEscalationPolicy& operator=(const RebootEscalationPolicy&) = delete;

    /**
     * @brief Report a fatal condition and reboot (or defer, then reboot)
     *
     * @param message Reason, emitted on every sink before anything else
     * @return EscalationResult::Terminated (production never returns)
     */
    EscalationResult escalate(const std::string& message);

    /**
     * @brief Blocking sessions under the current policy
     *
     * NoUsers never queries the session database.
     */
    int blocking_user_count();

    void set_blocking_policy(RebootBlockingPolicy policy);
    RebootBlockingPolicy blocking_policy() const {
        return policy_;
    }

    void set_poll_interval(std::chrono::seconds interval) {
        poll_interval_ = interval;
    }
    void set_grace_interval(std::chrono::seconds interval) {
        grace_interval_ = interval;
    }
    std::chrono::seconds poll_interval() const {
        return poll_interval_;
    }
    std::chrono::seconds grace_interval() const {
        return grace_interval_;
    }

    State state() const {
        return state_;
    }

    static const char* state_name(State state);

  private:
    /// Poll until no blocking users remain
    void watch_users();

    void enter(State next);

    MessageSinks& sinks_;
    UserPresenceQuery& users_;
    RebootBackend& reboot_;

    RebootBlockingPolicy policy_ = RebootBlockingPolicy::AnyUsers;
    std::chrono::seconds poll_interval_ = DEFAULT_POLL_INTERVAL;
    std::chrono::seconds grace_interval_ = DEFAULT_GRACE_INTERVAL;
    State state_ = State::Idle;
};

} // namespace kiosk
