// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace kiosk {

class SignalEventSource;

/**
 * @brief One-shot deadline used by the Timeout Watchdog
 *
 * arm() replaces any previous deadline. The expiry callback runs from the
 * event source's dispatch, never from a raw signal handler. Implementations
 * must not invoke a callback after cancel() returned.
 */
class DeadlineTimer {
  public:
    using ExpiryCallback = std::function<void()>;

    virtual ~DeadlineTimer() = default;

    /**
     * @brief Start (or restart) the deadline
     *
     * @return false if the underlying timer could not be started. The timer is
     *         left unarmed and @p on_expire will never run.
     */
    virtual bool arm(std::chrono::seconds timeout, ExpiryCallback on_expire) = 0;

    virtual void cancel() = 0;

    virtual bool armed() const = 0;

    /**
     * @brief Factory: SIGALRM-backed timer wired into @p events
     *
     * Registers the SIGALRM handler on @p events, which must outlive the timer
     * and must have been created with SIGALRM in its signal set.
     */
    static std::unique_ptr<DeadlineTimer> create(SignalEventSource& events);
};

} // namespace kiosk
