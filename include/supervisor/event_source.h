// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file event_source.h
 * @brief Asynchronous notification sources for the supervisor
 *
 * The supervisor reacts to two asynchronous events: a timed command's
 * deadline expiring (SIGALRM) and a child process terminating (SIGCHLD).
 * Instead of running logic inside real signal handlers, the signals are
 * blocked and read back through a signalfd. Handlers therefore only run at
 * dispatch points:
 * - the daemon's main loop (SignalEventSource::run)
 * - the Command Runner's poll loop while a timed command is executing
 *
 * Blocking the signals is the "mask/defer" mechanism: a notification can
 * never interrupt the supervisor halfway through updating its own state.
 */

#pragma once

#include <functional>
#include <initializer_list>
#include <map>
#include <signal.h>

namespace kiosk {

/**
 * @brief Something the Command Runner can wait on while it is blocked
 *
 * fd() becomes readable when notifications are pending; dispatch() runs
 * their handlers. A null EventSource means "nothing to service".
 */
class EventSource {
  public:
    virtual ~EventSource() = default;

    virtual int fd() const = 0;

    virtual void dispatch() = 0;
};

/**
 * @brief signalfd-backed event source (Linux)
 *
 * Blocks the given signals in the calling thread for the lifetime of the
 * object and restores the previous mask on destruction. Children created by
 * ProcessBackend unblock them again before exec.
 *
 * Several deliveries of the same signal between two dispatch() calls are
 * collapsed by the kernel into one; handlers must not assume one call per
 * event.
 */
class SignalEventSource : public EventSource {
  public:
    using Handler = std::function<void()>;

    explicit SignalEventSource(std::initializer_list<int> signals);
    ~SignalEventSource() override;

    SignalEventSource(const SignalEventSource&) = delete;
    SignalEventSource& operator=(const SignalEventSource&) = delete;

    /**
     * @brief Register the handler for one of the watched signals
     *
     * Registered once at startup. Replaces an existing handler.
     */
    void on_signal(int signo, Handler handler);

    int fd() const override {
        return fd_;
    }

    /**
     * @brief Drain pending signals and run their handlers
     *
     * Each signal's handler runs at most once per dispatch, however many
     * times the signal was delivered.
     */
    void dispatch() override;

    /**
     * @brief Wait for and dispatch signals until @p should_stop returns true
     *
     * @param should_stop Checked after every dispatch
     */
    void run(const std::function<bool()>& should_stop);

    bool valid() const {
        return fd_ >= 0;
    }

  private:
    int fd_ = -1;
    sigset_t mask_{};
    sigset_t previous_mask_{};
    std::map<int, Handler> handlers_;
};

/**
 * @brief Undo the supervisor's signal setup ahead of an exec
 *
 * Must be called before any exec(), in a forked child or in the supervisor
 * itself, so the new program does not inherit the blocked SIGCHLD/SIGALRM or
 * a running ITIMER_REAL. A SIGALRM already pending is discarded.
 */
void reset_signal_state_for_exec();

} // namespace kiosk
