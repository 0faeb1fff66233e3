// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor/deadline_timer.h"

#include "supervisor/event_source.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <sys/time.h>

namespace kiosk {

namespace {

// SIGALRM can be delivered a hair before steady_clock agrees the deadline
// passed; anything inside this window counts as expired.
constexpr auto EXPIRY_SLACK = std::chrono::milliseconds(50);

/**
 * @brief setitimer(ITIMER_REAL) deadline
 *
 * A SIGALRM that was already queued when the timer got cancelled or re-armed
 * is ignored: on delivery the timer checks that it is still armed and that
 * its own deadline has really passed.
 */
class AlarmDeadlineTimer : public DeadlineTimer {
  public:
    explicit AlarmDeadlineTimer(SignalEventSource& events) {
        events.on_signal(SIGALRM, [this]() { on_alarm(); });
    }

    ~AlarmDeadlineTimer() override {
        set_itimer(std::chrono::seconds(0));
    }

    bool arm(std::chrono::seconds timeout, ExpiryCallback on_expire) override {
        if (!set_itimer(timeout)) {
            armed_ = false;
            callback_ = nullptr;
            return false;
        }
        callback_ = std::move(on_expire);
        deadline_ = std::chrono::steady_clock::now() + timeout;
        armed_ = true;
        spdlog::trace("[Deadline] Armed for {}s", timeout.count());
        return true;
    }

    void cancel() override {
        if (!armed_) {
            return;
        }
        armed_ = false;
        callback_ = nullptr;
        set_itimer(std::chrono::seconds(0));
        spdlog::trace("[Deadline] Cancelled");
    }

    bool armed() const override {
        return armed_;
    }

  private:
    void on_alarm() {
        if (!armed_) {
            spdlog::debug("[Deadline] Stale SIGALRM ignored (timer not armed)");
            return;
        }
        if (std::chrono::steady_clock::now() + EXPIRY_SLACK < deadline_) {
            spdlog::debug("[Deadline] Early SIGALRM ignored (deadline not reached)");
            return;
        }

        armed_ = false;
        ExpiryCallback cb = std::move(callback_);
        callback_ = nullptr;
        if (cb) {
            cb();
        }
    }

    static bool set_itimer(std::chrono::seconds timeout) {
        struct itimerval tv = {};
        tv.it_value.tv_sec = static_cast<time_t>(timeout.count());
        if (setitimer(ITIMER_REAL, &tv, nullptr) != 0) {
            spdlog::error("[Deadline] setitimer({}s) failed: {}", timeout.count(),
                          strerror(errno));
            return false;
        }
        return true;
    }

    bool armed_ = false;
    std::chrono::steady_clock::time_point deadline_;
    ExpiryCallback callback_;
};

} // namespace

std::unique_ptr<DeadlineTimer> DeadlineTimer::create(SignalEventSource& events) {
    return std::make_unique<AlarmDeadlineTimer>(events);
}

} // namespace kiosk
