// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor/event_source.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <poll.h>
#include <set>
#include <sys/signalfd.h>
#include <sys/time.h>
#include <unistd.h>

namespace kiosk {

SignalEventSource::SignalEventSource(std::initializer_list<int> signals) {
    sigemptyset(&mask_);
    for (int signo : signals) {
        sigaddset(&mask_, signo);
    }

    if (sigprocmask(SIG_BLOCK, &mask_, &previous_mask_) != 0) {
        spdlog::error("[Events] sigprocmask failed: {}", strerror(errno));
        return;
    }

    fd_ = signalfd(-1, &mask_, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd_ < 0) {
        spdlog::error("[Events] signalfd failed: {}", strerror(errno));
        sigprocmask(SIG_SETMASK, &previous_mask_, nullptr);
        return;
    }

    spdlog::debug("[Events] Watching {} signal(s) on fd {}", signals.size(), fd_);
}

SignalEventSource::~SignalEventSource() {
    if (fd_ < 0) {
        return;
    }
    close(fd_);

    // Whatever is still queued would hit its default action (fatal for
    // SIGTERM and SIGALRM) the moment the old mask comes back
    sigset_t owned;
    sigemptyset(&owned);
    for (int signo = 1; signo < NSIG; ++signo) {
        if (sigismember(&mask_, signo) == 1 && sigismember(&previous_mask_, signo) != 1) {
            sigaddset(&owned, signo);
        }
    }
    const struct timespec no_wait = {0, 0};
    int signo;
    while ((signo = sigtimedwait(&owned, nullptr, &no_wait)) > 0) {
        spdlog::debug("[Events] Dropping undispatched signal {} ({})", signo, strsignal(signo));
    }

    sigprocmask(SIG_SETMASK, &previous_mask_, nullptr);
}

void SignalEventSource::on_signal(int signo, Handler handler) {
    if (sigismember(&mask_, signo) != 1) {
        spdlog::warn("[Events] Handler for unwatched signal {} ({}) will never run", signo,
                     strsignal(signo));
    }
    handlers_[signo] = std::move(handler);
}

void SignalEventSource::dispatch() {
    if (fd_ < 0) {
        return;
    }

    // Collect first, run afterwards: a handler may block for a long time
    // (escalation) and everything already queued must be accounted for.
    std::set<int> pending;
    while (true) {
        struct signalfd_siginfo info;
        ssize_t n = read(fd_, &info, sizeof(info));
        if (n == static_cast<ssize_t>(sizeof(info))) {
            pending.insert(static_cast<int>(info.ssi_signo));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && errno != EAGAIN) {
            spdlog::error("[Events] read(signalfd) failed: {}", strerror(errno));
        }
        break;
    }

    for (int signo : pending) {
        auto it = handlers_.find(signo);
        if (it == handlers_.end() || !it->second) {
            spdlog::trace("[Events] No handler for signal {}", signo);
            continue;
        }
        spdlog::trace("[Events] Dispatching {}", strsignal(signo));
        it->second();
    }
}

void SignalEventSource::run(const std::function<bool()>& should_stop) {
    if (fd_ < 0) {
        spdlog::error("[Events] Cannot run event loop without a signalfd");
        return;
    }

    while (!should_stop()) {
        struct pollfd pfd = {fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, -1);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[Events] poll failed: {}", strerror(errno));
            return;
        }
        if (pfd.revents & POLLIN) {
            dispatch();
        }
    }
}

void reset_signal_state_for_exec() {
    // ITIMER_REAL survives execve
    struct itimerval off = {};
    setitimer(ITIMER_REAL, &off, nullptr);

    // Ignoring a pending signal discards it
    signal(SIGALRM, SIG_IGN);

    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    signal(SIGCHLD, SIG_DFL);
    signal(SIGALRM, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
}

} // namespace kiosk
