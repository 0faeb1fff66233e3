// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_linux_process_backend.cpp
 * @brief Real fork/exec tests for the Linux process backend and signal plumbing
 *
 * These run actual shell commands (sh, echo, sleep, kill), so they need a
 * POSIX userland but no privileges.
 */

#include "supervisor/deadline_timer.h"
#include "supervisor/event_source.h"
#include "supervisor/process_backend.h"
#include "supervisor/reboot_policy.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/time.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using namespace kiosk;
using namespace std::chrono_literals;

namespace {

/// Poll reap() until @p pid shows up (other tests' children may come first)
std::optional<ChildExit> reap_pid(ProcessBackend& backend, pid_t pid,
                                  std::chrono::milliseconds limit = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        while (auto exit = backend.reap()) {
            if (exit->pid == pid) {
                return exit;
            }
        }
        std::this_thread::sleep_for(10ms);
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// run_captured()
// ============================================================================

TEST_CASE("LinuxProcessBackend: captures stdout", "[supervisor][process][os]") {
    auto backend = ProcessBackend::create();

    CommandOutcome out = backend->run_captured("echo hello; echo world", nullptr);

    REQUIRE(out.started);
    REQUIRE(out.completed_normally());
    REQUIRE(out.exit_code == 0);
    REQUIRE(out.output == "hello\nworld\n");
    REQUIRE(backend->current_helper() == 0);
}

TEST_CASE("LinuxProcessBackend: reports exit status", "[supervisor][process][os]") {
    auto backend = ProcessBackend::create();

    CommandOutcome out = backend->run_captured("echo partial; exit 3", nullptr);

    REQUIRE(out.completed_normally());
    REQUIRE(out.exit_code == 3);
    REQUIRE(out.output == "partial\n");
}

TEST_CASE("LinuxProcessBackend: reports death by signal", "[supervisor][process][os]") {
    auto backend = ProcessBackend::create();

    CommandOutcome out = backend->run_captured("kill -9 $$", nullptr);

    REQUIRE(out.started);
    REQUIRE_FALSE(out.completed_normally());
    REQUIRE(out.term_signal == SIGKILL);
    REQUIRE(out.error.find("signal 9") != std::string::npos);
}

TEST_CASE("LinuxProcessBackend: unknown command exits 127", "[supervisor][process][os]") {
    auto backend = ProcessBackend::create();

    CommandOutcome out = backend->run_captured("/definitely/not/a/command 2>/dev/null", nullptr);

    REQUIRE(out.completed_normally());
    REQUIRE(out.exit_code == 127);
}

TEST_CASE("LinuxProcessBackend: services events while waiting", "[supervisor][process][os]") {
    SignalEventSource events({SIGCHLD});
    REQUIRE(events.valid());

    auto backend = ProcessBackend::create();
    int dispatched = 0;
    events.on_signal(SIGCHLD, [&]() {
        ++dispatched;
        // Reap like the reactor does; the runner must still get its status
        while (backend->reap()) {
        }
    });

    // stdout closes before the shell exits, so the wait phase sees SIGCHLD
    CommandOutcome out = backend->run_captured("exec >/dev/null; sleep 0.2; exit 4", &events);

    REQUIRE(out.completed_normally());
    REQUIRE(out.exit_code == 4);
    REQUIRE(dispatched >= 1);
}

// ============================================================================
// spawn() / kill() / reap()
// ============================================================================

TEST_CASE("LinuxProcessBackend: spawn returns without waiting", "[supervisor][process][os]") {
    auto backend = ProcessBackend::create();

    auto start = std::chrono::steady_clock::now();
    pid_t pid = backend->spawn("sleep 30");
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(pid > 0);
    REQUIRE(elapsed < 2s);

    REQUIRE(backend->kill(pid));
    auto exit = reap_pid(*backend, pid);
    REQUIRE(exit.has_value());
    REQUIRE(exit->term_signal == SIGKILL);
}

TEST_CASE("LinuxProcessBackend: kill takes down the process group", "[supervisor][process][os]") {
    auto backend = ProcessBackend::create();

    // The shell forks sleep as a grandchild in the same group
    pid_t pid = backend->spawn("sleep 30 & wait");
    REQUIRE(pid > 0);
    std::this_thread::sleep_for(100ms);

    REQUIRE(backend->kill(pid));
    auto exit = reap_pid(*backend, pid);
    REQUIRE(exit.has_value());
    // The shell itself was killed, not left waiting on an orphaned sleep
    REQUIRE(exit->term_signal == SIGKILL);
}

TEST_CASE("LinuxProcessBackend: reap reports normal exit", "[supervisor][process][os]") {
    auto backend = ProcessBackend::create();

    pid_t pid = backend->spawn("exit 5");
    auto exit = reap_pid(*backend, pid);

    REQUIRE(exit.has_value());
    REQUIRE(exit->exit_code == 5);
    REQUIRE(exit->term_signal == 0);
    REQUIRE(describe_exit(*exit) == "exit code 5");
}

TEST_CASE("LinuxProcessBackend: kill of an invalid PID fails", "[supervisor][process][os]") {
    auto backend = ProcessBackend::create();
    REQUIRE_FALSE(backend->kill(0));
    REQUIRE_FALSE(backend->last_error().empty());
}

// ============================================================================
// Deadline timer on a real SIGALRM
// ============================================================================

TEST_CASE("AlarmDeadlineTimer: fires through the event source", "[supervisor][deadline][os]") {
    SignalEventSource events({SIGALRM});
    REQUIRE(events.valid());
    auto timer = DeadlineTimer::create(events);

    bool expired = false;
    auto start = std::chrono::steady_clock::now();
    REQUIRE(timer->arm(1s, [&]() { expired = true; }));
    REQUIRE(timer->armed());

    events.run([&]() { return expired; });

    REQUIRE(expired);
    REQUIRE_FALSE(timer->armed());
    REQUIRE(std::chrono::steady_clock::now() - start >= 900ms);
}

TEST_CASE("AlarmDeadlineTimer: cancel disarms", "[supervisor][deadline][os]") {
    SignalEventSource events({SIGALRM});
    auto timer = DeadlineTimer::create(events);

    bool expired = false;
    REQUIRE(timer->arm(1s, [&]() { expired = true; }));
    timer->cancel();
    REQUIRE_FALSE(timer->armed());

    // A SIGALRM that slips through after cancel is ignored
    raise(SIGALRM);
    events.dispatch();
    REQUIRE_FALSE(expired);
}

TEST_CASE("AlarmDeadlineTimer: rejected setitimer leaves the timer unarmed",
          "[supervisor][deadline][os]") {
    SignalEventSource events({SIGALRM});
    auto timer = DeadlineTimer::create(events);

    // The kernel refuses a negative it_value with EINVAL
    bool expired = false;
    REQUIRE_FALSE(timer->arm(-5s, [&]() { expired = true; }));
    REQUIRE_FALSE(timer->armed());

    raise(SIGALRM);
    events.dispatch();
    REQUIRE_FALSE(expired);
}

// ============================================================================
// Signal state handed to other programs
// ============================================================================

TEST_CASE("SignalEventSource: undispatched signals die with the event source",
          "[supervisor][events][os]") {
    // In a child, so a regression kills the child instead of the test run
    pid_t pid = fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
        {
            SignalEventSource events({SIGTERM, SIGALRM});
            if (!events.valid()) {
                _exit(2);
            }
            raise(SIGTERM);
            raise(SIGALRM);
        }
        sigset_t pending;
        sigpending(&pending);
        if (sigismember(&pending, SIGTERM) == 1 || sigismember(&pending, SIGALRM) == 1) {
            _exit(3);
        }
        _exit(0);
    }

    int status = 0;
    REQUIRE(waitpid(pid, &status, 0) == pid);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == 0);
}

TEST_CASE("SignalEventSource: signals blocked beforehand stay blocked",
          "[supervisor][events][os]") {
    sigset_t usr1, before;
    sigemptyset(&usr1);
    sigaddset(&usr1, SIGUSR1);
    sigprocmask(SIG_BLOCK, &usr1, &before);

    { SignalEventSource events({SIGUSR1, SIGALRM}); }

    sigset_t after;
    sigprocmask(SIG_SETMASK, nullptr, &after);
    REQUIRE(sigismember(&after, SIGUSR1) == 1);
    REQUIRE(sigismember(&after, SIGALRM) == 0);

    sigprocmask(SIG_SETMASK, &before, nullptr);
}

TEST_CASE("SystemRebootBackend: reboot command starts with a clean signal state",
          "[supervisor][reboot][os]") {
    if (geteuid() == 0) {
        SKIP("Would really reboot when run as root");
    }

    // A fake sudo on PATH stands in for the reboot command. It outlives the
    // one second timer armed below, then records its own blocked-signal mask.
    auto dir = std::filesystem::temp_directory_path() /
               ("kiosk_reboot_" + std::to_string(getpid()));
    std::filesystem::create_directories(dir);
    auto out_path = dir / "sigblk";
    std::filesystem::remove(out_path);
    {
        std::ofstream script(dir / "sudo");
        script << "#!/bin/sh\n"
               << "sleep 2\n"
               << "grep SigBlk /proc/$$/status > \"$KIOSK_REBOOT_OUT\"\n";
    }
    std::filesystem::permissions(dir / "sudo", std::filesystem::perms::owner_all);

    pid_t pid = fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
        // Same state the daemon is in while a timed command is running
        SignalEventSource events({SIGCHLD, SIGALRM, SIGTERM, SIGINT});
        struct itimerval tv = {};
        tv.it_value.tv_sec = 1;
        setitimer(ITIMER_REAL, &tv, nullptr);

        std::string path = dir.string() + ":/usr/bin:/bin";
        setenv("PATH", path.c_str(), 1);
        setenv("KIOSK_REBOOT_OUT", out_path.c_str(), 1);
        RebootBackend::create(false)->reboot();
        _exit(1);
    }

    int status = 0;
    REQUIRE(waitpid(pid, &status, 0) == pid);
    // A carried-over ITIMER_REAL kills the script with SIGALRM
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == 0);

    std::ifstream in(out_path);
    std::stringstream ss;
    ss << in.rdbuf();
    std::string line = ss.str();
    REQUIRE(line.find("SigBlk:") == 0);
    REQUIRE(line.find_first_not_of("0 \t\n", line.find(':') + 1) == std::string::npos);

    std::filesystem::remove_all(dir);
}
