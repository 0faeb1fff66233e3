// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file process_backend.h
 * @brief OS boundary for spawning, killing and reaping child processes
 *
 * Everything the supervisor does to real processes goes through this
 * interface, so tests can substitute a scripted fake:
 *
 * - run_captured(): the Command Runner. Synchronous, output captured.
 * - spawn(): detached background launch, returns immediately.
 * - kill(): forced kill of a background process (and its process group).
 * - reap(): non-blocking reap of one terminated child.
 *
 * Usage:
 * @code
 * auto backend = ProcessBackend::create();
 * CommandOutcome out = backend->run_captured("uname -a", &events);
 * if (out.completed_normally()) {
 *     spdlog::info("uname: {}", out.output);
 * }
 * @endcode
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

namespace kiosk {

class EventSource;

/**
 * @brief Result of one synchronous command
 */
struct CommandOutcome {
    bool started = false;  ///< false if the process could not be created
    int exit_code = -1;    ///< Exit status if the process exited
    int term_signal = 0;   ///< Signal number if the process was killed
    std::string output;    ///< Captured stdout
    std::string error;     ///< Human-readable failure reason (start failure, signal)

    /// Started and exited on its own (any exit code)
    bool completed_normally() const {
        return started && term_signal == 0;
    }
};

/**
 * @brief One reaped child
 */
struct ChildExit {
    pid_t pid = 0;
    int exit_code = -1;  ///< Valid when term_signal == 0
    int term_signal = 0; ///< Non-zero if killed by a signal
};

/// Human readable "exit code N" / "signal N (NAME)" for logs
std::string describe_exit(const ChildExit& exit);

class ProcessBackend {
  public:
    virtual ~ProcessBackend() = default;

    /**
     * @brief Run a shell command to completion and capture its stdout
     *
     * While waiting, @p events (if non-null) is serviced whenever it becomes
     * readable, so deadline and child-exit handlers can run.
     *
     * @param command Passed to /bin/sh -c
     * @param events Event source to dispatch while blocked, or nullptr
     */
    virtual CommandOutcome run_captured(const std::string& command, EventSource* events) = 0;

    /**
     * @brief Start a shell command in the background, in its own process group
     *
     * @return PID of the new process, or -1 if it could not be forked
     */
    virtual pid_t spawn(const std::string& command) = 0;

    /**
     * @brief Send SIGKILL to a background process and its process group
     *
     * @return true if the signal was delivered
     */
    virtual bool kill(pid_t pid) = 0;

    /**
     * @brief Reap one terminated child without blocking
     *
     * @return The reaped child, or std::nullopt if none is reapable right now
     */
    virtual std::optional<ChildExit> reap() = 0;

    /**
     * @brief Last OS error as text (for log and escalation messages)
     */
    virtual std::string last_error() const = 0;

    /**
     * @brief PID of the helper currently running inside run_captured(), or 0
     */
    virtual pid_t current_helper() const = 0;

    /**
     * @brief Factory: fork/exec backend for Linux
     */
    static std::unique_ptr<ProcessBackend> create();
};

} // namespace kiosk
