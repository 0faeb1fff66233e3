// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file process_registry.h
 * @brief Background Process Registry: launch, track and stop viewer processes
 *
 * The registry is the record of which children the daemon expects to keep
 * running. Its one subtle rule is ordering in terminate(): the entry is
 * removed *before* SIGKILL is sent, so when the exit notification arrives the
 * Child Exit Reactor finds no entry and treats the exit as intentional.
 *
 * Every access goes through one mutex: launch/terminate run on the main flow
 * while lookups come from the reactor.
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace kiosk {

class MessageSinks;
class ProcessBackend;
class RebootEscalationPolicy;

struct TrackedProcess {
    pid_t pid = 0;
    std::string command;
    /// Set only on the copy handed to stop(); an entry still in the registry
    /// is never expected to exit
    bool expected_exit = false;
};

class ProcessRegistry {
  public:
    /// Returned by launch() when the command could not be started and escalation ran
    static constexpr pid_t ESCALATED_PID = -1;

    ProcessRegistry(ProcessBackend& backend, MessageSinks& sinks, RebootEscalationPolicy& policy);

    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    /**
     * @brief Start @p command in the background and track it
     *
     * Returns immediately; never waits on the child.
     *
     * @return PID of the new process, or ESCALATED_PID if it could not be forked
     */
    pid_t launch(const std::string& command);

    /**
     * @brief Stop a tracked process with SIGKILL
     *
     * @throws NotTrackedError if @p pid is not tracked (no signal is sent)
     */
    void terminate(pid_t pid);

    /**
     * @brief Stop every tracked process, in no particular order
     */
    void terminate_all();

    std::optional<TrackedProcess> lookup(pid_t pid) const;

    bool is_tracked(pid_t pid) const;

    size_t size() const;

    std::vector<pid_t> tracked_pids() const;

    /**
     * @brief Drop an entry whose exit has been handled
     *
     * @return true if an entry was removed
     */
    bool forget(pid_t pid);

  private:
    /// Remove and return the entry, marked as an expected exit
    std::optional<TrackedProcess> take(pid_t pid);

    void stop(const TrackedProcess& process);

    ProcessBackend& backend_;
    MessageSinks& sinks_;
    RebootEscalationPolicy& policy_;

    mutable std::mutex mutex_;
    std::map<pid_t, TrackedProcess> processes_;
};

} // namespace kiosk
