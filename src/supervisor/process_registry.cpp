// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor/process_registry.h"

#include "supervisor/message_sinks.h"
#include "supervisor/process_backend.h"
#include "supervisor/reboot_policy.h"
#include "supervisor/supervisor_errors.h"

#include <spdlog/spdlog.h>

namespace kiosk {

ProcessRegistry::ProcessRegistry(ProcessBackend& backend, MessageSinks& sinks,
                                 RebootEscalationPolicy& policy)
    : backend_(backend), sinks_(sinks), policy_(policy) {}

pid_t ProcessRegistry::launch(const std::string& command) {
    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid = backend_.spawn(command);
        if (pid > 0) {
            processes_[pid] = TrackedProcess{pid, command, false};
        }
    }

    if (pid <= 0) {
        policy_.escalate("Cannot start background command " + command + " (" +
                         backend_.last_error() + ")");
        return ESCALATED_PID;
    }

    sinks_.message("BackgroundCommand " + command + " (PID " + std::to_string(pid) + ")");
    return pid;
}

void ProcessRegistry::terminate(pid_t pid) {
    std::optional<TrackedProcess> process = take(pid);
    if (!process) {
        spdlog::error("[Registry] terminate({}) on an untracked PID", pid);
        throw NotTrackedError(pid);
    }
    stop(*process);
}

void ProcessRegistry::terminate_all() {
    std::vector<TrackedProcess> stopping;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : processes_) {
            entry.second.expected_exit = true;
            stopping.push_back(entry.second);
        }
        processes_.clear();
    }

    spdlog::debug("[Registry] Stopping {} background command(s)", stopping.size());
    for (const auto& process : stopping) {
        stop(process);
    }
}

std::optional<TrackedProcess> ProcessRegistry::take(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(pid);
    if (it == processes_.end()) {
        return std::nullopt;
    }
    TrackedProcess process = it->second;
    process.expected_exit = true;
    processes_.erase(it);
    return process;
}

void ProcessRegistry::stop(const TrackedProcess& process) {
    // The entry is already gone, so the coming exit reads as expected
    sinks_.message("Stopping " + process.command + " (PID " + std::to_string(process.pid) + ")");
    if (!backend_.kill(process.pid)) {
        spdlog::warn("[Registry] Could not kill PID {} ({}): {}", process.pid, process.command,
                     backend_.last_error());
    }
}

std::optional<TrackedProcess> ProcessRegistry::lookup(pid_t pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(pid);
    if (it == processes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ProcessRegistry::is_tracked(pid_t pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.count(pid) > 0;
}

size_t ProcessRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.size();
}

std::vector<pid_t> ProcessRegistry::tracked_pids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<pid_t> pids;
    pids.reserve(processes_.size());
    for (const auto& entry : processes_) {
        pids.push_back(entry.first);
    }
    return pids;
}

bool ProcessRegistry::forget(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.erase(pid) > 0;
}

} // namespace kiosk
