// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file proc_info.h
 * @brief Process information from procfs
 *
 * Viewers are usually launched through a wrapper shell, so the PID the
 * registry tracks is the shell's. Callers that need the real viewer (to find
 * its window, for instance) wait for the shell's first child to appear.
 *
 * @code
 * ProcInfoReader proc;
 * pid_t shell = supervisor.launch("chromium --kiosk http://localhost");
 * if (auto viewer = proc.wait_for_child(shell, std::chrono::seconds(10))) {
 *     spdlog::info("Viewer PID {}", *viewer);
 * }
 * @endcode
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace kiosk {

struct PidInfo {
    pid_t pid = 0;
    pid_t ppid = 0;
    char state = '?';           ///< R, S, D, Z, T ...
    long priority = 0;
    long nice = 0;
    unsigned long vsize_kib = 0;
    long rss_pages = 0;
    std::string command;        ///< argv[0], or the kernel comm for kernel threads
    std::vector<std::string> args; ///< argv[1..]
    std::vector<pid_t> children;
};

class ProcInfoReader {
  public:
    using SleepFunction = std::function<void(std::chrono::seconds)>;

    static constexpr std::chrono::seconds CHILD_POLL_INTERVAL{1};

    /**
     * @param proc_root procfs mount point (tests point this at a fake tree)
     */
    explicit ProcInfoReader(std::string proc_root = "/proc");

    /**
     * @brief Read stat and cmdline for @p pid, plus its direct children
     *
     * @return std::nullopt if the process does not exist or stat is malformed
     */
    std::optional<PidInfo> read_pid_info(pid_t pid) const;

    /**
     * @brief Direct children of @p ppid, in ascending PID order
     */
    std::vector<pid_t> child_pids(pid_t ppid) const;

    /**
     * @brief Poll once per second until @p ppid has a child
     *
     * @return Lowest child PID, or std::nullopt if none appeared within @p timeout
     */
    std::optional<pid_t> wait_for_child(pid_t ppid, std::chrono::seconds timeout) const;

    /// Replace the poll sleep (tests)
    void set_sleep_function(SleepFunction sleep) {
        sleep_ = std::move(sleep);
    }

  private:
    /// Parse /proc/<pid>/stat into @p info; false if unreadable or malformed
    bool read_stat(pid_t pid, PidInfo& info) const;

    std::string proc_root_;
    SleepFunction sleep_;
};

} // namespace kiosk
