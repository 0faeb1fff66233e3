// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file supervisor_errors.h
 * @brief Caller-misuse errors raised by the process supervisor
 *
 * These never mean the device is unhealthy. They mean the caller's own
 * bookkeeping is wrong, so they are thrown back to the caller instead of
 * being routed into the reboot escalation path.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sys/types.h>

namespace kiosk {

/// Base class for programming errors detected by the supervisor
class SupervisorError : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

/// terminate() was asked to stop a PID the registry does not own
class NotTrackedError : public SupervisorError {
  public:
    explicit NotTrackedError(pid_t pid)
        : SupervisorError("PID " + std::to_string(pid) + " is not a background command"),
          pid_(pid) {}

    pid_t pid() const {
        return pid_;
    }

  private:
    pid_t pid_;
};

/// run_with_timeout() was called while another timed command is still armed
class WatchdogBusyError : public SupervisorError {
  public:
    WatchdogBusyError(const std::string& pending, const std::string& rejected)
        : SupervisorError("Timed command already in progress ('" + pending +
                          "'), cannot run '" + rejected + "'") {}
};

} // namespace kiosk
