// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor/supervisor.h"

#include "config.h"

#include <spdlog/spdlog.h>

#include <csignal>
#include <stdexcept>

namespace kiosk {

namespace {

std::chrono::seconds positive_seconds(Config& config, const std::string& json_ptr,
                                      std::chrono::seconds fallback) {
    int value = config.get<int>(json_ptr, static_cast<int>(fallback.count()));
    if (value <= 0) {
        spdlog::warn("[Supervisor] {} must be positive (got {}), using {}s", json_ptr, value,
                     fallback.count());
        return fallback;
    }
    return std::chrono::seconds(value);
}

} // namespace

// =============================================================================
// SupervisorSettings
// =============================================================================

SupervisorSettings SupervisorSettings::from_config(Config& config) {
    SupervisorSettings s;

    std::string policy = config.get<std::string>("/supervisor/reboot_blocking_users", "any");
    try {
        s.blocking_policy = parse_reboot_blocking_policy(policy);
    } catch (const std::invalid_argument& e) {
        spdlog::error("[Supervisor] {}; using 'any'", e.what());
        s.blocking_policy = RebootBlockingPolicy::AnyUsers;
    }

    s.default_timeout = positive_seconds(config, "/supervisor/default_timeout_sec",
                                         TimeoutWatchdog::DEFAULT_TIMEOUT);
    s.user_poll_interval = positive_seconds(config, "/supervisor/user_poll_interval_sec",
                                            RebootEscalationPolicy::DEFAULT_POLL_INTERVAL);
    s.reboot_grace = positive_seconds(config, "/supervisor/reboot_grace_sec",
                                      RebootEscalationPolicy::DEFAULT_GRACE_INTERVAL);
    s.boot_console = config.get<bool>("/supervisor/boot_console", true);

    json startup = config.get<json>("/startup_commands", json::array());
    if (startup.is_array()) {
        for (const auto& entry : startup) {
            StartupCommand cmd;
            if (entry.is_string()) {
                cmd.command = entry.get<std::string>();
            } else if (entry.is_object() && entry.contains("command") &&
                       entry["command"].is_string()) {
                cmd.command = entry["command"].get<std::string>();
                if (entry.contains("timeout_sec") && entry["timeout_sec"].is_number_integer()) {
                    int timeout = entry["timeout_sec"].get<int>();
                    if (timeout > 0) {
                        cmd.timeout = std::chrono::seconds(timeout);
                    }
                }
            }
            if (cmd.command.empty()) {
                spdlog::warn("[Supervisor] Skipping invalid startup command: {}", entry.dump());
                continue;
            }
            s.startup_commands.push_back(std::move(cmd));
        }
    } else {
        spdlog::warn("[Supervisor] /startup_commands is not an array, ignoring");
    }

    json background = config.get<json>("/background_commands", json::array());
    if (background.is_array()) {
        for (const auto& entry : background) {
            if (!entry.is_string() || entry.get<std::string>().empty()) {
                spdlog::warn("[Supervisor] Skipping invalid background command: {}",
                             entry.dump());
                continue;
            }
            s.background_commands.push_back(entry.get<std::string>());
        }
    } else {
        spdlog::warn("[Supervisor] /background_commands is not an array, ignoring");
    }

    return s;
}

// =============================================================================
// Supervisor
// =============================================================================

Supervisor::Supervisor(const SupervisorSettings& settings, SupervisorDeps deps)
    : settings_(settings),
      events_(std::make_unique<SignalEventSource>(
          std::initializer_list<int>{SIGCHLD, SIGALRM, SIGTERM, SIGINT})),
      process_(std::move(deps.process)), users_(std::move(deps.users)),
      reboot_(std::move(deps.reboot)), sinks_(std::move(deps.sinks)),
      timer_(std::move(deps.timer)) {
    if (!process_ || !users_ || !reboot_ || !sinks_) {
        throw std::invalid_argument("Supervisor needs process, users, reboot and sinks backends");
    }
    if (!timer_) {
        timer_ = DeadlineTimer::create(*events_);
    }

    policy_ = std::make_unique<RebootEscalationPolicy>(*sinks_, *users_, *reboot_);
    policy_->set_blocking_policy(settings_.blocking_policy);
    policy_->set_poll_interval(settings_.user_poll_interval);
    policy_->set_grace_interval(settings_.reboot_grace);

    registry_ = std::make_unique<ProcessRegistry>(*process_, *sinks_, *policy_);
    watchdog_ = std::make_unique<TimeoutWatchdog>(*process_, *timer_, *policy_, events_.get());
    reactor_ = std::make_unique<ChildExitReactor>(*process_, *registry_, *watchdog_, *policy_);

    events_->on_signal(SIGCHLD, [this]() { reactor_->on_child_exit(); });
    events_->on_signal(SIGTERM, [this]() {
        spdlog::info("[Supervisor] SIGTERM received, shutting down");
        request_stop();
    });
    events_->on_signal(SIGINT, [this]() {
        spdlog::info("[Supervisor] SIGINT received, shutting down");
        request_stop();
    });

    spdlog::debug("[Supervisor] Ready: blocking={}, timeout={}s, poll={}s, grace={}s",
                  reboot_blocking_policy_name(settings_.blocking_policy),
                  settings_.default_timeout.count(), settings_.user_poll_interval.count(),
                  settings_.reboot_grace.count());
}

Supervisor::~Supervisor() {
    if (registry_ && registry_->size() > 0) {
        spdlog::debug("[Supervisor] Destroyed with {} tracked process(es) still running",
                      registry_->size());
    }
}

std::unique_ptr<Supervisor> Supervisor::create(const SupervisorSettings& settings, bool dry_run) {
    MessageSinksConfig sinks_config;
    sinks_config.boot_console = settings.boot_console;

    SupervisorDeps deps;
    deps.process = ProcessBackend::create();
    deps.users = UserPresenceQuery::create();
    deps.reboot = RebootBackend::create(dry_run);
    deps.sinks = MessageSinks::create(sinks_config);
    return std::make_unique<Supervisor>(settings, std::move(deps));
}

std::optional<std::string> Supervisor::run_with_timeout(const std::string& command,
                                                        std::chrono::seconds timeout) {
    return watchdog_->run(command, timeout);
}

std::optional<std::string> Supervisor::run_with_timeout(const std::string& command) {
    return watchdog_->run(command, settings_.default_timeout);
}

pid_t Supervisor::launch(const std::string& command) {
    return registry_->launch(command);
}

void Supervisor::terminate(pid_t pid) {
    registry_->terminate(pid);
}

void Supervisor::terminate_all() {
    registry_->terminate_all();
}

void Supervisor::set_reboot_blocking_policy(RebootBlockingPolicy policy) {
    policy_->set_blocking_policy(policy);
}

int Supervisor::blocking_user_count() {
    return policy_->blocking_user_count();
}

void Supervisor::message(const std::string& text, bool failure) {
    sinks_->message(text, failure);
}

EscalationResult Supervisor::escalate(const std::string& text) {
    return policy_->escalate(text);
}

std::vector<pid_t> Supervisor::child_pids(pid_t ppid) const {
    return proc_info_.child_pids(ppid);
}

std::optional<pid_t> Supervisor::wait_for_child(pid_t ppid, std::chrono::seconds timeout) const {
    return proc_info_.wait_for_child(ppid, timeout);
}

bool Supervisor::start() {
    for (const auto& startup : settings_.startup_commands) {
        std::chrono::seconds timeout =
            startup.timeout.count() > 0 ? startup.timeout : settings_.default_timeout;
        std::optional<std::string> output = run_with_timeout(startup.command, timeout);
        if (!output) {
            return false;
        }
        spdlog::info("[Supervisor] Startup command done: {}", startup.command);
        if (!output->empty()) {
            spdlog::debug("[Supervisor] Output: {}", *output);
        }
    }

    for (const auto& command : settings_.background_commands) {
        if (launch(command) == ProcessRegistry::ESCALATED_PID) {
            return false;
        }
    }
    return true;
}

void Supervisor::run() {
    spdlog::info("[Supervisor] Supervising {} background command(s)", registry_->size());
    events_->run([this]() { return stop_requested(); });

    terminate_all();
    spdlog::info("[Supervisor] Stopped");
}

} // namespace kiosk
