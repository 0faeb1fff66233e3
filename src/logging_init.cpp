// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>

#ifdef KIOSK_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>
#include <utility>
#include <vector>

namespace kiosk {
namespace logging {

namespace {

constexpr const char* LOG_IDENT = "kiosk-supervisor";
constexpr const char* SYSTEM_LOG_FILE = "/var/log/kiosk-supervisor.log";
constexpr size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_ROTATIONS = 3;

// journald and syslog stamp time and PID themselves
constexpr const char* SYSTEM_PATTERN = "[%l] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%P] [%l] %v";

const std::pair<const char*, spdlog::level::level_enum> LEVEL_NAMES[] = {
    {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn}, {"error", spdlog::level::err},
    {"critical", spdlog::level::critical}, {"off", spdlog::level::off},
};

const std::pair<const char*, LogTarget> TARGET_NAMES[] = {
    {"auto", LogTarget::Auto}, {"journal", LogTarget::Journal}, {"syslog", LogTarget::Syslog},
    {"file", LogTarget::File}, {"console", LogTarget::Console},
};

/**
 * @brief Where LogTarget::File writes when no path was configured
 *
 * The daemon normally runs as root from an init script; an unprivileged
 * dry run falls back to $XDG_STATE_HOME (or ~/.local/state).
 */
std::string default_log_file() {
    if (access("/var/log", W_OK) == 0) {
        return SYSTEM_LOG_FILE;
    }

    std::string state_dir;
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && xdg[0] != '\0') {
        state_dir = xdg;
    } else if (const char* home = std::getenv("HOME"); home && home[0] != '\0') {
        state_dir = std::string(home) + "/.local/state";
    } else {
        state_dir = "/tmp";
    }

    std::filesystem::path dir = std::filesystem::path(state_dir) / "kiosk-supervisor";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return (dir / "supervisor.log").string();
}

LogTarget detect_best_target() {
#ifdef KIOSK_HAS_SYSTEMD
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
    return LogTarget::Syslog;
}

spdlog::sink_ptr make_syslog_sink() {
    auto sink =
        std::make_shared<spdlog::sinks::syslog_sink_mt>(LOG_IDENT, LOG_PID, LOG_DAEMON, false);
    sink->set_pattern(SYSTEM_PATTERN);
    return sink;
}

/// Sink for @p target, or nullptr when the console alone covers it
spdlog::sink_ptr make_target_sink(LogTarget target, const std::string& file_path) {
    switch (target) {
    case LogTarget::Journal: {
#ifdef KIOSK_HAS_SYSTEMD
        auto sink = std::make_shared<spdlog::sinks::systemd_sink_mt>(LOG_IDENT);
        sink->set_pattern(SYSTEM_PATTERN);
        return sink;
#else
        fprintf(stderr, "[Logging] Built without libsystemd, logging to syslog instead\n");
        return make_syslog_sink();
#endif
    }
    case LogTarget::Syslog:
        return make_syslog_sink();
    case LogTarget::File: {
        std::string path = file_path.empty() ? default_log_file() : file_path;
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path, LOG_FILE_MAX_BYTES, LOG_FILE_ROTATIONS);
        sink->set_pattern(FILE_PATTERN);
        return sink;
    }
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
    }
    return nullptr;
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget target = config.target == LogTarget::Auto ? detect_best_target() : config.target;

    try {
        if (auto sink = make_target_sink(target, config.file_path)) {
            sinks.push_back(std::move(sink));
        }
    } catch (const spdlog::spdlog_ex& e) {
        // The logger is not up yet, so this is the only place to say so
        fprintf(stderr, "[Logging] Cannot open %s log: %s\n", log_target_name(target), e.what());
    }

    auto logger = std::make_shared<spdlog::logger>("kiosk", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    // Escalation messages must reach disk before the reboot
    logger->flush_on(spdlog::level::err);
    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] target={} console={} level={}", log_target_name(target),
                  config.enable_console, spdlog::level::to_string_view(config.level));
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    for (const auto& [name, level] : LEVEL_NAMES) {
        if (str == name) {
            return level;
        }
    }
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity > 2 ? spdlog::level::trace : spdlog::level::warn;
    }
}

spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level,
                                            bool dry_run) {
    if (cli_verbosity > 0) {
        return verbosity_to_level(cli_verbosity);
    }
    auto mode_default = dry_run ? spdlog::level::debug : spdlog::level::warn;
    return parse_level(config_level, mode_default);
}

LogTarget parse_log_target(const std::string& str) {
    for (const auto& [name, target] : TARGET_NAMES) {
        if (str == name) {
            return target;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    for (const auto& [name, value] : TARGET_NAMES) {
        if (value == target) {
            return name;
        }
    }
    return "unknown";
}

} // namespace logging
} // namespace kiosk
