// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file logging_init.h
 * @brief Diagnostic logger setup (console + journal/syslog/file)
 *
 * This is the daemon's own diagnostic log. Operator announcements go through
 * MessageSinks instead and are not affected by the level chosen here.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace kiosk {
namespace logging {

enum class LogTarget {
    Auto,    ///< journal when available, syslog otherwise
    Journal, ///< systemd journal (needs KIOSK_HAS_SYSTEMD)
    Syslog,
    File,    ///< rotating file, see LogConfig::file_path
    Console, ///< stdout only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< Override for LogTarget::File, empty = default location
};

/**
 * @brief Build and install the default spdlog logger
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace" ... "off", "warning" accepted)
 *
 * Case sensitive. Returns @p default_level for anything unrecognized.
 */
spdlog::level::level_enum
parse_level(const std::string& str, spdlog::level::level_enum default_level = spdlog::level::warn);

/// -v = info, -vv = debug, -vvv = trace, none = warn
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Pick the effective level
 *
 * CLI verbosity wins over the config file value, which wins over the
 * default (debug in dry-run mode, warn otherwise).
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level,
                                            bool dry_run);

/// Unknown names map to LogTarget::Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace kiosk
