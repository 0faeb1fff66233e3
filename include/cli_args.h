// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for kiosk-supervisor
 */

#include <string>

namespace kiosk {

constexpr const char* DEFAULT_CONFIG_PATH = "/etc/kiosk-supervisor.json";

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path = DEFAULT_CONFIG_PATH;

    // Logging
    int verbosity = 0;
    std::string log_target; // empty = use config file value
    std::string log_file;   // empty = use config file value

    // Log reboot decisions and exit instead of rebooting
    bool dry_run = false;

    // Set when parse_cli_args() returns false: 0 after --help/--version, 1 on error
    int exit_code = 0;
};

/**
 * @brief Parse command-line arguments
 *
 * Usage and error text go to stdout/stderr.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true to continue starting up, false if the program should exit
 *         with args.exit_code (help/version shown, or invalid arguments)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

/// Version string baked in at build time
const char* kiosk_version();

} // namespace kiosk
