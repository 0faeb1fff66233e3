// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief kiosk-supervisor daemon entry point
 *
 * Runs the configured startup commands under the timeout watchdog, launches
 * the background commands (viewers), then supervises them until told to stop.
 * Any startup hang, startup failure or unexpected viewer exit reboots the
 * device (unless an operator is logged in).
 */

#include "cli_args.h"
#include "config.h"
#include "logging_init.h"
#include "supervisor/supervisor.h"
#include "supervisor/supervisor_errors.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>

using namespace kiosk;

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.exit_code;
    }

    // Console-only logging until the config file tells us where to log
    logging::LogConfig log_config;
    log_config.level = logging::resolve_log_level(args.verbosity, "", args.dry_run);
    log_config.target = logging::LogTarget::Console;
    logging::init(log_config);

    Config* config = Config::get_instance();
    config->init(args.config_path);

    log_config.level = logging::resolve_log_level(
        args.verbosity, config->get<std::string>("/log_level", ""), args.dry_run);
    log_config.target = logging::parse_log_target(
        args.log_target.empty() ? config->get<std::string>("/log_target", "auto")
                                : args.log_target);
    log_config.file_path =
        args.log_file.empty() ? config->get<std::string>("/log_file", "") : args.log_file;
    logging::init(log_config);

    spdlog::info("[Main] kiosk-supervisor {} starting (config {}){}", kiosk_version(),
                 config->get_path(), args.dry_run ? " [dry run]" : "");

    SupervisorSettings settings = SupervisorSettings::from_config(*config);

    try {
        std::unique_ptr<Supervisor> supervisor = Supervisor::create(settings, args.dry_run);
        if (!supervisor->events().valid()) {
            spdlog::critical("[Main] Signal handling unavailable, cannot supervise");
            return EXIT_FAILURE;
        }

        if (!supervisor->start()) {
            // Escalation returned: only a dry-run or test backend gets here
            spdlog::error("[Main] Startup escalated");
            return EXIT_FAILURE;
        }

        supervisor->run();
    } catch (const SupervisorError& e) {
        spdlog::critical("[Main] {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::critical("[Main] Unexpected error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("[Main] Exiting");
    spdlog::shutdown();
    return EXIT_SUCCESS;
}
