// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstring>

#ifndef KIOSK_VERSION
#define KIOSK_VERSION "0.0.0-dev"
#endif

namespace kiosk {

const char* kiosk_version() {
    return KIOSK_VERSION;
}

static void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>   Configuration file (default: %s)\n", DEFAULT_CONFIG_PATH);
    printf("  -v, --verbose         Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-target <t>      Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>     Log file path (when --log-target=file)\n");
    printf("  --dry-run             Announce reboots but exit instead of rebooting\n");
    printf("  -h, --help            Show this help message\n");
    printf("  -V, --version         Show version information\n");
}

/// Value of "--opt=value" or "--opt value"; nullptr (with an error) if missing
static const char* option_value(int argc, char** argv, int& i, const char* name) {
    size_t len = strlen(name);
    if (strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    fprintf(stderr, "Error: %s requires an argument\n", name);
    return nullptr;
}

static bool option_matches(const char* arg, const char* name) {
    size_t len = strlen(name);
    return strncmp(arg, name, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    const char* program = argc > 0 ? argv[0] : "kiosk-supervisor";
    args.exit_code = 0;

    for (int i = 1; i < argc; i++) {
        // Config file
        if (strcmp(argv[i], "-c") == 0 || option_matches(argv[i], "--config")) {
            const char* value =
                strcmp(argv[i], "-c") == 0 ? (i + 1 < argc ? argv[++i] : nullptr)
                                           : option_value(argc, argv, i, "--config");
            if (!value || value[0] == '\0') {
                fprintf(stderr, "Error: --config requires a path argument\n");
                args.exit_code = 1;
                return false;
            }
            args.config_path = value;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Log destination
        else if (option_matches(argv[i], "--log-target")) {
            const char* value = option_value(argc, argv, i, "--log-target");
            if (!value) {
                args.exit_code = 1;
                return false;
            }
            args.log_target = value;
            if (args.log_target != "auto" && args.log_target != "journal" &&
                args.log_target != "syslog" && args.log_target != "file" &&
                args.log_target != "console") {
                fprintf(stderr, "Error: invalid --log-target value: %s\n", value);
                fprintf(stderr, "Valid values: auto, journal, syslog, file, console\n");
                args.exit_code = 1;
                return false;
            }
        } else if (option_matches(argv[i], "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value) {
                args.exit_code = 1;
                return false;
            }
            args.log_file = value;
        } else if (strcmp(argv[i], "--dry-run") == 0) {
            args.dry_run = true;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(program);
            return false;
        }
        // Version
        else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            printf("kiosk-supervisor %s\n", kiosk_version());
            return false;
        }
        // Unknown argument
        else {
            fprintf(stderr, "Unknown argument: %s\n", argv[i]);
            fprintf(stderr, "Use --help for usage information\n");
            args.exit_code = 1;
            return false;
        }
    }

    return true;
}

} // namespace kiosk
