// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor/message_sinks.h"

#include "../mocks/capture_sink.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace kiosk;

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() /
            ("kiosk_sinks_" + std::to_string(getpid()) + "_" + name))
        .string();
}

std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

// ============================================================================
// Boot console formatting
// ============================================================================

TEST_CASE("BootConsoleSink: OK and FAILED tags", "[supervisor][sinks]") {
    REQUIRE(BootConsoleSink::format_line("BackgroundCommand feh (PID 7)", false) ==
            "[\033[0;32m  OK  \033[0m] BackgroundCommand feh (PID 7)");
    REQUIRE(BootConsoleSink::format_line("Rebooting ", true) ==
            "[\033[0;31mFAILED\033[0m] Rebooting ");
}

TEST_CASE("BootConsoleSink: writes one line per message", "[supervisor][sinks]") {
    std::string path = temp_path("console");
    std::filesystem::remove(path);

    {
        auto console = std::make_shared<BootConsoleSink>(path);
        MessageSinks sinks({console});
        sinks.message("BackgroundCommand viewer (PID 12)");
        sinks.message("Timeout (5 secs) executing hang", true);
        REQUIRE(sinks.error_count() == 0);
    }

    std::string written = slurp(path);
    REQUIRE(written == "[\033[0;32m  OK  \033[0m] BackgroundCommand viewer (PID 12)\n"
                       "[\033[0;31mFAILED\033[0m] Timeout (5 secs) executing hang\n");

    std::filesystem::remove(path);
}

// ============================================================================
// CriticalSyslogSink
// ============================================================================

TEST_CASE("CriticalSyslogSink: critical severity in the daemon facility", "[supervisor][sinks]") {
    REQUIRE(LOG_PRI(CriticalSyslogSink::PRIORITY) == LOG_CRIT);
    REQUIRE(LOG_FAC(CriticalSyslogSink::PRIORITY) == LOG_FAC(LOG_DAEMON));
}

TEST_CASE("CriticalSyslogSink: outlives its ident and survives sink turnover",
          "[supervisor][sinks]") {
    {
        std::string ident = "kiosk-test-" + std::to_string(getpid());
        MessageSinks sinks({std::make_shared<CriticalSyslogSink>(ident)});
        sinks.message("first announcement", true);
    }
    // A second sink after the first is gone keeps using the shared connection
    MessageSinks sinks({std::make_shared<CriticalSyslogSink>("kiosk-test")});
    sinks.message("second announcement", true);
    REQUIRE(sinks.error_count() == 0);
}

// ============================================================================
// Sink isolation
// ============================================================================

TEST_CASE("MessageSinks: unwritable console does not stop other sinks", "[supervisor][sinks]") {
    auto console = std::make_shared<BootConsoleSink>("/nonexistent-dir/tty0");
    auto capture = std::make_shared<CaptureSink>();
    MessageSinks sinks({console, capture});

    sinks.message("Stopping viewer (PID 3)");
    sinks.message("Rebooting ", true);

    REQUIRE(capture->texts() == std::vector<std::string>{"Stopping viewer (PID 3)", "Rebooting "});
    REQUIRE(sinks.error_count() == 2);
}

TEST_CASE("MessageSinks: failure flag maps to severity", "[supervisor][sinks]") {
    auto capture = std::make_shared<CaptureSink>();
    MessageSinks sinks({capture});

    sinks.message("fine");
    sinks.message("broken", true);
    sinks.message("");

    auto messages = capture->messages();
    REQUIRE(messages.size() == 3);
    REQUIRE(messages[0].level == spdlog::level::info);
    REQUIRE(messages[1].level == spdlog::level::critical);
    REQUIRE(messages[2].text.empty());
}

TEST_CASE("MessageSinks: factory honours the config switches", "[supervisor][sinks]") {
    MessageSinksConfig config;
    config.device_log = false;
    config.boot_console = false;
    config.standard_output = true;

    auto sinks = MessageSinks::create(config);
    REQUIRE(sinks->sink_count() == 1);

    config.device_log = true;
    sinks = MessageSinks::create(config);
    REQUIRE(sinks->sink_count() == 2);
}
