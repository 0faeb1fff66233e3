// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor/message_sinks.h"

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <set>
#include <unistd.h>

namespace kiosk {

// =============================================================================
// CriticalSyslogSink
// =============================================================================

namespace {

/// openlog() keeps the ident pointer, so the string must live as long as the process
const char* persistent_ident(const std::string& ident) {
    static std::mutex mutex;
    static std::set<std::string> idents;
    std::lock_guard<std::mutex> lock(mutex);
    return idents.insert(ident).first->c_str();
}

} // namespace

CriticalSyslogSink::CriticalSyslogSink(const std::string& ident) {
    // The connection is process-wide and shared with the diagnostic syslog
    // sink, so it is never closed from here
    ::openlog(ident.empty() ? nullptr : persistent_ident(ident), LOG_PID, LOG_DAEMON);
}

void CriticalSyslogSink::sink_it_(const spdlog::details::log_msg& msg) {
    ::syslog(PRIORITY, "%.*s", static_cast<int>(msg.payload.size()), msg.payload.data());
}

// =============================================================================
// BootConsoleSink
// =============================================================================

BootConsoleSink::BootConsoleSink(std::string device) : device_(std::move(device)) {}

std::string BootConsoleSink::format_line(const std::string& text, bool failure) {
    static constexpr const char* RED = "\033[0;31m";
    static constexpr const char* GREEN = "\033[0;32m";
    static constexpr const char* NC = "\033[0m";

    if (failure) {
        return std::string("[") + RED + "FAILED" + NC + "] " + text;
    }
    return std::string("[") + GREEN + "  OK  " + NC + "] " + text;
}

void BootConsoleSink::sink_it_(const spdlog::details::log_msg& msg) {
    bool failure = msg.level >= spdlog::level::err;
    std::string line =
        format_line(std::string(msg.payload.data(), msg.payload.size()), failure) + "\n";

    std::FILE* console = std::fopen(device_.c_str(), "a");
    if (!console) {
        spdlog::throw_spdlog_ex("Cannot open boot console " + device_, errno);
    }
    size_t written = std::fwrite(line.data(), 1, line.size(), console);
    int saved_errno = errno;
    std::fclose(console);
    if (written != line.size()) {
        spdlog::throw_spdlog_ex("Short write to boot console " + device_, saved_errno);
    }
}

// =============================================================================
// MessageSinks
// =============================================================================

MessageSinks::MessageSinks(std::vector<spdlog::sink_ptr> sinks) {
    for (auto& sink : sinks) {
        sink->set_pattern("%v");
    }
    logger_ = std::make_shared<spdlog::logger>("announce", sinks.begin(), sinks.end());
    logger_->set_level(spdlog::level::trace);
    logger_->flush_on(spdlog::level::trace);
    logger_->set_error_handler([this](const std::string& err) {
        ++error_count_;
        // Not through spdlog: the failing sink may be the one we would log to
        fprintf(stderr, "[Announce] Message sink failed: %s\n", err.c_str());
    });
}

void MessageSinks::message(const std::string& text, bool failure) {
    logger_->log(failure ? spdlog::level::critical : spdlog::level::info, "{}", text);
}

size_t MessageSinks::sink_count() const {
    return logger_->sinks().size();
}

std::unique_ptr<MessageSinks> MessageSinks::create(const MessageSinksConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.device_log) {
        sinks.push_back(std::make_shared<CriticalSyslogSink>(config.ident));
    }

    if (config.boot_console) {
        if (geteuid() == 0) {
            sinks.push_back(std::make_shared<BootConsoleSink>(config.console_device));
        } else {
            spdlog::debug("[Announce] Not root, boot console messages disabled");
        }
    }

    if (config.standard_output) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    }

    spdlog::debug("[Announce] {} message sink(s) configured", sinks.size());
    return std::make_unique<MessageSinks>(std::move(sinks));
}

} // namespace kiosk
