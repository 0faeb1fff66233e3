// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file message_sinks.h
 * @brief Three-way operator announcements (device log, boot console, stdout)
 *
 * Supervisor announcements ("BackgroundCommand ...", "Timeout ...",
 * "Rebooting") must be visible wherever someone might be looking:
 *
 * 1. The device log: syslog, always LOG_CRIT in the daemon facility
 * 2. The boot console (/dev/tty0): "[  OK  ] msg" in green or
 *    "[FAILED] msg" in red, only when running as root
 * 3. stdout, captured by whatever started the daemon
 *
 * The sinks sit behind a dedicated spdlog logger, separate from the default
 * diagnostic logger. spdlog guards every sink individually, so a sink that
 * throws (unwritable console, full disk) is reported through the error
 * handler and the remaining sinks still get the message.
 */

#pragma once

#include <spdlog/logger.h>
#include <spdlog/sinks/base_sink.h>

#include <memory>
#include <mutex>
#include <string>
#include <syslog.h>
#include <vector>

namespace kiosk {

/**
 * @brief syslog sink with a fixed LOG_CRIT priority
 *
 * spdlog's syslog_sink maps each level to its own priority; announcements
 * always go to the system log at critical severity regardless of level.
 */
class CriticalSyslogSink : public spdlog::sinks::base_sink<std::mutex> {
  public:
    /// Same facility as the diagnostic log, so both land in one place
    static constexpr int PRIORITY = LOG_CRIT | LOG_DAEMON;

    explicit CriticalSyslogSink(const std::string& ident);

  protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}
};

/**
 * @brief Boot-screen style console sink
 *
 * Messages at err or above are tagged FAILED in red, everything else OK in
 * green, matching the init system's own boot lines. The device is opened for
 * every message so a console that comes and goes (VT switch, fbcon reload)
 * does not leave a stale handle behind. Throws spdlog::spdlog_ex if the
 * device cannot be written.
 */
class BootConsoleSink : public spdlog::sinks::base_sink<std::mutex> {
  public:
    static constexpr const char* DEFAULT_DEVICE = "/dev/tty0";

    explicit BootConsoleSink(std::string device = DEFAULT_DEVICE);

    const std::string& device() const {
        return device_;
    }

    /// Format one console line (exposed for tests)
    static std::string format_line(const std::string& text, bool failure);

  protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}

  private:
    std::string device_;
};

struct MessageSinksConfig {
    std::string ident = "kiosk-supervisor";        ///< syslog identity
    std::string console_device = BootConsoleSink::DEFAULT_DEVICE;
    bool boot_console = true;                      ///< Only honoured when running as root
    bool device_log = true;
    bool standard_output = true;
};

class MessageSinks {
  public:
    /**
     * @brief Build from explicit sinks (tests, custom deployments)
     */
    explicit MessageSinks(std::vector<spdlog::sink_ptr> sinks);

    /**
     * @brief Emit @p text on every sink
     *
     * @param text Message; an empty string emits a blank separator line
     * @param failure true tags the line as a failure (critical level)
     */
    void message(const std::string& text, bool failure = false);

    size_t sink_count() const;

    /// Number of sink failures reported since construction
    size_t error_count() const {
        return error_count_;
    }

    /**
     * @brief Factory: syslog + boot console (root only) + stdout
     */
    static std::unique_ptr<MessageSinks> create(const MessageSinksConfig& config);

  private:
    std::shared_ptr<spdlog::logger> logger_;
    size_t error_count_ = 0;
};

} // namespace kiosk
