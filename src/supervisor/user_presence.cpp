// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor/user_presence.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <utmpx.h>

namespace kiosk {

RebootBlockingPolicy parse_reboot_blocking_policy(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "any" || lower == "anyusers")
        return RebootBlockingPolicy::AnyUsers;
    if (lower == "ssh" || lower == "sshusers")
        return RebootBlockingPolicy::SSHUsers;
    if (lower == "none" || lower == "nousers")
        return RebootBlockingPolicy::NoUsers;

    throw std::invalid_argument("Unknown reboot blocking policy '" + name +
                                "' (expected any, ssh or none)");
}

const char* reboot_blocking_policy_name(RebootBlockingPolicy policy) {
    switch (policy) {
    case RebootBlockingPolicy::AnyUsers:
        return "any";
    case RebootBlockingPolicy::SSHUsers:
        return "ssh";
    case RebootBlockingPolicy::NoUsers:
        return "none";
    }
    return "unknown";
}

namespace {

/**
 * @brief utmp session counter
 *
 * A USER_PROCESS record is one login. Remote logins carry the peer address
 * in ut_host; local X sessions record their display (":0") there instead,
 * so those are not counted as remote.
 */
class UtmpUserPresence : public UserPresenceQuery {
  public:
    int count_interactive_users(bool remote_only) override {
        int count = 0;

        setutxent();
        while (struct utmpx* entry = getutxent()) {
            if (entry->ut_type != USER_PROCESS) {
                continue;
            }
            if (remote_only && !is_remote(entry)) {
                continue;
            }
            ++count;
        }
        endutxent();

        spdlog::trace("[Users] {} {} session(s)", count, remote_only ? "remote" : "interactive");
        return count;
    }

  private:
    static bool is_remote(const struct utmpx* entry) {
        size_t len = strnlen(entry->ut_host, sizeof(entry->ut_host));
        if (len == 0) {
            return false;
        }
        return entry->ut_host[0] != ':';
    }
};

} // namespace

std::unique_ptr<UserPresenceQuery> UserPresenceQuery::create() {
    return std::make_unique<UtmpUserPresence>();
}

} // namespace kiosk
