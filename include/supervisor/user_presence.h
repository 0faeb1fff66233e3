// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <memory>
#include <string>

namespace kiosk {

/**
 * @brief Which logged-in users hold off a pending reboot
 *
 * - AnyUsers: any interactive session (console, desktop or SSH)
 * - SSHUsers: only remote sessions; a desktop login does not block
 * - NoUsers:  nobody blocks the reboot
 */
enum class RebootBlockingPolicy { AnyUsers, SSHUsers, NoUsers };

/**
 * @brief Parse a policy name from configuration
 *
 * Accepts "any", "ssh", "none" (and the AnyUsers/SSHUsers/NoUsers spellings),
 * case-insensitive.
 *
 * @throws std::invalid_argument for anything else
 */
RebootBlockingPolicy parse_reboot_blocking_policy(const std::string& name);

const char* reboot_blocking_policy_name(RebootBlockingPolicy policy);

/**
 * @brief Counts interactive login sessions
 *
 * Narrow boundary to the host's session database. The supervisor only needs
 * a count; it never enumerates or acts on individual sessions.
 */
class UserPresenceQuery {
  public:
    virtual ~UserPresenceQuery() = default;

    /**
     * @param remote_only Count only sessions that came in over the network
     * @return Number of matching sessions (0 if the database is unreadable)
     */
    virtual int count_interactive_users(bool remote_only) = 0;

    /**
     * @brief Factory: utmp-backed query
     */
    static std::unique_ptr<UserPresenceQuery> create();
};

} // namespace kiosk
