#pragma once

#include "access/access_export.hpp"
#include "core/clock.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace lockbox::storage {
class Connection;
class Statement;
}

namespace lockbox::invites {

/**
 * @brief Persisted redemption policy for one token
 *
 * Only the token hash is stored. Invites are never deleted.
 */
struct Invite {
    std::string id;
    std::string roomId;
    std::string creatorId;
    std::optional<std::string> allowedEmail;
    std::string tokenHash;
    std::optional<int64_t> maxUses;  // Absent means unlimited
    bool singleUse = false;
    int64_t usesCount = 0;
    std::optional<int64_t> grantHours;  // Lifetime of granted shares, absent means unlimited
    std::optional<core::TimePoint> expiresAt;
    bool revoked = false;
    core::TimePoint createdAt;
};

/**
 * @brief Lifecycle label of an invite
 *
 * Only Revoked is stored; Expired and Exhausted are computed from the clock
 * and the use counter whenever the invite is read or redeemed.
 */
enum class InviteStatus {
    Active,
    Revoked,
    Expired,
    Exhausted
};

/**
 * @brief Evaluate the terminal conditions in redemption gate order
 */
LOCKBOX_ACCESS_EXPORT InviteStatus deriveStatus(const Invite& invite, core::TimePoint now);

LOCKBOX_ACCESS_EXPORT const char* statusName(InviteStatus status);

LOCKBOX_ACCESS_EXPORT std::optional<Invite> fetchInviteById(storage::Connection& conn,
                                                            const std::string& inviteId);

LOCKBOX_ACCESS_EXPORT std::optional<Invite> fetchInviteByTokenHash(storage::Connection& conn,
                                                                   const std::string& tokenHash);

} // namespace lockbox::invites
