#pragma once

#include "access/access_export.hpp"
#include "audit/auditlog.hpp"
#include "core/clock.hpp"
#include "invites/invite.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lockbox::core {
class TokenCodec;
}

namespace lockbox::storage {
class Database;
}

namespace lockbox::invites {

// Upper bound for expires_hours and grant_hours (ten years)
constexpr int64_t MAX_POLICY_HOURS = 24 * 365 * 10;

struct InviteOptions {
    std::optional<std::string> allowedEmail;
    std::optional<int64_t> maxUses;
    std::optional<int64_t> expiresHours;
    bool singleUse = false;
    std::optional<int64_t> grantHours;
};

/**
 * @brief Result of createInvite; the only place the raw token ever appears
 */
struct IssuedInvite {
    std::string inviteId;
    std::string rawToken;
    std::string linkPath;  // /invites/accept?token=<rawToken>
};

struct InviteSummary {
    Invite invite;
    InviteStatus status = InviteStatus::Active;
};

/**
 * @brief Creates invites for room owners
 */
class LOCKBOX_ACCESS_EXPORT InviteIssuer {
public:
    InviteIssuer(std::shared_ptr<storage::Database> db,
                 std::shared_ptr<const core::Clock> clock,
                 std::shared_ptr<const core::TokenCodec> codec,
                 std::shared_ptr<audit::AuditLog> auditLog);

    /**
     * @brief Validate and normalize invite constraints
     *
     * single_use forces max_uses to 1 and overrides any supplied value.
     * Otherwise max_uses, expires_hours and grant_hours must be positive
     * when present. The email is trimmed.
     *
     * @throws core::ValidationError on any malformed constraint
     */
    static InviteOptions normalize(const InviteOptions& options);

    /**
     * @brief Persist a new invite
     * @param roomId Room the invite grants access to
     * @param creatorId Must own the room
     * @param options Constraints, see normalize()
     * @return Invite id and the raw token, returned exactly once
     * @throws core::NotFoundError if the room does not exist
     * @throws core::AuthorizationError if the creator does not own the room
     * @throws core::ValidationError on malformed constraints
     */
    IssuedInvite createInvite(const std::string& roomId,
                              const std::string& creatorId,
                              const InviteOptions& options,
                              const audit::RequestContext& origin = {});

    /**
     * @brief Invites of a room with their derived status, oldest first
     * @param callerId Must own the room
     */
    std::vector<InviteSummary> listInvites(const std::string& roomId,
                                           const std::string& callerId) const;

private:
    std::shared_ptr<storage::Database> db_;
    std::shared_ptr<const core::Clock> clock_;
    std::shared_ptr<const core::TokenCodec> codec_;
    std::shared_ptr<audit::AuditLog> auditLog_;
};

} // namespace lockbox::invites
