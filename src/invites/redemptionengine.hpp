#pragma once

#include "access/access_export.hpp"
#include "audit/auditlog.hpp"
#include "core/clock.hpp"
#include "sharing/shareregistry.hpp"
#include <memory>
#include <string>

namespace lockbox::core {
class TokenCodec;
}

namespace lockbox::storage {
class Connection;
class Database;
}

namespace lockbox::invites {

struct Invite;

/**
 * @brief Converts a presented invite token into a share
 *
 * Gates are checked in a fixed order, each terminal:
 *   unknown token   -> core::NotFoundError
 *   revoked         -> InviteStateError(Revoked)
 *   expired         -> InviteStateError(Expired)
 *   email mismatch  -> InviteStateError(EmailMismatch)
 *   no uses left    -> InviteStateError(Exhausted)
 *
 * The use counter increment is a conditional UPDATE inside a write
 * transaction, so concurrent redemptions never push uses_count past
 * max_uses. The share upsert and audit event commit with the increment or
 * not at all.
 */
class LOCKBOX_ACCESS_EXPORT RedemptionEngine {
public:
    RedemptionEngine(std::shared_ptr<storage::Database> db,
                     std::shared_ptr<const core::Clock> clock,
                     std::shared_ptr<const core::TokenCodec> codec,
                     std::shared_ptr<audit::AuditLog> auditLog);

    /**
     * @brief Redeem one use of an invite
     * @param rawToken Token as presented by the guest
     * @param userId Authenticated caller
     * @param userEmail Authenticated caller's email
     * @return The created or refreshed share
     * @throws core::AuthorizationError if the caller's share in the room was revoked
     * @throws core::TransientStorageError if the database is busy
     */
    sharing::Share acceptInvite(const std::string& rawToken,
                                const std::string& userId,
                                const std::string& userEmail,
                                const audit::RequestContext& origin = {});

private:
    std::shared_ptr<storage::Database> db_;
    std::shared_ptr<const core::Clock> clock_;
    std::shared_ptr<const core::TokenCodec> codec_;
    std::shared_ptr<audit::AuditLog> auditLog_;

    void checkGates(const Invite& invite, const std::string& userEmail, core::TimePoint now) const;
    bool consumeUse(storage::Connection& conn, const std::string& inviteId) const;
};

} // namespace lockbox::invites
