#pragma once

#include "access/access_export.hpp"
#include "audit/auditlog.hpp"
#include "core/clock.hpp"
#include <memory>
#include <string>

namespace lockbox::storage {
class Database;
}

namespace lockbox::invites {

/**
 * @brief One-way revocation of invites and shares
 *
 * Both operations are idempotent. Revoking an invite leaves the shares
 * already granted through it in place.
 */
class LOCKBOX_ACCESS_EXPORT RevocationManager {
public:
    RevocationManager(std::shared_ptr<storage::Database> db,
                      std::shared_ptr<audit::AuditLog> auditLog);

    /**
     * @brief Stop an invite from being redeemed again
     * @throws core::NotFoundError if the invite does not exist
     * @throws core::AuthorizationError if the caller does not own the invite's room
     */
    void revokeInvite(const std::string& inviteId,
                      const std::string& callerId,
                      const audit::RequestContext& origin = {});

    /**
     * @brief Withdraw a user's access to a room
     * @throws core::NotFoundError if the room or share does not exist
     * @throws core::AuthorizationError if the caller does not own the room
     * @throws core::ValidationError when targeting the owner's own share
     */
    void revokeShare(const std::string& roomId,
                     const std::string& userId,
                     const std::string& callerId,
                     const audit::RequestContext& origin = {});

private:
    std::shared_ptr<storage::Database> db_;
    std::shared_ptr<audit::AuditLog> auditLog_;
};

} // namespace lockbox::invites
