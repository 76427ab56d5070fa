#include "invites/revocationmanager.hpp"
#include "audit/auditlog.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "invites/invite.hpp"
#include "rooms/roomregistry.hpp"
#include "sharing/shareregistry.hpp"
#include "storage/database.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace lockbox::invites {

namespace sql {
    const char* REVOKE_INVITE =
        "UPDATE invites SET revoked = 1 WHERE id = ? AND revoked = 0";
}

RevocationManager::RevocationManager(std::shared_ptr<storage::Database> db,
                                     std::shared_ptr<audit::AuditLog> auditLog)
    : db_(std::move(db)), auditLog_(std::move(auditLog)) {
    if (!db_ || !auditLog_) {
        throw std::invalid_argument("RevocationManager requires a database and audit log");
    }
}

void RevocationManager::revokeInvite(const std::string& inviteId,
                                     const std::string& callerId,
                                     const audit::RequestContext& origin) {
    auto conn = db_->acquire();
    storage::Transaction tx(*conn);

    auto invite = fetchInviteById(*conn, inviteId);
    if (!invite) {
        throw core::NotFoundError("Invite not found: " + inviteId);
    }
    rooms::RoomRegistry::ensureOwner(*conn, invite->roomId, callerId);

    if (invite->revoked) {
        tx.commit();
        return;
    }

    auto stmt = conn->prepare(sql::REVOKE_INVITE);
    stmt.bindText(1, inviteId);
    stmt.run();

    nlohmann::json details = {
        {"room_id", invite->roomId},
        {"uses_count", invite->usesCount}
    };
    auditLog_->recordEvent(*conn, {callerId, audit::action::REVOKE_INVITE,
                                   std::string("invite"), inviteId, details.dump()}, origin);
    tx.commit();

    core::Log::info("revocation", "Revoked invite " + inviteId);
}

void RevocationManager::revokeShare(const std::string& roomId,
                                    const std::string& userId,
                                    const std::string& callerId,
                                    const audit::RequestContext& origin) {
    auto conn = db_->acquire();
    storage::Transaction tx(*conn);

    auto room = rooms::RoomRegistry::ensureOwner(*conn, roomId, callerId);
    if (userId == room.ownerId) {
        throw core::ValidationError("The room owner's access cannot be revoked");
    }

    auto share = sharing::ShareRegistry::fetch(*conn, roomId, userId);
    if (!share) {
        throw core::NotFoundError("No share for user " + userId + " in room " + roomId);
    }
    if (share->revoked) {
        tx.commit();
        return;
    }

    sharing::ShareRegistry::markRevoked(*conn, roomId, userId);

    nlohmann::json details = {
        {"room_id", roomId},
        {"user_id", userId}
    };
    auditLog_->recordEvent(*conn, {callerId, audit::action::REVOKE_ACCESS,
                                   std::string("share"), share->id, details.dump()}, origin);
    tx.commit();

    core::Log::info("revocation", "Revoked access of " + userId + " to room " + roomId);
}

} // namespace lockbox::invites
