#include "invites/redemptionengine.hpp"
#include "audit/auditlog.hpp"
#include "core/encoding.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/tokencodec.hpp"
#include "invites/invite.hpp"
#include "storage/database.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace lockbox::invites {

namespace sql {
    // Zero rows changed means another redemption or a revocation got there first
    const char* CONSUME_USE = R"(
        UPDATE invites SET uses_count = uses_count + 1
        WHERE id = ? AND revoked = 0 AND (max_uses IS NULL OR uses_count < max_uses)
    )";
}

using core::InviteStateError;

RedemptionEngine::RedemptionEngine(std::shared_ptr<storage::Database> db,
                                   std::shared_ptr<const core::Clock> clock,
                                   std::shared_ptr<const core::TokenCodec> codec,
                                   std::shared_ptr<audit::AuditLog> auditLog)
    : db_(std::move(db)),
      clock_(std::move(clock)),
      codec_(std::move(codec)),
      auditLog_(std::move(auditLog)) {
    if (!db_ || !clock_ || !codec_ || !auditLog_) {
        throw std::invalid_argument("RedemptionEngine is missing a dependency");
    }
}

void RedemptionEngine::checkGates(const Invite& invite,
                                  const std::string& userEmail,
                                  core::TimePoint now) const {
    if (invite.revoked) {
        throw InviteStateError(InviteStateError::Reason::Revoked);
    }
    if (invite.expiresAt && *invite.expiresAt <= now) {
        throw InviteStateError(InviteStateError::Reason::Expired);
    }
    if (invite.allowedEmail &&
        core::canonicalEmail(*invite.allowedEmail) != core::canonicalEmail(userEmail)) {
        throw InviteStateError(InviteStateError::Reason::EmailMismatch);
    }
    if (invite.maxUses && invite.usesCount >= *invite.maxUses) {
        throw InviteStateError(InviteStateError::Reason::Exhausted);
    }
}

bool RedemptionEngine::consumeUse(storage::Connection& conn, const std::string& inviteId) const {
    auto stmt = conn.prepare(sql::CONSUME_USE);
    stmt.bindText(1, inviteId);
    stmt.run();
    return conn.changes() == 1;
}

sharing::Share RedemptionEngine::acceptInvite(const std::string& rawToken,
                                              const std::string& userId,
                                              const std::string& userEmail,
                                              const audit::RequestContext& origin) {
    if (userId.empty()) {
        throw core::ValidationError("User id must not be empty");
    }
    if (rawToken.empty()) {
        throw core::NotFoundError("Invite not found");
    }

    const std::string tokenHash = codec_->hash(rawToken);

    auto conn = db_->acquire();
    storage::Transaction tx(*conn, storage::Transaction::Mode::Immediate);
    const core::TimePoint now = clock_->now();

    auto invite = fetchInviteByTokenHash(*conn, tokenHash);
    if (!invite || !codec_->matches(rawToken, invite->tokenHash)) {
        throw core::NotFoundError("Invite not found");
    }

    checkGates(*invite, userEmail, now);

    if (!consumeUse(*conn, invite->id)) {
        // Lost a race; report what the winner left behind
        auto fresh = fetchInviteById(*conn, invite->id);
        if (fresh && fresh->revoked) {
            throw InviteStateError(InviteStateError::Reason::Revoked);
        }
        throw InviteStateError(InviteStateError::Reason::Exhausted);
    }

    std::optional<core::TimePoint> shareExpiry;
    if (invite->grantHours) {
        shareExpiry = now + std::chrono::hours(*invite->grantHours);
    }
    if (!sharing::ShareRegistry::upsertFromInvite(*conn, invite->roomId, userId,
                                                  invite->id, shareExpiry, now)) {
        // Transaction rolls back, so no use is consumed
        throw core::AuthorizationError("Access to this room was revoked");
    }

    auto share = sharing::ShareRegistry::fetch(*conn, invite->roomId, userId);
    if (!share) {
        throw core::StorageError("Share missing after upsert");
    }

    nlohmann::json details = {
        {"room_id", invite->roomId},
        {"share_id", share->id},
        {"uses_count", invite->usesCount + 1}
    };
    auditLog_->recordEvent(*conn, {userId, audit::action::ACCEPT_INVITE,
                                   std::string("invite"), invite->id, details.dump()}, origin);
    tx.commit();

    core::Log::info("redemption", "User " + userId + " redeemed invite " + invite->id);
    return *share;
}

} // namespace lockbox::invites
