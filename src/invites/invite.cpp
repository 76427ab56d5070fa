#include "invites/invite.hpp"
#include "storage/database.hpp"

namespace lockbox::invites {

namespace sql {
    const char* SELECT_BY_ID = R"(
        SELECT id, room_id, creator_id, allowed_email, token_hash, max_uses, single_use,
               uses_count, grant_hours, expires_at, revoked, created_at
        FROM invites WHERE id = ?
    )";

    const char* SELECT_BY_TOKEN_HASH = R"(
        SELECT id, room_id, creator_id, allowed_email, token_hash, max_uses, single_use,
               uses_count, grant_hours, expires_at, revoked, created_at
        FROM invites WHERE token_hash = ?
    )";
}

namespace {

Invite readInvite(const storage::Statement& stmt) {
    Invite invite;
    invite.id = stmt.text(0);
    invite.roomId = stmt.text(1);
    invite.creatorId = stmt.text(2);
    invite.allowedEmail = stmt.optionalText(3);
    invite.tokenHash = stmt.text(4);
    invite.maxUses = stmt.optionalInt64(5);
    invite.singleUse = stmt.boolean(6);
    invite.usesCount = stmt.int64(7);
    invite.grantHours = stmt.optionalInt64(8);
    if (auto expires = stmt.optionalInt64(9)) {
        invite.expiresAt = core::fromEpochMillis(*expires);
    }
    invite.revoked = stmt.boolean(10);
    invite.createdAt = core::fromEpochMillis(stmt.int64(11));
    return invite;
}

std::optional<Invite> selectOne(storage::Connection& conn, const char* query,
                                const std::string& key) {
    auto stmt = conn.prepare(query);
    stmt.bindText(1, key);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readInvite(stmt);
}

} // namespace

InviteStatus deriveStatus(const Invite& invite, core::TimePoint now) {
    if (invite.revoked) {
        return InviteStatus::Revoked;
    }
    if (invite.expiresAt && *invite.expiresAt <= now) {
        return InviteStatus::Expired;
    }
    if (invite.maxUses && invite.usesCount >= *invite.maxUses) {
        return InviteStatus::Exhausted;
    }
    return InviteStatus::Active;
}

const char* statusName(InviteStatus status) {
    switch (status) {
        case InviteStatus::Active: return "active";
        case InviteStatus::Revoked: return "revoked";
        case InviteStatus::Expired: return "expired";
        case InviteStatus::Exhausted: return "exhausted";
    }
    return "active";
}

std::optional<Invite> fetchInviteById(storage::Connection& conn, const std::string& inviteId) {
    return selectOne(conn, sql::SELECT_BY_ID, inviteId);
}

std::optional<Invite> fetchInviteByTokenHash(storage::Connection& conn,
                                             const std::string& tokenHash) {
    return selectOne(conn, sql::SELECT_BY_TOKEN_HASH, tokenHash);
}

} // namespace lockbox::invites
