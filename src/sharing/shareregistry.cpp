#include "sharing/shareregistry.hpp"
#include "core/errors.hpp"
#include "core/identifiers.hpp"
#include "rooms/roomregistry.hpp"
#include "storage/database.hpp"
#include <stdexcept>

namespace lockbox::sharing {

namespace sql {
    const char* SELECT_SHARE = R"(
        SELECT id, room_id, user_id, invite_id, role, expires_at, revoked, created_at
        FROM shares WHERE room_id = ? AND user_id = ?
    )";

    const char* LIST_SHARES = R"(
        SELECT id, room_id, user_id, invite_id, role, expires_at, revoked, created_at
        FROM shares WHERE room_id = ? ORDER BY created_at, id
    )";

    const char* INSERT_OWNER = R"(
        INSERT INTO shares (id, room_id, user_id, invite_id, role, expires_at, revoked, created_at)
        VALUES (?, ?, ?, NULL, 'owner', NULL, 0, ?)
    )";

    // The WHERE on DO UPDATE leaves a revoked row untouched, so changes() is 0
    const char* UPSERT_GUEST = R"(
        INSERT INTO shares (id, room_id, user_id, invite_id, role, expires_at, revoked, created_at)
        VALUES (?, ?, ?, ?, 'guest', ?, 0, ?)
        ON CONFLICT (room_id, user_id) DO UPDATE SET
            expires_at = CASE
                WHEN shares.expires_at IS NULL OR excluded.expires_at IS NULL THEN NULL
                ELSE MAX(shares.expires_at, excluded.expires_at)
            END
        WHERE shares.revoked = 0
    )";

    const char* REVOKE_SHARE =
        "UPDATE shares SET revoked = 1 WHERE room_id = ? AND user_id = ? AND revoked = 0";

    const char* SHARE_EXISTS =
        "SELECT 1 FROM shares WHERE room_id = ? AND user_id = ?";
}

namespace {

Role parseRole(const std::string& name) {
    if (name == "owner") {
        return Role::Owner;
    }
    if (name == "guest") {
        return Role::Guest;
    }
    throw core::StorageError("Unknown share role in database: " + name);
}

Share readShare(const storage::Statement& stmt) {
    Share share;
    share.id = stmt.text(0);
    share.roomId = stmt.text(1);
    share.userId = stmt.text(2);
    share.inviteId = stmt.optionalText(3);
    share.role = parseRole(stmt.text(4));
    if (auto expires = stmt.optionalInt64(5)) {
        share.expiresAt = core::fromEpochMillis(*expires);
    }
    share.revoked = stmt.boolean(6);
    share.createdAt = core::fromEpochMillis(stmt.int64(7));
    return share;
}

} // namespace

const char* roleName(Role role) {
    switch (role) {
        case Role::Owner: return "owner";
        case Role::Guest: return "guest";
    }
    return "guest";
}

class ShareRegistry::Impl {
public:
    Impl(std::shared_ptr<storage::Database> db, std::shared_ptr<const core::Clock> clock)
        : db_(std::move(db)), clock_(std::move(clock)) {
        if (!db_ || !clock_) {
            throw std::invalid_argument("ShareRegistry requires a database and a clock");
        }
    }

    std::optional<Share> getShare(const std::string& roomId, const std::string& userId) {
        auto conn = db_->acquire();
        return ShareRegistry::fetch(*conn, roomId, userId);
    }

    std::vector<Share> listShares(const std::string& roomId, const std::string& callerId) {
        auto conn = db_->acquire();
        storage::Transaction tx(*conn, storage::Transaction::Mode::Deferred);
        rooms::RoomRegistry::ensureOwner(*conn, roomId, callerId);

        auto stmt = conn->prepare(sql::LIST_SHARES);
        stmt.bindText(1, roomId);

        std::vector<Share> shares;
        while (stmt.step()) {
            shares.push_back(readShare(stmt));
        }
        tx.commit();
        return shares;
    }

    bool hasAccess(const std::string& roomId, const std::string& userId) {
        try {
            requireAccess(roomId, userId);
            return true;
        } catch (const core::AuthorizationError&) {
            return false;
        } catch (const core::NotFoundError&) {
            return false;
        }
    }

    void requireAccess(const std::string& roomId, const std::string& userId) {
        auto conn = db_->acquire();
        storage::Transaction tx(*conn, storage::Transaction::Mode::Deferred);
        ShareRegistry::ensureAccess(*conn, roomId, userId, clock_->now());
        tx.commit();
    }

private:
    std::shared_ptr<storage::Database> db_;
    std::shared_ptr<const core::Clock> clock_;
};

ShareRegistry::ShareRegistry(std::shared_ptr<storage::Database> db,
                             std::shared_ptr<const core::Clock> clock)
    : impl_(std::make_unique<Impl>(std::move(db), std::move(clock))) {}

ShareRegistry::~ShareRegistry() = default;

std::optional<Share> ShareRegistry::getShare(const std::string& roomId,
                                             const std::string& userId) const {
    return impl_->getShare(roomId, userId);
}

std::vector<Share> ShareRegistry::listShares(const std::string& roomId,
                                             const std::string& callerId) const {
    return impl_->listShares(roomId, callerId);
}

bool ShareRegistry::hasAccess(const std::string& roomId, const std::string& userId) const {
    return impl_->hasAccess(roomId, userId);
}

void ShareRegistry::requireAccess(const std::string& roomId, const std::string& userId) const {
    impl_->requireAccess(roomId, userId);
}

std::optional<Share> ShareRegistry::fetch(storage::Connection& conn,
                                          const std::string& roomId,
                                          const std::string& userId) {
    auto stmt = conn.prepare(sql::SELECT_SHARE);
    stmt.bindText(1, roomId).bindText(2, userId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readShare(stmt);
}

void ShareRegistry::ensureAccess(storage::Connection& conn,
                                 const std::string& roomId,
                                 const std::string& userId,
                                 core::TimePoint now) {
    auto room = rooms::RoomRegistry::fetch(conn, roomId);
    if (room.ownerId == userId) {
        return;
    }

    auto share = fetch(conn, roomId, userId);
    if (!share) {
        throw core::AuthorizationError("No access to this room");
    }
    if (share->revoked) {
        throw core::AuthorizationError("Access to this room was revoked");
    }
    if (!share->isActive(now)) {
        throw core::AuthorizationError("Access to this room has expired");
    }
}

Share ShareRegistry::grantOwner(storage::Connection& conn,
                                const std::string& roomId,
                                const std::string& ownerId,
                                core::TimePoint now) {
    Share share;
    share.id = core::generateUuid();
    share.roomId = roomId;
    share.userId = ownerId;
    share.role = Role::Owner;
    share.createdAt = now;

    auto stmt = conn.prepare(sql::INSERT_OWNER);
    stmt.bindText(1, share.id)
        .bindText(2, roomId)
        .bindText(3, ownerId)
        .bindInt64(4, core::toEpochMillis(now));
    stmt.run();
    return share;
}

bool ShareRegistry::upsertFromInvite(storage::Connection& conn,
                                     const std::string& roomId,
                                     const std::string& userId,
                                     const std::string& inviteId,
                                     std::optional<core::TimePoint> expiresAt,
                                     core::TimePoint now) {
    std::optional<int64_t> expiresMillis;
    if (expiresAt) {
        expiresMillis = core::toEpochMillis(*expiresAt);
    }

    auto stmt = conn.prepare(sql::UPSERT_GUEST);
    stmt.bindText(1, core::generateUuid())
        .bindText(2, roomId)
        .bindText(3, userId)
        .bindText(4, inviteId)
        .bindOptionalInt64(5, expiresMillis)
        .bindInt64(6, core::toEpochMillis(now));
    stmt.run();
    return conn.changes() > 0;
}

bool ShareRegistry::markRevoked(storage::Connection& conn,
                                const std::string& roomId,
                                const std::string& userId) {
    auto update = conn.prepare(sql::REVOKE_SHARE);
    update.bindText(1, roomId).bindText(2, userId);
    update.run();
    if (conn.changes() > 0) {
        return true;
    }

    // Already revoked counts as success
    auto exists = conn.prepare(sql::SHARE_EXISTS);
    exists.bindText(1, roomId).bindText(2, userId);
    return exists.step();
}

} // namespace lockbox::sharing
