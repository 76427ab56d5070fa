#include "rooms/roomregistry.hpp"
#include "audit/auditlog.hpp"
#include "core/encoding.hpp"
#include "core/errors.hpp"
#include "core/identifiers.hpp"
#include "core/logging.hpp"
#include "sharing/shareregistry.hpp"
#include "storage/database.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace lockbox::rooms {

namespace sql {
    const char* INSERT_ROOM = R"(
        INSERT INTO rooms (id, owner_id, name, description, created_at)
        VALUES (?, ?, ?, ?, ?)
    )";

    const char* SELECT_ROOM = R"(
        SELECT id, owner_id, name, description, created_at FROM rooms WHERE id = ?
    )";

    // Expired shares are filtered by the caller-supplied time
    const char* ROOMS_FOR_USER = R"(
        SELECT r.id, r.owner_id, r.name, r.description, r.created_at
        FROM rooms r
        WHERE r.owner_id = ?1
           OR EXISTS (
               SELECT 1 FROM shares s
               WHERE s.room_id = r.id AND s.user_id = ?1 AND s.revoked = 0
                 AND (s.expires_at IS NULL OR s.expires_at > ?2)
           )
        ORDER BY r.created_at, r.id
    )";
}

namespace {

Room readRoom(const storage::Statement& stmt) {
    Room room;
    room.id = stmt.text(0);
    room.ownerId = stmt.text(1);
    room.name = stmt.text(2);
    room.description = stmt.optionalText(3);
    room.createdAt = core::fromEpochMillis(stmt.int64(4));
    return room;
}

} // namespace

RoomRegistry::RoomRegistry(std::shared_ptr<storage::Database> db,
                           std::shared_ptr<const core::Clock> clock,
                           std::shared_ptr<audit::AuditLog> auditLog)
    : db_(std::move(db)), clock_(std::move(clock)), auditLog_(std::move(auditLog)) {
    if (!db_ || !clock_ || !auditLog_) {
        throw std::invalid_argument("RoomRegistry requires a database, clock and audit log");
    }
}

Room RoomRegistry::createRoom(const std::string& ownerId,
                              const std::string& name,
                              const std::optional<std::string>& description,
                              const audit::RequestContext& origin) {
    if (ownerId.empty()) {
        throw core::ValidationError("Owner id must not be empty");
    }
    Room room;
    room.name = core::trim(name);
    if (room.name.empty()) {
        throw core::ValidationError("Room name must not be empty");
    }
    if (room.name.size() > MAX_ROOM_NAME_LENGTH) {
        throw core::ValidationError("Room name must be at most 255 characters");
    }
    room.id = core::generateUuid();
    room.ownerId = ownerId;
    room.description = description;
    room.createdAt = clock_->now();

    auto conn = db_->acquire();
    storage::Transaction tx(*conn);

    auto stmt = conn->prepare(sql::INSERT_ROOM);
    stmt.bindText(1, room.id)
        .bindText(2, room.ownerId)
        .bindText(3, room.name)
        .bindOptionalText(4, room.description)
        .bindInt64(5, core::toEpochMillis(room.createdAt));
    stmt.run();

    sharing::ShareRegistry::grantOwner(*conn, room.id, ownerId, room.createdAt);

    nlohmann::json details = {{"name", room.name}};
    auditLog_->recordEvent(*conn, {ownerId, audit::action::CREATE_ROOM,
                                   std::string("room"), room.id, details.dump()}, origin);
    tx.commit();

    core::Log::info("rooms", "Created room " + room.id);
    return room;
}

Room RoomRegistry::getRoom(const std::string& roomId) const {
    auto conn = db_->acquire();
    return fetch(*conn, roomId);
}

Room RoomRegistry::requireOwner(const std::string& roomId, const std::string& userId) const {
    auto conn = db_->acquire();
    return ensureOwner(*conn, roomId, userId);
}

std::vector<Room> RoomRegistry::listRoomsForUser(const std::string& userId) const {
    auto conn = db_->acquire();
    auto stmt = conn->prepare(sql::ROOMS_FOR_USER);
    stmt.bindText(1, userId).bindInt64(2, core::toEpochMillis(clock_->now()));

    std::vector<Room> rooms;
    while (stmt.step()) {
        rooms.push_back(readRoom(stmt));
    }
    return rooms;
}

Room RoomRegistry::fetch(storage::Connection& conn, const std::string& roomId) {
    auto stmt = conn.prepare(sql::SELECT_ROOM);
    stmt.bindText(1, roomId);
    if (!stmt.step()) {
        throw core::NotFoundError("Room not found: " + roomId);
    }
    return readRoom(stmt);
}

Room RoomRegistry::ensureOwner(storage::Connection& conn,
                               const std::string& roomId,
                               const std::string& userId) {
    Room room = fetch(conn, roomId);
    if (room.ownerId != userId) {
        throw core::AuthorizationError("Only the room owner may perform this action");
    }
    return room;
}

} // namespace lockbox::rooms
