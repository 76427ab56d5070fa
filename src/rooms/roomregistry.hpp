#pragma once

#include "access/access_export.hpp"
#include "audit/auditlog.hpp"
#include "core/clock.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lockbox::storage {
class Connection;
class Database;
}

namespace lockbox::rooms {

constexpr size_t MAX_ROOM_NAME_LENGTH = 255;

/**
 * @brief A data room: a named document collection with one owner
 */
struct Room {
    std::string id;
    std::string ownerId;
    std::string name;
    std::optional<std::string> description;
    core::TimePoint createdAt;
};

class LOCKBOX_ACCESS_EXPORT RoomRegistry {
public:
    RoomRegistry(std::shared_ptr<storage::Database> db,
                 std::shared_ptr<const core::Clock> clock,
                 std::shared_ptr<audit::AuditLog> auditLog);

    /**
     * @brief Create a room and the owner's share in one transaction
     * @throws core::ValidationError for an empty or overlong name
     */
    Room createRoom(const std::string& ownerId,
                    const std::string& name,
                    const std::optional<std::string>& description,
                    const audit::RequestContext& origin = {});

    /**
     * @throws core::NotFoundError if the room does not exist
     */
    Room getRoom(const std::string& roomId) const;

    /**
     * @brief Fetch a room, checking that the user owns it
     * @throws core::NotFoundError if the room does not exist
     * @throws core::AuthorizationError if the user is not the owner
     */
    Room requireOwner(const std::string& roomId, const std::string& userId) const;

    /**
     * @brief Rooms the user owns or holds a live share in, oldest first
     */
    std::vector<Room> listRoomsForUser(const std::string& userId) const;

    static Room fetch(storage::Connection& conn, const std::string& roomId);

    static Room ensureOwner(storage::Connection& conn,
                            const std::string& roomId,
                            const std::string& userId);

private:
    std::shared_ptr<storage::Database> db_;
    std::shared_ptr<const core::Clock> clock_;
    std::shared_ptr<audit::AuditLog> auditLog_;
};

} // namespace lockbox::rooms
