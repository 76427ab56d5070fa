#pragma once

#include "access/access_export.hpp"
#include "core/clock.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lockbox::storage {
class Connection;
class Database;
class Statement;
}

namespace lockbox::sharing {

enum class Role {
    Owner,
    Guest
};

LOCKBOX_ACCESS_EXPORT const char* roleName(Role role);

/**
 * @brief Durable grant binding one user to one room
 */
struct Share {
    std::string id;
    std::string roomId;
    std::string userId;
    std::optional<std::string> inviteId;  // Invite whose redemption created it
    Role role = Role::Guest;
    std::optional<core::TimePoint> expiresAt;  // Absent means no expiry
    bool revoked = false;
    core::TimePoint createdAt;

    bool isActive(core::TimePoint now) const {
        return !revoked && (!expiresAt || *expiresAt > now);
    }
};

/**
 * @brief Per-user, per-room access grants
 *
 * Shares are unique on (room, user). Grants are created by room creation
 * (owner) and invite redemption (guest); revocation is one-way.
 */
class LOCKBOX_ACCESS_EXPORT ShareRegistry {
public:
    ShareRegistry(std::shared_ptr<storage::Database> db,
                  std::shared_ptr<const core::Clock> clock);
    ~ShareRegistry();

    /**
     * @brief Look up the share a user holds in a room
     * @return std::nullopt if the user was never granted access
     */
    std::optional<Share> getShare(const std::string& roomId, const std::string& userId) const;

    /**
     * @brief All shares of a room, oldest first
     * @param callerId Must own the room
     */
    std::vector<Share> listShares(const std::string& roomId, const std::string& callerId) const;

    /**
     * @brief Check whether a user may read a room's documents
     * @return true for the owner or a share that is neither revoked nor expired
     */
    bool hasAccess(const std::string& roomId, const std::string& userId) const;

    /**
     * @brief Like hasAccess, but throws
     * @throws core::NotFoundError for an unknown room
     * @throws core::AuthorizationError if the user has no live share
     */
    void requireAccess(const std::string& roomId, const std::string& userId) const;

    // Building blocks used inside other components' transactions

    static std::optional<Share> fetch(storage::Connection& conn,
                                      const std::string& roomId,
                                      const std::string& userId);

    static void ensureAccess(storage::Connection& conn,
                             const std::string& roomId,
                             const std::string& userId,
                             core::TimePoint now);

    static Share grantOwner(storage::Connection& conn,
                            const std::string& roomId,
                            const std::string& ownerId,
                            core::TimePoint now);

    /**
     * @brief Create or refresh a guest share from a redeemed invite
     *
     * A new share gets role guest and the given expiry. An existing live
     * share keeps its role; its expiry is cleared when the new grant is
     * unlimited and otherwise becomes the later of the two.
     *
     * @return false if the existing share is revoked; nothing is written
     */
    static bool upsertFromInvite(storage::Connection& conn,
                                 const std::string& roomId,
                                 const std::string& userId,
                                 const std::string& inviteId,
                                 std::optional<core::TimePoint> expiresAt,
                                 core::TimePoint now);

    /**
     * @brief Set the revoked flag
     * @return false if no such share exists
     */
    static bool markRevoked(storage::Connection& conn,
                            const std::string& roomId,
                            const std::string& userId);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    // Prevent copying
    ShareRegistry(const ShareRegistry&) = delete;
    ShareRegistry& operator=(const ShareRegistry&) = delete;
};

} // namespace lockbox::sharing
