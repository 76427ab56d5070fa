#pragma once

#include "access/access_export.hpp"
#include "audit/auditlog.hpp"
#include "core/clock.hpp"
#include "documents/documentcatalog.hpp"
#include "invites/inviteissuer.hpp"
#include "invites/redemptionengine.hpp"
#include "invites/revocationmanager.hpp"
#include "rooms/roomregistry.hpp"
#include "sharing/shareregistry.hpp"
#include "storage/database.hpp"
#include "storage/objectstore.hpp"
#include <memory>
#include <string>
#include <vector>

namespace lockbox {

struct ServiceOptions {
    std::string databasePath;
    storage::DatabaseOptions database;
    std::vector<uint8_t> inviteSecret;  // Keys token hashes
    std::vector<uint8_t> auditKey;      // Keys audit row signatures
};

/**
 * @brief The access subsystem wired together over one database
 *
 * Owns the database pool and every component. All operations take the
 * caller's identity explicitly; nothing is kept per session. Mutating
 * operations also take the request origin for their audit event.
 */
class LOCKBOX_ACCESS_EXPORT DataRoomService {
public:
    /**
     * @brief Open the database and build the components
     * @param options Database location and secrets
     * @param objectStore Backend issuing upload and download URLs
     * @param clock Time source, system clock when omitted
     * @throws std::invalid_argument if a secret is empty
     * @throws core::Error if the database cannot be opened
     */
    DataRoomService(const ServiceOptions& options,
                    std::shared_ptr<storage::ObjectStore> objectStore,
                    std::shared_ptr<const core::Clock> clock = nullptr);
    ~DataRoomService();

    rooms::RoomRegistry& rooms();
    invites::InviteIssuer& invites();
    invites::RedemptionEngine& redemption();
    invites::RevocationManager& revocation();
    sharing::ShareRegistry& shares();
    audit::AuditLog& auditLog();
    documents::DocumentCatalog& documents();
    storage::Database& database();
    const core::Clock& clock() const;

    // Invite lifecycle

    invites::IssuedInvite createInvite(const std::string& roomId,
                                       const std::string& creatorId,
                                       const invites::InviteOptions& options,
                                       const audit::RequestContext& origin = {});

    sharing::Share acceptInvite(const std::string& rawToken,
                                const std::string& userId,
                                const std::string& userEmail,
                                const audit::RequestContext& origin = {});

    void revokeInvite(const std::string& inviteId,
                      const std::string& callerId,
                      const audit::RequestContext& origin = {});

    void revokeShare(const std::string& roomId,
                     const std::string& userId,
                     const std::string& callerId,
                     const audit::RequestContext& origin = {});

    // Download audit

    audit::Download recordDownload(const std::string& roomId,
                                   const std::string& documentId,
                                   const std::string& userId,
                                   const std::string& filename);

    std::vector<audit::Download> listDownloads(const std::string& roomId,
                                               const std::string& callerId) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    // Prevent copying
    DataRoomService(const DataRoomService&) = delete;
    DataRoomService& operator=(const DataRoomService&) = delete;
};

} // namespace lockbox
