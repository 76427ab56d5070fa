#include "lockbox/dataroomservice.hpp"
#include "core/logging.hpp"
#include "core/tokencodec.hpp"
#include <stdexcept>

namespace lockbox {

class DataRoomService::Impl {
public:
    Impl(const ServiceOptions& options,
         std::shared_ptr<storage::ObjectStore> objectStore,
         std::shared_ptr<const core::Clock> clock)
        : clock_(std::move(clock)) {
        if (!clock_) {
            clock_ = std::make_shared<core::SystemClock>();
        }
        if (!objectStore) {
            throw std::invalid_argument("DataRoomService requires an object store");
        }
        if (options.inviteSecret.empty() || options.auditKey.empty()) {
            throw std::invalid_argument("Invite secret and audit key must not be empty");
        }

        db_ = std::make_shared<storage::Database>(options.databasePath, options.database);
        codec_ = std::make_shared<core::TokenCodec>(options.inviteSecret);
        auditLog_ = std::make_shared<audit::AuditLog>(db_, options.auditKey, clock_);

        rooms_ = std::make_unique<rooms::RoomRegistry>(db_, clock_, auditLog_);
        shares_ = std::make_unique<sharing::ShareRegistry>(db_, clock_);
        issuer_ = std::make_unique<invites::InviteIssuer>(db_, clock_, codec_, auditLog_);
        redemption_ = std::make_unique<invites::RedemptionEngine>(db_, clock_, codec_, auditLog_);
        revocation_ = std::make_unique<invites::RevocationManager>(db_, auditLog_);
        documents_ = std::make_unique<documents::DocumentCatalog>(
            db_, clock_, std::move(objectStore), auditLog_);

        core::Log::info("service", "Data room service ready on " + db_->path() +
                        " (schema v" + std::to_string(db_->schemaVersion()) + ")");
    }

    std::shared_ptr<const core::Clock> clock_;
    std::shared_ptr<storage::Database> db_;
    std::shared_ptr<core::TokenCodec> codec_;
    std::shared_ptr<audit::AuditLog> auditLog_;
    std::unique_ptr<rooms::RoomRegistry> rooms_;
    std::unique_ptr<sharing::ShareRegistry> shares_;
    std::unique_ptr<invites::InviteIssuer> issuer_;
    std::unique_ptr<invites::RedemptionEngine> redemption_;
    std::unique_ptr<invites::RevocationManager> revocation_;
    std::unique_ptr<documents::DocumentCatalog> documents_;
};

DataRoomService::DataRoomService(const ServiceOptions& options,
                                 std::shared_ptr<storage::ObjectStore> objectStore,
                                 std::shared_ptr<const core::Clock> clock)
    : impl_(std::make_unique<Impl>(options, std::move(objectStore), std::move(clock))) {}

DataRoomService::~DataRoomService() = default;

rooms::RoomRegistry& DataRoomService::rooms() { return *impl_->rooms_; }
invites::InviteIssuer& DataRoomService::invites() { return *impl_->issuer_; }
invites::RedemptionEngine& DataRoomService::redemption() { return *impl_->redemption_; }
invites::RevocationManager& DataRoomService::revocation() { return *impl_->revocation_; }
sharing::ShareRegistry& DataRoomService::shares() { return *impl_->shares_; }
audit::AuditLog& DataRoomService::auditLog() { return *impl_->auditLog_; }
documents::DocumentCatalog& DataRoomService::documents() { return *impl_->documents_; }
storage::Database& DataRoomService::database() { return *impl_->db_; }
const core::Clock& DataRoomService::clock() const { return *impl_->clock_; }

invites::IssuedInvite DataRoomService::createInvite(const std::string& roomId,
                                                    const std::string& creatorId,
                                                    const invites::InviteOptions& options,
                                                    const audit::RequestContext& origin) {
    return impl_->issuer_->createInvite(roomId, creatorId, options, origin);
}

sharing::Share DataRoomService::acceptInvite(const std::string& rawToken,
                                             const std::string& userId,
                                             const std::string& userEmail,
                                             const audit::RequestContext& origin) {
    return impl_->redemption_->acceptInvite(rawToken, userId, userEmail, origin);
}

void DataRoomService::revokeInvite(const std::string& inviteId,
                                   const std::string& callerId,
                                   const audit::RequestContext& origin) {
    impl_->revocation_->revokeInvite(inviteId, callerId, origin);
}

void DataRoomService::revokeShare(const std::string& roomId,
                                  const std::string& userId,
                                  const std::string& callerId,
                                  const audit::RequestContext& origin) {
    impl_->revocation_->revokeShare(roomId, userId, callerId, origin);
}

audit::Download DataRoomService::recordDownload(const std::string& roomId,
                                                const std::string& documentId,
                                                const std::string& userId,
                                                const std::string& filename) {
    return impl_->auditLog_->recordDownload(roomId, documentId, userId, filename);
}

std::vector<audit::Download> DataRoomService::listDownloads(const std::string& roomId,
                                                            const std::string& callerId) const {
    return impl_->auditLog_->listDownloads(roomId, callerId);
}

} // namespace lockbox
