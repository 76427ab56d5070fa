#pragma once

#include "access/access_export.hpp"
#include "audit/auditlog.hpp"
#include "core/clock.hpp"
#include "storage/objectstore.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lockbox::storage {
class Database;
}

namespace lockbox::documents {

/**
 * @brief Metadata for one stored file
 */
struct Document {
    std::string id;
    std::string roomId;
    std::string uploadedBy;
    std::string filename;
    std::string contentType;
    int64_t sizeBytes = 0;
    std::optional<std::string> sha256;  // Lowercase hex, when the client supplied one
    std::string storageKey;
    core::TimePoint uploadedAt;
};

struct UploadConfirmation {
    std::string filename;
    std::string contentType;
    int64_t sizeBytes = 0;
    std::string storageKey;
    std::optional<std::string> sha256;
};

/**
 * @brief Room documents and the links used to move their bytes
 *
 * File content never passes through here. Owners get presigned upload
 * URLs and register the result; anyone with access gets presigned download
 * URLs, each issuance recorded in the audit log before it is returned.
 * Deleting a document keeps its download history.
 */
class LOCKBOX_ACCESS_EXPORT DocumentCatalog {
public:
    DocumentCatalog(std::shared_ptr<storage::Database> db,
                    std::shared_ptr<const core::Clock> clock,
                    std::shared_ptr<storage::ObjectStore> objectStore,
                    std::shared_ptr<audit::AuditLog> auditLog);

    /**
     * @brief Reserve a storage key and return a PUT URL for it (owner only)
     */
    storage::UploadTicket presignUpload(const std::string& roomId,
                                        const std::string& callerId,
                                        const audit::RequestContext& origin = {});

    /**
     * @brief Register an uploaded object (owner only)
     * @throws core::ValidationError if the key belongs to another room or
     *         the metadata is malformed
     * @throws core::ConflictError if the key was already registered
     */
    Document confirmUpload(const std::string& roomId,
                           const std::string& callerId,
                           const UploadConfirmation& upload,
                           const audit::RequestContext& origin = {});

    /**
     * @brief Documents of a room, newest first (access required)
     */
    std::vector<Document> listDocuments(const std::string& roomId,
                                        const std::string& callerId) const;

    /**
     * @brief Issue a GET URL and record the download (access required)
     * @throws core::NotFoundError if the document is not in the room
     */
    storage::DownloadTicket issueDownloadLink(const std::string& roomId,
                                              const std::string& documentId,
                                              const std::string& callerId,
                                              const audit::RequestContext& origin = {});

    /**
     * @brief Remove a document and its stored object (owner only)
     *
     * The metadata row and the audit event commit together. The object is
     * removed afterwards; if the store fails, the row is already gone and
     * the object is left orphaned with a warning.
     * @throws core::NotFoundError if the room or document does not exist
     * @throws core::AuthorizationError if the caller does not own the room
     */
    void deleteDocument(const std::string& roomId,
                        const std::string& documentId,
                        const std::string& callerId,
                        const audit::RequestContext& origin = {});

private:
    std::shared_ptr<storage::Database> db_;
    std::shared_ptr<const core::Clock> clock_;
    std::shared_ptr<storage::ObjectStore> objectStore_;
    std::shared_ptr<audit::AuditLog> auditLog_;
};

} // namespace lockbox::documents
