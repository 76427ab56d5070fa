#include "documents/documentcatalog.hpp"
#include "audit/auditlog.hpp"
#include "core/encoding.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "rooms/roomregistry.hpp"
#include "sharing/shareregistry.hpp"
#include "storage/database.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace lockbox::documents {

namespace sql {
    const char* INSERT_DOCUMENT = R"(
        INSERT INTO documents (id, room_id, uploaded_by, filename, content_type, size_bytes,
                               sha256, storage_key, uploaded_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    const char* LIST_DOCUMENTS = R"(
        SELECT id, room_id, uploaded_by, filename, content_type, size_bytes, sha256,
               storage_key, uploaded_at
        FROM documents WHERE room_id = ? ORDER BY uploaded_at DESC, id
    )";

    const char* SELECT_DOCUMENT = R"(
        SELECT id, room_id, uploaded_by, filename, content_type, size_bytes, sha256,
               storage_key, uploaded_at
        FROM documents WHERE id = ? AND room_id = ?
    )";

    const char* DELETE_DOCUMENT = "DELETE FROM documents WHERE id = ? AND room_id = ?";
}

namespace {

constexpr size_t MAX_FILENAME_LENGTH = 255;

Document readDocument(const storage::Statement& stmt) {
    Document doc;
    doc.id = stmt.text(0);
    doc.roomId = stmt.text(1);
    doc.uploadedBy = stmt.text(2);
    doc.filename = stmt.text(3);
    doc.contentType = stmt.text(4);
    doc.sizeBytes = stmt.int64(5);
    doc.sha256 = stmt.optionalText(6);
    doc.storageKey = stmt.text(7);
    doc.uploadedAt = core::fromEpochMillis(stmt.int64(8));
    return doc;
}

std::optional<Document> findDocument(storage::Connection& conn,
                                     const std::string& roomId,
                                     const std::string& documentId) {
    auto stmt = conn.prepare(sql::SELECT_DOCUMENT);
    stmt.bindText(1, documentId).bindText(2, roomId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readDocument(stmt);
}

bool isHexDigest(const std::string& text) {
    return text.size() == 64 &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) {
               return std::isxdigit(c) != 0;
           });
}

} // namespace

DocumentCatalog::DocumentCatalog(std::shared_ptr<storage::Database> db,
                                 std::shared_ptr<const core::Clock> clock,
                                 std::shared_ptr<storage::ObjectStore> objectStore,
                                 std::shared_ptr<audit::AuditLog> auditLog)
    : db_(std::move(db)),
      clock_(std::move(clock)),
      objectStore_(std::move(objectStore)),
      auditLog_(std::move(auditLog)) {
    if (!db_ || !clock_ || !objectStore_ || !auditLog_) {
        throw std::invalid_argument("DocumentCatalog is missing a dependency");
    }
}

storage::UploadTicket DocumentCatalog::presignUpload(const std::string& roomId,
                                                     const std::string& callerId,
                                                     const audit::RequestContext& origin) {
    {
        auto conn = db_->acquire();
        rooms::RoomRegistry::ensureOwner(*conn, roomId, callerId);
    }

    storage::UploadTicket ticket = objectStore_->presignUpload(roomId);

    nlohmann::json details = {{"room_id", roomId}};
    auditLog_->recordEvent({callerId, audit::action::PRESIGN_UPLOAD,
                            std::string("document"), ticket.storageKey, details.dump()}, origin);
    return ticket;
}

Document DocumentCatalog::confirmUpload(const std::string& roomId,
                                        const std::string& callerId,
                                        const UploadConfirmation& upload,
                                        const audit::RequestContext& origin) {
    Document doc;
    doc.filename = core::trim(upload.filename);
    if (doc.filename.empty() || doc.filename.size() > MAX_FILENAME_LENGTH) {
        throw core::ValidationError("filename must be 1 to 255 characters");
    }
    if (upload.sizeBytes < 0) {
        throw core::ValidationError("size_bytes must not be negative");
    }
    auto documentId = storage::documentIdFromKey(roomId, upload.storageKey);
    if (!documentId) {
        throw core::ValidationError("storage_key does not belong to this room");
    }
    if (upload.sha256) {
        std::string digest = core::toLowerAscii(*upload.sha256);
        if (!isHexDigest(digest)) {
            throw core::ValidationError("sha256 must be 64 hex characters");
        }
        doc.sha256 = digest;
    }

    doc.id = *documentId;
    doc.roomId = roomId;
    doc.uploadedBy = callerId;
    doc.contentType = upload.contentType.empty() ? "application/octet-stream" : upload.contentType;
    doc.sizeBytes = upload.sizeBytes;
    doc.storageKey = upload.storageKey;
    doc.uploadedAt = clock_->now();

    auto conn = db_->acquire();
    storage::Transaction tx(*conn);
    rooms::RoomRegistry::ensureOwner(*conn, roomId, callerId);

    auto stmt = conn->prepare(sql::INSERT_DOCUMENT);
    stmt.bindText(1, doc.id)
        .bindText(2, doc.roomId)
        .bindText(3, doc.uploadedBy)
        .bindText(4, doc.filename)
        .bindText(5, doc.contentType)
        .bindInt64(6, doc.sizeBytes)
        .bindOptionalText(7, doc.sha256)
        .bindText(8, doc.storageKey)
        .bindInt64(9, core::toEpochMillis(doc.uploadedAt));
    stmt.run();

    nlohmann::json details = {
        {"room_id", roomId},
        {"filename", doc.filename},
        {"size_bytes", doc.sizeBytes}
    };
    auditLog_->recordEvent(*conn, {callerId, audit::action::UPLOAD_DOCUMENT,
                                   std::string("document"), doc.id, details.dump()}, origin);
    tx.commit();

    core::Log::info("documents", "Registered document " + doc.id + " in room " + roomId);
    return doc;
}

std::vector<Document> DocumentCatalog::listDocuments(const std::string& roomId,
                                                     const std::string& callerId) const {
    auto conn = db_->acquire();
    storage::Transaction tx(*conn, storage::Transaction::Mode::Deferred);
    sharing::ShareRegistry::ensureAccess(*conn, roomId, callerId, clock_->now());

    auto stmt = conn->prepare(sql::LIST_DOCUMENTS);
    stmt.bindText(1, roomId);

    std::vector<Document> docs;
    while (stmt.step()) {
        docs.push_back(readDocument(stmt));
    }
    tx.commit();
    return docs;
}

storage::DownloadTicket DocumentCatalog::issueDownloadLink(const std::string& roomId,
                                                           const std::string& documentId,
                                                           const std::string& callerId,
                                                           const audit::RequestContext& origin) {
    auto conn = db_->acquire();
    storage::Transaction tx(*conn);
    sharing::ShareRegistry::ensureAccess(*conn, roomId, callerId, clock_->now());

    auto doc = findDocument(*conn, roomId, documentId);
    if (!doc) {
        throw core::NotFoundError("Document not found: " + documentId);
    }

    storage::DownloadTicket ticket = objectStore_->presignDownload(roomId, doc->id);

    // Recorded before the link leaves the service
    auditLog_->recordDownload(*conn, roomId, doc->id, callerId, doc->filename);
    nlohmann::json details = {
        {"room_id", roomId},
        {"filename", doc->filename}
    };
    auditLog_->recordEvent(*conn, {callerId, audit::action::DOWNLOAD_DOCUMENT,
                                   std::string("document"), doc->id, details.dump()}, origin);
    tx.commit();
    return ticket;
}

void DocumentCatalog::deleteDocument(const std::string& roomId,
                                     const std::string& documentId,
                                     const std::string& callerId,
                                     const audit::RequestContext& origin) {
    std::optional<Document> doc;
    {
        auto conn = db_->acquire();
        storage::Transaction tx(*conn);
        rooms::RoomRegistry::ensureOwner(*conn, roomId, callerId);

        doc = findDocument(*conn, roomId, documentId);
        if (!doc) {
            throw core::NotFoundError("Document not found: " + documentId);
        }

        auto stmt = conn->prepare(sql::DELETE_DOCUMENT);
        stmt.bindText(1, doc->id).bindText(2, roomId);
        stmt.run();

        nlohmann::json details = {
            {"room_id", roomId},
            {"filename", doc->filename}
        };
        auditLog_->recordEvent(*conn, {callerId, audit::action::DELETE_DOCUMENT,
                                       std::string("document"), doc->id, details.dump()}, origin);
        tx.commit();
    }

    try {
        objectStore_->deleteObject(roomId, doc->id);
    } catch (const core::Error& e) {
        core::Log::warning("documents", "Object of deleted document " + doc->id +
                           " was not removed: " + e.what());
    }
    core::Log::info("documents", "Deleted document " + doc->id + " from room " + roomId);
}

} // namespace lockbox::documents
