#include "audit/auditlog.hpp"
#include "core/digest.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "rooms/roomregistry.hpp"
#include "storage/database.hpp"
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace lockbox::audit {

// SQL statements
namespace sql {
    const char* INSERT_DOWNLOAD = R"(
        INSERT INTO downloads (room_id, document_id, user_id, filename, timestamp, signature)
        VALUES (?, ?, ?, ?, ?, ?)
    )";

    const char* LIST_DOWNLOADS = R"(
        SELECT id, room_id, document_id, user_id, filename, timestamp
        FROM downloads WHERE room_id = ? ORDER BY timestamp ASC, id ASC
    )";

    const char* ALL_DOWNLOADS = R"(
        SELECT id, room_id, document_id, user_id, filename, timestamp, signature
        FROM downloads ORDER BY id
    )";

    const char* INSERT_EVENT = R"(
        INSERT INTO audit_events (user_id, action, object_type, object_id, details,
                                  ip_address, user_agent, timestamp, signature)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    const char* QUERY_EVENTS = R"(
        SELECT id, user_id, action, object_type, object_id, details,
               ip_address, user_agent, timestamp, signature
        FROM audit_events WHERE 1=1
    )";
}

namespace {

// Each field is length-prefixed so ("ab","c") and ("a","bc") sign differently
void appendField(std::string& out, std::string_view value) {
    uint64_t len = value.size();
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((len >> (8 * i)) & 0xff));
    }
    out.append(value.data(), value.size());
}

void appendOptional(std::string& out, const std::optional<std::string>& value) {
    out.push_back(value ? '\x01' : '\x00');
    if (value) {
        appendField(out, *value);
    }
}

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace

class AuditLog::Impl {
public:
    Impl(std::shared_ptr<storage::Database> db,
         std::vector<uint8_t> key,
         std::shared_ptr<const core::Clock> clock)
        : db_(std::move(db)), hmacKey_(std::move(key)), clock_(std::move(clock)) {
        if (!db_ || !clock_) {
            throw std::invalid_argument("AuditLog requires a database and a clock");
        }
        if (hmacKey_.empty()) {
            throw std::invalid_argument("Audit HMAC key must not be empty");
        }
    }

    ~Impl() {
        core::cleanse(hmacKey_.data(), hmacKey_.size());
    }

    Download recordDownload(storage::Connection& conn,
                            const std::string& roomId,
                            const std::string& documentId,
                            const std::string& userId,
                            const std::string& filename) {
        Download download;
        download.roomId = roomId;
        download.documentId = documentId;
        download.userId = userId;
        download.filename = filename;
        download.timestamp = clock_->now();

        auto stmt = conn.prepare(sql::INSERT_DOWNLOAD);
        stmt.bindText(1, roomId)
            .bindText(2, documentId)
            .bindText(3, userId)
            .bindText(4, filename)
            .bindInt64(5, core::toEpochMillis(download.timestamp))
            .bindBlob(6, downloadSignature(download));
        stmt.run();

        download.id = sqlite3_last_insert_rowid(conn.handle());
        return download;
    }

    std::vector<Download> listDownloads(const std::string& roomId, const std::string& callerId) {
        auto conn = db_->acquire();
        storage::Transaction tx(*conn, storage::Transaction::Mode::Deferred);
        rooms::RoomRegistry::ensureOwner(*conn, roomId, callerId);

        auto stmt = conn->prepare(sql::LIST_DOWNLOADS);
        stmt.bindText(1, roomId);

        std::vector<Download> downloads;
        while (stmt.step()) {
            Download download;
            download.id = stmt.int64(0);
            download.roomId = stmt.text(1);
            download.documentId = stmt.text(2);
            download.userId = stmt.text(3);
            download.filename = stmt.text(4);
            download.timestamp = core::fromEpochMillis(stmt.int64(5));
            downloads.push_back(std::move(download));
        }
        tx.commit();
        return downloads;
    }

    void recordEvent(storage::Connection& conn, const EventData& data,
                     const RequestContext& origin) {
        if (data.action.empty()) {
            throw core::ValidationError("Audit event action must not be empty");
        }

        Event event;
        event.data = data;
        event.origin = origin;
        event.timestamp = clock_->now();

        auto stmt = conn.prepare(sql::INSERT_EVENT);
        stmt.bindOptionalText(1, data.userId)
            .bindText(2, data.action)
            .bindOptionalText(3, data.objectType)
            .bindOptionalText(4, data.objectId)
            .bindOptionalText(5, data.details)
            .bindOptionalText(6, origin.ipAddress)
            .bindOptionalText(7, origin.userAgent)
            .bindInt64(8, core::toEpochMillis(event.timestamp))
            .bindBlob(9, eventSignature(event));
        stmt.run();
    }

    std::vector<Event> queryEvents(const Query& filter) {
        std::stringstream query;
        query << sql::QUERY_EVENTS;
        if (filter.userId) {
            query << " AND user_id = ?";
        }
        if (filter.action) {
            query << " AND action = ?";
        }
        if (filter.objectId) {
            query << " AND object_id = ?";
        }
        if (filter.timeRange) {
            query << " AND timestamp >= ? AND timestamp <= ?";
        }
        query << " ORDER BY timestamp ASC, id ASC LIMIT ?";
        const std::string text = query.str();

        auto conn = db_->acquire();
        auto stmt = conn->prepare(text.c_str());
        int index = 1;
        if (filter.userId) {
            stmt.bindText(index++, *filter.userId);
        }
        if (filter.action) {
            stmt.bindText(index++, *filter.action);
        }
        if (filter.objectId) {
            stmt.bindText(index++, *filter.objectId);
        }
        if (filter.timeRange) {
            stmt.bindInt64(index++, core::toEpochMillis(filter.timeRange->start));
            stmt.bindInt64(index++, core::toEpochMillis(filter.timeRange->end));
        }
        stmt.bindInt64(index, static_cast<int64_t>(filter.limit));

        std::vector<Event> events;
        while (stmt.step()) {
            events.push_back(readEvent(stmt));
        }
        return events;
    }

    IntegrityReport verifyIntegrity() {
        IntegrityReport report;
        auto conn = db_->acquire();
        storage::Transaction tx(*conn, storage::Transaction::Mode::Deferred);

        auto downloads = conn->prepare(sql::ALL_DOWNLOADS);
        while (downloads.step()) {
            Download download;
            download.id = downloads.int64(0);
            download.roomId = downloads.text(1);
            download.documentId = downloads.text(2);
            download.userId = downloads.text(3);
            download.filename = downloads.text(4);
            download.timestamp = core::fromEpochMillis(downloads.int64(5));
            auto stored = downloads.blob(6);

            auto computed = downloadSignature(download);
            ++report.rowsChecked;
            if (!core::constantTimeEquals(stored.data(), stored.size(),
                                          computed.data(), computed.size())) {
                report.tampered.push_back("downloads:" + std::to_string(download.id));
            }
        }

        std::string allEvents = std::string(sql::QUERY_EVENTS) + " ORDER BY id";
        auto events = conn->prepare(allEvents.c_str());
        while (events.step()) {
            Event event = readEvent(events);
            auto computed = eventSignature(event);
            ++report.rowsChecked;
            if (!core::constantTimeEquals(event.signature.data(), event.signature.size(),
                                          computed.data(), computed.size())) {
                report.tampered.push_back("audit_events:" + std::to_string(event.id));
            }
        }
        tx.commit();

        if (!report.valid()) {
            core::Log::error("audit", "Integrity check failed for " +
                             std::to_string(report.tampered.size()) + " row(s)");
        }
        return report;
    }

    std::string exportDownloads(const std::string& roomId,
                                const std::string& callerId,
                                Format format) {
        auto downloads = listDownloads(roomId, callerId);

        std::stringstream output;
        switch (format) {
            case Format::JSON: {
                nlohmann::json j = nlohmann::json::array();
                for (const auto& download : downloads) {
                    nlohmann::json row;
                    row["id"] = download.id;
                    row["room_id"] = download.roomId;
                    row["document_id"] = download.documentId;
                    row["user_id"] = download.userId;
                    row["filename"] = download.filename;
                    row["timestamp"] = core::formatIso8601(download.timestamp);
                    j.push_back(row);
                }
                output << j.dump(2);
                break;
            }
            case Format::CSV: {
                output << "id,room_id,document_id,user_id,filename,timestamp\n";
                for (const auto& download : downloads) {
                    output << download.id << ","
                           << csvField(download.roomId) << ","
                           << csvField(download.documentId) << ","
                           << csvField(download.userId) << ","
                           << csvField(download.filename) << ","
                           << core::formatIso8601(download.timestamp)
                           << "\n";
                }
                break;
            }
        }
        return output.str();
    }

    storage::Database& database() { return *db_; }

private:
    std::shared_ptr<storage::Database> db_;
    std::vector<uint8_t> hmacKey_;
    std::shared_ptr<const core::Clock> clock_;

    static Event readEvent(const storage::Statement& stmt) {
        Event event;
        event.id = stmt.int64(0);
        event.data.userId = stmt.optionalText(1);
        event.data.action = stmt.text(2);
        event.data.objectType = stmt.optionalText(3);
        event.data.objectId = stmt.optionalText(4);
        event.data.details = stmt.optionalText(5);
        event.origin.ipAddress = stmt.optionalText(6);
        event.origin.userAgent = stmt.optionalText(7);
        event.timestamp = core::fromEpochMillis(stmt.int64(8));
        event.signature = stmt.blob(9);
        return event;
    }

    std::vector<uint8_t> downloadSignature(const Download& download) const {
        std::string message = "download";
        appendField(message, download.roomId);
        appendField(message, download.documentId);
        appendField(message, download.userId);
        appendField(message, download.filename);
        appendField(message, std::to_string(core::toEpochMillis(download.timestamp)));
        return core::hmacSha256(hmacKey_, message);
    }

    std::vector<uint8_t> eventSignature(const Event& event) const {
        std::string message = "event";
        appendOptional(message, event.data.userId);
        appendField(message, event.data.action);
        appendOptional(message, event.data.objectType);
        appendOptional(message, event.data.objectId);
        appendOptional(message, event.data.details);
        appendOptional(message, event.origin.ipAddress);
        appendOptional(message, event.origin.userAgent);
        appendField(message, std::to_string(core::toEpochMillis(event.timestamp)));
        return core::hmacSha256(hmacKey_, message);
    }
};

// Public interface implementation
AuditLog::AuditLog(std::shared_ptr<storage::Database> db,
                   std::vector<uint8_t> hmacKey,
                   std::shared_ptr<const core::Clock> clock)
    : impl_(std::make_unique<Impl>(std::move(db), std::move(hmacKey), std::move(clock))) {}

AuditLog::~AuditLog() = default;

Download AuditLog::recordDownload(const std::string& roomId,
                                  const std::string& documentId,
                                  const std::string& userId,
                                  const std::string& filename) {
    auto conn = impl_->database().acquire();
    return impl_->recordDownload(*conn, roomId, documentId, userId, filename);
}

Download AuditLog::recordDownload(storage::Connection& conn,
                                  const std::string& roomId,
                                  const std::string& documentId,
                                  const std::string& userId,
                                  const std::string& filename) {
    return impl_->recordDownload(conn, roomId, documentId, userId, filename);
}

std::vector<Download> AuditLog::listDownloads(const std::string& roomId,
                                              const std::string& callerId) const {
    return impl_->listDownloads(roomId, callerId);
}

void AuditLog::recordEvent(const EventData& data, const RequestContext& origin) {
    auto conn = impl_->database().acquire();
    impl_->recordEvent(*conn, data, origin);
}

void AuditLog::recordEvent(storage::Connection& conn, const EventData& data,
                           const RequestContext& origin) {
    impl_->recordEvent(conn, data, origin);
}

std::vector<Event> AuditLog::queryEvents(const Query& filter) const {
    return impl_->queryEvents(filter);
}

IntegrityReport AuditLog::verifyIntegrity() const {
    return impl_->verifyIntegrity();
}

std::string AuditLog::exportDownloads(const std::string& roomId,
                                      const std::string& callerId,
                                      Format format) const {
    return impl_->exportDownloads(roomId, callerId, format);
}

} // namespace lockbox::audit
