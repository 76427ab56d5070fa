#pragma once

#include "access/access_export.hpp"
#include "core/clock.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lockbox::storage {
class Connection;
class Database;
}

namespace lockbox::audit {

// Actions written to the event log
namespace action {
    constexpr char CREATE_ROOM[] = "create_room";
    constexpr char CREATE_INVITE[] = "create_invite";
    constexpr char ACCEPT_INVITE[] = "accept_invite";
    constexpr char REVOKE_INVITE[] = "revoke_invite";
    constexpr char REVOKE_ACCESS[] = "revoke_access";
    constexpr char PRESIGN_UPLOAD[] = "presign_upload";
    constexpr char UPLOAD_DOCUMENT[] = "upload_document";
    constexpr char DOWNLOAD_DOCUMENT[] = "download_document";
    constexpr char DELETE_DOCUMENT[] = "delete_document";
}

/**
 * @brief Where a request came from, as seen by the HTTP layer
 */
struct RequestContext {
    std::optional<std::string> ipAddress;
    std::optional<std::string> userAgent;
};

struct EventData {
    std::optional<std::string> userId;
    std::string action;
    std::optional<std::string> objectType;
    std::optional<std::string> objectId;
    std::optional<std::string> details;  // JSON object text
};

struct Event {
    int64_t id = 0;
    EventData data;
    RequestContext origin;
    core::TimePoint timestamp;
    std::vector<uint8_t> signature;
};

/**
 * @brief One issued download link
 */
struct Download {
    int64_t id = 0;
    std::string roomId;
    std::string documentId;
    std::string userId;
    std::string filename;
    core::TimePoint timestamp;
};

enum class Format {
    JSON,
    CSV
};

struct TimeRange {
    core::TimePoint start;
    core::TimePoint end;
};

struct Query {
    std::optional<std::string> userId;
    std::optional<std::string> action;
    std::optional<std::string> objectId;
    std::optional<TimeRange> timeRange;
    size_t limit = 1000;
};

struct IntegrityReport {
    size_t rowsChecked = 0;
    std::vector<std::string> tampered;  // "downloads:<id>" or "audit_events:<id>"

    bool valid() const { return tampered.empty(); }
};

/**
 * @brief Append-only, HMAC-signed record of document access and actions
 *
 * Rows are never updated or deleted; the schema rejects both. Each row is
 * signed with HMAC-SHA256 over its fields so verifyIntegrity() can detect
 * edits made behind the service's back.
 */
class LOCKBOX_ACCESS_EXPORT AuditLog {
public:
    /**
     * @brief Constructor
     * @param db Shared database
     * @param hmacKey Signing key, must not be empty
     * @param clock Time source for row timestamps
     */
    AuditLog(std::shared_ptr<storage::Database> db,
             std::vector<uint8_t> hmacKey,
             std::shared_ptr<const core::Clock> clock);
    ~AuditLog();

    /**
     * @brief Append one download row
     *
     * Called once per issued download link, so repeated requests by the
     * same user yield repeated rows.
     */
    Download recordDownload(const std::string& roomId,
                            const std::string& documentId,
                            const std::string& userId,
                            const std::string& filename);

    /**
     * @brief Same as above, inside the caller's transaction
     */
    Download recordDownload(storage::Connection& conn,
                            const std::string& roomId,
                            const std::string& documentId,
                            const std::string& userId,
                            const std::string& filename);

    /**
     * @brief Download rows of a room, oldest first
     * @param callerId Must own the room
     */
    std::vector<Download> listDownloads(const std::string& roomId,
                                        const std::string& callerId) const;

    void recordEvent(const EventData& data, const RequestContext& origin = {});
    void recordEvent(storage::Connection& conn, const EventData& data,
                     const RequestContext& origin = {});

    /**
     * @brief Events matching every set filter, oldest first
     */
    std::vector<Event> queryEvents(const Query& filter) const;

    /**
     * @brief Recompute every row signature and compare
     */
    IntegrityReport verifyIntegrity() const;

    /**
     * @brief Render a room's download history
     * @param callerId Must own the room
     */
    std::string exportDownloads(const std::string& roomId,
                                const std::string& callerId,
                                Format format) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    // Prevent copying
    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;
};

} // namespace lockbox::audit
