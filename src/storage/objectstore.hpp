#pragma once

#include "core/core_export.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace lockbox::storage {

struct UploadTicket {
    std::string uploadUrl;
    std::string storageKey;
    std::chrono::seconds expiresIn{0};
};

struct DownloadTicket {
    std::string downloadUrl;
    std::chrono::seconds expiresIn{0};
};

/**
 * @brief Backend holding raw document bytes
 *
 * The access subsystem never moves file content itself; it only asks the
 * backend for short-lived URLs the client uses directly.
 */
class LOCKBOX_CORE_EXPORT ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /**
     * @brief Reserve a storage key in a room and return a PUT URL for it
     */
    virtual UploadTicket presignUpload(const std::string& roomId) = 0;

    /**
     * @brief Return a GET URL for a stored document
     */
    virtual DownloadTicket presignDownload(const std::string& roomId,
                                           const std::string& documentId) = 0;

    /**
     * @brief Remove a stored document; removing a missing one succeeds
     * @throws core::TransientStorageError if the backend is unreachable or busy
     * @throws core::StorageError if the backend refuses the request
     */
    virtual void deleteObject(const std::string& roomId, const std::string& documentId) = 0;
};

// rooms/{roomId}/documents/{documentId}
LOCKBOX_CORE_EXPORT std::string documentStorageKey(const std::string& roomId,
                                                   const std::string& documentId);

/**
 * @brief Extract the document id from a storage key
 * @return std::nullopt if the key does not belong to the room
 */
LOCKBOX_CORE_EXPORT std::optional<std::string> documentIdFromKey(const std::string& roomId,
                                                                 const std::string& storageKey);

} // namespace lockbox::storage
