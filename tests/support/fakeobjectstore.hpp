#pragma once

#include "core/errors.hpp"
#include "core/identifiers.hpp"
#include "storage/objectstore.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace lockbox::test {

/**
 * @brief Object store returning predictable URLs without any network
 */
class FakeObjectStore : public storage::ObjectStore {
public:
    storage::UploadTicket presignUpload(const std::string& roomId) override {
        ++uploads;
        storage::UploadTicket ticket;
        ticket.storageKey = storage::documentStorageKey(roomId, core::generateUuid());
        ticket.uploadUrl = "https://objects.test/put/" + ticket.storageKey;
        ticket.expiresIn = std::chrono::seconds(300);
        return ticket;
    }

    storage::DownloadTicket presignDownload(const std::string& roomId,
                                            const std::string& documentId) override {
        if (failDownloads) {
            throw core::TransientStorageError("object store unavailable");
        }
        ++downloads;
        storage::DownloadTicket ticket;
        ticket.downloadUrl = "https://objects.test/get/" +
                             storage::documentStorageKey(roomId, documentId);
        ticket.expiresIn = std::chrono::seconds(60);
        return ticket;
    }

    void deleteObject(const std::string& roomId, const std::string& documentId) override {
        if (failDeletes) {
            throw core::TransientStorageError("object store unavailable");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        deletedKeys_.push_back(storage::documentStorageKey(roomId, documentId));
    }

    std::vector<std::string> deletedKeys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return deletedKeys_;
    }

    std::atomic<int> uploads{0};
    std::atomic<int> downloads{0};
    std::atomic<bool> failDownloads{false};
    std::atomic<bool> failDeletes{false};

private:
    mutable std::mutex mutex_;
    std::vector<std::string> deletedKeys_;
};

} // namespace lockbox::test
