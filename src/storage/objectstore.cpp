#include "storage/objectstore.hpp"
#include "core/identifiers.hpp"

namespace lockbox::storage {

std::string documentStorageKey(const std::string& roomId, const std::string& documentId) {
    return "rooms/" + roomId + "/documents/" + documentId;
}

std::optional<std::string> documentIdFromKey(const std::string& roomId,
                                             const std::string& storageKey) {
    const std::string prefix = "rooms/" + roomId + "/documents/";
    if (storageKey.size() <= prefix.size() ||
        storageKey.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    std::string documentId = storageKey.substr(prefix.size());
    if (!core::isUuid(documentId)) {
        return std::nullopt;
    }
    return documentId;
}

} // namespace lockbox::storage
