#pragma once

#include "core/core_export.hpp"
#include "core/clock.hpp"
#include "storage/objectstore.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace lockbox::storage {

/**
 * @brief S3 (or S3-compatible) bucket settings
 */
struct S3Settings {
    std::string endpoint = "https://s3.amazonaws.com";  // scheme://host[:port]
    std::string bucket;
    std::string region = "us-east-1";
    std::string accessKeyId;
    std::string secretAccessKey;
    bool pathStyle = false;                   // endpoint/bucket/key instead of bucket.endpoint/key
    std::chrono::seconds uploadExpiry{300};   // 5 minutes
    std::chrono::seconds downloadExpiry{60};  // 1 minute
    std::chrono::seconds requestTimeout{10};  // Requests the service sends itself
};

/**
 * @brief Object store issuing AWS Signature Version 4 query-string URLs
 *
 * Only the host header is signed and the payload is UNSIGNED-PAYLOAD, so
 * the client can PUT or GET with no extra headers. Deletes are sent by the
 * service itself over the same kind of URL.
 */
class LOCKBOX_CORE_EXPORT S3Presigner : public ObjectStore {
public:
    /**
     * @brief Constructor
     * @param settings Bucket and credentials
     * @param clock Time source for X-Amz-Date
     * @throws std::invalid_argument on a malformed endpoint or missing credentials
     */
    S3Presigner(S3Settings settings, std::shared_ptr<const core::Clock> clock);

    UploadTicket presignUpload(const std::string& roomId) override;

    DownloadTicket presignDownload(const std::string& roomId,
                                   const std::string& documentId) override;

    void deleteObject(const std::string& roomId, const std::string& documentId) override;

    /**
     * @brief Build a presigned URL
     * @param method HTTP method ("GET", "PUT", "DELETE")
     * @param key Object key, unescaped
     * @param expires URL lifetime, at most seven days
     * @param at Signing time
     */
    std::string presignUrl(std::string_view method,
                           const std::string& key,
                           std::chrono::seconds expires,
                           core::TimePoint at) const;

private:
    S3Settings settings_;
    std::shared_ptr<const core::Clock> clock_;
    std::string scheme_;
    std::string endpointHost_;

    std::string host() const;
    std::string canonicalUri(const std::string& key) const;

    // Path and query of a presigned URL
    std::string signedTarget(std::string_view method,
                             const std::string& key,
                             std::chrono::seconds expires,
                             core::TimePoint at) const;

    // Send a bodiless request to the endpoint and return the HTTP status
    unsigned send(std::string_view method, const std::string& target) const;
};

} // namespace lockbox::storage
