#pragma once

#include "api/api_export.hpp"
#include "api/httpserver.hpp"
#include "storage/database.hpp"
#include "storage/s3presigner.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lockbox::config {

// Secrets shorter than this are rejected
constexpr size_t MIN_SECRET_LENGTH = 32;

/**
 * @brief Everything lockboxd needs to start
 *
 * Loaded from a JSON file:
 * {
 *   "log_level": "info",
 *   "database": {"path": "...", "pool_size": 4, "busy_timeout_ms": 5000},
 *   "server": {"address": "127.0.0.1", "port": 8080, "threads": 4, "max_body_bytes": 1048576},
 *   "secrets": {"invite": "...", "audit": "...", "jwt": "..."},
 *   "jwt": {"issuer": "..."},
 *   "s3": {"endpoint": "...", "bucket": "...", "region": "...", "access_key_id": "...",
 *          "secret_access_key": "...", "path_style": false,
 *          "upload_expiry_seconds": 300, "download_expiry_seconds": 60,
 *          "request_timeout_seconds": 10}
 * }
 * Secrets may instead come from LOCKBOX_INVITE_SECRET, LOCKBOX_AUDIT_KEY,
 * LOCKBOX_JWT_SECRET, LOCKBOX_S3_ACCESS_KEY_ID and
 * LOCKBOX_S3_SECRET_ACCESS_KEY, which take precedence over the file.
 */
struct LOCKBOX_API_EXPORT ServiceConfig {
    using EnvLookup = std::function<const char*(const char*)>;

    std::string logLevel = "info";
    std::string databasePath = "lockbox.db";
    storage::DatabaseOptions database;
    api::ServerSettings server;
    std::string inviteSecret;
    std::string auditKey;
    std::string jwtSecret;
    std::optional<std::string> jwtIssuer;
    storage::S3Settings s3;

    /**
     * @brief Parse configuration text
     * @throws std::invalid_argument on malformed JSON or wrongly typed fields
     */
    static ServiceConfig parse(const std::string& jsonText);

    /**
     * @brief Read and parse a configuration file
     * @throws std::runtime_error if the file cannot be read
     */
    static ServiceConfig load(const std::string& path);

    /**
     * @brief Override secrets from the process environment
     */
    void applyEnvironment();
    void applyEnvironment(const EnvLookup& lookup);

    /**
     * @brief Check that the configuration is complete
     * @throws std::invalid_argument naming the first problem found
     */
    void validate() const;

    static std::vector<uint8_t> secretBytes(const std::string& secret);
};

} // namespace lockbox::config
