#include "config/serviceconfig.hpp"
#include "core/logging.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace lockbox::config {

using nlohmann::json;

namespace {

const json* section(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("Config section '") + name + "' must be an object");
    }
    return &*it;
}

template <typename T>
void read(const json* object, const char* key, T& out) {
    if (!object) {
        return;
    }
    auto it = object->find(key);
    if (it != object->end() && !it->is_null()) {
        out = it->get<T>();
    }
}

void readSeconds(const json* object, const char* key, std::chrono::seconds& out) {
    int64_t seconds = out.count();
    read(object, key, seconds);
    out = std::chrono::seconds(seconds);
}

} // namespace

ServiceConfig ServiceConfig::parse(const std::string& jsonText) {
    json root = json::parse(jsonText, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }

    ServiceConfig config;
    try {
        read(&root, "log_level", config.logLevel);

        const json* db = section(root, "database");
        read(db, "path", config.databasePath);
        read(db, "pool_size", config.database.poolSize);
        read(db, "busy_timeout_ms", config.database.busyTimeoutMs);

        const json* server = section(root, "server");
        read(server, "address", config.server.address);
        read(server, "port", config.server.port);
        read(server, "threads", config.server.workerThreads);
        read(server, "max_body_bytes", config.server.maxBodyBytes);
        readSeconds(server, "read_timeout_seconds", config.server.readTimeout);

        const json* secrets = section(root, "secrets");
        read(secrets, "invite", config.inviteSecret);
        read(secrets, "audit", config.auditKey);
        read(secrets, "jwt", config.jwtSecret);

        const json* jwt = section(root, "jwt");
        std::string issuer;
        read(jwt, "issuer", issuer);
        if (!issuer.empty()) {
            config.jwtIssuer = issuer;
        }

        const json* s3 = section(root, "s3");
        read(s3, "endpoint", config.s3.endpoint);
        read(s3, "bucket", config.s3.bucket);
        read(s3, "region", config.s3.region);
        read(s3, "access_key_id", config.s3.accessKeyId);
        read(s3, "secret_access_key", config.s3.secretAccessKey);
        read(s3, "path_style", config.s3.pathStyle);
        readSeconds(s3, "upload_expiry_seconds", config.s3.uploadExpiry);
        readSeconds(s3, "download_expiry_seconds", config.s3.downloadExpiry);
        readSeconds(s3, "request_timeout_seconds", config.s3.requestTimeout);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid configuration: ") + e.what());
    }
    return config;
}

ServiceConfig ServiceConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

void ServiceConfig::applyEnvironment() {
    applyEnvironment([](const char* name) -> const char* { return std::getenv(name); });
}

void ServiceConfig::applyEnvironment(const EnvLookup& lookup) {
    auto overrideFrom = [&lookup](const char* name, std::string& target) {
        const char* value = lookup(name);
        if (value && *value) {
            target = value;
        }
    };
    overrideFrom("LOCKBOX_INVITE_SECRET", inviteSecret);
    overrideFrom("LOCKBOX_AUDIT_KEY", auditKey);
    overrideFrom("LOCKBOX_JWT_SECRET", jwtSecret);
    overrideFrom("LOCKBOX_S3_ACCESS_KEY_ID", s3.accessKeyId);
    overrideFrom("LOCKBOX_S3_SECRET_ACCESS_KEY", s3.secretAccessKey);
}

void ServiceConfig::validate() const {
    if (!core::Log::parseLevel(logLevel)) {
        throw std::invalid_argument("Unknown log level: " + logLevel);
    }
    if (databasePath.empty()) {
        throw std::invalid_argument("database.path is required");
    }
    if (database.poolSize == 0) {
        throw std::invalid_argument("database.pool_size must be positive");
    }
    if (database.busyTimeoutMs < 0) {
        throw std::invalid_argument("database.busy_timeout_ms must not be negative");
    }
    if (server.workerThreads == 0) {
        throw std::invalid_argument("server.threads must be positive");
    }
    if (server.maxBodyBytes == 0) {
        throw std::invalid_argument("server.max_body_bytes must be positive");
    }

    auto requireSecret = [](const std::string& value, const char* name) {
        if (value.size() < MIN_SECRET_LENGTH) {
            throw std::invalid_argument(std::string(name) + " must be at least " +
                                        std::to_string(MIN_SECRET_LENGTH) + " characters");
        }
    };
    requireSecret(inviteSecret, "secrets.invite");
    requireSecret(auditKey, "secrets.audit");
    requireSecret(jwtSecret, "secrets.jwt");
    if (inviteSecret == auditKey) {
        throw std::invalid_argument("secrets.invite and secrets.audit must differ");
    }

    if (s3.bucket.empty()) {
        throw std::invalid_argument("s3.bucket is required");
    }
    if (s3.accessKeyId.empty() || s3.secretAccessKey.empty()) {
        throw std::invalid_argument("S3 credentials are required");
    }
    const auto maxExpiry = std::chrono::hours(24 * 7);
    if (s3.uploadExpiry.count() <= 0 || s3.uploadExpiry > maxExpiry ||
        s3.downloadExpiry.count() <= 0 || s3.downloadExpiry > maxExpiry) {
        throw std::invalid_argument("S3 URL expiries must be between 1 second and 7 days");
    }
    if (s3.requestTimeout.count() <= 0) {
        throw std::invalid_argument("s3.request_timeout_seconds must be positive");
    }
}

std::vector<uint8_t> ServiceConfig::secretBytes(const std::string& secret) {
    return std::vector<uint8_t>(secret.begin(), secret.end());
}

} // namespace lockbox::config
