#include "config/serviceconfig.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include "test_config.h"

using namespace lockbox;
using config::ServiceConfig;

namespace {

const std::string INVITE_SECRET(32, 'i');
const std::string AUDIT_KEY(32, 'a');
const std::string JWT_SECRET(32, 'j');

std::string completeConfig() {
    return R"({
        "log_level": "debug",
        "database": {"path": "/var/lib/lockbox/lockbox.db", "pool_size": 8, "busy_timeout_ms": 2000},
        "server": {"address": "0.0.0.0", "port": 9443, "threads": 2, "max_body_bytes": 65536},
        "secrets": {"invite": ")" + INVITE_SECRET + R"(", "audit": ")" + AUDIT_KEY +
           R"(", "jwt": ")" + JWT_SECRET + R"("},
        "jwt": {"issuer": "https://id.example.com"},
        "s3": {"bucket": "rooms", "region": "eu-west-1", "access_key_id": "AKID",
               "secret_access_key": "SECRET", "download_expiry_seconds": 120,
               "request_timeout_seconds": 4}
    })";
}

} // namespace

TEST(ServiceConfigTest, ParsesCompleteFile) {
    auto config = ServiceConfig::parse(completeConfig());

    EXPECT_EQ(config.logLevel, "debug");
    EXPECT_EQ(config.databasePath, "/var/lib/lockbox/lockbox.db");
    EXPECT_EQ(config.database.poolSize, 8u);
    EXPECT_EQ(config.database.busyTimeoutMs, 2000);
    EXPECT_EQ(config.server.address, "0.0.0.0");
    EXPECT_EQ(config.server.port, 9443);
    EXPECT_EQ(config.server.workerThreads, 2u);
    EXPECT_EQ(config.server.maxBodyBytes, 65536u);
    EXPECT_EQ(config.jwtIssuer, std::string("https://id.example.com"));
    EXPECT_EQ(config.s3.bucket, "rooms");
    EXPECT_EQ(config.s3.region, "eu-west-1");
    EXPECT_EQ(config.s3.uploadExpiry, std::chrono::seconds(300));
    EXPECT_EQ(config.s3.downloadExpiry, std::chrono::seconds(120));
    EXPECT_EQ(config.s3.requestTimeout, std::chrono::seconds(4));
    EXPECT_NO_THROW(config.validate());

    auto secret = ServiceConfig::secretBytes(config.inviteSecret);
    EXPECT_EQ(secret.size(), 32u);
    EXPECT_EQ(secret[0], 'i');
}

TEST(ServiceConfigTest, DefaultsApplyToMissingSections) {
    auto config = ServiceConfig::parse("{}");
    EXPECT_EQ(config.logLevel, "info");
    EXPECT_EQ(config.databasePath, "lockbox.db");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_FALSE(config.jwtIssuer.has_value());
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ServiceConfigTest, RejectsMalformedInput) {
    EXPECT_THROW(ServiceConfig::parse("not json"), std::invalid_argument);
    EXPECT_THROW(ServiceConfig::parse("[]"), std::invalid_argument);
    EXPECT_THROW(ServiceConfig::parse(R"({"database": "x"})"), std::invalid_argument);
    EXPECT_THROW(ServiceConfig::parse(R"({"server": {"port": "eighty"}})"), std::invalid_argument);
}

TEST(ServiceConfigTest, EnvironmentOverridesSecrets) {
    auto config = ServiceConfig::parse("{}");
    std::map<std::string, std::string> env = {
        {"LOCKBOX_INVITE_SECRET", INVITE_SECRET},
        {"LOCKBOX_AUDIT_KEY", AUDIT_KEY},
        {"LOCKBOX_JWT_SECRET", JWT_SECRET},
        {"LOCKBOX_S3_ACCESS_KEY_ID", "AKID"},
        {"LOCKBOX_S3_SECRET_ACCESS_KEY", ""}
    };
    config.s3.secretAccessKey = "from-file";
    config.applyEnvironment([&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    });

    EXPECT_EQ(config.inviteSecret, INVITE_SECRET);
    EXPECT_EQ(config.auditKey, AUDIT_KEY);
    EXPECT_EQ(config.jwtSecret, JWT_SECRET);
    EXPECT_EQ(config.s3.accessKeyId, "AKID");
    // Empty values do not override
    EXPECT_EQ(config.s3.secretAccessKey, "from-file");
}

TEST(ServiceConfigTest, ValidateRejectsWeakOrMissingSettings) {
    auto base = ServiceConfig::parse(completeConfig());

    auto shortSecret = base;
    shortSecret.inviteSecret = "short";
    EXPECT_THROW(shortSecret.validate(), std::invalid_argument);

    auto sharedSecret = base;
    sharedSecret.auditKey = sharedSecret.inviteSecret;
    EXPECT_THROW(sharedSecret.validate(), std::invalid_argument);

    auto badLevel = base;
    badLevel.logLevel = "loud";
    EXPECT_THROW(badLevel.validate(), std::invalid_argument);

    auto noPool = base;
    noPool.database.poolSize = 0;
    EXPECT_THROW(noPool.validate(), std::invalid_argument);

    auto noBucket = base;
    noBucket.s3.bucket.clear();
    EXPECT_THROW(noBucket.validate(), std::invalid_argument);

    auto longExpiry = base;
    longExpiry.s3.downloadExpiry = std::chrono::hours(24 * 8);
    EXPECT_THROW(longExpiry.validate(), std::invalid_argument);

    auto noTimeout = base;
    noTimeout.s3.requestTimeout = std::chrono::seconds(0);
    EXPECT_THROW(noTimeout.validate(), std::invalid_argument);
}

TEST(ServiceConfigTest, LoadsFromFile) {
    auto path = std::filesystem::path(TEST_OUTPUT_DIR) / "config_load_test.json";
    {
        std::ofstream file(path);
        file << completeConfig();
    }
    auto config = ServiceConfig::load(path.string());
    EXPECT_EQ(config.s3.bucket, "rooms");
    std::filesystem::remove(path);

    EXPECT_THROW(ServiceConfig::load((std::filesystem::path(TEST_OUTPUT_DIR) / "missing.json").string()),
                 std::runtime_error);
}
