#pragma once

#include "core/core_export.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lockbox::core {

/**
 * @brief A freshly generated invite token
 *
 * `raw` goes to the inviting owner exactly once; only `hash` is stored.
 */
struct IssuedToken {
    std::string raw;   // base64url, 43 characters
    std::string hash;  // lowercase hex HMAC-SHA256, 64 characters
};

/**
 * @brief Generates unguessable invite tokens and their keyed one-way hashes
 *
 * Hashes are HMAC-SHA256 under a server secret, so a leaked invites table
 * cannot be used to confirm guessed tokens offline.
 */
class LOCKBOX_CORE_EXPORT TokenCodec {
public:
    static constexpr size_t TOKEN_BYTES = 32;  // 256 bits of entropy

    /**
     * @brief Constructor
     * @param secret HMAC key for token hashes
     * @throws std::invalid_argument if the secret is empty
     */
    explicit TokenCodec(std::vector<uint8_t> secret);
    ~TokenCodec();

    TokenCodec(const TokenCodec&) = delete;
    TokenCodec& operator=(const TokenCodec&) = delete;

    /**
     * @brief Generate a random token and its hash
     * @throws std::runtime_error if the CSPRNG fails
     */
    IssuedToken generate() const;

    /**
     * @brief Hash a presented token for lookup
     */
    std::string hash(std::string_view rawToken) const;

    /**
     * @brief Check a presented token against a stored hash in constant time
     */
    bool matches(std::string_view rawToken, std::string_view storedHash) const;

private:
    std::vector<uint8_t> secret_;
};

} // namespace lockbox::core
