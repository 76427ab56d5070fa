#pragma once

#include "core/core_export.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace lockbox::core {

/**
 * @brief SHA-256 of a byte string
 * @return 32-byte digest
 * @throws std::runtime_error if OpenSSL fails
 */
LOCKBOX_CORE_EXPORT std::vector<uint8_t> sha256(std::string_view data);

/**
 * @brief HMAC-SHA256
 * @param key MAC key (any length)
 * @param data Message
 * @return 32-byte MAC
 * @throws std::runtime_error if OpenSSL fails
 */
LOCKBOX_CORE_EXPORT std::vector<uint8_t> hmacSha256(const std::vector<uint8_t>& key,
                                                    std::string_view data);

/**
 * @brief Fill a buffer from the OpenSSL CSPRNG
 * @throws std::runtime_error if the generator is not seeded
 */
LOCKBOX_CORE_EXPORT std::vector<uint8_t> randomBytes(size_t length);

/**
 * @brief Compare two byte strings without data-dependent early exit
 */
LOCKBOX_CORE_EXPORT bool constantTimeEquals(const void* a, size_t aLen,
                                            const void* b, size_t bLen);

LOCKBOX_CORE_EXPORT bool constantTimeEquals(std::string_view a, std::string_view b);

// Overwrite sensitive memory so the compiler cannot elide it
LOCKBOX_CORE_EXPORT void cleanse(void* ptr, size_t size);

} // namespace lockbox::core
