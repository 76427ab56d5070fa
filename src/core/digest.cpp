#include "core/digest.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <limits>
#include <stdexcept>

namespace lockbox::core {

std::vector<uint8_t> sha256(std::string_view data) {
    std::vector<uint8_t> hash(EVP_MAX_MD_SIZE);
    unsigned int hashLen = 0;

    if (EVP_Digest(data.data(), data.size(), hash.data(), &hashLen,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to compute SHA-256");
    }

    hash.resize(hashLen);
    return hash;
}

std::vector<uint8_t> hmacSha256(const std::vector<uint8_t>& key, std::string_view data) {
    if (key.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("HMAC key too long");
    }

    std::vector<uint8_t> mac(EVP_MAX_MD_SIZE);
    unsigned int macLen = 0;

    // HMAC() rejects a null key pointer, so an empty key still needs a valid address
    static const unsigned char emptyKey = 0;
    const unsigned char* keyData = key.empty() ? &emptyKey : key.data();

    if (HMAC(EVP_sha256(), keyData, static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(),
             mac.data(), &macLen) == nullptr) {
        throw std::runtime_error("Failed to compute HMAC-SHA256");
    }

    mac.resize(macLen);
    return mac;
}

std::vector<uint8_t> randomBytes(size_t length) {
    if (length > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("Requested too many random bytes");
    }

    std::vector<uint8_t> bytes(length);
    if (length > 0 && RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
        throw std::runtime_error("Failed to generate secure random bytes");
    }
    return bytes;
}

bool constantTimeEquals(const void* a, size_t aLen, const void* b, size_t bLen) {
    if (aLen != bLen) {
        return false;
    }
    if (aLen == 0) {
        return true;
    }
    return CRYPTO_memcmp(a, b, aLen) == 0;
}

bool constantTimeEquals(std::string_view a, std::string_view b) {
    return constantTimeEquals(a.data(), a.size(), b.data(), b.size());
}

void cleanse(void* ptr, size_t size) {
    if (ptr && size > 0) {
        OPENSSL_cleanse(ptr, size);
    }
}

} // namespace lockbox::core
