#include "core/tokencodec.hpp"
#include "core/digest.hpp"
#include "core/encoding.hpp"
#include <stdexcept>

namespace lockbox::core {

TokenCodec::TokenCodec(std::vector<uint8_t> secret)
    : secret_(std::move(secret)) {
    if (secret_.empty()) {
        throw std::invalid_argument("Invite token secret must not be empty");
    }
}

TokenCodec::~TokenCodec() {
    cleanse(secret_.data(), secret_.size());
}

IssuedToken TokenCodec::generate() const {
    auto bytes = randomBytes(TOKEN_BYTES);

    IssuedToken token;
    token.raw = base64UrlEncode(bytes.data(), bytes.size());
    cleanse(bytes.data(), bytes.size());

    token.hash = hash(token.raw);
    return token;
}

std::string TokenCodec::hash(std::string_view rawToken) const {
    return hexEncode(hmacSha256(secret_, rawToken));
}

bool TokenCodec::matches(std::string_view rawToken, std::string_view storedHash) const {
    std::string computed = hash(rawToken);
    return constantTimeEquals(computed, storedHash);
}

} // namespace lockbox::core
