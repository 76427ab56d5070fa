#include "auth/jwtidentity.hpp"
#include "core/digest.hpp"
#include "core/encoding.hpp"
#include "core/logging.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace lockbox::auth {

namespace {

constexpr char BEARER_PREFIX[] = "bearer ";

std::optional<nlohmann::json> decodeSegment(std::string_view segment) {
    auto bytes = core::base64UrlDecode(segment);
    if (!bytes) {
        return std::nullopt;
    }
    auto json = nlohmann::json::parse(bytes->begin(), bytes->end(), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    return json;
}

/// Reads a NumericDate claim into @p value, leaving it empty when absent.
/// Returns false when the claim is present but not a whole number of seconds
/// that fits in int64_t.
bool readTimeClaim(const nlohmann::json& claims, const char* name,
                   std::optional<int64_t>& value) {
    value.reset();
    auto it = claims.find(name);
    if (it == claims.end()) {
        return true;
    }
    if (it->is_number_unsigned()) {
        auto raw = it->get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return false;
        }
        value = static_cast<int64_t>(raw);
        return true;
    }
    if (it->is_number_integer()) {
        value = it->get<int64_t>();
        return true;
    }
    if (it->is_number_float()) {
        // [-2^63, 2^63) are the doubles that convert without overflow
        const double raw = it->get<double>();
        if (!std::isfinite(raw) || raw < -9223372036854775808.0 || raw >= 9223372036854775808.0) {
            return false;
        }
        value = static_cast<int64_t>(std::floor(raw));
        return true;
    }
    return false;
}

} // namespace

JwtIdentityProvider::JwtIdentityProvider(std::vector<uint8_t> secret,
                                         std::shared_ptr<const core::Clock> clock,
                                         std::optional<std::string> issuer)
    : secret_(std::move(secret)), clock_(std::move(clock)), issuer_(std::move(issuer)) {
    if (secret_.empty()) {
        throw std::invalid_argument("JWT secret must not be empty");
    }
    if (!clock_) {
        throw std::invalid_argument("JwtIdentityProvider requires a clock");
    }
}

JwtIdentityProvider::~JwtIdentityProvider() {
    core::cleanse(secret_.data(), secret_.size());
}

std::optional<Identity> JwtIdentityProvider::authenticate(const api::Request& request) const {
    auto header = request.header("authorization");
    if (!header) {
        return std::nullopt;
    }

    const std::string prefix = BEARER_PREFIX;
    if (header->size() <= prefix.size() ||
        core::toLowerAscii(header->substr(0, prefix.size())) != prefix) {
        return std::nullopt;
    }
    return verify(core::trim(header->substr(prefix.size())));
}

std::optional<Identity> JwtIdentityProvider::verify(const std::string& token) const {
    size_t first = token.find('.');
    size_t second = first == std::string::npos ? first : token.find('.', first + 1);
    if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
        return std::nullopt;
    }

    std::string_view view(token);
    std::string_view signingInput = view.substr(0, second);
    auto header = decodeSegment(view.substr(0, first));
    auto claims = decodeSegment(view.substr(first + 1, second - first - 1));
    auto signature = core::base64UrlDecode(view.substr(second + 1));
    if (!header || !claims || !signature) {
        return std::nullopt;
    }

    auto alg = header->find("alg");
    if (alg == header->end() || !alg->is_string() || alg->get<std::string>() != "HS256") {
        core::Log::debug("auth", "Rejected token with unsupported algorithm");
        return std::nullopt;
    }

    auto expected = core::hmacSha256(secret_, signingInput);
    if (!core::constantTimeEquals(expected.data(), expected.size(),
                                  signature->data(), signature->size())) {
        core::Log::debug("auth", "Rejected token with bad signature");
        return std::nullopt;
    }

    const int64_t now = core::toEpochMillis(clock_->now()) / 1000;
    std::optional<int64_t> exp;
    std::optional<int64_t> nbf;
    if (!readTimeClaim(*claims, "exp", exp) || !readTimeClaim(*claims, "nbf", nbf)) {
        core::Log::debug("auth", "Rejected token with malformed time claims");
        return std::nullopt;
    }
    if (exp && now >= *exp) {
        core::Log::debug("auth", "Rejected expired token");
        return std::nullopt;
    }
    if (nbf && now < *nbf) {
        return std::nullopt;
    }
    if (issuer_) {
        auto iss = claims->find("iss");
        if (iss == claims->end() || !iss->is_string() || iss->get<std::string>() != *issuer_) {
            core::Log::debug("auth", "Rejected token from unexpected issuer");
            return std::nullopt;
        }
    }

    auto sub = claims->find("sub");
    auto email = claims->find("email");
    if (sub == claims->end() || !sub->is_string() ||
        email == claims->end() || !email->is_string()) {
        return std::nullopt;
    }

    Identity identity;
    identity.userId = sub->get<std::string>();
    identity.email = email->get<std::string>();
    if (identity.userId.empty()) {
        return std::nullopt;
    }
    return identity;
}

std::string JwtIdentityProvider::sign(const nlohmann::json& claims,
                                      const std::vector<uint8_t>& secret) {
    nlohmann::json header = {{"alg", "HS256"}, {"typ", "JWT"}};
    std::string signingInput = core::base64UrlEncode(header.dump()) + "." +
                               core::base64UrlEncode(claims.dump());
    auto signature = core::hmacSha256(secret, signingInput);
    return signingInput + "." + core::base64UrlEncode(signature.data(), signature.size());
}

} // namespace lockbox::auth
