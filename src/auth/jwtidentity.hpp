#pragma once

#include "api/api_export.hpp"
#include "auth/identity.hpp"
#include "core/clock.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lockbox::auth {

/**
 * @brief Identity from an HS256 bearer token
 *
 * Expects "Authorization: Bearer <jwt>". The token must carry string
 * "sub" and "email" claims; "exp" and "nbf" are enforced when present and
 * "iss" must match when an issuer is configured.
 */
class LOCKBOX_API_EXPORT JwtIdentityProvider : public IdentityProvider {
public:
    /**
     * @brief Constructor
     * @param secret HMAC-SHA256 key shared with the token issuer
     * @param clock Time source for exp and nbf
     * @param issuer Required "iss" value, if any
     * @throws std::invalid_argument if the secret is empty
     */
    JwtIdentityProvider(std::vector<uint8_t> secret,
                        std::shared_ptr<const core::Clock> clock,
                        std::optional<std::string> issuer = std::nullopt);
    ~JwtIdentityProvider() override;

    std::optional<Identity> authenticate(const api::Request& request) const override;

    /**
     * @brief Verify a compact JWT and extract the identity
     */
    std::optional<Identity> verify(const std::string& token) const;

    /**
     * @brief Produce a compact HS256 token for the given claims
     */
    static std::string sign(const nlohmann::json& claims, const std::vector<uint8_t>& secret);

private:
    std::vector<uint8_t> secret_;
    std::shared_ptr<const core::Clock> clock_;
    std::optional<std::string> issuer_;
};

} // namespace lockbox::auth
