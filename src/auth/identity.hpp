#pragma once

#include "api/request.hpp"
#include <optional>
#include <string>

namespace lockbox::auth {

/**
 * @brief Authenticated caller
 */
struct Identity {
    std::string userId;
    std::string email;
};

/**
 * @brief Authenticates a request and yields the caller's identity
 */
class IdentityProvider {
public:
    virtual ~IdentityProvider() = default;

    /**
     * @return std::nullopt if the request carries no valid credentials
     */
    virtual std::optional<Identity> authenticate(const api::Request& request) const = 0;
};

} // namespace lockbox::auth
