#pragma once

#include "core/core_export.hpp"
#include <string>
#include <string_view>

namespace lockbox::core {

/**
 * @brief Random RFC 4122 version 4 UUID, lowercase canonical form
 * @throws std::runtime_error if the CSPRNG fails
 */
LOCKBOX_CORE_EXPORT std::string generateUuid();

/**
 * @brief Whether text is a canonical 8-4-4-4-12 hex UUID
 */
LOCKBOX_CORE_EXPORT bool isUuid(std::string_view text);

} // namespace lockbox::core
