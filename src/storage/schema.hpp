#pragma once

#include "core/core_export.hpp"

namespace lockbox::storage {

class Connection;

// Schema version written to schema_version
constexpr int SCHEMA_VERSION = 1;

/**
 * @brief Create tables, indexes and integrity triggers if missing
 */
LOCKBOX_CORE_EXPORT void applySchema(Connection& conn);

} // namespace lockbox::storage
