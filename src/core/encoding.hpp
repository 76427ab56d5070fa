#pragma once

#include "core/core_export.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lockbox::core {

// Lowercase hexadecimal
LOCKBOX_CORE_EXPORT std::string hexEncode(const uint8_t* data, size_t len);
LOCKBOX_CORE_EXPORT std::string hexEncode(const std::vector<uint8_t>& data);

/**
 * @brief RFC 4648 base64url without padding
 */
LOCKBOX_CORE_EXPORT std::string base64UrlEncode(const uint8_t* data, size_t len);
LOCKBOX_CORE_EXPORT std::string base64UrlEncode(std::string_view data);

/**
 * @brief Decode base64url, padded or not
 * @return Decoded bytes, std::nullopt on any character outside the alphabet
 */
LOCKBOX_CORE_EXPORT std::optional<std::vector<uint8_t>> base64UrlDecode(std::string_view text);

/**
 * @brief Percent-encode everything except RFC 3986 unreserved characters
 * @param keepSlash Leave '/' as is (object key paths)
 */
LOCKBOX_CORE_EXPORT std::string percentEncode(std::string_view text, bool keepSlash = false);

/**
 * @brief Decode %XX escapes, and '+' as space when formEncoded
 * @return std::nullopt on a truncated or non-hex escape
 */
LOCKBOX_CORE_EXPORT std::optional<std::string> percentDecode(std::string_view text,
                                                             bool formEncoded = true);

LOCKBOX_CORE_EXPORT std::string toLowerAscii(std::string_view text);
LOCKBOX_CORE_EXPORT std::string trim(std::string_view text);

/**
 * @brief Canonical form of an email address for comparisons
 *
 * Trimmed and ASCII-lowercased. Comparing canonical forms is the
 * case-insensitive match used for invite email restrictions.
 */
LOCKBOX_CORE_EXPORT std::string canonicalEmail(std::string_view email);

/**
 * @brief Loose syntactic check: one '@', non-empty local part and domain,
 * a dot in the domain, no whitespace
 */
LOCKBOX_CORE_EXPORT bool looksLikeEmail(std::string_view email);

} // namespace lockbox::core
