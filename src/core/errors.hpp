#pragma once

#include "core/core_export.hpp"
#include <stdexcept>
#include <string>

namespace lockbox::core {

/**
 * @brief Stable, machine-readable error categories
 */
enum class ErrorKind {
    Validation,       // Malformed request or constraint
    Authorization,    // Caller may not perform the action
    NotFound,         // Unknown invite, room, share or document
    InviteRevoked,    // Redemption gate: invite revoked
    InviteExpired,    // Redemption gate: invite past expires_at
    InviteExhausted,  // Redemption gate: no uses left
    EmailMismatch,    // Redemption gate: invite bound to another email
    Conflict,         // Lost a uniqueness or atomic-write race
    Transient,        // Storage busy/unavailable, safe to retry
    Storage           // Storage failure that retrying will not fix
};

/**
 * @brief Name used on the wire for an error kind
 */
LOCKBOX_CORE_EXPORT const char* errorKindName(ErrorKind kind);

/**
 * @brief Base of every error the access subsystem reports
 */
class LOCKBOX_CORE_EXPORT Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

    /**
     * @brief Whether the caller may retry the same request unchanged
     */
    bool isRetryable() const noexcept { return kind_ == ErrorKind::Transient; }

private:
    ErrorKind kind_;
};

class LOCKBOX_CORE_EXPORT ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(ErrorKind::Validation, message) {}
};

class LOCKBOX_CORE_EXPORT AuthorizationError : public Error {
public:
    explicit AuthorizationError(const std::string& message)
        : Error(ErrorKind::Authorization, message) {}
};

class LOCKBOX_CORE_EXPORT NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(ErrorKind::NotFound, message) {}
};

/**
 * @brief Redemption rejected by one of the invite gates
 */
class LOCKBOX_CORE_EXPORT InviteStateError : public Error {
public:
    enum class Reason {
        Revoked,
        Expired,
        Exhausted,
        EmailMismatch
    };

    explicit InviteStateError(Reason reason);
    InviteStateError(Reason reason, const std::string& message);

    Reason reason() const noexcept { return reason_; }

private:
    Reason reason_;
};

class LOCKBOX_CORE_EXPORT ConflictError : public Error {
public:
    explicit ConflictError(const std::string& message)
        : Error(ErrorKind::Conflict, message) {}
};

class LOCKBOX_CORE_EXPORT TransientStorageError : public Error {
public:
    explicit TransientStorageError(const std::string& message)
        : Error(ErrorKind::Transient, message) {}
};

class LOCKBOX_CORE_EXPORT StorageError : public Error {
public:
    explicit StorageError(const std::string& message)
        : Error(ErrorKind::Storage, message) {}
};

} // namespace lockbox::core
