#include "core/errors.hpp"

namespace lockbox::core {

namespace {

ErrorKind kindForReason(InviteStateError::Reason reason) {
    switch (reason) {
        case InviteStateError::Reason::Revoked:
            return ErrorKind::InviteRevoked;
        case InviteStateError::Reason::Expired:
            return ErrorKind::InviteExpired;
        case InviteStateError::Reason::Exhausted:
            return ErrorKind::InviteExhausted;
        case InviteStateError::Reason::EmailMismatch:
            return ErrorKind::EmailMismatch;
    }
    return ErrorKind::InviteRevoked;
}

const char* defaultMessage(InviteStateError::Reason reason) {
    switch (reason) {
        case InviteStateError::Reason::Revoked:
            return "Invite revoked";
        case InviteStateError::Reason::Expired:
            return "Invite expired";
        case InviteStateError::Reason::Exhausted:
            return "Invite max uses exceeded";
        case InviteStateError::Reason::EmailMismatch:
            return "Invite restricted to a different email";
    }
    return "Invite unusable";
}

} // namespace

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:      return "validation_error";
        case ErrorKind::Authorization:   return "authorization_error";
        case ErrorKind::NotFound:        return "not_found";
        case ErrorKind::InviteRevoked:   return "invite_revoked";
        case ErrorKind::InviteExpired:   return "invite_expired";
        case ErrorKind::InviteExhausted: return "invite_exhausted";
        case ErrorKind::EmailMismatch:   return "email_mismatch";
        case ErrorKind::Conflict:        return "conflict";
        case ErrorKind::Transient:       return "transient_storage_error";
        case ErrorKind::Storage:         return "storage_error";
    }
    return "unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

InviteStateError::InviteStateError(Reason reason)
    : InviteStateError(reason, defaultMessage(reason)) {}

InviteStateError::InviteStateError(Reason reason, const std::string& message)
    : Error(kindForReason(reason), message), reason_(reason) {}

} // namespace lockbox::core
