#include "core/SessionError.h"
#include <utility>

SessionError::SessionError(SessionErrorKind kind, std::string session_id, std::string detail)
    : kind_(kind), session_id_(std::move(session_id)), detail_(std::move(detail)) {}

SessionError SessionError::notFound(const std::string& session_id) {
    return SessionError(SessionErrorKind::NotFound, session_id);
}

SessionError SessionError::expired(const std::string& session_id) {
    return SessionError(SessionErrorKind::Expired, session_id);
}

SessionError SessionError::lockPoisoned(const std::string& detail) {
    return SessionError(SessionErrorKind::LockPoisoned, "", detail);
}

SessionError SessionError::invalidFormat(const std::string& text) {
    return SessionError(SessionErrorKind::InvalidFormat, text);
}

SessionError SessionError::alreadyExists(const std::string& session_id) {
    return SessionError(SessionErrorKind::AlreadyExists, session_id);
}

SessionError SessionError::invalidRecord(const std::string& session_id, const std::string& detail) {
    return SessionError(SessionErrorKind::InvalidRecord, session_id, detail);
}

SessionError SessionError::limitExceeded(const std::string& owner, size_t limit) {
    return SessionError(SessionErrorKind::LimitExceeded, owner, "max " + std::to_string(limit));
}

std::string SessionError::message() const {
    std::string msg;
    switch (kind_) {
        case SessionErrorKind::NotFound:
            msg = "Session not found: " + session_id_;
            break;
        case SessionErrorKind::Expired:
            msg = "Session expired: " + session_id_;
            break;
        case SessionErrorKind::LockPoisoned:
            msg = "Lock poisoned - concurrent access failure";
            break;
        case SessionErrorKind::InvalidFormat:
            msg = "Invalid session ID format: " + session_id_;
            break;
        case SessionErrorKind::AlreadyExists:
            msg = "Session already exists: " + session_id_;
            break;
        case SessionErrorKind::InvalidRecord:
            msg = "Invalid session data: " + session_id_;
            break;
        case SessionErrorKind::LimitExceeded:
            msg = "Session limit exceeded for owner: " + session_id_;
            break;
    }
    if (!detail_.empty()) {
        msg += " (" + detail_ + ")";
    }
    return msg;
}

const char* toString(SessionErrorKind kind) {
    switch (kind) {
        case SessionErrorKind::NotFound:      return "not_found";
        case SessionErrorKind::Expired:       return "expired";
        case SessionErrorKind::LockPoisoned:  return "lock_poisoned";
        case SessionErrorKind::InvalidFormat: return "invalid_format";
        case SessionErrorKind::AlreadyExists: return "already_exists";
        case SessionErrorKind::InvalidRecord: return "invalid_record";
        case SessionErrorKind::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}
