#pragma once
#include <cstddef>
#include <string>

enum class SessionErrorKind {
    NotFound,
    Expired,
    LockPoisoned,
    InvalidFormat,
    AlreadyExists,
    InvalidRecord,
    LimitExceeded
};

// Typed failure carried by SessionResult. NotFound and Expired are ordinary
// outcomes callers branch on; LockPoisoned sticks until the store is reset.
class SessionError {
public:
    SessionError(SessionErrorKind kind, std::string session_id = "", std::string detail = "");

    static SessionError notFound(const std::string& session_id);
    static SessionError expired(const std::string& session_id);
    static SessionError lockPoisoned(const std::string& detail = "");
    static SessionError invalidFormat(const std::string& text);
    static SessionError alreadyExists(const std::string& session_id);
    static SessionError invalidRecord(const std::string& session_id, const std::string& detail);
    // Per-owner cap reached; session_id carries the owner name
    static SessionError limitExceeded(const std::string& owner, size_t limit);

    SessionErrorKind kind() const { return kind_; }
    const std::string& sessionId() const { return session_id_; }
    const std::string& detail() const { return detail_; }

    // Human readable, e.g. "Session not found: sess_..."
    std::string message() const;

    bool operator==(SessionErrorKind kind) const { return kind_ == kind; }

private:
    SessionErrorKind kind_;
    std::string session_id_;
    std::string detail_;
};

const char* toString(SessionErrorKind kind);
