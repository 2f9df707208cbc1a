#pragma once
#include <chrono>
#include <optional>
#include <string>

enum class SessionEventType {
    Created,
    Stored,
    Refreshed,
    Expired,
    Evicted,
    Removed,
    CleanedUp,
    Updated,
    Poisoned,
    Reset
};

// Lifecycle event emitted by SessionManager after its lock is released
struct SessionEvent {
    SessionEventType type;
    std::string session_id;
    std::optional<std::string> owner;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::string detail;

    // "2025-01-01 12:00:00 UTC | SESSION_CREATED | session=... user=..."
    std::string toAuditString() const;
};

const char* toString(SessionEventType type);   // "SESSION_CREATED", ...
std::optional<SessionEventType> eventTypeFromString(const std::string& name);
