#include "core/SessionEvent.h"
#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

const std::array<SessionEventType, 10> kAllTypes = {
    SessionEventType::Created,  SessionEventType::Stored,   SessionEventType::Refreshed,
    SessionEventType::Expired,  SessionEventType::Evicted,  SessionEventType::Removed,
    SessionEventType::CleanedUp, SessionEventType::Updated, SessionEventType::Poisoned,
    SessionEventType::Reset
};

std::string formatUtc(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S") << " UTC";
    return oss.str();
}

} // namespace

const char* toString(SessionEventType type) {
    switch (type) {
        case SessionEventType::Created:   return "SESSION_CREATED";
        case SessionEventType::Stored:    return "SESSION_STORED";
        case SessionEventType::Refreshed: return "SESSION_REFRESHED";
        case SessionEventType::Expired:   return "SESSION_EXPIRED";
        case SessionEventType::Evicted:   return "SESSION_EVICTED";
        case SessionEventType::Removed:   return "SESSION_REMOVED";
        case SessionEventType::CleanedUp: return "SESSION_CLEANUP";
        case SessionEventType::Updated:   return "SESSION_UPDATED";
        case SessionEventType::Poisoned:  return "STORE_POISONED";
        case SessionEventType::Reset:     return "STORE_RESET";
    }
    return "UNKNOWN";
}

std::optional<SessionEventType> eventTypeFromString(const std::string& name) {
    for (auto type : kAllTypes) {
        if (name == toString(type)) return type;
    }
    return std::nullopt;
}

std::string SessionEvent::toAuditString() const {
    std::ostringstream oss;
    oss << formatUtc(timestamp) << " | " << toString(type);
    if (!session_id.empty()) {
        oss << " | session=" << session_id;
    }
    if (owner) {
        oss << " user=" << *owner;
    }
    if (!detail.empty()) {
        oss << (session_id.empty() && !owner ? " | " : " ") << detail;
    }
    return oss.str();
}

