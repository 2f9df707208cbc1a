#include "core/SessionRecord.h"
#include <utility>

Instant Instant::now() {
    return Instant{std::chrono::steady_clock::now(), std::chrono::system_clock::now()};
}

Instant Instant::shifted(std::chrono::milliseconds offset) const {
    return Instant{monotonic + offset, wall + offset};
}

int64_t toUnixMillis(WallTime t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

SessionRecord SessionRecord::create(SessionId id, std::optional<std::string> owner, Instant now) {
    return SessionRecord{std::move(id), std::move(owner), now, now, Metadata{}, false};
}

bool SessionRecord::isExpired(SteadyTime now, std::chrono::milliseconds timeout) const {
    return now - last_activity.monotonic > timeout;
}

std::chrono::milliseconds SessionRecord::idleFor(SteadyTime now) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - last_activity.monotonic);
}

std::chrono::milliseconds SessionRecord::age(SteadyTime now) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - created_at.monotonic);
}

void SessionRecord::touch(const Instant& now) {
    // steady_clock never goes back, but a caller-built record may carry a
    // later instant than the one sampled here
    if (now.monotonic > last_activity.monotonic) {
        last_activity.monotonic = now.monotonic;
    }
    if (now.wall > last_activity.wall) {
        last_activity.wall = now.wall;
    }
}

bool SessionRecord::timestampsConsistent() const {
    return last_activity.monotonic >= created_at.monotonic &&
           last_activity.wall >= created_at.wall;
}

nlohmann::json SessionRecord::toJson() const {
    nlohmann::json j;
    j["id"] = id.str();
    j["owner"] = owner ? nlohmann::json(*owner) : nlohmann::json(nullptr);
    j["created_at"] = toUnixMillis(created_at.wall);
    j["last_activity"] = toUnixMillis(last_activity.wall);
    j["metadata"] = metadata;
    j["authenticated"] = authenticated;
    return j;
}
