#pragma once
#include "core/SessionId.h"
#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

using SteadyTime = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;
using Metadata = std::unordered_map<std::string, std::string>;

// A point in time on both clocks. `monotonic` drives all expiry math;
// `wall` is only for display and audit.
struct Instant {
    SteadyTime monotonic;
    WallTime wall;

    static Instant now();

    // Same instant shifted on both clocks (negative offsets move into the past)
    Instant shifted(std::chrono::milliseconds offset) const;
};

struct SessionRecord {
    SessionId id;
    std::optional<std::string> owner;
    Instant created_at;
    Instant last_activity;
    Metadata metadata;
    bool authenticated = false;

    static SessionRecord create(SessionId id, std::optional<std::string> owner, Instant now = Instant::now());

    // Strictly greater than timeout; a record exactly at the boundary is still live
    bool isExpired(SteadyTime now, std::chrono::milliseconds timeout) const;
    std::chrono::milliseconds idleFor(SteadyTime now) const;
    std::chrono::milliseconds age(SteadyTime now) const;

    void touch(const Instant& now);

    // last_activity >= created_at on both clocks
    bool timestampsConsistent() const;

    nlohmann::json toJson() const;
};

int64_t toUnixMillis(WallTime t);
