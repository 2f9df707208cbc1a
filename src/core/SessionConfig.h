#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

enum class EvictionPolicy {
    OldestCreated,        // earliest created_at goes first (default)
    LeastRecentlyActive   // earliest last_activity goes first
};

const char* toString(EvictionPolicy policy);
std::optional<EvictionPolicy> evictionPolicyFromString(const std::string& name);

struct SessionConfig {
    std::chrono::milliseconds timeout{std::chrono::seconds(3600)};
    size_t max_sessions = 1000;
    std::chrono::milliseconds cleanup_interval{std::chrono::seconds(300)};
    std::string token_prefix = "sess";
    EvictionPolicy eviction = EvictionPolicy::OldestCreated;
    size_t max_sessions_per_owner = 0;   // 0 = unlimited

    // Largest timeout or cleanup interval accepted. Expiry arithmetic runs in
    // steady_clock ticks, so longer durations would overflow.
    static std::chrono::milliseconds maxDuration();

    // Throws std::invalid_argument describing the first bad field
    void validate() const;
};
