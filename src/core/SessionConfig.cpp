#include "core/SessionConfig.h"
#include "core/IdGenerator.h"
#include <stdexcept>
#include <string>

const char* toString(EvictionPolicy policy) {
    switch (policy) {
        case EvictionPolicy::OldestCreated:       return "oldest_created";
        case EvictionPolicy::LeastRecentlyActive: return "least_recent_activity";
    }
    return "unknown";
}

std::optional<EvictionPolicy> evictionPolicyFromString(const std::string& name) {
    if (name == "oldest_created") return EvictionPolicy::OldestCreated;
    if (name == "least_recent_activity") return EvictionPolicy::LeastRecentlyActive;
    return std::nullopt;
}

std::chrono::milliseconds SessionConfig::maxDuration() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::duration::max()) / 2;
}

void SessionConfig::validate() const {
    if (timeout.count() <= 0) {
        throw std::invalid_argument("session timeout must be positive");
    }
    if (timeout > maxDuration()) {
        throw std::invalid_argument("session timeout must not exceed " + std::to_string(maxDuration().count()) + "ms");
    }
    if (max_sessions == 0) {
        throw std::invalid_argument("max_sessions must be at least 1");
    }
    if (cleanup_interval.count() <= 0) {
        throw std::invalid_argument("cleanup interval must be positive");
    }
    if (cleanup_interval > maxDuration()) {
        throw std::invalid_argument("cleanup interval must not exceed " + std::to_string(maxDuration().count()) + "ms");
    }
    if (!IdGenerator::isValidPrefix(token_prefix)) {
        throw std::invalid_argument("token prefix must be non-empty [A-Za-z0-9_]: '" + token_prefix + "'");
    }
}
