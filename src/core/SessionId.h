#pragma once
#include "core/SessionResult.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

// Opaque session token: <prefix>_<wall-clock-millis>_<32 lowercase hex>.
// Kept as its own type so unrelated strings cannot be passed where a token is expected.
class SessionId {
public:
    explicit SessionId(std::string value);

    const std::string& str() const { return value_; }

    // Millisecond component, if the token is well formed
    std::optional<int64_t> timestampMillis() const;

    // Validate shape before lookup. The store itself never checks format.
    static SessionResult<SessionId> parse(const std::string& text, const std::string& prefix);
    static bool isWellFormed(const std::string& text, const std::string& prefix);

    bool operator==(const SessionId& other) const { return value_ == other.value_; }
    bool operator!=(const SessionId& other) const { return value_ != other.value_; }

private:
    std::string value_;
};

namespace std {
    template<>
    struct hash<SessionId> {
        size_t operator()(const SessionId& id) const {
            return std::hash<std::string>()(id.str());
        }
    };
}
