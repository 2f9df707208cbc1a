#pragma once
#include "core/SessionId.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

// Mints session tokens: <prefix>_<wall-clock-millis>_<hex of 16 CSPRNG bytes>.
// The random suffix carries all of the unpredictability; the millisecond part
// only makes tokens sort by creation order.
class IdGenerator {
public:
    static constexpr size_t kRandomBytes = 16;

    // Throws std::invalid_argument on a bad prefix and std::runtime_error if
    // the OpenSSL RNG is not seeded (fatal at startup).
    explicit IdGenerator(std::string prefix = "sess");

    SessionId generate() const;

    const std::string& prefix() const { return prefix_; }

    static bool isValidPrefix(const std::string& prefix);

private:
    int64_t nextMillis() const;

    std::string prefix_;
    // Last emitted timestamp; keeps the millis component non-decreasing
    mutable std::atomic<int64_t> last_millis_{0};
};
