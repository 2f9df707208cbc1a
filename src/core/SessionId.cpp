#include "core/SessionId.h"
#include "core/IdGenerator.h"
#include <cctype>
#include <stdexcept>
#include <utility>

SessionId::SessionId(std::string value) : value_(std::move(value)) {}

namespace {

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool lowerHex(const std::string& s) {
    for (char c : s) {
        bool digit = c >= '0' && c <= '9';
        bool letter = c >= 'a' && c <= 'f';
        if (!digit && !letter) return false;
    }
    return true;
}

// Splits from the right: the prefix itself may contain underscores ("cli_sess").
bool splitToken(const std::string& text, std::string& prefix, std::string& millis, std::string& hex) {
    size_t hex_sep = text.rfind('_');
    if (hex_sep == std::string::npos || hex_sep == 0) return false;
    size_t millis_sep = text.rfind('_', hex_sep - 1);
    if (millis_sep == std::string::npos) return false;

    prefix = text.substr(0, millis_sep);
    millis = text.substr(millis_sep + 1, hex_sep - millis_sep - 1);
    hex = text.substr(hex_sep + 1);
    return true;
}

} // namespace

bool SessionId::isWellFormed(const std::string& text, const std::string& prefix) {
    std::string p, millis, hex;
    if (!splitToken(text, p, millis, hex)) return false;
    if (p != prefix) return false;
    // 19 digits covers any int64 millisecond value
    if (!allDigits(millis) || millis.size() > 19) return false;
    return hex.size() == IdGenerator::kRandomBytes * 2 && lowerHex(hex);
}

SessionResult<SessionId> SessionId::parse(const std::string& text, const std::string& prefix) {
    if (!isWellFormed(text, prefix)) {
        return SessionError::invalidFormat(text);
    }
    return SessionId(text);
}

std::optional<int64_t> SessionId::timestampMillis() const {
    std::string p, millis, hex;
    if (!splitToken(value_, p, millis, hex) || !allDigits(millis) || millis.size() > 19) {
        return std::nullopt;
    }
    try {
        return static_cast<int64_t>(std::stoll(millis));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}
