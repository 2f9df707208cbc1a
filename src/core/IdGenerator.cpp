#include "core/IdGenerator.h"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <array>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

IdGenerator::IdGenerator(std::string prefix) : prefix_(std::move(prefix)) {
    if (!isValidPrefix(prefix_)) {
        throw std::invalid_argument("Invalid token prefix: '" + prefix_ + "'");
    }
    if (RAND_status() != 1) {
        throw std::runtime_error("OpenSSL random generator is not seeded - cannot mint session tokens");
    }
}

bool IdGenerator::isValidPrefix(const std::string& prefix) {
    if (prefix.empty()) return false;
    for (char c : prefix) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

int64_t IdGenerator::nextMillis() const {
    int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    // Wall clock may step backwards; never emit a smaller value than before
    int64_t last = last_millis_.load();
    while (now > last && !last_millis_.compare_exchange_weak(last, now)) {
    }
    return now > last ? now : last;
}

SessionId IdGenerator::generate() const {
    std::array<unsigned char, kRandomBytes> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed (error " + std::to_string(ERR_get_error()) + ")");
    }

    std::ostringstream oss;
    oss << prefix_ << "_" << nextMillis() << "_";
    for (unsigned char b : bytes) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return SessionId(oss.str());
}
