#include <gtest/gtest.h>
#include "core/SessionId.h"

#include <string>
#include <unordered_set>

namespace {
const std::string kValid = "sess_1699999999999_9f86d081884c7d659a2feaa0c55ad015";
}

TEST(SessionIdTest, ParsesWellFormedToken) {
    auto parsed = SessionId::parse(kValid, "sess");
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(parsed.value().str(), kValid);
    ASSERT_TRUE(parsed.value().timestampMillis().has_value());
    EXPECT_EQ(*parsed.value().timestampMillis(), 1699999999999LL);
}

TEST(SessionIdTest, RejectsMalformedTokens) {
    const std::string bad[] = {
        "",
        "sess",
        "sess_123",
        "sess__9f86d081884c7d659a2feaa0c55ad015",                 // empty millis
        "sess_12a4_9f86d081884c7d659a2feaa0c55ad015",             // non-digit millis
        "sess_1699999999999_9F86D081884C7D659A2FEAA0C55AD015",    // uppercase hex
        "sess_1699999999999_9f86d081884c7d659a2feaa0c55ad01",     // 31 hex chars
        "sess_1699999999999_9f86d081884c7d659a2feaa0c55ad0155",   // 33 hex chars
        "sess_1699999999999_9f86d081884c7d659a2feaa0c55ad01g",    // non-hex char
        "sess_12345678901234567890_9f86d081884c7d659a2feaa0c55ad015",  // 20 digits
        "other_1699999999999_9f86d081884c7d659a2feaa0c55ad015",   // wrong prefix
    };
    for (const auto& text : bad) {
        auto parsed = SessionId::parse(text, "sess");
        ASSERT_FALSE(parsed.ok()) << text;
        EXPECT_EQ(parsed.error().kind(), SessionErrorKind::InvalidFormat);
        EXPECT_EQ(parsed.error().sessionId(), text);
    }
}

TEST(SessionIdTest, PrefixMayContainUnderscores) {
    std::string token = "cli_sess_1699999999999_9f86d081884c7d659a2feaa0c55ad015";
    EXPECT_TRUE(SessionId::isWellFormed(token, "cli_sess"));
    EXPECT_FALSE(SessionId::isWellFormed(token, "sess"));
    EXPECT_FALSE(SessionId::isWellFormed(token, "cli"));
}

TEST(SessionIdTest, ArbitraryStringHasNoTimestamp) {
    SessionId id("not-a-token");
    EXPECT_FALSE(id.timestampMillis().has_value());
}

TEST(SessionIdTest, EqualityAndHashing) {
    SessionId a(kValid);
    SessionId b(kValid);
    SessionId c("sess_1_00000000000000000000000000000000");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(std::hash<SessionId>()(a), std::hash<SessionId>()(b));

    std::unordered_set<SessionId> ids{a, b, c};
    EXPECT_EQ(ids.size(), 2u);
}
