#include <gtest/gtest.h>
#include "core/SessionError.h"
#include "core/SessionResult.h"

#include <stdexcept>
#include <string>

TEST(SessionErrorTest, MessagesNameTheSession) {
    EXPECT_EQ(SessionError::notFound("sess_1_ab").message(), "Session not found: sess_1_ab");
    EXPECT_EQ(SessionError::expired("sess_1_ab").message(), "Session expired: sess_1_ab");
    EXPECT_EQ(SessionError::invalidFormat("junk").message(), "Invalid session ID format: junk");
    EXPECT_EQ(SessionError::alreadyExists("sess_1_ab").message(), "Session already exists: sess_1_ab");
}

TEST(SessionErrorTest, DetailIsAppended) {
    EXPECT_EQ(SessionError::lockPoisoned().message(), "Lock poisoned - concurrent access failure");
    EXPECT_EQ(SessionError::lockPoisoned("boom").message(), "Lock poisoned - concurrent access failure (boom)");
    EXPECT_EQ(SessionError::invalidRecord("s", "bad clock").message(), "Invalid session data: s (bad clock)");
    EXPECT_EQ(SessionError::limitExceeded("alice", 3).message(), "Session limit exceeded for owner: alice (max 3)");
}

TEST(SessionErrorTest, KindNames) {
    EXPECT_STREQ(toString(SessionErrorKind::NotFound), "not_found");
    EXPECT_STREQ(toString(SessionErrorKind::Expired), "expired");
    EXPECT_STREQ(toString(SessionErrorKind::LockPoisoned), "lock_poisoned");
    EXPECT_STREQ(toString(SessionErrorKind::InvalidFormat), "invalid_format");
    EXPECT_STREQ(toString(SessionErrorKind::AlreadyExists), "already_exists");
    EXPECT_STREQ(toString(SessionErrorKind::InvalidRecord), "invalid_record");
    EXPECT_STREQ(toString(SessionErrorKind::LimitExceeded), "limit_exceeded");
}

TEST(SessionResultTest, HoldsValueOrError) {
    SessionResult<int> good(42);
    ASSERT_TRUE(good.ok());
    EXPECT_TRUE(static_cast<bool>(good));
    EXPECT_EQ(good.value(), 42);
    EXPECT_THROW(good.error(), std::logic_error);

    SessionResult<int> bad(SessionError::notFound("x"));
    EXPECT_FALSE(bad.ok());
    EXPECT_TRUE(bad.is(SessionErrorKind::NotFound));
    EXPECT_FALSE(bad.is(SessionErrorKind::Expired));
    EXPECT_THROW(bad.value(), std::logic_error);
}

TEST(SessionResultTest, VoidSpecialization) {
    auto good = SessionResult<void>::success();
    EXPECT_TRUE(good.ok());
    EXPECT_FALSE(good.is(SessionErrorKind::NotFound));

    SessionResult<void> bad(SessionError::expired("x"));
    EXPECT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().kind(), SessionErrorKind::Expired);
}

TEST(SessionResultTest, MoveOutValue) {
    SessionResult<std::string> result(std::string("payload"));
    std::string moved = std::move(result).value();
    EXPECT_EQ(moved, "payload");
}
