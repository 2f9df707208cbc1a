#include <gtest/gtest.h>
#include "daemon/CommandShell.h"
#include "SessionManagerTestPeer.h"

#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace std::chrono_literals;

class CommandShellTest : public ::testing::Test {
protected:
    std::shared_ptr<SessionManager> manager_;
    std::unique_ptr<CommandShell> shell_;

    void SetUp() override {
        SessionConfig config;
        config.timeout = 60s;
        config.max_sessions = 100;
        manager_ = std::make_shared<SessionManager>(config);
        shell_ = std::make_unique<CommandShell>(manager_);
    }

    std::string createSession(const std::string& owner = "") {
        json reply = shell_->execute(owner.empty() ? "create" : "create " + owner);
        EXPECT_TRUE(reply["ok"].get<bool>());
        return reply["session"]["id"].get<std::string>();
    }
};

TEST_F(CommandShellTest, CreateAndGet) {
    std::string id = createSession("alice");

    json reply = shell_->execute("get " + id);
    ASSERT_TRUE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["session"]["id"], id);
    EXPECT_EQ(reply["session"]["owner"], "alice");
    EXPECT_FALSE(reply["session"]["authenticated"].get<bool>());
}

TEST_F(CommandShellTest, MalformedIdRejectedBeforeLookup) {
    json reply = shell_->execute("get not-a-token");
    EXPECT_FALSE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["error"], "invalid_format");
    EXPECT_EQ(reply["message"], "Invalid session ID format: not-a-token");
}

TEST_F(CommandShellTest, UnknownIdIsNotFound) {
    std::string unknown = manager_->idGenerator().generate().str();
    json reply = shell_->execute("touch " + unknown);
    EXPECT_FALSE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["error"], "not_found");
}

TEST_F(CommandShellTest, ExpiredSessionReported) {
    SessionRecord stale = SessionRecord::create(manager_->idGenerator().generate(), std::nullopt,
                                                Instant::now().shifted(-120s));
    ASSERT_TRUE(manager_->store(stale).ok());

    json reply = shell_->execute("refresh " + stale.id.str());
    EXPECT_EQ(reply["error"], "expired");

    json cleanup = shell_->execute("cleanup");
    ASSERT_TRUE(cleanup["ok"].get<bool>());
    EXPECT_EQ(cleanup["removed"], 1);
}

TEST_F(CommandShellTest, RemoveTwice) {
    std::string id = createSession();

    json first = shell_->execute("remove " + id);
    ASSERT_TRUE(first["ok"].get<bool>());
    EXPECT_TRUE(first["removed"].get<bool>());
    EXPECT_EQ(first["session"]["id"], id);

    json second = shell_->execute("remove " + id);
    ASSERT_TRUE(second["ok"].get<bool>());
    EXPECT_FALSE(second["removed"].get<bool>());
}

TEST_F(CommandShellTest, MetadataAuthAndStats) {
    std::string id = createSession("bob");

    EXPECT_TRUE(shell_->execute("meta " + id + " agent curl 8.0").at("ok").get<bool>());
    EXPECT_TRUE(shell_->execute("auth " + id).at("ok").get<bool>());

    json session = shell_->execute("get " + id)["session"];
    EXPECT_EQ(session["metadata"]["agent"], "curl 8.0");
    EXPECT_TRUE(session["authenticated"].get<bool>());

    json stats = shell_->execute("stats");
    EXPECT_EQ(stats["total"], 1);
    EXPECT_EQ(stats["active"], 1);
    EXPECT_EQ(stats["authenticated"], 1);
    EXPECT_EQ(stats["max_sessions"], 100);
    EXPECT_EQ(stats["timeout_ms"], 60000);
}

TEST_F(CommandShellTest, MetaValueKeepsInnerWhitespace) {
    std::string id = createSession();

    ASSERT_TRUE(shell_->execute("meta " + id + " agent  Mozilla/5.0   (X11;\tLinux)").at("ok").get<bool>());
    ASSERT_TRUE(shell_->execute("meta\t" + id + "   note \t two  spaces").at("ok").get<bool>());

    json metadata = shell_->execute("get " + id)["session"]["metadata"];
    EXPECT_EQ(metadata["agent"], "Mozilla/5.0   (X11;\tLinux)");
    EXPECT_EQ(metadata["note"], "two  spaces");
}

TEST_F(CommandShellTest, RevokeRemovesEveryOwnedSession) {
    createSession("alice");
    createSession("alice");
    std::string bob = createSession("bob");

    json reply = shell_->execute("revoke alice");
    ASSERT_TRUE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["removed"], 2);
    EXPECT_EQ(shell_->execute("owner alice")["sessions"].size(), 0u);
    EXPECT_TRUE(shell_->execute("get " + bob)["ok"].get<bool>());

    EXPECT_EQ(shell_->execute("revoke nobody")["removed"], 0);
    EXPECT_EQ(shell_->execute("revoke")["error"], "usage");
}

TEST_F(CommandShellTest, OwnerLimitReported) {
    SessionConfig config;
    config.max_sessions_per_owner = 1;
    auto manager = std::make_shared<SessionManager>(config);
    CommandShell shell(manager);

    ASSERT_TRUE(shell.execute("create alice")["ok"].get<bool>());
    json reply = shell.execute("create alice");
    EXPECT_FALSE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["error"], "limit_exceeded");
    EXPECT_EQ(reply["message"], "Session limit exceeded for owner: alice (max 1)");
    EXPECT_EQ(shell.execute("stats")["max_sessions_per_owner"], 1);
}

TEST_F(CommandShellTest, CountSizeAndOwner) {
    createSession("alice");
    createSession("alice");
    createSession("bob");

    EXPECT_EQ(shell_->execute("count")["active"], 3);
    EXPECT_EQ(shell_->execute("size")["size"], 3);

    json owned = shell_->execute("owner alice");
    ASSERT_TRUE(owned["ok"].get<bool>());
    EXPECT_EQ(owned["sessions"].size(), 2u);
}

TEST_F(CommandShellTest, ResetDiscardsSessions) {
    createSession();
    createSession();

    json reply = shell_->execute("reset");
    ASSERT_TRUE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["discarded"], 2);
    EXPECT_EQ(shell_->execute("size")["size"], 0);
}

TEST_F(CommandShellTest, UsageAndUnknownCommands) {
    EXPECT_EQ(shell_->execute("get")["error"], "usage");
    EXPECT_EQ(shell_->execute("meta only-two args")["error"], "usage");
    EXPECT_EQ(shell_->execute("create a b")["error"], "usage");
    EXPECT_EQ(shell_->execute("frobnicate")["error"], "unknown_command");
    EXPECT_TRUE(shell_->execute("help")["commands"].is_array());
}

TEST_F(CommandShellTest, RunStopsAtQuitAndSkipsComments) {
    std::istringstream in("# warmup\ncreate\n\ncount\nquit\ncount\n");
    std::ostringstream out;

    size_t executed = shell_->run(in, out);
    EXPECT_EQ(executed, 3u);
    EXPECT_TRUE(shell_->quitRequested());

    std::vector<json> replies;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        replies.push_back(json::parse(line));
    }
    ASSERT_EQ(replies.size(), 3u);
    EXPECT_TRUE(replies[0]["ok"].get<bool>());
    EXPECT_EQ(replies[1]["active"], 1);
    EXPECT_TRUE(replies[2]["bye"].get<bool>());
}

TEST_F(CommandShellTest, RunHonoursKeepRunning) {
    std::istringstream in("create\ncreate\n");
    std::ostringstream out;

    size_t executed = shell_->run(in, out, []() { return false; });
    EXPECT_EQ(executed, 0u);
    EXPECT_EQ(manager_->size().value(), 0u);
}

TEST_F(CommandShellTest, PoisonedStoreReportedAsError) {
    std::string id = createSession();
    auto failed = SessionManagerTestPeer::failWhileLocked(*manager_, "corrupted");
    ASSERT_TRUE(failed.is(SessionErrorKind::LockPoisoned));

    json reply = shell_->execute("get " + id);
    EXPECT_FALSE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["error"], "lock_poisoned");

    EXPECT_TRUE(shell_->execute("reset")["ok"].get<bool>());
    EXPECT_TRUE(shell_->execute("count")["ok"].get<bool>());
}
