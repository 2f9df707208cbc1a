#include <gtest/gtest.h>
#include "core/Logger.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

TEST(LoggerTest, FiltersBelowConfiguredLevel) {
    std::ostringstream out;
    Logger logger(out, "warn", false);

    logger.debug("d");
    logger.info("i");
    logger.warn("w");
    logger.error("e");

    EXPECT_EQ(out.str(), "[warn] w\n[error] e\n");
}

TEST(LoggerTest, UnknownLevelRanksAsInfo) {
    std::ostringstream out;
    Logger logger(out, "verbose", false);

    EXPECT_FALSE(logger.shouldLog("debug"));
    EXPECT_TRUE(logger.shouldLog("info"));
    EXPECT_TRUE(logger.shouldLog("whatever"));
}

TEST(LoggerTest, TimestampPrefix) {
    std::ostringstream out;
    Logger logger(out, "info", true);
    logger.info("hello");

    // "[YYYY-MM-DD HH:MM:SS] [info] hello\n"
    std::string line = out.str();
    ASSERT_GE(line.size(), 22u);
    EXPECT_EQ(line[0], '[');
    EXPECT_EQ(line[20], ']');
    EXPECT_NE(line.find("] [info] hello"), std::string::npos);
}

TEST(LoggerTest, SetLevelAtRuntime) {
    std::ostringstream out;
    Logger logger(out, "error", false);
    logger.info("hidden");
    logger.setLevel("debug");
    logger.debug("shown");

    EXPECT_EQ(logger.level(), "debug");
    EXPECT_EQ(out.str(), "[debug] shown\n");
}

TEST(LoggerTest, AppendsToFile) {
    std::string path = "test_logger_" + std::to_string(getpid()) + ".log";
    fs::remove(path);
    {
        Logger logger("info", path, false);
        EXPECT_EQ(logger.file(), path);
        logger.info("first");
    }
    {
        Logger logger("info", path, false);
        logger.info("second");
    }

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), "[info] first\n[info] second\n");
    fs::remove(path);
}

TEST(LoggerTest, UnopenableFileThrows) {
    EXPECT_THROW(Logger("info", "/nonexistent/dir/sessiond.log"), std::runtime_error);
}
