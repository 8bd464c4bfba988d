#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "db/LogRepository.hpp"
#include "utils/Logger.hpp"

using namespace DryDock;
using DryDock::Testing::TempDir;

class LogRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = Testing::openPool(dir_);
        ASSERT_NE(pool_, nullptr);
        logs_ = std::make_unique<LogRepository>(*pool_);
    }

    TempDir dir_;
    std::shared_ptr<ConnectionPool> pool_;
    std::unique_ptr<LogRepository> logs_;
};

TEST_F(LogRepositoryTest, RecentIsNewestFirst) {
    ASSERT_TRUE(logs_->append("INFO", "first", 100).ok());
    ASSERT_TRUE(logs_->append("WARNING", "second", 200).ok());
    ASSERT_TRUE(logs_->append("ERROR", "third", 300).ok());

    auto entries = logs_->recent();
    ASSERT_TRUE(entries.ok());
    ASSERT_EQ(entries.value.size(), 3u);
    EXPECT_EQ(entries.value[0].message, "third");
    EXPECT_EQ(entries.value[0].level, "ERROR");
    EXPECT_EQ(entries.value[2].message, "first");

    auto limited = logs_->recent(2);
    ASSERT_TRUE(limited.ok());
    EXPECT_EQ(limited.value.size(), 2u);
}

TEST_F(LogRepositoryTest, SearchMatchesSubstring) {
    ASSERT_TRUE(logs_->append("INFO", "[FeedSync] Feed 1 (Example): added 3 items", 100).ok());
    ASSERT_TRUE(logs_->append("WARNING", "[FeedSync] Feed 2 (Broken) error: FetchError", 200).ok());
    ASSERT_TRUE(logs_->append("INFO", "[App] Running", 300).ok());

    auto matches = logs_->search("FeedSync");
    ASSERT_TRUE(matches.ok());
    ASSERT_EQ(matches.value.size(), 2u);
    EXPECT_EQ(matches.value[0].level, "WARNING");

    auto none = logs_->search("nothing like this");
    ASSERT_TRUE(none.ok());
    EXPECT_TRUE(none.value.empty());
}

TEST_F(LogRepositoryTest, DatabaseSinkStoresInfoAndAbove) {
    auto sink = std::make_shared<DatabaseLogSink>(pool_);
    sink->set_level(spdlog::level::info);
    spdlog::logger logger("sink-test", sink);
    logger.set_level(spdlog::level::debug);

    logger.debug("not stored");
    logger.info("stored {}", 1);
    logger.warn("careful");

    auto entries = logs_->recent();
    ASSERT_TRUE(entries.ok());
    ASSERT_EQ(entries.value.size(), 2u);
    EXPECT_EQ(entries.value[0].level, "WARNING");
    EXPECT_EQ(entries.value[0].message, "careful");
    EXPECT_EQ(entries.value[1].level, "INFO");
    EXPECT_EQ(entries.value[1].message, "stored 1");
}

TEST(LoggingTest, LevelNames) {
    EXPECT_STREQ(DatabaseLogSink::levelName(spdlog::level::debug), "DEBUG");
    EXPECT_STREQ(DatabaseLogSink::levelName(spdlog::level::info), "INFO");
    EXPECT_STREQ(DatabaseLogSink::levelName(spdlog::level::warn), "WARNING");
    EXPECT_STREQ(DatabaseLogSink::levelName(spdlog::level::err), "ERROR");

    EXPECT_EQ(Logging::parseLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(Logging::parseLevel("ERROR"), spdlog::level::err);
    EXPECT_EQ(Logging::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(Logging::parseLevel("chatty"), spdlog::level::info);
    EXPECT_EQ(Logging::parseLevel("\xC3\x89RROR"), spdlog::level::info);
    EXPECT_EQ(Logging::parseLevel("\xFF"), spdlog::level::info);
}
