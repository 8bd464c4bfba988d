#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "db/FeedRepository.hpp"

using namespace DryDock;
using DryDock::Testing::TempDir;

namespace {

FeedItem makeItem(const std::string& key, std::int64_t publishedAt = 1000) {
    FeedItem item;
    item.title = "Title " + key;
    item.link = "https://example.com/" + key;
    item.description = "Body";
    item.publishedAt = publishedAt;
    item.dedupKey = key;
    return item;
}

}

class FeedRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = Testing::openPool(dir_);
        ASSERT_NE(pool_, nullptr);
        repository_ = std::make_unique<FeedRepository>(*pool_);
    }

    std::int64_t addFeed(const std::string& url) {
        auto feed = repository_->addFeed(url, "Feed " + url);
        EXPECT_TRUE(feed.ok()) << feed.error.describe();
        return feed.value.id;
    }

    TempDir dir_;
    std::shared_ptr<ConnectionPool> pool_;
    std::unique_ptr<FeedRepository> repository_;
};

TEST_F(FeedRepositoryTest, AddAndListFeeds) {
    std::int64_t first = addFeed("https://a.example.com/rss");
    std::int64_t second = addFeed("https://b.example.com/rss");

    auto feeds = repository_->listFeeds();
    ASSERT_TRUE(feeds.ok());
    ASSERT_EQ(feeds.value.size(), 2u);
    EXPECT_EQ(feeds.value[0].id, first);
    EXPECT_EQ(feeds.value[1].id, second);
    EXPECT_EQ(feeds.value[0].title, "Feed https://a.example.com/rss");
    EXPECT_FALSE(feeds.value[0].lastSyncedAt.has_value());
    EXPECT_GT(feeds.value[0].createdAt, 0);
}

TEST_F(FeedRepositoryTest, DuplicateUrlIsRejected) {
    addFeed("https://example.com/rss");
    auto duplicate = repository_->addFeed("https://example.com/rss", "Again");
    EXPECT_FALSE(duplicate.ok());
    EXPECT_EQ(duplicate.error.code, ErrorCode::Database);
    EXPECT_NE(duplicate.error.message.find("already exists"), std::string::npos);
}

TEST_F(FeedRepositoryTest, FindFeed) {
    std::int64_t id = addFeed("https://example.com/rss");

    auto found = repository_->findFeed(id);
    ASSERT_TRUE(found.ok());
    ASSERT_TRUE(found.value.has_value());
    EXPECT_EQ(found.value->url, "https://example.com/rss");

    auto missing = repository_->findFeed(id + 100);
    ASSERT_TRUE(missing.ok());
    EXPECT_FALSE(missing.value.has_value());
}

TEST_F(FeedRepositoryTest, RepeatedInsertKeepsOneRow) {
    std::int64_t id = addFeed("https://example.com/rss");

    auto first = repository_->insertItemIfAbsent(id, makeItem("guid-1"));
    ASSERT_TRUE(first.ok()) << first.error.describe();
    EXPECT_TRUE(first.value);

    for (int i = 0; i < 4; ++i) {
        auto again = repository_->insertItemIfAbsent(id, makeItem("guid-1"));
        ASSERT_TRUE(again.ok());
        EXPECT_FALSE(again.value);
    }

    auto count = repository_->countItems(id);
    ASSERT_TRUE(count.ok());
    EXPECT_EQ(count.value, 1);
}

TEST_F(FeedRepositoryTest, DedupKeyIsUniqueAcrossFeeds) {
    std::int64_t a = addFeed("https://a.example.com/rss");
    std::int64_t b = addFeed("https://b.example.com/rss");

    EXPECT_TRUE(repository_->insertItemIfAbsent(a, makeItem("shared")).value);
    auto other = repository_->insertItemIfAbsent(b, makeItem("shared"));
    ASSERT_TRUE(other.ok());
    EXPECT_FALSE(other.value);
    EXPECT_EQ(repository_->countItems(b).value, 0);
}

TEST_F(FeedRepositoryTest, ItemWithoutKeyIsRejected) {
    std::int64_t id = addFeed("https://example.com/rss");
    auto inserted = repository_->insertItemIfAbsent(id, makeItem(""));
    EXPECT_FALSE(inserted.ok());
    EXPECT_EQ(inserted.error.code, ErrorCode::InvalidArgument);
}

TEST_F(FeedRepositoryTest, ItemForUnknownFeedViolatesForeignKey) {
    auto inserted = repository_->insertItemIfAbsent(999, makeItem("orphan"));
    EXPECT_FALSE(inserted.ok());
    EXPECT_EQ(inserted.error.code, ErrorCode::Database);
}

TEST_F(FeedRepositoryTest, DeletingFeedCascadesToItems) {
    std::int64_t keep = addFeed("https://keep.example.com/rss");
    std::int64_t drop = addFeed("https://drop.example.com/rss");
    ASSERT_TRUE(repository_->insertItemIfAbsent(keep, makeItem("keep-1")).ok());
    ASSERT_TRUE(repository_->insertItemIfAbsent(drop, makeItem("drop-1")).ok());
    ASSERT_TRUE(repository_->insertItemIfAbsent(drop, makeItem("drop-2")).ok());

    Error err = repository_->deleteFeed(drop);
    ASSERT_TRUE(err.ok()) << err.describe();

    EXPECT_EQ(repository_->countItems(drop).value, 0);
    auto items = repository_->latestItems(10);
    ASSERT_TRUE(items.ok());
    ASSERT_EQ(items.value.size(), 1u);
    EXPECT_EQ(items.value[0].dedupKey, "keep-1");

    EXPECT_EQ(repository_->deleteFeed(drop).code, ErrorCode::Database);
}

TEST_F(FeedRepositoryTest, UpdateLastSynced) {
    std::int64_t id = addFeed("https://example.com/rss");

    Error err = repository_->updateLastSynced(id, 1700000000);
    ASSERT_TRUE(err.ok()) << err.describe();
    auto found = repository_->findFeed(id);
    ASSERT_TRUE(found.ok() && found.value.has_value());
    ASSERT_TRUE(found.value->lastSyncedAt.has_value());
    EXPECT_EQ(*found.value->lastSyncedAt, 1700000000);

    EXPECT_FALSE(repository_->updateLastSynced(id + 1, 1700000000).ok());
}

TEST_F(FeedRepositoryTest, LatestItemsAreNewestFirst) {
    std::int64_t id = addFeed("https://example.com/rss");
    ASSERT_TRUE(repository_->insertItemIfAbsent(id, makeItem("old", 100)).ok());
    ASSERT_TRUE(repository_->insertItemIfAbsent(id, makeItem("new", 300)).ok());
    ASSERT_TRUE(repository_->insertItemIfAbsent(id, makeItem("mid", 200)).ok());

    auto items = repository_->latestItems(2);
    ASSERT_TRUE(items.ok());
    ASSERT_EQ(items.value.size(), 2u);
    EXPECT_EQ(items.value[0].dedupKey, "new");
    EXPECT_EQ(items.value[1].dedupKey, "mid");
    EXPECT_EQ(items.value[0].feedId, id);
    EXPECT_GT(items.value[0].createdAt, 0);
}
