#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "db/Database.hpp"
#include "db/FeedRepository.hpp"
#include "db/Statement.hpp"
#include <thread>

using namespace DryDock;
using DryDock::Testing::TempDir;
using DryDock::Testing::openPool;

namespace {

std::string queryText(sqlite3* db, const char* sql) {
    Statement stmt(db, sql);
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) return "";
    return stmt.columnText(0);
}

}

TEST(ConnectionPoolTest, CreatesDatabaseAndSchema) {
    TempDir dir;
    auto pool = openPool(dir);
    ASSERT_NE(pool, nullptr);
    EXPECT_TRUE(std::filesystem::exists(dir.file("database.db")));

    auto lease = pool->acquire();
    ASSERT_TRUE(lease.ok()) << lease.error.describe();
    for (const char* table : {"feeds", "feed_items", "logs"}) {
        Statement stmt(lease.value.get(), "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = ?1");
        ASSERT_TRUE(stmt.ok());
        stmt.bind(1, std::string(table));
        ASSERT_EQ(stmt.step(), SQLITE_ROW);
        EXPECT_EQ(stmt.columnInt64(0), 1) << table;
    }
}

TEST(ConnectionPoolTest, PragmasAreActiveOnEveryHandle) {
    TempDir dir;
    auto pool = openPool(dir, 3);
    ASSERT_NE(pool, nullptr);

    // Hold three leases at once so three distinct handles get opened
    std::vector<PooledConnection> leases;
    for (int i = 0; i < 3; ++i) {
        auto lease = pool->acquire();
        ASSERT_TRUE(lease.ok()) << lease.error.describe();
        leases.push_back(std::move(lease.value));
    }

    for (const auto& lease : leases) {
        EXPECT_EQ(queryText(lease.get(), "PRAGMA foreign_keys"), "1");
        EXPECT_EQ(queryText(lease.get(), "PRAGMA journal_mode"), "wal");
    }
    EXPECT_EQ(pool->leasedCount(), 3u);
}

TEST(ConnectionPoolTest, ExhaustedPoolFailsAfterBoundedWait) {
    TempDir dir;
    auto pool = openPool(dir, 2, std::chrono::milliseconds(100));
    ASSERT_NE(pool, nullptr);

    auto first = pool->acquire();
    auto second = pool->acquire();
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    auto started = std::chrono::steady_clock::now();
    auto third = pool->acquire();
    auto waited = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(third.ok());
    EXPECT_EQ(third.error.code, ErrorCode::PoolExhausted);
    EXPECT_GE(waited, std::chrono::milliseconds(90));
    EXPECT_LT(waited, std::chrono::seconds(5));
}

TEST(ConnectionPoolTest, LeaseReturnsHandleOnScopeExit) {
    TempDir dir;
    auto pool = openPool(dir, 1, std::chrono::milliseconds(50));
    ASSERT_NE(pool, nullptr);

    {
        auto lease = pool->acquire();
        ASSERT_TRUE(lease.ok());
        EXPECT_EQ(pool->leasedCount(), 1u);
        EXPECT_EQ(pool->idleCount(), 0u);
    }
    EXPECT_EQ(pool->leasedCount(), 0u);
    EXPECT_EQ(pool->idleCount(), 1u);

    auto again = pool->acquire();
    EXPECT_TRUE(again.ok());
}

TEST(ConnectionPoolTest, MovedLeaseKeepsHandle) {
    TempDir dir;
    auto pool = openPool(dir, 1, std::chrono::milliseconds(50));
    ASSERT_NE(pool, nullptr);

    auto lease = pool->acquire();
    ASSERT_TRUE(lease.ok());
    PooledConnection moved(std::move(lease.value));
    EXPECT_EQ(lease.value.get(), nullptr);
    EXPECT_NE(moved.get(), nullptr);
    EXPECT_EQ(pool->leasedCount(), 1u);

    moved.release();
    EXPECT_EQ(moved.get(), nullptr);
    EXPECT_EQ(pool->leasedCount(), 0u);
}

TEST(ConnectionPoolTest, WaiterReceivesReleasedHandle) {
    TempDir dir;
    auto pool = openPool(dir, 1, std::chrono::milliseconds(50));
    ASSERT_NE(pool, nullptr);

    auto held = pool->acquire();
    ASSERT_TRUE(held.ok());

    std::thread releaser([&held]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        held.value.release();
    });

    auto waited = pool->acquire(std::chrono::seconds(5));
    releaser.join();
    EXPECT_TRUE(waited.ok()) << waited.error.describe();
}

TEST(ConnectionPoolTest, UnopenablePathIsInitializationError) {
    PoolOptions options;
    options.path = "/nonexistent-drydock-dir/nested/database.db";
    auto opened = ConnectionPool::open(options);
    EXPECT_FALSE(opened.ok());
    EXPECT_EQ(opened.error.code, ErrorCode::Initialization);

    options.path.clear();
    opened = ConnectionPool::open(options);
    EXPECT_EQ(opened.error.code, ErrorCode::Initialization);
}

TEST(ConnectionPoolTest, RefusedWalModeFailsOpen) {
    // An in-memory database can only journal in memory
    PoolOptions options;
    options.path = ":memory:";
    auto opened = ConnectionPool::open(options);
    EXPECT_FALSE(opened.ok());
    EXPECT_EQ(opened.error.code, ErrorCode::Initialization);
    EXPECT_NE(opened.error.message.find("WAL journal mode refused"), std::string::npos);
}

TEST(ConnectionPoolTest, ReopeningExistingStoreKeepsData) {
    TempDir dir;
    {
        auto pool = openPool(dir);
        ASSERT_NE(pool, nullptr);
        FeedRepository repository(*pool);
        ASSERT_TRUE(repository.addFeed("https://example.com/rss", "Example").ok());
    }

    auto pool = openPool(dir);
    ASSERT_NE(pool, nullptr);
    FeedRepository repository(*pool);
    auto feeds = repository.listFeeds();
    ASSERT_TRUE(feeds.ok());
    ASSERT_EQ(feeds.value.size(), 1u);
    EXPECT_EQ(feeds.value[0].url, "https://example.com/rss");
}

// The singleton can be initialized once per process, so the whole
// lifecycle lives in one test.
TEST(ConnectionPoolTest, DatabaseSingletonLifecycle) {
    auto before = Database::acquire();
    EXPECT_FALSE(before.ok());
    EXPECT_EQ(before.error.code, ErrorCode::NotInitialized);
    EXPECT_EQ(Database::pool(), nullptr);
    EXPECT_FALSE(Database::isInitialized());

    static TempDir dir;
    PoolOptions options;
    options.path = dir.file("singleton.db");
    Error err = Database::initialize(options);
    ASSERT_TRUE(err.ok()) << err.describe();
    EXPECT_TRUE(Database::isInitialized());

    auto lease = Database::acquire();
    EXPECT_TRUE(lease.ok()) << lease.error.describe();

    Error second = Database::initialize(options);
    EXPECT_EQ(second.code, ErrorCode::Initialization);
}
