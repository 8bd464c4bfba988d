#include "db/FeedRepository.hpp"
#include "db/Statement.hpp"
#include <ctime>

namespace DryDock {

FeedRepository::FeedRepository(ConnectionPool& pool) : pool_(pool) {}

Feed FeedRepository::readFeed(const Statement& stmt) {
    Feed feed;
    feed.id = stmt.columnInt64(0);
    feed.title = stmt.columnText(1);
    feed.url = stmt.columnText(2);
    if (!stmt.columnIsNull(3)) feed.lastSyncedAt = stmt.columnInt64(3);
    feed.createdAt = stmt.columnInt64(4);
    return feed;
}

Result<std::vector<Feed>> FeedRepository::listFeeds() {
    auto lease = pool_.acquire();
    if (!lease.ok()) return lease.error;
    sqlite3* db = lease.value.get();

    Statement stmt(db, "SELECT id, title, url, last_synced_at, created_at FROM feeds ORDER BY id");
    if (!stmt.ok()) return sqliteError(db, "Failed to prepare feed query");

    std::vector<Feed> feeds;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        feeds.push_back(readFeed(stmt));
    }
    if (rc != SQLITE_DONE) return sqliteError(db, "Failed to query feeds");
    return feeds;
}

Result<std::optional<Feed>> FeedRepository::findFeed(std::int64_t feedId) {
    auto lease = pool_.acquire();
    if (!lease.ok()) return lease.error;
    sqlite3* db = lease.value.get();

    Statement stmt(db, "SELECT id, title, url, last_synced_at, created_at FROM feeds WHERE id = ?1");
    if (!stmt.ok()) return sqliteError(db, "Failed to prepare feed lookup");
    stmt.bind(1, feedId);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) return std::optional<Feed>(readFeed(stmt));
    if (rc != SQLITE_DONE) return sqliteError(db, "Failed to look up feed");
    return std::optional<Feed>();
}

Result<Feed> FeedRepository::addFeed(const std::string& url, const std::string& title) {
    auto lease = pool_.acquire();
    if (!lease.ok()) return lease.error;
    sqlite3* db = lease.value.get();

    Statement stmt(db, "INSERT INTO feeds (title, url, created_at) VALUES (?1, ?2, ?3)");
    if (!stmt.ok()) return sqliteError(db, "Failed to prepare feed insert");

    Feed feed;
    feed.title = title;
    feed.url = url;
    feed.createdAt = static_cast<std::int64_t>(std::time(nullptr));
    stmt.bind(1, feed.title);
    stmt.bind(2, feed.url);
    stmt.bind(3, feed.createdAt);

    if (stmt.step() != SQLITE_DONE) {
        if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE) {
            return Error(ErrorCode::Database, "Feed already exists: " + url);
        }
        return sqliteError(db, "Failed to add feed");
    }
    feed.id = sqlite3_last_insert_rowid(db);
    return feed;
}

Error FeedRepository::deleteFeed(std::int64_t feedId) {
    auto lease = pool_.acquire();
    if (!lease.ok()) return lease.error;
    sqlite3* db = lease.value.get();

    Statement stmt(db, "DELETE FROM feeds WHERE id = ?1");
    if (!stmt.ok()) return sqliteError(db, "Failed to prepare feed delete");
    stmt.bind(1, feedId);
    if (stmt.step() != SQLITE_DONE) return sqliteError(db, "Failed to delete feed");
    if (sqlite3_changes(db) == 0) {
        return Error(ErrorCode::Database, "Feed " + std::to_string(feedId) + " not found");
    }
    return {};
}

Error FeedRepository::updateLastSynced(std::int64_t feedId, std::int64_t timestamp) {
    auto lease = pool_.acquire();
    if (!lease.ok()) return lease.error;
    sqlite3* db = lease.value.get();

    Statement stmt(db, "UPDATE feeds SET last_synced_at = ?1 WHERE id = ?2");
    if (!stmt.ok()) return sqliteError(db, "Failed to prepare feed timestamp update");
    stmt.bind(1, timestamp);
    stmt.bind(2, feedId);
    if (stmt.step() != SQLITE_DONE) return sqliteError(db, "Failed to update feed timestamp");
    if (sqlite3_changes(db) == 0) {
        return Error(ErrorCode::Database, "Feed " + std::to_string(feedId) + " not found");
    }
    return {};
}

Result<bool> FeedRepository::insertItemIfAbsent(std::int64_t feedId, const FeedItem& item) {
    if (item.dedupKey.empty()) {
        return Error(ErrorCode::InvalidArgument, "Feed item has no dedup key");
    }

    auto lease = pool_.acquire();
    if (!lease.ok()) return lease.error;
    sqlite3* db = lease.value.get();

    // Only the dedup_key conflict is tolerated; foreign key and NOT NULL
    // violations still surface as errors.
    Statement stmt(db,
        "INSERT INTO feed_items (feed_id, title, link, description, published_at, dedup_key, created_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7) ON CONFLICT(dedup_key) DO NOTHING");
    if (!stmt.ok()) return sqliteError(db, "Failed to prepare feed item insert");

    std::int64_t createdAt = item.createdAt ? item.createdAt : static_cast<std::int64_t>(std::time(nullptr));
    stmt.bind(1, feedId);
    stmt.bind(2, item.title);
    stmt.bind(3, item.link);
    stmt.bind(4, item.description);
    stmt.bind(5, item.publishedAt);
    stmt.bind(6, item.dedupKey);
    stmt.bind(7, createdAt);

    if (stmt.step() != SQLITE_DONE) return sqliteError(db, "Failed to insert feed item");
    return sqlite3_changes(db) == 1;
}

Result<std::vector<FeedItem>> FeedRepository::latestItems(int limit) {
    auto lease = pool_.acquire();
    if (!lease.ok()) return lease.error;
    sqlite3* db = lease.value.get();

    Statement stmt(db,
        "SELECT id, feed_id, title, link, description, published_at, dedup_key, created_at "
        "FROM feed_items ORDER BY published_at DESC, id DESC LIMIT ?1");
    if (!stmt.ok()) return sqliteError(db, "Failed to prepare feed item query");
    stmt.bind(1, static_cast<std::int64_t>(limit));

    std::vector<FeedItem> items;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        FeedItem item;
        item.id = stmt.columnInt64(0);
        item.feedId = stmt.columnInt64(1);
        item.title = stmt.columnText(2);
        item.link = stmt.columnText(3);
        item.description = stmt.columnText(4);
        item.publishedAt = stmt.columnInt64(5);
        item.dedupKey = stmt.columnText(6);
        item.createdAt = stmt.columnInt64(7);
        items.push_back(std::move(item));
    }
    if (rc != SQLITE_DONE) return sqliteError(db, "Failed to query feed items");
    return items;
}

Result<std::int64_t> FeedRepository::countItems(std::int64_t feedId) {
    auto lease = pool_.acquire();
    if (!lease.ok()) return lease.error;
    sqlite3* db = lease.value.get();

    Statement stmt(db, "SELECT COUNT(*) FROM feed_items WHERE feed_id = ?1");
    if (!stmt.ok()) return sqliteError(db, "Failed to prepare feed item count");
    stmt.bind(1, feedId);
    if (stmt.step() != SQLITE_ROW) return sqliteError(db, "Failed to count feed items");
    return stmt.columnInt64(0);
}

}
