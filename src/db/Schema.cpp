#include "db/Schema.hpp"
#include <string>

namespace DryDock {
namespace Schema {

static const char* kTables = R"(
    CREATE TABLE IF NOT EXISTS feeds (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        title TEXT NOT NULL,
        url TEXT UNIQUE NOT NULL,
        last_synced_at INTEGER,
        created_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS feed_items (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        feed_id INTEGER NOT NULL,
        title TEXT NOT NULL,
        link TEXT,
        description TEXT,
        published_at INTEGER NOT NULL,
        dedup_key TEXT UNIQUE NOT NULL,
        created_at INTEGER NOT NULL,
        FOREIGN KEY (feed_id) REFERENCES feeds(id) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_feed_items_feed_id ON feed_items(feed_id);
    CREATE INDEX IF NOT EXISTS idx_feed_items_published_at ON feed_items(published_at DESC);

    CREATE TABLE IF NOT EXISTS logs (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        level TEXT NOT NULL,
        message TEXT NOT NULL,
        timestamp INTEGER NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_logs_timestamp ON logs(timestamp DESC);
    CREATE INDEX IF NOT EXISTS idx_logs_level ON logs(level);
)";

Error migrate(sqlite3* db) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, kTables, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string message = "Migration SQL failed: ";
        message += errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        return Error(ErrorCode::Initialization, message);
    }
    return {};
}

}
}
