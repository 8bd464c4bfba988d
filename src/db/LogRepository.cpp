#include "db/LogRepository.hpp"
#include "db/Statement.hpp"

namespace DryDock {

LogRepository::LogRepository(ConnectionPool& pool, std::chrono::milliseconds acquireTimeout)
    : pool_(pool), acquireTimeout_(acquireTimeout) {}

Error LogRepository::append(const std::string& level, const std::string& message, std::int64_t timestamp) {
    auto lease = pool_.acquire(acquireTimeout_);
    if (!lease.ok()) return lease.error;
    sqlite3* db = lease.value.get();

    Statement stmt(db, "INSERT INTO logs (level, message, timestamp) VALUES (?1, ?2, ?3)");
    if (!stmt.ok()) return sqliteError(db, "Failed to prepare log insert");
    stmt.bind(1, level);
    stmt.bind(2, message);
    stmt.bind(3, timestamp);
    if (stmt.step() != SQLITE_DONE) return sqliteError(db, "Failed to create log entry");
    return {};
}

static Result<std::vector<LogEntry>> collect(Statement& stmt, sqlite3* db) {
    std::vector<LogEntry> entries;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        LogEntry entry;
        entry.id = stmt.columnInt64(0);
        entry.level = stmt.columnText(1);
        entry.message = stmt.columnText(2);
        entry.timestamp = stmt.columnInt64(3);
        entries.push_back(std::move(entry));
    }
    if (rc != SQLITE_DONE) return sqliteError(db, "Failed to query logs");
    return entries;
}

Result<std::vector<LogEntry>> LogRepository::recent(int limit) {
    auto lease = pool_.acquire();
    if (!lease.ok()) return lease.error;
    sqlite3* db = lease.value.get();

    Statement stmt(db, "SELECT id, level, message, timestamp FROM logs ORDER BY timestamp DESC, id DESC LIMIT ?1");
    if (!stmt.ok()) return sqliteError(db, "Failed to prepare log query");
    stmt.bind(1, static_cast<std::int64_t>(limit));
    return collect(stmt, db);
}

Result<std::vector<LogEntry>> LogRepository::search(const std::string& text, int limit) {
    auto lease = pool_.acquire();
    if (!lease.ok()) return lease.error;
    sqlite3* db = lease.value.get();

    Statement stmt(db,
        "SELECT id, level, message, timestamp FROM logs WHERE instr(message, ?1) > 0 "
        "ORDER BY timestamp DESC, id DESC LIMIT ?2");
    if (!stmt.ok()) return sqliteError(db, "Failed to prepare log search");
    stmt.bind(1, text);
    stmt.bind(2, static_cast<std::int64_t>(limit));
    return collect(stmt, db);
}

}
