#pragma once
#include "utils/Error.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace DryDock {

struct PoolOptions {
    std::string path;
    std::size_t maxConnections = 10;
    std::chrono::milliseconds acquireTimeout{5000};
    int busyTimeoutMs = 5000;
};

class ConnectionPool;

// Exclusive lease on one handle. Goes back to the pool when destroyed or
// released; the pool must outlive every lease it hands out.
class PooledConnection {
public:
    PooledConnection() = default;
    ~PooledConnection();
    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    sqlite3* get() const { return db_; }
    explicit operator bool() const { return db_ != nullptr; }
    void release();

private:
    friend class ConnectionPool;
    PooledConnection(ConnectionPool* pool, sqlite3* db) : pool_(pool), db_(db) {}

    ConnectionPool* pool_ = nullptr;
    sqlite3* db_ = nullptr;
};

// Bounded set of SQLite handles on one database file. Handles are opened
// lazily up to maxConnections; each gets foreign keys and WAL switched on.
// Callers beyond the ceiling wait up to the acquire timeout, then fail with
// PoolExhausted.
class ConnectionPool {
public:
    // Creates the file if missing and runs the schema migration.
    static Result<std::shared_ptr<ConnectionPool>> open(const PoolOptions& options);

    ~ConnectionPool();
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Result<PooledConnection> acquire();
    Result<PooledConnection> acquire(std::chrono::milliseconds timeout);

    std::size_t maxConnections() const { return options_.maxConnections; }
    std::size_t idleCount() const;
    std::size_t leasedCount() const;
    const std::string& path() const { return options_.path; }

private:
    explicit ConnectionPool(PoolOptions options);

    Error createHandle(sqlite3** out);
    void giveBack(sqlite3* db);
    friend class PooledConnection;

    PoolOptions options_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<sqlite3*> idle_;
    std::size_t total_ = 0;
    std::size_t leased_ = 0;
};

}
