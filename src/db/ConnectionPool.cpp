#include "db/ConnectionPool.hpp"
#include "db/Schema.hpp"
#include "db/Statement.hpp"
#include <sys/stat.h>
#include <utility>

namespace DryDock {

PooledConnection::~PooledConnection() { release(); }

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool_(other.pool_), db_(other.db_) {
    other.pool_ = nullptr;
    other.db_ = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        db_ = other.db_;
        other.pool_ = nullptr;
        other.db_ = nullptr;
    }
    return *this;
}

void PooledConnection::release() {
    if (pool_ && db_) pool_->giveBack(db_);
    pool_ = nullptr;
    db_ = nullptr;
}

ConnectionPool::ConnectionPool(PoolOptions options) : options_(std::move(options)) {
    if (options_.maxConnections == 0) options_.maxConnections = 1;
}

ConnectionPool::~ConnectionPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (sqlite3* db : idle_) sqlite3_close(db);
    idle_.clear();
}

Result<std::shared_ptr<ConnectionPool>> ConnectionPool::open(const PoolOptions& options) {
    if (options.path.empty()) {
        return Error(ErrorCode::Initialization, "Database path is empty");
    }

    struct stat st;
    bool existed = ::stat(options.path.c_str(), &st) == 0;

    std::shared_ptr<ConnectionPool> pool(new ConnectionPool(options));

    // Opening with SQLITE_OPEN_CREATE creates the file when it does not exist yet
    sqlite3* first = nullptr;
    Error err = pool->createHandle(&first);
    if (!err.ok()) {
        return Error(ErrorCode::Initialization,
                     std::string(existed ? "Failed to open database '" : "Failed to create database '") +
                         options.path + "': " + err.message);
    }

    err = Schema::migrate(first);
    if (!err.ok()) {
        sqlite3_close(first);
        return err;
    }

    std::lock_guard<std::mutex> lock(pool->mutex_);
    pool->idle_.push_back(first);
    pool->total_ = 1;
    return pool;
}

Error ConnectionPool::createHandle(sqlite3** out) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(options_.path.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        return Error(ErrorCode::Database, message);
    }

    sqlite3_busy_timeout(db, options_.busyTimeoutMs);

    // Foreign keys are a per-connection setting
    char* errMsg = nullptr;
    if (sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string message = std::string("PRAGMA foreign_keys failed: ") + (errMsg ? errMsg : sqlite3_errmsg(db));
        sqlite3_free(errMsg);
        sqlite3_close(db);
        return Error(ErrorCode::Database, message);
    }

    // SQLite answers with the mode it actually chose; anything but wal is a refusal
    std::string journalMode;
    {
        Statement stmt(db, "PRAGMA journal_mode = WAL;");
        if (stmt.ok() && stmt.step() == SQLITE_ROW) journalMode = stmt.columnText(0);
    }
    if (journalMode != "wal") {
        std::string message = journalMode.empty()
            ? std::string("PRAGMA journal_mode failed: ") + sqlite3_errmsg(db)
            : "WAL journal mode refused, database is in '" + journalMode + "' mode";
        sqlite3_close(db);
        return Error(ErrorCode::Database, message);
    }

    *out = db;
    return {};
}

Result<PooledConnection> ConnectionPool::acquire() {
    return acquire(options_.acquireTimeout);
}

Result<PooledConnection> ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (!idle_.empty()) {
            sqlite3* db = idle_.back();
            idle_.pop_back();
            ++leased_;
            return PooledConnection(this, db);
        }

        if (total_ < options_.maxConnections) {
            // Reserve the slot, then open outside the lock
            ++total_;
            lock.unlock();
            sqlite3* db = nullptr;
            Error err = createHandle(&db);
            lock.lock();
            if (!err.ok()) {
                --total_;
                available_.notify_one();
                return err;
            }
            ++leased_;
            return PooledConnection(this, db);
        }

        bool woke = available_.wait_until(lock, deadline, [this] {
            return !idle_.empty() || total_ < options_.maxConnections;
        });
        if (!woke) {
            return Error(ErrorCode::PoolExhausted,
                         "No database connection available within " + std::to_string(timeout.count()) +
                             " ms (" + std::to_string(options_.maxConnections) + " in use)");
        }
    }
}

void ConnectionPool::giveBack(sqlite3* db) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(db);
        --leased_;
    }
    available_.notify_one();
}

std::size_t ConnectionPool::idleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

std::size_t ConnectionPool::leasedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leased_;
}

}
