#include "db/Database.hpp"
#include <mutex>

namespace DryDock {

namespace {

std::mutex& instanceMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<ConnectionPool>& instance() {
    static std::shared_ptr<ConnectionPool> pool;
    return pool;
}

}

Error Database::initialize(const PoolOptions& options) {
    std::lock_guard<std::mutex> lock(instanceMutex());
    if (instance()) {
        return Error(ErrorCode::Initialization, "Database pool already initialized");
    }
    auto opened = ConnectionPool::open(options);
    if (!opened.ok()) return opened.error;
    instance() = opened.value;
    return {};
}

bool Database::isInitialized() {
    std::lock_guard<std::mutex> lock(instanceMutex());
    return instance() != nullptr;
}

std::shared_ptr<ConnectionPool> Database::pool() {
    std::lock_guard<std::mutex> lock(instanceMutex());
    return instance();
}

Result<PooledConnection> Database::acquire() {
    std::shared_ptr<ConnectionPool> current = pool();
    if (!current) {
        return Error(ErrorCode::NotInitialized, "Database not initialized. Call Database::initialize first.");
    }
    return current->acquire();
}

}
