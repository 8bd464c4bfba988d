#pragma once
#include "db/ConnectionPool.hpp"
#include <memory>

namespace DryDock {

// Process-wide holder of the connection pool. initialize() succeeds once per
// process; the pool then lives until exit.
class Database {
public:
    static Error initialize(const PoolOptions& options);
    static bool isInitialized();

    // nullptr before initialize()
    static std::shared_ptr<ConnectionPool> pool();

    static Result<PooledConnection> acquire();

private:
    Database() = delete;
};

}
