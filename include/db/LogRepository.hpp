#pragma once
#include "db/ConnectionPool.hpp"
#include "models/LogEntry.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace DryDock {

// Backs the auxiliary log view. Writes use a short acquire timeout so a
// contended pool delays logging only briefly.
class LogRepository {
public:
    explicit LogRepository(ConnectionPool& pool,
                           std::chrono::milliseconds acquireTimeout = std::chrono::milliseconds(250));

    Error append(const std::string& level, const std::string& message, std::int64_t timestamp);

    // Newest first
    Result<std::vector<LogEntry>> recent(int limit = 1000);
    Result<std::vector<LogEntry>> search(const std::string& text, int limit = 1000);

private:
    ConnectionPool& pool_;
    std::chrono::milliseconds acquireTimeout_;
};

}
