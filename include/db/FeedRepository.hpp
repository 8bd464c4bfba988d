#pragma once
#include "db/ConnectionPool.hpp"
#include "models/Feed.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DryDock {

class Statement;

// Typed access to feeds and feed_items. Every call leases its own handle for
// the duration of the call.
class FeedRepository {
public:
    explicit FeedRepository(ConnectionPool& pool);

    Result<std::vector<Feed>> listFeeds();
    Result<std::optional<Feed>> findFeed(std::int64_t feedId);

    // Fails with a Database error when the url is already subscribed.
    Result<Feed> addFeed(const std::string& url, const std::string& title);
    Error deleteFeed(std::int64_t feedId);
    Error updateLastSynced(std::int64_t feedId, std::int64_t timestamp);

    // Dedup primitive: inserts unless a row with item.dedupKey already exists.
    // The value is true only when a new row was written.
    Result<bool> insertItemIfAbsent(std::int64_t feedId, const FeedItem& item);

    Result<std::vector<FeedItem>> latestItems(int limit);
    Result<std::int64_t> countItems(std::int64_t feedId);

private:
    static Feed readFeed(const Statement& stmt);

    ConnectionPool& pool_;
};

}
