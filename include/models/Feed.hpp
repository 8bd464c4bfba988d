#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace DryDock {

struct Feed {
    std::int64_t id = 0;
    std::string title;
    std::string url;
    std::optional<std::int64_t> lastSyncedAt;
    std::int64_t createdAt = 0;
};

// Items are immutable once stored. dedupKey is the remote guid, or the link when
// the entry carries no identifier.
struct FeedItem {
    std::int64_t id = 0;
    std::int64_t feedId = 0;
    std::string title;
    std::string link;
    std::string description;
    std::int64_t publishedAt = 0;
    std::string dedupKey;
    std::int64_t createdAt = 0;
};

}
