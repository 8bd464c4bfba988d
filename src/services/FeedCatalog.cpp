#include "services/FeedCatalog.hpp"
#include "services/FeedSyncService.hpp"
#include "utils/TextUtils.hpp"
#include <spdlog/spdlog.h>

namespace DryDock {

FeedCatalog::FeedCatalog(FeedRepository& repository, ViewStateCoordinator& views)
    : repository_(repository), views_(views) {}

Result<Feed> FeedCatalog::subscribe(const std::string& url, const std::string& title) {
    std::string feedUrl = FeedSyncService::normalizeUrl(url);
    if (feedUrl.empty()) {
        return Error(ErrorCode::InvalidArgument, "Feed URL is empty");
    }
    std::string feedTitle = TextUtils::trim(title);
    if (feedTitle.empty()) feedTitle = feedUrl;

    auto added = repository_.addFeed(feedUrl, feedTitle);
    if (!added.ok()) {
        spdlog::error("[FeedCatalog] Error adding feed {}: {}", feedUrl, added.error.describe());
        return added;
    }
    spdlog::info("[FeedCatalog] Subscribed to {} ({})", feedTitle, feedUrl);
    views_.markStale(ViewKey::FeedList);
    return added;
}

Error FeedCatalog::unsubscribe(std::int64_t feedId) {
    Error err = repository_.deleteFeed(feedId);
    if (!err.ok()) {
        spdlog::error("[FeedCatalog] Error deleting feed {}: {}", feedId, err.describe());
        return err;
    }
    spdlog::info("[FeedCatalog] Removed feed {}", feedId);
    views_.markStale(ViewKey::FeedList);
    views_.markStale(ViewKey::FeedItems);
    return {};
}

Result<std::vector<Feed>> FeedCatalog::feeds() {
    return repository_.listFeeds();
}

Result<std::vector<FeedItem>> FeedCatalog::latestItems(int limit) {
    return repository_.latestItems(limit);
}

}
