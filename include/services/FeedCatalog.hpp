#pragma once
#include "db/FeedRepository.hpp"
#include "state/ViewStateCoordinator.hpp"
#include <string>
#include <vector>

namespace DryDock {

// Subscription changes made on behalf of the user. Each successful mutation
// marks the views it affects stale so the render loop reloads them.
class FeedCatalog {
public:
    FeedCatalog(FeedRepository& repository, ViewStateCoordinator& views);

    Result<Feed> subscribe(const std::string& url, const std::string& title);
    Error unsubscribe(std::int64_t feedId);

    Result<std::vector<Feed>> feeds();
    Result<std::vector<FeedItem>> latestItems(int limit);

private:
    FeedRepository& repository_;
    ViewStateCoordinator& views_;
};

}
