#include "services/FeedSyncService.hpp"
#include "utils/TextUtils.hpp"
#include <spdlog/spdlog.h>
#include <ctime>

namespace DryDock {

std::string SyncSummary::describe() const {
    if (!batchError.ok()) {
        return "Failed to refresh feeds: " + batchError.describe();
    }
    if (failures.empty()) {
        return "Successfully refreshed feeds. Added " + std::to_string(itemsAdded) + " new items.";
    }
    std::string text = "Refreshed feeds with " + std::to_string(failures.size()) + " errors. Added " +
                       std::to_string(itemsAdded) + " items.\nErrors:";
    for (const auto& failure : failures) {
        text += "\n" + (failure.title.empty() ? failure.url : failure.title) + ": " + failure.error.describe();
    }
    return text;
}

FeedSyncService::FeedSyncService(FeedRepository& repository, HttpClient& client)
    : repository_(repository), client_(client),
      clock_([]() { return static_cast<std::int64_t>(std::time(nullptr)); }) {}

std::string FeedSyncService::normalizeUrl(const std::string& url) {
    std::string trimmed = TextUtils::trim(url);
    if (trimmed.empty()) return trimmed;
    if (TextUtils::startsWith(trimmed, "http://") || TextUtils::startsWith(trimmed, "https://")) {
        return trimmed;
    }
    return "https://" + trimmed;
}

std::vector<FeedItem> FeedSyncService::normalizeEntries(std::int64_t feedId,
                                                        const std::vector<FeedParser::Entry>& entries,
                                                        std::int64_t now) {
    std::vector<FeedItem> items;
    items.reserve(entries.size());
    for (const auto& entry : entries) {
        FeedItem item;
        item.feedId = feedId;
        item.title = TextUtils::sanitizeUtf8(entry.title);
        if (item.title.empty()) item.title = "Untitled";
        item.link = entry.link;
        item.description = TextUtils::sanitizeUtf8(TextUtils::stripHtml(entry.description));
        item.publishedAt = entry.published ? *entry.published : now;
        item.dedupKey = entry.guid.empty() ? entry.link : entry.guid;
        item.createdAt = now;

        if (item.dedupKey.empty()) {
            spdlog::warn("[FeedSync] Skipping entry '{}' of feed {}: no guid or link", item.title, feedId);
            continue;
        }
        items.push_back(std::move(item));
    }
    return items;
}

Result<int> FeedSyncService::syncFeed(std::int64_t feedId, const std::string& url) {
    std::string feedUrl = normalizeUrl(url);
    if (feedUrl.empty()) {
        return Error(ErrorCode::Fetch, "Feed URL is empty");
    }
    if (feedUrl != TextUtils::trim(url)) {
        spdlog::debug("[FeedSync] URL missing protocol, using {}", feedUrl);
    }

    spdlog::debug("[FeedSync] Fetching feed {} from {}", feedId, feedUrl);
    auto response = client_.get(feedUrl);
    if (!response.success) {
        if (response.statusCode != 0) {
            return Error(ErrorCode::Fetch,
                         "HTTP error " + std::to_string(response.statusCode) + " for URL: " + feedUrl);
        }
        return Error(ErrorCode::Fetch, "Failed to fetch feed from '" + feedUrl + "': " + response.error);
    }

    std::vector<FeedParser::Entry> entries;
    if (!FeedParser::parseRss(response.body, entries) && !FeedParser::parseAtom(response.body, entries)) {
        return Error(ErrorCode::Parse, "Failed to parse feed as RSS or Atom: " + feedUrl);
    }

    std::int64_t now = clock_();
    int itemsAdded = 0;
    for (const auto& item : normalizeEntries(feedId, entries, now)) {
        auto inserted = repository_.insertItemIfAbsent(feedId, item);
        if (!inserted.ok()) {
            spdlog::warn("[FeedSync] Failed to insert item '{}' of feed {}: {}",
                         item.dedupKey, feedId, inserted.error.describe());
            continue;
        }
        if (inserted.value) ++itemsAdded;
    }

    Error stamped = repository_.updateLastSynced(feedId, now);
    if (!stamped.ok()) return stamped;

    return itemsAdded;
}

SyncSummary FeedSyncService::syncAllFeeds() {
    SyncSummary summary;

    auto feeds = repository_.listFeeds();
    if (!feeds.ok()) {
        summary.batchError = feeds.error;
        spdlog::error("[FeedSync] Could not load feed list: {}", feeds.error.describe());
        return summary;
    }

    spdlog::info("[FeedSync] Found {} feeds to refresh", feeds.value.size());

    for (const auto& feed : feeds.value) {
        ++summary.feedsAttempted;
        auto result = syncFeed(feed.id, feed.url);
        if (result.ok()) {
            ++summary.feedsSucceeded;
            summary.itemsAdded += result.value;
            spdlog::info("[FeedSync] Feed {} ({}): added {} items", feed.id, feed.title, result.value);
        } else {
            spdlog::warn("[FeedSync] Feed {} ({}) error: {}", feed.id, feed.title, result.error.describe());
            summary.failures.push_back({feed.id, feed.title, feed.url, result.error});
        }
    }

    return summary;
}

}
