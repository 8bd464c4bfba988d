#pragma once
#include "db/FeedRepository.hpp"
#include "utils/FeedParser.hpp"
#include "utils/HttpClient.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace DryDock {

struct FeedFailure {
    std::int64_t feedId = 0;
    std::string title;
    std::string url;
    Error error;
};

struct SyncSummary {
    int feedsAttempted = 0;
    int feedsSucceeded = 0;
    int itemsAdded = 0;
    std::vector<FeedFailure> failures;
    Error batchError;   // set when the feed list itself could not be read

    bool fullSuccess() const { return batchError.ok() && failures.empty(); }
    std::string describe() const;
};

// Fetch -> parse (RSS, then Atom) -> normalize -> dedup-insert -> stamp the feed.
class FeedSyncService {
public:
    using Clock = std::function<std::int64_t()>;

    FeedSyncService(FeedRepository& repository, HttpClient& client);

    // Number of newly stored items, or Fetch/Parse/Database errors.
    Result<int> syncFeed(std::int64_t feedId, const std::string& url);

    // Feeds run one after another; a failing feed is recorded and skipped.
    SyncSummary syncAllFeeds();

    // Trims and prepends https:// when no http(s) scheme is present.
    static std::string normalizeUrl(const std::string& url);

    static std::vector<FeedItem> normalizeEntries(std::int64_t feedId,
                                                  const std::vector<FeedParser::Entry>& entries,
                                                  std::int64_t now);

    void setClock(Clock clock) { clock_ = std::move(clock); }

private:
    FeedRepository& repository_;
    HttpClient& client_;
    Clock clock_;
};

}
