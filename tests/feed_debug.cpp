#include <iostream>
#include <string>
#include <vector>
#include "services/FeedSyncService.hpp"
#include "utils/FeedParser.hpp"
#include "utils/HttpClient.hpp"

// Fetches one live feed and prints what the sync pipeline would store.
int main(int argc, char* argv[]) {
    std::string testUrl = argc > 1 ? argv[1] : "news.ycombinator.com/rss";
    std::string url = DryDock::FeedSyncService::normalizeUrl(testUrl);
    std::cout << "Fetching: " << url << "\n";

    DryDock::HttpClient client;
    auto response = client.get(url);
    if (!response.success) {
        std::cout << "Fetch failed (HTTP " << response.statusCode << "): " << response.error << "\n";
        return 1;
    }
    std::cout << "Received " << response.body.size() << " bytes";
    auto type = response.headers.find("content-type");
    if (type != response.headers.end()) std::cout << " (" << type->second << ")";
    std::cout << "\n";

    std::vector<DryDock::FeedParser::Entry> entries;
    const char* dialect = "RSS";
    if (!DryDock::FeedParser::parseRss(response.body, entries)) {
        dialect = "Atom";
        if (!DryDock::FeedParser::parseAtom(response.body, entries)) {
            std::cout << "Neither RSS nor Atom\n";
            return 1;
        }
    }

    auto items = DryDock::FeedSyncService::normalizeEntries(0, entries, 0);
    std::cout << dialect << ": " << entries.size() << " entries, " << items.size() << " storable\n";
    for (size_t i = 0; i < items.size() && i < 20; ++i) {
        const auto &it = items[i];
        std::cout << i+1 << ". " << it.title << "\n";
        std::cout << "   Link: " << (it.link.empty() ? "(none)" : it.link) << "\n";
        std::cout << "   Key: " << it.dedupKey << "\n";
        std::cout << "   Published: " << it.publishedAt << "\n";
    }

    return 0;
}
