#pragma once

#include "db/FeedRepository.hpp"
#include "db/LogRepository.hpp"
#include "models/LogEntry.hpp"
#include "state/ViewStateCoordinator.hpp"
#include "utils/Error.hpp"
#include <glib.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace DryDock {

class HttpClient;
class FeedSyncService;
class FeedCatalog;
class SyncScheduler;
struct SyncSummary;

struct CommandLine {
    std::string databasePath;
    std::string configPath;
    int intervalSeconds = 0;
    bool once = false;
    bool list = false;
    bool logs = false;
    std::string addFeedUrl;
    std::string addFeedTitle;
    std::int64_t removeFeedId = 0;
    std::string askPrompt;
};

// Process shell: configuration, logging, the store and the background
// scheduler around a GLib main loop. The main loop plays the render loop: it
// owns the cached view rows and reloads them when the coordinator wakes it.
class Application {
public:
    Application();
    ~Application();

    int run(int argc, char* argv[]);

    static Result<CommandLine> parseCommandLine(int argc, char* argv[]);

private:
    Error startup(const CommandLine& options);
    void shutdown();

    int runService();
    int runOnce();
    int listFeeds();
    int addFeed(const std::string& url, const std::string& title);
    int removeFeed(std::int64_t feedId);
    int showLogs();
    int ask(const std::string& prompt);

    void scheduleViewRefresh();
    void reloadViews(const std::vector<ViewKey>& keys);

    static gboolean onViewRefresh(gpointer userData);
    static gboolean onQuitSignal(gpointer userData);
    static gboolean onQuitIdle(gpointer userData);

    GMainLoop* loop_;
    std::atomic<bool> refreshPending_;
    guint sigintSource_;
    guint sigtermSource_;

    std::unique_ptr<FeedRepository> repository_;
    std::unique_ptr<LogRepository> logRepository_;
    std::unique_ptr<HttpClient> http_;
    std::unique_ptr<FeedSyncService> syncService_;
    std::unique_ptr<ViewStateCoordinator> views_;
    std::unique_ptr<FeedCatalog> catalog_;
    std::unique_ptr<SyncScheduler> scheduler_;
    std::unique_ptr<SyncSummary> lastSummary_;

    // Owned by the main loop thread
    std::vector<Feed> feedListView_;
    std::vector<FeedItem> feedItemsView_;
    std::vector<LogEntry> logView_;

};

} // namespace DryDock
