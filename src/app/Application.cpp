#include "app/Application.hpp"
#include "db/Database.hpp"
#include "services/AssistantBridge.hpp"
#include "services/FeedCatalog.hpp"
#include "services/FeedSyncService.hpp"
#include "services/SyncScheduler.hpp"
#include "utils/Config.hpp"
#include "utils/HttpClient.hpp"
#include "utils/Logger.hpp"
#include <glib-unix.h>
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>

namespace DryDock {

namespace {

constexpr int kItemsViewLimit = 50;
constexpr int kLogViewLimit = 200;

std::string formatTimestamp(std::int64_t timestamp) {
    GDateTime* dt = g_date_time_new_from_unix_local(timestamp);
    if (!dt) return std::to_string(timestamp);
    gchar* text = g_date_time_format(dt, "%Y-%m-%d %H:%M");
    std::string result = text ? text : std::to_string(timestamp);
    g_free(text);
    g_date_time_unref(dt);
    return result;
}

std::string takeString(gchar* value) {
    std::string result = value ? value : "";
    g_free(value);
    return result;
}

}

Application::Application()
    : loop_(nullptr), refreshPending_(false), sigintSource_(0), sigtermSource_(0) {
}

Application::~Application() {
    shutdown();
    if (loop_) {
        g_main_loop_unref(loop_);
    }
}

Result<CommandLine> Application::parseCommandLine(int argc, char* argv[]) {
    gchar* database = nullptr;
    gchar* config = nullptr;
    gint interval = 0;
    gboolean once = FALSE;
    gboolean list = FALSE;
    gboolean logs = FALSE;
    gchar* addFeed = nullptr;
    gchar* title = nullptr;
    // Sentinel tells "not given" apart from an explicit 0
    gint64 removeFeed = G_MININT64;
    gchar* ask = nullptr;

    GOptionEntry entries[] = {
        {"database", 'd', 0, G_OPTION_ARG_FILENAME, &database, "Database file", "PATH"},
        {"config", 'c', 0, G_OPTION_ARG_FILENAME, &config, "Configuration file", "PATH"},
        {"interval", 'i', 0, G_OPTION_ARG_INT, &interval, "Seconds between background syncs", "SECONDS"},
        {"once", 0, 0, G_OPTION_ARG_NONE, &once, "Sync all feeds once and exit", nullptr},
        {"list", 'l', 0, G_OPTION_ARG_NONE, &list, "List subscribed feeds", nullptr},
        {"add-feed", 'a', 0, G_OPTION_ARG_STRING, &addFeed, "Subscribe to a feed", "URL"},
        {"title", 't', 0, G_OPTION_ARG_STRING, &title, "Title for --add-feed", "TITLE"},
        {"remove-feed", 'r', 0, G_OPTION_ARG_INT64, &removeFeed, "Unsubscribe a feed by id", "ID"},
        {"logs", 0, 0, G_OPTION_ARG_NONE, &logs, "Show recent log entries", nullptr},
        {"ask", 0, 0, G_OPTION_ARG_STRING, &ask, "Send a prompt to the local assistant", "PROMPT"},
        {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr}
    };

    GOptionContext* context = g_option_context_new("- background feed sync");
    g_option_context_add_main_entries(context, entries, nullptr);

    GError* error = nullptr;
    gboolean parsed = g_option_context_parse(context, &argc, &argv, &error);
    g_option_context_free(context);

    CommandLine cli;
    cli.databasePath = takeString(database);
    cli.configPath = takeString(config);
    cli.addFeedUrl = takeString(addFeed);
    cli.addFeedTitle = takeString(title);
    cli.askPrompt = takeString(ask);

    if (!parsed) {
        Error result(ErrorCode::InvalidArgument, error ? error->message : "Invalid command line");
        if (error) g_error_free(error);
        return result;
    }
    if (interval < 0) {
        return Error(ErrorCode::InvalidArgument, "--interval must be positive");
    }
    if (removeFeed != G_MININT64 && removeFeed <= 0) {
        return Error(ErrorCode::InvalidArgument, "--remove-feed needs a positive feed id");
    }

    cli.intervalSeconds = interval;
    cli.once = once;
    cli.list = list;
    cli.logs = logs;
    cli.removeFeedId = removeFeed == G_MININT64 ? 0 : removeFeed;
    return cli;
}

int Application::run(int argc, char* argv[]) {
    auto cli = parseCommandLine(argc, argv);
    if (!cli.ok()) {
        std::cerr << cli.error.message << std::endl;
        return 1;
    }

    Error err = startup(cli.value);
    if (!err.ok()) {
        std::cerr << "Failed to start: " << err.describe() << std::endl;
        return 1;
    }

    int status;
    if (!cli.value.addFeedUrl.empty()) {
        status = addFeed(cli.value.addFeedUrl, cli.value.addFeedTitle);
    } else if (cli.value.removeFeedId > 0) {
        status = removeFeed(cli.value.removeFeedId);
    } else if (cli.value.list) {
        status = listFeeds();
    } else if (cli.value.logs) {
        status = showLogs();
    } else if (!cli.value.askPrompt.empty()) {
        status = ask(cli.value.askPrompt);
    } else if (cli.value.once) {
        status = runOnce();
    } else {
        status = runService();
    }

    shutdown();
    return status;
}

Error Application::startup(const CommandLine& options) {
    Config& config = Config::getInstance();
    Error configError = options.configPath.empty() ? config.load() : config.loadFromFile(options.configPath);
    if (!options.databasePath.empty()) config.setDatabasePath(options.databasePath);
    if (options.intervalSeconds > 0) config.setSyncIntervalSeconds(options.intervalSeconds);

    Logging::init(config.getLogLevel());
    if (!configError.ok()) {
        spdlog::warn("[App] {}; using defaults", configError.describe());
    }

    std::string dbPath = config.getDatabasePath();
    gchar* dir = g_path_get_dirname(dbPath.c_str());
    int rc = g_mkdir_with_parents(dir, 0755);
    std::string dirName = dir;
    g_free(dir);
    if (rc != 0) {
        return Error(ErrorCode::Initialization, "Cannot create data directory '" + dirName + "'");
    }

    PoolOptions poolOptions;
    poolOptions.path = dbPath;
    poolOptions.maxConnections = static_cast<std::size_t>(config.getPoolMaxConnections());
    poolOptions.acquireTimeout = std::chrono::milliseconds(config.getPoolAcquireTimeoutMs());

    Error err = Database::initialize(poolOptions);
    if (!err.ok()) {
        return err;
    }
    auto pool = Database::pool();
    Logging::attachDatabase(pool);

    repository_ = std::make_unique<FeedRepository>(*pool);
    logRepository_ = std::make_unique<LogRepository>(*pool);

    http_ = std::make_unique<HttpClient>();
    http_->setTimeout(config.getHttpTimeoutSeconds());
    http_->setMaxRedirects(config.getMaxRedirects());
    http_->setUserAgent(config.getUserAgent());

    syncService_ = std::make_unique<FeedSyncService>(*repository_, *http_);
    views_ = std::make_unique<ViewStateCoordinator>();
    catalog_ = std::make_unique<FeedCatalog>(*repository_, *views_);
    scheduler_ = std::make_unique<SyncScheduler>(
        [this]() { return syncService_->syncAllFeeds(); },
        *views_, std::chrono::seconds(config.getSyncIntervalSeconds()));

    spdlog::info("[App] {} {} using database {}", config.getAppName(), config.getVersion(), dbPath);
    return Error();
}

void Application::shutdown() {
    if (scheduler_) {
        scheduler_->stop();
    }
    if (views_) {
        views_->setWakeHandler(nullptr);
    }
    g_idle_remove_by_data(this);
    if (sigintSource_) {
        g_source_remove(sigintSource_);
        sigintSource_ = 0;
    }
    if (sigtermSource_) {
        g_source_remove(sigtermSource_);
        sigtermSource_ = 0;
    }
    // Background threads are gone; safe to drop the database sink
    Logging::detachDatabase();
}

int Application::runService() {
    loop_ = g_main_loop_new(nullptr, FALSE);

    views_->setWakeHandler([this]() { scheduleViewRefresh(); });
    sigintSource_ = g_unix_signal_add(SIGINT, onQuitSignal, this);
    sigtermSource_ = g_unix_signal_add(SIGTERM, onQuitSignal, this);

    // First render: every view starts stale
    scheduleViewRefresh();

    scheduler_->start();
    scheduler_->requestSync();

    spdlog::info("[App] Running; press Ctrl+C to quit");
    g_main_loop_run(loop_);
    spdlog::info("[App] Shutting down");
    return 0;
}

int Application::runOnce() {
    loop_ = g_main_loop_new(nullptr, FALSE);
    views_->setWakeHandler([this]() { scheduleViewRefresh(); });

    scheduler_->setCycleCallback([this](const SyncSummary& summary) {
        // Read by the main thread once the loop has quit
        lastSummary_ = std::make_unique<SyncSummary>(summary);
        g_idle_add(onQuitIdle, this);
    });
    scheduler_->start();
    scheduler_->requestSync();

    g_main_loop_run(loop_);
    scheduler_->stop();

    // Pick up the invalidation from the final cycle
    reloadViews(views_->takeStale());

    if (!lastSummary_) return 1;
    std::cout << lastSummary_->describe() << std::endl;
    std::cout << feedListView_.size() << " feeds, showing " << feedItemsView_.size() << " latest items" << std::endl;
    return lastSummary_->fullSuccess() ? 0 : 1;
}

int Application::listFeeds() {
    auto feeds = catalog_->feeds();
    if (!feeds.ok()) {
        std::cerr << feeds.error.describe() << std::endl;
        return 1;
    }
    if (feeds.value.empty()) {
        std::cout << "No feeds subscribed" << std::endl;
        return 0;
    }
    for (const auto& feed : feeds.value) {
        auto count = repository_->countItems(feed.id);
        std::cout << feed.id << ". " << feed.title << "\n";
        std::cout << "   URL: " << feed.url << "\n";
        std::cout << "   Items: " << (count.ok() ? std::to_string(count.value) : count.error.describe()) << "\n";
        std::cout << "   Last synced: "
                  << (feed.lastSyncedAt ? formatTimestamp(*feed.lastSyncedAt) : std::string("never")) << "\n";
    }
    return 0;
}

int Application::addFeed(const std::string& url, const std::string& title) {
    auto feed = catalog_->subscribe(url, title);
    if (!feed.ok()) {
        std::cerr << feed.error.describe() << std::endl;
        return 1;
    }
    std::cout << "Added feed " << feed.value.id << ": " << feed.value.title << " (" << feed.value.url << ")"
              << std::endl;
    return 0;
}

int Application::removeFeed(std::int64_t feedId) {
    Error err = catalog_->unsubscribe(feedId);
    if (!err.ok()) {
        std::cerr << err.describe() << std::endl;
        return 1;
    }
    std::cout << "Removed feed " << feedId << std::endl;
    return 0;
}

int Application::showLogs() {
    auto entries = logRepository_->recent(kLogViewLimit);
    if (!entries.ok()) {
        std::cerr << entries.error.describe() << std::endl;
        return 1;
    }
    // Oldest first on a terminal
    for (auto it = entries.value.rbegin(); it != entries.value.rend(); ++it) {
        std::cout << "[" << formatTimestamp(it->timestamp) << "] [" << it->level << "] " << it->message << "\n";
    }
    return 0;
}

int Application::ask(const std::string& prompt) {
    const Config& config = Config::getInstance();
    AssistantBridge::Options options;
    options.baseUrl = config.getAssistantUrl();
    options.model = config.getAssistantModel();
    options.timeoutSeconds = config.getAssistantTimeoutSeconds();
    AssistantBridge assistant(options);

    if (!assistant.checkServerStatus()) {
        std::cerr << "Assistant server is not running at " << options.baseUrl << std::endl;
        return 1;
    }

    auto reply = assistant.sendMessage({ChatMessage::user(prompt)});
    if (!reply.ok()) {
        std::cerr << reply.error.describe() << std::endl;
        return 1;
    }
    std::cout << reply.value << std::endl;
    return 0;
}

// Any thread. At most one refresh is queued on the main loop at a time.
void Application::scheduleViewRefresh() {
    if (!refreshPending_.exchange(true)) {
        g_idle_add(onViewRefresh, this);
    }
}

void Application::reloadViews(const std::vector<ViewKey>& keys) {
    for (ViewKey key : keys) {
        switch (key) {
            case ViewKey::FeedList: {
                auto feeds = catalog_->feeds();
                if (feeds.ok()) {
                    feedListView_ = std::move(feeds.value);
                } else {
                    spdlog::warn("[App] Could not reload {}: {}", viewKeyName(key), feeds.error.describe());
                }
                break;
            }
            case ViewKey::FeedItems: {
                auto items = catalog_->latestItems(kItemsViewLimit);
                if (items.ok()) {
                    feedItemsView_ = std::move(items.value);
                } else {
                    spdlog::warn("[App] Could not reload {}: {}", viewKeyName(key), items.error.describe());
                }
                break;
            }
            case ViewKey::Logs: {
                auto entries = logRepository_->recent(kLogViewLimit);
                if (entries.ok()) {
                    logView_ = std::move(entries.value);
                } else {
                    spdlog::warn("[App] Could not reload {}: {}", viewKeyName(key), entries.error.describe());
                }
                break;
            }
        }
        spdlog::debug("[App] Reloaded {}", viewKeyName(key));
    }
}

gboolean Application::onViewRefresh(gpointer userData) {
    auto* self = static_cast<Application*>(userData);
    self->refreshPending_ = false;
    self->reloadViews(self->views_->takeStale());
    return G_SOURCE_REMOVE;
}

gboolean Application::onQuitSignal(gpointer userData) {
    auto* self = static_cast<Application*>(userData);
    spdlog::info("[App] Signal received, stopping");
    g_main_loop_quit(self->loop_);
    return G_SOURCE_CONTINUE;
}

gboolean Application::onQuitIdle(gpointer userData) {
    auto* self = static_cast<Application*>(userData);
    g_main_loop_quit(self->loop_);
    return G_SOURCE_REMOVE;
}

} // namespace DryDock
