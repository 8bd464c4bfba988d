#pragma once
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace DryDock {

// Opaque identifiers for the cached views the render loop keeps.
enum class ViewKey {
    FeedList,
    FeedItems,
    Logs
};

const char* viewKeyName(ViewKey key);

// Staleness flags shared between the render loop and background threads.
// Writers call markStale() from any thread; the render loop either polls
// isStale()/clearStale() or drains everything at once with takeStale() after
// being woken by the wake handler. Every view starts stale so the first
// render loads it.
class ViewStateCoordinator {
public:
    ViewStateCoordinator();

    void markStale(ViewKey key);
    bool isStale(ViewKey key) const;
    void clearStale(ViewKey key);

    // Returns the stale keys and clears them in one step.
    std::vector<ViewKey> takeStale();

    // Invoked after markStale(), outside the lock, on the marking thread.
    void setWakeHandler(std::function<void()> handler);

private:
    mutable std::mutex mutex_;
    std::map<ViewKey, bool> stale_;
    std::function<void()> wakeHandler_;
};

}
