#include "state/ViewStateCoordinator.hpp"

namespace DryDock {

const char* viewKeyName(ViewKey key) {
    switch (key) {
        case ViewKey::FeedList: return "feed-list";
        case ViewKey::FeedItems: return "feed-items";
        case ViewKey::Logs: return "logs";
    }
    return "unknown";
}

ViewStateCoordinator::ViewStateCoordinator()
    : stale_{{ViewKey::FeedList, true}, {ViewKey::FeedItems, true}, {ViewKey::Logs, true}} {}

void ViewStateCoordinator::markStale(ViewKey key) {
    std::function<void()> handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stale_[key] = true;
        handler = wakeHandler_;
    }
    if (handler) handler();
}

bool ViewStateCoordinator::isStale(ViewKey key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stale_.find(key);
    return it != stale_.end() && it->second;
}

void ViewStateCoordinator::clearStale(ViewKey key) {
    std::lock_guard<std::mutex> lock(mutex_);
    stale_[key] = false;
}

std::vector<ViewKey> ViewStateCoordinator::takeStale() {
    std::vector<ViewKey> keys;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : stale_) {
        if (entry.second) {
            keys.push_back(entry.first);
            entry.second = false;
        }
    }
    return keys;
}

void ViewStateCoordinator::setWakeHandler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    wakeHandler_ = std::move(handler);
}

}
