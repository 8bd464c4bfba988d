#pragma once
#include "services/FeedSyncService.hpp"
#include "state/ViewStateCoordinator.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace DryDock {

// Runs the sync job on its own thread: sleep for the interval (or until
// requestSync()), run the job, mark the feed and log views stale, repeat. A failing
// or throwing job is logged and the loop carries on. stop() wakes the sleeper
// and joins; a cycle already running is allowed to finish.
class SyncScheduler {
public:
    enum class State {
        Idle,
        Sleeping,
        Running,
        Stopped
    };

    using SyncJob = std::function<SyncSummary()>;
    using CycleCallback = std::function<void(const SyncSummary&)>;

    static constexpr std::chrono::seconds kDefaultInterval{300};

    SyncScheduler(SyncJob job, ViewStateCoordinator& views,
                  std::chrono::milliseconds interval = kDefaultInterval);
    ~SyncScheduler();
    SyncScheduler(const SyncScheduler&) = delete;
    SyncScheduler& operator=(const SyncScheduler&) = delete;

    void start();
    void stop();

    // Cuts the current sleep short. A request made while a cycle is running
    // starts another cycle as soon as that one finishes.
    void requestSync();

    bool isRunning() const;
    State state() const;
    std::uint64_t completedCycles() const;
    std::chrono::milliseconds interval() const { return interval_; }

    // Blocks until at least `count` cycles completed or the timeout passed.
    bool waitForCycles(std::uint64_t count, std::chrono::milliseconds timeout);

    // Called on the scheduler thread after each cycle. Set before start().
    void setCycleCallback(CycleCallback callback);

private:
    void run();
    void runCycle();

    SyncJob job_;
    ViewStateCoordinator& views_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable cycleDone_;
    std::thread thread_;
    bool stopRequested_ = false;
    bool syncRequested_ = false;
    State state_ = State::Idle;
    std::uint64_t cycles_ = 0;
    CycleCallback callback_;
};

const char* schedulerStateName(SyncScheduler::State state);

}
