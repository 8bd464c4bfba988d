#include "services/SyncScheduler.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace DryDock {

const char* schedulerStateName(SyncScheduler::State state) {
    switch (state) {
        case SyncScheduler::State::Idle: return "idle";
        case SyncScheduler::State::Sleeping: return "sleeping";
        case SyncScheduler::State::Running: return "running";
        case SyncScheduler::State::Stopped: return "stopped";
    }
    return "unknown";
}

SyncScheduler::SyncScheduler(SyncJob job, ViewStateCoordinator& views, std::chrono::milliseconds interval)
    : job_(std::move(job)), views_(views), interval_(interval) {}

SyncScheduler::~SyncScheduler() { stop(); }

void SyncScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) return;
    stopRequested_ = false;
    syncRequested_ = false;
    state_ = State::Idle;
    thread_ = std::thread(&SyncScheduler::run, this);
    spdlog::info("[SyncScheduler] Started, interval {} s",
                 std::chrono::duration_cast<std::chrono::seconds>(interval_).count());
}

void SyncScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_.joinable()) return;
        stopRequested_ = true;
    }
    wake_.notify_all();
    thread_.join();
    spdlog::info("[SyncScheduler] Stopped after {} cycles", completedCycles());
}

void SyncScheduler::requestSync() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        syncRequested_ = true;
    }
    wake_.notify_all();
}

bool SyncScheduler::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_.joinable() && !stopRequested_;
}

SyncScheduler::State SyncScheduler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::uint64_t SyncScheduler::completedCycles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cycles_;
}

bool SyncScheduler::waitForCycles(std::uint64_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cycleDone_.wait_for(lock, timeout, [this, count] { return cycles_ >= count; });
}

void SyncScheduler::setCycleCallback(CycleCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

void SyncScheduler::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            state_ = State::Sleeping;
            wake_.wait_for(lock, interval_, [this] { return stopRequested_ || syncRequested_; });
            if (stopRequested_) break;
            syncRequested_ = false;
            state_ = State::Running;
        }

        runCycle();

        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Idle;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::Stopped;
}

void SyncScheduler::runCycle() {
    SyncSummary summary;
    try {
        summary = job_();
        if (summary.fullSuccess()) {
            spdlog::info("[SyncScheduler] {}", summary.describe());
        } else {
            spdlog::warn("[SyncScheduler] {}", summary.describe());
        }
    } catch (const std::exception& e) {
        summary.batchError = Error(ErrorCode::Internal, std::string("Sync cycle aborted: ") + e.what());
        spdlog::error("[SyncScheduler] {}", summary.batchError.describe());
    }

    // Whatever happened, the stored rows may have changed, and the outcome
    // was logged into the logs table
    views_.markStale(ViewKey::FeedList);
    views_.markStale(ViewKey::FeedItems);
    views_.markStale(ViewKey::Logs);

    CycleCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = callback_;
    }
    if (callback) callback(summary);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++cycles_;
    }
    cycleDone_.notify_all();
}

}
