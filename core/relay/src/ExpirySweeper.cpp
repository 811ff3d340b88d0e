#include "ExpirySweeper.h"
#include "Logger.h"

namespace RelayPipe {

ExpirySweeper::ExpirySweeper(ChannelStore& store,
                             std::chrono::milliseconds interval,
                             std::chrono::seconds ttl)
    : store_(store)
    , interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(config::SWEEP_INTERVAL_MS))
    , ttl_(ttl) {
}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

void ExpirySweeper::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    stopRequested_ = false;
    running_ = true;
    thread_ = std::thread(&ExpirySweeper::run, this);
    Logger::instance().info("Expiry sweeper started (interval " + std::to_string(interval_.count()) +
                            "ms, ttl " + std::to_string(ttl_.count()) + "s)", "ExpirySweeper");
}

void ExpirySweeper::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stopRequested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
    Logger::instance().info("Expiry sweeper stopped", "ExpirySweeper");
}

size_t ExpirySweeper::sweepNow() {
    size_t evicted = store_.expireSweep(store_.now(), ttl_);
    sweeps_++;
    totalEvicted_ += evicted;
    if (evicted > 0) {
        Logger::instance().info("Evicted " + std::to_string(evicted) + " expired channel(s)", "ExpirySweeper");
    }
    return evicted;
}

void ExpirySweeper::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopRequested_) {
        cv_.wait_for(lock, interval_, [this]() { return stopRequested_; });
        if (stopRequested_) {
            break;
        }
        lock.unlock();
        sweepNow();
        lock.lock();
    }
}

} // namespace RelayPipe
