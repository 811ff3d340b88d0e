#pragma once

#include "ChannelStore.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace RelayPipe {

/**
 * @brief Background thread that evicts idle channels
 *
 * Wakes every interval (or immediately on stop()) and runs
 * ChannelStore::expireSweep with the configured default TTL.
 */
class ExpirySweeper {
public:
    ExpirySweeper(ChannelStore& store,
                  std::chrono::milliseconds interval = std::chrono::milliseconds(config::SWEEP_INTERVAL_MS),
                  std::chrono::seconds ttl = std::chrono::seconds(config::DEFAULT_TTL_SEC));
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    void start();

    /// Wake the thread and join it; safe to call from several threads at once
    void stop();
    bool isRunning() const { return running_; }

    /// Run one sweep on the calling thread
    size_t sweepNow();

    uint64_t totalEvicted() const { return totalEvicted_; }
    uint64_t sweepCount() const { return sweeps_; }

private:
    void run();

    ChannelStore& store_;
    std::chrono::milliseconds interval_;
    std::chrono::seconds ttl_;

    std::thread thread_;
    std::mutex lifecycleMutex_;   // serializes start() and stop(), held across the join
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    bool stopRequested_{false};

    std::atomic<uint64_t> totalEvicted_{0};
    std::atomic<uint64_t> sweeps_{0};
};

} // namespace RelayPipe
