#pragma once

#include <string>
#include <atomic>
#include <mutex>
#include <chrono>
#include <cstdint>

namespace RelayPipe {

    // Snapshot structs for returning metrics (non-atomic)
    struct ChannelMetricsSnapshot {
        uint64_t pushes{0};
        uint64_t duplicatePushes{0};
        uint64_t pops{0};
        uint64_t peeks{0};
        uint64_t clears{0};
        uint64_t channelsCreated{0};
        uint64_t channelsEvicted{0};
        uint64_t channelsDrained{0};
        uint64_t channelsActive{0};
        uint64_t lockConflicts{0};
        uint64_t channelFullRejects{0};
    };

    struct TrafficMetricsSnapshot {
        uint64_t requestsTotal{0};
        uint64_t bytesIn{0};
        uint64_t bytesOut{0};
        uint64_t transfersCompleted{0};
        uint64_t transfersFailed{0};
        uint64_t retries{0};
    };

    struct SecurityMetricsSnapshot {
        uint64_t authFailures{0};
        uint64_t integrityErrors{0};
        uint64_t rateLimited{0};
        uint64_t serverErrors{0};
    };

    // Internal structs with atomics
    struct ChannelMetrics {
        std::atomic<uint64_t> pushes{0};
        std::atomic<uint64_t> duplicatePushes{0};
        std::atomic<uint64_t> pops{0};
        std::atomic<uint64_t> peeks{0};
        std::atomic<uint64_t> clears{0};
        std::atomic<uint64_t> channelsCreated{0};
        std::atomic<uint64_t> channelsEvicted{0};
        std::atomic<uint64_t> channelsDrained{0};
        std::atomic<uint64_t> channelsActive{0};
        std::atomic<uint64_t> lockConflicts{0};
        std::atomic<uint64_t> channelFullRejects{0};
    };

    struct TrafficMetrics {
        std::atomic<uint64_t> requestsTotal{0};
        std::atomic<uint64_t> bytesIn{0};
        std::atomic<uint64_t> bytesOut{0};
        std::atomic<uint64_t> transfersCompleted{0};
        std::atomic<uint64_t> transfersFailed{0};
        std::atomic<uint64_t> retries{0};
    };

    struct SecurityMetrics {
        std::atomic<uint64_t> authFailures{0};
        std::atomic<uint64_t> integrityErrors{0};
        std::atomic<uint64_t> rateLimited{0};
        std::atomic<uint64_t> serverErrors{0};
    };

    class MetricsCollector {
    public:
        static MetricsCollector& instance();

        // Channel store
        void incrementPushes();
        void incrementDuplicatePushes();
        void incrementPops();
        void incrementPeeks();
        void incrementClears();
        void incrementChannelsCreated();
        void incrementChannelsEvicted(uint64_t count = 1);
        void incrementChannelsDrained();
        void setChannelsActive(uint64_t count);
        void incrementLockConflicts();
        void incrementChannelFull();

        // Traffic
        void incrementRequests();
        void addBytesIn(uint64_t bytes);
        void addBytesOut(uint64_t bytes);
        void incrementTransfersCompleted();
        void incrementTransfersFailed();
        void incrementRetries();

        // Security / failures
        void incrementAuthFailures();
        void incrementIntegrityErrors();
        void incrementRateLimited();
        void incrementServerErrors();

        ChannelMetricsSnapshot getChannelMetrics() const;
        TrafficMetricsSnapshot getTrafficMetrics() const;
        SecurityMetricsSnapshot getSecurityMetrics() const;

        // Human-readable summary, logged by the server at shutdown
        std::string getMetricsSummary() const;

        // Prometheus-compatible export
        std::string exportPrometheus() const;

        void reset();

        std::chrono::seconds getUptime() const;

    private:
        MetricsCollector();
        ~MetricsCollector() = default;

        ChannelMetrics channelMetrics_;
        TrafficMetrics trafficMetrics_;
        SecurityMetrics securityMetrics_;

        std::chrono::system_clock::time_point startTime_;
        mutable std::mutex mutex_;
    };

} // namespace RelayPipe
