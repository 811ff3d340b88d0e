#include "MetricsCollector.h"
#include "Version.h"
#include <sstream>
#include <iomanip>

namespace RelayPipe {

    namespace {
        void writeMetric(std::stringstream& ss, const char* name, const char* type,
                         const char* help, uint64_t value) {
            ss << "# HELP " << name << " " << help << "\n";
            ss << "# TYPE " << name << " " << type << "\n";
            ss << name << " " << value << "\n";
        }
    }

    MetricsCollector::MetricsCollector()
        : startTime_(std::chrono::system_clock::now()) {
    }

    MetricsCollector& MetricsCollector::instance() {
        static MetricsCollector instance;
        return instance;
    }

    // Channel store
    void MetricsCollector::incrementPushes() { channelMetrics_.pushes++; }
    void MetricsCollector::incrementDuplicatePushes() { channelMetrics_.duplicatePushes++; }
    void MetricsCollector::incrementPops() { channelMetrics_.pops++; }
    void MetricsCollector::incrementPeeks() { channelMetrics_.peeks++; }
    void MetricsCollector::incrementClears() { channelMetrics_.clears++; }
    void MetricsCollector::incrementChannelsCreated() { channelMetrics_.channelsCreated++; }
    void MetricsCollector::incrementChannelsEvicted(uint64_t count) { channelMetrics_.channelsEvicted += count; }
    void MetricsCollector::incrementChannelsDrained() { channelMetrics_.channelsDrained++; }
    void MetricsCollector::setChannelsActive(uint64_t count) { channelMetrics_.channelsActive = count; }
    void MetricsCollector::incrementLockConflicts() { channelMetrics_.lockConflicts++; }
    void MetricsCollector::incrementChannelFull() { channelMetrics_.channelFullRejects++; }

    // Traffic
    void MetricsCollector::incrementRequests() { trafficMetrics_.requestsTotal++; }
    void MetricsCollector::addBytesIn(uint64_t bytes) { trafficMetrics_.bytesIn += bytes; }
    void MetricsCollector::addBytesOut(uint64_t bytes) { trafficMetrics_.bytesOut += bytes; }
    void MetricsCollector::incrementTransfersCompleted() { trafficMetrics_.transfersCompleted++; }
    void MetricsCollector::incrementTransfersFailed() { trafficMetrics_.transfersFailed++; }
    void MetricsCollector::incrementRetries() { trafficMetrics_.retries++; }

    // Security / failures
    void MetricsCollector::incrementAuthFailures() { securityMetrics_.authFailures++; }
    void MetricsCollector::incrementIntegrityErrors() { securityMetrics_.integrityErrors++; }
    void MetricsCollector::incrementRateLimited() { securityMetrics_.rateLimited++; }
    void MetricsCollector::incrementServerErrors() { securityMetrics_.serverErrors++; }

    ChannelMetricsSnapshot MetricsCollector::getChannelMetrics() const {
        ChannelMetricsSnapshot snapshot;
        snapshot.pushes = channelMetrics_.pushes.load();
        snapshot.duplicatePushes = channelMetrics_.duplicatePushes.load();
        snapshot.pops = channelMetrics_.pops.load();
        snapshot.peeks = channelMetrics_.peeks.load();
        snapshot.clears = channelMetrics_.clears.load();
        snapshot.channelsCreated = channelMetrics_.channelsCreated.load();
        snapshot.channelsEvicted = channelMetrics_.channelsEvicted.load();
        snapshot.channelsDrained = channelMetrics_.channelsDrained.load();
        snapshot.channelsActive = channelMetrics_.channelsActive.load();
        snapshot.lockConflicts = channelMetrics_.lockConflicts.load();
        snapshot.channelFullRejects = channelMetrics_.channelFullRejects.load();
        return snapshot;
    }

    TrafficMetricsSnapshot MetricsCollector::getTrafficMetrics() const {
        TrafficMetricsSnapshot snapshot;
        snapshot.requestsTotal = trafficMetrics_.requestsTotal.load();
        snapshot.bytesIn = trafficMetrics_.bytesIn.load();
        snapshot.bytesOut = trafficMetrics_.bytesOut.load();
        snapshot.transfersCompleted = trafficMetrics_.transfersCompleted.load();
        snapshot.transfersFailed = trafficMetrics_.transfersFailed.load();
        snapshot.retries = trafficMetrics_.retries.load();
        return snapshot;
    }

    SecurityMetricsSnapshot MetricsCollector::getSecurityMetrics() const {
        SecurityMetricsSnapshot snapshot;
        snapshot.authFailures = securityMetrics_.authFailures.load();
        snapshot.integrityErrors = securityMetrics_.integrityErrors.load();
        snapshot.rateLimited = securityMetrics_.rateLimited.load();
        snapshot.serverErrors = securityMetrics_.serverErrors.load();
        return snapshot;
    }

    std::string MetricsCollector::getMetricsSummary() const {
        std::stringstream ss;

        auto uptime = getUptime();
        auto hours = std::chrono::duration_cast<std::chrono::hours>(uptime).count();
        auto minutes = std::chrono::duration_cast<std::chrono::minutes>(uptime % std::chrono::hours(1)).count();

        ss << "=== RelayPipe Metrics Summary ===" << std::endl;
        ss << "Uptime: " << hours << "h " << minutes << "m" << std::endl << std::endl;

        ss << "--- Channels ---" << std::endl;
        ss << "  Active: " << channelMetrics_.channelsActive.load() << std::endl;
        ss << "  Created: " << channelMetrics_.channelsCreated.load() << std::endl;
        ss << "  Drained: " << channelMetrics_.channelsDrained.load() << std::endl;
        ss << "  Evicted: " << channelMetrics_.channelsEvicted.load() << std::endl;
        ss << "  Pushes: " << channelMetrics_.pushes.load()
           << " (duplicates " << channelMetrics_.duplicatePushes.load() << ")" << std::endl;
        ss << "  Pops: " << channelMetrics_.pops.load() << std::endl;
        ss << "  Peeks: " << channelMetrics_.peeks.load() << std::endl;
        ss << "  Lock Conflicts: " << channelMetrics_.lockConflicts.load() << std::endl << std::endl;

        ss << "--- Traffic ---" << std::endl;
        double inMB = trafficMetrics_.bytesIn.load() / (1024.0 * 1024.0);
        double outMB = trafficMetrics_.bytesOut.load() / (1024.0 * 1024.0);
        ss << std::fixed << std::setprecision(2);
        ss << "  Requests: " << trafficMetrics_.requestsTotal.load() << std::endl;
        ss << "  In: " << inMB << " MB" << std::endl;
        ss << "  Out: " << outMB << " MB" << std::endl << std::endl;

        ss << "--- Failures ---" << std::endl;
        ss << "  Auth Failures: " << securityMetrics_.authFailures.load() << std::endl;
        ss << "  Integrity Errors: " << securityMetrics_.integrityErrors.load() << std::endl;
        ss << "  Rate Limited: " << securityMetrics_.rateLimited.load() << std::endl;
        ss << "  Server Errors: " << securityMetrics_.serverErrors.load() << std::endl;

        return ss.str();
    }

    std::string MetricsCollector::exportPrometheus() const {
        std::stringstream ss;

        ss << "# HELP relaypipe_info RelayPipe server information\n";
        ss << "# TYPE relaypipe_info gauge\n";
        ss << "relaypipe_info{version=\"" << Version::STRING << "\"} 1\n";

        writeMetric(ss, "relaypipe_uptime_seconds", "counter", "Server uptime in seconds",
                    static_cast<uint64_t>(getUptime().count()));

        // === Channel Store ===
        writeMetric(ss, "relaypipe_channels_active", "gauge", "Channels currently held by the store",
                    channelMetrics_.channelsActive.load());
        writeMetric(ss, "relaypipe_channels_created_total", "counter", "Channels created",
                    channelMetrics_.channelsCreated.load());
        writeMetric(ss, "relaypipe_channels_drained_total", "counter", "Channels destroyed after the final chunk was received",
                    channelMetrics_.channelsDrained.load());
        writeMetric(ss, "relaypipe_channels_evicted_total", "counter", "Channels evicted by the expiry sweeper",
                    channelMetrics_.channelsEvicted.load());
        writeMetric(ss, "relaypipe_pushes_total", "counter", "Chunks accepted",
                    channelMetrics_.pushes.load());
        writeMetric(ss, "relaypipe_duplicate_pushes_total", "counter", "Retried pushes answered with the original sequence",
                    channelMetrics_.duplicatePushes.load());
        writeMetric(ss, "relaypipe_pops_total", "counter", "Chunks handed to destructive receivers",
                    channelMetrics_.pops.load());
        writeMetric(ss, "relaypipe_peeks_total", "counter", "Peek snapshots served",
                    channelMetrics_.peeks.load());
        writeMetric(ss, "relaypipe_clears_total", "counter", "Channels deleted on request",
                    channelMetrics_.clears.load());
        writeMetric(ss, "relaypipe_lock_conflicts_total", "counter", "Receives rejected because another receiver holds the lock",
                    channelMetrics_.lockConflicts.load());
        writeMetric(ss, "relaypipe_channel_full_total", "counter", "Pushes rejected because the channel was full",
                    channelMetrics_.channelFullRejects.load());

        // === Traffic ===
        writeMetric(ss, "relaypipe_requests_total", "counter", "HTTP requests handled",
                    trafficMetrics_.requestsTotal.load());
        writeMetric(ss, "relaypipe_bytes_in_total", "counter", "Request body bytes received",
                    trafficMetrics_.bytesIn.load());
        writeMetric(ss, "relaypipe_bytes_out_total", "counter", "Response body bytes sent",
                    trafficMetrics_.bytesOut.load());
        writeMetric(ss, "relaypipe_transfers_completed_total", "counter", "Transfer sessions that completed",
                    trafficMetrics_.transfersCompleted.load());
        writeMetric(ss, "relaypipe_transfers_failed_total", "counter", "Transfer sessions that failed",
                    trafficMetrics_.transfersFailed.load());
        writeMetric(ss, "relaypipe_retries_total", "counter", "Exchanges retried after a transient failure",
                    trafficMetrics_.retries.load());

        // === Failures ===
        writeMetric(ss, "relaypipe_auth_failures_total", "counter", "Requests rejected for a bad credential",
                    securityMetrics_.authFailures.load());
        writeMetric(ss, "relaypipe_integrity_errors_total", "counter", "Chunks that failed checksum or tag verification",
                    securityMetrics_.integrityErrors.load());
        writeMetric(ss, "relaypipe_rate_limited_total", "counter", "Requests rejected by the rate limiter",
                    securityMetrics_.rateLimited.load());
        writeMetric(ss, "relaypipe_server_errors_total", "counter", "Requests that ended in an internal error",
                    securityMetrics_.serverErrors.load());

        return ss.str();
    }

    void MetricsCollector::reset() {
        std::lock_guard<std::mutex> lock(mutex_);

        channelMetrics_.pushes = 0;
        channelMetrics_.duplicatePushes = 0;
        channelMetrics_.pops = 0;
        channelMetrics_.peeks = 0;
        channelMetrics_.clears = 0;
        channelMetrics_.channelsCreated = 0;
        channelMetrics_.channelsEvicted = 0;
        channelMetrics_.channelsDrained = 0;
        channelMetrics_.channelsActive = 0;
        channelMetrics_.lockConflicts = 0;
        channelMetrics_.channelFullRejects = 0;

        trafficMetrics_.requestsTotal = 0;
        trafficMetrics_.bytesIn = 0;
        trafficMetrics_.bytesOut = 0;
        trafficMetrics_.transfersCompleted = 0;
        trafficMetrics_.transfersFailed = 0;
        trafficMetrics_.retries = 0;

        securityMetrics_.authFailures = 0;
        securityMetrics_.integrityErrors = 0;
        securityMetrics_.rateLimited = 0;
        securityMetrics_.serverErrors = 0;

        startTime_ = std::chrono::system_clock::now();
    }

    std::chrono::seconds MetricsCollector::getUptime() const {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::seconds>(now - startTime_);
    }

} // namespace RelayPipe
