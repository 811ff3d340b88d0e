#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace RelayPipe {

/**
 * @brief Token bucket
 *
 * Tokens are added at a constant rate up to the burst capacity; each
 * request consumes one. Not thread-safe on its own, RateLimiter guards it.
 */
class TokenBucket {
public:
    TokenBucket(double ratePerSecond, double burstCapacity,
                std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    bool tryConsume(double tokens, std::chrono::steady_clock::time_point now);
    double tokens() const { return tokens_; }
    std::chrono::steady_clock::time_point lastUsed() const { return lastUsed_; }

private:
    void refill(std::chrono::steady_clock::time_point now);

    double ratePerSecond_;
    double burstCapacity_;
    double tokens_;
    std::chrono::steady_clock::time_point lastRefill_;
    std::chrono::steady_clock::time_point lastUsed_;
};

/**
 * @brief Per-client request limiter for the relay server
 *
 * One bucket per client address. A rate of 0 disables limiting.
 */
class RateLimiter {
public:
    /**
     * @param requestsPerSecond sustained rate per client (0 = unlimited)
     * @param burstCapacity bucket size (default: 2x rate)
     */
    RateLimiter(size_t requestsPerSecond = 0, size_t burstCapacity = 0);

    /**
     * @brief Account one request from clientKey
     * @return false if the client is over its rate
     */
    bool allow(const std::string& clientKey,
               std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    void setRateLimit(size_t requestsPerSecond, size_t burstCapacity = 0);
    size_t getRateLimit() const { return requestsPerSecond_; }
    bool isEnabled() const { return requestsPerSecond_ > 0; }

    /// Forget clients whose bucket has been unused for longer than idle
    size_t pruneIdle(std::chrono::steady_clock::duration idle,
                     std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    size_t trackedClients() const;

    /**
     * @brief Get statistics
     * @return Pair of (allowed, rejected)
     */
    std::pair<uint64_t, uint64_t> getStats() const;

private:
    std::atomic<size_t> requestsPerSecond_;
    size_t burstCapacity_;

    std::unordered_map<std::string, std::unique_ptr<TokenBucket>> buckets_;
    mutable std::mutex mutex_;

    std::atomic<uint64_t> allowed_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace RelayPipe
