#include "RateLimiter.h"
#include <algorithm>

namespace RelayPipe {

TokenBucket::TokenBucket(double ratePerSecond, double burstCapacity,
                         std::chrono::steady_clock::time_point now)
    : ratePerSecond_(ratePerSecond)
    , burstCapacity_(burstCapacity)
    , tokens_(burstCapacity)
    , lastRefill_(now)
    , lastUsed_(now) {
}

void TokenBucket::refill(std::chrono::steady_clock::time_point now) {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(now - lastRefill_).count();
    if (elapsed > 0) {
        double tokensToAdd = (ratePerSecond_ * elapsed) / 1000000.0;
        tokens_ = std::min(tokens_ + tokensToAdd, burstCapacity_);
        lastRefill_ = now;
    }
}

bool TokenBucket::tryConsume(double tokens, std::chrono::steady_clock::time_point now) {
    refill(now);
    lastUsed_ = now;
    if (tokens_ < tokens) {
        return false;
    }
    tokens_ -= tokens;
    return true;
}

RateLimiter::RateLimiter(size_t requestsPerSecond, size_t burstCapacity)
    : requestsPerSecond_(requestsPerSecond)
    , burstCapacity_(burstCapacity > 0 ? burstCapacity : requestsPerSecond * 2) {
}

bool RateLimiter::allow(const std::string& clientKey, std::chrono::steady_clock::time_point now) {
    if (!isEnabled()) {
        allowed_++;
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = buckets_[clientKey];
    if (!bucket) {
        bucket = std::make_unique<TokenBucket>(static_cast<double>(requestsPerSecond_.load()),
                                               static_cast<double>(burstCapacity_), now);
    }

    if (bucket->tryConsume(1.0, now)) {
        allowed_++;
        return true;
    }
    rejected_++;
    return false;
}

void RateLimiter::setRateLimit(size_t requestsPerSecond, size_t burstCapacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    requestsPerSecond_ = requestsPerSecond;
    burstCapacity_ = burstCapacity > 0 ? burstCapacity : requestsPerSecond * 2;
    // Existing buckets carry the old rate
    buckets_.clear();
}

size_t RateLimiter::pruneIdle(std::chrono::steady_clock::duration idle,
                              std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        if (now - it->second->lastUsed() > idle) {
            it = buckets_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t RateLimiter::trackedClients() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

std::pair<uint64_t, uint64_t> RateLimiter::getStats() const {
    return {allowed_.load(), rejected_.load()};
}

} // namespace RelayPipe
