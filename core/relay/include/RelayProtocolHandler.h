#pragma once

/**
 * @file RelayProtocolHandler.h
 * @brief Maps HTTP requests onto ChannelStore operations
 *
 * Routes:
 * - GET /, /help              usage text
 * - GET /version              server version
 * - GET /supported            protocol version, algorithm ids and limits (JSON)
 * - GET /health, /ready, /live, /metrics
 * - POST|PUT /c/<channel>     push one chunk frame
 * - GET /c/<channel>          pop one chunk frame, optional long-poll
 * - DELETE /c/<channel>       delete the channel
 * - GET /p/<channel>          peek, body is the queued frames back to back
 * - GET /q/<channel>          channel info (JSON)
 * - GET|POST /web/<channel>   plaintext path for browsers and curl
 */

#include "ChannelStore.h"
#include "HttpMessage.h"
#include "RateLimiter.h"
#include "Result.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace RelayPipe {

/// Header names shared by the server and the client
namespace RelayHeaders {
    constexpr const char* AUTH = "X-Channel-Auth";
    constexpr const char* CHANNEL_ID = "X-Channel-Id";
    constexpr const char* LOCK_TOKEN = "X-Lock-Token";
    constexpr const char* PRODUCER_ID = "X-Producer-Id";
    constexpr const char* WAIT_MS = "X-Wait-Ms";
    constexpr const char* TTL = "X-Channel-TTL";

    constexpr const char* SEQUENCE = "X-Sequence";
    constexpr const char* FINAL = "X-Final";
    constexpr const char* DUPLICATE = "X-Duplicate";
    constexpr const char* CHUNK_COUNT = "X-Chunk-Count";
    constexpr const char* STREAM_COMPLETE = "X-Stream-Complete";
    constexpr const char* MAX_CHUNK_SIZE = "X-Max-Chunk-Size";
    constexpr const char* AUTH_FAILURE = "X-Auth-Failure";
    constexpr const char* ERROR_CODE = "X-Error-Code";
}

enum class HealthStatus {
    Healthy,
    Degraded,
    Unhealthy
};

struct HealthCheck {
    std::string name;
    HealthStatus status;
    std::string message;

    HealthCheck(std::string n, HealthStatus s, std::string msg = "")
        : name(std::move(n)), status(s), message(std::move(msg)) {}
};

using HealthCollector = std::function<std::vector<HealthCheck>()>;

inline const char* healthStatusToString(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
        default: return "unknown";
    }
}

struct RelayHandlerOptions {
    int maxWaitMs = config::MAX_WAIT_MS;
    size_t rateLimitRps = config::DEFAULT_RATE_LIMIT_RPS;
    size_t rateLimitBurst = 0;
};

class RelayProtocolHandler {
public:
    explicit RelayProtocolHandler(ChannelStore& store, RelayHandlerOptions options = RelayHandlerOptions());

    RelayProtocolHandler(const RelayProtocolHandler&) = delete;
    RelayProtocolHandler& operator=(const RelayProtocolHandler&) = delete;

    /**
     * @brief Handle one request; never throws
     */
    HttpResponse handle(const HttpRequest& request);

    void setHealthCollector(HealthCollector collector);
    void setReady(bool ready) { ready_ = ready; }
    bool isReady() const { return ready_; }

    /// Refuse channel operations with 503 from now on
    void beginShutdown();
    bool isShuttingDown() const { return shuttingDown_; }

    RateLimiter& rateLimiter() { return rateLimiter_; }

    /// HTTP status for an error outcome
    static int statusFor(ErrorCode code);

    /// Response carrying X-Error-Code (and X-Auth-Failure for AuthError)
    static HttpResponse errorResponse(const Error& error);

private:
    HttpResponse dispatch(const HttpRequest& request);

    HttpResponse handleSend(const std::string& channel, const HttpRequest& request);
    HttpResponse handleReceive(const std::string& channel, const HttpRequest& request);
    HttpResponse handleClear(const std::string& channel, const HttpRequest& request);
    HttpResponse handlePeek(const std::string& channel, const HttpRequest& request);
    HttpResponse handleQuery(const std::string& channel);
    HttpResponse handleWebRead(const std::string& channel, const HttpRequest& request);
    HttpResponse handleWebWrite(const std::string& channel, const HttpRequest& request);

    HttpResponse handleHelp() const;
    HttpResponse handleSupported() const;
    HttpResponse handleHealth();
    HttpResponse handleMetrics() const;

    /// Pop, long-polling up to the requested wait while the channel is empty
    Result<PopResult> popWithWait(const std::string& channel, const HttpRequest& request,
                                  const std::string& lockToken, const std::string& expectedChannelId);

    ChannelStore& store_;
    RelayHandlerOptions options_;
    RateLimiter rateLimiter_;
    std::atomic<bool> ready_{true};
    std::atomic<bool> shuttingDown_{false};

    HealthCollector healthCollector_;
    std::mutex healthMutex_;
};

} // namespace RelayPipe
