#pragma once

/**
 * @file TransferSession.h
 * @brief Client side of one send, receive or peek
 *
 * A session drives the chunk exchanges for a single logical stream over an
 * IHttpTransport and retries transient failures with bounded backoff. It is
 * not thread-safe apart from cancel().
 */

#include "ChannelStore.h"
#include "ChunkCodec.h"
#include "Constants.h"
#include "IHttpTransport.h"
#include "Result.h"
#include "SHA256.h"
#include "ThreadPool.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace RelayPipe {

/**
 * @brief What the session knows about the stream in flight
 */
struct TransferDescriptor {
    std::string channel;
    std::shared_ptr<ChannelKey> key;     // null when no password is set
    std::string credential;              // sent as X-Channel-Auth
    bool compress = false;
    SHA256::Digest streamChecksum{};     // SHA-256 of the whole plaintext
    std::vector<uint64_t> acknowledged;  // producer indices the relay has accepted
    std::string producerId;              // send
    std::string lockToken;               // receive
    std::string channelId;               // incarnation pinned after the first exchange
};

struct SessionOptions {
    std::chrono::milliseconds requestTimeout{config::DEFAULT_REQUEST_TIMEOUT_MS};
    std::chrono::milliseconds idleTimeout{config::DEFAULT_IDLE_TIMEOUT_MS};
    std::chrono::milliseconds pollWait{config::DEFAULT_POLL_WAIT_MS};
    int maxRetries = config::DEFAULT_MAX_RETRIES;
    int ttlSec = 0;
    bool compress = false;
    int kdfIterations = config::KDF_ITERATIONS;
    double backoffScale = 1.0;           // multiplies every backoff delay
    ThreadPool* pool = nullptr;          // null = ThreadPool::global()
};

/**
 * @brief Outcome of receive() and peek()
 *
 * On failure data holds the decoded prefix; complete is only set when the
 * whole stream arrived and its digest verified.
 */
struct ReceiveResult {
    std::vector<uint8_t> data;
    std::optional<Error> error;
    bool complete = false;

    bool ok() const { return complete && !error; }
};

class TransferSession {
public:
    TransferSession(IHttpTransport& transport,
                    std::string channel,
                    std::string password = "",
                    SessionOptions options = SessionOptions());

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    /**
     * @brief Upload a whole stream
     *
     * AuthError, FormatError and Expired end the upload; transient errors
     * are retried with the same chunk.
     */
    VoidResult send(const std::vector<uint8_t>& data);

    /**
     * @brief Destructively read one stream, holding the channel's lock token
     */
    ReceiveResult receive();

    /**
     * @brief Non-destructive read; waits until the stream is complete
     */
    ReceiveResult peek();

    VoidResult clear();
    Result<ChannelInfo> query();

    /// Abort the running loop; safe to call from another thread
    void cancel();
    bool isCancelled() const { return cancelled_; }

    const TransferDescriptor& descriptor() const { return descriptor_; }

    /// Delay before retry number attempt, from the 0.3s/0.5s/1s/2s/5s ladder
    static std::chrono::milliseconds backoffDelay(int attempt);

    /// Turn a non-success response into an Error, preferring X-Error-Code
    static Error errorFromResponse(const HttpResponse& response);

private:
    HttpRequest makeRequest(const std::string& method, const std::string& prefix) const;

    /**
     * @brief Exchange with retries; 2xx responses (204 included) are success
     */
    Result<HttpResponse> exchangeWithRetry(const HttpRequest& request, const char* what);

    /// Sleep unless cancelled first; false when cancelled
    bool pause(std::chrono::milliseconds delay);

    VoidResult appendDecoded(const Chunk& chunk, ReceiveResult& out, SHA256& digest);

    ThreadPool& pool();

    IHttpTransport& transport_;
    SessionOptions options_;
    TransferDescriptor descriptor_;

    std::atomic<bool> cancelled_{false};
    std::mutex cancelMutex_;
    std::condition_variable cancelCv_;
};

} // namespace RelayPipe
