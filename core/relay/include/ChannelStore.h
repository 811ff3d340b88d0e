#pragma once

/**
 * @file ChannelStore.h
 * @brief In-memory registry of relay channels
 *
 * Each channel entry owns its own mutex and condition variable. The map
 * itself is guarded by a shared_mutex that is taken exclusively only to
 * create or remove an entry. Lock order is map then entry; no code path
 * acquires the map lock while holding an entry lock.
 */

#include "Chunk.h"
#include "Constants.h"
#include "Result.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace RelayPipe {

/// Error messages of AuthError results, sent back as X-Auth-Failure
namespace AuthFailure {
    constexpr const char* MISSING = "missing";        // channel has a password, none supplied
    constexpr const char* UNEXPECTED = "unexpected";  // channel has no password, one supplied
    constexpr const char* MISMATCH = "mismatch";      // wrong password
}

struct PushReceipt {
    uint64_t sequence = 0;
    std::string channelId;
    bool duplicate = false;
};

struct PopResult {
    Chunk chunk;
    std::string channelId;
    bool final = false;
    std::string lockToken;   // lock the channel is bound to after this pop, minted for a tokenless caller
};

struct PeekSnapshot {
    std::vector<Chunk> chunks;
    std::string channelId;
    bool complete = false;
};

struct ChannelInfo {
    std::string name;
    std::string channelId;
    size_t chunkCount = 0;
    size_t queuedBytes = 0;
    bool established = false;      // a writer has pushed at least once
    bool passwordProtected = false;
    bool encrypted = false;        // any queued chunk is encrypted
    bool locked = false;
    bool complete = false;         // the final chunk is queued
    int64_t ageSec = 0;
    int64_t idleSec = 0;
    int ttlSec = 0;
    uint64_t nextSequence = 0;
    uint64_t pushes = 0;
    uint64_t pops = 0;
};

/**
 * @brief Serializable copy of one channel, for the state file
 */
struct ChannelSnapshot {
    std::string name;
    std::string channelId;
    std::string credentialHash;   // empty when the channel has no password
    int ttlSec = 0;               // 0 = store default
    int64_t ageSec = 0;
    int64_t idleSec = 0;
    uint64_t nextSequence = 0;
    bool finalQueued = false;
    bool producerBound = false;
    std::string activeProducer;
    struct Producer {
        std::string id;
        uint64_t lastIndex = 0;
        uint64_t sequence = 0;
    };
    std::vector<Producer> producers;
    std::vector<Chunk> chunks;
};

struct ChannelStoreOptions {
    size_t maxChannelBytes = config::MAX_CHANNEL_BYTES;
    std::chrono::milliseconds lockIdleTimeout{config::LOCK_IDLE_TIMEOUT_MS};
    std::chrono::seconds defaultTtl{config::DEFAULT_TTL_SEC};
    std::chrono::seconds maxTtl{config::MAX_TTL_SEC};
};

class ChannelStore {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit ChannelStore(ChannelStoreOptions options = ChannelStoreOptions(), Clock clock = nullptr);
    ~ChannelStore();

    ChannelStore(const ChannelStore&) = delete;
    ChannelStore& operator=(const ChannelStore&) = delete;

    /**
     * @brief Append a chunk
     *
     * The first writer establishes the password (or its absence) and the TTL
     * for the channel's lifetime. A chunk whose producer id and index match
     * the last accepted chunk of that producer is not appended again; the
     * receipt repeats the original sequence with duplicate set.
     *
     * @param credential client credential, empty for no password
     * @param expectedChannelId when non-empty, Expired unless the channel
     *        still has this incarnation
     * @param ttlSec requested TTL, honoured on the first push only (0 = default)
     */
    Result<PushReceipt> push(const std::string& name,
                             const std::string& credential,
                             Chunk chunk,
                             const std::string& expectedChannelId = "",
                             int ttlSec = 0);

    /**
     * @brief Remove and return the lowest-sequence chunk
     *
     * The first successful pop binds the channel to lockToken, or to a fresh
     * token returned in PopResult::lockToken when the caller has none. The
     * lock is dropped when the final chunk is popped, or when the holder has
     * been idle longer than lockIdleTimeout. Once a stream has been started,
     * a caller without a token gets Locked. Popping the final chunk of an
     * otherwise empty queue destroys the channel.
     */
    Result<PopResult> pop(const std::string& name,
                          const std::string& credential,
                          const std::string& lockToken,
                          const std::string& expectedChannelId = "");

    /**
     * @brief Block until the channel has data, is removed, the store shuts
     *        down, or the deadline passes
     *
     * Creates a placeholder channel so that a receiver can wait before any
     * sender has connected.
     * @return true if data was queued when the wait ended
     */
    bool waitForData(const std::string& name, std::chrono::steady_clock::time_point deadline);

    /**
     * @brief Copy of the queue; never takes or checks a receiver lock
     */
    Result<PeekSnapshot> peek(const std::string& name, const std::string& credential);

    /**
     * @brief Delete a channel; an absent channel is not an error
     */
    VoidResult clear(const std::string& name, const std::string& credential);

    Result<ChannelInfo> query(const std::string& name) const;

    /**
     * @brief Evict every channel idle for longer than its TTL
     *
     * A channel uses the TTL its first writer asked for, otherwise ttl.
     * @return number of channels removed
     */
    size_t expireSweep(std::chrono::steady_clock::time_point now, std::chrono::seconds ttl);

    std::vector<ChannelSnapshot> snapshotAll() const;

    /**
     * @brief Re-create channels from snapshots; idle time restarts from the
     *        recorded idle age so that downtime does not count against the TTL
     * @return number of channels restored
     */
    size_t restore(const std::vector<ChannelSnapshot>& snapshots);

    /// Wake all waiters and refuse further waits
    void shutdown();

    size_t channelCount() const;
    std::chrono::steady_clock::time_point now() const { return clock_(); }
    const ChannelStoreOptions& options() const { return options_; }

    static bool isValidChannelName(const std::string& name);

private:
    struct ProducerRecord {
        uint64_t lastIndex = 0;
        uint64_t sequence = 0;
    };

    struct ChannelEntry {
        std::mutex mutex;
        std::condition_variable cv;

        std::string name;
        std::string id;
        bool dead = false;
        bool established = false;
        std::string credentialHash;   // SHA-256 hex of the credential, empty = no password
        std::deque<Chunk> queue;
        size_t queuedBytes = 0;
        uint64_t nextSequence = 0;
        bool finalQueued = false;
        bool producerBound = false;   // activeProducer owns the channel until it is destroyed
        std::string activeProducer;
        std::unordered_map<std::string, ProducerRecord> producers;
        std::string lockToken;
        std::chrono::steady_clock::time_point lockActivity;
        std::chrono::steady_clock::time_point created;
        std::chrono::steady_clock::time_point lastActivity;
        std::chrono::seconds ttl{0};
        uint64_t pushes = 0;
        uint64_t pops = 0;
    };

    using EntryPtr = std::shared_ptr<ChannelEntry>;

    EntryPtr find(const std::string& name) const;
    EntryPtr findOrCreate(const std::string& name);
    void removeEntry(const EntryPtr& entry);
    std::string nextChannelId();
    void publishChannelCount();

    // Called with entry->mutex held
    VoidResult checkCredential(ChannelEntry& entry, const std::string& credential) const;
    void markDead(ChannelEntry& entry);

    static std::string hashCredential(const std::string& credential);
    static int64_t secondsBetween(std::chrono::steady_clock::time_point from,
                                  std::chrono::steady_clock::time_point to);

    ChannelStoreOptions options_;
    Clock clock_;

    mutable std::shared_mutex mapMutex_;
    std::unordered_map<std::string, EntryPtr> channels_;

    std::string idPrefix_;
    std::atomic<uint64_t> idCounter_{0};
    std::atomic<bool> stopping_{false};
};

} // namespace RelayPipe
