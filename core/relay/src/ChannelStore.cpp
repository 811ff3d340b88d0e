#include "ChannelStore.h"
#include "Crypto.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"
#include "SHA256.h"

#include <algorithm>

namespace RelayPipe {

namespace {
    constexpr int MAX_LOOKUP_ATTEMPTS = 8;
    const char* COMPONENT = "ChannelStore";
}

ChannelStore::ChannelStore(ChannelStoreOptions options, Clock clock)
    : options_(options)
    , clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::steady_clock::now(); }))
    , idPrefix_(Crypto::randomToken(6)) {
}

ChannelStore::~ChannelStore() {
    shutdown();
}

bool ChannelStore::isValidChannelName(const std::string& name) {
    if (name.empty() || name.size() > config::MAX_CHANNEL_NAME) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
               c == '.' || c == '_' || c == '~' || c == '-';
    });
}

std::string ChannelStore::hashCredential(const std::string& credential) {
    return SHA256::hash(credential);
}

int64_t ChannelStore::secondsBetween(std::chrono::steady_clock::time_point from,
                                     std::chrono::steady_clock::time_point to) {
    return std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
}

std::string ChannelStore::nextChannelId() {
    return idPrefix_ + "-" + std::to_string(++idCounter_);
}

void ChannelStore::publishChannelCount() {
    MetricsCollector::instance().setChannelsActive(channels_.size());
}

ChannelStore::EntryPtr ChannelStore::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mapMutex_);
    auto it = channels_.find(name);
    return it == channels_.end() ? nullptr : it->second;
}

ChannelStore::EntryPtr ChannelStore::findOrCreate(const std::string& name) {
    if (auto existing = find(name)) {
        return existing;
    }

    std::unique_lock<std::shared_mutex> lock(mapMutex_);
    auto& slot = channels_[name];
    if (!slot) {
        slot = std::make_shared<ChannelEntry>();
        slot->name = name;
        slot->id = nextChannelId();
        slot->created = clock_();
        slot->lastActivity = slot->created;
        MetricsCollector::instance().incrementChannelsCreated();
        publishChannelCount();
        LOG_DEBUG_COMP_IF("Created channel " + name + " (" + slot->id + ")", COMPONENT);
    }
    return slot;
}

void ChannelStore::removeEntry(const EntryPtr& entry) {
    std::unique_lock<std::shared_mutex> lock(mapMutex_);
    auto it = channels_.find(entry->name);
    if (it != channels_.end() && it->second == entry) {
        channels_.erase(it);
        publishChannelCount();
    }
}

void ChannelStore::markDead(ChannelEntry& entry) {
    entry.dead = true;
    entry.queue.clear();
    entry.queuedBytes = 0;
    entry.lockToken.clear();
    entry.cv.notify_all();
}

VoidResult ChannelStore::checkCredential(ChannelEntry& entry, const std::string& credential) const {
    const char* failure = nullptr;
    if (entry.credentialHash.empty()) {
        if (!credential.empty()) {
            failure = AuthFailure::UNEXPECTED;
        }
    } else if (credential.empty()) {
        failure = AuthFailure::MISSING;
    } else if (!Crypto::constantTimeCompare(hashCredential(credential), entry.credentialHash)) {
        failure = AuthFailure::MISMATCH;
    }

    if (failure) {
        MetricsCollector::instance().incrementAuthFailures();
        Logger::instance().warn("Credential " + std::string(failure) + " on channel " + entry.name, COMPONENT);
        return Err(ErrorCode::AuthError, failure);
    }
    return Ok();
}

Result<PushReceipt> ChannelStore::push(const std::string& name,
                                       const std::string& credential,
                                       Chunk chunk,
                                       const std::string& expectedChannelId,
                                       int ttlSec) {
    if (!isValidChannelName(name)) {
        return Err(ErrorCode::InvalidArgument, "invalid channel name");
    }
    if (chunk.payload.size() > options_.maxChannelBytes) {
        return Err(ErrorCode::TooLarge, "chunk larger than the channel capacity");
    }

    for (int attempt = 0; attempt < MAX_LOOKUP_ATTEMPTS; ++attempt) {
        EntryPtr entry = expectedChannelId.empty() ? findOrCreate(name) : find(name);
        if (!entry) {
            return Err(ErrorCode::Expired, "channel " + name + " no longer exists");
        }

        std::unique_lock<std::mutex> lock(entry->mutex);
        if (entry->dead) {
            lock.unlock();
            removeEntry(entry);
            if (!expectedChannelId.empty()) {
                return Err(ErrorCode::Expired, "channel " + name + " no longer exists");
            }
            continue;
        }
        if (!expectedChannelId.empty() && entry->id != expectedChannelId) {
            return Err(ErrorCode::Expired, "channel " + name + " was re-created");
        }

        auto now = clock_();

        if (!entry->established) {
            entry->established = true;
            entry->credentialHash = credential.empty() ? std::string() : hashCredential(credential);
            if (ttlSec > 0) {
                entry->ttl = std::min(std::chrono::seconds(ttlSec), options_.maxTtl);
            }
        } else {
            auto auth = checkCredential(*entry, credential);
            if (!auth) {
                return auth.error();
            }
        }

        const std::string& producer = chunk.producerId;
        if (!producer.empty()) {
            auto rec = entry->producers.find(producer);
            if (rec != entry->producers.end()) {
                if (chunk.producerIndex == rec->second.lastIndex) {
                    entry->lastActivity = now;
                    MetricsCollector::instance().incrementDuplicatePushes();
                    LOG_DEBUG_COMP_IF("Duplicate push on " + name + " index " +
                                      std::to_string(chunk.producerIndex), COMPONENT);
                    return PushReceipt{rec->second.sequence, entry->id, true};
                }
                if (chunk.producerIndex != rec->second.lastIndex + 1) {
                    return Err(ErrorCode::InvalidArgument,
                               "producer index " + std::to_string(chunk.producerIndex) +
                               " does not follow " + std::to_string(rec->second.lastIndex));
                }
            }
        }

        if (entry->producerBound && entry->activeProducer != producer) {
            return Err(ErrorCode::Locked, "channel " + name + " is carrying another stream");
        }
        if (entry->finalQueued) {
            return Err(ErrorCode::InvalidArgument, "stream on " + name + " is already complete");
        }
        if (entry->queuedBytes + chunk.payload.size() > options_.maxChannelBytes) {
            MetricsCollector::instance().incrementChannelFull();
            return Err(ErrorCode::ChannelFull, "channel " + name + " is full");
        }

        chunk.sequence = entry->nextSequence++;
        PushReceipt receipt{chunk.sequence, entry->id, false};

        if (!producer.empty()) {
            entry->producers[producer] = ProducerRecord{chunk.producerIndex, chunk.sequence};
        }
        entry->producerBound = true;
        entry->activeProducer = producer;
        if (chunk.isFinal()) {
            entry->finalQueued = true;
        }
        entry->queuedBytes += chunk.payload.size();
        entry->queue.push_back(std::move(chunk));
        entry->lastActivity = now;
        entry->pushes++;

        lock.unlock();
        entry->cv.notify_all();

        MetricsCollector::instance().incrementPushes();
        return receipt;
    }

    Logger::instance().error("Channel " + name + " kept disappearing during push", COMPONENT);
    return Err(ErrorCode::InternalError, "channel lookup did not settle");
}

Result<PopResult> ChannelStore::pop(const std::string& name,
                                    const std::string& credential,
                                    const std::string& lockToken,
                                    const std::string& expectedChannelId) {
    if (!isValidChannelName(name)) {
        return Err(ErrorCode::InvalidArgument, "invalid channel name");
    }

    auto absent = [&]() -> Error {
        if (expectedChannelId.empty()) {
            return Error(ErrorCode::Empty, "channel " + name + " is empty");
        }
        return Error(ErrorCode::Expired, "channel " + name + " no longer exists");
    };

    EntryPtr entry = find(name);
    if (!entry) {
        return absent();
    }

    std::unique_lock<std::mutex> lock(entry->mutex);
    if (entry->dead) {
        return absent();
    }
    if (!expectedChannelId.empty() && entry->id != expectedChannelId) {
        return Err(ErrorCode::Expired, "channel " + name + " was re-created");
    }
    if (!entry->established) {
        return Err(ErrorCode::Empty, "channel " + name + " is empty");
    }

    auto auth = checkCredential(*entry, credential);
    if (!auth) {
        return auth.error();
    }

    auto now = clock_();
    if (!entry->lockToken.empty() && entry->lockToken != lockToken) {
        if (now - entry->lockActivity > options_.lockIdleTimeout) {
            Logger::instance().info("Releasing idle receiver lock on " + name, COMPONENT);
            entry->lockToken.clear();
        } else {
            MetricsCollector::instance().incrementLockConflicts();
            return Err(ErrorCode::Locked, "channel " + name + " is being read by another receiver");
        }
    }
    // A started stream only continues under a lock token
    if (lockToken.empty() && entry->lockToken.empty() && entry->pops > 0) {
        MetricsCollector::instance().incrementLockConflicts();
        return Err(ErrorCode::Locked, "stream on " + name + " was started by another receiver");
    }

    if (entry->queue.empty()) {
        if (!lockToken.empty() && entry->lockToken == lockToken) {
            entry->lockActivity = now;
        }
        return Err(ErrorCode::Empty, "channel " + name + " is empty");
    }

    PopResult result;
    result.chunk = std::move(entry->queue.front());
    entry->queue.pop_front();
    entry->queuedBytes -= std::min(entry->queuedBytes, result.chunk.payload.size());
    entry->lastActivity = now;
    entry->pops++;
    result.channelId = entry->id;
    result.final = result.chunk.isFinal();

    bool destroyed = false;
    if (result.final) {
        entry->lockToken.clear();
        if (entry->queue.empty()) {
            markDead(*entry);
            destroyed = true;
        }
    } else {
        entry->lockToken = lockToken.empty() ? Crypto::randomToken() : lockToken;
        entry->lockActivity = now;
        result.lockToken = entry->lockToken;
    }
    lock.unlock();

    if (destroyed) {
        removeEntry(entry);
        MetricsCollector::instance().incrementChannelsDrained();
        LOG_DEBUG_COMP_IF("Channel " + name + " drained and removed", COMPONENT);
    }
    MetricsCollector::instance().incrementPops();
    return result;
}

bool ChannelStore::waitForData(const std::string& name, std::chrono::steady_clock::time_point deadline) {
    if (stopping_ || !isValidChannelName(name)) {
        return false;
    }

    EntryPtr entry = findOrCreate(name);
    std::unique_lock<std::mutex> lock(entry->mutex);
    entry->cv.wait_until(lock, deadline, [&]() {
        return entry->dead || !entry->queue.empty() || stopping_.load();
    });
    return !entry->dead && !entry->queue.empty();
}

Result<PeekSnapshot> ChannelStore::peek(const std::string& name, const std::string& credential) {
    if (!isValidChannelName(name)) {
        return Err(ErrorCode::InvalidArgument, "invalid channel name");
    }

    EntryPtr entry = find(name);
    if (!entry) {
        return Err(ErrorCode::Empty, "channel " + name + " is empty");
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->dead || !entry->established) {
        return Err(ErrorCode::Empty, "channel " + name + " is empty");
    }

    auto auth = checkCredential(*entry, credential);
    if (!auth) {
        return auth.error();
    }
    if (entry->queue.empty()) {
        return Err(ErrorCode::Empty, "channel " + name + " is empty");
    }

    PeekSnapshot snapshot;
    snapshot.chunks.assign(entry->queue.begin(), entry->queue.end());
    snapshot.channelId = entry->id;
    snapshot.complete = entry->finalQueued;

    MetricsCollector::instance().incrementPeeks();
    return snapshot;
}

VoidResult ChannelStore::clear(const std::string& name, const std::string& credential) {
    if (!isValidChannelName(name)) {
        return Err(ErrorCode::InvalidArgument, "invalid channel name");
    }

    EntryPtr entry = find(name);
    if (!entry) {
        return Ok();
    }

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->dead) {
            return Ok();
        }
        if (entry->established) {
            auto auth = checkCredential(*entry, credential);
            if (!auth) {
                return auth;
            }
        }
        markDead(*entry);
    }

    removeEntry(entry);
    MetricsCollector::instance().incrementClears();
    Logger::instance().info("Channel " + name + " deleted", COMPONENT);
    return Ok();
}

Result<ChannelInfo> ChannelStore::query(const std::string& name) const {
    if (!isValidChannelName(name)) {
        return Err(ErrorCode::InvalidArgument, "invalid channel name");
    }

    EntryPtr entry = find(name);
    if (!entry) {
        return Err(ErrorCode::NotFound, "channel " + name + " not found");
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->dead) {
        return Err(ErrorCode::NotFound, "channel " + name + " not found");
    }

    auto now = clock_();
    ChannelInfo info;
    info.name = entry->name;
    info.channelId = entry->id;
    info.chunkCount = entry->queue.size();
    info.queuedBytes = entry->queuedBytes;
    info.established = entry->established;
    info.passwordProtected = !entry->credentialHash.empty();
    info.encrypted = std::any_of(entry->queue.begin(), entry->queue.end(),
                                 [](const Chunk& c) { return c.isEncrypted(); });
    info.locked = !entry->lockToken.empty() && now - entry->lockActivity <= options_.lockIdleTimeout;
    info.complete = entry->finalQueued;
    info.ageSec = secondsBetween(entry->created, now);
    info.idleSec = secondsBetween(entry->lastActivity, now);
    info.ttlSec = static_cast<int>(entry->ttl.count() > 0 ? entry->ttl.count() : options_.defaultTtl.count());
    info.nextSequence = entry->nextSequence;
    info.pushes = entry->pushes;
    info.pops = entry->pops;
    return info;
}

size_t ChannelStore::expireSweep(std::chrono::steady_clock::time_point now, std::chrono::seconds ttl) {
    std::vector<EntryPtr> candidates;
    {
        std::shared_lock<std::shared_mutex> mapLock(mapMutex_);
        candidates.reserve(channels_.size());
        for (const auto& [name, entry] : channels_) {
            candidates.push_back(entry);
        }
    }

    // Entries are locked one at a time so other channels stay usable
    size_t evicted = 0;
    std::vector<EntryPtr> doomed;
    for (const auto& entry : candidates) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        auto effective = entry->ttl.count() > 0 ? entry->ttl : ttl;
        if (!entry->dead && now - entry->lastActivity > effective) {
            Logger::instance().info("Evicting idle channel " + entry->name + " (" +
                                    std::to_string(entry->queue.size()) + " chunk(s) queued)", COMPONENT);
            markDead(*entry);
            ++evicted;
        }
        if (entry->dead) {
            doomed.push_back(entry);
        }
    }

    for (const auto& entry : doomed) {
        removeEntry(entry);
    }
    if (evicted > 0) {
        MetricsCollector::instance().incrementChannelsEvicted(evicted);
    }
    return evicted;
}

std::vector<ChannelSnapshot> ChannelStore::snapshotAll() const {
    std::vector<ChannelSnapshot> out;
    auto now = clock_();
    std::shared_lock<std::shared_mutex> mapLock(mapMutex_);
    out.reserve(channels_.size());
    for (const auto& [name, entry] : channels_) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->dead || !entry->established) {
            continue;
        }
        ChannelSnapshot snap;
        snap.name = name;
        snap.channelId = entry->id;
        snap.credentialHash = entry->credentialHash;
        snap.ttlSec = static_cast<int>(entry->ttl.count());
        snap.ageSec = secondsBetween(entry->created, now);
        snap.idleSec = secondsBetween(entry->lastActivity, now);
        snap.nextSequence = entry->nextSequence;
        snap.finalQueued = entry->finalQueued;
        snap.producerBound = entry->producerBound;
        snap.activeProducer = entry->activeProducer;
        for (const auto& [id, rec] : entry->producers) {
            snap.producers.push_back({id, rec.lastIndex, rec.sequence});
        }
        snap.chunks.assign(entry->queue.begin(), entry->queue.end());
        out.push_back(std::move(snap));
    }
    return out;
}

size_t ChannelStore::restore(const std::vector<ChannelSnapshot>& snapshots) {
    size_t restored = 0;
    auto now = clock_();
    std::unique_lock<std::shared_mutex> mapLock(mapMutex_);
    for (const auto& snap : snapshots) {
        if (!isValidChannelName(snap.name) || channels_.count(snap.name) > 0) {
            Logger::instance().warn("Skipping snapshot of channel '" + snap.name + "'", COMPONENT);
            continue;
        }
        auto entry = std::make_shared<ChannelEntry>();
        entry->name = snap.name;
        entry->id = snap.channelId.empty() ? nextChannelId() : snap.channelId;
        entry->established = true;
        entry->credentialHash = snap.credentialHash;
        entry->ttl = std::chrono::seconds(std::max(0, snap.ttlSec));
        entry->created = now - std::chrono::seconds(std::max<int64_t>(0, snap.ageSec));
        entry->lastActivity = now - std::chrono::seconds(std::max<int64_t>(0, snap.idleSec));
        entry->nextSequence = snap.nextSequence;
        entry->finalQueued = snap.finalQueued;
        entry->producerBound = snap.producerBound;
        entry->activeProducer = snap.activeProducer;
        for (const auto& p : snap.producers) {
            entry->producers[p.id] = ProducerRecord{p.lastIndex, p.sequence};
        }
        for (const auto& chunk : snap.chunks) {
            entry->queuedBytes += chunk.payload.size();
            entry->queue.push_back(chunk);
        }
        channels_.emplace(snap.name, std::move(entry));
        ++restored;
    }
    publishChannelCount();
    return restored;
}

void ChannelStore::shutdown() {
    if (stopping_.exchange(true)) {
        return;
    }
    std::shared_lock<std::shared_mutex> mapLock(mapMutex_);
    for (const auto& [name, entry] : channels_) {
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
        }
        entry->cv.notify_all();
    }
}

size_t ChannelStore::channelCount() const {
    std::shared_lock<std::shared_mutex> lock(mapMutex_);
    return channels_.size();
}

} // namespace RelayPipe
