#include <gtest/gtest.h>

#include "ChannelStore.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace RelayPipe;
using namespace std::chrono_literals;

namespace {

Chunk makeChunk(const std::string& payload, uint64_t index, bool final = false,
                const std::string& producer = "producer-1") {
    Chunk chunk;
    chunk.producerId = producer;
    chunk.producerIndex = index;
    chunk.flags = final ? FLAG_FINAL : 0;
    chunk.plaintextLength = static_cast<uint32_t>(payload.size());
    chunk.payload.assign(payload.begin(), payload.end());
    return chunk;
}

std::string text(const Chunk& chunk) {
    return std::string(chunk.payload.begin(), chunk.payload.end());
}

} // namespace

class ChannelStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());
        options_.lockIdleTimeout = 1000ms;
        options_.defaultTtl = 60s;
        rebuild();
    }

    void rebuild() {
        auto clock = now_;
        store_ = std::make_unique<ChannelStore>(options_, [clock]() { return *clock; });
    }

    void advance(std::chrono::steady_clock::duration d) { *now_ += d; }

    std::shared_ptr<std::chrono::steady_clock::time_point> now_;
    ChannelStoreOptions options_;
    std::unique_ptr<ChannelStore> store_;
};

TEST_F(ChannelStoreTest, DrainReturnsPushedOrder) {
    for (uint64_t i = 0; i < 5; ++i) {
        auto receipt = store_->push("ordered", "", makeChunk("chunk" + std::to_string(i), i, i == 4));
        ASSERT_TRUE(receipt.ok());
        EXPECT_EQ(receipt->sequence, i);
        EXPECT_FALSE(receipt->duplicate);
    }

    for (uint64_t i = 0; i < 5; ++i) {
        auto popped = store_->pop("ordered", "", "token");
        ASSERT_TRUE(popped.ok());
        EXPECT_EQ(popped->chunk.sequence, i);
        EXPECT_EQ(text(popped->chunk), "chunk" + std::to_string(i));
        EXPECT_EQ(popped->final, i == 4);
    }

    // Popping the final chunk destroys the channel
    EXPECT_EQ(store_->pop("ordered", "", "token").error().code, ErrorCode::Empty);
    EXPECT_EQ(store_->query("ordered").error().code, ErrorCode::NotFound);
    EXPECT_EQ(store_->channelCount(), 0u);
}

TEST_F(ChannelStoreTest, PeekThenReceiveExample) {
    ASSERT_TRUE(store_->push("x", "", makeChunk("ab", 0)).ok());
    ASSERT_TRUE(store_->push("x", "", makeChunk("cd", 1)).ok());

    auto snapshot = store_->peek("x", "");
    ASSERT_TRUE(snapshot.ok());
    ASSERT_EQ(snapshot->chunks.size(), 2u);
    EXPECT_EQ(text(snapshot->chunks[0]), "ab");
    EXPECT_EQ(text(snapshot->chunks[1]), "cd");
    EXPECT_FALSE(snapshot->complete);

    auto first = store_->pop("x", "", "t");
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(text(first->chunk), "ab");
    auto second = store_->pop("x", "", "t");
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(text(second->chunk), "cd");

    EXPECT_EQ(store_->pop("x", "", "t").error().code, ErrorCode::Empty);
    EXPECT_EQ(store_->peek("x", "").error().code, ErrorCode::Empty);
}

TEST_F(ChannelStoreTest, PeekNeverMutates) {
    ASSERT_TRUE(store_->push("p", "", makeChunk("one", 0)).ok());
    ASSERT_TRUE(store_->push("p", "", makeChunk("two", 1, true)).ok());

    // Another receiver holds the lock; peek ignores it
    ASSERT_TRUE(store_->pop("p", "", "holder").ok());

    for (int i = 0; i < 3; ++i) {
        auto snapshot = store_->peek("p", "");
        ASSERT_TRUE(snapshot.ok());
        ASSERT_EQ(snapshot->chunks.size(), 1u);
        EXPECT_EQ(text(snapshot->chunks[0]), "two");
        EXPECT_TRUE(snapshot->complete);
    }

    auto info = store_->query("p");
    ASSERT_TRUE(info.ok());
    EXPECT_EQ(info->chunkCount, 1u);
    EXPECT_EQ(info->pops, 1u);
    EXPECT_TRUE(info->locked);
    EXPECT_TRUE(info->complete);
}

TEST_F(ChannelStoreTest, RetriedPushIsNotAppendedTwice) {
    auto first = store_->push("dup", "", makeChunk("a", 0));
    ASSERT_TRUE(first.ok());
    auto retry = store_->push("dup", "", makeChunk("a", 0));
    ASSERT_TRUE(retry.ok());

    EXPECT_TRUE(retry->duplicate);
    EXPECT_EQ(retry->sequence, first->sequence);
    EXPECT_EQ(store_->query("dup")->chunkCount, 1u);

    auto next = store_->push("dup", "", makeChunk("b", 1));
    ASSERT_TRUE(next.ok());
    EXPECT_EQ(next->sequence, 1u);
}

TEST_F(ChannelStoreTest, ProducerIndexMustAdvanceByOne) {
    ASSERT_TRUE(store_->push("gap", "", makeChunk("a", 0)).ok());
    auto skipped = store_->push("gap", "", makeChunk("c", 2));
    ASSERT_FALSE(skipped.ok());
    EXPECT_EQ(skipped.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ChannelStoreTest, SecondWriterIsLockedOut) {
    ASSERT_TRUE(store_->push("owned", "", makeChunk("a", 0, false, "writer-a")).ok());
    auto other = store_->push("owned", "", makeChunk("b", 0, false, "writer-b"));
    ASSERT_FALSE(other.ok());
    EXPECT_EQ(other.error().code, ErrorCode::Locked);
}

TEST_F(ChannelStoreTest, PushAfterFinalIsRejected) {
    ASSERT_TRUE(store_->push("done", "", makeChunk("a", 0, true)).ok());
    auto late = store_->push("done", "", makeChunk("b", 1));
    ASSERT_FALSE(late.ok());
    EXPECT_EQ(late.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ChannelStoreTest, PasswordEstablishedByFirstWriter) {
    ASSERT_TRUE(store_->push("secret", "cred-1", makeChunk("a", 0)).ok());

    auto missing = store_->push("secret", "", makeChunk("b", 1));
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code, ErrorCode::AuthError);
    EXPECT_EQ(missing.error().message, AuthFailure::MISSING);

    auto mismatch = store_->pop("secret", "cred-2", "t");
    ASSERT_FALSE(mismatch.ok());
    EXPECT_EQ(mismatch.error().message, AuthFailure::MISMATCH);

    EXPECT_EQ(store_->peek("secret", "").error().message, AuthFailure::MISSING);
    EXPECT_EQ(store_->clear("secret", "cred-2").error().code, ErrorCode::AuthError);

    ASSERT_TRUE(store_->push("secret", "cred-1", makeChunk("b", 1)).ok());
    auto popped = store_->pop("secret", "cred-1", "t");
    ASSERT_TRUE(popped.ok());
    EXPECT_EQ(text(popped->chunk), "a");

    auto info = store_->query("secret");
    ASSERT_TRUE(info.ok());
    EXPECT_TRUE(info->passwordProtected);
}

TEST_F(ChannelStoreTest, UnexpectedPasswordOnOpenChannel) {
    ASSERT_TRUE(store_->push("open", "", makeChunk("a", 0)).ok());
    auto unexpected = store_->pop("open", "some-cred", "t");
    ASSERT_FALSE(unexpected.ok());
    EXPECT_EQ(unexpected.error().code, ErrorCode::AuthError);
    EXPECT_EQ(unexpected.error().message, AuthFailure::UNEXPECTED);
}

TEST_F(ChannelStoreTest, OneReceiverHoldsTheLock) {
    for (uint64_t i = 0; i < 3; ++i) {
        ASSERT_TRUE(store_->push("shared", "", makeChunk("c", i)).ok());
    }

    ASSERT_TRUE(store_->pop("shared", "", "reader-a").ok());
    auto blocked = store_->pop("shared", "", "reader-b");
    ASSERT_FALSE(blocked.ok());
    EXPECT_EQ(blocked.error().code, ErrorCode::Locked);

    // The holder keeps reading
    ASSERT_TRUE(store_->pop("shared", "", "reader-a").ok());

    // An idle holder loses the lock
    advance(2s);
    ASSERT_TRUE(store_->pop("shared", "", "reader-b").ok());
    EXPECT_EQ(store_->pop("shared", "", "reader-a").error().code, ErrorCode::Locked);
}

TEST_F(ChannelStoreTest, TokenlessReceiverIsGivenTheLock) {
    for (uint64_t i = 0; i < 4; ++i) {
        ASSERT_TRUE(store_->push("open", "", makeChunk("c", i, i == 3)).ok());
    }

    auto first = store_->pop("open", "", "");
    ASSERT_TRUE(first.ok());
    ASSERT_FALSE(first->lockToken.empty());

    // A second tokenless reader must not interleave with the first
    auto second = store_->pop("open", "", "");
    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.error().code, ErrorCode::Locked);
    EXPECT_EQ(store_->pop("open", "", "client-token").error().code, ErrorCode::Locked);

    auto resumed = store_->pop("open", "", first->lockToken);
    ASSERT_TRUE(resumed.ok());
    EXPECT_EQ(resumed->chunk.producerIndex, 1u);
    EXPECT_EQ(resumed->lockToken, first->lockToken);
}

TEST_F(ChannelStoreTest, ExplicitTokenIsEchoed) {
    ASSERT_TRUE(store_->push("echo", "", makeChunk("a", 0)).ok());
    auto popped = store_->pop("echo", "", "reader-a");
    ASSERT_TRUE(popped.ok());
    EXPECT_EQ(popped->lockToken, "reader-a");
}

TEST_F(ChannelStoreTest, TokenlessReaderCannotResumeStartedStream) {
    for (uint64_t i = 0; i < 3; ++i) {
        ASSERT_TRUE(store_->push("half", "", makeChunk("c", i)).ok());
    }
    ASSERT_TRUE(store_->pop("half", "", "reader-a").ok());

    // The lock goes idle but the stream is already partly consumed
    advance(2s);
    EXPECT_EQ(store_->pop("half", "", "").error().code, ErrorCode::Locked);

    // A receiver with a token may take over
    auto takeover = store_->pop("half", "", "reader-b");
    ASSERT_TRUE(takeover.ok());
    EXPECT_EQ(takeover->chunk.producerIndex, 1u);
}

TEST_F(ChannelStoreTest, EmptyPollKeepsLockAlive) {
    ASSERT_TRUE(store_->push("poll", "", makeChunk("a", 0)).ok());
    ASSERT_TRUE(store_->pop("poll", "", "reader-a").ok());

    for (int i = 0; i < 3; ++i) {
        advance(700ms);
        EXPECT_EQ(store_->pop("poll", "", "reader-a").error().code, ErrorCode::Empty);
    }
    EXPECT_EQ(store_->pop("poll", "", "reader-b").error().code, ErrorCode::Locked);
}

TEST_F(ChannelStoreTest, ExpiryGivesFreshChannel) {
    auto receipt = store_->push("old", "cred", makeChunk("a", 0));
    ASSERT_TRUE(receipt.ok());
    std::string firstId = receipt->channelId;

    advance(30s);
    EXPECT_EQ(store_->expireSweep(*now_, options_.defaultTtl), 0u);
    advance(31s);
    EXPECT_EQ(store_->expireSweep(*now_, options_.defaultTtl), 1u);

    // A writer pinned to the old incarnation learns it is gone
    auto pinned = store_->push("old", "cred", makeChunk("b", 1), firstId);
    ASSERT_FALSE(pinned.ok());
    EXPECT_EQ(pinned.error().code, ErrorCode::Expired);
    EXPECT_EQ(store_->pop("old", "cred", "t", firstId).error().code, ErrorCode::Expired);

    // Everyone else sees a brand new channel with a different password
    auto fresh = store_->push("old", "", makeChunk("z", 0, false, "producer-2"));
    ASSERT_TRUE(fresh.ok());
    EXPECT_EQ(fresh->sequence, 0u);
    EXPECT_NE(fresh->channelId, firstId);
    EXPECT_FALSE(store_->query("old")->passwordProtected);

    EXPECT_EQ(store_->push("old", "", makeChunk("y", 1, false, "producer-2"), firstId).error().code,
              ErrorCode::Expired);
}

TEST_F(ChannelStoreTest, PushesContinueWhileOtherChannelsAreEvicted) {
    constexpr int STALE = 400;
    for (int i = 0; i < STALE; ++i) {
        ASSERT_TRUE(store_->push("stale-" + std::to_string(i), "", makeChunk("x", 0)).ok());
    }
    advance(61s);
    ASSERT_TRUE(store_->push("busy", "", makeChunk("c", 0)).ok());

    std::atomic<size_t> evicted{0};
    std::thread sweeper([&]() {
        for (int round = 0; round < 20; ++round) {
            evicted += store_->expireSweep(*now_, options_.defaultTtl);
        }
    });

    for (uint64_t i = 1; i < 200; ++i) {
        auto receipt = store_->push("busy", "", makeChunk("c", i));
        EXPECT_TRUE(receipt.ok());
        if (receipt.ok()) {
            EXPECT_EQ(receipt->sequence, i);
        }
    }
    sweeper.join();

    EXPECT_EQ(evicted.load(), static_cast<size_t>(STALE));
    EXPECT_EQ(store_->query("stale-0").error().code, ErrorCode::NotFound);
    auto busy = store_->query("busy");
    ASSERT_TRUE(busy.ok());
    EXPECT_EQ(busy->chunkCount, 200u);
    EXPECT_EQ(store_->channelCount(), 1u);
}

TEST_F(ChannelStoreTest, WriterChosenTtlIsHonoured) {
    ASSERT_TRUE(store_->push("short", "", makeChunk("a", 0), "", 10).ok());
    ASSERT_TRUE(store_->push("long", "", makeChunk("a", 0)).ok());
    EXPECT_EQ(store_->query("short")->ttlSec, 10);
    EXPECT_EQ(store_->query("long")->ttlSec, 60);

    advance(11s);
    EXPECT_EQ(store_->expireSweep(*now_, options_.defaultTtl), 1u);
    EXPECT_EQ(store_->query("short").error().code, ErrorCode::NotFound);
    EXPECT_TRUE(store_->query("long").ok());
}

TEST_F(ChannelStoreTest, TtlIsCappedByMaximum) {
    options_.maxTtl = 100s;
    rebuild();
    ASSERT_TRUE(store_->push("capped", "", makeChunk("a", 0), "", 5000).ok());
    EXPECT_EQ(store_->query("capped")->ttlSec, 100);
}

TEST_F(ChannelStoreTest, ChannelFullIsRetryable) {
    options_.maxChannelBytes = 10;
    rebuild();

    ASSERT_TRUE(store_->push("small", "", makeChunk("12345678", 0)).ok());
    auto full = store_->push("small", "", makeChunk("abcdefgh", 1));
    ASSERT_FALSE(full.ok());
    EXPECT_EQ(full.error().code, ErrorCode::ChannelFull);
    EXPECT_TRUE(isRetryable(full.error().code));

    ASSERT_TRUE(store_->pop("small", "", "t").ok());
    EXPECT_TRUE(store_->push("small", "", makeChunk("abcdefgh", 1)).ok());

    auto huge = store_->push("small", "", makeChunk("this is far too big", 2));
    ASSERT_FALSE(huge.ok());
    EXPECT_EQ(huge.error().code, ErrorCode::TooLarge);
}

TEST_F(ChannelStoreTest, ChannelNames) {
    EXPECT_TRUE(ChannelStore::isValidChannelName("my-channel_1.2~x"));
    EXPECT_FALSE(ChannelStore::isValidChannelName(""));
    EXPECT_FALSE(ChannelStore::isValidChannelName("has space"));
    EXPECT_FALSE(ChannelStore::isValidChannelName("slash/inside"));
    EXPECT_FALSE(ChannelStore::isValidChannelName(std::string(config::MAX_CHANNEL_NAME + 1, 'a')));
    EXPECT_TRUE(ChannelStore::isValidChannelName(std::string(config::MAX_CHANNEL_NAME, 'a')));

    EXPECT_EQ(store_->push("bad name", "", makeChunk("a", 0)).error().code, ErrorCode::InvalidArgument);
}

TEST_F(ChannelStoreTest, ClearDeletesChannel) {
    EXPECT_TRUE(store_->clear("absent", "").ok());

    ASSERT_TRUE(store_->push("doomed", "", makeChunk("a", 0)).ok());
    ASSERT_TRUE(store_->clear("doomed", "").ok());
    EXPECT_EQ(store_->query("doomed").error().code, ErrorCode::NotFound);
    EXPECT_EQ(store_->pop("doomed", "", "t").error().code, ErrorCode::Empty);
}

TEST_F(ChannelStoreTest, ReceiverCanWaitBeforeWriterArrives) {
    auto deadline = std::chrono::steady_clock::now() + 20ms;
    EXPECT_FALSE(store_->waitForData("early", deadline));

    // The placeholder exists but has no password yet
    auto info = store_->query("early");
    ASSERT_TRUE(info.ok());
    EXPECT_FALSE(info->established);
    EXPECT_EQ(store_->pop("early", "any-cred", "t").error().code, ErrorCode::Empty);

    std::atomic<bool> woke{false};
    std::thread waiter([&]() {
        woke = store_->waitForData("early", std::chrono::steady_clock::now() + 5s);
    });
    std::this_thread::sleep_for(50ms);
    ASSERT_TRUE(store_->push("early", "cred", makeChunk("hi", 0)).ok());
    waiter.join();

    EXPECT_TRUE(woke);
    EXPECT_TRUE(store_->query("early")->passwordProtected);
}

TEST_F(ChannelStoreTest, ClearAndShutdownWakeWaiters) {
    std::atomic<bool> result{true};
    auto start = std::chrono::steady_clock::now();
    std::thread waiter([&]() {
        result = store_->waitForData("wake", std::chrono::steady_clock::now() + 10s);
    });
    std::this_thread::sleep_for(50ms);
    ASSERT_TRUE(store_->clear("wake", "").ok());
    waiter.join();
    EXPECT_FALSE(result);

    std::thread second([&]() {
        result = store_->waitForData("wake-2", std::chrono::steady_clock::now() + 10s);
    });
    std::this_thread::sleep_for(50ms);
    store_->shutdown();
    second.join();
    EXPECT_FALSE(result);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST_F(ChannelStoreTest, SnapshotRestoreKeepsIdleAge) {
    ASSERT_TRUE(store_->push("keep", "cred", makeChunk("a", 0), "", 120).ok());
    ASSERT_TRUE(store_->push("keep", "cred", makeChunk("b", 1)).ok());
    std::string channelId = store_->query("keep")->channelId;
    advance(100s);

    auto snapshots = store_->snapshotAll();
    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(snapshots[0].idleSec, 100);
    EXPECT_EQ(snapshots[0].ttlSec, 120);
    EXPECT_EQ(snapshots[0].chunks.size(), 2u);

    // Downtime between save and restore does not count
    advance(1h);
    rebuild();
    EXPECT_EQ(store_->restore(snapshots), 1u);

    auto info = store_->query("keep");
    ASSERT_TRUE(info.ok());
    EXPECT_EQ(info->channelId, channelId);
    EXPECT_EQ(info->idleSec, 100);
    EXPECT_EQ(info->chunkCount, 2u);
    EXPECT_TRUE(info->passwordProtected);

    EXPECT_EQ(store_->expireSweep(*now_, options_.defaultTtl), 0u);

    auto next = store_->push("keep", "cred", makeChunk("c", 2), channelId);
    ASSERT_TRUE(next.ok());
    EXPECT_EQ(next->sequence, 2u);

    auto popped = store_->pop("keep", "cred", "t");
    ASSERT_TRUE(popped.ok());
    EXPECT_EQ(popped->chunk.sequence, 0u);
    EXPECT_EQ(text(popped->chunk), "a");
}

TEST_F(ChannelStoreTest, ConcurrentPushAndPopKeepSequence) {
    constexpr uint64_t COUNT = 300;
    std::vector<uint64_t> seen;

    std::thread writer([&]() {
        for (uint64_t i = 0; i < COUNT; ++i) {
            auto r = store_->push("busy", "", makeChunk(std::to_string(i), i, i == COUNT - 1));
            ASSERT_TRUE(r.ok());
        }
    });

    std::thread reader([&]() {
        auto giveUp = std::chrono::steady_clock::now() + 10s;
        while (seen.size() < COUNT && std::chrono::steady_clock::now() < giveUp) {
            auto r = store_->pop("busy", "", "reader");
            if (r.ok()) {
                seen.push_back(r->chunk.sequence);
            } else {
                store_->waitForData("busy", std::chrono::steady_clock::now() + 10ms);
            }
        }
    });

    writer.join();
    reader.join();

    ASSERT_EQ(seen.size(), COUNT);
    for (uint64_t i = 0; i < COUNT; ++i) {
        EXPECT_EQ(seen[i], i);
    }
}
