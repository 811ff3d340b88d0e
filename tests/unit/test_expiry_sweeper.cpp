#include <gtest/gtest.h>

#include "ChunkCodec.h"
#include "ExpirySweeper.h"

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace RelayPipe;
using namespace std::chrono_literals;

class ExpirySweeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());
        auto clock = now_;
        ChannelStoreOptions options;
        options.defaultTtl = 30s;
        store_ = std::make_unique<ChannelStore>(options, [clock]() { return *clock; });
    }

    void seed(const std::string& name, int ttlSec = 0) {
        auto chunk = ChunkCodec::makePlainChunk({'x'});
        chunk.producerId = "p";
        ASSERT_TRUE(store_->push(name, "", chunk, "", ttlSec).ok());
    }

    std::shared_ptr<std::chrono::steady_clock::time_point> now_;
    std::unique_ptr<ChannelStore> store_;
};

TEST_F(ExpirySweeperTest, SweepNowEvictsOnlyIdleChannels) {
    ExpirySweeper sweeper(*store_, 50ms, 30s);
    seed("old");
    *now_ += 20s;
    seed("young");
    *now_ += 15s;

    EXPECT_EQ(sweeper.sweepNow(), 1u);
    EXPECT_EQ(store_->query("old").error().code, ErrorCode::NotFound);
    EXPECT_TRUE(store_->query("young").ok());
    EXPECT_EQ(sweeper.totalEvicted(), 1u);
    EXPECT_EQ(sweeper.sweepCount(), 1u);

    EXPECT_EQ(sweeper.sweepNow(), 0u);
    EXPECT_EQ(sweeper.sweepCount(), 2u);
}

TEST_F(ExpirySweeperTest, WriterTtlOverridesDefault) {
    ExpirySweeper sweeper(*store_, 50ms, 30s);
    seed("short", 5);
    seed("normal");
    *now_ += 10s;

    EXPECT_EQ(sweeper.sweepNow(), 1u);
    EXPECT_FALSE(store_->query("short").ok());
    EXPECT_TRUE(store_->query("normal").ok());
}

TEST_F(ExpirySweeperTest, BackgroundThreadSweeps) {
    ExpirySweeper sweeper(*store_, 10ms, 30s);
    seed("stale");
    *now_ += 31s;

    sweeper.start();
    EXPECT_TRUE(sweeper.isRunning());

    for (int i = 0; i < 200 && sweeper.totalEvicted() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(sweeper.totalEvicted(), 1u);
    EXPECT_EQ(store_->channelCount(), 0u);

    sweeper.stop();
    EXPECT_FALSE(sweeper.isRunning());
}

TEST_F(ExpirySweeperTest, StopIsPromptAndRepeatable) {
    ExpirySweeper sweeper(*store_, std::chrono::hours(1), 30s);
    sweeper.start();
    sweeper.start();

    auto begin = std::chrono::steady_clock::now();
    sweeper.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
    sweeper.stop();
    EXPECT_EQ(sweeper.sweepCount(), 0u);
}

TEST_F(ExpirySweeperTest, ConcurrentStopsJoinOnce) {
    for (int round = 0; round < 20; ++round) {
        ExpirySweeper sweeper(*store_, 1ms, 30s);
        sweeper.start();

        std::vector<std::thread> stoppers;
        for (int i = 0; i < 4; ++i) {
            stoppers.emplace_back([&sweeper]() { sweeper.stop(); });
        }
        for (auto& t : stoppers) {
            t.join();
        }
        EXPECT_FALSE(sweeper.isRunning());

        // Restartable after a racing stop, and the destructor stops it again
        sweeper.start();
        EXPECT_TRUE(sweeper.isRunning());
    }
}
